#include "commands.h"

#include <args.hxx>
#include <corral/actions.h>
#include <corral/rpc/rpc-message.h>
#include <corral/url.h>

#include <iostream>
#include <string>

namespace corral::ctl {

// ─── Helpers ─────────────────────────────────────────────────────────────────

static void printJson(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    std::cout << Json::writeString(builder, value) << "\n";
}

// Ok(false) when help was printed and the command should not run
static Result<bool> parseCommand(args::ArgumentParser& parser, const std::string& name,
                                 ArgIt begin, ArgIt end) {
    try {
        parser.ParseArgs(begin, end);
    } catch (const args::Help&) {
        std::cout << parser;
        return Ok(false);
    } catch (const args::Error& e) {
        return Err<bool>(name + ": " + std::string(e.what()));
    }
    return Ok(true);
}

static Result<BrowserService::Ptr> startService(const CmdContext& ctx) {
    auto options = BrowserService::optionsFromConfig(*ctx.config);
    if (!options) {
        return Err<BrowserService::Ptr>("invalid configuration", options);
    }
    options->spawnWorker = !ctx.attach;

    auto service = BrowserService::create(*options);
    if (!service) {
        return Err<BrowserService::Ptr>("cannot create browser service", service);
    }
    if (auto res = (*service)->initialize(); !res) {
        return Err<BrowserService::Ptr>("cannot start browser service", res);
    }
    return service;
}

using SessionFn = std::function<Result<Json::Value>(BrowserClient& client, const std::string& sessionId)>;

// Start the service, run fn against the current session, print its result
static Result<void> withSession(const CmdContext& ctx, const std::string& name, const SessionFn& fn) {
    auto service = startService(ctx);
    if (!service) {
        return std::unexpected(service.error());
    }

    Result<void> outcome = Ok();
    auto session = (*service)->ensureCurrentSession();
    auto client = (*service)->client();
    if (!session) {
        outcome = Err<void>(name, session);
    } else if (!client) {
        outcome = Err<void>(name, client);
    } else if (auto out = fn(**client, session->id); !out) {
        outcome = Err<void>(name, out);
    } else {
        printJson(*out);
    }

    (*service)->stop();
    return outcome;
}

static Json::Value pageJson(const PageInfo& page) {
    Json::Value out(Json::objectValue);
    out["url"] = page.url;
    out["title"] = page.title;
    return out;
}

static Result<Json::Value> okJson(const Result<void>& result) {
    if (!result) {
        return std::unexpected(result.error());
    }
    Json::Value out(Json::objectValue);
    out["ok"] = true;
    return Ok(std::move(out));
}

template<typename T, typename F>
static Result<Json::Value> mapResult(const Result<T>& result, F&& convert) {
    if (!result) {
        return std::unexpected(result.error());
    }
    return Ok(Json::Value(convert(*result)));
}

// ─── navigate ────────────────────────────────────────────────────────────────

Result<void> cmdNavigate(const CmdContext& ctx, ArgIt begin, ArgIt end) {
    args::ArgumentParser parser("Open a URL in the current session");
    parser.Prog(ctx.prog + " navigate");
    args::HelpFlag help(parser, "help", "Show this help", {'h', "help"});
    args::Positional<std::string> urlArg(parser, "url", "Address to open", args::Options::Required);

    auto parsed = parseCommand(parser, "navigate", begin, end);
    if (!parsed || !*parsed) {
        return parsed ? Ok() : Err<void>("", parsed);
    }

    const auto url = args::get(urlArg);
    if (auto res = validateUrl(url, UrlPolicy::fromConfig(*ctx.config)); !res) {
        return Err<void>("navigate", res);
    }
    return withSession(ctx, "navigate", [&](BrowserClient& client, const std::string& id) {
        return mapResult(client.navigate(id, url), pageJson);
    });
}

// ─── state / history ─────────────────────────────────────────────────────────

Result<void> cmdState(const CmdContext& ctx, ArgIt begin, ArgIt end) {
    args::ArgumentParser parser("Show the current page");
    parser.Prog(ctx.prog + " state");
    args::HelpFlag help(parser, "help", "Show this help", {'h', "help"});

    auto parsed = parseCommand(parser, "state", begin, end);
    if (!parsed || !*parsed) {
        return parsed ? Ok() : Err<void>("", parsed);
    }
    return withSession(ctx, "state", [](BrowserClient& client, const std::string& id) {
        return mapResult(client.getState(id), [](const PageState& state) {
            Json::Value out(Json::objectValue);
            out["url"] = state.url;
            out["title"] = state.title;
            out["sessionId"] = state.sessionId;
            out["createdAt"] = state.createdAt;
            return out;
        });
    });
}

static Result<void> historyCommand(const CmdContext& ctx, const std::string& name,
                                   const std::string& description, ArgIt begin, ArgIt end,
                                   Result<PageInfo> (BrowserClient::*op)(const std::string&)) {
    args::ArgumentParser parser(description);
    parser.Prog(ctx.prog + " " + name);
    args::HelpFlag help(parser, "help", "Show this help", {'h', "help"});

    auto parsed = parseCommand(parser, name, begin, end);
    if (!parsed || !*parsed) {
        return parsed ? Ok() : Err<void>("", parsed);
    }
    return withSession(ctx, name, [op](BrowserClient& client, const std::string& id) {
        return mapResult((client.*op)(id), pageJson);
    });
}

Result<void> cmdBack(const CmdContext& ctx, ArgIt begin, ArgIt end) {
    return historyCommand(ctx, "back", "Go back one page", begin, end, &BrowserClient::goBack);
}

Result<void> cmdForward(const CmdContext& ctx, ArgIt begin, ArgIt end) {
    return historyCommand(ctx, "forward", "Go forward one page", begin, end, &BrowserClient::goForward);
}

Result<void> cmdRefresh(const CmdContext& ctx, ArgIt begin, ArgIt end) {
    return historyCommand(ctx, "refresh", "Reload the current page", begin, end, &BrowserClient::refresh);
}

// ─── interaction ─────────────────────────────────────────────────────────────

Result<void> cmdClick(const CmdContext& ctx, ArgIt begin, ArgIt end) {
    args::ArgumentParser parser("Click an element described in plain words");
    parser.Prog(ctx.prog + " click");
    args::HelpFlag help(parser, "help", "Show this help", {'h', "help"});
    args::Positional<std::string> description(parser, "description", "Element to click",
                                              args::Options::Required);

    auto parsed = parseCommand(parser, "click", begin, end);
    if (!parsed || !*parsed) {
        return parsed ? Ok() : Err<void>("", parsed);
    }
    return withSession(ctx, "click", [&](BrowserClient& client, const std::string& id) {
        return okJson(client.click(id, args::get(description)));
    });
}

Result<void> cmdType(const CmdContext& ctx, ArgIt begin, ArgIt end) {
    args::ArgumentParser parser("Type text into a field");
    parser.Prog(ctx.prog + " type");
    args::HelpFlag help(parser, "help", "Show this help", {'h', "help"});
    args::Positional<std::string> field(parser, "field", "Field to type into", args::Options::Required);
    args::Positional<std::string> text(parser, "text", "Text to type", args::Options::Required);

    auto parsed = parseCommand(parser, "type", begin, end);
    if (!parsed || !*parsed) {
        return parsed ? Ok() : Err<void>("", parsed);
    }
    return withSession(ctx, "type", [&](BrowserClient& client, const std::string& id) {
        return okJson(client.type(id, args::get(text), args::get(field)));
    });
}

Result<void> cmdSelect(const CmdContext& ctx, ArgIt begin, ArgIt end) {
    args::ArgumentParser parser("Pick an option from a dropdown");
    parser.Prog(ctx.prog + " select");
    args::HelpFlag help(parser, "help", "Show this help", {'h', "help"});
    args::Positional<std::string> dropdown(parser, "dropdown", "Dropdown to open", args::Options::Required);
    args::Positional<std::string> option(parser, "option", "Option to pick", args::Options::Required);

    auto parsed = parseCommand(parser, "select", begin, end);
    if (!parsed || !*parsed) {
        return parsed ? Ok() : Err<void>("", parsed);
    }
    return withSession(ctx, "select", [&](BrowserClient& client, const std::string& id) {
        return okJson(client.select(id, args::get(option), args::get(dropdown)));
    });
}

Result<void> cmdExtract(const CmdContext& ctx, ArgIt begin, ArgIt end) {
    args::ArgumentParser parser("Extract information from the page");
    parser.Prog(ctx.prog + " extract");
    args::HelpFlag help(parser, "help", "Show this help", {'h', "help"});
    args::Positional<std::string> instruction(parser, "instruction", "What to extract",
                                              args::Options::Required);

    auto parsed = parseCommand(parser, "extract", begin, end);
    if (!parsed || !*parsed) {
        return parsed ? Ok() : Err<void>("", parsed);
    }
    return withSession(ctx, "extract", [&](BrowserClient& client, const std::string& id) {
        return mapResult(client.extract(id, args::get(instruction)), [](const Extraction& extraction) {
            Json::Value out(Json::objectValue);
            out["data"] = extraction.data;
            out["found"] = extraction.found;
            return out;
        });
    });
}

Result<void> cmdScreenshot(const CmdContext& ctx, ArgIt begin, ArgIt end) {
    args::ArgumentParser parser("Capture the current page");
    parser.Prog(ctx.prog + " screenshot");
    args::HelpFlag help(parser, "help", "Show this help", {'h', "help"});

    auto parsed = parseCommand(parser, "screenshot", begin, end);
    if (!parsed || !*parsed) {
        return parsed ? Ok() : Err<void>("", parsed);
    }
    return withSession(ctx, "screenshot", [](BrowserClient& client, const std::string& id) {
        return mapResult(client.screenshot(id), [](const Screenshot& shot) {
            Json::Value out(Json::objectValue);
            out["screenshot"] = shot.screenshot;
            out["mimeType"] = shot.mimeType;
            out["url"] = shot.url;
            out["title"] = shot.title;
            return out;
        });
    });
}

Result<void> cmdCaptcha(const CmdContext& ctx, ArgIt begin, ArgIt end) {
    args::ArgumentParser parser("Detect and solve a captcha on the page");
    parser.Prog(ctx.prog + " captcha");
    args::HelpFlag help(parser, "help", "Show this help", {'h', "help"});

    auto parsed = parseCommand(parser, "captcha", begin, end);
    if (!parsed || !*parsed) {
        return parsed ? Ok() : Err<void>("", parsed);
    }
    return withSession(ctx, "captcha", [](BrowserClient& client, const std::string& id) {
        return mapResult(client.solveCaptcha(id), [](const CaptchaStatus& status) {
            Json::Value out(Json::objectValue);
            out["captchaDetected"] = status.captchaDetected;
            out["captchaType"] = status.captchaType ? Json::Value(*status.captchaType) : Json::Value();
            out["siteKey"] = status.siteKey ? Json::Value(*status.siteKey) : Json::Value();
            return out;
        });
    });
}

// ─── do ──────────────────────────────────────────────────────────────────────

Result<void> cmdDo(const CmdContext& ctx, ArgIt begin, ArgIt end) {
    args::ArgumentParser parser("Run a navigation request written in plain words");
    parser.Prog(ctx.prog + " do");
    args::HelpFlag help(parser, "help", "Show this help", {'h', "help"});
    args::PositionalList<std::string> words(parser, "text", "Request, e.g. \"go to example.com\"",
                                            args::Options::Required);

    auto parsed = parseCommand(parser, "do", begin, end);
    if (!parsed || !*parsed) {
        return parsed ? Ok() : Err<void>("", parsed);
    }

    std::string text;
    for (const auto& word : args::get(words)) {
        text += text.empty() ? word : " " + word;
    }

    auto service = startService(ctx);
    if (!service) {
        return std::unexpected(service.error());
    }
    auto result = navigateAction(**service, text, UrlPolicy::fromConfig(*ctx.config));
    printJson(result.toJson());
    (*service)->stop();

    if (!result.success) {
        return Err<void>(result.text);
    }
    return Ok();
}

} // namespace corral::ctl
