#include <corral/browser-client.h>
#include <ytrace/ytrace.hpp>

namespace corral {

using namespace rpc;

static std::string stringField(const Json::Value& data, const char* key,
                               const std::string& fallback = "") {
    if (!data.isObject()) return fallback;
    const Json::Value& value = data[key];
    if (value.isString()) return value.asString();
    if (value.isNull()) return fallback;
    return toJson(value);
}

static std::optional<std::string> optionalString(const Json::Value& data, const char* key) {
    if (!data.isObject()) return std::nullopt;
    const Json::Value& value = data[key];
    if (value.isString()) return value.asString();
    return std::nullopt;
}

static bool boolField(const Json::Value& data, const char* key) {
    if (!data.isObject()) return false;
    const Json::Value& value = data[key];
    return value.isBool() && value.asBool();
}

static PageInfo pageInfo(const Json::Value& data, const std::string& fallbackUrl) {
    if (!data.isObject()) return PageInfo{fallbackUrl, ""};
    return PageInfo{stringField(data, "url", fallbackUrl), stringField(data, "title")};
}

BrowserClient::BrowserClient(RpcClient::Ptr rpc, RetryConfig navigationRetry, RetryConfig actionRetry)
    : _rpc(std::move(rpc))
    , _navigationRetry(navigationRetry)
    , _actionRetry(actionRetry) {}

Error BrowserClient::classify(OpKind kind, const std::string& target, const Error& error) {
    if (error.code() != ErrorCode::Unknown) {
        return error;
    }
    switch (kind) {
        case OpKind::Navigation: return Error::navigationError(target, error.message());
        case OpKind::Action:     return Error::actionError(target, error.message());
        case OpKind::Session:    return Error::sessionError(target + ": " + error.message());
    }
    return error;
}

Result<Json::Value> BrowserClient::call(OpKind kind, const std::string& type, const std::string& target,
                                        const std::string& sessionId, const Json::Value& data) {
    if (!_rpc) {
        return Err<Json::Value>(Error::serviceNotAvailable("no RPC client"));
    }
    Json::Value payload(Json::objectValue);
    if (!sessionId.empty()) payload["sessionId"] = sessionId;
    if (!data.isNull()) payload["data"] = data;

    auto reply = _rpc->sendMessage(type, payload);
    if (!reply) {
        return Err<Json::Value>(classify(kind, target, reply.error()));
    }
    return Ok(Json::Value((*reply)["data"]));
}

Result<Json::Value> BrowserClient::callWithRetry(OpKind kind, const std::string& type,
                                                 const std::string& target,
                                                 const std::string& sessionId,
                                                 const Json::Value& data) {
    const RetryConfig& config = kind == OpKind::Navigation ? _navigationRetry : _actionRetry;
    return retryWithBackoff([&] { return call(kind, type, target, sessionId, data); },
                            config, type + " " + sessionId);
}

static Result<void> requireSession(const std::string& sessionId) {
    if (sessionId.empty()) {
        return Err(Error::sessionError("session id is required"));
    }
    return Ok();
}

// ─── Sessions ────────────────────────────────────────────────────────────────

Result<std::string> BrowserClient::createSession() {
    auto data = call(OpKind::Session, verb::CREATE_SESSION, "create session", "", Json::Value());
    if (!data) {
        return std::unexpected(data.error());
    }
    auto sessionId = stringField(*data, "sessionId");
    if (sessionId.empty()) {
        return Err<std::string>(Error::sessionError("worker returned no session id"));
    }
    yinfo("BrowserClient: created session {}", sessionId);
    return Ok(std::move(sessionId));
}

Result<void> BrowserClient::destroySession(const std::string& sessionId) {
    if (auto res = requireSession(sessionId); !res) return res;
    auto data = call(OpKind::Session, verb::DESTROY_SESSION, "destroy session", sessionId, Json::Value());
    if (!data) {
        return std::unexpected(data.error());
    }
    yinfo("BrowserClient: destroyed session {}", sessionId);
    return Ok();
}

// ─── Navigation ──────────────────────────────────────────────────────────────

Result<PageInfo> BrowserClient::navigate(const std::string& sessionId, const std::string& url) {
    if (auto res = requireSession(sessionId); !res) return std::unexpected(res.error());
    Json::Value data(Json::objectValue);
    data["url"] = url;
    auto reply = callWithRetry(OpKind::Navigation, verb::NAVIGATE, url, sessionId, data);
    if (!reply) {
        return std::unexpected(reply.error());
    }
    return Ok(pageInfo(*reply, url));
}

Result<PageInfo> BrowserClient::history(const std::string& type, const std::string& target,
                                        const std::string& sessionId) {
    if (auto res = requireSession(sessionId); !res) return std::unexpected(res.error());
    auto reply = callWithRetry(OpKind::Navigation, type, target, sessionId, Json::Value());
    if (!reply) {
        return std::unexpected(reply.error());
    }
    return Ok(pageInfo(*reply, ""));
}

Result<PageInfo> BrowserClient::goBack(const std::string& sessionId) {
    return history(verb::GO_BACK, "the previous page", sessionId);
}

Result<PageInfo> BrowserClient::goForward(const std::string& sessionId) {
    return history(verb::GO_FORWARD, "the next page", sessionId);
}

Result<PageInfo> BrowserClient::refresh(const std::string& sessionId) {
    return history(verb::REFRESH, "the current page", sessionId);
}

Result<PageState> BrowserClient::getState(const std::string& sessionId) {
    if (auto res = requireSession(sessionId); !res) return std::unexpected(res.error());
    auto reply = call(OpKind::Session, verb::GET_STATE, "get page state", sessionId, Json::Value());
    if (!reply) {
        return std::unexpected(reply.error());
    }
    const Json::Value& data = *reply;
    if (!data.isObject()) {
        return Ok(PageState{"", "", sessionId, ""});
    }
    return Ok(PageState{stringField(data, "url"), stringField(data, "title"),
                        stringField(data, "sessionId", sessionId), stringField(data, "createdAt")});
}

// ─── Interaction ─────────────────────────────────────────────────────────────

Result<void> BrowserClient::click(const std::string& sessionId, const std::string& description) {
    if (auto res = requireSession(sessionId); !res) return res;
    Json::Value data(Json::objectValue);
    data["description"] = description;
    auto reply = callWithRetry(OpKind::Action, verb::CLICK, "click", sessionId, data);
    if (!reply) {
        return std::unexpected(reply.error());
    }
    return Ok();
}

Result<void> BrowserClient::type(const std::string& sessionId, const std::string& text,
                                 const std::string& field) {
    if (auto res = requireSession(sessionId); !res) return res;
    Json::Value data(Json::objectValue);
    data["text"] = text;
    data["field"] = field;
    auto reply = callWithRetry(OpKind::Action, verb::TYPE, "type", sessionId, data);
    if (!reply) {
        return std::unexpected(reply.error());
    }
    return Ok();
}

Result<void> BrowserClient::select(const std::string& sessionId, const std::string& option,
                                   const std::string& dropdown) {
    if (auto res = requireSession(sessionId); !res) return res;
    Json::Value data(Json::objectValue);
    data["option"] = option;
    data["dropdown"] = dropdown;
    auto reply = callWithRetry(OpKind::Action, verb::SELECT, "select an option", sessionId, data);
    if (!reply) {
        return std::unexpected(reply.error());
    }
    return Ok();
}

Result<Extraction> BrowserClient::extract(const std::string& sessionId, const std::string& instruction) {
    if (auto res = requireSession(sessionId); !res) return std::unexpected(res.error());
    Json::Value data(Json::objectValue);
    data["instruction"] = instruction;
    auto reply = callWithRetry(OpKind::Action, verb::EXTRACT, "extract data", sessionId, data);
    if (!reply) {
        return std::unexpected(reply.error());
    }
    const Json::Value& result = *reply;
    if (!result.isObject()) {
        return Ok(Extraction{});
    }
    return Ok(Extraction{stringField(result, "data"), boolField(result, "found")});
}

Result<Screenshot> BrowserClient::screenshot(const std::string& sessionId) {
    if (auto res = requireSession(sessionId); !res) return std::unexpected(res.error());
    auto reply = callWithRetry(OpKind::Action, verb::SCREENSHOT, "take a screenshot", sessionId, Json::Value());
    if (!reply) {
        return std::unexpected(reply.error());
    }
    const Json::Value& result = *reply;
    if (!result.isObject()) {
        return Ok(Screenshot{});
    }
    return Ok(Screenshot{stringField(result, "screenshot"), stringField(result, "mimeType", "image/png"),
                         stringField(result, "url"), stringField(result, "title")});
}

Result<CaptchaStatus> BrowserClient::solveCaptcha(const std::string& sessionId) {
    if (auto res = requireSession(sessionId); !res) return std::unexpected(res.error());
    auto reply = call(OpKind::Action, verb::SOLVE_CAPTCHA, "solve the captcha", sessionId, Json::Value());
    if (!reply) {
        return std::unexpected(reply.error());
    }
    const Json::Value& result = *reply;
    if (!result.isObject()) {
        return Ok(CaptchaStatus{});
    }
    return Ok(CaptchaStatus{boolField(result, "captchaDetected"),
                            optionalString(result, "captchaType"),
                            optionalString(result, "siteKey")});
}

} // namespace corral
