#include <corral/actions.h>
#include <ytrace/ytrace.hpp>

#include <regex>

namespace corral {

// "example.com" gains https://; anything that already names a scheme
// ("javascript:", "file:") is left for validateUrl to judge
static std::string withScheme(const std::string& url) {
    static const std::regex scheme(R"(^[A-Za-z][A-Za-z0-9+.\-]*:(?!\d))");
    if (std::regex_search(url, scheme)) {
        return url;
    }
    return "https://" + url;
}

static const char* errorTypeFor(const Error& error) {
    switch (error.code()) {
        case ErrorCode::ServiceNotAvailable: return "service_not_available";
        case ErrorCode::SecurityError:       return "security_error";
        default:                             return "navigation_error";
    }
}

static ActionResult navigateFailure(const Error& error, const std::string& url) {
    ActionResult result;
    result.text = error.userMessage();
    result.success = false;
    result.data["actionName"] = NAVIGATE_ACTION;
    result.data["error"] = errorTypeFor(error);
    if (!url.empty()) result.data["url"] = url;
    result.values["success"] = false;
    result.values["errorType"] = errorTypeFor(error);
    return result;
}

Json::Value ActionResult::toJson() const {
    Json::Value out(Json::objectValue);
    out["text"] = text;
    out["success"] = success;
    out["data"] = data;
    out["values"] = values;
    return out;
}

ActionResult navigateAction(BrowserService& service, const std::string& text, const UrlPolicy& policy) {
    yinfo("Handling {} action", NAVIGATE_ACTION);

    auto client = service.client();
    if (!client) {
        yerror("{}: {}", NAVIGATE_ACTION, client.error().message());
        return navigateFailure(client.error(), "");
    }

    auto extracted = extractUrl(text);
    if (!extracted) {
        ActionResult result;
        result.text = "I couldn't find a URL in your request. Please provide a valid URL to navigate to.";
        result.data["actionName"] = NAVIGATE_ACTION;
        result.data["error"] = "no_url_found";
        result.values["success"] = false;
        result.values["errorType"] = "no_url_found";
        return result;
    }
    const std::string url = withScheme(*extracted);

    if (auto res = validateUrl(url, policy); !res) {
        ywarn("{}: refused {}: {}", NAVIGATE_ACTION, url, res.error().message());
        return navigateFailure(res.error(), url);
    }

    auto session = service.ensureCurrentSession();
    if (!session) {
        yerror("{}: no session: {}", NAVIGATE_ACTION, session.error().message());
        return navigateFailure(Error::wrapUnknown(session.error(), "navigate to " + url), url);
    }

    auto page = (*client)->navigate(session->id, url);
    if (!page) {
        yerror("{}: {}", NAVIGATE_ACTION, page.error().message());
        return navigateFailure(Error::wrapUnknown(page.error(), "navigate to " + url), url);
    }

    ActionResult result;
    result.text = "I've navigated to " + url + ". The page title is: \"" + page->title + "\"";
    result.success = true;
    result.data["actionName"] = NAVIGATE_ACTION;
    result.data["url"] = page->url;
    result.data["title"] = page->title;
    result.data["sessionId"] = session->id;
    result.values["success"] = true;
    result.values["url"] = page->url;
    result.values["pageTitle"] = page->title;
    return result;
}

ActionResult browserStateAction(BrowserService& service) {
    ActionResult result;
    auto session = service.currentSession();
    auto client = service.client();
    if (!session || !client) {
        result.text = "No active browser session";
        result.success = true;
        result.values["hasSession"] = false;
        return result;
    }

    auto state = (*client)->getState(session->id);
    if (!state) {
        yerror("Error getting browser state: {}", state.error().message());
        result.text = "Error getting browser state";
        result.values["hasSession"] = true;
        result.values["error"] = true;
        return result;
    }

    const auto createdAt = std::chrono::duration_cast<std::chrono::milliseconds>(
        session->createdAt.time_since_epoch()).count();

    result.text = "Current browser page: \"" + state->title + "\" at " + state->url;
    result.success = true;
    result.values["hasSession"] = true;
    result.values["url"] = state->url;
    result.values["title"] = state->title;
    result.data["sessionId"] = session->id;
    result.data["createdAt"] = Json::Int64(createdAt);
    return result;
}

} // namespace corral
