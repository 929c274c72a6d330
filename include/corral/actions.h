#pragma once

#include <corral/browser-service.h>
#include <corral/url.h>

#include <json/json.h>

#include <string>

namespace corral {

// Reply handed back to the agent layer. text is always safe to show to an
// end user; internal error detail only goes to the log.
struct ActionResult {
    std::string text;
    bool success = false;
    Json::Value data{Json::objectValue};
    Json::Value values{Json::objectValue};

    Json::Value toJson() const;
};

inline constexpr const char* NAVIGATE_ACTION = "BROWSER_NAVIGATE";

// Navigate the current session (created on demand) to the URL found in text.
// values.errorType on failure: service_not_available, no_url_found,
// security_error or navigation_error.
ActionResult navigateAction(BrowserService& service, const std::string& text, const UrlPolicy& policy);

// Describe the current session's page, or report that there is none
ActionResult browserStateAction(BrowserService& service);

} // namespace corral
