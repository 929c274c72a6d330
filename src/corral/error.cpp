#include <corral/error.h>

namespace corral {

const char* errorCodeName(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Unknown:             return "UNKNOWN";
        case ErrorCode::ServiceNotAvailable: return "SERVICE_NOT_AVAILABLE";
        case ErrorCode::SessionError:        return "SESSION_ERROR";
        case ErrorCode::NavigationError:     return "NAVIGATION_ERROR";
        case ErrorCode::ActionError:         return "ACTION_ERROR";
        case ErrorCode::SecurityError:       return "SECURITY_ERROR";
    }
    return "UNKNOWN";
}

bool isRetryable(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::SessionError:
        case ErrorCode::NavigationError:
        case ErrorCode::ActionError:
            return true;
        case ErrorCode::Unknown:
        case ErrorCode::ServiceNotAvailable:
        case ErrorCode::SecurityError:
            return false;
    }
    return false;
}

Error::Error(std::string message)
    : _code(ErrorCode::Unknown)
    , _message(std::move(message))
    , _userMessage("Something went wrong with the browser.")
    , _retryable(false) {}

Error::Error(ErrorCode code, std::string message, std::string userMessage)
    : _code(code)
    , _message(std::move(message))
    , _userMessage(std::move(userMessage))
    , _retryable(isRetryable(code)) {}

Error::Error(const std::string& context, const Error& cause)
    : _code(cause._code)
    , _message(context.empty() ? cause._message : context + ": " + cause._message)
    , _userMessage(cause._userMessage)
    , _retryable(cause._retryable) {}

Error Error::serviceNotAvailable(const std::string& detail) {
    return Error(ErrorCode::ServiceNotAvailable,
                 "browser service not available: " + detail,
                 "The browser service is not available right now. Please try again later.");
}

Error Error::sessionError(const std::string& detail) {
    return Error(ErrorCode::SessionError,
                 "browser session error: " + detail,
                 "There was a problem with the browser session. Please try again.");
}

Error Error::navigationError(const std::string& url, const std::string& detail) {
    return Error(ErrorCode::NavigationError,
                 "failed to navigate to " + url + ": " + detail,
                 "I couldn't load " + url + ". The page may be unavailable or took too long to respond.");
}

Error Error::actionError(const std::string& action, const std::string& detail) {
    return Error(ErrorCode::ActionError,
                 "failed to " + action + ": " + detail,
                 "I couldn't " + action + " on the page. The element may not be available.");
}

Error Error::securityError(const std::string& detail) {
    return Error(ErrorCode::SecurityError,
                 "security policy violation: " + detail,
                 "That browser action was blocked for security reasons.");
}

Error Error::wrapUnknown(const Error& cause, const std::string& attemptedAction) {
    if (cause.code() != ErrorCode::Unknown) {
        return cause;
    }
    return Error(ErrorCode::Unknown,
                 attemptedAction + ": " + cause.message(),
                 "Something went wrong while trying to " + attemptedAction + ".");
}

} // namespace corral
