#pragma once

#include <string>

namespace corral {

// Closed set of failure kinds. Unknown marks an unstructured failure that
// has not been classified yet (raw worker error strings, transport timeouts,
// third-party exceptions).
enum class ErrorCode {
    Unknown,
    ServiceNotAvailable,
    SessionError,
    NavigationError,
    ActionError,
    SecurityError,
};

const char* errorCodeName(ErrorCode code) noexcept;

// Retryability is a property of the kind, not of the individual error.
bool isRetryable(ErrorCode code) noexcept;

// Structured error carried by every Result<T>.
//
//   message      internal diagnostic text, safe for logs only
//   userMessage  generic text that may be shown to an end user or agent
//
// Instances are immutable. Adding context with Error(context, cause)
// prefixes the internal message and keeps code, userMessage and retryable.
class Error {
public:
    explicit Error(std::string message);
    Error(ErrorCode code, std::string message, std::string userMessage);
    Error(const std::string& context, const Error& cause);

    ErrorCode code() const noexcept { return _code; }
    const std::string& message() const noexcept { return _message; }
    const std::string& userMessage() const noexcept { return _userMessage; }
    bool retryable() const noexcept { return _retryable; }

    // Worker or RPC layer unreachable
    static Error serviceNotAvailable(const std::string& detail);
    // Session-scoped operation failed
    static Error sessionError(const std::string& detail);
    static Error navigationError(const std::string& url, const std::string& detail);
    static Error actionError(const std::string& action, const std::string& detail);
    // Blocked by policy, never retried
    static Error securityError(const std::string& detail);

    // Wrap an unclassified error with a fallback user message that names the
    // attempted action instead of echoing the raw failure text.
    static Error wrapUnknown(const Error& cause, const std::string& attemptedAction);

private:
    ErrorCode _code;
    std::string _message;
    std::string _userMessage;
    bool _retryable;
};

} // namespace corral
