#pragma once

#include <corral/retry.h>
#include <corral/rpc/rpc-client.h>

#include <optional>
#include <string>

namespace corral {

struct PageInfo {
    std::string url;
    std::string title;
};

struct PageState {
    std::string url;
    std::string title;
    std::string sessionId;
    std::string createdAt;
};

struct Extraction {
    std::string data;
    bool found = false;
};

struct Screenshot {
    std::string screenshot;  // base64
    std::string mimeType = "image/png";
    std::string url;
    std::string title;
};

struct CaptchaStatus {
    bool captchaDetected = false;
    std::optional<std::string> captchaType;
    std::optional<std::string> siteKey;
};

// Session-scoped browser operations over an RpcClient.
//
// Every call rejects an empty session id with SessionError before touching
// the wire. Unclassified failures (worker error strings, timeouts) become
// the operation's own kind, so they carry its retryable flag and user
// message. Navigation calls run under the navigation retry profile,
// click/type/select/extract/screenshot under the action profile.
// A reply without "data" yields the neutral value documented per call.
class BrowserClient {
public:
    explicit BrowserClient(rpc::RpcClient::Ptr rpc,
                           RetryConfig navigationRetry = retry::NAVIGATION,
                           RetryConfig actionRetry = retry::ACTION);

    Result<std::string> createSession();
    Result<void> destroySession(const std::string& sessionId);

    // {url, ""} when the worker sends no data
    Result<PageInfo> navigate(const std::string& sessionId, const std::string& url);
    // {"", "", sessionId, ""} when the worker sends no data
    Result<PageState> getState(const std::string& sessionId);
    Result<PageInfo> goBack(const std::string& sessionId);
    Result<PageInfo> goForward(const std::string& sessionId);
    Result<PageInfo> refresh(const std::string& sessionId);

    Result<void> click(const std::string& sessionId, const std::string& description);
    Result<void> type(const std::string& sessionId, const std::string& text, const std::string& field);
    Result<void> select(const std::string& sessionId, const std::string& option, const std::string& dropdown);
    Result<Extraction> extract(const std::string& sessionId, const std::string& instruction);
    Result<Screenshot> screenshot(const std::string& sessionId);
    Result<CaptchaStatus> solveCaptcha(const std::string& sessionId);

    const rpc::RpcClient::Ptr& rpc() const { return _rpc; }

private:
    enum class OpKind { Session, Navigation, Action };

    // Send and return the reply's "data" member (null when absent)
    Result<Json::Value> call(OpKind kind, const std::string& type, const std::string& target,
                             const std::string& sessionId, const Json::Value& data);
    Result<Json::Value> callWithRetry(OpKind kind, const std::string& type, const std::string& target,
                                      const std::string& sessionId, const Json::Value& data);
    Result<PageInfo> history(const std::string& type, const std::string& target,
                             const std::string& sessionId);

    static Error classify(OpKind kind, const std::string& target, const Error& error);

    rpc::RpcClient::Ptr _rpc;
    RetryConfig _navigationRetry;
    RetryConfig _actionRetry;
};

} // namespace corral
