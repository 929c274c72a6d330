#pragma once

#include <corral/base/factory.h>
#include <corral/rpc/rpc-message.h>

#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <string>

namespace corral {
namespace rpc {

enum class ConnectionState {
    Disconnected,
    Connecting,
    Connected,
    Reconnecting,
};

const char* connectionStateName(ConnectionState state) noexcept;

enum class ConnectionEvent {
    Connected,
    // Connection lost or closed by disconnect()
    Disconnected,
    // maxReconnectAttempts used up; the client stays disconnected
    ReconnectFailed,
};

const char* connectionEventName(ConnectionEvent event) noexcept;

// WebSocket RPC client for the browser worker.
//
// One logical connection multiplexes any number of concurrent calls,
// correlated only by requestId. All socket work, the pending-request map
// and the reconnect state live on a private I/O thread; public methods may
// be called from any thread except from inside the notification handler.
//
// Usage:
//   auto client = RpcClient::create(RpcClient::Options{.port = 3456});
//   (*client)->connect();
//   auto reply = (*client)->sendMessage("getState", payload);
//
// connect() fails without retrying when the worker is unreachable. Once
// connected, an unexpected close rejects every in-flight call and schedules
// up to maxReconnectAttempts reconnects, waiting reconnectDelay * attempt
// before each. disconnect() is permanent until the next connect().
class RpcClient : public base::ObjectFactory<RpcClient> {
public:
    using Ptr = std::shared_ptr<RpcClient>;
    using NotificationHandler = std::function<void(const Json::Value& envelope)>;
    using ConnectionHandler = std::function<void(ConnectionEvent event)>;

    struct Options {
        std::string host = "127.0.0.1";
        uint16_t port = 3456;
        std::chrono::milliseconds requestTimeout{30000};
        std::chrono::milliseconds connectTimeout{10000};
        std::chrono::milliseconds reconnectDelay{5000};
        int maxReconnectAttempts = 5;
    };

    static Result<Ptr> createImpl(const Options& options) noexcept;

    virtual ~RpcClient() = default;

    virtual Result<void> connect() = 0;
    virtual void disconnect() = 0;

    // Blocks until the matching response, the request timeout or the loss of
    // the connection. Returns the whole response envelope.
    virtual Result<Json::Value> sendMessage(const std::string& type, const Json::Value& payload) = 0;
    virtual std::future<Result<Json::Value>> sendMessageAsync(const std::string& type,
                                                              const Json::Value& payload) = 0;

    // Receives every envelope that is not a reply to a pending call.
    // Runs on the I/O thread.
    virtual void setNotificationHandler(NotificationHandler handler) = 0;
    // Connection lifecycle events. Runs on the I/O thread.
    virtual void setConnectionHandler(ConnectionHandler handler) = 0;

    virtual bool isConnected() const = 0;
    virtual ConnectionState state() const = 0;
    virtual int reconnectAttempts() const = 0;
    virtual size_t pendingCount() const = 0;
    // Id announced by the worker in its "connected" message
    virtual std::string clientId() const = 0;
    virtual const Options& options() const = 0;

protected:
    RpcClient() = default;
};

} // namespace rpc
} // namespace corral
