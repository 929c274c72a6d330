#include <corral/rpc/rpc-client.h>
#include <ytrace/ytrace.hpp>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include <atomic>
#include <deque>
#include <mutex>
#include <system_error>
#include <thread>
#include <unordered_map>

namespace corral {
namespace rpc {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace websocket = beast::websocket;
using tcp = asio::ip::tcp;

const char* connectionStateName(ConnectionState state) noexcept {
    switch (state) {
        case ConnectionState::Disconnected: return "disconnected";
        case ConnectionState::Connecting:   return "connecting";
        case ConnectionState::Connected:    return "connected";
        case ConnectionState::Reconnecting: return "reconnecting";
    }
    return "unknown";
}

const char* connectionEventName(ConnectionEvent event) noexcept {
    switch (event) {
        case ConnectionEvent::Connected:       return "connected";
        case ConnectionEvent::Disconnected:    return "disconnected";
        case ConnectionEvent::ReconnectFailed: return "reconnectFailed";
    }
    return "unknown";
}

// ─── Implementation ──────────────────────────────────────────────────────────

class RpcClientImpl : public RpcClient {
public:
    using WsStream = websocket::stream<beast::tcp_stream>;
    using ReplyPromise = std::promise<Result<Json::Value>>;
    using ConnectPromise = std::promise<Result<void>>;

    struct PendingRequest {
        std::string type;
        std::shared_ptr<ReplyPromise> promise;
        std::unique_ptr<asio::steady_timer> timer;
    };

    explicit RpcClientImpl(const Options& options)
        : _options(options)
        , _work(asio::make_work_guard(_ioc))
        , _resolver(_ioc)
        , _reconnectTimer(_ioc) {}

    ~RpcClientImpl() override {
        disconnect();
        _work.reset();
        _ioc.stop();
        if (_thread.joinable()) {
            _thread.join();
        }
    }

    Result<void> init() noexcept {
        try {
            _thread = std::thread([this] { _ioc.run(); });
        } catch (const std::system_error& e) {
            return Err<void>(std::string("RpcClient: cannot start I/O thread: ") + e.what());
        }
        return Ok();
    }

    // ── Public API ──

    Result<void> connect() override {
        auto waiter = std::make_shared<ConnectPromise>();
        auto future = waiter->get_future();
        asio::post(_ioc, [this, waiter] {
            if (_state == ConnectionState::Connected) {
                waiter->set_value(Ok());
                return;
            }
            if (_connectWaiter) {
                waiter->set_value(Err<void>("RpcClient: connect already in progress"));
                return;
            }
            _closing = false;
            _reconnectAttempts = 0;
            _reconnectTimer.cancel();
            _connectWaiter = waiter;
            startConnect();
        });
        return future.get();
    }

    void disconnect() override {
        runOnLoop([this] {
            _closing = true;
            _reconnectAttempts = _options.maxReconnectAttempts;
            _reconnectTimer.cancel();
            ++_generation;

            const bool wasConnected = _state == ConnectionState::Connected;
            finishConnect(Err(Error::serviceNotAvailable("client disconnected")));
            failAllPending(Error::serviceNotAvailable("client disconnected"));
            _writeQueue.clear();
            _writing = false;

            if (auto ws = std::move(_ws); ws && ws->is_open()) {
                ydebug("RpcClient: closing connection to {}:{}", _options.host, _options.port);
                ws->async_close(websocket::close_code::normal, [ws](beast::error_code) {});
            }
            setState(ConnectionState::Disconnected);
            if (wasConnected) {
                emit(ConnectionEvent::Disconnected);
            }
        });
    }

    Result<Json::Value> sendMessage(const std::string& type, const Json::Value& payload) override {
        return sendMessageAsync(type, payload).get();
    }

    std::future<Result<Json::Value>> sendMessageAsync(const std::string& type,
                                                      const Json::Value& payload) override {
        auto promise = std::make_shared<ReplyPromise>();
        auto future = promise->get_future();

        if (_state != ConnectionState::Connected) {
            promise->set_value(Err<Json::Value>(Error::serviceNotAvailable(
                std::string("cannot send ") + type + ": not connected")));
            return future;
        }

        asio::post(_ioc, [this, type, payload, promise] {
            if (_state != ConnectionState::Connected) {
                promise->set_value(Err<Json::Value>(Error::serviceNotAvailable(
                    "cannot send " + type + ": not connected")));
                return;
            }

            std::string requestId = _ids.next();
            while (_pending.count(requestId)) {
                requestId = _ids.next();
            }

            PendingRequest request;
            request.type = type;
            request.promise = promise;
            request.timer = std::make_unique<asio::steady_timer>(_ioc, _options.requestTimeout);
            request.timer->async_wait([this, requestId](beast::error_code ec) {
                if (ec) return;
                onTimeout(requestId);
            });
            _pending.emplace(requestId, std::move(request));
            _pendingCount = _pending.size();

            ytrace("RpcClient: -> {} {}", type, requestId);
            enqueueWrite(encodeRequest(type, requestId, payload));
        });
        return future;
    }

    void setNotificationHandler(NotificationHandler handler) override {
        std::lock_guard<std::mutex> lock(_mutex);
        _notificationHandler = std::move(handler);
    }

    void setConnectionHandler(ConnectionHandler handler) override {
        std::lock_guard<std::mutex> lock(_mutex);
        _connectionHandler = std::move(handler);
    }

    bool isConnected() const override { return _state == ConnectionState::Connected; }
    ConnectionState state() const override { return _state; }
    int reconnectAttempts() const override { return _reconnectAttempts; }
    size_t pendingCount() const override { return _pendingCount; }

    std::string clientId() const override {
        std::lock_guard<std::mutex> lock(_mutex);
        return _clientId;
    }

    const Options& options() const override { return _options; }

private:
    // Run f on the I/O thread and wait for it
    template<typename F>
    void runOnLoop(F&& f) {
        if (!_thread.joinable() || std::this_thread::get_id() == _thread.get_id()) {
            f();
            return;
        }
        std::promise<void> done;
        auto future = done.get_future();
        asio::post(_ioc, [&] {
            f();
            done.set_value();
        });
        future.wait();
    }

    void setState(ConnectionState state) {
        if (_state != state) {
            ydebug("RpcClient: {} -> {}", connectionStateName(_state), connectionStateName(state));
            _state = state;
        }
    }

    void emit(ConnectionEvent event) {
        ConnectionHandler handler;
        {
            std::lock_guard<std::mutex> lock(_mutex);
            handler = _connectionHandler;
        }
        if (handler) {
            handler(event);
        }
    }

    std::string endpoint() const {
        return _options.host + ":" + std::to_string(_options.port);
    }

    // ── Connection ──

    void startConnect() {
        setState(_connectWaiter ? ConnectionState::Connecting : ConnectionState::Reconnecting);
        const uint64_t gen = ++_generation;
        auto ws = std::make_shared<WsStream>(_ioc);
        _ws = ws;

        _resolver.async_resolve(_options.host, std::to_string(_options.port),
            [this, gen, ws](beast::error_code ec, tcp::resolver::results_type results) {
                if (gen != _generation) return;
                if (ec) {
                    onConnectFailed("resolve: " + ec.message());
                    return;
                }
                beast::get_lowest_layer(*ws).expires_after(_options.connectTimeout);
                beast::get_lowest_layer(*ws).async_connect(results,
                    [this, gen, ws](beast::error_code ec, tcp::resolver::results_type::endpoint_type) {
                        if (gen != _generation) return;
                        if (ec) {
                            onConnectFailed("connect: " + ec.message());
                            return;
                        }
                        startHandshake(gen, ws);
                    });
            });
    }

    void startHandshake(uint64_t gen, const std::shared_ptr<WsStream>& ws) {
        beast::get_lowest_layer(*ws).expires_never();

        auto timeouts = websocket::stream_base::timeout::suggested(beast::role_type::client);
        timeouts.handshake_timeout = _options.connectTimeout;
        ws->set_option(timeouts);
        ws->set_option(websocket::stream_base::decorator([](websocket::request_type& req) {
            req.set(beast::http::field::user_agent, "corral");
        }));

        ws->async_handshake(endpoint(), "/", [this, gen, ws](beast::error_code ec) {
            if (gen != _generation) return;
            if (ec) {
                onConnectFailed("handshake: " + ec.message());
                return;
            }
            ws->text(true);
            onConnected(gen);
        });
    }

    void onConnected(uint64_t gen) {
        yinfo("RpcClient: connected to ws://{}", endpoint());
        _reconnectAttempts = 0;
        _readBuffer.consume(_readBuffer.size());
        setState(ConnectionState::Connected);
        finishConnect(Ok());
        emit(ConnectionEvent::Connected);
        startRead(gen);
    }

    void onConnectFailed(const std::string& reason) {
        ++_generation;
        _ws.reset();

        if (_connectWaiter) {
            // First attempt after connect(): report, never retry
            ywarn("RpcClient: cannot connect to ws://{}: {}", endpoint(), reason);
            setState(ConnectionState::Disconnected);
            finishConnect(Err(Error::serviceNotAvailable("cannot connect to ws://" + endpoint() + ": " + reason)));
            return;
        }
        ywarn("RpcClient: reconnect attempt {} failed: {}", _reconnectAttempts.load(), reason);
        scheduleReconnect();
    }

    void onConnectionLost(uint64_t gen, const std::string& reason) {
        if (gen != _generation) return;
        ++_generation;
        _ws.reset();
        _writeQueue.clear();
        _writing = false;

        ywarn("RpcClient: connection to ws://{} lost: {}", endpoint(), reason);
        failAllPending(Error::serviceNotAvailable("connection lost: " + reason));
        emit(ConnectionEvent::Disconnected);

        if (_closing) {
            setState(ConnectionState::Disconnected);
            return;
        }
        scheduleReconnect();
    }

    void scheduleReconnect() {
        if (_reconnectAttempts >= _options.maxReconnectAttempts) {
            ywarn("RpcClient: giving up after {} reconnect attempts", _reconnectAttempts.load());
            setState(ConnectionState::Disconnected);
            emit(ConnectionEvent::ReconnectFailed);
            return;
        }
        const int attempt = ++_reconnectAttempts;
        const auto delay = _options.reconnectDelay * attempt;
        yinfo("RpcClient: reconnecting in {}ms (attempt {}/{})",
              delay.count(), attempt, _options.maxReconnectAttempts);
        setState(ConnectionState::Reconnecting);

        const uint64_t gen = _generation;
        _reconnectTimer.expires_after(delay);
        _reconnectTimer.async_wait([this, gen](beast::error_code ec) {
            if (ec || gen != _generation || _closing) return;
            startConnect();
        });
    }

    void finishConnect(Result<void> result) {
        if (auto waiter = std::move(_connectWaiter)) {
            waiter->set_value(std::move(result));
        }
    }

    // ── Requests ──

    void onTimeout(const std::string& requestId) {
        auto it = _pending.find(requestId);
        if (it == _pending.end()) return;
        auto request = std::move(it->second);
        _pending.erase(it);
        _pendingCount = _pending.size();

        ywarn("RpcClient: {} {} timed out after {}ms", request.type, requestId,
              _options.requestTimeout.count());
        request.promise->set_value(Err<Json::Value>(
            "request " + request.type + " timed out after " +
            std::to_string(_options.requestTimeout.count()) + "ms"));
    }

    void failAllPending(const Error& error) {
        if (_pending.empty()) return;
        ydebug("RpcClient: rejecting {} pending requests", _pending.size());
        auto pending = std::move(_pending);
        _pending.clear();
        _pendingCount = 0;
        for (auto& [id, request] : pending) {
            request.timer->cancel();
            request.promise->set_value(Err<Json::Value>(
                Error(request.type + " " + id, error)));
        }
    }

    // ── I/O ──

    void enqueueWrite(std::string text) {
        _writeQueue.push_back(std::move(text));
        if (!_writing) {
            doWrite();
        }
    }

    void doWrite() {
        if (!_ws || _writeQueue.empty()) {
            _writing = false;
            return;
        }
        _writing = true;
        const uint64_t gen = _generation;
        auto ws = _ws;
        ws->async_write(asio::buffer(_writeQueue.front()),
            [this, gen, ws](beast::error_code ec, size_t) {
                if (gen != _generation) return;
                if (ec) {
                    onConnectionLost(gen, "write: " + ec.message());
                    return;
                }
                _writeQueue.pop_front();
                doWrite();
            });
    }

    void startRead(uint64_t gen) {
        auto ws = _ws;
        ws->async_read(_readBuffer, [this, gen, ws](beast::error_code ec, size_t) {
            if (gen != _generation) return;
            if (ec) {
                onConnectionLost(gen, ec == websocket::error::closed ? "closed by worker" : ec.message());
                return;
            }
            auto text = beast::buffers_to_string(_readBuffer.data());
            _readBuffer.consume(_readBuffer.size());
            dispatch(text);
            startRead(gen);
        });
    }

    void dispatch(const std::string& text) {
        auto parsed = parseEnvelope(text);
        if (!parsed) {
            ywarn("RpcClient: dropping message: {}", error_msg(parsed));
            return;
        }
        const Json::Value& envelope = *parsed;
        if (!envelope["type"].isString()) {
            ywarn("RpcClient: dropping message without a string type");
            return;
        }
        const auto type = envelope["type"].asString();
        const auto requestId = stringMember(envelope, "requestId");

        auto it = requestId.empty() ? _pending.end() : _pending.find(requestId);
        if (it != _pending.end()) {
            auto request = std::move(it->second);
            _pending.erase(it);
            _pendingCount = _pending.size();
            request.timer->cancel();

            ytrace("RpcClient: <- {} {}", type, requestId);
            if (isErrorEnvelope(envelope)) {
                request.promise->set_value(Err<Json::Value>(envelopeError(envelope)));
            } else {
                request.promise->set_value(Ok(Json::Value(envelope)));
            }
            return;
        }

        NotificationHandler handler;
        {
            std::lock_guard<std::mutex> lock(_mutex);
            if (type == verb::CONNECTED) {
                _clientId = stringMember(envelope, "clientId");
                yinfo("RpcClient: worker assigned client id {}", _clientId);
            } else {
                ydebug("RpcClient: notification {} {}", type, requestId);
            }
            handler = _notificationHandler;
        }
        if (handler) {
            handler(envelope);
        }
    }

    Options _options;

    asio::io_context _ioc;
    asio::executor_work_guard<asio::io_context::executor_type> _work;
    tcp::resolver _resolver;
    asio::steady_timer _reconnectTimer;
    std::thread _thread;

    // Owned by the I/O thread
    std::shared_ptr<WsStream> _ws;
    beast::flat_buffer _readBuffer;
    std::deque<std::string> _writeQueue;
    bool _writing = false;
    bool _closing = false;
    uint64_t _generation = 0;
    std::unordered_map<std::string, PendingRequest> _pending;
    std::shared_ptr<ConnectPromise> _connectWaiter;
    RequestIdGenerator _ids;

    // Readable from any thread
    std::atomic<ConnectionState> _state{ConnectionState::Disconnected};
    std::atomic<int> _reconnectAttempts{0};
    std::atomic<size_t> _pendingCount{0};

    mutable std::mutex _mutex;
    std::string _clientId;
    NotificationHandler _notificationHandler;
    ConnectionHandler _connectionHandler;
};

// ─── Factory ─────────────────────────────────────────────────────────────────

Result<RpcClient::Ptr> RpcClient::createImpl(const Options& options) noexcept {
    if (options.port == 0) {
        return Err<Ptr>("RpcClient: port must be non-zero");
    }
    auto client = std::make_shared<RpcClientImpl>(options);
    if (auto res = client->init(); !res) {
        return Err<Ptr>("Failed to initialize RpcClient", res);
    }
    return Ok<Ptr>(std::move(client));
}

} // namespace rpc
} // namespace corral
