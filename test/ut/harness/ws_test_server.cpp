#include "ws_test_server.h"

#include <corral/rpc/rpc-message.h>

#include <boost/asio/post.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include <deque>
#include <future>

namespace corral::test {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace websocket = beast::websocket;
using tcp = asio::ip::tcp;

bool waitFor(const std::function<bool()>& pred, std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!pred()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return true;
}

uint16_t freePort() {
    asio::io_context ioc;
    tcp::acceptor acceptor(ioc, tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
    return acceptor.local_endpoint().port();
}

Json::Value replyTo(const Json::Value& request, const Json::Value& data) {
    Json::Value reply(Json::objectValue);
    reply["type"] = request["type"];
    reply["requestId"] = request["requestId"];
    reply["success"] = true;
    if (!data.isNull()) {
        reply["data"] = data;
    }
    return reply;
}

Json::Value errorTo(const Json::Value& request, const std::string& message) {
    Json::Value reply(Json::objectValue);
    reply["type"] = rpc::verb::ERROR;
    reply["requestId"] = request["requestId"];
    reply["error"] = message;
    return reply;
}

//-----------------------------------------------------------------------------
// Session - one accepted WebSocket connection, driven by the I/O thread
//-----------------------------------------------------------------------------
class WsTestServer::Session : public std::enable_shared_from_this<Session> {
public:
    Session(WsTestServer& server, tcp::socket socket)
        : _server(server)
        , _ws(std::move(socket)) {}

    void run() {
        auto self = shared_from_this();
        _ws.async_accept([self](beast::error_code ec) {
            if (ec) return;
            self->onAccept();
        });
    }

    void send(std::string text) {
        _queue.push_back(std::move(text));
        if (_queue.size() == 1) {
            doWrite();
        }
    }

    void drop() {
        beast::error_code ec;
        auto& socket = beast::get_lowest_layer(_ws).socket();
        socket.shutdown(tcp::socket::shutdown_both, ec);
        socket.close(ec);
    }

private:
    void onAccept() {
        _ws.text(true);
        ++_server._connections;

        std::string clientId;
        {
            std::lock_guard<std::mutex> lock(_server._mutex);
            clientId = _server._clientId;
        }
        if (!clientId.empty()) {
            Json::Value hello(Json::objectValue);
            hello["type"] = rpc::verb::CONNECTED;
            hello["clientId"] = clientId;
            send(rpc::toJson(hello));
        }
        doRead();
    }

    void doRead() {
        auto self = shared_from_this();
        _ws.async_read(_buffer, [self](beast::error_code ec, size_t) {
            if (ec) return;
            auto text = beast::buffers_to_string(self->_buffer.data());
            self->_buffer.consume(self->_buffer.size());
            if (auto request = rpc::parseEnvelope(text)) {
                for (const auto& reply : self->_server.handle(*request)) {
                    self->send(rpc::toJson(reply));
                }
            }
            self->doRead();
        });
    }

    void doWrite() {
        auto self = shared_from_this();
        _ws.async_write(asio::buffer(_queue.front()), [self](beast::error_code ec, size_t) {
            if (ec) {
                self->_queue.clear();
                return;
            }
            self->_queue.pop_front();
            if (!self->_queue.empty()) {
                self->doWrite();
            }
        });
    }

    WsTestServer& _server;
    websocket::stream<beast::tcp_stream> _ws;
    beast::flat_buffer _buffer;
    std::deque<std::string> _queue;
};

//-----------------------------------------------------------------------------
// WsTestServer
//-----------------------------------------------------------------------------
WsTestServer::WsTestServer()
    : _work(asio::make_work_guard(_ioc)) {}

WsTestServer::~WsTestServer() {
    stop();
    _work.reset();
    _ioc.stop();
    if (_thread.joinable()) {
        _thread.join();
    }
}

template<typename F>
void WsTestServer::runOnLoop(F&& f) {
    if (!_thread.joinable()) {
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

bool WsTestServer::start(uint16_t port) {
    bool ok = false;
    runOnLoop([&] {
        beast::error_code ec;
        auto acceptor = std::make_unique<tcp::acceptor>(_ioc);
        tcp::endpoint endpoint(asio::ip::make_address("127.0.0.1"), port);
        acceptor->open(endpoint.protocol(), ec);
        if (ec) return;
        acceptor->set_option(asio::socket_base::reuse_address(true), ec);
        acceptor->bind(endpoint, ec);
        if (ec) return;
        acceptor->listen(asio::socket_base::max_listen_connections, ec);
        if (ec) return;

        _port = acceptor->local_endpoint().port();
        _acceptor = std::move(acceptor);
        doAccept();
        ok = true;
    });
    if (ok && !_thread.joinable()) {
        _thread = std::thread([this] { _ioc.run(); });
    }
    return ok;
}

void WsTestServer::stop() {
    stopListening();
    dropConnections();
}

void WsTestServer::stopListening() {
    runOnLoop([this] {
        if (_acceptor) {
            beast::error_code ec;
            _acceptor->close(ec);
        }
    });
}

void WsTestServer::dropConnections() {
    runOnLoop([this] {
        for (auto& weak : _sessions) {
            if (auto session = weak.lock()) {
                session->drop();
            }
        }
        _sessions.clear();
    });
}

void WsTestServer::broadcast(const Json::Value& envelope) {
    const std::string text = rpc::toJson(envelope);
    runOnLoop([this, &text] {
        for (auto& weak : _sessions) {
            if (auto session = weak.lock()) {
                session->send(text);
            }
        }
    });
}

void WsTestServer::setHandler(Handler handler) {
    std::lock_guard<std::mutex> lock(_mutex);
    _handler = std::move(handler);
}

void WsTestServer::setClientId(std::string id) {
    std::lock_guard<std::mutex> lock(_mutex);
    _clientId = std::move(id);
}

std::vector<Json::Value> WsTestServer::received() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _received;
}

size_t WsTestServer::receivedCount(const std::string& type) const {
    std::lock_guard<std::mutex> lock(_mutex);
    if (type.empty()) {
        return _received.size();
    }
    size_t count = 0;
    for (const auto& request : _received) {
        if (request.get("type", "").asString() == type) {
            ++count;
        }
    }
    return count;
}

void WsTestServer::doAccept() {
    _acceptor->async_accept([this](beast::error_code ec, tcp::socket socket) {
        if (ec) return;
        auto session = std::make_shared<Session>(*this, std::move(socket));
        _sessions.push_back(session);
        session->run();
        doAccept();
    });
}

std::vector<Json::Value> WsTestServer::handle(const Json::Value& request) {
    Handler handler;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _received.push_back(request);
        handler = _handler;
    }
    if (!handler) {
        return {replyTo(request)};
    }
    return handler(request);
}

} // namespace corral::test
