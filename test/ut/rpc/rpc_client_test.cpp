#include <boost/ut.hpp>
#include <corral/rpc/rpc-client.h>
#include "../harness/ws_test_server.h"

#include <atomic>
#include <mutex>
#include <thread>
#include <vector>

using namespace boost::ut;
using namespace corral;
using namespace corral::rpc;
using namespace corral::test;
using namespace std::chrono_literals;

namespace {

RpcClient::Options optionsFor(uint16_t port) {
    RpcClient::Options options;
    options.port = port;
    options.requestTimeout = 2000ms;
    options.connectTimeout = 1000ms;
    options.reconnectDelay = 20ms;
    options.maxReconnectAttempts = 2;
    return options;
}

RpcClient::Ptr connectedClient(const RpcClient::Options& options) {
    auto client = RpcClient::create(options);
    if (!client) return nullptr;
    if (!(*client)->connect()) return nullptr;
    return *client;
}

// Connection events in arrival order
struct EventLog {
    std::mutex mutex;
    std::vector<ConnectionEvent> events;

    RpcClient::ConnectionHandler handler() {
        return [this](ConnectionEvent event) {
            std::lock_guard<std::mutex> lock(mutex);
            events.push_back(event);
        };
    }

    std::vector<ConnectionEvent> snapshot() {
        std::lock_guard<std::mutex> lock(mutex);
        return events;
    }
};

Json::Value data(const std::string& key, const std::string& value) {
    Json::Value out(Json::objectValue);
    out[key] = value;
    return out;
}

} // namespace

suite rpc_client_tests = [] {
    "create rejects port zero"_test = [] {
        RpcClient::Options options;
        options.port = 0;
        expect(!RpcClient::create(options).has_value());
    };

    "send while not connected fails fast"_test = [] {
        auto client = RpcClient::create(optionsFor(freePort()));
        expect(client.has_value() >> fatal);
        auto reply = (*client)->sendMessage(verb::GET_STATE, Json::Value(Json::objectValue));
        expect(!reply.has_value());
        expect(reply.error().code() == ErrorCode::ServiceNotAvailable);
        expect((*client)->state() == ConnectionState::Disconnected);
    };

    "initial connect failure is reported without retrying"_test = [] {
        auto client = RpcClient::create(optionsFor(freePort()));
        expect(client.has_value() >> fatal);
        auto res = (*client)->connect();
        expect(!res.has_value());
        expect(res.error().code() == ErrorCode::ServiceNotAvailable);
        std::this_thread::sleep_for(100ms);
        expect((*client)->state() == ConnectionState::Disconnected);
        expect((*client)->reconnectAttempts() == 0_i);
    };

    "request and reply"_test = [] {
        WsTestServer server;
        expect(server.start() >> fatal);
        server.setHandler([](const Json::Value& request) {
            return std::vector<Json::Value>{replyTo(request, data("echo", request["data"]["text"].asString()))};
        });

        auto client = connectedClient(optionsFor(server.port()));
        expect((client != nullptr) >> fatal);
        expect(client->isConnected());

        Json::Value payload(Json::objectValue);
        payload["sessionId"] = "s-1";
        payload["data"]["text"] = "hello";
        auto reply = client->sendMessage(verb::TYPE, payload);
        expect(reply.has_value() >> fatal);
        expect((*reply)["data"]["echo"].asString() == std::string("hello"));
        expect(client->pendingCount() == 0_ul);

        auto received = server.received();
        expect((received.size() == 1_ul) >> fatal);
        expect(received[0]["type"].asString() == std::string("type"));
        expect(received[0]["sessionId"].asString() == std::string("s-1"));
        expect(received[0]["requestId"].asString().rfind("req-", 0) == 0u);
    };

    "replies are matched by requestId not by order"_test = [] {
        WsTestServer server;
        expect(server.start() >> fatal);
        // Hold "first" back and answer it after "second"
        std::vector<Json::Value> held;
        server.setHandler([&held](const Json::Value& request) {
            const auto label = request["data"]["label"].asString();
            if (label == "first") {
                held.push_back(request);
                return std::vector<Json::Value>{};
            }
            std::vector<Json::Value> replies{replyTo(request, data("label", label))};
            for (const auto& earlier : held) {
                replies.push_back(replyTo(earlier, data("label", earlier["data"]["label"].asString())));
            }
            held.clear();
            return replies;
        });

        auto client = connectedClient(optionsFor(server.port()));
        expect((client != nullptr) >> fatal);

        Json::Value first(Json::objectValue);
        first["data"]["label"] = "first";
        Json::Value second(Json::objectValue);
        second["data"]["label"] = "second";

        auto firstFuture = client->sendMessageAsync(verb::EXTRACT, first);
        expect(waitFor([&] { return server.receivedCount() == 1; }) >> fatal);
        auto secondFuture = client->sendMessageAsync(verb::EXTRACT, second);

        auto secondReply = secondFuture.get();
        auto firstReply = firstFuture.get();
        expect((firstReply.has_value() && secondReply.has_value()) >> fatal);
        expect((*firstReply)["data"]["label"].asString() == std::string("first"));
        expect((*secondReply)["data"]["label"].asString() == std::string("second"));
    };

    "concurrent callers each get their own reply"_test = [] {
        WsTestServer server;
        expect(server.start() >> fatal);
        server.setHandler([](const Json::Value& request) {
            return std::vector<Json::Value>{replyTo(request, data("n", request["data"]["n"].asString()))};
        });
        auto client = connectedClient(optionsFor(server.port()));
        expect((client != nullptr) >> fatal);

        std::atomic<int> mismatches{0};
        std::vector<std::thread> threads;
        for (int t = 0; t < 8; ++t) {
            threads.emplace_back([&, t] {
                for (int i = 0; i < 10; ++i) {
                    const auto n = std::to_string(t * 100 + i);
                    Json::Value payload(Json::objectValue);
                    payload["data"]["n"] = n;
                    auto reply = client->sendMessage(verb::EXTRACT, payload);
                    if (!reply || (*reply)["data"]["n"].asString() != n) {
                        ++mismatches;
                    }
                }
            });
        }
        for (auto& thread : threads) thread.join();
        expect(mismatches == 0_i);
        expect(client->pendingCount() == 0_ul);
    };

    "timeout affects only the silent request"_test = [] {
        WsTestServer server;
        expect(server.start() >> fatal);
        server.setHandler([](const Json::Value& request) {
            if (request["type"].asString() == verb::SOLVE_CAPTCHA) {
                return std::vector<Json::Value>{};
            }
            return std::vector<Json::Value>{replyTo(request)};
        });

        auto options = optionsFor(server.port());
        options.requestTimeout = 300ms;
        auto client = connectedClient(options);
        expect((client != nullptr) >> fatal);

        auto slow = client->sendMessageAsync(verb::SOLVE_CAPTCHA, Json::Value(Json::objectValue));
        auto fast = client->sendMessage(verb::GET_STATE, Json::Value(Json::objectValue));
        expect(fast.has_value());

        auto timedOut = slow.get();
        expect(!timedOut.has_value() >> fatal);
        expect(timedOut.error().code() == ErrorCode::Unknown);
        expect(timedOut.error().message().find("timed out") != std::string::npos);
        expect(client->isConnected());
        expect(client->pendingCount() == 0_ul);
    };

    "error envelope rejects with the worker message"_test = [] {
        WsTestServer server;
        expect(server.start() >> fatal);
        server.setHandler([](const Json::Value& request) {
            if (request["type"].asString() == verb::CLICK) {
                return std::vector<Json::Value>{errorTo(request, "No element matches")};
            }
            Json::Value reply = replyTo(request);
            reply["success"] = false;
            return std::vector<Json::Value>{reply};
        });
        auto client = connectedClient(optionsFor(server.port()));
        expect((client != nullptr) >> fatal);

        auto click = client->sendMessage(verb::CLICK, Json::Value(Json::objectValue));
        expect(!click.has_value() >> fatal);
        expect(click.error().code() == ErrorCode::Unknown);
        expect(click.error().message() == std::string("No element matches"));

        auto select = client->sendMessage(verb::SELECT, Json::Value(Json::objectValue));
        expect(!select.has_value() >> fatal);
        expect(select.error().message() == std::string("Request failed"));
    };

    "connected message sets client id and notifications reach the handler"_test = [] {
        WsTestServer server;
        server.setClientId("client-42");
        expect(server.start() >> fatal);

        auto client = RpcClient::create(optionsFor(server.port()));
        expect(client.has_value() >> fatal);
        std::atomic<int> notifications{0};
        std::atomic<bool> sawProgress{false};
        (*client)->setNotificationHandler([&](const Json::Value& envelope) {
            ++notifications;
            if (envelope["type"].asString() == "progress") sawProgress = true;
        });
        expect((*client)->connect().has_value() >> fatal);

        expect(waitFor([&] { return (*client)->clientId() == "client-42"; }));

        Json::Value progress(Json::objectValue);
        progress["type"] = "progress";
        progress["data"]["percent"] = 50;
        server.broadcast(progress);
        expect(waitFor([&] { return sawProgress.load(); }));
        expect(notifications == 2_i);
    };

    "frames with mistyped members are dropped and the connection survives"_test = [] {
        WsTestServer server;
        expect(server.start() >> fatal);
        auto client = RpcClient::create(optionsFor(server.port()));
        expect(client.has_value() >> fatal);
        std::atomic<int> notifications{0};
        (*client)->setNotificationHandler([&](const Json::Value&) { ++notifications; });
        expect((*client)->connect().has_value() >> fatal);
        expect(waitFor([&] { return server.connectionCount() == 1; }) >> fatal);

        auto parsed = parseEnvelope(R"({"type":["x"],"requestId":"r"})");
        expect(parsed.has_value() >> fatal);
        server.broadcast(*parsed);
        auto badId = parseEnvelope(R"({"type":"connected","clientId":{"id":1},"requestId":[1]})");
        expect(badId.has_value() >> fatal);
        server.broadcast(*badId);

        expect(waitFor([&] { return notifications.load() == 1; }) >> fatal);
        expect((*client)->isConnected());
        expect((*client)->clientId().empty());

        auto reply = (*client)->sendMessage(verb::GET_STATE, Json::Value(Json::objectValue));
        expect(reply.has_value());
        expect((*client)->isConnected());
    };

    "connection loss rejects pending requests immediately"_test = [] {
        WsTestServer server;
        expect(server.start() >> fatal);
        server.setHandler([](const Json::Value&) { return std::vector<Json::Value>{}; });

        auto options = optionsFor(server.port());
        options.requestTimeout = 10000ms;
        auto client = connectedClient(options);
        expect((client != nullptr) >> fatal);

        const auto started = std::chrono::steady_clock::now();
        auto pending = client->sendMessageAsync(verb::NAVIGATE, Json::Value(Json::objectValue));
        expect(waitFor([&] { return server.receivedCount() == 1; }) >> fatal);
        server.dropConnections();

        auto result = pending.get();
        expect(!result.has_value() >> fatal);
        expect(result.error().code() == ErrorCode::ServiceNotAvailable);
        expect(std::chrono::steady_clock::now() - started < 5000ms);
    };

    "reconnects after the worker drops the connection"_test = [] {
        WsTestServer server;
        expect(server.start() >> fatal);
        auto client = connectedClient(optionsFor(server.port()));
        expect((client != nullptr) >> fatal);
        expect(server.connectionCount() == 1_i);

        server.dropConnections();
        expect(waitFor([&] { return server.connectionCount() == 2 && client->isConnected(); }) >> fatal);
        expect(client->reconnectAttempts() == 0_i);

        auto reply = client->sendMessage(verb::GET_STATE, Json::Value(Json::objectValue));
        expect(reply.has_value());
    };

    "reconnect gives up after maxReconnectAttempts"_test = [] {
        WsTestServer server;
        expect(server.start() >> fatal);
        auto client = connectedClient(optionsFor(server.port()));
        expect((client != nullptr) >> fatal);

        server.stop();
        expect(waitFor([&] {
            return client->state() == ConnectionState::Disconnected && client->reconnectAttempts() == 2;
        }) >> fatal);
        std::this_thread::sleep_for(200ms);
        expect(client->state() == ConnectionState::Disconnected);
        expect(client->reconnectAttempts() == 2_i);
        expect(server.connectionCount() == 1_i);
    };

    "connection events report loss, recovery and giving up"_test = [] {
        WsTestServer server;
        expect(server.start() >> fatal);
        EventLog log;
        auto client = RpcClient::create(optionsFor(server.port()));
        expect(client.has_value() >> fatal);
        (*client)->setConnectionHandler(log.handler());
        expect((*client)->connect().has_value() >> fatal);

        server.dropConnections();
        expect(waitFor([&] { return log.snapshot().size() == 3; }) >> fatal);
        expect(log.snapshot() == std::vector<ConnectionEvent>{
            ConnectionEvent::Connected, ConnectionEvent::Disconnected, ConnectionEvent::Connected});

        server.stop();
        expect(waitFor([&] { return log.snapshot().size() == 5; }) >> fatal);
        auto events = log.snapshot();
        expect(events[3] == ConnectionEvent::Disconnected);
        expect(events[4] == ConnectionEvent::ReconnectFailed);
        expect((*client)->state() == ConnectionState::Disconnected);
        expect(std::string(connectionEventName(events[4])) == "reconnectFailed");
    };

    "disconnect reports a single disconnected event"_test = [] {
        WsTestServer server;
        expect(server.start() >> fatal);
        EventLog log;
        auto client = RpcClient::create(optionsFor(server.port()));
        expect(client.has_value() >> fatal);
        (*client)->setConnectionHandler(log.handler());
        expect((*client)->connect().has_value() >> fatal);

        (*client)->disconnect();
        (*client)->disconnect();
        expect(log.snapshot() == std::vector<ConnectionEvent>{
            ConnectionEvent::Connected, ConnectionEvent::Disconnected});
    };

    "disconnect rejects pending requests and does not reconnect"_test = [] {
        WsTestServer server;
        expect(server.start() >> fatal);
        server.setHandler([](const Json::Value&) { return std::vector<Json::Value>{}; });
        auto client = connectedClient(optionsFor(server.port()));
        expect((client != nullptr) >> fatal);

        auto pending = client->sendMessageAsync(verb::SCREENSHOT, Json::Value(Json::objectValue));
        expect(waitFor([&] { return server.receivedCount() == 1; }) >> fatal);
        client->disconnect();

        auto result = pending.get();
        expect(!result.has_value() >> fatal);
        expect(result.error().code() == ErrorCode::ServiceNotAvailable);

        std::this_thread::sleep_for(100ms);
        expect(client->state() == ConnectionState::Disconnected);
        expect(server.connectionCount() == 1_i);

        // An explicit connect starts over
        expect(client->connect().has_value());
        expect(client->isConnected());
        expect(client->reconnectAttempts() == 0_i);
    };
};
