#pragma once

#include <corral/result.hpp>
#include <json/json.h>

#include <atomic>
#include <cstdint>
#include <string>

namespace corral {
namespace rpc {

// Wire format: one JSON object per WebSocket text frame.
//
// Outbound:  {"type": "<verb>", "requestId": "<id>", "sessionId"?: "<id>", "data"?: {...}}
// Inbound:   {"type": "<verb>", "requestId": "<id>", "data"?: {...}}
//            {"type": "error", "requestId": "<id>", "error": "<message>"}
//            {"type": "connected", "clientId": "<id>"}          (unsolicited)

namespace verb {
inline constexpr const char* CREATE_SESSION = "createSession";
inline constexpr const char* DESTROY_SESSION = "destroySession";
inline constexpr const char* NAVIGATE = "navigate";
inline constexpr const char* GET_STATE = "getState";
inline constexpr const char* GO_BACK = "goBack";
inline constexpr const char* GO_FORWARD = "goForward";
inline constexpr const char* REFRESH = "refresh";
inline constexpr const char* CLICK = "click";
inline constexpr const char* TYPE = "type";
inline constexpr const char* SELECT = "select";
inline constexpr const char* EXTRACT = "extract";
inline constexpr const char* SCREENSHOT = "screenshot";
inline constexpr const char* SOLVE_CAPTCHA = "solveCaptcha";
inline constexpr const char* ERROR = "error";
inline constexpr const char* CONNECTED = "connected";
} // namespace verb

// Serialize an outbound envelope. Members of payload are merged into the
// top level ("sessionId", "data", ...), then type and requestId are set.
std::string encodeRequest(const std::string& type, const std::string& requestId,
                          const Json::Value& payload);

// Compact single-line serialization
std::string toJson(const Json::Value& value);

// Parse one inbound frame; fails when it is not a JSON object
Result<Json::Value> parseEnvelope(const std::string& text);

// String member of an envelope; empty when absent or not a string
std::string stringMember(const Json::Value& envelope, const char* key);

// True for {"type":"error"} and {"success": false}
bool isErrorEnvelope(const Json::Value& envelope);

// Worker-provided error text, "Request failed" when absent
std::string envelopeError(const Json::Value& envelope);

// req-<unix-ms>-<counter>-<random base36>
class RequestIdGenerator {
public:
    std::string next();

private:
    std::atomic<uint64_t> _counter{0};
};

} // namespace rpc
} // namespace corral
