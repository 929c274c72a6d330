#include <corral/rpc/rpc-message.h>

#include <chrono>
#include <memory>
#include <random>
#include <sstream>

namespace corral {
namespace rpc {

static std::string toBase36(uint64_t value) {
    static constexpr char digits[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    if (value == 0) {
        return "0";
    }
    std::string out;
    while (value > 0) {
        out.insert(out.begin(), digits[value % 36]);
        value /= 36;
    }
    return out;
}

std::string toJson(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value);
}

std::string encodeRequest(const std::string& type, const std::string& requestId,
                          const Json::Value& payload) {
    Json::Value envelope(Json::objectValue);
    if (payload.isObject()) {
        for (const auto& key : payload.getMemberNames()) {
            envelope[key] = payload[key];
        }
    }
    envelope["type"] = type;
    envelope["requestId"] = requestId;
    return toJson(envelope);
}

Result<Json::Value> parseEnvelope(const std::string& text) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string errors;
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors)) {
        return Err<Json::Value>("rpc: malformed message: " + errors);
    }
    if (!root.isObject()) {
        return Err<Json::Value>("rpc: message is not a JSON object");
    }
    return Ok(std::move(root));
}

std::string stringMember(const Json::Value& envelope, const char* key) {
    if (!envelope.isObject()) {
        return {};
    }
    const Json::Value& value = envelope[key];
    return value.isString() ? value.asString() : std::string();
}

bool isErrorEnvelope(const Json::Value& envelope) {
    if (!envelope.isObject()) {
        return false;
    }
    if (stringMember(envelope, "type") == verb::ERROR) {
        return true;
    }
    const auto& success = envelope["success"];
    return success.isBool() && !success.asBool();
}

std::string envelopeError(const Json::Value& envelope) {
    auto error = stringMember(envelope, "error");
    return error.empty() ? std::string("Request failed") : error;
}

std::string RequestIdGenerator::next() {
    thread_local std::mt19937_64 rng(std::random_device{}());
    const auto now = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    const auto count = ++_counter;

    std::ostringstream id;
    id << "req-" << now << "-" << count << "-" << toBase36(rng() % 2176782336ULL);  // 6 base36 digits
    return id.str();
}

} // namespace rpc
} // namespace corral
