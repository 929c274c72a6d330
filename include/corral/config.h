#pragma once

#include <corral/result.hpp>
#include <yaml-cpp/yaml.h>

#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace corral {

// Layered configuration: built-in defaults, then the YAML file, then
// CORRAL_* environment variables, then command-line overrides.
class Config {
public:
    using Ptr = std::shared_ptr<Config>;

    static Result<Ptr> create(const std::string& configPath = "",
                              const YAML::Node& cmdOverrides = YAML::Node()) noexcept;

    ~Config() = default;

    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    // Get a value by dotted path (e.g. "worker.port" or "rpc.request-timeout-ms")
    // Returns nullopt if the key doesn't exist or has the wrong type
    template<typename T>
    std::optional<T> get(const std::string& path) const;

    template<typename T>
    T get(const std::string& path, const T& defaultValue) const;

    // Sequence value, or a comma-separated scalar (as set from the environment)
    std::vector<std::string> getList(const std::string& path) const;

    // String map (e.g. worker.env)
    std::map<std::string, std::string> getMap(const std::string& path) const;

    bool has(const std::string& path) const;

    const YAML::Node& root() const { return _config; }

    // Path of the config file that was loaded, empty if none
    const std::string& loadedFrom() const { return _loadedFrom; }

    static std::filesystem::path getExecutableDir();
    static std::filesystem::path getXDGConfigPath();

    static constexpr const char* ENV_PREFIX = "CORRAL_";

    static constexpr const char* KEY_WORKER_HOST = "worker.host";
    static constexpr const char* KEY_WORKER_PORT = "worker.port";
    static constexpr const char* KEY_WORKER_BASE_DIR = "worker.base-dir";
    static constexpr const char* KEY_WORKER_CONTAINER_PATH = "worker.container-path";
    static constexpr const char* KEY_WORKER_SCRIPT = "worker.script";
    static constexpr const char* KEY_WORKER_INTERPRETER = "worker.interpreter";
    static constexpr const char* KEY_WORKER_BINARY = "worker.binary";
    static constexpr const char* KEY_WORKER_READY_PATTERN = "worker.ready-pattern";
    static constexpr const char* KEY_WORKER_PROBE_INTERVAL_MS = "worker.probe-interval-ms";
    static constexpr const char* KEY_WORKER_PROBE_ATTEMPTS = "worker.probe-attempts";
    static constexpr const char* KEY_WORKER_STOP_GRACE_MS = "worker.stop-grace-ms";
    static constexpr const char* KEY_WORKER_ENV = "worker.env";
    static constexpr const char* KEY_BROWSER_HEADLESS = "browser.headless";
    static constexpr const char* KEY_RPC_REQUEST_TIMEOUT_MS = "rpc.request-timeout-ms";
    static constexpr const char* KEY_RPC_CONNECT_TIMEOUT_MS = "rpc.connect-timeout-ms";
    static constexpr const char* KEY_RPC_RECONNECT_DELAY_MS = "rpc.reconnect-delay-ms";
    static constexpr const char* KEY_RPC_MAX_RECONNECT_ATTEMPTS = "rpc.max-reconnect-attempts";
    static constexpr const char* KEY_SECURITY_ALLOWED_SCHEMES = "security.allowed-schemes";
    static constexpr const char* KEY_SECURITY_ALLOWED_DOMAINS = "security.allowed-domains";
    static constexpr const char* KEY_SECURITY_BLOCKED_DOMAINS = "security.blocked-domains";
    static constexpr const char* KEY_SECURITY_MAX_URL_LENGTH = "security.max-url-length";

private:
    Config(const std::string& configPath, const YAML::Node& cmdOverrides) noexcept;
    Result<void> init() noexcept;

    void loadDefaults();
    Result<void> loadFile(const std::string& path);
    void applyEnvOverrides();

    YAML::Node getNode(const std::string& path) const;

    // "worker.probe-attempts" -> "CORRAL_WORKER_PROBE_ATTEMPTS"
    static std::string pathToEnvVar(const std::string& path);
    static std::vector<std::string> splitPath(const std::string& path);

    // Merge source into target; maps recursively, everything else replaced
    static void mergeNodes(YAML::Node& target, const YAML::Node& source);

    YAML::Node _config;
    std::string _configPath;
    std::string _loadedFrom;
    YAML::Node _cmdOverrides;
};

template<typename T>
std::optional<T> Config::get(const std::string& path) const {
    YAML::Node node = getNode(path);
    if (!node || node.IsNull()) {
        return std::nullopt;
    }
    try {
        return node.as<T>();
    } catch (const YAML::Exception&) {
        return std::nullopt;
    }
}

template<typename T>
T Config::get(const std::string& path, const T& defaultValue) const {
    auto value = get<T>(path);
    return value.value_or(defaultValue);
}

} // namespace corral
