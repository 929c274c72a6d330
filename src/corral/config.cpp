#include <corral/config.h>
#include <ytrace/ytrace.hpp>

#include <cctype>
#include <climits>
#include <cstdlib>
#include <sstream>

#ifdef __linux__
#include <unistd.h>
#elif defined(__APPLE__)
#include <mach-o/dyld.h>
#endif

namespace corral {

// Keys that may be overridden from the environment
static constexpr const char* s_envKeys[] = {
    Config::KEY_WORKER_HOST,
    Config::KEY_WORKER_PORT,
    Config::KEY_WORKER_BASE_DIR,
    Config::KEY_WORKER_CONTAINER_PATH,
    Config::KEY_WORKER_SCRIPT,
    Config::KEY_WORKER_INTERPRETER,
    Config::KEY_WORKER_BINARY,
    Config::KEY_WORKER_READY_PATTERN,
    Config::KEY_WORKER_PROBE_INTERVAL_MS,
    Config::KEY_WORKER_PROBE_ATTEMPTS,
    Config::KEY_WORKER_STOP_GRACE_MS,
    Config::KEY_BROWSER_HEADLESS,
    Config::KEY_RPC_REQUEST_TIMEOUT_MS,
    Config::KEY_RPC_CONNECT_TIMEOUT_MS,
    Config::KEY_RPC_RECONNECT_DELAY_MS,
    Config::KEY_RPC_MAX_RECONNECT_ATTEMPTS,
    Config::KEY_SECURITY_ALLOWED_SCHEMES,
    Config::KEY_SECURITY_ALLOWED_DOMAINS,
    Config::KEY_SECURITY_BLOCKED_DOMAINS,
    Config::KEY_SECURITY_MAX_URL_LENGTH,
};

static constexpr const char* s_defaults = R"(
worker:
  host: 127.0.0.1
  port: 3456
  container-path: /usr/local/bin/browser-worker
  interpreter: node
  ready-pattern: listening on port
  probe-interval-ms: 1000
  probe-attempts: 30
  stop-grace-ms: 5000
rpc:
  request-timeout-ms: 30000
  connect-timeout-ms: 10000
  reconnect-delay-ms: 5000
  max-reconnect-attempts: 5
security:
  allowed-schemes: [http, https]
  allowed-domains: []
  blocked-domains: []
  max-url-length: 2048
)";

// Wrap a value in nested maps following the dotted path
static YAML::Node nestUnder(const std::vector<std::string>& parts, const YAML::Node& value) {
    YAML::Node node = YAML::Clone(value);
    for (auto it = parts.rbegin(); it != parts.rend(); ++it) {
        YAML::Node parent(YAML::NodeType::Map);
        parent[*it] = node;
        node.reset(parent);
    }
    return node;
}

static YAML::Node lookup(const YAML::Node& node, const std::vector<std::string>& parts, size_t index) {
    if (index == parts.size()) {
        return node;
    }
    if (!node.IsMap()) {
        return YAML::Node(YAML::NodeType::Undefined);
    }
    const YAML::Node child = node[parts[index]];
    if (!child) {
        return YAML::Node(YAML::NodeType::Undefined);
    }
    return lookup(child, parts, index + 1);
}

Config::Config(const std::string& configPath, const YAML::Node& cmdOverrides) noexcept
    : _config(YAML::NodeType::Map)
    , _configPath(configPath)
    , _cmdOverrides(cmdOverrides) {}

Result<Config::Ptr> Config::create(const std::string& configPath,
                                   const YAML::Node& cmdOverrides) noexcept {
    auto config = Ptr(new Config(configPath, cmdOverrides));
    if (auto res = config->init(); !res) {
        return Err<Ptr>("Failed to initialize Config", res);
    }
    return Ok(std::move(config));
}

Result<void> Config::init() noexcept {
    try {
        loadDefaults();

        std::string effectivePath = _configPath;
        if (effectivePath.empty()) {
            auto xdgPath = getXDGConfigPath();
            std::error_code ec;
            if (std::filesystem::exists(xdgPath, ec)) {
                effectivePath = xdgPath.string();
            }
        }

        if (!effectivePath.empty()) {
            if (auto res = loadFile(effectivePath); !res) {
                // An explicit path must load; the XDG default is best-effort
                if (!_configPath.empty()) {
                    return res;
                }
                ywarn("Failed to load config file {}: {}", effectivePath, error_msg(res));
            } else {
                _loadedFrom = effectivePath;
                yinfo("Loaded config from: {}", effectivePath);
            }
        }

        applyEnvOverrides();

        if (_cmdOverrides && _cmdOverrides.IsMap()) {
            mergeNodes(_config, _cmdOverrides);
        }
    } catch (const YAML::Exception& e) {
        return Err<void>(std::string("config: ") + e.what());
    }
    return Ok();
}

void Config::loadDefaults() {
    _config = YAML::Load(s_defaults);
    _config["worker"]["base-dir"] = getExecutableDir().string();
}

Result<void> Config::loadFile(const std::string& path) {
    YAML::Node file;
    try {
        file = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        return Err<void>("config: cannot parse " + path + ": " + e.what());
    }
    if (!file || file.IsNull()) {
        return Ok();
    }
    if (!file.IsMap()) {
        return Err<void>("config: " + path + " is not a mapping");
    }
    mergeNodes(_config, file);
    return Ok();
}

void Config::applyEnvOverrides() {
    for (const char* key : s_envKeys) {
        auto envName = pathToEnvVar(key);
        const char* value = std::getenv(envName.c_str());
        if (!value) {
            continue;
        }
        ydebug("Config: {} overridden from {}", key, envName);
        mergeNodes(_config, nestUnder(splitPath(key), YAML::Node(std::string(value))));
    }
}

YAML::Node Config::getNode(const std::string& path) const {
    return lookup(_config, splitPath(path), 0);
}

bool Config::has(const std::string& path) const {
    YAML::Node node = getNode(path);
    return node && !node.IsNull();
}

std::vector<std::string> Config::getList(const std::string& path) const {
    std::vector<std::string> result;
    YAML::Node node = getNode(path);
    if (!node || node.IsNull()) {
        return result;
    }
    try {
        if (node.IsSequence()) {
            for (const auto& item : node) {
                result.push_back(item.as<std::string>());
            }
        } else if (node.IsScalar()) {
            std::stringstream ss(node.as<std::string>());
            std::string item;
            while (std::getline(ss, item, ',')) {
                auto first = item.find_first_not_of(" \t");
                auto last = item.find_last_not_of(" \t");
                if (first != std::string::npos) {
                    result.push_back(item.substr(first, last - first + 1));
                }
            }
        }
    } catch (const YAML::Exception& e) {
        ywarn("Config: {} is not a string list: {}", path, e.what());
        result.clear();
    }
    return result;
}

std::map<std::string, std::string> Config::getMap(const std::string& path) const {
    std::map<std::string, std::string> result;
    YAML::Node node = getNode(path);
    if (!node || !node.IsMap()) {
        return result;
    }
    for (const auto& entry : node) {
        try {
            result[entry.first.as<std::string>()] = entry.second.as<std::string>();
        } catch (const YAML::Exception& e) {
            ywarn("Config: skipping non-scalar entry in {}: {}", path, e.what());
        }
    }
    return result;
}

std::string Config::pathToEnvVar(const std::string& path) {
    std::string result = ENV_PREFIX;
    for (char c : path) {
        if (c == '.' || c == '-') {
            result += '_';
        } else {
            result += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
    }
    return result;
}

std::vector<std::string> Config::splitPath(const std::string& path) {
    std::vector<std::string> parts;
    std::stringstream ss(path);
    std::string part;
    while (std::getline(ss, part, '.')) {
        if (!part.empty()) {
            parts.push_back(part);
        }
    }
    return parts;
}

void Config::mergeNodes(YAML::Node& target, const YAML::Node& source) {
    if (!source.IsMap()) {
        return;
    }
    for (const auto& entry : source) {
        const auto key = entry.first.as<std::string>();
        const YAML::Node& value = entry.second;
        YAML::Node existing = target[key];
        if (value.IsMap() && existing.IsMap()) {
            mergeNodes(existing, value);
        } else {
            target[key] = YAML::Clone(value);
        }
    }
}

std::filesystem::path Config::getExecutableDir() {
#ifdef __linux__
    char path[PATH_MAX];
    ssize_t len = readlink("/proc/self/exe", path, sizeof(path) - 1);
    if (len != -1) {
        path[len] = '\0';
        return std::filesystem::path(path).parent_path();
    }
#elif defined(__APPLE__)
    char path[PATH_MAX];
    uint32_t size = sizeof(path);
    if (_NSGetExecutablePath(path, &size) == 0) {
        char realPath[PATH_MAX];
        if (realpath(path, realPath)) {
            return std::filesystem::path(realPath).parent_path();
        }
    }
#endif
    std::error_code ec;
    auto cwd = std::filesystem::current_path(ec);
    return ec ? std::filesystem::path(".") : cwd;
}

std::filesystem::path Config::getXDGConfigPath() {
    std::filesystem::path configDir;

    const char* xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig && xdgConfig[0] != '\0') {
        configDir = xdgConfig;
    } else {
        const char* home = std::getenv("HOME");
        if (home) {
            configDir = std::filesystem::path(home) / ".config";
        } else {
            configDir = "/tmp";
        }
    }

    return configDir / "corral" / "config.yaml";
}

} // namespace corral
