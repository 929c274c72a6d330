#include <corral/browser-service.h>
#include <corral/config.h>
#include <ytrace/ytrace.hpp>

namespace corral {

Result<BrowserService::Options> BrowserService::optionsFromConfig(const Config& config) {
    Options options;

    const std::filesystem::path baseDir = config.get<std::string>(
        Config::KEY_WORKER_BASE_DIR, Config::getExecutableDir().string());
    const std::string script = config.get<std::string>(
        Config::KEY_WORKER_SCRIPT, (baseDir / "worker" / "dist" / "index.js").string());
    const std::string containerPath = config.get<std::string>(Config::KEY_WORKER_CONTAINER_PATH, "");
    const std::string explicitBinary = config.get<std::string>(Config::KEY_WORKER_BINARY, "");

    const std::string host = config.get<std::string>(Config::KEY_WORKER_HOST, "127.0.0.1");
    const int portValue = config.get<int>(Config::KEY_WORKER_PORT, 3456);
    if (portValue < 1 || portValue > 65535) {
        return Err<Options>(std::string(Config::KEY_WORKER_PORT) + " must be between 1 and 65535, got " +
                            std::to_string(portValue));
    }
    const auto port = static_cast<uint16_t>(portValue);

    auto& sup = options.supervisor;
    sup.resolver = BinaryResolver::defaults(baseDir, containerPath, script, explicitBinary);
    sup.host = host;
    sup.port = port;
    sup.interpreter = config.get<std::string>(Config::KEY_WORKER_INTERPRETER, sup.interpreter);
    sup.readyPattern = config.get<std::string>(Config::KEY_WORKER_READY_PATTERN, sup.readyPattern);
    sup.probeInterval = std::chrono::milliseconds(
        config.get<int>(Config::KEY_WORKER_PROBE_INTERVAL_MS, static_cast<int>(sup.probeInterval.count())));
    sup.probeAttempts = config.get<int>(Config::KEY_WORKER_PROBE_ATTEMPTS, sup.probeAttempts);
    sup.stopGrace = std::chrono::milliseconds(
        config.get<int>(Config::KEY_WORKER_STOP_GRACE_MS, static_cast<int>(sup.stopGrace.count())));
    sup.envOverrides = config.getMap(Config::KEY_WORKER_ENV);
    if (auto headless = config.get<std::string>(Config::KEY_BROWSER_HEADLESS)) {
        sup.envOverrides["BROWSER_HEADLESS"] = *headless;
    }

    auto& rpc = options.rpc;
    rpc.host = host;
    rpc.port = port;
    rpc.requestTimeout = std::chrono::milliseconds(
        config.get<int>(Config::KEY_RPC_REQUEST_TIMEOUT_MS, static_cast<int>(rpc.requestTimeout.count())));
    rpc.connectTimeout = std::chrono::milliseconds(
        config.get<int>(Config::KEY_RPC_CONNECT_TIMEOUT_MS, static_cast<int>(rpc.connectTimeout.count())));
    rpc.reconnectDelay = std::chrono::milliseconds(
        config.get<int>(Config::KEY_RPC_RECONNECT_DELAY_MS, static_cast<int>(rpc.reconnectDelay.count())));
    rpc.maxReconnectAttempts = config.get<int>(Config::KEY_RPC_MAX_RECONNECT_ATTEMPTS, rpc.maxReconnectAttempts);

    return Ok(std::move(options));
}

Result<BrowserService::Ptr> BrowserService::create(const Options& options) noexcept {
    auto supervisor = ProcessSupervisor::create(options.supervisor);
    if (!supervisor) {
        return Err<Ptr>("Failed to create ProcessSupervisor", supervisor);
    }
    auto rpc = rpc::RpcClient::create(options.rpc);
    if (!rpc) {
        return Err<Ptr>("Failed to create RpcClient", rpc);
    }
    return Ok(Ptr(new BrowserService(options, std::move(*supervisor), std::move(*rpc))));
}

BrowserService::BrowserService(const Options& options, ProcessSupervisor::Ptr supervisor,
                               rpc::RpcClient::Ptr rpc) noexcept
    : _options(options)
    , _supervisor(std::move(supervisor))
    , _rpc(std::move(rpc))
    , _client(std::make_shared<BrowserClient>(_rpc, options.navigationRetry, options.actionRetry)) {}

BrowserService::~BrowserService() {
    stop();
}

Result<void> BrowserService::initialize() {
    std::lock_guard<std::mutex> lock(_lifecycleMutex);
    if (_initialized) {
        return Ok();
    }

    if (_options.spawnWorker) {
        if (auto res = _supervisor->start(); !res) {
            return Err<void>("Failed to start browser worker", res);
        }
    }
    if (auto res = _rpc->connect(); !res) {
        if (_options.spawnWorker) {
            _supervisor->stop();
        }
        return Err<void>("Failed to connect to browser worker", res);
    }

    _initialized = true;
    yinfo("BrowserService: ready on {}", _supervisor->getConnectionInfo().url());
    return Ok();
}

void BrowserService::stop() {
    std::lock_guard<std::mutex> lock(_lifecycleMutex);
    if (!_initialized) {
        return;
    }

    std::map<std::string, SessionHandle> sessions;
    {
        std::lock_guard<std::mutex> sessionLock(_sessionMutex);
        sessions.swap(_sessions);
        _currentKey.reset();
    }
    for (const auto& [key, session] : sessions) {
        if (auto res = _client->destroySession(session.id); !res) {
            ywarn("BrowserService: failed to destroy session {}: {}", key, error_msg(res));
        }
    }

    _rpc->disconnect();
    if (_options.spawnWorker) {
        _supervisor->stop();
    }
    _initialized = false;
    yinfo("BrowserService: stopped");
}

bool BrowserService::isInitialized() const {
    return _initialized && _rpc->isConnected();
}

Result<std::shared_ptr<BrowserClient>> BrowserService::client() const {
    if (!_initialized) {
        return Err<std::shared_ptr<BrowserClient>>(
            Error::serviceNotAvailable("browser service is not initialized"));
    }
    return Ok(_client);
}

Result<SessionHandle> BrowserService::createSession(const std::string& key) {
    auto client = this->client();
    if (!client) {
        return std::unexpected(client.error());
    }
    auto id = (*client)->createSession();
    if (!id) {
        return Err<SessionHandle>("create session " + key, id);
    }

    SessionHandle session{*id, std::chrono::system_clock::now()};
    std::lock_guard<std::mutex> lock(_sessionMutex);
    _sessions[key] = session;
    _currentKey = key;
    ydebug("BrowserService: session {} -> {}", key, session.id);
    return Ok(std::move(session));
}

std::optional<SessionHandle> BrowserService::getSession(const std::string& key) const {
    std::lock_guard<std::mutex> lock(_sessionMutex);
    auto it = _sessions.find(key);
    if (it == _sessions.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<SessionHandle> BrowserService::currentSession() const {
    std::lock_guard<std::mutex> lock(_sessionMutex);
    if (!_currentKey) {
        return std::nullopt;
    }
    auto it = _sessions.find(*_currentKey);
    if (it == _sessions.end()) {
        return std::nullopt;
    }
    return it->second;
}

Result<SessionHandle> BrowserService::ensureCurrentSession() {
    if (auto session = currentSession()) {
        return Ok(std::move(*session));
    }
    const auto now = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return createSession("session-" + std::to_string(now));
}

Result<void> BrowserService::destroySession(const std::string& key) {
    std::optional<SessionHandle> session;
    {
        std::lock_guard<std::mutex> lock(_sessionMutex);
        auto it = _sessions.find(key);
        if (it == _sessions.end()) {
            return Ok();
        }
        session = it->second;
        _sessions.erase(it);
        if (_currentKey == key) {
            _currentKey.reset();
        }
    }

    auto client = this->client();
    if (!client) {
        return std::unexpected(client.error());
    }
    return (*client)->destroySession(session->id);
}

void BrowserService::invalidateSessions() {
    std::lock_guard<std::mutex> lock(_sessionMutex);
    if (!_sessions.empty()) {
        ywarn("BrowserService: dropping {} sessions", _sessions.size());
    }
    _sessions.clear();
    _currentKey.reset();
}

size_t BrowserService::sessionCount() const {
    std::lock_guard<std::mutex> lock(_sessionMutex);
    return _sessions.size();
}

} // namespace corral
