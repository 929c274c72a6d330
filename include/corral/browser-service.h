#pragma once

#include <corral/browser-client.h>
#include <corral/process-supervisor.h>
#include <corral/rpc/rpc-client.h>

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace corral {

class Config;

struct SessionHandle {
    std::string id;  // worker-side session id
    std::chrono::system_clock::time_point createdAt;
};

// Ties one worker process, one RPC connection and the session bookkeeping
// together. Session ids are only valid for the worker process that issued
// them; after a worker restart call invalidateSessions().
class BrowserService {
public:
    using Ptr = std::shared_ptr<BrowserService>;

    struct Options {
        ProcessSupervisor::Options supervisor;
        rpc::RpcClient::Options rpc;
        RetryConfig navigationRetry = retry::NAVIGATION;
        RetryConfig actionRetry = retry::ACTION;
        // false: attach to a worker that is already listening
        bool spawnWorker = true;
    };

    static Result<Options> optionsFromConfig(const Config& config);

    static Result<Ptr> create(const Options& options) noexcept;

    ~BrowserService();

    BrowserService(const BrowserService&) = delete;
    BrowserService& operator=(const BrowserService&) = delete;

    // Start the worker and connect. Idempotent.
    Result<void> initialize();
    // Destroy known sessions, disconnect, stop the worker
    void stop();
    bool isInitialized() const;

    // ServiceNotAvailable before initialize()
    Result<std::shared_ptr<BrowserClient>> client() const;

    // Create a worker session under key and make it current
    Result<SessionHandle> createSession(const std::string& key);
    std::optional<SessionHandle> getSession(const std::string& key) const;
    std::optional<SessionHandle> currentSession() const;
    // Current session, creating "session-<unix-ms>" when there is none
    Result<SessionHandle> ensureCurrentSession();
    // No-op for unknown keys
    Result<void> destroySession(const std::string& key);
    // Forget every session without contacting the worker
    void invalidateSessions();
    size_t sessionCount() const;

    const ProcessSupervisor::Ptr& supervisor() const { return _supervisor; }
    const rpc::RpcClient::Ptr& rpc() const { return _rpc; }

private:
    BrowserService(const Options& options, ProcessSupervisor::Ptr supervisor,
                   rpc::RpcClient::Ptr rpc) noexcept;

    Options _options;
    ProcessSupervisor::Ptr _supervisor;
    rpc::RpcClient::Ptr _rpc;
    std::shared_ptr<BrowserClient> _client;

    // Serializes initialize/stop
    std::mutex _lifecycleMutex;
    std::atomic<bool> _initialized{false};

    mutable std::mutex _sessionMutex;
    std::map<std::string, SessionHandle> _sessions;
    std::optional<std::string> _currentKey;
};

} // namespace corral
