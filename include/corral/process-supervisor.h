#pragma once

#include <corral/base/factory.h>
#include <corral/binary-resolver.h>

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace corral {

enum class WorkerState {
    Stopped,
    Starting,
    Running,
    Stopping,
};

const char* workerStateName(WorkerState state) noexcept;

struct ConnectionInfo {
    std::string host;
    uint16_t port = 0;

    std::string url() const { return "ws://" + host + ":" + std::to_string(port); }
};

struct ExitStatus {
    int64_t code = 0;
    int signal = 0;
};

// Variables copied from the host environment into the worker when set.
// Nothing outside this list is inherited.
extern const std::vector<std::string> WORKER_ENV_ALLOW_LIST;

// Environment for a worker listening on port: the allow-list, built-in
// defaults for absent model settings, then overrides, then
// BROWSER_WORKER_PORT.
std::map<std::string, std::string> workerEnvironment(
    uint16_t port, const std::map<std::string, std::string>& overrides);

// Owns one browser worker process.
//
//   Stopped -> Starting -> Running -> Stopping -> Stopped
//
// start() spawns the resolved worker and blocks until a TCP probe to the
// worker port succeeds. A matching stdout line only triggers an early
// probe. Any failure while Starting kills the process and ends in Stopped.
// stop() is idempotent and bounded: SIGTERM, then SIGKILL after the grace
// period. Called while start() is still waiting, it cancels the start.
// The host may be a name; every resolved address is probed.
//
// The process handle, its pipes and timers live on a private libuv loop
// run by one thread for the lifetime of the worker.
class ProcessSupervisor : public base::ObjectFactory<ProcessSupervisor> {
public:
    using Ptr = std::shared_ptr<ProcessSupervisor>;

    struct Options {
        BinaryResolver resolver;
        std::string host = "127.0.0.1";
        uint16_t port = 3456;
        std::string interpreter = "node";
        std::string readyPattern = "listening on port";
        std::chrono::milliseconds probeInterval{1000};
        int probeAttempts = 30;
        std::chrono::milliseconds stopGrace{5000};
        // worker.env entries and BROWSER_HEADLESS
        std::map<std::string, std::string> envOverrides;
        // Appended after the binary (or script) path
        std::vector<std::string> extraArgs;
    };

    static Result<Ptr> createImpl(const Options& options) noexcept;

    virtual ~ProcessSupervisor() = default;

    virtual Result<void> start() = 0;
    virtual void stop() = 0;

    virtual bool isRunning() const = 0;
    virtual WorkerState state() const = 0;
    virtual ConnectionInfo getConnectionInfo() const = 0;

    // Last observed exit of a worker started by this supervisor
    virtual std::optional<ExitStatus> lastExitStatus() const = 0;
    // 0 when no process is alive
    virtual int pid() const = 0;
    virtual std::optional<ResolvedBinary> binary() const = 0;

protected:
    ProcessSupervisor() = default;
};

} // namespace corral
