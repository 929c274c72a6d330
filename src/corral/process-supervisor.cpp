#include <corral/process-supervisor.h>
#include <ytrace/ytrace.hpp>

#include <uv.h>
#include <netdb.h>

#include <array>
#include <atomic>
#include <csignal>
#include <cstdlib>
#include <future>
#include <mutex>
#include <string_view>
#include <thread>

namespace corral {

const char* workerStateName(WorkerState state) noexcept {
    switch (state) {
        case WorkerState::Stopped:  return "stopped";
        case WorkerState::Starting: return "starting";
        case WorkerState::Running:  return "running";
        case WorkerState::Stopping: return "stopping";
    }
    return "unknown";
}

const std::vector<std::string> WORKER_ENV_ALLOW_LIST = {
    "BROWSERBASE_API_KEY",
    "BROWSERBASE_PROJECT_ID",
    "OPENAI_API_KEY",
    "ANTHROPIC_API_KEY",
    "BROWSER_HEADLESS",
    "CAPSOLVER_API_KEY",
    "OLLAMA_BASE_URL",
    "OLLAMA_MODEL",
    "NODE_ENV",
    "PATH",
    "HOME",
};

static const std::map<std::string, std::string> s_envDefaults = {
    {"OLLAMA_BASE_URL", "http://ollama:11434"},
    {"OLLAMA_MODEL", "llama3.2-vision"},
    {"NODE_ENV", "production"},
};

std::map<std::string, std::string> workerEnvironment(
    uint16_t port, const std::map<std::string, std::string>& overrides) {
    std::map<std::string, std::string> env;
    for (const auto& name : WORKER_ENV_ALLOW_LIST) {
        if (const char* value = std::getenv(name.c_str())) {
            env[name] = value;
        }
    }
    for (const auto& [name, value] : s_envDefaults) {
        env.emplace(name, value);
    }
    for (const auto& [name, value] : overrides) {
        env[name] = value;
    }
    env["BROWSER_WORKER_PORT"] = std::to_string(port);
    return env;
}

// Close a heap-allocated handle and free it from the close callback
template<typename T>
static void closeHandle(T*& handle) {
    if (!handle) return;
    auto* h = reinterpret_cast<uv_handle_t*>(handle);
    if (!uv_is_closing(h)) {
        uv_close(h, [](uv_handle_t* closed) {
            delete reinterpret_cast<T*>(closed);
        });
    }
    handle = nullptr;
}

// ─── Implementation ──────────────────────────────────────────────────────────

class ProcessSupervisorImpl : public ProcessSupervisor {
public:
    // One readiness probe: resolve the host, then connect to every address
    struct ProbeRound {
        ProcessSupervisorImpl* self = nullptr;
        bool scheduled = false;
        uv_getaddrinfo_t resolve;
        int outstanding = 0;
        bool succeeded = false;
        std::string lastError;
    };

    struct ProbeConnect {
        ProbeRound* round = nullptr;
        uv_tcp_t tcp;
        uv_connect_t req;
    };

    explicit ProcessSupervisorImpl(const Options& options)
        : _options(options) {}

    ~ProcessSupervisorImpl() override {
        stop();
    }

    Result<void> start() override {
        std::lock_guard<std::mutex> lock(_controlMutex);
        if (_state != WorkerState::Stopped) {
            ywarn("ProcessSupervisor: worker is already {}, not spawning another",
                  workerStateName(_state));
            return Ok();
        }
        // Reap a worker that exited on its own
        if (_thread.joinable()) {
            stopLocked();
        }

        auto binary = _options.resolver.resolve();
        if (!binary) {
            yerror("ProcessSupervisor: no browser worker found in {} candidate locations",
                   _options.resolver.candidates().size());
            return Err(Error::serviceNotAvailable("browser worker binary not found"));
        }
        {
            std::lock_guard<std::mutex> infoLock(_infoMutex);
            _binary = binary;
        }

        setState(WorkerState::Starting);
        if (auto res = spawn(*binary); !res) {
            setState(WorkerState::Stopped);
            return res;
        }

        auto ready = _ready.get_future();
        _thread = std::thread([this] { uv_run(_loop.get(), UV_RUN_DEFAULT); });

        auto result = ready.get();
        if (!result) {
            yerror("ProcessSupervisor: worker failed to start: {}", error_msg(result));
            stopLocked();
            return result;
        }
        return Ok();
    }

    void stop() override {
        // Cancel a start() that is still waiting for readiness
        if (_state == WorkerState::Starting) {
            requestStop();
        }
        std::lock_guard<std::mutex> lock(_controlMutex);
        if (!_thread.joinable() && _state == WorkerState::Stopped) {
            return;
        }
        stopLocked();
    }

    bool isRunning() const override { return _state == WorkerState::Running; }
    WorkerState state() const override { return _state; }

    ConnectionInfo getConnectionInfo() const override {
        return ConnectionInfo{_options.host, _options.port};
    }

    std::optional<ExitStatus> lastExitStatus() const override {
        std::lock_guard<std::mutex> lock(_infoMutex);
        return _lastExit;
    }

    int pid() const override { return _pid; }

    std::optional<ResolvedBinary> binary() const override {
        std::lock_guard<std::mutex> lock(_infoMutex);
        return _binary;
    }

private:
    void setState(WorkerState state) {
        WorkerState previous = _state.exchange(state);
        if (previous != state) {
            ydebug("ProcessSupervisor: {} -> {}", workerStateName(previous), workerStateName(state));
        }
    }

    Result<void> spawn(const ResolvedBinary& binary) {
        _loop = std::make_unique<uv_loop_t>();
        if (int err = uv_loop_init(_loop.get()); err != 0) {
            _loop.reset();
            return Err(Error::serviceNotAvailable(std::string("uv_loop_init: ") + uv_strerror(err)));
        }

        _ready = std::promise<Result<void>>();
        _readyResolved = false;
        _exited = false;
        _stopRequested = false;
        _probeCount = 0;
        _stdoutLine.clear();
        _stderrLine.clear();

        _stdoutPipe = new uv_pipe_t;
        uv_pipe_init(_loop.get(), _stdoutPipe, 0);
        _stdoutPipe->data = this;
        _stderrPipe = new uv_pipe_t;
        uv_pipe_init(_loop.get(), _stderrPipe, 0);
        _stderrPipe->data = this;
        _probeTimer = new uv_timer_t;
        uv_timer_init(_loop.get(), _probeTimer);
        _probeTimer->data = this;
        _graceTimer = new uv_timer_t;
        uv_timer_init(_loop.get(), _graceTimer);
        _graceTimer->data = this;
        _stopAsync = new uv_async_t;
        uv_async_init(_loop.get(), _stopAsync, onStopRequest);
        _stopAsync->data = this;

        // Secrets travel in the environment only, never in argv
        std::vector<std::string> args;
        if (binary.kind == LaunchKind::Script) {
            args.push_back(_options.interpreter);
        }
        args.push_back(binary.path.string());
        args.insert(args.end(), _options.extraArgs.begin(), _options.extraArgs.end());
        std::vector<char*> argv;
        for (auto& arg : args) argv.push_back(arg.data());
        argv.push_back(nullptr);

        auto envMap = workerEnvironment(_options.port, _options.envOverrides);
        std::vector<std::string> envStrings;
        std::string envNames;
        for (const auto& [name, value] : envMap) {
            envStrings.push_back(name + "=" + value);
            envNames += envNames.empty() ? name : ", " + name;
        }
        std::vector<char*> envp;
        for (auto& entry : envStrings) envp.push_back(entry.data());
        envp.push_back(nullptr);

        uv_stdio_container_t stdio[3];
        stdio[0].flags = UV_IGNORE;
        stdio[1].flags = static_cast<uv_stdio_flags>(UV_CREATE_PIPE | UV_WRITABLE_PIPE);
        stdio[1].data.stream = reinterpret_cast<uv_stream_t*>(_stdoutPipe);
        stdio[2].flags = static_cast<uv_stdio_flags>(UV_CREATE_PIPE | UV_WRITABLE_PIPE);
        stdio[2].data.stream = reinterpret_cast<uv_stream_t*>(_stderrPipe);

        uv_process_options_t options = {};
        options.exit_cb = onExit;
        options.file = argv[0];
        options.args = argv.data();
        options.env = envp.data();
        options.stdio_count = 3;
        options.stdio = stdio;

        _process = new uv_process_t;
        _process->data = this;

        if (int err = uv_spawn(_loop.get(), _process, &options); err != 0) {
            closeAllHandles();
            uv_run(_loop.get(), UV_RUN_DEFAULT);
            uv_loop_close(_loop.get());
            _loop.reset();
            return Err(Error::serviceNotAvailable(
                "cannot spawn " + binary.path.string() + ": " + uv_strerror(err)));
        }

        {
            std::lock_guard<std::mutex> lock(_asyncMutex);
            _acceptingCommands = true;
        }
        _pid = _process->pid;
        yinfo("ProcessSupervisor: spawned {} worker {} (pid {}) for port {}",
              binary.label, binary.path.string(), _pid.load(), _options.port);
        ydebug("ProcessSupervisor: worker environment: {}", envNames);

        if (int err = uv_read_start(reinterpret_cast<uv_stream_t*>(_stdoutPipe), onAlloc, onRead); err != 0) {
            ywarn("ProcessSupervisor: cannot read worker stdout: {}", uv_strerror(err));
        }
        if (int err = uv_read_start(reinterpret_cast<uv_stream_t*>(_stderrPipe), onAlloc, onRead); err != 0) {
            ywarn("ProcessSupervisor: cannot read worker stderr: {}", uv_strerror(err));
        }
        uv_timer_start(_probeTimer, onProbeTimer, static_cast<uint64_t>(_options.probeInterval.count()), 0);
        return Ok();
    }

    void stopLocked() {
        if (!_thread.joinable()) {
            setState(WorkerState::Stopped);
            return;
        }
        if (_state != WorkerState::Stopped) {
            setState(WorkerState::Stopping);
        }
        requestStop();
        _thread.join();

        if (int err = uv_loop_close(_loop.get()); err != 0) {
            ywarn("ProcessSupervisor: loop close: {}", uv_strerror(err));
        }
        _loop.reset();
        _pid = 0;
        setState(WorkerState::Stopped);
    }

    void requestStop() {
        std::lock_guard<std::mutex> lock(_asyncMutex);
        if (_acceptingCommands) {
            uv_async_send(_stopAsync);
        }
    }

    void closeAllHandles() {
        closeHandle(_stdoutPipe);
        closeHandle(_stderrPipe);
        closeHandle(_probeTimer);
        closeHandle(_graceTimer);
        closeHandle(_stopAsync);
        closeHandle(_process);
    }

    // ── Readiness (loop thread) ──

    void markReady() {
        if (_readyResolved) return;
        _readyResolved = true;
        if (_probeTimer) uv_timer_stop(_probeTimer);
        setState(WorkerState::Running);
        yinfo("ProcessSupervisor: worker ready on {}:{} after {} probes",
              _options.host, _options.port, _probeCount);
        _ready.set_value(Ok());
    }

    void failStart(Error error) {
        if (_readyResolved) return;
        _readyResolved = true;
        if (_probeTimer) uv_timer_stop(_probeTimer);
        _ready.set_value(Err(std::move(error)));
    }

    void launchProbe(bool scheduled) {
        auto* round = new ProbeRound;
        round->self = this;
        round->scheduled = scheduled;
        round->resolve.data = round;

        addrinfo hints = {};
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;
        hints.ai_protocol = IPPROTO_TCP;
        const std::string port = std::to_string(_options.port);
        if (int err = uv_getaddrinfo(_loop.get(), &round->resolve, onProbeResolved,
                                     _options.host.c_str(), port.c_str(), &hints);
            err != 0) {
            delete round;
            if (scheduled) onProbeFailed(std::string("resolve: ") + uv_strerror(err));
        }
    }

    // Resolve failures and connect attempts that could not start count as
    // one failed probe once nothing is outstanding
    void finishRound(ProbeRound* round) {
        if (round->outstanding > 0) return;
        if (!round->succeeded && round->scheduled) {
            onProbeFailed(round->lastError.empty() ? "no address to connect to" : round->lastError);
        }
        delete round;
    }

    static void closeProbe(ProbeConnect* conn) {
        uv_close(reinterpret_cast<uv_handle_t*>(&conn->tcp), [](uv_handle_t* h) {
            delete static_cast<ProbeConnect*>(h->data);
        });
    }

    void onProbeFailed(const std::string& reason) {
        if (_readyResolved) return;
        ytrace("ProcessSupervisor: probe {}/{} failed: {}", _probeCount, _options.probeAttempts, reason);
        if (_probeCount >= _options.probeAttempts) {
            failStart(Error::serviceNotAvailable(
                "worker did not accept connections on port " + std::to_string(_options.port) +
                " after " + std::to_string(_probeCount) + " attempts"));
            return;
        }
        uv_timer_start(_probeTimer, onProbeTimer, static_cast<uint64_t>(_options.probeInterval.count()), 0);
    }

    // ── Worker output (loop thread) ──

    void consumeOutput(bool isStdout, std::string_view chunk) {
        std::string& pending = isStdout ? _stdoutLine : _stderrLine;
        pending.append(chunk);
        size_t pos;
        while ((pos = pending.find('\n')) != std::string::npos) {
            std::string line = pending.substr(0, pos);
            pending.erase(0, pos + 1);
            handleLine(isStdout, line);
        }
        if (pending.size() > MAX_LINE) {
            handleLine(isStdout, pending);
            pending.clear();
        }
    }

    void flushOutput(bool isStdout) {
        std::string& pending = isStdout ? _stdoutLine : _stderrLine;
        if (!pending.empty()) {
            handleLine(isStdout, pending);
            pending.clear();
        }
    }

    void handleLine(bool isStdout, std::string line) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) return;

        if (!isStdout) {
            ywarn("[worker] {}", line);
            return;
        }
        ydebug("[worker] {}", line);
        if (!_readyResolved && !_options.readyPattern.empty() &&
            line.find(_options.readyPattern) != std::string::npos) {
            ydebug("ProcessSupervisor: ready line seen, probing port {}", _options.port);
            launchProbe(false);
        }
    }

    // ── libuv callbacks ──

    static void onAlloc(uv_handle_t* handle, size_t, uv_buf_t* buf) {
        auto* self = static_cast<ProcessSupervisorImpl*>(handle->data);
        buf->base = self->_readBuffer.data();
        buf->len = self->_readBuffer.size();
    }

    static void onRead(uv_stream_t* stream, ssize_t nread, const uv_buf_t* buf) {
        auto* self = static_cast<ProcessSupervisorImpl*>(stream->data);
        const bool isStdout = stream == reinterpret_cast<uv_stream_t*>(self->_stdoutPipe);
        if (nread > 0) {
            self->consumeOutput(isStdout, std::string_view(buf->base, static_cast<size_t>(nread)));
        } else if (nread < 0) {
            self->flushOutput(isStdout);
            if (isStdout) {
                closeHandle(self->_stdoutPipe);
            } else {
                closeHandle(self->_stderrPipe);
            }
        }
    }

    static void onProbeTimer(uv_timer_t* timer) {
        auto* self = static_cast<ProcessSupervisorImpl*>(timer->data);
        if (self->_readyResolved) return;
        ++self->_probeCount;
        self->launchProbe(true);
    }

    static void onProbeResolved(uv_getaddrinfo_t* req, int status, addrinfo* res) {
        auto* round = static_cast<ProbeRound*>(req->data);
        auto* self = round->self;
        if (status != 0 || self->_readyResolved) {
            if (status != 0) {
                round->lastError = "resolve " + self->_options.host + ": " + uv_strerror(status);
            }
            uv_freeaddrinfo(res);
            self->finishRound(round);
            return;
        }
        for (addrinfo* ai = res; ai != nullptr; ai = ai->ai_next) {
            auto* conn = new ProbeConnect;
            conn->round = round;
            if (int err = uv_tcp_init(self->_loop.get(), &conn->tcp); err != 0) {
                delete conn;
                round->lastError = uv_strerror(err);
                continue;
            }
            conn->tcp.data = conn;
            conn->req.data = conn;
            if (int err = uv_tcp_connect(&conn->req, &conn->tcp, ai->ai_addr, onProbeConnect); err != 0) {
                closeProbe(conn);
                round->lastError = uv_strerror(err);
                continue;
            }
            ++round->outstanding;
        }
        uv_freeaddrinfo(res);
        self->finishRound(round);
    }

    static void onProbeConnect(uv_connect_t* req, int status) {
        auto* conn = static_cast<ProbeConnect*>(req->data);
        auto* round = conn->round;
        closeProbe(conn);

        --round->outstanding;
        if (status == 0) {
            if (!round->succeeded) {
                round->succeeded = true;
                round->self->markReady();
            }
        } else {
            round->lastError = uv_strerror(status);
        }
        round->self->finishRound(round);
    }

    static void onStopRequest(uv_async_t* handle) {
        auto* self = static_cast<ProcessSupervisorImpl*>(handle->data);
        if (self->_exited || self->_stopRequested) return;
        self->_stopRequested = true;
        self->failStart(Error::serviceNotAvailable("worker start cancelled by stop()"));

        yinfo("ProcessSupervisor: stopping worker pid {}", self->_pid.load());
        if (int err = uv_process_kill(self->_process, SIGTERM); err != 0) {
            ywarn("ProcessSupervisor: SIGTERM failed: {}", uv_strerror(err));
        }
        uv_timer_start(self->_graceTimer, onGraceTimeout,
                       static_cast<uint64_t>(self->_options.stopGrace.count()), 0);
    }

    static void onGraceTimeout(uv_timer_t* timer) {
        auto* self = static_cast<ProcessSupervisorImpl*>(timer->data);
        if (self->_exited) return;

        ywarn("ProcessSupervisor: worker did not exit within {}ms, killing",
              self->_options.stopGrace.count());
        if (int err = uv_process_kill(self->_process, SIGKILL); err != 0) {
            ywarn("ProcessSupervisor: SIGKILL failed: {}", uv_strerror(err));
        }
    }

    static void onExit(uv_process_t* process, int64_t exitStatus, int termSignal) {
        auto* self = static_cast<ProcessSupervisorImpl*>(process->data);
        self->_exited = true;
        {
            std::lock_guard<std::mutex> lock(self->_infoMutex);
            self->_lastExit = ExitStatus{exitStatus, termSignal};
        }
        self->flushOutput(true);
        self->flushOutput(false);

        if (self->_state == WorkerState::Running) {
            ywarn("ProcessSupervisor: worker exited unexpectedly (code {}, signal {})",
                  exitStatus, termSignal);
        } else {
            yinfo("ProcessSupervisor: worker exited (code {}, signal {})", exitStatus, termSignal);
        }

        std::string detail = "worker exited with code " + std::to_string(exitStatus);
        if (termSignal != 0) {
            detail += " (signal " + std::to_string(termSignal) + ")";
        }
        self->failStart(Error::serviceNotAvailable(detail + " before becoming ready"));

        {
            std::lock_guard<std::mutex> lock(self->_asyncMutex);
            self->_acceptingCommands = false;
        }
        self->closeAllHandles();
        self->_pid = 0;
        self->setState(WorkerState::Stopped);
    }

    static constexpr size_t MAX_LINE = 64 * 1024;

    Options _options;

    std::mutex _controlMutex;
    std::thread _thread;
    std::unique_ptr<uv_loop_t> _loop;

    uv_process_t* _process = nullptr;
    uv_pipe_t* _stdoutPipe = nullptr;
    uv_pipe_t* _stderrPipe = nullptr;
    uv_timer_t* _probeTimer = nullptr;
    uv_timer_t* _graceTimer = nullptr;
    uv_async_t* _stopAsync = nullptr;

    // Guards _stopAsync against use after the loop closed it
    std::mutex _asyncMutex;
    bool _acceptingCommands = false;

    std::atomic<WorkerState> _state{WorkerState::Stopped};
    std::atomic<int> _pid{0};

    mutable std::mutex _infoMutex;
    std::optional<ExitStatus> _lastExit;
    std::optional<ResolvedBinary> _binary;

    // Loop thread only
    std::promise<Result<void>> _ready;
    bool _readyResolved = false;
    bool _exited = false;
    bool _stopRequested = false;
    int _probeCount = 0;
    std::string _stdoutLine;
    std::string _stderrLine;
    std::array<char, 4096> _readBuffer{};
};

// ─── Factory ─────────────────────────────────────────────────────────────────

Result<ProcessSupervisor::Ptr> ProcessSupervisor::createImpl(const Options& options) noexcept {
    if (options.port == 0) {
        return Err<Ptr>("ProcessSupervisor: port must be non-zero");
    }
    if (options.probeAttempts < 1) {
        return Err<Ptr>("ProcessSupervisor: probeAttempts must be at least 1");
    }
    return Ok<Ptr>(std::make_shared<ProcessSupervisorImpl>(options));
}

} // namespace corral
