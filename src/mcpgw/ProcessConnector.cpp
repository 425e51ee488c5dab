//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProcessConnector.cpp
// Purpose: Subprocess backend connector (spawn, frame, read/write, classify stderr)
//==========================================================================================================

#include <unistd.h>
#include <fcntl.h>
#include <errno.h>
#include <poll.h>
#include <signal.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <cstring>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <deque>
#include <filesystem>
#include <format>
#include <mutex>
#include <sstream>
#include <thread>
#include <unordered_map>

#include "mcpgw/JsonRpcMessageRouter.h"
#include "mcpgw/ProcessConnector.hpp"
#include "mcpgw/errors/Errors.h"
#include "mcpgw/version.h"

extern char** environ;

namespace mcpgw {

using errors::ErrorCategory;
using errors::GatewayError;

namespace {

constexpr const char* kHandshakeProtocolVersion = "2024-11-05";
constexpr int kWaitTimeoutMs = 100;

std::string basenameOf(const std::string& path) {
    std::size_t slash = path.rfind('/');
    return (slash == std::string::npos) ? path : path.substr(slash + 1);
}

std::string trim(const std::string& s) {
    auto notSpace = [](unsigned char c){ return !std::isspace(c); };
    auto b = std::find_if(s.begin(), s.end(), notSpace);
    auto e = std::find_if(s.rbegin(), s.rend(), notSpace).base();
    return (b < e) ? std::string(b, e) : std::string();
}

std::string toUpper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::toupper(c)); });
    return s;
}

// Keeps scratch directory names predictable for any tenant/connector id.
std::string pathSafe(const std::string& s) {
    std::string out;
    for (unsigned char c : s) {
        out.push_back((std::isalnum(c) || c == '-' || c == '_') ? static_cast<char>(c) : '_');
    }
    return out;
}

bool isWritableDir(const std::string& path) {
    struct stat st{};
    return !path.empty() && ::stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode) && ::access(path.c_str(), W_OK) == 0;
}

bool isExecutableFile(const std::string& path) {
    struct stat st{};
    return ::stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode) && ::access(path.c_str(), X_OK) == 0;
}

std::optional<std::string> resolveExecutable(const std::string& name, const std::map<std::string, std::string>& env) {
    if (name.find('/') != std::string::npos) {
        return isExecutableFile(name) ? std::make_optional(name) : std::nullopt;
    }
    auto it = env.find("PATH");
    std::string path = (it != env.end()) ? it->second : std::string("/usr/local/bin:/usr/bin:/bin");
    std::stringstream ss(path);
    std::string dir;
    while (std::getline(ss, dir, ':')) {
        std::string candidate = (dir.empty() ? std::string(".") : dir) + "/" + name;
        if (isExecutableFile(candidate)) {
            return candidate;
        }
    }
    return std::nullopt;
}

void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

void setNonBlocking(int fd) {
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags >= 0) {
        (void)::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
}

// A closed child stdin must surface as EPIPE, not terminate the gateway.
void ignoreSigpipe() {
    static std::once_flag once;
    std::call_once(once, []{ ::signal(SIGPIPE, SIG_IGN); });
}

GatewayError unavailable(const std::string& message) {
    return GatewayError(ErrorCategory::BackendUnavailable, message);
}

} // namespace

Logger::Level ClassifyStderrLine(const std::string& line) {
    if (line.find("[DEBUG]") != std::string::npos) {
        return Logger::Level::DEBUG;
    }
    if (line.find("INFO:") != std::string::npos) {
        return Logger::Level::INFO;
    }
    if (line.find("WARNING") != std::string::npos) {
        return Logger::Level::WARN;
    }
    if (line.find("ERROR") != std::string::npos) {
        return Logger::Level::ERROR;
    }
    return Logger::Level::DEBUG;
}

class ProcessConnector::Impl {
public:
    struct PendingCall {
        std::promise<JSONValue> promise;
        std::string method;
        std::chrono::steady_clock::time_point deadline;
    };

    LaunchSpec spec;
    ProcessConnector::Options opts;
    LaunchContext context;

    pid_t pid{-1};
    int stdinFd{-1};
    int stdoutFd{-1};
    int stderrFd{-1};
    int wakeEventFd{-1};

    std::atomic<bool> running{false};
    std::atomic<bool> writable{false};
    std::atomic<bool> initialized{false};
    std::atomic<bool> stdoutClosed{false};
    std::atomic<bool> stderrClosed{false};
    std::atomic<FramingMode> framing{FramingMode::JsonLines};
    std::atomic<uint64_t> requestCounter{0};

    std::thread readerThread;
    std::thread timeoutThread;

    mutable std::mutex requestMutex;
    std::unordered_map<std::string, PendingCall> pendingRequests;

    std::mutex writeMutex;

    mutable std::mutex stderrMutex;
    std::deque<std::string> stderrLines;

    std::mutex sinkMutex;
    ProcessConnector::NotificationSink sink;

    std::mutex procMutex;
    bool reaped{true};
    std::optional<int> exitCode;

    std::unique_ptr<IJsonRpcMessageRouter> router{MakeDefaultJsonRpcMessageRouter()};
    RouterHandlers handlers;
    std::unique_ptr<IContentFramer> jsonLinesFramer;
    std::unique_ptr<IContentFramer> contentLengthFramer;

    Impl(LaunchSpec s, const ProcessConnector::Options& o) : spec(std::move(s)), opts(o) {
        jsonLinesFramer = MakeJsonLinesFramer(opts.maxFrameBytes);
        contentLengthFramer = MakeContentLengthFramer(opts.maxFrameBytes);
        wakeEventFd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
        if (wakeEventFd < 0) {
            LOG_ERROR("ProcessConnector: failed to create eventfd (errno={} msg={})", errno, ::strerror(errno));
        }
        handlers.requestHandler = [this](const JSONRPCRequest& req) {
            LOG_DEBUG("ProcessConnector [{}]: rejecting server request '{}'", spec.runtimeType, req.method);
            return CreateErrorResponse(req.id, JSONRPCErrorCodes::MethodNotFound, "Method not found: " + req.method);
        };
        handlers.notificationHandler = [this](JSONRPCNotification&& note) {
            LOG_DEBUG("ProcessConnector [{}]: notification {}", spec.runtimeType, note.method);
            ProcessConnector::NotificationSink target;
            {
                std::lock_guard<std::mutex> lock(sinkMutex);
                target = sink;
            }
            if (target) {
                target(note);
            }
        };
        handlers.errorHandler = [this](const std::string& msg) {
            LOG_DEBUG("ProcessConnector [{}]: {}", spec.runtimeType, msg);
        };
    }

    ~Impl() {
        closeFd(wakeEventFd);
    }

    void wake() {
        if (wakeEventFd < 0) {
            return;
        }
        uint64_t one = 1;
        ssize_t w;
        do {
            w = ::write(wakeEventFd, &one, sizeof(one));
        } while (w < 0 && errno == EINTR);
        if (w < 0 && errno != EAGAIN && errno != EWOULDBLOCK) {
            LOG_WARN("ProcessConnector: eventfd write failed (errno={} msg={})", errno, ::strerror(errno));
        }
    }

    //======================================================================================================
    // Process lifecycle
    //======================================================================================================
    void spawn(const std::string& executable, const std::vector<std::string>& argv,
               const std::map<std::string, std::string>& env) {
        int inPipe[2]{-1, -1};
        int outPipe[2]{-1, -1};
        int errPipe[2]{-1, -1};
        auto closeAll = [&]() {
            closeFd(inPipe[0]); closeFd(inPipe[1]);
            closeFd(outPipe[0]); closeFd(outPipe[1]);
            closeFd(errPipe[0]); closeFd(errPipe[1]);
        };
        if (::pipe2(inPipe, O_CLOEXEC) != 0 || ::pipe2(outPipe, O_CLOEXEC) != 0 || ::pipe2(errPipe, O_CLOEXEC) != 0) {
            int err = errno;
            closeAll();
            throw unavailable(std::format("Failed to create pipes: {}", ::strerror(err)));
        }

        // Everything the child touches is prepared before fork
        std::vector<std::string> envStrings;
        envStrings.reserve(env.size());
        for (const auto& [k, v] : env) {
            envStrings.push_back(k + "=" + v);
        }
        std::vector<char*> envp;
        for (auto& e : envStrings) envp.push_back(e.data());
        envp.push_back(nullptr);
        std::vector<std::string> args = argv;
        std::vector<char*> argvp;
        for (auto& a : args) argvp.push_back(a.data());
        argvp.push_back(nullptr);
        const std::string execFailure = "mcpgw: failed to exec " + executable + "\n";
        const std::string chdirFailure = "mcpgw: failed to enter working directory\n";
        const char* workDir = spec.workingDir.has_value() ? spec.workingDir->c_str() : nullptr;

        pid_t child = ::fork();
        if (child < 0) {
            int err = errno;
            closeAll();
            throw unavailable(std::format("Failed to start MCP server process: {}", ::strerror(err)));
        }
        if (child == 0) {
            ::dup2(inPipe[0], STDIN_FILENO);
            ::dup2(outPipe[1], STDOUT_FILENO);
            ::dup2(errPipe[1], STDERR_FILENO);
            ::signal(SIGPIPE, SIG_DFL);
            if (workDir != nullptr && ::chdir(workDir) != 0) {
                ssize_t ignored = ::write(STDERR_FILENO, chdirFailure.data(), chdirFailure.size());
                (void)ignored;
                ::_exit(127);
            }
            ::execve(executable.c_str(), argvp.data(), envp.data());
            ssize_t ignored = ::write(STDERR_FILENO, execFailure.data(), execFailure.size());
            (void)ignored;
            ::_exit(127);
        }

        closeFd(inPipe[0]);
        closeFd(outPipe[1]);
        closeFd(errPipe[1]);
        stdinFd = inPipe[1];
        stdoutFd = outPipe[0];
        stderrFd = errPipe[0];
        setNonBlocking(stdinFd);
        setNonBlocking(stdoutFd);
        setNonBlocking(stderrFd);
        {
            std::lock_guard<std::mutex> lock(procMutex);
            pid = child;
            reaped = false;
            exitCode.reset();
        }
        stdoutClosed = false;
        stderrClosed = false;
        writable = true;
        LOG_INFO("ProcessConnector: started {} (pid={}, runtime={})", executable, static_cast<int>(child), spec.runtimeType);
    }

    // Collects the exit status if the child has terminated. Returns true once reaped.
    bool reap(bool block) {
        std::lock_guard<std::mutex> lock(procMutex);
        if (reaped) {
            return true;
        }
        int status = 0;
        pid_t r;
        do {
            r = ::waitpid(pid, &status, block ? 0 : WNOHANG);
        } while (r < 0 && errno == EINTR);
        if (r == pid) {
            reaped = true;
            if (WIFEXITED(status)) {
                exitCode = WEXITSTATUS(status);
            } else if (WIFSIGNALED(status)) {
                exitCode = 128 + WTERMSIG(status);
            } else {
                exitCode = -1;
            }
            LOG_DEBUG("ProcessConnector: pid {} exited with code {}", static_cast<int>(pid), *exitCode);
            return true;
        }
        if (r < 0 && errno == ECHILD) {
            reaped = true;
            exitCode = -1;
            return true;
        }
        return false;
    }

    void startThreads() {
        running = true;
        readerThread = std::thread([this]() { readerLoop(); });
        timeoutThread = std::thread([this]() { timeoutLoop(); });
    }

    void stop() {
        writable = false;
        {
            std::lock_guard<std::mutex> lock(writeMutex);
            closeFd(stdinFd);
        }
        if (!reap(false)) {
            ::kill(pid, SIGTERM);
            auto deadline = std::chrono::steady_clock::now() + opts.stopTimeout;
            while (!reap(false) && std::chrono::steady_clock::now() < deadline) {
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
            }
            if (!reap(false)) {
                LOG_WARN("ProcessConnector: pid {} ignored SIGTERM; sending SIGKILL", static_cast<int>(pid));
                ::kill(pid, SIGKILL);
                (void)reap(true);
            }
        }
        running = false;
        wake();
        if (readerThread.joinable()) {
            readerThread.join();
        }
        if (timeoutThread.joinable()) {
            timeoutThread.join();
        }
        closeFd(stdoutFd);
        closeFd(stderrFd);
        failAll("Process terminated", ErrorCategory::BackendUnavailable);
        initialized = false;
    }

    //======================================================================================================
    // Writing
    //======================================================================================================
    void writeFrame(const std::string& payload) {
        IContentFramer& framer = (framing.load() == FramingMode::ContentLength) ? *contentLengthFramer : *jsonLinesFramer;
        std::string frame = framer.encode(payload);
        std::lock_guard<std::mutex> lock(writeMutex);
        if (!writable.load() || stdinFd < 0) {
            throw unavailable("Process not started");
        }
        std::size_t total = 0;
        auto deadline = std::chrono::steady_clock::now() + opts.requestTimeout;
        while (total < frame.size()) {
            ssize_t w = ::write(stdinFd, frame.data() + total, frame.size() - total);
            if (w > 0) {
                total += static_cast<std::size_t>(w);
                continue;
            }
            if (w < 0 && errno == EINTR) {
                continue;
            }
            if (w < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
                if (std::chrono::steady_clock::now() >= deadline) {
                    throw unavailable("Failed to write to MCP server: write timeout");
                }
                struct pollfd pfd{stdinFd, POLLOUT, 0};
                (void)::poll(&pfd, 1, kWaitTimeoutMs);
                continue;
            }
            int err = errno;
            writable = false;
            throw unavailable(std::format("Failed to write to MCP server: {}", ::strerror(err)));
        }
        LOG_DEBUG("ProcessConnector: wrote {} byte {} frame", frame.size(), framingName(framing.load()));
    }

    //======================================================================================================
    // Reading
    //======================================================================================================
    // Reads everything currently available. Returns true on EOF or a hard error.
    bool drainFd(int fd, std::string& buffer) {
        char tmp[4096];
        for (;;) {
            ssize_t n = ::read(fd, tmp, sizeof(tmp));
            if (n > 0) {
                buffer.append(tmp, static_cast<std::size_t>(n));
                continue;
            }
            if (n == 0) {
                return true;
            }
            if (errno == EINTR) {
                continue;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                return false;
            }
            LOG_ERROR("ProcessConnector: read error (errno={} msg={})", errno, ::strerror(errno));
            return true;
        }
    }

    void emitStderrLines(std::string& buffer, bool flushPartial) {
        std::size_t pos = 0;
        for (;;) {
            std::size_t eol = buffer.find('\n', pos);
            if (eol == std::string::npos) {
                break;
            }
            recordStderr(buffer.substr(pos, eol - pos));
            pos = eol + 1;
        }
        buffer.erase(0, pos);
        if (flushPartial && !buffer.empty()) {
            recordStderr(buffer);
            buffer.clear();
        }
    }

    void recordStderr(const std::string& raw) {
        std::string line = trim(raw);
        if (line.empty()) {
            return;
        }
        {
            std::lock_guard<std::mutex> lock(stderrMutex);
            stderrLines.push_back(line);
            while (stderrLines.size() > ProcessConnector::StderrRingSize) {
                stderrLines.pop_front();
            }
        }
        Logger::logAt(ClassifyStderrLine(line), std::format("MCP stderr [{}]: {}", spec.runtimeType, line),
                      __FILE__, __LINE__);
    }

    void handleFrame(const std::string& frame) {
        LOG_DEBUG("ProcessConnector: received frame: {}", frame);
        auto reply = router->route(frame, handlers, [this](JSONRPCResponse&& resp) { resolve(std::move(resp)); });
        if (reply.has_value()) {
            try {
                writeFrame(*reply);
            } catch (const GatewayError& e) {
                LOG_WARN("ProcessConnector: failed to answer server request: {}", e.what());
            }
        }
    }

    void readerLoop() {
        int ep = ::epoll_create1(EPOLL_CLOEXEC);
        if (ep < 0) {
            LOG_ERROR("ProcessConnector: epoll_create1 failed (errno={} msg={})", errno, ::strerror(errno));
            return;
        }
        for (int fd : {stdoutFd, stderrFd, wakeEventFd}) {
            if (fd < 0) {
                continue;
            }
            epoll_event ev{};
            ev.events = EPOLLIN | EPOLLRDHUP;
            ev.data.fd = fd;
            (void)::epoll_ctl(ep, EPOLL_CTL_ADD, fd, &ev);
        }

        std::string outBuffer;
        std::string errBuffer;
        while (running.load() && !(stdoutClosed.load() && stderrClosed.load())) {
            epoll_event events[3];
            int rc = ::epoll_wait(ep, events, 3, kWaitTimeoutMs);
            if (rc < 0) {
                if (errno == EINTR) {
                    continue;
                }
                LOG_ERROR("ProcessConnector: epoll_wait failed (errno={} msg={})", errno, ::strerror(errno));
                break;
            }
            for (int i = 0; i < rc; ++i) {
                int fd = events[i].data.fd;
                if (fd == wakeEventFd) {
                    uint64_t v = 0;
                    ssize_t r;
                    do {
                        r = ::read(fd, &v, sizeof(v));
                    } while (r < 0 && errno == EINTR);
                    continue;
                }
                if (fd == stdoutFd) {
                    bool eof = drainFd(fd, outBuffer);
                    for (const auto& frame : DrainFrames(outBuffer, opts.maxFrameBytes)) {
                        handleFrame(frame);
                    }
                    if (eof) {
                        (void)::epoll_ctl(ep, EPOLL_CTL_DEL, fd, nullptr);
                        stdoutClosed = true;
                        writable = false;
                        LOG_INFO("ProcessConnector [{}]: stdout closed", spec.runtimeType);
                        failAll("Process exited", ErrorCategory::BackendUnavailable);
                    }
                } else if (fd == stderrFd) {
                    bool eof = drainFd(fd, errBuffer);
                    emitStderrLines(errBuffer, eof);
                    if (eof) {
                        (void)::epoll_ctl(ep, EPOLL_CTL_DEL, fd, nullptr);
                        stderrClosed = true;
                    }
                }
            }
        }
        ::close(ep);
    }

    //======================================================================================================
    // Pending request bookkeeping
    //======================================================================================================
    void resolve(JSONRPCResponse&& response) {
        std::string idStr = IdToString(response.id);
        std::lock_guard<std::mutex> lock(requestMutex);
        auto it = pendingRequests.find(idStr);
        if (it == pendingRequests.end()) {
            LOG_DEBUG("ProcessConnector: dropping response for unknown id {}", idStr);
            return;
        }
        if (response.error.has_value()) {
            auto err = errors::mcpErrorFromErrorValue(*response.error);
            if (err.has_value()) {
                it->second.promise.set_exception(std::make_exception_ptr(
                    GatewayError(err->category, err->code, "MCP error: " + err->message, err->data)));
            } else {
                it->second.promise.set_exception(std::make_exception_ptr(
                    GatewayError(ErrorCategory::Internal, "MCP error: Unknown error")));
            }
        } else {
            it->second.promise.set_value(response.result.value_or(JSONValue(JSONValue::Object{})));
        }
        pendingRequests.erase(it);
    }

    void failAll(const std::string& message, ErrorCategory category) {
        std::lock_guard<std::mutex> lock(requestMutex);
        for (auto& [id, call] : pendingRequests) {
            call.promise.set_exception(std::make_exception_ptr(GatewayError(category, message)));
        }
        pendingRequests.clear();
    }

    void timeoutLoop() {
        using clock = std::chrono::steady_clock;
        while (running.load()) {
            auto now = clock::now();
            {
                std::lock_guard<std::mutex> lock(requestMutex);
                for (auto it = pendingRequests.begin(); it != pendingRequests.end();) {
                    if (it->second.deadline <= now) {
                        LOG_WARN("ProcessConnector: request {} ({}) timed out", it->first, it->second.method);
                        it->second.promise.set_exception(std::make_exception_ptr(
                            GatewayError(ErrorCategory::UpstreamTimeout, "MCP request timeout: " + it->second.method)));
                        it = pendingRequests.erase(it);
                    } else {
                        ++it;
                    }
                }
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    }

    std::future<JSONValue> sendRequest(const std::string& method, const std::optional<JSONValue>& params,
                                       std::chrono::milliseconds timeout) {
        std::promise<JSONValue> promise;
        auto fut = promise.get_future();
        if (!writable.load()) {
            promise.set_exception(std::make_exception_ptr(unavailable("Process not started")));
            return fut;
        }
        std::string id = std::to_string(++requestCounter);
        JSONRPCRequest request(id, method, params.value_or(JSONValue(JSONValue::Object{})));
        {
            std::lock_guard<std::mutex> lock(requestMutex);
            pendingRequests.emplace(id, PendingCall{std::move(promise), method, std::chrono::steady_clock::now() + timeout});
        }
        try {
            writeFrame(request.Serialize());
        } catch (const GatewayError&) {
            std::lock_guard<std::mutex> lock(requestMutex);
            auto it = pendingRequests.find(id);
            if (it != pendingRequests.end()) {
                it->second.promise.set_exception(std::current_exception());
                pendingRequests.erase(it);
            }
        }
        return fut;
    }

    JSONValue handshakeParams() const {
        JSONValue::Object roots;
        SetField(roots, "listChanged", JSONValue(true));
        JSONValue::Object caps;
        SetField(caps, "roots", JSONValue(roots));
        SetField(caps, "sampling", JSONValue(JSONValue::Object{}));
        JSONValue::Object clientInfo;
        SetField(clientInfo, "name", JSONValue(kClientName));
        SetField(clientInfo, "version", JSONValue(getVersionString()));
        JSONValue::Object params;
        SetField(params, "protocolVersion", JSONValue(kHandshakeProtocolVersion));
        SetField(params, "capabilities", JSONValue(caps));
        SetField(params, "clientInfo", JSONValue(clientInfo));
        return JSONValue(params);
    }

    void handshake() {
        const JSONValue params = handshakeParams();
        framing = FramingMode::JsonLines;
        JSONValue result;
        try {
            result = sendRequest("initialize", params, opts.handshakeTimeout).get();
        } catch (const GatewayError& e) {
            if (e.category() != ErrorCategory::UpstreamTimeout || reap(false)) {
                throw;
            }
            LOG_WARN("ProcessConnector [{}]: no JSON-lines initialize response; retrying with Content-Length framing",
                     spec.runtimeType);
            framing = FramingMode::ContentLength;
            result = sendRequest("initialize", params, opts.handshakeTimeout).get();
        }
        initialized = true;
        JSONRPCNotification note("notifications/initialized", JSONValue(JSONValue::Object{}));
        writeFrame(note.Serialize());
        std::string serverName = "unknown";
        if (const JSONValue* info = FindField(result, "serverInfo")) {
            serverName = GetStringField(*info, "name").value_or(serverName);
        }
        LOG_INFO("ProcessConnector [{}]: session initialized with '{}' using {} framing", spec.runtimeType,
                 serverName, framingName(framing.load()));
    }
};

ProcessConnector::ProcessConnector(LaunchSpec spec) : ProcessConnector(std::move(spec), Options{}) {}

ProcessConnector::ProcessConnector(LaunchSpec spec, const Options& opts)
    : pImpl(std::make_unique<Impl>(std::move(spec), opts)) {
    ignoreSigpipe();
}

ProcessConnector::~ProcessConnector() {
    if (pImpl->running.load()) {
        pImpl->stop();
    }
}

void ProcessConnector::Start(const LaunchContext& ctx) {
    FUNC_SCOPE();
    if (pImpl->running.load()) {
        if (!HasExited() && pImpl->initialized.load()) {
            return;
        }
        pImpl->stop();
    }
    pImpl->context = ctx;
    const auto& command = pImpl->spec.command;
    if (command.empty() || trim(command.front()).empty()) {
        throw unavailable("runtime_command must start with a non-empty executable name");
    }
    auto argv = BuildArgv(command);
    auto env = BuildEnvironment(pImpl->spec, ctx, CurrentEnvironment());
    auto executable = resolveExecutable(trim(argv.front()), env);
    if (!executable.has_value()) {
        throw unavailable(std::format(
            "MCP server command '{}' not found on PATH. Ensure the runtime is installed (e.g., Node.js for npx, Python for uvx).",
            argv.front()));
    }
    {
        std::lock_guard<std::mutex> lock(pImpl->stderrMutex);
        pImpl->stderrLines.clear();
    }
    pImpl->spawn(*executable, argv, env);
    pImpl->startThreads();

    auto deadline = std::chrono::steady_clock::now() + pImpl->opts.startupGrace;
    while (!pImpl->reap(false) && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    if (pImpl->reap(false)) {
        // Let the reader collect what the process printed before dying
        auto drainDeadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(500);
        while (!pImpl->stderrClosed.load() && std::chrono::steady_clock::now() < drainDeadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        int code = ExitCode().value_or(-1);
        auto tail = StderrTail(StderrTailLines);
        std::string message;
        if (tail.empty()) {
            message = std::format("MCP server process died with code {} (no stderr captured)", code);
        } else {
            message = std::format("MCP server process died with code {}\nstderr:", code);
            for (const auto& line : tail) {
                message += "\n" + line;
            }
        }
        pImpl->stop();
        LOG_ERROR("ProcessConnector: {}", message);
        throw unavailable(message);
    }

    try {
        pImpl->handshake();
    } catch (const GatewayError& e) {
        pImpl->stop();
        throw unavailable(std::string("Failed to initialize MCP session: ") + e.what());
    }
}

void ProcessConnector::Stop() {
    FUNC_SCOPE();
    if (!pImpl->running.load()) {
        return;
    }
    int pid = 0;
    {
        std::lock_guard<std::mutex> lock(pImpl->procMutex);
        pid = static_cast<int>(pImpl->pid);
    }
    LOG_INFO("ProcessConnector: stopping pid {}", pid);
    pImpl->stop();
}

bool ProcessConnector::IsRunning() {
    return pImpl->running.load() && !pImpl->reap(false);
}

bool ProcessConnector::IsInitialized() const {
    return pImpl->initialized.load();
}

std::optional<int> ProcessConnector::Pid() const {
    std::lock_guard<std::mutex> lock(pImpl->procMutex);
    if (pImpl->pid <= 0) {
        return std::nullopt;
    }
    return static_cast<int>(pImpl->pid);
}

std::optional<int> ProcessConnector::ExitCode() {
    (void)pImpl->reap(false);
    std::lock_guard<std::mutex> lock(pImpl->procMutex);
    return pImpl->exitCode;
}

FramingMode ProcessConnector::Framing() const {
    return pImpl->framing.load();
}

std::size_t ProcessConnector::PendingCount() const {
    std::lock_guard<std::mutex> lock(pImpl->requestMutex);
    return pImpl->pendingRequests.size();
}

const LaunchSpec& ProcessConnector::Spec() const {
    return pImpl->spec;
}

const LaunchContext& ProcessConnector::Context() const {
    return pImpl->context;
}

std::vector<std::string> ProcessConnector::StderrTail(std::size_t lines) const {
    std::lock_guard<std::mutex> lock(pImpl->stderrMutex);
    std::size_t n = std::min(lines, pImpl->stderrLines.size());
    return std::vector<std::string>(pImpl->stderrLines.end() - static_cast<std::ptrdiff_t>(n), pImpl->stderrLines.end());
}

std::future<JSONValue> ProcessConnector::SendRequest(const std::string& method, const std::optional<JSONValue>& params,
                                                     std::optional<std::chrono::milliseconds> timeout) {
    FUNC_SCOPE();
    return pImpl->sendRequest(method, params, timeout.value_or(pImpl->opts.requestTimeout));
}

void ProcessConnector::SendNotification(const std::string& method, const std::optional<JSONValue>& params) {
    FUNC_SCOPE();
    JSONRPCNotification note(method, params.value_or(JSONValue(JSONValue::Object{})));
    pImpl->writeFrame(note.Serialize());
}

void ProcessConnector::SetNotificationSink(NotificationSink sink) {
    std::lock_guard<std::mutex> lock(pImpl->sinkMutex);
    pImpl->sink = std::move(sink);
}

bool ProcessConnector::HasExited() {
    return pImpl->reap(false) || pImpl->stdoutClosed.load();
}

JSONValue ProcessConnector::Call(const std::string& method, const std::optional<JSONValue>& params) {
    return SendRequest(method, params).get();
}

JSONValue ProcessConnector::ListTools() {
    return Call("tools/list", std::nullopt);
}

JSONValue ProcessConnector::CallTool(const std::string& name, const JSONValue& arguments) {
    JSONValue::Object params;
    SetField(params, "name", JSONValue(name));
    SetField(params, "arguments", arguments);
    return Call("tools/call", JSONValue(params));
}

JSONValue ProcessConnector::ListResources() {
    return Call("resources/list", std::nullopt);
}

JSONValue ProcessConnector::ReadResource(const std::string& uri) {
    JSONValue::Object params;
    SetField(params, "uri", JSONValue(uri));
    return Call("resources/read", JSONValue(params));
}

std::vector<std::string> ProcessConnector::BuildArgv(const std::vector<std::string>& command) {
    std::vector<std::string> argv = command;
    if (!argv.empty() && basenameOf(trim(argv.front())) == "npx") {
        bool confirmed = std::any_of(argv.begin() + 1, argv.end(),
                                     [](const std::string& a){ return a == "-y" || a == "--yes"; });
        if (!confirmed) {
            argv.insert(argv.begin() + 1, "-y");
        }
    }
    return argv;
}

std::map<std::string, std::string> ProcessConnector::BuildEnvironment(const LaunchSpec& spec, const LaunchContext& ctx,
                                                                      const std::map<std::string, std::string>& base) {
    std::map<std::string, std::string> env = base;
    for (const auto& [k, v] : spec.env) {
        env[k] = v;
    }
    if (ctx.oauthToken.has_value()) {
        env["OAUTH_TOKEN"] = *ctx.oauthToken;
        env["ACCESS_TOKEN"] = *ctx.oauthToken;
    }
    env["TENANT_ID"] = ctx.tenantId;
    env["CONNECTOR_ID"] = ctx.connectorId;
    env["MCPGW_MODE"] = "hosted";
    if (ctx.apiBase.has_value()) {
        env["MCPGW_API_BASE"] = *ctx.apiBase;
    }
    for (const auto& [k, v] : spec.configuration) {
        env["CONFIG_" + toUpper(k)] = v;
    }

    if (!spec.command.empty() && basenameOf(trim(spec.command.front())) == "uvx") {
        auto home = env.find("HOME");
        if (home == env.end() || !isWritableDir(home->second)) {
            std::error_code ec;
            std::filesystem::path scratch = std::filesystem::temp_directory_path(ec);
            if (ec) {
                scratch = "/tmp";
            }
            scratch /= "mcpgw-uvx-" + pathSafe(ctx.tenantId) + "-" + pathSafe(ctx.connectorId);
            std::filesystem::path cache = scratch / ".cache";
            std::filesystem::create_directories(cache / "uv", ec);
            if (ec) {
                LOG_WARN("ProcessConnector: could not create uvx scratch dir {}: {}", scratch.string(), ec.message());
            }
            env["HOME"] = scratch.string();
            env["XDG_CACHE_HOME"] = cache.string();
            env["UV_CACHE_DIR"] = (cache / "uv").string();
        }
    }
    return env;
}

std::map<std::string, std::string> ProcessConnector::CurrentEnvironment() {
    std::map<std::string, std::string> env;
    for (char** e = environ; e != nullptr && *e != nullptr; ++e) {
        std::string entry(*e);
        std::size_t eq = entry.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        env.emplace(entry.substr(0, eq), entry.substr(eq + 1));
    }
    return env;
}

} // namespace mcpgw
