#include "pingwatch/trace_executor.hpp"

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace pingwatch {

const char* to_string(TraceOutcome outcome) {
    switch (outcome) {
    case TraceOutcome::Completed:   return "completed";
    case TraceOutcome::Cancelled:   return "cancelled";
    case TraceOutcome::SpawnFailed: return "spawn failed";
    }
    return "completed";
}

namespace {

constexpr int kExecFailedStatus = 127;
constexpr int kPollSliceMs = 100;

/**
 * A forked child shared between the reading thread and the cancel
 * callback. kill() and waitpid() are serialized so a reaped pid is
 * never signalled.
 */
struct ChildProcess {
    explicit ChildProcess(pid_t p) : pid(p) {}

    void terminate() {
        std::lock_guard<std::mutex> lk(mtx);
        if (reap_locked()) return;  // Already exited on its own
        ::kill(-pid, SIGKILL);      // Whole process group
        killed = true;
    }

    // Non-blocking reap; true once the child is gone
    bool try_reap() {
        std::lock_guard<std::mutex> lk(mtx);
        return reap_locked();
    }

    bool was_killed() {
        std::lock_guard<std::mutex> lk(mtx);
        return killed;
    }

    int exit_status() {
        std::lock_guard<std::mutex> lk(mtx);
        return status;
    }

    bool reap_locked() {
        if (reaped) return true;
        pid_t r = ::waitpid(pid, &status, WNOHANG);
        if (r == pid || (r < 0 && errno != EINTR)) {
            reaped = true;
            return true;
        }
        return false;
    }

    const pid_t pid;
    std::mutex mtx;
    bool reaped{false};
    bool killed{false};
    int status{0};
};

std::string format_seconds(int ms) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.3f", ms / 1000.0);
    std::string s = buf;
    while (!s.empty() && s.back() == '0') s.pop_back();
    if (!s.empty() && s.back() == '.') s.pop_back();
    return s;
}

// Split complete lines out of `pending`, keeping any unterminated tail
void emit_lines(std::string& pending, const LineSink& sink) {
    size_t start = 0;
    for (;;) {
        size_t nl = pending.find('\n', start);
        if (nl == std::string::npos) break;
        std::string line = pending.substr(start, nl - start);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (sink) sink(line);
        start = nl + 1;
    }
    pending.erase(0, start);
}

} // namespace


SubprocessTraceExecutor::SubprocessTraceExecutor(std::string program, ArgvBuilder builder)
    : program_(std::move(program)), builder_(std::move(builder)) {}


std::vector<std::string> SubprocessTraceExecutor::build_args(const TraceRequest& req) const {
    std::vector<std::string> args;
    args.push_back(program_);
    if (req.no_resolve)
        args.push_back("-n");
    args.push_back("-w");
    args.push_back(format_seconds(req.hop_timeout_ms));
    args.push_back(req.address);
    return args;
}


// ============================================================================
// fork / exec / stream
// ============================================================================
TraceOutcome SubprocessTraceExecutor::execute(const TraceRequest& req,
                                              const CancelToken& cancel,
                                              const LineSink& sink)
{
    if (cancel.cancelled())
        return TraceOutcome::Cancelled;

    std::vector<std::string> args = builder_ ? builder_(req) : build_args(req);
    if (args.empty()) {
        if (sink) sink("(trace spawn error: empty command line)");
        return TraceOutcome::SpawnFailed;
    }

    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (auto& a : args)
        argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);

    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) < 0) {
        if (sink) sink(std::string("(trace spawn error: pipe: ") + std::strerror(errno) + ")");
        return TraceOutcome::SpawnFailed;
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        ::close(fds[0]);
        ::close(fds[1]);
        if (sink) sink(std::string("(trace spawn error: fork: ") + std::strerror(err) + ")");
        return TraceOutcome::SpawnFailed;
    }

    if (pid == 0) {
        // Child: only async-signal-safe calls from here on
        ::setpgid(0, 0);
        ::dup2(fds[1], STDOUT_FILENO);
        ::dup2(fds[1], STDERR_FILENO);
        ::execvp(argv[0], argv.data());

        static const char msg[] = "(trace spawn error: exec failed)\n";
        ssize_t w = ::write(STDOUT_FILENO, msg, sizeof(msg) - 1);
        (void)w;
        ::_exit(kExecFailedStatus);
    }

    // Also set from the parent so an early kill(-pid) reaches the group.
    // EACCES here means the child already exec'd with its own group.
    ::setpgid(pid, pid);
    ::close(fds[1]);

    auto child = std::make_shared<ChildProcess>(pid);
    CancelRegistration reg = cancel.on_cancel([child] { child->terminate(); });

    std::string pending;
    char buf[4096];

    for (;;) {
        if (cancel.cancelled()) break;

        pollfd pfd{};
        pfd.fd = fds[0];
        pfd.events = POLLIN;

        int pr = ::poll(&pfd, 1, kPollSliceMs);
        if (pr < 0) {
            if (errno == EINTR) continue;
            if (sink) sink(std::string("(trace output read error: ") + std::strerror(errno) + ")");
            break;
        }
        if (pr == 0) continue;

        ssize_t n = ::read(fds[0], buf, sizeof(buf));
        if (n > 0) {
            pending.append(buf, static_cast<size_t>(n));
            emit_lines(pending, sink);
            continue;
        }
        if (n == 0) break;          // EOF
        if (errno == EINTR || errno == EAGAIN) continue;

        if (sink) sink(std::string("(trace output read error: ") + std::strerror(errno) + ")");
        break;
    }

    ::close(fds[0]);

    if (!pending.empty() && !cancel.cancelled()) {
        if (pending.back() == '\r') pending.pop_back();
        if (sink) sink(pending);
    }

    // Output closed or reading stopped; wait for the process itself
    while (!child->try_reap()) {
        if (cancel.cancelled())
            child->terminate();
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    reg.reset();

    const int status = child->exit_status();

    if (child->was_killed() || (cancel.cancelled() && WIFSIGNALED(status)))
        return TraceOutcome::Cancelled;

    if (WIFEXITED(status) && WEXITSTATUS(status) == kExecFailedStatus)
        return TraceOutcome::SpawnFailed;

    return TraceOutcome::Completed;
}

} // namespace pingwatch
