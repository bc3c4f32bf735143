#pragma once
#include <functional>
#include <string>
#include <vector>

#include "pingwatch/cancel.hpp"

namespace pingwatch {

/**
 * How one path-trace subprocess ended.
 */
enum class TraceOutcome {
    Completed,      // Process exited on its own
    Cancelled,      // Killed after cancellation
    SpawnFailed     // Could not be started
};

const char* to_string(TraceOutcome outcome);

struct TraceRequest {
    std::string address;
    int hop_timeout_ms{2000};     // Already floored by the caller
    bool no_resolve{true};
};

using LineSink = std::function<void(const std::string& line)>;

/**
 * Runs one external path-trace for one address and streams its output.
 *
 * execute() blocks until the process has exited or has been killed in
 * response to `cancel`. Each complete output line (without the line
 * terminator) is passed to `sink` as soon as it is read. Spawn and read
 * errors are reported as ordinary lines.
 */
class TraceExecutor {
public:
    virtual ~TraceExecutor() = default;

    virtual TraceOutcome execute(const TraceRequest& req,
                                 const CancelToken& cancel,
                                 const LineSink& sink) = 0;
};

/**
 * fork/exec executor. stdout and stderr of the child share one pipe.
 *
 * The child runs in its own process group so a kill on cancellation
 * also reaches anything it spawned.
 */
class SubprocessTraceExecutor : public TraceExecutor {
public:
    using ArgvBuilder = std::function<std::vector<std::string>(const TraceRequest&)>;

    /**
     * @param program  executable looked up on PATH (default "traceroute")
     * @param builder  optional replacement for the default argument list;
     *                 must return the complete argv including argv[0]
     */
    explicit SubprocessTraceExecutor(std::string program = "traceroute",
                                     ArgvBuilder builder = {});

    TraceOutcome execute(const TraceRequest& req,
                         const CancelToken& cancel,
                         const LineSink& sink) override;

    /**
     * Default traceroute argv: `traceroute [-n] -w <seconds> <address>`.
     */
    std::vector<std::string> build_args(const TraceRequest& req) const;

private:
    std::string program_;
    ArgvBuilder builder_;
};

} // namespace pingwatch
