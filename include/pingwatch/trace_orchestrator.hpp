#pragma once
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "pingwatch/cancel.hpp"
#include "pingwatch/diag_logger.hpp"
#include "pingwatch/monitor_session.hpp"
#include "pingwatch/trace_executor.hpp"
#include "pingwatch/trace_session.hpp"

namespace pingwatch {

struct TraceOptions {
    int timeout_ms{2000};             // Probe timeout the hop timeout derives from
    int min_hop_timeout_ms{100};      // Floor for the per-hop timeout
    size_t max_concurrency{4};        // Subprocesses alive at once
    bool no_resolve{true};            // Skip DNS lookups of hops
};

/**
 * Runs path-trace diagnostics for a set of addresses with bounded
 * concurrency. One run at a time.
 */
class TraceOrchestrator {
public:
    /** Starts the thread for one address task. */
    using TaskLauncher = std::function<std::thread(std::function<void()>)>;

    explicit TraceOrchestrator(std::shared_ptr<TraceExecutor> executor,
                               DiagLogger* diag = nullptr);
    ~TraceOrchestrator();

    TraceOrchestrator(const TraceOrchestrator&) = delete;
    TraceOrchestrator& operator=(const TraceOrchestrator&) = delete;

    void set_callbacks(TraceCallbacks callbacks);

    /**
     * Replace how task threads are started; empty restores std::thread.
     * A launcher that throws std::system_error fails the run cleanly.
     */
    void set_task_launcher(TaskLauncher launcher);

    /**
     * Trace every address and block until all tasks have finished, or
     * until the run is cancelled and the remaining tasks have unwound.
     *
     * @param parent  optional scope (e.g. a monitoring session) whose
     *                cancellation also stops this run
     */
    CommandResult run_trace(const std::vector<std::string>& addresses,
                            const TraceOptions& opts = {},
                            const CancelToken& parent = {});

    /**
     * Cancel the active run: running subprocesses are killed, waiting
     * tasks give up, unfinished addresses get a "stopped by user"
     * trailer. No-op when idle.
     */
    void stop_trace();

    bool running() const;

    /** Session of the active or most recent run; nullptr before the first. */
    std::shared_ptr<TraceSession> last_session() const;

private:
    void run_task(const std::shared_ptr<TraceSession>& session,
                  size_t index,
                  const TraceOptions& opts);

    std::shared_ptr<TraceExecutor> executor_;
    DiagLogger* diag_;

    mutable std::mutex mtx_;
    TraceCallbacks callbacks_;
    TaskLauncher launcher_;
    std::shared_ptr<TraceSession> session_;
    bool running_{false};
};

} // namespace pingwatch
