#include "pingwatch/trace_orchestrator.hpp"
#include "pingwatch/util.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <system_error>
#include <thread>
#include <utility>

namespace pingwatch {

TraceOrchestrator::TraceOrchestrator(std::shared_ptr<TraceExecutor> executor, DiagLogger* diag)
    : executor_(std::move(executor)), diag_(diag) {}

TraceOrchestrator::~TraceOrchestrator() {
    stop_trace();
}

void TraceOrchestrator::set_callbacks(TraceCallbacks callbacks) {
    std::lock_guard<std::mutex> lk(mtx_);
    callbacks_ = std::move(callbacks);
}

void TraceOrchestrator::set_task_launcher(TaskLauncher launcher) {
    std::lock_guard<std::mutex> lk(mtx_);
    launcher_ = std::move(launcher);
}

bool TraceOrchestrator::running() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return running_;
}

std::shared_ptr<TraceSession> TraceOrchestrator::last_session() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return session_;
}


// ============================================================================
// Run
// ============================================================================
CommandResult TraceOrchestrator::run_trace(const std::vector<std::string>& addresses,
                                           const TraceOptions& opts,
                                           const CancelToken& parent)
{
    CommandResult result;
    std::shared_ptr<TraceSession> session;
    TaskLauncher launcher;

    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (running_) {
            result.error_msg = "A trace run is already in progress";
            return result;
        }
        if (!executor_) {
            result.error_msg = "No trace executor configured";
            return result;
        }

        session = std::make_shared<TraceSession>(addresses, opts.max_concurrency,
                                                 parent, callbacks_);
        if (session->size() == 0) {
            result.error_msg = "No addresses selected for tracing";
            return result;
        }

        session_ = session;
        running_ = true;
        launcher = launcher_;
    }

    const auto now = std::chrono::system_clock::now();
    session->broadcast("=== trace run started " + format_time(now) + " (" +
                       std::to_string(session->size()) + " addresses) ===");
    diag_log(diag_, "trace run started, " + std::to_string(session->size()) +
                    " addresses, jobs=" + std::to_string(session->limiter().capacity()));

    std::vector<std::thread> tasks;
    tasks.reserve(session->size());
    try {
        for (size_t i = 0; i < session->size(); ++i) {
            std::function<void()> task = [this, session, i, opts] { run_task(session, i, opts); };
            tasks.push_back(launcher ? launcher(std::move(task)) : std::thread(std::move(task)));
        }
    } catch (const std::system_error& e) {
        // Started tasks unwind on cancel; the others never ran
        session->cancel();
        for (size_t i = tasks.size(); i < session->size(); ++i)
            session->finish(i, TraceOutcome::Cancelled);
        for (auto& t : tasks)
            t.join();

        diag_log(diag_, std::string("trace run aborted: ") + e.what());
        {
            std::lock_guard<std::mutex> lk(mtx_);
            running_ = false;
        }
        result.error_msg = std::string("Failed to start trace tasks: ") + e.what();
        return result;
    }

    session->wait_done();

    // Finalizer: a cancelled run marks whatever has not finished yet
    if (session->cancelled()) {
        for (const auto& a : session->annotate_unfinished())
            diag_log(diag_, "trace stopped by user: " + a);
    }

    for (auto& t : tasks)
        t.join();

    session->broadcast("=== trace run finished " +
                       format_time(std::chrono::system_clock::now()) + " ===");
    diag_log(diag_, std::string("trace run ") +
                    (session->cancelled() ? "cancelled" : "finished") +
                    ", peak concurrency " + std::to_string(session->limiter().peak()));

    {
        std::lock_guard<std::mutex> lk(mtx_);
        running_ = false;
    }

    result.ok = true;
    return result;
}


void TraceOrchestrator::run_task(const std::shared_ptr<TraceSession>& session,
                                 size_t index,
                                 const TraceOptions& opts)
{
    const CancelToken token = session->token();
    const std::string& address = session->address(index);

    if (!session->limiter().acquire(token)) {
        session->finish(index, TraceOutcome::Cancelled);
        return;
    }

    TraceOutcome outcome = TraceOutcome::Completed;
    {
        LimiterSlot slot(session->limiter());

        TraceRequest req;
        req.address = address;
        req.hop_timeout_ms = std::max(opts.min_hop_timeout_ms, opts.timeout_ms);
        req.no_resolve = opts.no_resolve;

        session->append_line(index, "--- traceroute " + address +
                                    " (timeout=" + std::to_string(req.hop_timeout_ms) +
                                    "ms, no-resolve=" + (req.no_resolve ? "true" : "false") +
                                    ") ---");

        try {
            outcome = executor_->execute(req, token, [&session, index](const std::string& line) {
                session->append_line(index, line);
            });
        } catch (const std::exception& e) {
            session->append_line(index, std::string("(trace spawn error: ") + e.what() + ")");
            outcome = TraceOutcome::SpawnFailed;
        }
    }

    if (outcome == TraceOutcome::SpawnFailed)
        diag_log(diag_, "trace spawn failed: " + address);
    else if (outcome == TraceOutcome::Cancelled)
        diag_log(diag_, "trace killed: " + address);

    session->finish(index, outcome);
}


void TraceOrchestrator::stop_trace() {
    std::shared_ptr<TraceSession> session;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (!running_) return;
        session = session_;
    }
    if (!session) return;

    session->cancel();
    for (const auto& a : session->annotate_unfinished())
        diag_log(diag_, "trace stopped by user: " + a);
}

} // namespace pingwatch
