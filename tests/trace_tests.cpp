#include "harness.hpp"
#include "pingwatch/limiter.hpp"
#include "pingwatch/trace_executor.hpp"
#include "pingwatch/trace_orchestrator.hpp"
#include "pingwatch/trace_session.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <set>
#include <system_error>
#include <thread>

using namespace pingwatch;
using std::chrono::milliseconds;

static bool wait_until(const std::function<bool()>& pred, int timeout_ms = 5000) {
    auto until = std::chrono::steady_clock::now() + milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < until) {
        if (pred()) return true;
        std::this_thread::sleep_for(milliseconds(5));
    }
    return pred();
}

static int count_of(const std::string& text, const std::string& needle) {
    int n = 0;
    for (size_t pos = text.find(needle); pos != std::string::npos;
         pos = text.find(needle, pos + needle.size()))
        ++n;
    return n;
}

/**
 * Fake executor: emits two hop lines, sleeps, and tracks how many
 * executions overlap.
 */
class CountingExecutor : public TraceExecutor {
public:
    explicit CountingExecutor(int work_ms) : work_ms_(work_ms) {}

    TraceOutcome execute(const TraceRequest& req, const CancelToken& cancel,
                         const LineSink& sink) override {
        int now = ++active_;
        int seen = peak_.load();
        while (now > seen && !peak_.compare_exchange_weak(seen, now)) {}
        {
            std::lock_guard<std::mutex> lk(mtx_);
            hop_timeouts_.insert(req.hop_timeout_ms);
        }

        sink(" 1  192.0.2.254  1.0 ms");
        bool cancelled = cancel.wait_for(milliseconds(work_ms_));
        if (!cancelled) sink(" 2  " + req.address + "  2.0 ms");

        --active_;
        return cancelled ? TraceOutcome::Cancelled : TraceOutcome::Completed;
    }

    int peak() const { return peak_.load(); }
    std::set<int> hop_timeouts() {
        std::lock_guard<std::mutex> lk(mtx_);
        return hop_timeouts_;
    }

private:
    const int work_ms_;
    std::atomic<int> active_{0};
    std::atomic<int> peak_{0};
    std::mutex mtx_;
    std::set<int> hop_timeouts_;
};

/**
 * Addresses starting with "fast" finish at once; the rest run until
 * cancelled.
 */
class SplitExecutor : public TraceExecutor {
public:
    TraceOutcome execute(const TraceRequest& req, const CancelToken& cancel,
                         const LineSink& sink) override {
        sink("tracing " + req.address);
        if (req.address.rfind("fast", 0) == 0)
            return TraceOutcome::Completed;
        cancel.wait_for(milliseconds(60000));
        return TraceOutcome::Cancelled;
    }
};


// ============================================================================
// Limiter / session
// ============================================================================
bool test_limiter_cancelled_acquire() {
    ConcurrencyLimiter limiter(1);
    CancelSource cancel;
    EXPECT(limiter.acquire(cancel.token()));

    std::atomic<bool> result{true};
    std::thread waiter([&] { result = limiter.acquire(cancel.token()); });
    std::this_thread::sleep_for(milliseconds(30));
    cancel.cancel();
    waiter.join();

    EXPECT(!result);
    EXPECT(limiter.in_use() == 1);
    limiter.release();
    EXPECT(limiter.in_use() == 0);
    EXPECT(limiter.peak() == 1);
    return true;
}

bool test_session_single_trailer() {
    TraceSession session({"a", "b", "a", " ", "c"}, 4);
    EXPECT(session.size() == 3);
    EXPECT(session.index_of("c") == 2);
    EXPECT(session.index_of("zzz") == -1);

    EXPECT(session.finish(0, TraceOutcome::Completed));
    session.cancel();
    auto annotated = session.annotate_unfinished();
    EXPECT((annotated == std::vector<std::string>{"b", "c"}));

    // Second stop and the task cleanups add nothing
    EXPECT(session.annotate_unfinished().empty());
    EXPECT(!session.finish(1, TraceOutcome::Cancelled));
    EXPECT(!session.finish(2, TraceOutcome::Completed));
    session.append_line(2, "late output");

    EXPECT(count_of(session.transcript(0), "--- completed ---") == 1);
    EXPECT(count_of(session.transcript(0), "stopped by user") == 0);
    for (size_t i = 1; i < 3; ++i) {
        EXPECT(count_of(session.transcript(i), "--- stopped by user ---") == 1);
        EXPECT(count_of(session.transcript(i), "--- completed ---") == 0);
        EXPECT(session.completed(i));
        EXPECT(session.stop_annotated(i));
    }
    EXPECT(count_of(session.transcript(2), "late output") == 0);
    return true;
}


// ============================================================================
// Orchestrator
// ============================================================================
bool test_concurrency_capped() {
    auto exec = std::make_shared<CountingExecutor>(80);
    TraceOrchestrator orch(exec);

    std::vector<std::string> addrs = {"a1", "a2", "a3", "a4", "a5", "a6"};
    CommandResult r = orch.run_trace(addrs);
    EXPECT(r.ok);
    EXPECT(exec->peak() <= 4);
    EXPECT(exec->peak() >= 2);

    auto session = orch.last_session();
    EXPECT(session->limiter().peak() <= 4);
    EXPECT(session->all_completed());
    for (size_t i = 0; i < session->size(); ++i) {
        const std::string text = session->transcript(i);
        EXPECT(count_of(text, "--- completed ---") == 1);
        EXPECT(count_of(text, "=== trace run started") == 1);
        EXPECT(count_of(text, "=== trace run finished") == 1);
        EXPECT(count_of(text, "--- traceroute " + session->address(i) + " (timeout=2000ms, no-resolve=true) ---") == 1);
        // Trailer comes after the last hop, end banner after the trailer
        EXPECT(text.find("--- completed ---") > text.find(" 2  " + session->address(i)));
        EXPECT(text.find("=== trace run finished") > text.find("--- completed ---"));
    }
    return true;
}

bool test_stop_with_two_completed() {
    auto exec = std::make_shared<SplitExecutor>();
    TraceOrchestrator orch(exec);

    std::vector<std::string> addrs = {"fast-1", "slow-1", "fast-2", "slow-2", "slow-3"};
    std::thread runner([&] { orch.run_trace(addrs); });

    EXPECT(wait_until([&] { return orch.last_session() != nullptr; }));
    auto session = orch.last_session();
    EXPECT(wait_until([&] {
        return session->completed(0) && session->completed(2);
    }));

    orch.stop_trace();
    runner.join();
    EXPECT(!orch.running());

    for (size_t i = 0; i < session->size(); ++i) {
        const std::string text = session->transcript(i);
        const bool fast = session->address(i).rfind("fast", 0) == 0;
        if (fast) {
            EXPECT(count_of(text, "--- completed ---") == 1);
            EXPECT(count_of(text, "--- stopped by user ---") == 0);
        } else {
            EXPECT(count_of(text, "--- stopped by user ---") == 1);
            EXPECT(count_of(text, "--- completed ---") == 0);
        }
    }
    return true;
}

bool test_parent_cancellation() {
    auto exec = std::make_shared<SplitExecutor>();
    TraceOrchestrator orch(exec);

    std::vector<std::pair<std::string, TraceAnnotation>> notes;
    std::mutex notes_mtx;
    TraceCallbacks cb;
    cb.on_annotation = [&](const std::string& addr, TraceAnnotation a) {
        std::lock_guard<std::mutex> lk(notes_mtx);
        notes.emplace_back(addr, a);
    };
    orch.set_callbacks(cb);

    CancelSource monitoring;
    TraceOptions opts;
    opts.max_concurrency = 1;
    std::thread runner([&] { orch.run_trace({"slow-a", "slow-b", "slow-c"}, opts, monitoring.token()); });

    EXPECT(wait_until([&] { return orch.running(); }));
    std::this_thread::sleep_for(milliseconds(50));
    monitoring.cancel();
    runner.join();

    std::lock_guard<std::mutex> lk(notes_mtx);
    EXPECT(notes.size() == 3);
    for (const auto& n : notes)
        EXPECT(n.second == TraceAnnotation::StoppedByUser);
    return true;
}

bool test_hop_timeout_floor() {
    auto exec = std::make_shared<CountingExecutor>(1);
    TraceOrchestrator orch(exec);

    TraceOptions opts;
    opts.timeout_ms = 20;
    EXPECT(orch.run_trace({"a"}, opts).ok);
    opts.timeout_ms = 1500;
    EXPECT(orch.run_trace({"b"}, opts).ok);

    EXPECT((exec->hop_timeouts() == std::set<int>{100, 1500}));
    return true;
}

bool test_rejected_runs() {
    auto exec = std::make_shared<SplitExecutor>();
    TraceOrchestrator orch(exec);

    CommandResult empty = orch.run_trace({});
    EXPECT(!empty.ok);
    EXPECT(empty.error_msg == "No addresses selected for tracing");

    std::thread runner([&] { orch.run_trace({"slow-x"}); });
    EXPECT(wait_until([&] { return orch.running(); }));
    CommandResult second = orch.run_trace({"slow-y"});
    EXPECT(!second.ok);

    orch.stop_trace();
    runner.join();
    return true;
}

bool test_thread_start_failure() {
    auto exec = std::make_shared<SplitExecutor>();
    TraceOrchestrator orch(exec);

    int launched = 0;
    orch.set_task_launcher([&launched](std::function<void()> task) -> std::thread {
        if (++launched > 2)
            throw std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again));
        return std::thread(std::move(task));
    });

    CommandResult r = orch.run_trace({"slow-1", "slow-2", "slow-3", "slow-4"});
    EXPECT(!r.ok);
    EXPECT(r.error_msg.rfind("Failed to start trace tasks", 0) == 0);
    EXPECT(!orch.running());

    auto session = orch.last_session();
    EXPECT(session->all_completed());
    for (size_t i = 0; i < session->size(); ++i) {
        const std::string text = session->transcript(i);
        EXPECT(count_of(text, "--- stopped by user ---") == 1);
        EXPECT(count_of(text, "--- completed ---") == 0);
    }

    // The orchestrator accepts the next run
    orch.set_task_launcher({});
    EXPECT(orch.run_trace({"fast-1"}).ok);
    return true;
}


// ============================================================================
// Subprocess executor
// ============================================================================
static std::shared_ptr<SubprocessTraceExecutor> shell(const std::string& script) {
    return std::make_shared<SubprocessTraceExecutor>(
        "/bin/sh", [script](const TraceRequest&) {
            return std::vector<std::string>{"/bin/sh", "-c", script};
        });
}

bool test_default_arguments() {
    SubprocessTraceExecutor exec;
    TraceRequest req;
    req.address = "198.51.100.7";
    req.hop_timeout_ms = 2000;
    EXPECT((exec.build_args(req) ==
            std::vector<std::string>{"traceroute", "-n", "-w", "2", "198.51.100.7"}));

    req.hop_timeout_ms = 100;
    req.no_resolve = false;
    EXPECT((exec.build_args(req) ==
            std::vector<std::string>{"traceroute", "-w", "0.1", "198.51.100.7"}));
    return true;
}

bool test_subprocess_streams_lines() {
    auto exec = shell("echo hop1; echo hop2 >&2; printf 'tail\\r\\n'; printf 'partial'");
    std::vector<std::string> lines;
    CancelSource cancel;

    TraceOutcome out = exec->execute(TraceRequest{}, cancel.token(),
                                     [&lines](const std::string& l) { lines.push_back(l); });
    EXPECT(out == TraceOutcome::Completed);
    EXPECT((lines == std::vector<std::string>{"hop1", "hop2", "tail", "partial"}));
    return true;
}

bool test_subprocess_killed_on_cancel() {
    auto exec = shell("echo started; sleep 30; echo never");
    std::vector<std::string> lines;
    std::mutex mtx;
    CancelSource cancel;

    std::atomic<bool> started{false};
    TraceOutcome out = TraceOutcome::Completed;
    auto begin = std::chrono::steady_clock::now();

    std::thread runner([&] {
        out = exec->execute(TraceRequest{}, cancel.token(), [&](const std::string& l) {
            std::lock_guard<std::mutex> lk(mtx);
            lines.push_back(l);
            started = true;
        });
    });

    EXPECT(wait_until([&] { return started.load(); }));
    cancel.cancel();
    runner.join();

    EXPECT(out == TraceOutcome::Cancelled);
    EXPECT(std::chrono::steady_clock::now() - begin < std::chrono::seconds(5));
    std::lock_guard<std::mutex> lk(mtx);
    EXPECT(std::find(lines.begin(), lines.end(), "never") == lines.end());
    return true;
}

bool test_spawn_failure() {
    auto exec = std::make_shared<SubprocessTraceExecutor>("/nonexistent/pingwatch-no-such-tool");
    TraceOrchestrator orch(exec);

    EXPECT(orch.run_trace({"203.0.113.1"}).ok);
    auto session = orch.last_session();
    const std::string text = session->transcript(0);
    EXPECT(count_of(text, "(trace spawn error") == 1);
    EXPECT(count_of(text, "--- completed ---") == 1);
    return true;
}

bool test_already_cancelled_never_spawns() {
    auto exec = shell("echo should-not-run");
    CancelSource cancel;
    cancel.cancel();
    int lines = 0;
    TraceOutcome out = exec->execute(TraceRequest{}, cancel.token(),
                                     [&lines](const std::string&) { ++lines; });
    EXPECT(out == TraceOutcome::Cancelled);
    EXPECT(lines == 0);
    return true;
}

int main() {
    std::cout << "Running trace tests...\n";

    run_test("Limiter acquire cancelled", test_limiter_cancelled_acquire);
    run_test("Session writes one trailer per address", test_session_single_trailer);
    run_test("Concurrency capped at 4", test_concurrency_capped);
    run_test("Stop with 2 of 5 completed", test_stop_with_two_completed);
    run_test("Parent cancellation stops the run", test_parent_cancellation);
    run_test("Hop timeout floor", test_hop_timeout_floor);
    run_test("Rejected runs", test_rejected_runs);
    run_test("Thread start failure unwinds the run", test_thread_start_failure);
    run_test("Default traceroute arguments", test_default_arguments);
    run_test("Subprocess streams lines", test_subprocess_streams_lines);
    run_test("Subprocess killed on cancel", test_subprocess_killed_on_cancel);
    run_test("Spawn failure", test_spawn_failure);
    run_test("Cancelled before spawn", test_already_cancelled_never_spawns);

    return finish_tests("Trace tests");
}
