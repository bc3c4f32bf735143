#include "harness.hpp"
#include "pingwatch/monitor_session.hpp"
#include "pingwatch/probe_loop.hpp"

#include <atomic>
#include <chrono>
#include <deque>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <vector>

#include <unistd.h>

using namespace pingwatch;
using std::chrono::milliseconds;

/**
 * Prober replaying a per-address script of RTTs; -1 is a timeout,
 * -2 throws a std::exception, -3 throws a plain int. Past the end of a
 * script the last entry repeats.
 */
class ScriptedProber : public Prober {
public:
    void script(const std::string& addr, std::deque<long> rtts) {
        std::lock_guard<std::mutex> lk(mtx_);
        scripts_[addr] = std::move(rtts);
    }

    PingProbeResult probe(const std::string& address, int, const CancelToken&) override {
        long rtt = 10;
        {
            std::lock_guard<std::mutex> lk(mtx_);
            ++calls_;
            auto& q = scripts_[address];
            if (!q.empty()) {
                rtt = q.front();
                if (q.size() > 1) q.pop_front();
            }
        }
        if (rtt == -2) throw std::runtime_error("socket exploded");
        if (rtt == -3) throw 42;

        PingProbeResult r;
        r.address = address;
        if (rtt < 0) {
            r.error_msg = "Timeout";
            return r;
        }
        r.success = true;
        r.rtt_ms = rtt;
        return r;
    }

    int calls() const {
        std::lock_guard<std::mutex> lk(mtx_);
        return calls_;
    }

private:
    mutable std::mutex mtx_;
    std::map<std::string, std::deque<long>> scripts_;
    int calls_{0};
};

/**
 * Prober that blocks until cancelled, like a probe waiting on a long timeout.
 */
class BlockingProber : public Prober {
public:
    PingProbeResult probe(const std::string& address, int, const CancelToken& cancel) override {
        cancel.wait_for(milliseconds(60000));
        PingProbeResult r;
        r.address = address;
        r.cancelled = true;
        return r;
    }
};

static bool wait_until(const std::function<bool()>& pred, int timeout_ms = 3000) {
    auto until = std::chrono::steady_clock::now() + milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < until) {
        if (pred()) return true;
        std::this_thread::sleep_for(milliseconds(5));
    }
    return pred();
}

static TargetSpec spec(const std::string& addr) {
    TargetSpec s;
    s.address = addr;
    return s;
}


bool test_no_valid_targets() {
    MonitorSession session(std::make_shared<ScriptedProber>());
    CommandResult r = session.start_monitoring({spec(""), spec("   ")}, 10, 100);
    EXPECT(!r.ok);
    EXPECT(r.error_msg == "No valid targets to monitor");
    EXPECT(session.state() == SessionState::Idle);
    return true;
}

bool test_blank_targets_skipped_and_numbered() {
    auto prober = std::make_shared<ScriptedProber>();
    MonitorSession session(prober);
    CommandResult r = session.start_monitoring({spec(" 10.0.0.1 "), spec(""), spec("10.0.0.2")}, 10, 100);
    EXPECT(r.ok);
    EXPECT(session.state() == SessionState::Running);

    auto snap = session.snapshot();
    EXPECT(snap.size() == 2);
    EXPECT(snap[0].sequence == 1 && snap[0].address == "10.0.0.1");
    EXPECT(snap[1].sequence == 2 && snap[1].address == "10.0.0.2");

    session.stop_monitoring();
    EXPECT(session.state() == SessionState::Stopped);
    EXPECT(session.stopped_at().has_value());
    return true;
}

bool test_disruption_through_loop() {
    auto prober = std::make_shared<ScriptedProber>();
    prober->script("a", {10, 20, 10, 20, 10, -1, -1, -1, 15});

    std::atomic<int> created{0};
    ProbeCallbacks cb;
    cb.on_disruption = [&created](const DisruptionEvent&, bool is_new) {
        if (is_new) ++created;
    };

    MonitorSession session(prober);
    session.set_callbacks(cb);
    EXPECT(session.start_monitoring({spec("a")}, 1, 100).ok);

    EXPECT(wait_until([&] { return session.snapshot()[0].send_count >= 10; }));
    session.stop_monitoring();

    EXPECT(created == 1);
    auto events = session.log().snapshot();
    EXPECT(events.size() == 1);
    EXPECT(events[0].failure_count == 3);
    EXPECT(events[0].pre_down.jitter_max_min_ms == 10);
    EXPECT(events[0].post_recovery.min_ms == 15);
    EXPECT(events[0].post_recovery.max_ms == 15);

    // Stopped data stays readable
    auto t = session.snapshot()[0];
    EXPECT(t.fail_count == 3);
    EXPECT(t.status == TargetStatus::Up);
    return true;
}

bool test_exception_is_failed_probe() {
    auto prober = std::make_shared<ScriptedProber>();
    prober->script("boom", {-2});

    MonitorSession session(prober);
    EXPECT(session.start_monitoring({spec("boom")}, 1, 100).ok);
    EXPECT(wait_until([&] { return session.snapshot()[0].fail_count >= 3; }));
    session.stop_monitoring();

    auto t = session.snapshot()[0];
    EXPECT(t.status == TargetStatus::Down);
    EXPECT(t.fail_count == t.send_count);
    return true;
}

bool test_non_std_throw_counts_as_failure() {
    auto prober = std::make_shared<ScriptedProber>();
    prober->script("odd", {-3});

    MonitorSession session(prober);
    EXPECT(session.start_monitoring({spec("odd")}, 1, 100).ok);
    EXPECT(wait_until([&] { return session.snapshot()[0].fail_count >= 3; }));
    session.stop_monitoring();

    auto t = session.snapshot()[0];
    EXPECT(t.status == TargetStatus::Down);
    EXPECT(t.fail_count == t.send_count);
    return true;
}

bool test_restart_resets_everything() {
    auto prober = std::make_shared<ScriptedProber>();
    prober->script("a", {-1, 10});

    MonitorSession session(prober);
    EXPECT(session.start_monitoring({spec("a")}, 1, 100).ok);
    EXPECT(wait_until([&] { return session.log().size() >= 1; }));
    session.stop_monitoring();
    EXPECT(session.log().size() == 1);

    prober->script("b", {10});
    EXPECT(session.start_monitoring({spec("b")}, 1, 100).ok);
    auto snap = session.snapshot();
    EXPECT(snap.size() == 1);
    EXPECT(snap[0].address == "b");
    EXPECT(session.log().size() == 0);
    session.stop_monitoring();
    return true;
}

bool test_reset_target_and_all() {
    auto prober = std::make_shared<ScriptedProber>();
    MonitorSession session(prober);
    EXPECT(session.start_monitoring({spec("a"), spec("b")}, 1, 100).ok);
    EXPECT(wait_until([&] { return session.snapshot()[1].send_count >= 3; }));
    session.stop_monitoring();

    EXPECT(session.reset_target(2));
    EXPECT(!session.reset_target(42));
    auto snap = session.snapshot();
    EXPECT(snap[0].send_count >= 3);
    EXPECT(snap[1].send_count == 0);

    session.reset_all();
    EXPECT(session.state() == SessionState::Idle);
    EXPECT(session.snapshot()[0].send_count == 0);
    EXPECT(!session.started_at().has_value());
    return true;
}

bool test_stop_is_prompt() {
    MonitorSession session(std::make_shared<BlockingProber>());
    EXPECT(session.start_monitoring({spec("a"), spec("b"), spec("c")}, 1000, 60000).ok);
    std::this_thread::sleep_for(milliseconds(50));

    auto begin = std::chrono::steady_clock::now();
    session.stop_monitoring();
    auto took = std::chrono::steady_clock::now() - begin;

    EXPECT(took < milliseconds(1000));
    // A probe abandoned on cancellation is not recorded
    for (const auto& t : session.snapshot())
        EXPECT(t.send_count == 0);
    return true;
}

bool test_long_interval_cancelled() {
    auto prober = std::make_shared<ScriptedProber>();
    MonitorSession session(prober);
    EXPECT(session.start_monitoring({spec("a")}, 60000, 100).ok);
    EXPECT(wait_until([&] { return prober->calls() >= 1; }));

    auto begin = std::chrono::steady_clock::now();
    session.stop_monitoring();
    EXPECT(std::chrono::steady_clock::now() - begin < milliseconds(1000));
    EXPECT(session.snapshot()[0].send_count == 1);
    return true;
}

bool test_concurrent_commands() {
    auto prober = std::make_shared<ScriptedProber>();
    MonitorSession session(prober);
    const std::vector<TargetSpec> list{spec("a"), spec("b"), spec("c")};

    for (int round = 0; round < 50; ++round) {
        std::atomic<int> started{0};
        std::thread t1([&] { if (session.start_monitoring(list, 1, 10).ok) ++started; });
        std::thread t2([&] { if (session.start_monitoring(list, 1, 10).ok) ++started; });
        t1.join();
        t2.join();

        EXPECT(started == 2);
        EXPECT(session.state() == SessionState::Running);
        auto snap = session.snapshot();
        EXPECT(snap.size() == 3);
        EXPECT(snap[0].sequence == 1 && snap[2].sequence == 3);
    }

    std::thread starter([&] {
        for (int i = 0; i < 20; ++i)
            session.start_monitoring(list, 1, 10);
    });
    std::thread stopper([&] {
        for (int i = 0; i < 20; ++i) {
            session.stop_monitoring();
            session.reset_all();
        }
    });
    starter.join();
    stopper.join();

    session.stop_monitoring();
    EXPECT(session.state() != SessionState::Running);
    return true;
}

bool test_diag_log_records_session() {
    namespace fs = std::filesystem;
    const fs::path file = fs::temp_directory_path() /
                          ("pingwatch_diag_" + std::to_string(::getpid()) + ".log");
    fs::remove(file);

    {
        DiagLogger diag(file.string());
        EXPECT(diag.ok());

        auto prober = std::make_shared<ScriptedProber>();
        prober->script("a", {-1, 10});
        MonitorSession session(prober, &diag);
        EXPECT(session.start_monitoring({spec("a")}, 1, 100).ok);
        EXPECT(wait_until([&] { return session.log().size() >= 1; }));
        session.stop_monitoring();
        EXPECT(diag.entries() >= 3);
    }

    std::ifstream in(file);
    std::stringstream ss;
    ss << in.rdbuf();
    const std::string text = ss.str();
    fs::remove(file);

    EXPECT(text.rfind(">>> pingwatch pid ", 0) == 0);
    EXPECT(text.find(" +0.") != std::string::npos);
    EXPECT(text.find("monitoring started: 1 targets") != std::string::npos);
    EXPECT(text.find("recovered a after") != std::string::npos);
    EXPECT(text.find("<<< pingwatch pid ") != std::string::npos);
    EXPECT(text.find(" entries\n") != std::string::npos);
    return true;
}

bool test_probe_loop_with_injected_clock() {
    auto prober = std::make_shared<ScriptedProber>();
    prober->script("a", {-1, -1, 7});

    DisruptionEventLog log;
    MonitorTarget target(1, spec("a"), 1, 100);
    CancelSource cancel;

    std::chrono::system_clock::time_point fake{std::chrono::seconds(1000)};
    Clock clock = [&fake] {
        auto now = fake;
        fake += std::chrono::seconds(2);
        return now;
    };

    ProbeCallbacks cb;
    cb.on_disruption = [&cancel](const DisruptionEvent&, bool created) {
        if (created) cancel.cancel();
    };

    long n = run_probe_loop(target, *prober, log, cancel.token(), cb, clock);
    EXPECT(n == 3);
    auto events = log.snapshot();
    EXPECT(events.size() == 1);
    EXPECT(events[0].duration == std::chrono::milliseconds(4000));
    EXPECT(events[0].duration_text == "00:00:04");
    return true;
}

int main() {
    std::cout << "Running monitor session tests...\n";

    run_test("No valid targets", test_no_valid_targets);
    run_test("Blank targets skipped", test_blank_targets_skipped_and_numbered);
    run_test("Disruption through probe loop", test_disruption_through_loop);
    run_test("Prober exception is a failed probe", test_exception_is_failed_probe);
    run_test("Non-std throw counts as a failure", test_non_std_throw_counts_as_failure);
    run_test("Restart resets everything", test_restart_resets_everything);
    run_test("Reset target / reset all", test_reset_target_and_all);
    run_test("Stop cancels pending probes", test_stop_is_prompt);
    run_test("Stop cancels the interval wait", test_long_interval_cancelled);
    run_test("Concurrent start / stop / reset", test_concurrent_commands);
    run_test("Diagnostic log records the session", test_diag_log_records_session);
    run_test("Probe loop with injected clock", test_probe_loop_with_injected_clock);

    return finish_tests("Monitor session tests");
}
