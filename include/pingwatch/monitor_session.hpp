#pragma once
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "pingwatch/cancel.hpp"
#include "pingwatch/diag_logger.hpp"
#include "pingwatch/disruption_log.hpp"
#include "pingwatch/monitor_target.hpp"
#include "pingwatch/probe_loop.hpp"
#include "pingwatch/prober.hpp"

namespace pingwatch {

enum class SessionState {
    Idle,       // Nothing monitored yet, or cleared
    Running,    // Probe loops active
    Stopped     // Loops joined; results kept until the next start or reset
};

const char* to_string(SessionState state);

/**
 * Outcome of a front-end command. error_msg is set when ok == false.
 */
struct CommandResult {
    bool ok{false};
    std::string error_msg;
};

/**
 * Owns the monitored targets, the disruption log and one probe thread
 * per target.
 *
 * Starting a run discards the previous run's targets, statistics and
 * disruption events. Stopping cancels and joins every probe thread and
 * leaves the results readable.
 *
 * Commands (start, stop, reset_all) may be issued from any thread; they
 * are serialized against each other, queries are not blocked by them.
 */
class MonitorSession {
public:
    explicit MonitorSession(std::shared_ptr<Prober> prober, DiagLogger* diag = nullptr);
    ~MonitorSession();

    MonitorSession(const MonitorSession&) = delete;
    MonitorSession& operator=(const MonitorSession&) = delete;

    /** Must be called while no run is active. */
    void set_callbacks(ProbeCallbacks callbacks);
    void set_clock(Clock clock);

    CommandResult start_monitoring(const std::vector<TargetSpec>& targets,
                                   int interval_ms,
                                   int timeout_ms);
    void stop_monitoring();

    /** @return false if no target has that sequence number. */
    bool reset_target(int sequence);

    /** Stop if running, reset every target, clear the log; state becomes Idle. */
    void reset_all();

    SessionState state() const;
    std::vector<TargetSnapshot> snapshot() const;

    DisruptionEventLog& log() { return log_; }
    const DisruptionEventLog& log() const { return log_; }

    /**
     * Token of the active run (a never-cancelled token when idle),
     * for linking a trace run to this session.
     */
    CancelToken token() const;

    std::optional<std::chrono::system_clock::time_point> started_at() const;
    std::optional<std::chrono::system_clock::time_point> stopped_at() const;
    int interval_ms() const;
    int timeout_ms() const;

private:
    std::chrono::system_clock::time_point now() const;

    // Requires cmd_mtx_
    void stop_running();

    std::shared_ptr<Prober> prober_;
    DiagLogger* diag_;
    ProbeCallbacks callbacks_;
    Clock clock_;

    std::mutex cmd_mtx_;                                // Held for a whole command
    mutable std::mutex mtx_;                            // Guards the fields below
    SessionState state_{SessionState::Idle};
    std::vector<std::unique_ptr<MonitorTarget>> targets_;
    std::map<int, std::thread> tasks_;                  // Keyed by target sequence
    std::unique_ptr<CancelSource> cancel_;
    std::optional<std::chrono::system_clock::time_point> started_at_;
    std::optional<std::chrono::system_clock::time_point> stopped_at_;
    int interval_ms_{0};
    int timeout_ms_{0};

    DisruptionEventLog log_;
};

} // namespace pingwatch
