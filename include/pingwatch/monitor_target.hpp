#pragma once
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

#include "pingwatch/disruption_log.hpp"
#include "pingwatch/statistics.hpp"

namespace pingwatch {

enum class TargetStatus {
    Unknown,
    Up,
    Down
};

const char* to_string(TargetStatus status);

/**
 * One monitored endpoint as supplied by the user or a target file.
 */
struct TargetSpec {
    std::string address;
    std::string host;
    bool trace{false};              // Selected for path-trace diagnostics
};

/**
 * Immutable copy of everything the front end displays for a target.
 */
struct TargetSnapshot {
    int sequence{0};
    std::string address;
    std::string host;
    bool trace{false};
    int interval_ms{0};
    int timeout_ms{0};

    TargetStatus status{TargetStatus::Unknown};
    std::string status_label;       // "", "OK", "Recovered" or "Down"

    long send_count{0};
    long fail_count{0};
    int  consecutive_fail_count{0};
    long current_rtt_ms{0};

    SessionStats session;

    std::optional<std::chrono::system_clock::time_point> down_since;
    std::chrono::milliseconds current_down_duration{0};
    std::chrono::milliseconds max_disruption_duration{0};
    std::string current_down_text;  // Empty while up
    std::string max_down_text;
    int current_disruption_failure_count{0};

    SessionStats pre_down;
    std::optional<uint64_t> open_event_id;
};

/**
 * Result of feeding one probe outcome into a target.
 * `event` holds a copy of the disruption event that the probe created
 * or updated, if any.
 */
struct ProbeUpdate {
    TargetSnapshot target;
    std::optional<DisruptionEvent> event;
    bool event_created{false};
    bool went_down{false};          // First failure of a new episode
};

/**
 * Reachability state machine and rolling statistics for one endpoint.
 *
 * Unknown -> Up / Down on the first probe; Up <-> Down afterwards.
 * Session statistics cover the successes since the last recovery (or
 * since construction). A recovery appends a DisruptionEvent to the log
 * and the target then keeps that event's post-recovery figures in step
 * with its session until it goes Down again.
 *
 * All members lock an internal mutex; one probe loop writes while the
 * front end takes snapshots.
 */
class MonitorTarget {
public:
    MonitorTarget(int sequence, TargetSpec spec, int interval_ms, int timeout_ms);

    MonitorTarget(const MonitorTarget&) = delete;
    MonitorTarget& operator=(const MonitorTarget&) = delete;

    ProbeUpdate record_success(long rtt_ms,
                               std::chrono::system_clock::time_point now,
                               DisruptionEventLog& log);

    ProbeUpdate record_failure(std::chrono::system_clock::time_point now);

    /**
     * Return to the freshly constructed state, keeping identity and timing.
     */
    void reset();

    TargetSnapshot snapshot() const;

    int sequence() const { return sequence_; }
    const std::string& address() const { return spec_.address; }
    const std::string& host() const { return spec_.host; }
    bool trace_selected() const { return spec_.trace; }
    int interval_ms() const { return interval_ms_; }
    int timeout_ms() const { return timeout_ms_; }

private:
    TargetSnapshot snapshot_locked() const;
    void reset_locked();

    const int sequence_;
    const TargetSpec spec_;
    const int interval_ms_;
    const int timeout_ms_;

    mutable std::mutex mtx_;

    TargetStatus status_{TargetStatus::Unknown};
    bool just_recovered_{false};

    long send_count_{0};
    long fail_count_{0};
    int  consecutive_fail_count_{0};
    long current_rtt_ms_{0};

    StatisticsAccumulator session_;
    SessionStats stats_;

    std::optional<std::chrono::system_clock::time_point> continuous_down_start_;
    std::chrono::milliseconds current_down_duration_{0};
    std::chrono::milliseconds max_disruption_duration_{0};
    int current_disruption_failure_count_{0};

    SessionStats pre_down_;
    std::optional<uint64_t> open_event_;   // Non-owning handle into the log
};

} // namespace pingwatch
