#include "pingwatch/monitor_target.hpp"
#include "pingwatch/util.hpp"

#include <utility>

namespace pingwatch {

using std::chrono::duration_cast;
using std::chrono::milliseconds;

const char* to_string(TargetStatus status) {
    switch (status) {
    case TargetStatus::Unknown: return "Unknown";
    case TargetStatus::Up:      return "Up";
    case TargetStatus::Down:    return "Down";
    }
    return "Unknown";
}


MonitorTarget::MonitorTarget(int sequence, TargetSpec spec, int interval_ms, int timeout_ms)
    : sequence_(sequence),
      spec_(std::move(spec)),
      interval_ms_(interval_ms),
      timeout_ms_(timeout_ms) {}


// ============================================================================
// Successful probe
// ============================================================================
ProbeUpdate MonitorTarget::record_success(long rtt_ms,
                                          std::chrono::system_clock::time_point now,
                                          DisruptionEventLog& log)
{
    std::lock_guard<std::mutex> lk(mtx_);
    ProbeUpdate update;

    ++send_count_;
    just_recovered_ = false;

    // ---------------------------------------------------------------
    // Recovery: close the episode and open a new event
    // ---------------------------------------------------------------
    if (status_ == TargetStatus::Down && continuous_down_start_) {
        DisruptionEvent ev;
        ev.address       = spec_.address;
        ev.host          = spec_.host;
        ev.down_start    = *continuous_down_start_;
        ev.recovery_time = now;
        ev.duration      = duration_cast<milliseconds>(now - *continuous_down_start_);
        ev.duration_text = format_duration(ev.duration);
        ev.failure_count = current_disruption_failure_count_;
        ev.pre_down      = pre_down_;

        ev.post_recovery.count  = 1;
        ev.post_recovery.avg_ms = static_cast<double>(rtt_ms);
        ev.post_recovery.min_ms = rtt_ms;
        ev.post_recovery.max_ms = rtt_ms;

        open_event_ = log.append(std::move(ev));
        update.event_created = true;

        session_.reset();
        continuous_down_start_.reset();
        current_disruption_failure_count_ = 0;
        just_recovered_ = true;
    }

    // ---------------------------------------------------------------
    // Session accumulation
    // ---------------------------------------------------------------
    session_.add(rtt_ms);
    stats_ = session_.stats();

    if (open_event_) {
        if (log.update_post_recovery(*open_event_, stats_))
            update.event = log.find(*open_event_);
        else
            open_event_.reset();   // log was cleared underneath us
    }

    status_ = TargetStatus::Up;
    consecutive_fail_count_ = 0;
    current_rtt_ms_ = rtt_ms;
    current_down_duration_ = milliseconds(0);

    update.target = snapshot_locked();
    return update;
}


// ============================================================================
// Failed probe (timeout, transport error and non-success replies alike)
// ============================================================================
ProbeUpdate MonitorTarget::record_failure(std::chrono::system_clock::time_point now) {
    std::lock_guard<std::mutex> lk(mtx_);
    ProbeUpdate update;

    ++send_count_;
    just_recovered_ = false;

    // New episode: freeze the session as it stood before this probe
    if (status_ != TargetStatus::Down) {
        pre_down_ = stats_;
        continuous_down_start_ = now;
        current_disruption_failure_count_ = 0;
        session_.break_chain();
        open_event_.reset();
        update.went_down = true;
    }

    ++fail_count_;
    ++consecutive_fail_count_;
    ++current_disruption_failure_count_;
    current_rtt_ms_ = 0;

    current_down_duration_ = duration_cast<milliseconds>(now - *continuous_down_start_);
    if (current_down_duration_ > max_disruption_duration_)
        max_disruption_duration_ = current_down_duration_;

    status_ = TargetStatus::Down;

    update.target = snapshot_locked();
    return update;
}


void MonitorTarget::reset() {
    std::lock_guard<std::mutex> lk(mtx_);
    reset_locked();
}


void MonitorTarget::reset_locked() {
    status_ = TargetStatus::Unknown;
    just_recovered_ = false;
    send_count_ = 0;
    fail_count_ = 0;
    consecutive_fail_count_ = 0;
    current_rtt_ms_ = 0;
    session_.reset();
    stats_ = SessionStats{};
    continuous_down_start_.reset();
    current_down_duration_ = milliseconds(0);
    max_disruption_duration_ = milliseconds(0);
    current_disruption_failure_count_ = 0;
    pre_down_ = SessionStats{};
    open_event_.reset();
}


TargetSnapshot MonitorTarget::snapshot() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return snapshot_locked();
}


TargetSnapshot MonitorTarget::snapshot_locked() const {
    TargetSnapshot s;
    s.sequence    = sequence_;
    s.address     = spec_.address;
    s.host        = spec_.host;
    s.trace       = spec_.trace;
    s.interval_ms = interval_ms_;
    s.timeout_ms  = timeout_ms_;

    s.status = status_;
    switch (status_) {
    case TargetStatus::Unknown: s.status_label = "";   break;
    case TargetStatus::Up:      s.status_label = just_recovered_ ? "Recovered" : "OK"; break;
    case TargetStatus::Down:    s.status_label = "Down"; break;
    }

    s.send_count             = send_count_;
    s.fail_count             = fail_count_;
    s.consecutive_fail_count = consecutive_fail_count_;
    s.current_rtt_ms         = current_rtt_ms_;
    s.session                = stats_;

    s.down_since              = continuous_down_start_;
    s.current_down_duration   = current_down_duration_;
    s.max_disruption_duration = max_disruption_duration_;
    s.current_down_text = (status_ == TargetStatus::Down)
                        ? format_duration(current_down_duration_) : "";
    s.max_down_text = (max_disruption_duration_.count() > 0 || fail_count_ > 0)
                    ? format_duration(max_disruption_duration_) : "";
    s.current_disruption_failure_count = current_disruption_failure_count_;

    s.pre_down      = pre_down_;
    s.open_event_id = open_event_;
    return s;
}

} // namespace pingwatch
