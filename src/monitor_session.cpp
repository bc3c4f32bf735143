#include "pingwatch/monitor_session.hpp"

#include <algorithm>
#include <cctype>
#include <system_error>
#include <utility>

namespace pingwatch {

namespace {

std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

} // namespace


const char* to_string(SessionState state) {
    switch (state) {
    case SessionState::Idle:    return "Idle";
    case SessionState::Running: return "Running";
    case SessionState::Stopped: return "Stopped";
    }
    return "Idle";
}


MonitorSession::MonitorSession(std::shared_ptr<Prober> prober, DiagLogger* diag)
    : prober_(std::move(prober)), diag_(diag) {}

MonitorSession::~MonitorSession() {
    stop_monitoring();
}

void MonitorSession::set_callbacks(ProbeCallbacks callbacks) {
    std::lock_guard<std::mutex> lk(mtx_);
    callbacks_ = std::move(callbacks);
}

void MonitorSession::set_clock(Clock clock) {
    std::lock_guard<std::mutex> lk(mtx_);
    clock_ = std::move(clock);
}

std::chrono::system_clock::time_point MonitorSession::now() const {
    return clock_ ? clock_() : std::chrono::system_clock::now();
}


// ============================================================================
// Start / stop
// ============================================================================
CommandResult MonitorSession::start_monitoring(const std::vector<TargetSpec>& targets,
                                               int interval_ms,
                                               int timeout_ms)
{
    CommandResult result;

    std::vector<TargetSpec> valid;
    for (const auto& t : targets) {
        TargetSpec spec = t;
        spec.address = trim(spec.address);
        spec.host = trim(spec.host);
        if (!spec.address.empty())
            valid.push_back(std::move(spec));
    }

    if (valid.empty()) {
        result.error_msg = "No valid targets to monitor";
        return result;
    }
    if (!prober_) {
        result.error_msg = "No prober configured";
        return result;
    }

    std::lock_guard<std::mutex> cmd(cmd_mtx_);

    // A new run never inherits anything from the previous one
    stop_running();
    log_.clear();

    std::unique_lock<std::mutex> lk(mtx_);

    interval_ms_ = std::max(1, interval_ms);
    timeout_ms_ = std::max(1, timeout_ms);

    targets_.clear();
    int seq = 1;
    for (auto& spec : valid)
        targets_.push_back(std::make_unique<MonitorTarget>(seq++, std::move(spec),
                                                           interval_ms_, timeout_ms_));

    cancel_ = std::make_unique<CancelSource>();
    CancelToken token = cancel_->token();

    Clock clock = clock_ ? clock_ : Clock{};
    try {
        for (auto& target : targets_) {
            MonitorTarget* t = target.get();
            tasks_.emplace(t->sequence(), std::thread([this, t, token, clock] {
                run_probe_loop(*t, *prober_, log_, token, callbacks_, clock, diag_);
            }));
        }
    } catch (const std::system_error& e) {
        // Unwind the loops already launched; callbacks may query the session
        std::map<int, std::thread> launched;
        launched.swap(tasks_);
        std::unique_ptr<CancelSource> cancel = std::move(cancel_);
        lk.unlock();

        cancel->cancel();
        for (auto& kv : launched)
            kv.second.join();

        diag_log(diag_, std::string("monitoring start failed: ") + e.what());
        result.error_msg = std::string("Failed to start probe threads: ") + e.what();
        return result;
    }

    state_ = SessionState::Running;
    started_at_ = now();
    stopped_at_.reset();

    diag_log(diag_, "monitoring started: " + std::to_string(targets_.size()) +
                    " targets, interval=" + std::to_string(interval_ms_) +
                    "ms, timeout=" + std::to_string(timeout_ms_) + "ms");

    result.ok = true;
    return result;
}


void MonitorSession::stop_monitoring() {
    std::lock_guard<std::mutex> cmd(cmd_mtx_);
    stop_running();
}


void MonitorSession::stop_running() {
    std::unique_ptr<CancelSource> cancel;
    std::map<int, std::thread> tasks;

    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (state_ != SessionState::Running) return;
        cancel = std::move(cancel_);
        tasks.swap(tasks_);
    }

    // Join outside the lock; loops never take mtx_ but snapshots do
    cancel->cancel();
    for (auto& kv : tasks) {
        if (kv.second.joinable())
            kv.second.join();
    }

    std::lock_guard<std::mutex> lk(mtx_);
    state_ = SessionState::Stopped;
    stopped_at_ = now();

    diag_log(diag_, "monitoring stopped, " + std::to_string(log_.size()) +
                    " disruption events");
}


// ============================================================================
// Reset
// ============================================================================
bool MonitorSession::reset_target(int sequence) {
    std::lock_guard<std::mutex> lk(mtx_);
    for (auto& t : targets_) {
        if (t->sequence() == sequence) {
            t->reset();
            return true;
        }
    }
    return false;
}


void MonitorSession::reset_all() {
    std::lock_guard<std::mutex> cmd(cmd_mtx_);
    stop_running();

    std::lock_guard<std::mutex> lk(mtx_);
    for (auto& t : targets_)
        t->reset();
    log_.clear();

    state_ = SessionState::Idle;
    started_at_.reset();
    stopped_at_.reset();

    diag_log(diag_, "all targets reset");
}


// ============================================================================
// Queries
// ============================================================================
SessionState MonitorSession::state() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return state_;
}

std::vector<TargetSnapshot> MonitorSession::snapshot() const {
    std::lock_guard<std::mutex> lk(mtx_);
    std::vector<TargetSnapshot> out;
    out.reserve(targets_.size());
    for (const auto& t : targets_)
        out.push_back(t->snapshot());
    return out;
}

CancelToken MonitorSession::token() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return cancel_ ? cancel_->token() : CancelToken{};
}

std::optional<std::chrono::system_clock::time_point> MonitorSession::started_at() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return started_at_;
}

std::optional<std::chrono::system_clock::time_point> MonitorSession::stopped_at() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return stopped_at_;
}

int MonitorSession::interval_ms() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return interval_ms_;
}

int MonitorSession::timeout_ms() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return timeout_ms_;
}

} // namespace pingwatch
