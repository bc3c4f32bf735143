#include "pingwatch/disruption_log.hpp"

#include <algorithm>
#include <utility>

namespace pingwatch {

namespace {

template <typename T>
int three_way(const T& a, const T& b) {
    if (a < b) return -1;
    if (b < a) return 1;
    return 0;
}

int compare_by(const DisruptionEvent& a, const DisruptionEvent& b, SortField field) {
    switch (field) {
    case SortField::Address:      return three_way(a.address, b.address);
    case SortField::Host:         return three_way(a.host, b.host);
    case SortField::DownStart:    return three_way(a.down_start, b.down_start);
    case SortField::RecoveryTime: return three_way(a.recovery_time, b.recovery_time);
    case SortField::FailureCount: return three_way(a.failure_count, b.failure_count);
    case SortField::Duration:     return three_way(a.duration, b.duration);
    case SortField::PreAvg:       return three_way(a.pre_down.avg_ms, b.pre_down.avg_ms);
    case SortField::PreMin:       return three_way(a.pre_down.min_ms, b.pre_down.min_ms);
    case SortField::PreMax:       return three_way(a.pre_down.max_ms, b.pre_down.max_ms);
    case SortField::PreJitter1:   return three_way(a.pre_down.jitter_max_min_ms, b.pre_down.jitter_max_min_ms);
    case SortField::PreJitter2:   return three_way(a.pre_down.jitter_pair_avg_ms, b.pre_down.jitter_pair_avg_ms);
    case SortField::PreStdDev:    return three_way(a.pre_down.stddev_ms, b.pre_down.stddev_ms);
    case SortField::PostAvg:      return three_way(a.post_recovery.avg_ms, b.post_recovery.avg_ms);
    case SortField::PostMin:      return three_way(a.post_recovery.min_ms, b.post_recovery.min_ms);
    case SortField::PostMax:      return three_way(a.post_recovery.max_ms, b.post_recovery.max_ms);
    case SortField::PostJitter1:  return three_way(a.post_recovery.jitter_max_min_ms, b.post_recovery.jitter_max_min_ms);
    case SortField::PostJitter2:  return three_way(a.post_recovery.jitter_pair_avg_ms, b.post_recovery.jitter_pair_avg_ms);
    case SortField::PostStdDev:   return three_way(a.post_recovery.stddev_ms, b.post_recovery.stddev_ms);
    }
    return 0;
}

} // namespace


const char* to_string(SortField field) {
    switch (field) {
    case SortField::Address:      return "address";
    case SortField::Host:         return "host";
    case SortField::DownStart:    return "down_start";
    case SortField::RecoveryTime: return "recovery_time";
    case SortField::FailureCount: return "failure_count";
    case SortField::Duration:     return "duration";
    case SortField::PreAvg:       return "pre_avg";
    case SortField::PreMin:       return "pre_min";
    case SortField::PreMax:       return "pre_max";
    case SortField::PreJitter1:   return "pre_jitter1";
    case SortField::PreJitter2:   return "pre_jitter2";
    case SortField::PreStdDev:    return "pre_stddev";
    case SortField::PostAvg:      return "post_avg";
    case SortField::PostMin:      return "post_min";
    case SortField::PostMax:      return "post_max";
    case SortField::PostJitter1:  return "post_jitter1";
    case SortField::PostJitter2:  return "post_jitter2";
    case SortField::PostStdDev:   return "post_stddev";
    }
    return "unknown";
}


bool parse_sort_field(const std::string& name, SortField& out) {
    for (int f = static_cast<int>(SortField::Address);
         f <= static_cast<int>(SortField::PostStdDev); ++f)
    {
        if (name == to_string(static_cast<SortField>(f))) {
            out = static_cast<SortField>(f);
            return true;
        }
    }
    return false;
}


uint64_t DisruptionEventLog::append(DisruptionEvent ev) {
    std::lock_guard<std::mutex> lk(mtx_);
    ev.id = next_id_++;

    auto owned = std::make_unique<DisruptionEvent>(std::move(ev));
    by_id_[owned->id] = owned.get();
    events_.push_back(std::move(owned));
    return events_.back()->id;
}


bool DisruptionEventLog::update_post_recovery(uint64_t id, const SessionStats& stats) {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = by_id_.find(id);
    if (it == by_id_.end()) return false;

    it->second->post_recovery = stats;
    return true;
}


std::optional<DisruptionEvent> DisruptionEventLog::find(uint64_t id) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = by_id_.find(id);
    if (it == by_id_.end()) return std::nullopt;
    return *it->second;
}


void DisruptionEventLog::sort_locked(SortField field, SortDirection direction) {
    const bool ascending = (direction == SortDirection::Ascending);

    std::stable_sort(events_.begin(), events_.end(),
        [&](const std::unique_ptr<DisruptionEvent>& a,
            const std::unique_ptr<DisruptionEvent>& b) {
            int c = compare_by(*a, *b, field);
            return ascending ? c < 0 : c > 0;
        });

    sort_field_ = field;
    sort_direction_ = direction;
}


void DisruptionEventLog::sort_by(SortField field, SortDirection direction) {
    std::lock_guard<std::mutex> lk(mtx_);
    sort_locked(field, direction);
}


SortDirection DisruptionEventLog::toggle_sort(SortField field) {
    std::lock_guard<std::mutex> lk(mtx_);

    SortDirection dir = SortDirection::Ascending;
    if (sort_field_ && *sort_field_ == field && sort_direction_ == SortDirection::Ascending)
        dir = SortDirection::Descending;

    sort_locked(field, dir);
    return dir;
}


std::vector<DisruptionEvent> DisruptionEventLog::snapshot() const {
    std::lock_guard<std::mutex> lk(mtx_);
    std::vector<DisruptionEvent> out;
    out.reserve(events_.size());
    for (const auto& ev : events_)
        out.push_back(*ev);
    return out;
}


size_t DisruptionEventLog::size() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return events_.size();
}


void DisruptionEventLog::clear() {
    std::lock_guard<std::mutex> lk(mtx_);
    events_.clear();
    by_id_.clear();
    sort_field_.reset();
    sort_direction_ = SortDirection::Ascending;
}


std::optional<SortField> DisruptionEventLog::sort_field() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return sort_field_;
}


SortDirection DisruptionEventLog::sort_direction() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return sort_direction_;
}

} // namespace pingwatch
