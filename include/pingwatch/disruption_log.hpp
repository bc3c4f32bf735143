#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "pingwatch/statistics.hpp"

namespace pingwatch {

/**
 * One disruption episode: a target went Down and came back Up.
 *
 * Created at recovery. post_recovery keeps tracking the live session
 * until the target goes Down again, after which the event is final.
 */
struct DisruptionEvent {
    uint64_t id{0};                                   // Assigned by the log
    std::string address;
    std::string host;
    std::chrono::system_clock::time_point down_start{};
    std::chrono::system_clock::time_point recovery_time{};
    int failure_count{0};                             // Failed probes in the episode
    std::chrono::milliseconds duration{0};
    std::string duration_text;                        // "hh:mm:ss"
    SessionStats pre_down;                            // Session stats at down-start
    SessionStats post_recovery;                       // Live session after recovery
};

/**
 * Closed set of columns the log can be ordered by.
 */
enum class SortField {
    Address,
    Host,
    DownStart,
    RecoveryTime,
    FailureCount,
    Duration,
    PreAvg,
    PreMin,
    PreMax,
    PreJitter1,
    PreJitter2,
    PreStdDev,
    PostAvg,
    PostMin,
    PostMax,
    PostJitter1,
    PostJitter2,
    PostStdDev
};

enum class SortDirection {
    Ascending,
    Descending
};

const char* to_string(SortField field);

/**
 * Inverse of to_string(SortField), e.g. "recovery_time".
 * @return false (out unchanged) for an unknown name.
 */
bool parse_sort_field(const std::string& name, SortField& out);

/**
 * Shared, append-only collection of disruption events.
 *
 * Every member is safe to call from any thread; probe loops append and
 * update concurrently while the front end sorts and snapshots.
 */
class DisruptionEventLog {
public:
    /**
     * Store a new event and return its id. The id field of `ev` is ignored.
     */
    uint64_t append(DisruptionEvent ev);

    /**
     * Overwrite the post-recovery statistics of an open event.
     * @return false if the id is unknown (e.g. the log was cleared).
     */
    bool update_post_recovery(uint64_t id, const SessionStats& stats);

    std::optional<DisruptionEvent> find(uint64_t id) const;

    /** Stable sort by one field. */
    void sort_by(SortField field, SortDirection direction);

    /**
     * Column-header click semantics: the same field flips the current
     * direction, a different field starts ascending.
     * @return the direction that was applied.
     */
    SortDirection toggle_sort(SortField field);

    /** Copy of all events in current order. */
    std::vector<DisruptionEvent> snapshot() const;

    size_t size() const;

    /** Bulk reset; also forgets the sort state. */
    void clear();

    std::optional<SortField> sort_field() const;
    SortDirection sort_direction() const;

private:
    void sort_locked(SortField field, SortDirection direction);

    mutable std::mutex mtx_;
    std::vector<std::unique_ptr<DisruptionEvent>> events_;
    std::unordered_map<uint64_t, DisruptionEvent*> by_id_;
    uint64_t next_id_{1};
    std::optional<SortField> sort_field_;
    SortDirection sort_direction_{SortDirection::Ascending};
};

} // namespace pingwatch
