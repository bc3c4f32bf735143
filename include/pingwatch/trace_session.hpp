#pragma once
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include "pingwatch/cancel.hpp"
#include "pingwatch/limiter.hpp"
#include "pingwatch/trace_executor.hpp"

namespace pingwatch {

/**
 * Terminal annotation written at the end of an address's transcript.
 */
enum class TraceAnnotation {
    Completed,
    StoppedByUser
};

/** Trailer line for an annotation, e.g. "--- completed ---". */
const char* trailer_text(TraceAnnotation annotation);

/**
 * Front-end notifications for a trace run. Invoked while the session
 * lock is held, so per-address order matches the transcript; handlers
 * must not call back into the session.
 */
struct TraceCallbacks {
    std::function<void(const std::string& address, const std::string& line)> on_line;
    std::function<void(const std::string& address, TraceAnnotation annotation)> on_annotation;
};

/**
 * State of one trace run: the participating addresses, their output
 * buffers and completion bookkeeping, the cancellation scope and the
 * shared concurrency limiter.
 *
 * Every address ends with exactly one trailer:
 *   - finish() writes "completed" (natural exit or spawn failure) or
 *     "stopped by user" (killed / never started) unless a stop trailer
 *     is already there,
 *   - annotate_unfinished() writes "stopped by user" for every address
 *     that is neither completed nor already annotated.
 * Both check-and-set under the same lock.
 */
class TraceSession {
public:
    /**
     * @param addresses        duplicates and blank entries are dropped
     * @param max_concurrency  limiter capacity (minimum 1)
     * @param parent           cancelling it also cancels this session
     */
    TraceSession(const std::vector<std::string>& addresses,
                 size_t max_concurrency,
                 const CancelToken& parent = {},
                 TraceCallbacks callbacks = {});

    TraceSession(const TraceSession&) = delete;
    TraceSession& operator=(const TraceSession&) = delete;

    size_t size() const { return entries_.size(); }
    const std::string& address(size_t i) const { return entries_.at(i).address; }

    /** @return index of `address`, or -1. */
    int index_of(const std::string& address) const;

    /**
     * Append one line to address i. Dropped once the address has
     * its trailer.
     */
    void append_line(size_t i, const std::string& line);

    /** Append a line to every address, regardless of state. */
    void broadcast(const std::string& line);

    /**
     * Task cleanup for address i. Writes the trailer if none yet and
     * marks the address completed.
     *
     * @return true if this call wrote the trailer.
     */
    bool finish(size_t i, TraceOutcome outcome);

    /**
     * Stop handler / run finalizer.
     * @return addresses that received a "stopped by user" trailer.
     */
    std::vector<std::string> annotate_unfinished();

    void cancel() { cancel_.cancel(); }
    bool cancelled() const { return cancel_.cancelled(); }
    CancelToken token() const { return cancel_.token(); }

    ConcurrencyLimiter& limiter() { return limiter_; }

    /** Block until every address is completed or the session is cancelled. */
    void wait_done();

    bool completed(size_t i) const;
    bool stop_annotated(size_t i) const;
    bool all_completed() const;
    std::string transcript(size_t i) const;

private:
    struct Entry {
        std::string address;
        std::string buffer;
        bool completed{false};          // One-way
        bool stop_annotated{false};     // One-way
        bool trailer_written{false};
    };

    void write_locked(Entry& e, const std::string& line);
    void write_trailer_locked(Entry& e, TraceAnnotation annotation);
    bool all_completed_locked() const;

    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::vector<Entry> entries_;
    TraceCallbacks callbacks_;
    CancelSource cancel_;
    ConcurrencyLimiter limiter_;
};

} // namespace pingwatch
