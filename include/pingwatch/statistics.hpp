#pragma once

namespace pingwatch {

/**
 * Latency statistics of one up-session.
 *
 * jitter_max_min is "Jitter1" (max - min); jitter_pair_avg is "Jitter2",
 * the mean absolute difference between consecutive successful RTTs.
 */
struct SessionStats {
    long   count{0};                   // Successful probes in the session
    double avg_ms{0.0};
    long   min_ms{0};
    long   max_ms{0};
    long   jitter_max_min_ms{0};
    double jitter_pair_avg_ms{0.0};
    double stddev_ms{0.0};             // Population standard deviation
};

bool operator==(const SessionStats& a, const SessionStats& b);
inline bool operator!=(const SessionStats& a, const SessionStats& b) { return !(a == b); }

/**
 * Rolling accumulator behind SessionStats.
 *
 * Keeps only running sums, so the cost per sample is constant regardless
 * of how long a target stays up.
 */
class StatisticsAccumulator {
public:
    void add(long rtt_ms);

    /** Forget every sample (used on recovery). */
    void reset();

    /** Drop the previous-RTT link so the pair jitter does not span a gap. */
    void break_chain() { previous_rtt_ = -1; }

    SessionStats stats() const;

    long count() const { return count_; }
    bool has_previous() const { return previous_rtt_ >= 0; }

private:
    long count_{0};
    long long sum_{0};
    double sum_squares_{0.0};
    long min_{0};
    long max_{0};
    long previous_rtt_{-1};
    long long jitter_diff_sum_{0};
    long jitter_diff_count_{0};
};

} // namespace pingwatch
