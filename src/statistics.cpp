#include "pingwatch/statistics.hpp"

#include <cmath>
#include <cstdlib>

namespace pingwatch {

bool operator==(const SessionStats& a, const SessionStats& b) {
    return a.count == b.count &&
           a.avg_ms == b.avg_ms &&
           a.min_ms == b.min_ms &&
           a.max_ms == b.max_ms &&
           a.jitter_max_min_ms == b.jitter_max_min_ms &&
           a.jitter_pair_avg_ms == b.jitter_pair_avg_ms &&
           a.stddev_ms == b.stddev_ms;
}


void StatisticsAccumulator::add(long rtt_ms) {
    ++count_;
    sum_ += rtt_ms;
    sum_squares_ += static_cast<double>(rtt_ms) * static_cast<double>(rtt_ms);

    if (count_ == 1) {
        min_ = rtt_ms;
        max_ = rtt_ms;
    } else {
        if (rtt_ms < min_) min_ = rtt_ms;
        if (rtt_ms > max_) max_ = rtt_ms;
    }

    // Jitter2: temporal pair difference, only inside one unbroken chain
    if (previous_rtt_ >= 0) {
        jitter_diff_sum_ += std::labs(rtt_ms - previous_rtt_);
        ++jitter_diff_count_;
    }
    previous_rtt_ = rtt_ms;
}


void StatisticsAccumulator::reset() {
    count_ = 0;
    sum_ = 0;
    sum_squares_ = 0.0;
    min_ = 0;
    max_ = 0;
    previous_rtt_ = -1;
    jitter_diff_sum_ = 0;
    jitter_diff_count_ = 0;
}


/**
 * Derived values:
 *  - avg = sum / count
 *  - jitter1 = max - min
 *  - jitter2 = pair-difference sum / pair count (0 with no pairs)
 *  - stddev = sqrt(E[x^2] - avg^2), variance clamped at 0 because the
 *    one-pass form can round slightly below zero
 */
SessionStats StatisticsAccumulator::stats() const {
    SessionStats s;
    s.count = count_;
    if (count_ == 0) return s;

    const double n = static_cast<double>(count_);
    s.avg_ms = static_cast<double>(sum_) / n;
    s.min_ms = min_;
    s.max_ms = max_;
    s.jitter_max_min_ms = max_ - min_;

    if (jitter_diff_count_ > 0)
        s.jitter_pair_avg_ms = static_cast<double>(jitter_diff_sum_) / jitter_diff_count_;

    double variance = sum_squares_ / n - s.avg_ms * s.avg_ms;
    if (variance < 0.0) variance = 0.0;
    s.stddev_ms = std::sqrt(variance);

    return s;
}

} // namespace pingwatch
