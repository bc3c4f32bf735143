#include "stats.hpp"
#include "terminal.hpp"
#include "pingwatch/util.hpp"

#include <cstdio>
#include <iomanip>
#include <string>

using namespace pingwatch;

static std::string fixed(double v, int decimals) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.*f", decimals, v);
    return buf;
}

// Pad before coloring so ANSI sequences do not break column widths
static std::string cell(const std::string& s, int width) {
    std::string out = s.size() > static_cast<size_t>(width) ? s.substr(0, width) : s;
    out.append(static_cast<size_t>(width) - out.size(), ' ');
    return out;
}

/**
 * Live table layout:
 *
 *   #  status     address          host     sent  fail  cons  down      max down  rtt  avg  min  max  j1  j2  sd
 *
 * Down rows are red, recovered rows yellow; the status column of an
 * unprobed target stays empty.
 */
void print_target_table(const std::vector<TargetSnapshot>& targets,
                        SessionState state,
                        std::optional<std::chrono::system_clock::time_point> started_at,
                        std::ostream& os)
{
    os << term::home_clear();
    os << term::bold() << "pingwatch" << term::reset()
       << "  [" << to_string(state) << "]";
    if (started_at) {
        auto up = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now() - *started_at);
        os << "  since " << format_time(*started_at)
           << " (" << format_duration(up) << ")";
    }
    os << "\n\n";

    os << term::dim()
       << std::setw(3) << "#" << "  "
       << cell("status", 10)
       << cell("address", 18)
       << cell("host", 16)
       << std::setw(7) << "sent"
       << std::setw(7) << "fail"
       << std::setw(6) << "cons"
       << std::setw(10) << "down"
       << std::setw(10) << "max down"
       << std::setw(6) << "rtt"
       << std::setw(8) << "avg"
       << std::setw(6) << "min"
       << std::setw(6) << "max"
       << std::setw(6) << "j1"
       << std::setw(7) << "j2"
       << std::setw(8) << "sd"
       << term::reset() << "\n";

    for (const auto& t : targets) {
        os << std::setw(3) << t.sequence << "  "
           << term::status_color(t.status_label) << cell(t.status_label, 10) << term::reset()
           << cell(t.address, 18)
           << cell(t.host, 16)
           << std::setw(7) << t.send_count
           << std::setw(7) << t.fail_count
           << std::setw(6) << t.consecutive_fail_count
           << std::setw(10) << t.current_down_text
           << std::setw(10) << t.max_down_text
           << std::setw(6) << t.current_rtt_ms
           << std::setw(8) << fixed(t.session.avg_ms, 1)
           << std::setw(6) << t.session.min_ms
           << std::setw(6) << t.session.max_ms
           << std::setw(6) << t.session.jitter_max_min_ms
           << std::setw(7) << fixed(t.session.jitter_pair_avg_ms, 1)
           << std::setw(8) << fixed(t.session.stddev_ms, 2)
           << (t.trace ? term::colorize("  [trace]", term::cyan()) : std::string())
           << "\n";
    }
    os << std::flush;
}


void print_disruption_log(const std::vector<DisruptionEvent>& events, std::ostream& os) {
    os << "\n--- disruption events (" << events.size() << ") ---\n";
    if (events.empty()) {
        os << term::gray() << "none" << term::reset() << "\n";
        return;
    }

    for (const auto& e : events) {
        os << term::yellow() << format_time(e.down_start) << " -> "
           << format_time(e.recovery_time) << term::reset()
           << "  " << e.address;
        if (!e.host.empty()) os << " (" << e.host << ")";
        os << "  down " << e.duration_text
           << ", " << e.failure_count << " failed"
           << "  pre avg/min/max " << fixed(e.pre_down.avg_ms, 1)
           << "/" << e.pre_down.min_ms << "/" << e.pre_down.max_ms
           << "  post avg/min/max " << fixed(e.post_recovery.avg_ms, 1)
           << "/" << e.post_recovery.min_ms << "/" << e.post_recovery.max_ms
           << "\n";
    }
}


/**
 * Closing block per target. Loss is computed over every probe sent;
 * the RTT figures cover the current session only.
 */
void print_summary(const std::vector<TargetSnapshot>& targets, std::ostream& os) {
    for (const auto& t : targets) {
        const long received = t.send_count - t.fail_count;
        const long loss = t.send_count > 0 ? (100 - (received * 100 / t.send_count)) : 100;

        os << "\n--- " << t.address;
        if (!t.host.empty()) os << " (" << t.host << ")";
        os << " ping statistics ---\n";
        os << t.send_count << " packets transmitted, "
           << received << " received, "
           << loss << "% packet loss";
        if (t.max_disruption_duration.count() > 0)
            os << ", longest outage " << t.max_down_text;
        os << "\n";

        if (t.session.count == 0) continue;

        os << "session rtt min/avg/max/mdev/jitter = "
           << t.session.min_ms << "/"
           << fixed(t.session.avg_ms, 1) << "/"
           << t.session.max_ms << "/"
           << fixed(t.session.stddev_ms, 2) << "/"
           << fixed(t.session.jitter_pair_avg_ms, 1) << " ms\n";
    }
}
