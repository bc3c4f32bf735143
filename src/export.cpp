#include "export.hpp"
#include "pingwatch/util.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

using namespace pingwatch;

namespace fs = std::filesystem;

static std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

static std::string lower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

/**
 * Create the parent directory of `path` if it has one.
 */
static bool ensure_parent_dir(const std::string& path) {
    fs::path parent = fs::path(path).parent_path();
    if (parent.empty()) return true;
    std::error_code ec;
    fs::create_directories(parent, ec);
    return !ec;
}


// ------------------------------------------------------------
// Target list
// ------------------------------------------------------------

static const char* kTargetHeader = "address,host";

static bool is_comment(const std::string& trimmed) {
    const char c = trimmed[0];
    return c == '[' || c == '#' || c == ';' || c == '\'';
}

/**
 * Split "host[,flag]" of the saved format. A trailing column is only
 * taken as the trace flag when it reads like one; otherwise the comma
 * belongs to the host name.
 */
static void split_host_and_flag(const std::string& rest, std::string& host, bool& trace) {
    trace = false;
    host = trim(rest);

    size_t comma = rest.rfind(',');
    if (comma == std::string::npos) return;

    std::string flag = lower(trim(rest.substr(comma + 1)));
    if (flag == "1" || flag == "true" || flag == "yes" || flag == "trace") {
        trace = true;
        host = trim(rest.substr(0, comma));
    } else if (flag == "0" || flag == "false" || flag == "no") {
        host = trim(rest.substr(0, comma));
    }
}

static std::string collapse_spaces(const std::string& s) {
    std::string out;
    bool in_space = false;
    for (char c : s) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            in_space = true;
            continue;
        }
        if (in_space && !out.empty()) out += ' ';
        in_space = false;
        out += c;
    }
    return out;
}

std::vector<TargetSpec> parse_targets(const std::vector<std::string>& lines) {
    std::vector<TargetSpec> out;
    size_t first = 0;
    bool saved_format = false;

    if (!lines.empty()) {
        std::string header;
        for (char c : trim(lines[0]))
            if (c != ' ') header += c;
        if (lower(header) == kTargetHeader) {
            saved_format = true;
            first = 1;
        }
    }

    for (size_t n = first; n < lines.size(); ++n) {
        std::string line = lines[n];
        if (!line.empty() && line.back() == '\r') line.pop_back();

        const std::string trimmed = trim(line);
        if (trimmed.empty() || is_comment(trimmed)) continue;

        TargetSpec spec;

        if (saved_format) {
            size_t comma = line.find(',');
            spec.address = trim(line.substr(0, comma));
            if (comma != std::string::npos)
                split_host_and_flag(line.substr(comma + 1), spec.host, spec.trace);
        } else {
            // Legacy lists: "<address> <host name...>" or "<address>,<host>"
            size_t sep = std::string::npos;
            for (size_t i = 0; i < line.size(); ++i) {
                if ((line[i] == ' ' || line[i] == '\t') && !trim(line.substr(0, i)).empty()) {
                    sep = i;
                    break;
                }
            }

            if (sep != std::string::npos) {
                spec.address = trim(line.substr(0, sep));
                spec.host = collapse_spaces(trim(line.substr(sep)));
            } else if (line.find(',') != std::string::npos) {
                size_t comma = line.find(',');
                spec.address = trim(line.substr(0, comma));
                spec.host = trim(line.substr(comma + 1));
            } else {
                spec.address = trimmed;
            }
        }

        if (spec.address.empty()) continue;
        out.push_back(std::move(spec));
    }

    return out;
}

bool load_targets(const std::string& path,
                  std::vector<TargetSpec>& out,
                  std::string* error_msg)
{
    std::ifstream f(path);
    if (!f) {
        if (error_msg) *error_msg = "Cannot open target file: " + path;
        return false;
    }

    std::vector<std::string> lines;
    std::string line;
    while (std::getline(f, line))
        lines.push_back(line);

    out = parse_targets(lines);
    return true;
}

bool save_targets(const std::string& path, const std::vector<TargetSpec>& targets) {
    if (!ensure_parent_dir(path)) return false;

    std::ofstream f(path, std::ios::out | std::ios::trunc);
    if (!f) return false;

    f << kTargetHeader << "\n";
    for (const auto& t : targets) {
        if (t.address.empty() && t.host.empty()) continue;
        f << t.address << "," << t.host;
        if (t.trace) f << ",1";
        f << "\n";
    }
    return static_cast<bool>(f);
}


// ------------------------------------------------------------
// Formatting helpers
// ------------------------------------------------------------

static std::string fixed(double v, int decimals) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.*f", decimals, v);
    return buf;
}

static std::string csv_field(const std::string& s) {
    if (s.find_first_of(",\"\n") == std::string::npos) return s;
    std::string out = "\"";
    for (char c : s) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

static std::string json_string(const std::string& s) {
    std::string out = "\"";
    for (char c : s) {
        switch (c) {
        case '"':  out += "\\\""; break;
        case '\\': out += "\\\\"; break;
        case '\n': out += "\\n";  break;
        case '\r': out += "\\r";  break;
        case '\t': out += "\\t";  break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                char buf[8];
                std::snprintf(buf, sizeof(buf), "\\u%04x", c);
                out += buf;
            } else {
                out += c;
            }
        }
    }
    out += '"';
    return out;
}

static std::string opt_time(const std::optional<std::chrono::system_clock::time_point>& tp) {
    return tp ? format_time(*tp) : std::string("-");
}

static std::vector<TargetSnapshot> by_sequence(std::vector<TargetSnapshot> v) {
    std::stable_sort(v.begin(), v.end(), [](const TargetSnapshot& a, const TargetSnapshot& b) {
        return a.sequence < b.sequence;
    });
    return v;
}

static std::vector<DisruptionEvent> by_recovery(std::vector<DisruptionEvent> v) {
    std::stable_sort(v.begin(), v.end(), [](const DisruptionEvent& a, const DisruptionEvent& b) {
        return a.recovery_time < b.recovery_time;
    });
    return v;
}


// ------------------------------------------------------------
// Report: CSV
// ------------------------------------------------------------

static void write_csv_report(std::ofstream& f,
                             const ReportHeader& header,
                             const std::vector<TargetSnapshot>& targets,
                             const std::vector<DisruptionEvent>& events)
{
    f << "================================================================\n";
    f << "Saved: " << format_time(std::chrono::system_clock::now()) << "\n\n";

    f << "Start time : " << opt_time(header.start_time) << "\n";
    f << "End time   : " << opt_time(header.end_time) << "\n";
    f << "Interval   : " << header.interval_ms << " [ms]     "
      << "Timeout : " << header.timeout_ms << " [ms]\n\n";

    f << "--- Monitoring statistics ---\n";
    f << "status,seq,address,host,sent,failed,consecutive_failed,"
         "down_time[hh:mm:ss],max_down_time[hh:mm:ss],rtt[ms],"
         "avg[ms],min[ms],max[ms],jitter1[ms],jitter2[ms],stddev\n";

    for (const auto& t : targets) {
        f << csv_field(t.status_label) << ","
          << t.sequence << ","
          << csv_field(t.address) << ","
          << csv_field(t.host) << ","
          << t.send_count << ","
          << t.fail_count << ","
          << t.consecutive_fail_count << ","
          << t.current_down_text << ","
          << t.max_down_text << ","
          << t.current_rtt_ms << ","
          << fixed(t.session.avg_ms, 1) << ","
          << t.session.min_ms << ","
          << t.session.max_ms << ","
          << t.session.jitter_max_min_ms << ","
          << fixed(t.session.jitter_pair_avg_ms, 1) << ","
          << fixed(t.session.stddev_ms, 2) << "\n";
    }

    f << "\n\n";
    f << "--- Disruption event log ---\n";

    if (events.empty()) {
        f << "No disruption events recorded.\n\n";
        return;
    }

    f << "address,host,down_start,recovery_time,failures,down_time[hh:mm:ss],"
         "pre_avg[ms],pre_min[ms],pre_max[ms],"
         "post_avg[ms],post_min[ms],post_max[ms],"
         "pre_jitter1,pre_jitter2,pre_stddev,"
         "post_jitter1,post_jitter2,post_stddev\n";

    for (const auto& e : events) {
        f << csv_field(e.address) << ","
          << csv_field(e.host) << ","
          << format_time(e.down_start) << ","
          << format_time(e.recovery_time) << ","
          << e.failure_count << ","
          << e.duration_text << ","
          << fixed(e.pre_down.avg_ms, 1) << ","
          << e.pre_down.min_ms << ","
          << e.pre_down.max_ms << ","
          << fixed(e.post_recovery.avg_ms, 1) << ","
          << e.post_recovery.min_ms << ","
          << e.post_recovery.max_ms << ","
          << e.pre_down.jitter_max_min_ms << ","
          << fixed(e.pre_down.jitter_pair_avg_ms, 1) << ","
          << fixed(e.pre_down.stddev_ms, 2) << ","
          << e.post_recovery.jitter_max_min_ms << ","
          << fixed(e.post_recovery.jitter_pair_avg_ms, 1) << ","
          << fixed(e.post_recovery.stddev_ms, 2) << "\n";
    }
    f << "\n";
}


// ------------------------------------------------------------
// Report: JSON (one object per line)
// ------------------------------------------------------------

static std::string json_stats(const SessionStats& s) {
    std::ostringstream o;
    o << "{"
      << "\"count\":" << s.count << ","
      << "\"avg\":" << fixed(s.avg_ms, 1) << ","
      << "\"min\":" << s.min_ms << ","
      << "\"max\":" << s.max_ms << ","
      << "\"jitter1\":" << s.jitter_max_min_ms << ","
      << "\"jitter2\":" << fixed(s.jitter_pair_avg_ms, 1) << ","
      << "\"stddev\":" << fixed(s.stddev_ms, 2)
      << "}";
    return o.str();
}

static void write_json_report(std::ofstream& f,
                              const ReportHeader& header,
                              const std::vector<TargetSnapshot>& targets,
                              const std::vector<DisruptionEvent>& events)
{
    f << "{"
      << "\"saved\":" << json_string(format_time(std::chrono::system_clock::now())) << ","
      << "\"start\":" << json_string(opt_time(header.start_time)) << ","
      << "\"end\":" << json_string(opt_time(header.end_time)) << ","
      << "\"interval_ms\":" << header.interval_ms << ","
      << "\"timeout_ms\":" << header.timeout_ms << ","
      << "\"targets\":[";

    for (size_t i = 0; i < targets.size(); ++i) {
        const auto& t = targets[i];
        if (i) f << ",";
        f << "{"
          << "\"status\":" << json_string(t.status_label) << ","
          << "\"seq\":" << t.sequence << ","
          << "\"address\":" << json_string(t.address) << ","
          << "\"host\":" << json_string(t.host) << ","
          << "\"sent\":" << t.send_count << ","
          << "\"failed\":" << t.fail_count << ","
          << "\"consecutive_failed\":" << t.consecutive_fail_count << ","
          << "\"down_time\":" << json_string(t.current_down_text) << ","
          << "\"max_down_time\":" << json_string(t.max_down_text) << ","
          << "\"rtt\":" << t.current_rtt_ms << ","
          << "\"session\":" << json_stats(t.session)
          << "}";
    }

    f << "],\"events\":[";

    for (size_t i = 0; i < events.size(); ++i) {
        const auto& e = events[i];
        if (i) f << ",";
        f << "{"
          << "\"address\":" << json_string(e.address) << ","
          << "\"host\":" << json_string(e.host) << ","
          << "\"down_start\":" << json_string(format_time(e.down_start)) << ","
          << "\"recovery_time\":" << json_string(format_time(e.recovery_time)) << ","
          << "\"failures\":" << e.failure_count << ","
          << "\"down_time\":" << json_string(e.duration_text) << ","
          << "\"pre_down\":" << json_stats(e.pre_down) << ","
          << "\"post_recovery\":" << json_stats(e.post_recovery)
          << "}";
    }

    f << "]}\n";
}


bool export_report(const std::string& path,
                   ExportFormat fmt,
                   const ReportHeader& header,
                   const std::vector<TargetSnapshot>& targets,
                   const std::vector<DisruptionEvent>& events)
{
    if (!ensure_parent_dir(path)) return false;

    std::ofstream f(path, std::ios::out | std::ios::app);
    if (!f) return false;

    const auto sorted_targets = by_sequence(targets);
    const auto sorted_events = by_recovery(events);

    if (fmt == ExportFormat::CSV)
        write_csv_report(f, header, sorted_targets, sorted_events);
    else
        write_json_report(f, header, sorted_targets, sorted_events);

    return static_cast<bool>(f);
}


// ------------------------------------------------------------
// Trace transcripts / console logs
// ------------------------------------------------------------

std::string trace_transcript_path(const std::string& folder,
                                  const std::string& address,
                                  const std::string& host,
                                  std::chrono::system_clock::time_point now)
{
    std::string name = "Traceroute_result_" + format_time(now, "%Y%m%d") + "_" +
                       sanitize_file_name(address) + "_" +
                       sanitize_file_name(host) + ".log";
    return (fs::path(folder) / name).string();
}

bool export_trace_transcript(const std::string& folder,
                             const std::string& address,
                             const std::string& host,
                             const std::string& content,
                             std::string* out_path)
{
    if (content.empty()) return true;

    std::error_code ec;
    fs::create_directories(folder, ec);
    if (ec) return false;

    const auto now = std::chrono::system_clock::now();
    const std::string path = trace_transcript_path(folder, address, host, now);

    std::ofstream f(path, std::ios::out | std::ios::app);
    if (!f) return false;

    f << "----------------------------------------------------------------\n";
    f << "Saved: " << format_time(now) << "\n";
    f << content;
    if (content.back() != '\n') f << "\n";
    f << "\n";

    if (out_path) *out_path = path;
    return static_cast<bool>(f);
}

std::string console_log_path(const std::string& folder,
                             const std::string& address,
                             const std::string& host,
                             std::chrono::system_clock::time_point now)
{
    std::string name = "Ping_" + sanitize_file_name(address) + "_" +
                       sanitize_file_name(host) + "_" +
                       format_time(now, "%Y%m%d") + ".log";
    return (fs::path(folder) / name).string();
}

bool append_line(const std::string& path, const std::string& line) {
    if (!ensure_parent_dir(path)) return false;
    std::ofstream f(path, std::ios::out | std::ios::app);
    if (!f) return false;
    f << line << "\n";
    return static_cast<bool>(f);
}
