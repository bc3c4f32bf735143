#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "pingwatch/disruption_log.hpp"
#include "pingwatch/monitor_target.hpp"

/**
 * Supported export formats.
 */
enum class ExportFormat {
    CSV,
    JSON
};

/**
 * Run parameters printed at the top of a monitoring report.
 */
struct ReportHeader {
    std::optional<std::chrono::system_clock::time_point> start_time;
    std::optional<std::chrono::system_clock::time_point> end_time;
    int interval_ms{0};
    int timeout_ms{0};
};

// ------------------------------------------------------------
// Target list
// ------------------------------------------------------------

/**
 * Load monitored targets from a text file.
 *
 * Accepts the saved format (header "address,host", then one
 * "address,host[,trace]" per line) as well as legacy lists where
 * address and host name are separated by whitespace or a comma.
 * Blank lines and lines starting with '[', '#', ';' or '\'' are skipped.
 *
 * @return false if the file cannot be opened (error_msg is filled).
 */
bool load_targets(const std::string& path,
                  std::vector<pingwatch::TargetSpec>& out,
                  std::string* error_msg = nullptr);

/**
 * Parse one already-split file. Exposed for callers that read the
 * content themselves.
 */
std::vector<pingwatch::TargetSpec> parse_targets(const std::vector<std::string>& lines);

/**
 * Save targets in the format load_targets() reads back. Entries with
 * both address and host empty are skipped.
 */
bool save_targets(const std::string& path,
                  const std::vector<pingwatch::TargetSpec>& targets);

// ------------------------------------------------------------
// Monitoring report
// ------------------------------------------------------------

/**
 * Append a monitoring report: run header, one row per target (ordered
 * by sequence) and the disruption log ordered by recovery time.
 * Missing parent directories are created.
 */
bool export_report(const std::string& path,
                   ExportFormat fmt,
                   const ReportHeader& header,
                   const std::vector<pingwatch::TargetSnapshot>& targets,
                   const std::vector<pingwatch::DisruptionEvent>& events);

// ------------------------------------------------------------
// Trace transcripts / console logs
// ------------------------------------------------------------

/**
 * "<folder>/Traceroute_result_<yyyymmdd>_<address>_<host>.log"
 */
std::string trace_transcript_path(const std::string& folder,
                                  const std::string& address,
                                  const std::string& host,
                                  std::chrono::system_clock::time_point now);

/**
 * Append one address's trace transcript to its dated file.
 * Empty content writes nothing and returns true.
 *
 * @param out_path  receives the file written, if not null
 */
bool export_trace_transcript(const std::string& folder,
                             const std::string& address,
                             const std::string& host,
                             const std::string& content,
                             std::string* out_path = nullptr);

/**
 * "<folder>/Ping_<address>_<host>_<yyyymmdd>.log"
 */
std::string console_log_path(const std::string& folder,
                             const std::string& address,
                             const std::string& host,
                             std::chrono::system_clock::time_point now);

/**
 * Append one line to a console log file.
 */
bool append_line(const std::string& path, const std::string& line);
