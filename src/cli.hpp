#pragma once
#include <string>
#include <vector>
#include "export.hpp"

/**
 * Sub-command selected on the command line.
 */
enum class Command {
    None,       // Missing or unknown; main prints usage
    Monitor,
    Trace,
    Console
};

/**
 * Parsed command-line options for the pingwatch executable.
 *
 * Flat and CLI-oriented; the runner maps it onto the library's
 * MonitorSession / TraceOptions / PingOptions.
 */
struct CliOptions {
    Command command{Command::None};

    std::string targets_file;           // monitor: -f FILE
    std::vector<std::string> addresses; // Positional addresses

    int interval_ms{1000};              // Probe interval (min 1)
    int timeout_ms{2000};               // Probe timeout; also drives trace hop timeout
    int refresh_ms{1000};               // Live table redraw period
    int duration_s{0};                  // 0 = until CTRL+C

    std::string save_targets_path;      // monitor: write the target list here
    std::vector<std::string> sort_keys; // monitor: --sort FIELD, repeated = flip direction

    std::string report_path;            // monitor: report file
    ExportFormat report_format{ExportFormat::CSV};

    bool trace{false};                  // monitor: trace flagged targets alongside
    std::string trace_dir;              // Save transcripts here if set
    int jobs{4};                        // Concurrent trace subprocesses
    bool resolve{false};                // trace: resolve hop names

    std::string host;                   // console: display name for the log file
    std::string log_dir{"."};           // console: log folder

    std::string log_path;               // Diagnostic log
    std::string if_name;                // Bind probes to this interface
    bool no_color{false};               // Disable ANSI colors

    std::vector<std::string> errors;    // Values that failed to parse
};

/**
 * Parse all command-line arguments into a CliOptions struct.
 * Invalid flags produce warnings but parsing continues.
 */
CliOptions parse_args(int argc, char** argv);

/**
 * Print usage text to stderr.
 */
void print_usage();
