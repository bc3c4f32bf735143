#include "cli.hpp"
#include "pingwatch/disruption_log.hpp"
#include <iostream>
#include <stdexcept>
#include <string>

/**
 * Read an integer flag value. Malformed values are recorded in
 * opt.errors and leave `out` unchanged.
 */
static void parse_int(CliOptions& opt, const std::string& flag,
                      const char* value, int& out, int min_value)
{
    try {
        size_t used = 0;
        int v = std::stoi(value, &used);
        if (used != std::string(value).size())
            throw std::invalid_argument("trailing characters");
        out = v < min_value ? min_value : v;
    } catch (const std::exception&) {
        opt.errors.push_back("Invalid value for " + flag + ": " + value);
    }
}

void print_usage() {
    std::cerr << "Usage:\n"
              << "  pingwatch monitor [-f FILE] [address...] [options]\n"
              << "  pingwatch trace <address...> [options]\n"
              << "  pingwatch console <address> [--host NAME] [--log-dir DIR]\n"
              << "\n"
              << "Monitor options:\n"
              << "  -i, --interval MS     probe interval (default 1000)\n"
              << "  -t, --timeout MS      probe timeout (default 2000)\n"
              << "      --refresh MS      table refresh period (default 1000)\n"
              << "      --duration S      stop after S seconds (default: CTRL+C)\n"
              << "      --report PATH     append a report on exit\n"
              << "      --json            write the report as JSON\n"
              << "      --save-targets P  save the target list (address,host,trace)\n"
              << "      --sort FIELD      order the disruption log (address, host,\n"
              << "                        down_start, recovery_time, failure_count,\n"
              << "                        duration, pre_avg ... post_stddev);\n"
              << "                        repeating a field flips the direction\n"
              << "      --trace           trace targets flagged in the file\n"
              << "      --trace-dir DIR   save trace transcripts\n"
              << "Trace options:\n"
              << "  -t, --timeout MS      per-hop timeout (floored at 100)\n"
              << "  -j, --jobs N          concurrent traces (default 4)\n"
              << "      --resolve         resolve hop names\n"
              << "      --trace-dir DIR   save trace transcripts\n"
              << "Global options:\n"
              << "      --log PATH        diagnostic log file\n"
              << "      --if NAME         bind probes to an interface\n"
              << "      --no-color        disable ANSI colors\n";
}

/**
 * Parse command-line arguments into a CliOptions struct.
 *
 * The first argument selects the sub-command; everything else is a
 * flag or a positional address. Flags that do not apply to the chosen
 * sub-command are accepted and ignored.
 *
 * Invalid or unknown flags are reported but do not stop parsing.
 */
CliOptions parse_args(int argc, char** argv) {
    CliOptions opt{};

    if (argc < 2)
        return opt; // command stays None → main prints usage

    const std::string cmd = argv[1];
    if (cmd == "monitor")      opt.command = Command::Monitor;
    else if (cmd == "trace")   opt.command = Command::Trace;
    else if (cmd == "console") opt.command = Command::Console;
    else {
        std::cerr << "Unknown command: " << cmd << "\n";
        return opt;
    }

    for (int i = 2; i < argc; ++i) {
        std::string a = argv[i];

        // ------------------------------
        // Probe timing
        // ------------------------------
        if ((a == "-i" || a == "--interval") && i + 1 < argc) {
            parse_int(opt, a, argv[++i], opt.interval_ms, 1);

        } else if ((a == "-t" || a == "--timeout") && i + 1 < argc) {
            parse_int(opt, a, argv[++i], opt.timeout_ms, 1);

        } else if (a == "--refresh" && i + 1 < argc) {
            parse_int(opt, a, argv[++i], opt.refresh_ms, 100);

        } else if (a == "--duration" && i + 1 < argc) {
            parse_int(opt, a, argv[++i], opt.duration_s, 0);

        // ------------------------------
        // Targets
        // ------------------------------
        } else if ((a == "-f" || a == "--file") && i + 1 < argc) {
            opt.targets_file = argv[++i];

        } else if (a == "--host" && i + 1 < argc) {
            opt.host = argv[++i];

        } else if (a == "--save-targets" && i + 1 < argc) {
            opt.save_targets_path = argv[++i];

        } else if (a == "--sort" && i + 1 < argc) {
            const std::string key = argv[++i];
            pingwatch::SortField field;
            if (pingwatch::parse_sort_field(key, field))
                opt.sort_keys.push_back(key);
            else
                opt.errors.push_back("Invalid value for --sort: " + key);

        // ------------------------------
        // Report / logs
        // ------------------------------
        } else if (a == "--report" && i + 1 < argc) {
            opt.report_path = argv[++i];

        } else if (a == "--json") {
            opt.report_format = ExportFormat::JSON;

        } else if (a == "--log-dir" && i + 1 < argc) {
            opt.log_dir = argv[++i];

        } else if (a == "--log" && i + 1 < argc) {
            opt.log_path = argv[++i];

        // ------------------------------
        // Trace
        // ------------------------------
        } else if (a == "--trace") {
            opt.trace = true;

        } else if (a == "--trace-dir" && i + 1 < argc) {
            opt.trace_dir = argv[++i];

        } else if ((a == "-j" || a == "--jobs") && i + 1 < argc) {
            parse_int(opt, a, argv[++i], opt.jobs, 1);

        } else if (a == "--resolve") {
            opt.resolve = true;

        // ------------------------------
        // Interface / output
        // ------------------------------
        } else if (a == "--if" && i + 1 < argc) {
            opt.if_name = argv[++i];

        } else if (a == "--no-color") {
            opt.no_color = true;

        // ------------------------------
        // Positional address / unknown flag
        // ------------------------------
        } else if (!a.empty() && a[0] != '-') {
            opt.addresses.push_back(a);

        } else {
            std::cerr << "Unknown arg: " << a << "\n";
        }
    }

    return opt;
}
