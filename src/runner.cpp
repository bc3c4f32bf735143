/**
 * Runner: drives monitoring, trace and console sessions.
 *
 * This module handles:
 * - SIGINT/SIGTERM-driven shutdown
 * - The live monitoring table and closing summary
 * - Streaming trace output tagged by address
 * - Report, transcript and console log files
 */

#include "runner.hpp"
#include "export.hpp"
#include "stats.hpp"
#include "terminal.hpp"

#include "pingwatch/diag_logger.hpp"
#include "pingwatch/engine.hpp"
#include "pingwatch/monitor_session.hpp"
#include "pingwatch/prober.hpp"
#include "pingwatch/trace_orchestrator.hpp"
#include "pingwatch/util.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <system_error>
#include <thread>

using namespace pingwatch;

// Set by CTRL+C / SIGTERM
static volatile std::sig_atomic_t g_stop = 0;

static void handle_signal(int) {
    g_stop = 1;
}

static void install_signal_handlers() {
    g_stop = 0;
    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);
}

/**
 * Sleep up to `ms`, waking early on a stop signal.
 * @return false if a stop was requested.
 */
static bool sleep_unless_stopped(int ms) {
    auto until = std::chrono::steady_clock::now() + std::chrono::milliseconds(ms);
    while (!g_stop) {
        auto now = std::chrono::steady_clock::now();
        if (now >= until) return true;
        auto slice = std::min<std::chrono::steady_clock::duration>(
            until - now, std::chrono::milliseconds(100));
        std::this_thread::sleep_for(slice);
    }
    return false;
}

static std::unique_ptr<DiagLogger> open_diag(const CliOptions& opt) {
    if (opt.log_path.empty()) return nullptr;
    auto diag = std::make_unique<DiagLogger>(opt.log_path);
    if (!diag->ok()) {
        std::cerr << term::yellow() << "Cannot open log file " << opt.log_path
                  << term::reset() << "\n";
        return nullptr;
    }
    return diag;
}

static void save_transcripts(const TraceSession& session,
                             const std::string& folder,
                             const std::vector<TargetSpec>& targets)
{
    for (size_t i = 0; i < session.size(); ++i) {
        const std::string& addr = session.address(i);
        std::string host;
        for (const auto& t : targets)
            if (t.address == addr) host = t.host;

        std::string path;
        if (export_trace_transcript(folder, addr, host, session.transcript(i), &path)) {
            if (!path.empty())
                std::cout << "Trace for " << addr << " saved to " << path << "\n";
        } else {
            std::cerr << term::red() << "Failed to save trace for " << addr
                      << " in " << folder << term::reset() << "\n";
        }
    }
}


bool collect_targets(const CliOptions& opt,
                     std::vector<TargetSpec>& out,
                     std::string& error_msg)
{
    out.clear();

    std::string file = opt.targets_file;
    std::vector<std::string> addresses = opt.addresses;

    if (file.empty() && addresses.size() == 1) {
        std::error_code ec;
        if (std::filesystem::is_regular_file(addresses[0], ec)) {
            file = addresses[0];
            addresses.clear();
        }
    }

    if (!file.empty()) {
        if (!load_targets(file, out, &error_msg))
            return false;
    }

    for (const auto& a : addresses) {
        TargetSpec spec;
        spec.address = a;
        spec.trace = opt.trace;
        out.push_back(spec);
    }
    return true;
}


int apply_sort_keys(DisruptionEventLog& log, const std::vector<std::string>& keys) {
    int applied = 0;
    for (const auto& key : keys) {
        SortField field;
        if (!parse_sort_field(key, field))
            continue;
        log.toggle_sort(field);
        ++applied;
    }
    return applied;
}

// New events land at the end; keep the chosen order on every redraw.
static void resort(DisruptionEventLog& log) {
    if (auto field = log.sort_field())
        log.sort_by(*field, log.sort_direction());
}


// -------------------------------------------------------------
// MONITOR
// -------------------------------------------------------------
int run_monitor(const CliOptions& opt) {
    std::vector<TargetSpec> targets;
    std::string err;
    if (!collect_targets(opt, targets, err)) {
        std::cerr << term::red() << err << term::reset() << "\n";
        return 1;
    }

    if (!opt.save_targets_path.empty()) {
        if (!save_targets(opt.save_targets_path, targets)) {
            std::cerr << term::red() << "Failed to save target list " << opt.save_targets_path
                      << term::reset() << "\n";
            return 1;
        }
        std::cout << "Target list saved to " << opt.save_targets_path << "\n";
    }

    auto diag = open_diag(opt);

    if (!init_engine(opt.if_name)) {
        std::cerr << term::yellow()
                  << "Shared ICMP socket unavailable, falling back to per-probe sockets"
                  << term::reset() << "\n";
    }

    PingOptions base;
    base.if_name = opt.if_name;
    auto prober = std::make_shared<IcmpProber>(base);

    MonitorSession session(prober, diag.get());
    CommandResult started = session.start_monitoring(targets, opt.interval_ms, opt.timeout_ms);
    if (!started.ok) {
        std::cerr << term::red() << started.error_msg << term::reset() << "\n";
        shutdown_engine();
        return 1;
    }

    // start_monitoring cleared the log along with its sort state
    apply_sort_keys(session.log(), opt.sort_keys);

    install_signal_handlers();

    // Optional trace run linked to the monitoring session
    std::vector<std::string> trace_addrs;
    if (opt.trace) {
        for (const auto& t : session.snapshot())
            if (t.trace) trace_addrs.push_back(t.address);
    }

    TraceOrchestrator tracer(std::make_shared<SubprocessTraceExecutor>(), diag.get());
    std::thread trace_thread;
    if (!trace_addrs.empty()) {
        TraceOptions topts;
        topts.timeout_ms = opt.timeout_ms;
        topts.max_concurrency = static_cast<size_t>(opt.jobs);
        topts.no_resolve = !opt.resolve;
        CancelToken link = session.token();

        trace_thread = std::thread([&tracer, trace_addrs, topts, link] {
            CommandResult r = tracer.run_trace(trace_addrs, topts, link);
            if (!r.ok)
                std::cerr << "Trace: " << r.error_msg << "\n";
        });
    }

    const auto begin = std::chrono::steady_clock::now();
    for (;;) {
        resort(session.log());
        print_target_table(session.snapshot(), session.state(), session.started_at());
        print_disruption_log(session.log().snapshot());
        std::cout << term::gray() << "\nCTRL+C to stop" << term::reset() << std::flush;

        if (opt.duration_s > 0 &&
            std::chrono::steady_clock::now() - begin >= std::chrono::seconds(opt.duration_s))
            break;
        if (!sleep_unless_stopped(opt.refresh_ms))
            break;
    }

    tracer.stop_trace();
    session.stop_monitoring();
    if (trace_thread.joinable())
        trace_thread.join();
    shutdown_engine();

    resort(session.log());
    const auto final_targets = session.snapshot();
    print_target_table(final_targets, session.state(), session.started_at());
    print_disruption_log(session.log().snapshot());
    print_summary(final_targets);

    int rc = 0;

    if (!opt.report_path.empty()) {
        ReportHeader header;
        header.start_time = session.started_at();
        header.end_time = session.stopped_at();
        header.interval_ms = session.interval_ms();
        header.timeout_ms = session.timeout_ms();

        if (export_report(opt.report_path, opt.report_format, header,
                          final_targets, session.log().snapshot())) {
            std::cout << "\nReport appended to " << opt.report_path << "\n";
        } else {
            std::cerr << term::red() << "Failed to write report " << opt.report_path
                      << term::reset() << "\n";
            rc = 1;
        }
    }

    if (!opt.trace_dir.empty()) {
        if (auto ts = tracer.last_session())
            save_transcripts(*ts, opt.trace_dir, targets);
    }

    return rc;
}


// -------------------------------------------------------------
// TRACE
// -------------------------------------------------------------
int run_trace(const CliOptions& opt) {
    if (opt.addresses.empty()) {
        std::cerr << term::red() << "No addresses selected for tracing"
                  << term::reset() << "\n";
        return 1;
    }

    auto diag = open_diag(opt);

    TraceOrchestrator tracer(std::make_shared<SubprocessTraceExecutor>(), diag.get());

    TraceCallbacks cb;
    cb.on_line = [](const std::string& addr, const std::string& line) {
        std::cout << term::cyan() << "[" << addr << "] " << term::reset() << line << "\n";
    };
    cb.on_annotation = [](const std::string& addr, TraceAnnotation a) {
        const char* color = a == TraceAnnotation::Completed ? term::green() : term::yellow();
        std::cout << color << "[" << addr << "] " << trailer_text(a) << term::reset() << std::endl;
    };
    tracer.set_callbacks(cb);

    TraceOptions topts;
    topts.timeout_ms = opt.timeout_ms;
    topts.max_concurrency = static_cast<size_t>(opt.jobs);
    topts.no_resolve = !opt.resolve;

    install_signal_handlers();

    // run_trace blocks; a watcher turns CTRL+C into stop_trace()
    std::atomic<bool> done{false};
    std::thread watcher([&tracer, &done] {
        while (!done.load()) {
            if (g_stop) {
                tracer.stop_trace();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });

    CommandResult r = tracer.run_trace(opt.addresses, topts);
    done = true;
    watcher.join();

    if (!r.ok) {
        std::cerr << term::red() << r.error_msg << term::reset() << "\n";
        return 1;
    }

    if (!opt.trace_dir.empty()) {
        if (auto ts = tracer.last_session())
            save_transcripts(*ts, opt.trace_dir, {});
    }
    return 0;
}


// -------------------------------------------------------------
// CONSOLE
// -------------------------------------------------------------
int run_console(const CliOptions& opt) {
    if (opt.addresses.empty()) {
        std::cerr << term::red() << "No address given" << term::reset() << "\n";
        return 1;
    }

    const std::string& address = opt.addresses.front();
    std::string ip = address;
    if (!resolve_ipv4(address, ip)) {
        std::cerr << term::red() << "Cannot resolve " << address << term::reset() << "\n";
        return 1;
    }

    PingOptions base;
    base.if_name = opt.if_name;
    IcmpProber prober(base);

    const std::string log_path = console_log_path(opt.log_dir, address, opt.host,
                                                  std::chrono::system_clock::now());

    install_signal_handlers();

    std::cout << "Pinging " << address;
    if (ip != address) std::cout << " [" << ip << "]";
    std::cout << " every 1000ms, timeout=" << opt.timeout_ms << "ms (CTRL+C to stop)\n"
              << "Logging to " << log_path << "\n";

    bool log_ok = true;
    CancelToken never;

    while (!g_stop) {
        PingProbeResult res = prober.probe(address, opt.timeout_ms, never);
        if (g_stop) break;

        std::string line = "[" + format_time(std::chrono::system_clock::now()) + "] ";
        if (res.success) {
            line += "Reply from " + res.address + ": bytes=" + std::to_string(res.bytes) +
                    " time=" + std::to_string(res.rtt_ms) + "ms TTL=" + std::to_string(res.ttl);
            std::cout << term::green() << line << term::reset() << "\n";
        } else if (res.error_msg.empty() || res.error_msg == "Timeout") {
            line += "Request timed out.";
            std::cout << term::red() << line << term::reset() << "\n";
        } else {
            line += "General failure (" + res.error_msg + ")";
            std::cout << term::red() << line << term::reset() << "\n";
        }

        if (log_ok && !append_line(log_path, line)) {
            std::cerr << term::yellow() << "Cannot write " << log_path
                      << ", file logging disabled" << term::reset() << "\n";
            log_ok = false;
        }

        if (!sleep_unless_stopped(1000)) break;
    }

    return 0;
}


int run(const CliOptions& opt) {
    term::g_enabled = !opt.no_color;
    if (term::g_enabled) term::detect();

    for (const auto& e : opt.errors)
        std::cerr << term::red() << e << term::reset() << "\n";
    if (!opt.errors.empty())
        return 2;

    switch (opt.command) {
    case Command::Monitor: return run_monitor(opt);
    case Command::Trace:   return run_trace(opt);
    case Command::Console: return run_console(opt);
    case Command::None:    break;
    }

    print_usage();
    return 2;
}
