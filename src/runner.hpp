/**
 * High-level execution logic for the pingwatch sub-commands.
 *
 * The monitoring and tracing work is delegated to the pingwatch library
 * (MonitorSession, TraceOrchestrator); this layer owns the terminal,
 * signals, and files.
 */

#pragma once
#include <string>
#include <vector>
#include "cli.hpp"
#include "pingwatch/disruption_log.hpp"
#include "pingwatch/monitor_target.hpp"

/**
 * Dispatch to the selected sub-command.
 * Returns the process exit code.
 */
int run(const CliOptions& opt);

/**
 * Multi-target monitoring with a live table until CTRL+C or --duration.
 */
int run_monitor(const CliOptions& opt);

/**
 * One trace run over the given addresses, streamed to stdout.
 */
int run_trace(const CliOptions& opt);

/**
 * Single-target ping console with a daily log file.
 */
int run_console(const CliOptions& opt);

/**
 * Targets for `monitor`: -f FILE, a single positional that names an
 * existing file, or the positional addresses themselves.
 *
 * @return false (with error_msg) if a target file cannot be read.
 */
bool collect_targets(const CliOptions& opt,
                     std::vector<pingwatch::TargetSpec>& out,
                     std::string& error_msg);

/**
 * Replay --sort keys on the log like successive column-header clicks.
 * Unknown keys are skipped.
 *
 * @return the number of keys applied.
 */
int apply_sort_keys(pingwatch::DisruptionEventLog& log,
                    const std::vector<std::string>& keys);
