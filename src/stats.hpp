#pragma once
#include <chrono>
#include <iostream>
#include <optional>
#include <vector>
#include "pingwatch/disruption_log.hpp"
#include "pingwatch/monitor_session.hpp"
#include "pingwatch/monitor_target.hpp"

/**
 * Print the live monitoring table: one row per target with status,
 * counters, down durations and session statistics.
 */
void print_target_table(const std::vector<pingwatch::TargetSnapshot>& targets,
                        pingwatch::SessionState state,
                        std::optional<std::chrono::system_clock::time_point> started_at,
                        std::ostream& os = std::cout);

/**
 * Print the disruption log in its current order.
 */
void print_disruption_log(const std::vector<pingwatch::DisruptionEvent>& events,
                          std::ostream& os = std::cout);

/**
 * Per-target closing summary printed when monitoring stops,
 * in the classic ping statistics layout.
 */
void print_summary(const std::vector<pingwatch::TargetSnapshot>& targets,
                   std::ostream& os = std::cout);
