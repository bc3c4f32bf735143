#pragma once
#include <chrono>
#include <functional>

#include "pingwatch/cancel.hpp"
#include "pingwatch/diag_logger.hpp"
#include "pingwatch/disruption_log.hpp"
#include "pingwatch/monitor_target.hpp"
#include "pingwatch/prober.hpp"

namespace pingwatch {

using Clock = std::function<std::chrono::system_clock::time_point()>;

/**
 * Notifications published after every processed probe.
 * Invoked on the probe loop's thread; either member may be empty.
 */
struct ProbeCallbacks {
    std::function<void(const TargetSnapshot&)> on_target;
    std::function<void(const DisruptionEvent&, bool created)> on_disruption;
};

/**
 * Probe `target` until `cancel` fires.
 *
 * Each iteration sends one probe, feeds the outcome into the target,
 * publishes the result and sleeps the target's interval. Exceptions from
 * the prober become failed probes. A probe that completes after
 * cancellation is dropped, so stopping never records a trailing sample.
 *
 * @return number of probes recorded.
 */
long run_probe_loop(MonitorTarget& target,
                    Prober& prober,
                    DisruptionEventLog& log,
                    const CancelToken& cancel,
                    const ProbeCallbacks& callbacks = {},
                    const Clock& clock = {},
                    DiagLogger* diag = nullptr);

} // namespace pingwatch
