#include "pingwatch/probe_loop.hpp"

#include <exception>
#include <string>

namespace pingwatch {

long run_probe_loop(MonitorTarget& target,
                    Prober& prober,
                    DisruptionEventLog& log,
                    const CancelToken& cancel,
                    const ProbeCallbacks& callbacks,
                    const Clock& clock,
                    DiagLogger* diag)
{
    const auto now = [&clock] {
        return clock ? clock() : std::chrono::system_clock::now();
    };

    long recorded = 0;

    while (!cancel.cancelled()) {
        PingProbeResult res{};

        try {
            res = prober.probe(target.address(), target.timeout_ms(), cancel);
        } catch (const std::exception& e) {
            // Transport failures are ordinary failed probes
            res = PingProbeResult{};
            res.error_msg = e.what();
        } catch (...) {
            res = PingProbeResult{};
            res.error_msg = "Unknown prober failure";
        }

        if (res.cancelled || cancel.cancelled())
            break;

        ProbeUpdate upd = res.success
            ? target.record_success(res.rtt_ms, now(), log)
            : target.record_failure(now());
        ++recorded;

        if (upd.went_down) {
            diag_log(diag, "down " + target.address() +
                           (res.error_msg.empty() ? "" : " (" + res.error_msg + ")"));
        }
        if (upd.event_created && upd.event) {
            diag_log(diag, "recovered " + target.address() +
                           " after " + upd.event->duration_text +
                           ", failures=" + std::to_string(upd.event->failure_count));
        }

        if (callbacks.on_target)
            callbacks.on_target(upd.target);
        if (callbacks.on_disruption && upd.event)
            callbacks.on_disruption(*upd.event, upd.event_created);

        if (cancel.wait_for(std::chrono::milliseconds(target.interval_ms())))
            break;
    }

    return recorded;
}

} // namespace pingwatch
