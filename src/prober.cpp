#include "pingwatch/prober.hpp"
#include "pingwatch/engine.hpp"
#include "pingwatch/util.hpp"

#include <utility>

namespace pingwatch {

IcmpProber::IcmpProber(PingOptions base) : base_(std::move(base)) {}

PingProbeResult IcmpProber::probe(const std::string& address,
                                  int timeout_ms,
                                  const CancelToken& cancel)
{
    std::string ip;
    if (!resolve_ipv4(address, ip)) {
        PingProbeResult r{};
        r.address = address;
        r.error_msg = "Cannot resolve " + address;
        return r;
    }

    if (engine_available())
        return ping_once_engine(ip, timeout_ms, base_.payload_size, base_.ttl, &cancel);

    PingOptions opt = base_;
    opt.timeout_ms = timeout_ms;
    return ping_once(ip, opt, &cancel);
}

} // namespace pingwatch
