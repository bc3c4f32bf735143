#pragma once
#include <string>

#include "pingwatch/cancel.hpp"
#include "pingwatch/ping.hpp"

namespace pingwatch {

/**
 * Sends one echo request to an address and reports the outcome.
 *
 * Implementations may report failure either through the result
 * (success=false) or by throwing; probe loops treat both alike.
 * A probe abandoned because `cancel` fired sets cancelled=true.
 */
class Prober {
public:
    virtual ~Prober() = default;

    virtual PingProbeResult probe(const std::string& address,
                                  int timeout_ms,
                                  const CancelToken& cancel) = 0;
};

/**
 * ICMP echo over the shared engine when it is running, otherwise over a
 * per-probe datagram socket. Host names are resolved to IPv4 first.
 */
class IcmpProber : public Prober {
public:
    explicit IcmpProber(PingOptions base = {});

    PingProbeResult probe(const std::string& address,
                          int timeout_ms,
                          const CancelToken& cancel) override;

private:
    PingOptions base_;
};

} // namespace pingwatch
