#pragma once
#include <string>
#include "pingwatch/visibility.hpp"

namespace pingwatch {

class CancelToken;

/**
 * Represents the result of a single ICMP probe.
 */
struct PingProbeResult {
    bool success{false};           // Whether a valid reply was received
    bool cancelled{false};         // Probe abandoned because of cancellation
    long rtt_ms{-1};               // RTT in milliseconds (-1 = invalid)
    int  ttl{-1};                  // Observed TTL (-1 = invalid)
    int  bytes{0};                 // Echo payload bytes in the reply
    std::string address;           // Dotted IPv4 actually probed
    std::string if_name;           // Interface used (optional)
    std::string error_msg;         // Error detail (empty if success=true)
};

/**
 * Options for a single probe.
 */
struct PingOptions {
    int timeout_ms{2000};                 // Timeout per probe (ms)
    std::string if_name;                  // Interface name to bind to
    int payload_size{24};                 // Extra payload bytes after timestamp
    int ttl{-1};                          // Custom TTL, -1 = system default
};

/**
 * Send one ICMP Echo Request to an IPv4 literal over a private datagram
 * socket and wait for the reply.
 *
 * If a cancel token is supplied, the wait is abandoned as soon as the
 * token fires and the result carries cancelled=true.
 */
PINGWATCH_API PingProbeResult ping_once(const std::string& ip,
                                        const PingOptions& opt,
                                        const CancelToken* cancel = nullptr);

} // namespace pingwatch
