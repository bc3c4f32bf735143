#pragma once
#include <string>
#include "ping.hpp"

namespace pingwatch {

/**
 * Initializes the shared ICMP engine.
 * Opens one ICMP datagram socket and starts the reply listener thread,
 * so many probe loops can share a single socket.
 *
 * @param if_name Optional interface to bind to; empty = routing decides.
 */
bool init_engine(const std::string& if_name = "");

/**
 * Shuts down the engine and releases all resources.
 * Outstanding probes are resolved with an empty (failed) result.
 */
void shutdown_engine();

/**
 * Executes a single ICMP probe using the shared engine.
 * The wait for the reply polls the optional cancel token.
 */
PingProbeResult ping_once_engine(const std::string& ip,
                                 int timeout_ms,
                                 int payload_size = 0,
                                 int ttl = -1,
                                 const CancelToken* cancel = nullptr);

/**
 * @return true if init_engine() was successfully started.
 */
bool engine_available();

} // namespace pingwatch
