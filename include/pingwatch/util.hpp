#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace pingwatch {

/**
 * Compute a classic 16-bit Internet checksum (RFC 1071).
 *
 * @param data  Pointer to raw buffer
 * @param len   Buffer length in bytes
 * @return      One's-complement 16-bit checksum
 */
uint16_t checksum16(const void* data, size_t len);

/**
 * Format a duration as "hh:mm:ss" (hours are not wrapped at 24).
 * Negative durations are clamped to zero.
 */
std::string format_duration(std::chrono::milliseconds d);

/**
 * Format a wall-clock time point in local time using strftime syntax.
 */
std::string format_time(std::chrono::system_clock::time_point tp,
                        const char* fmt = "%Y/%m/%d %H:%M:%S");

/**
 * Resolve a host name or dotted IPv4 literal to a dotted IPv4 string.
 * Returns false (and leaves out_ip untouched) if no IPv4 address exists.
 */
bool resolve_ipv4(const std::string& host, std::string& out_ip);

/**
 * Make a string safe for use as one path component.
 * '/', '\\', ':' and control characters become '_', the result is cut
 * at 120 characters, and an empty input yields "unknown".
 */
std::string sanitize_file_name(const std::string& name);

} // namespace pingwatch
