#include "pingwatch/util.hpp"

#include <cstdio>
#include <cstring>
#include <ctime>

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/types.h>

namespace pingwatch {

/**
 * Compute the standard Internet checksum (RFC 1071).
 *
 * Used for ICMP Echo headers (IPv4) including the timestamp payload.
 *
 * This is the classic 16-bit one's-complement sum:
 *   - sum words
 *   - fold carries
 *   - invert result
 */
uint16_t checksum16(const void* data, size_t len) {
    uint32_t sum = 0;
    const uint16_t* p = static_cast<const uint16_t*>(data);

    // Sum 16-bit chunks
    while (len > 1) {
        sum += *p++;
        len -= 2;
    }

    // Handle remaining odd byte
    if (len) {
        sum += *reinterpret_cast<const uint8_t*>(p);
    }

    // Fold carries
    while (sum >> 16) {
        sum = (sum & 0xFFFF) + (sum >> 16);
    }

    return static_cast<uint16_t>(~sum);
}


std::string format_duration(std::chrono::milliseconds d) {
    long long total = d.count() / 1000;
    if (total < 0) total = 0;

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%02lld:%02lld:%02lld",
                  total / 3600, (total / 60) % 60, total % 60);
    return buf;
}


std::string format_time(std::chrono::system_clock::time_point tp, const char* fmt) {
    std::time_t tt = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&tt, &tm);

    char buf[64];
    size_t n = std::strftime(buf, sizeof(buf), fmt, &tm);
    return std::string(buf, n);
}


/**
 * Literal addresses short-circuit; anything else goes through
 * getaddrinfo() restricted to AF_INET, first result wins.
 */
bool resolve_ipv4(const std::string& host, std::string& out_ip) {
    if (host.empty()) return false;

    in_addr literal{};
    if (inet_pton(AF_INET, host.c_str(), &literal) == 1) {
        out_ip = host;
        return true;
    }

    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_DGRAM;
    addrinfo* res = nullptr;

    if (getaddrinfo(host.c_str(), nullptr, &hints, &res) != 0 || !res)
        return false;

    bool found = false;
    for (auto* p = res; p; p = p->ai_next) {
        if (p->ai_family != AF_INET) continue;

        char buf[INET_ADDRSTRLEN];
        auto* sin = reinterpret_cast<const sockaddr_in*>(p->ai_addr);
        if (inet_ntop(AF_INET, &sin->sin_addr, buf, sizeof(buf))) {
            out_ip = buf;
            found = true;
            break;
        }
    }

    freeaddrinfo(res);
    return found;
}


std::string sanitize_file_name(const std::string& name) {
    if (name.empty()) return "unknown";

    std::string s;
    s.reserve(name.size());
    for (char c : name) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (c == '/' || c == '\\' || c == ':' || uc < 0x20 || uc == 0x7F)
            s.push_back('_');
        else
            s.push_back(c);
    }

    if (s.size() > 120) s.resize(120);
    return s;
}

} // namespace pingwatch
