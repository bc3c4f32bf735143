/**
 * Linux implementation of the one-shot ping path (non-engine).
 *
 * Each call opens its own ICMP datagram socket:
 *   - DATAGRAM ICMP sockets (SOCK_DGRAM + IPPROTO_ICMP), no raw privileges
 *   - recvmsg() with IP_RECVTTL to extract hop count
 *   - manual checksum + timestamp payload
 *
 * The receive timeout is cut into short slices so a monitoring session
 * can be stopped while a probe is outstanding.
 */

#include "pingwatch/ping.hpp"
#include "pingwatch/cancel.hpp"
#include "pingwatch/util.hpp"

#include <chrono>
#include <cstring>
#include <string>
#include <vector>
#include <algorithm>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <netinet/ip.h>
#include <netinet/ip_icmp.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>
#include <errno.h>

namespace pingwatch {

namespace {

// Upper bound for one blocking recvmsg() so cancellation is noticed quickly.
constexpr int kRecvSliceMs = 100;

void set_recv_timeout(int s, int ms) {
    timeval tv{};
    tv.tv_sec  = ms / 1000;
    tv.tv_usec = (ms % 1000) * 1000;
    ::setsockopt(s, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
}

} // namespace


// ============================================================================
// Perform a single ICMP Echo attempt (blocking, cancellable)
// ============================================================================
PingProbeResult ping_once(const std::string& ip,
                          const PingOptions& opt,
                          const CancelToken* cancel)
{
    PingProbeResult probe{};
    probe.address = ip;
    probe.if_name = opt.if_name;

    // ---------------------------------------------------------------------
    // Parse target IPv4
    // ---------------------------------------------------------------------
    sockaddr_in dst{};
    dst.sin_family = AF_INET;

    if (inet_pton(AF_INET, ip.c_str(), &dst.sin_addr) != 1) {
        probe.error_msg = "Invalid IP address";
        return probe;
    }

    // ---------------------------------------------------------------------
    // ICMP datagram socket
    // ---------------------------------------------------------------------
    int s = ::socket(AF_INET, SOCK_DGRAM, IPPROTO_ICMP);
    if (s < 0) {
        probe.error_msg = std::string("socket() failed: ") + std::strerror(errno);
        return probe;
    }

    // Optional: bind to interface
    if (!opt.if_name.empty()) {
        ::setsockopt(s, SOL_SOCKET, SO_BINDTODEVICE,
                     opt.if_name.c_str(),
                     (socklen_t)opt.if_name.size());
    }

    // Must connect() for consistent recvmsg() semantics
    if (::connect(s, reinterpret_cast<sockaddr*>(&dst), sizeof(dst)) < 0) {
        probe.error_msg = std::string("connect() failed: ") + std::strerror(errno);
        ::close(s);
        return probe;
    }

    // Receive TTL via cmsg
    int one = 1;
    ::setsockopt(s, IPPROTO_IP, IP_RECVTTL, &one, sizeof(one));

    // Custom TTL (if supplied)
    if (opt.ttl > 0) {
        ::setsockopt(s, IPPROTO_IP, IP_TTL, &opt.ttl, sizeof(opt.ttl));
    }

    const int timeout_ms = std::max(1, opt.timeout_ms);
    set_recv_timeout(s, std::min(timeout_ms, kRecvSliceMs));

    // ---------------------------------------------------------------------
    // Build ICMP Echo Request (the kernel fills in the identifier)
    // ---------------------------------------------------------------------
    const size_t payload = sizeof(uint64_t) + static_cast<size_t>(std::max(0, opt.payload_size));
    std::vector<unsigned char> packet(sizeof(icmphdr) + payload, 0);

    auto* hdr = reinterpret_cast<icmphdr*>(packet.data());
    hdr->type = ICMP_ECHO;
    hdr->code = 0;
    hdr->un.echo.id = 0;
    hdr->un.echo.sequence = htons(1);

    // Timestamp payload
    uint64_t ticks = (uint64_t)std::chrono::duration_cast<std::chrono::milliseconds>(
                         std::chrono::steady_clock::now().time_since_epoch())
                         .count();

    std::memcpy(packet.data() + sizeof(icmphdr), &ticks, sizeof(ticks));

    hdr->checksum = checksum16(packet.data(), packet.size());

    // ---------------------------------------------------------------------
    // Send
    // ---------------------------------------------------------------------
    auto t_send = std::chrono::steady_clock::now();

    if (::send(s, packet.data(), packet.size(), 0) < 0) {
        probe.error_msg = std::string("send() failed: ") + std::strerror(errno);
        ::close(s);
        return probe;
    }

    // ---------------------------------------------------------------------
    // Receive loop
    // ---------------------------------------------------------------------
    uint8_t recv_buf[1500];
    char cbuf[256];

    auto deadline = t_send + std::chrono::milliseconds(timeout_ms);

    while (std::chrono::steady_clock::now() < deadline) {
        if (cancel && cancel->cancelled()) {
            probe.cancelled = true;
            probe.error_msg = "Cancelled";
            ::close(s);
            return probe;
        }

        iovec iov{ recv_buf, sizeof(recv_buf) };
        sockaddr_in src{};

        msghdr msg{};
        msg.msg_name    = &src;
        msg.msg_namelen = sizeof(src);
        msg.msg_iov     = &iov;
        msg.msg_iovlen  = 1;
        msg.msg_control = cbuf;
        msg.msg_controllen = sizeof(cbuf);

        ssize_t n = ::recvmsg(s, &msg, 0);

        if (n < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)
                continue;

            probe.error_msg = std::string("recvmsg() failed: ") + std::strerror(errno);
            ::close(s);
            return probe;
        }

        if (n < (ssize_t)sizeof(icmphdr))
            continue;

        const icmphdr* ricmp = reinterpret_cast<const icmphdr*>(recv_buf);
        if (ricmp->type != ICMP_ECHOREPLY)
            continue;

        // RTT
        auto t_recv = std::chrono::steady_clock::now();
        probe.rtt_ms = (long)std::chrono::duration_cast<std::chrono::milliseconds>(
                           t_recv - t_send)
                           .count();
        probe.bytes = static_cast<int>(n - (ssize_t)sizeof(icmphdr));

        // Extract TTL
        int ttl = -1;
        for (cmsghdr* cmsg = CMSG_FIRSTHDR(&msg);
             cmsg;
             cmsg = CMSG_NXTHDR(&msg, cmsg))
        {
            if (cmsg->cmsg_level == IPPROTO_IP &&
                cmsg->cmsg_type == IP_TTL)
            {
                std::memcpy(&ttl, CMSG_DATA(cmsg), sizeof(ttl));
                break;
            }
        }

        probe.ttl = (ttl >= 0 ? ttl : -1);
        probe.success = true;

        ::close(s);
        return probe;
    }

    probe.error_msg = "Timeout";
    ::close(s);
    return probe;
}

} // namespace pingwatch
