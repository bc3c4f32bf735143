/**
 * Shared ICMP engine (Linux).
 *
 * Implementation notes:
 *  - One datagram ICMP socket (SOCK_DGRAM + IPPROTO_ICMP) for all targets
 *  - Listener thread consumes replies via recvmsg(), extracting TTL
 *    from ancillary data (IP_RECVTTL)
 *  - Correlates replies to outstanding promises via (id, seq)
 *  - The kernel rewrites the echo identifier of datagram ICMP sockets to
 *    the socket's local "port", so the id is read back with getsockname()
 */

#include "pingwatch/engine.hpp"
#include "pingwatch/cancel.hpp"
#include "pingwatch/util.hpp"

#include <algorithm>
#include <chrono>
#include <cstring>
#include <atomic>
#include <future>
#include <mutex>
#include <system_error>
#include <thread>
#include <unordered_map>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <netinet/ip.h>
#include <netinet/ip_icmp.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>
#include <errno.h>

namespace pingwatch {

// ============================================================================
// Global engine state
// ============================================================================
static int g_sock = -1;
static uint16_t g_ident = 0;
static std::thread g_listener;
static std::atomic<bool> g_running{false};

struct Key { uint16_t id; uint16_t seq; };
struct KeyHash {
    size_t operator()(const Key& k) const noexcept {
        return (size_t(k.id) << 16) ^ k.seq;
    }
};
struct KeyEq {
    bool operator()(const Key& a, const Key& b) const noexcept {
        return a.id == b.id && a.seq == b.seq;
    }
};

static std::unordered_map<
    Key,
    std::promise<PingProbeResult>,
    KeyHash,
    KeyEq
> g_waiters;

static std::mutex g_mtx;
static std::atomic<uint16_t> g_seq{1};

// Poll interval while waiting on a reply, bounds cancellation latency.
static constexpr int kWaitSliceMs = 50;


// ============================================================================
// Listener thread
// Consumes ICMP Echo Replies and resolves the corresponding promises
// ============================================================================
static void listener_loop() {
    int s = g_sock;
    if (s < 0) return;

    uint8_t recv_buf[2048];
    char cbuf[256];

    while (g_running.load()) {
        iovec iov{ recv_buf, sizeof(recv_buf) };
        sockaddr_in src{};

        msghdr msg{};
        msg.msg_name = &src;
        msg.msg_namelen = sizeof(src);
        msg.msg_iov = &iov;
        msg.msg_iovlen = 1;
        msg.msg_control = cbuf;
        msg.msg_controllen = sizeof(cbuf);

        ssize_t n = ::recvmsg(s, &msg, 0);

        if (n < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) continue;
            break; // fatal error or shutdown
        }
        if (n == 0)
            break; // socket shutdown

        if (n < (ssize_t)sizeof(icmphdr))
            continue;

        auto* ricmp = reinterpret_cast<const icmphdr*>(recv_buf);
        if (ricmp->type != ICMP_ECHOREPLY)
            continue;

        Key k{ ntohs(ricmp->un.echo.id),
               ntohs(ricmp->un.echo.sequence) };

        // Extract TTL from ancillary data
        int ttl_val = -1;
        for (cmsghdr* cmsg = CMSG_FIRSTHDR(&msg);
             cmsg;
             cmsg = CMSG_NXTHDR(&msg, cmsg))
        {
            if (cmsg->cmsg_level == IPPROTO_IP &&
                cmsg->cmsg_type == IP_TTL)
            {
                std::memcpy(&ttl_val, CMSG_DATA(cmsg), sizeof(ttl_val));
                break;
            }
        }

        char ipbuf[INET_ADDRSTRLEN] = {0};
        inet_ntop(AF_INET, &src.sin_addr, ipbuf, sizeof(ipbuf));

        PingProbeResult probe{};
        probe.success = true;
        probe.ttl     = (ttl_val >= 0) ? ttl_val : -1;
        probe.rtt_ms  = 0;  // caller computes RTT
        probe.bytes   = static_cast<int>(n - (ssize_t)sizeof(icmphdr));
        probe.address = ipbuf;

        // Resolve waiter, if present
        std::lock_guard<std::mutex> lk(g_mtx);
        auto it = g_waiters.find(k);
        if (it != g_waiters.end()) {
            it->second.set_value(probe);
            g_waiters.erase(it);
        }
    }
}


// ============================================================================
// Engine lifecycle
// ============================================================================
bool init_engine(const std::string& if_name) {
    if (g_running.load())
        return true;

    // ICMP datagram socket (no IP header exposure)
    int s = ::socket(AF_INET, SOCK_DGRAM, IPPROTO_ICMP);
    if (s < 0)
        return false;

    // Optional interface binding
    if (!if_name.empty()) {
        ::setsockopt(s, SOL_SOCKET, SO_BINDTODEVICE,
                     if_name.c_str(), (socklen_t)if_name.size());
    }

    // Bind explicitly so the kernel assigns the echo identifier now
    sockaddr_in local{};
    local.sin_family = AF_INET;
    local.sin_addr.s_addr = htonl(INADDR_ANY);
    socklen_t len = sizeof(local);
    if (::bind(s, reinterpret_cast<sockaddr*>(&local), sizeof(local)) < 0 ||
        ::getsockname(s, reinterpret_cast<sockaddr*>(&local), &len) < 0)
    {
        ::close(s);
        return false;
    }
    g_ident = ntohs(local.sin_port);

    // Enable TTL extraction via recvmsg()
    int one = 1;
    ::setsockopt(s, IPPROTO_IP, IP_RECVTTL, &one, sizeof(one));

    // Default TTL (can be overridden per-probe)
    int ttl_def = 64;
    ::setsockopt(s, IPPROTO_IP, IP_TTL, &ttl_def, sizeof(ttl_def));

    g_sock = s;
    g_running = true;

    try {
        g_listener = std::thread(listener_loop);
    } catch (const std::system_error&) {
        g_running = false;
        ::close(g_sock);
        g_sock = -1;
        return false;
    }

    return true;
}


void shutdown_engine() {
    if (!g_running.exchange(false) && g_sock < 0)
        return;

    // Wake listener thread
    if (g_sock >= 0)
        ::shutdown(g_sock, SHUT_RD);

    if (g_listener.joinable())
        g_listener.join();

    if (g_sock >= 0) {
        ::close(g_sock);
        g_sock = -1;
    }

    // Resolve pending waiters
    std::lock_guard<std::mutex> lk(g_mtx);
    for (auto& kv : g_waiters) {
        PingProbeResult empty{};
        empty.error_msg = "Engine shut down";
        kv.second.set_value(empty);
    }
    g_waiters.clear();
}


// ============================================================================
// Single-probe API (engine path)
// ============================================================================
PingProbeResult ping_once_engine(const std::string& ip,
                                 int timeout_ms,
                                 int payload_size,
                                 int ttl,
                                 const CancelToken* cancel)
{
    PingProbeResult probe{};
    probe.address = ip;

    // Parse IPv4
    in_addr dst{};
    if (inet_pton(AF_INET, ip.c_str(), &dst) != 1) {
        probe.error_msg = "Invalid IP address";
        return probe;
    }

    if (g_sock < 0 || !g_running.load()) {
        probe.error_msg = "Engine socket not available";
        return probe;
    }

    uint16_t seq = g_seq.fetch_add(1, std::memory_order_relaxed);
    Key k{ g_ident, seq };

    std::promise<PingProbeResult> pr;
    auto fut = pr.get_future();

    {
        std::lock_guard<std::mutex> lk(g_mtx);
        g_waiters.emplace(k, std::move(pr));
    }

    // Build ICMP Echo Request
    const size_t payload = sizeof(uint64_t) + static_cast<size_t>(std::max(0, payload_size));
    std::vector<unsigned char> packet(sizeof(icmphdr) + payload, 0);

    auto* hdr = reinterpret_cast<icmphdr*>(packet.data());
    hdr->type = ICMP_ECHO;
    hdr->code = 0;
    hdr->un.echo.id = htons(g_ident);
    hdr->un.echo.sequence = htons(seq);

    uint64_t ticks =
        (uint64_t)std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now().time_since_epoch())
            .count();

    std::memcpy(packet.data() + sizeof(icmphdr), &ticks, sizeof(ticks));

    hdr->checksum = 0;
    hdr->checksum = checksum16(packet.data(), packet.size());

    sockaddr_in dstsa{};
    dstsa.sin_family = AF_INET;
    dstsa.sin_addr   = dst;

    auto t_send = std::chrono::steady_clock::now();

    // The TTL override is a socket-wide option, so it is set and sent
    // under the waiter lock to keep concurrent probes from mixing TTLs.
    ssize_t sent;
    {
        std::lock_guard<std::mutex> lk(g_mtx);
        if (ttl > 0)
            ::setsockopt(g_sock, IPPROTO_IP, IP_TTL, &ttl, sizeof(ttl));

        sent = ::sendto(g_sock,
                        packet.data(),
                        packet.size(),
                        0,
                        reinterpret_cast<sockaddr*>(&dstsa),
                        sizeof(dstsa));

        if (ttl > 0) {
            int ttl_def = 64;
            ::setsockopt(g_sock, IPPROTO_IP, IP_TTL, &ttl_def, sizeof(ttl_def));
        }

        if (sent < 0) {
            g_waiters.erase(k);
            probe.error_msg = std::string("sendto() failed: ") + std::strerror(errno);
            return probe;
        }
    }

    // Await response in slices so cancellation is observed
    auto deadline = t_send + std::chrono::milliseconds(std::max(1, timeout_ms));

    while (std::chrono::steady_clock::now() < deadline) {
        if (cancel && cancel->cancelled()) {
            std::lock_guard<std::mutex> lk(g_mtx);
            g_waiters.erase(k);
            probe.cancelled = true;
            probe.error_msg = "Cancelled";
            return probe;
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        auto slice = std::min(remaining, std::chrono::milliseconds(kWaitSliceMs));

        if (fut.wait_for(slice) == std::future_status::ready) {
            probe = fut.get();
            if (!probe.success)
                return probe;

            auto t_recv = std::chrono::steady_clock::now();
            probe.rtt_ms =
                (long)std::chrono::duration_cast<std::chrono::milliseconds>(
                    t_recv - t_send)
                    .count();

            return probe;
        }
    }

    // Timeout: cleanup
    {
        std::lock_guard<std::mutex> lk(g_mtx);
        g_waiters.erase(k);
    }

    probe.error_msg = "Timeout";
    return probe;
}


// ============================================================================
// Engine status
// ============================================================================
bool engine_available() {
    return g_running.load();
}

} // namespace pingwatch
