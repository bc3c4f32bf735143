#include "harness.hpp"
#include "pingwatch/cancel.hpp"
#include "pingwatch/engine.hpp"
#include "pingwatch/ping.hpp"
#include "pingwatch/prober.hpp"
#include "pingwatch/util.hpp"

#include <chrono>
#include <cstdint>
#include <cstring>
#include <string>
#include <thread>

using namespace pingwatch;

bool test_invalid_ip() {
    PingOptions opt;
    opt.timeout_ms = 100;
    auto res = ping_once("999.999.999.999", opt);
    // Should fail gracefully
    if (res.success) return false;
    return res.error_msg == "Invalid IP address";
}

bool test_unresolvable_host() {
    IcmpProber prober;
    CancelToken never;
    auto res = prober.probe("no-such-host.invalid", 100, never);
    EXPECT(!res.success);
    EXPECT(!res.error_msg.empty());
    return true;
}

bool test_engine_not_started() {
    EXPECT(!engine_available());
    auto res = ping_once_engine("127.0.0.1", 100);
    EXPECT(!res.success);
    return true;
}

bool test_checksum() {
    // A buffer carrying its own checksum sums to zero
    uint8_t pkt[8] = {8, 0, 0, 0, 0x12, 0x34, 0x00, 0x01};
    uint16_t c = checksum16(pkt, sizeof(pkt));
    std::memcpy(pkt + 2, &c, sizeof(c));
    EXPECT(checksum16(pkt, sizeof(pkt)) == 0);

    // Odd length is padded with a zero byte
    const uint8_t odd[3] = {0xab, 0xcd, 0xef};
    const uint8_t even[4] = {0xab, 0xcd, 0xef, 0x00};
    EXPECT(checksum16(odd, sizeof(odd)) == checksum16(even, sizeof(even)));
    return true;
}

bool test_format_duration() {
    using std::chrono::milliseconds;
    EXPECT(format_duration(milliseconds(0)) == "00:00:00");
    EXPECT(format_duration(milliseconds(59999)) == "00:00:59");
    EXPECT(format_duration(milliseconds(3723000)) == "01:02:03");
    EXPECT(format_duration(milliseconds(90000000)) == "25:00:00");
    EXPECT(format_duration(milliseconds(-5000)) == "00:00:00");
    return true;
}

bool test_resolve_literal() {
    std::string ip = "unchanged";
    EXPECT(resolve_ipv4("192.0.2.33", ip));
    EXPECT(ip == "192.0.2.33");
    return true;
}

bool test_sanitize_file_name() {
    EXPECT(sanitize_file_name("") == "unknown");
    EXPECT(sanitize_file_name("a/b\\c:d") == "a_b_c_d");
    EXPECT(sanitize_file_name(std::string("x\ty")) == "x_y");
    EXPECT(sanitize_file_name(std::string(300, 'h')).size() == 120);
    return true;
}

bool test_cancel_token() {
    CancelSource src;
    CancelToken tok = src.token();
    int calls = 0;
    CancelRegistration reg = tok.on_cancel([&calls] { ++calls; });
    EXPECT(!tok.cancelled());
    EXPECT(!tok.wait_for(std::chrono::milliseconds(1)));

    std::thread t([&src] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        src.cancel();
    });
    EXPECT(tok.wait_for(std::chrono::milliseconds(5000)));
    t.join();
    src.cancel();
    EXPECT(calls == 1);

    // Late registration runs immediately
    tok.on_cancel([&calls] { ++calls; });
    EXPECT(calls == 2);

    // Linked source follows its parent
    CancelSource parent;
    CancelSource child(parent.token());
    EXPECT(!child.cancelled());
    parent.cancel();
    EXPECT(child.cancelled());
    return true;
}

bool test_unregistered_callback_not_run() {
    CancelSource src;
    int calls = 0;
    {
        CancelRegistration reg = src.token().on_cancel([&calls] { ++calls; });
    }
    src.cancel();
    EXPECT(calls == 0);
    return true;
}

int main() {
    std::cout << "Running ping tests...\n";

    run_test("Invalid IP Handling", test_invalid_ip);
    run_test("Unresolvable host", test_unresolvable_host);
    run_test("Engine not started", test_engine_not_started);
    run_test("Checksum", test_checksum);
    run_test("Format duration", test_format_duration);
    run_test("Resolve IPv4 literal", test_resolve_literal);
    run_test("Sanitize file name", test_sanitize_file_name);
    run_test("Cancel token", test_cancel_token);
    run_test("Unregistered callback", test_unregistered_callback_not_run);

    return finish_tests("Ping tests");
}
