#include "src/agent/probe_runner.hpp"
#include "src/agent/probes.hpp"

#include <chrono>
#include <iostream>
#include <map>
#include <mutex>
#include <string>
#include <thread>

namespace {
int Fail(const std::string& message) {
    std::cerr << message << std::endl;
    return 1;
}

const char* kPingUp =
    "PING 192.168.0.10 (192.168.0.10) 56(84) bytes of data.\n"
    "64 bytes from 192.168.0.10: icmp_seq=1 ttl=64 time=0.412 ms\n"
    "64 bytes from 192.168.0.10: icmp_seq=2 ttl=64 time=0.389 ms\n"
    "\n"
    "--- 192.168.0.10 ping statistics ---\n"
    "4 packets transmitted, 4 received, 0% packet loss, time 3004ms\n"
    "rtt min/avg/max/mdev = 0.345/0.456/0.601/0.091 ms\n";

const char* kPingDown =
    "PING 192.168.0.99 (192.168.0.99) 56(84) bytes of data.\n"
    "\n"
    "--- 192.168.0.99 ping statistics ---\n"
    "4 packets transmitted, 0 received, 100% packet loss, time 3060ms\n";

const char* kArpTable =
    "IP address       HW type     Flags       HW address            Mask     Device\n"
    "192.168.0.10     0x1         0x2         AA:BB:CC:00:11:22     *        eth0\n"
    "192.168.0.50     0x1         0x2         aa:bb:cc:00:11:33     *        eth0\n"
    "192.168.0.77     0x1         0x0         00:00:00:00:00:00     *        eth0\n";

// scripted reachability per host; counts pings so concurrency can be observed
class FakeProbes : public sitewatch::Probes {
public:
    std::map<std::string, sitewatch::ping_result> hosts;
    std::map<std::string, std::string> arp;     // ip -> mac
    bool dns = true;
    bool http = true;
    int speed_tests = 0;
    std::chrono::milliseconds ping_delay{0};

    sitewatch::ping_result ping(const std::string& host, int) override {
        if (ping_delay.count() > 0) {
            std::this_thread::sleep_for(ping_delay);
        }
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = hosts.find(host);
        return it == hosts.end() ? sitewatch::ping_result{} : it->second;
    }
    bool resolve(const std::string&) override { return dns; }
    bool http_get(const std::string&) override { return http; }
    std::optional<std::string> mac_for_ip(const std::string& ip) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = arp.find(ip);
        if (it == arp.end()) return std::nullopt;
        return it->second;
    }
    std::optional<std::string> ip_for_mac(const std::string& mac) override {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [ip, m] : arp) {
            if (m == mac) return ip;
        }
        return std::nullopt;
    }
    sitewatch::speed_result speed_test(const std::string&, const std::optional<std::string>&, long long, long long) override {
        ++speed_tests;
        return {12.5, 3.25};
    }

private:
    std::mutex mutex_;
};

sitewatch::ping_result Up(double ms) {
    return {true, ms, 0.0};
}
} // namespace

int main() {
    // host validation before anything reaches the command line
    if (!sitewatch::is_safe_host("192.168.0.10") || !sitewatch::is_safe_host("cam-01.local") ||
        !sitewatch::is_safe_host("fe80::1")) {
        return Fail("Valid hosts rejected.");
    }
    if (sitewatch::is_safe_host("-f") || sitewatch::is_safe_host("--help") || sitewatch::is_safe_host("") ||
        sitewatch::is_safe_host("10.0.0.1; reboot") || sitewatch::is_safe_host("$(id)")) {
        return Fail("Option-like or shell-unsafe host accepted.");
    }

    // ping output parsing
    auto up = sitewatch::parse_ping_output(kPingUp, 0);
    if (!up.reachable || !up.avg_ms || *up.avg_ms != 0.456 || up.loss_pct != std::optional<double>(0.0)) {
        return Fail("Reachable ping output parsed wrongly.");
    }
    auto down = sitewatch::parse_ping_output(kPingDown, 1);
    if (down.reachable || down.avg_ms || down.loss_pct != std::optional<double>(100.0)) {
        return Fail("Unreachable ping output parsed wrongly.");
    }
    if (sitewatch::parse_ping_output(kPingDown, 0).reachable) {
        return Fail("Exit code 0 with 100% loss must be unreachable.");
    }
    if (sitewatch::parse_ping_output("PING x\n", 0).reachable) {
        return Fail("Exit code 0 without any reply must be unreachable.");
    }
    if (!sitewatch::parse_ping_output("64 bytes from 10.0.0.1: icmp_seq=1 ttl=64 time=1 ms\n", 0).reachable) {
        return Fail("A reply line without statistics should still be reachable.");
    }

    // arp table lookups
    if (sitewatch::arp_find_mac(kArpTable, "192.168.0.10") != std::optional<std::string>("aa:bb:cc:00:11:22")) {
        return Fail("MAC lookup failed or not lowercased.");
    }
    if (sitewatch::arp_find_mac(kArpTable, "192.168.0.77")) {
        return Fail("Incomplete ARP entries must be skipped.");
    }
    if (sitewatch::arp_find_ip(kArpTable, "AA:BB:CC:00:11:33") != std::optional<std::string>("192.168.0.50")) {
        return Fail("IP lookup by MAC failed.");
    }

    if (sitewatch::to_mbps(1000000, 1.0) != std::optional<double>(8.0) || sitewatch::to_mbps(1, 0.0)) {
        return Fail("Mbps conversion wrong.");
    }
    if (sitewatch::to_mbps(1234567, 1.0) != std::optional<double>(9.88)) {
        return Fail("Mbps should be rounded to two decimals.");
    }
    if (!sitewatch::is_private_ipv4("172.20.1.1") || sitewatch::is_private_ipv4("172.32.1.1") ||
        sitewatch::is_private_ipv4("8.8.8.8") || !sitewatch::is_private_ipv4("10.1.2.3")) {
        return Fail("Private range detection wrong.");
    }

    // probe runner: order, suspicious latency, MAC tracking
    auto fake = std::make_shared<FakeProbes>();
    fake->hosts["192.168.0.10"] = Up(2.0);
    fake->hosts["192.168.0.11"] = Up(750.0);
    fake->hosts["1.1.1.1"] = Up(12.0);
    fake->arp["192.168.0.10"] = "aa:bb:cc:00:11:22";
    fake->ping_delay = std::chrono::milliseconds(100);

    auto now = sitewatch::from_epoch_seconds(1000);
    sitewatch::ProbeRunner runner(fake, [&now] { return now; });

    sitewatch::camera_list cameras{
        {"cam1", "Gate", "192.168.0.10"},
        {"", "Yard", "192.168.0.11"},
        {"", "", "192.168.0.12"},
    };
    sitewatch::probe_options options;
    options.uplink_targets = {"1.1.1.1", "8.8.8.8"};
    options.dns_probe_host = "example.com";
    options.http_probe_url = "http://example.com/";
    options.server = "http://collector:9000";
    options.speedtest_interval = std::chrono::seconds(60);

    auto start = std::chrono::steady_clock::now();
    auto results = runner.run(cameras, options);
    auto elapsed = std::chrono::steady_clock::now() - start;

    if (results.cameras.size() != 3) {
        return Fail("Every configured camera needs a result.");
    }
    if (results.cameras[0].camera_id != "cam1" || results.cameras[1].camera_id != "Yard" ||
        results.cameras[2].camera_id != "192.168.0.12") {
        return Fail("Results must keep configuration order and use id, name, ip as key.");
    }
    if (!results.cameras[0].up || results.cameras[0].mac != std::optional<std::string>("aa:bb:cc:00:11:22")) {
        return Fail("Reachable camera should carry its MAC.");
    }
    if (!results.cameras[1].suspicious || results.cameras[0].suspicious) {
        return Fail("Only high latency on a private address is suspicious.");
    }
    if (results.cameras[2].up || results.cameras[2].ping_ms) {
        return Fail("Unreachable camera reported up.");
    }
    // 2 uplink pings run serially, 3 camera pings in parallel; fully serial would be 500ms
    if (elapsed >= std::chrono::milliseconds(450)) {
        return Fail("Camera probes did not run concurrently.");
    }

    if (!results.network.dns_ok || !results.network.http_ok) {
        return Fail("Network probe flags wrong.");
    }
    if (results.network.uplink_ping_ms.at("1.1.1.1") != std::optional<double>(12.0) ||
        results.network.uplink_ping_ms.at("8.8.8.8")) {
        return Fail("Uplink ping results wrong.");
    }
    if (results.network.all_ok()) {
        return Fail("An unreachable uplink must fail all_ok().");
    }
    if (results.network.download_mbps != std::optional<double>(12.5) || fake->speed_tests != 1) {
        return Fail("Speed test result missing.");
    }

    // camera moved: offline at old ip, MAC now seen elsewhere
    fake->hosts.erase("192.168.0.10");
    fake->hosts["192.168.0.60"] = Up(3.0);
    fake->arp.erase("192.168.0.10");
    fake->arp["192.168.0.60"] = "aa:bb:cc:00:11:22";
    now += std::chrono::seconds(30);
    results = runner.run(cameras, options);
    const auto& moved = results.cameras[0];
    if (!moved.up || !moved.ip_changed || moved.ip != "192.168.0.60" ||
        moved.old_ip != std::optional<std::string>("192.168.0.10")) {
        return Fail("Camera should be found at its new address through the MAC cache.");
    }
    if (fake->speed_tests != 1 || results.network.upload_mbps != std::optional<double>(3.25)) {
        return Fail("Speed test should be served from cache inside its interval.");
    }

    now += std::chrono::seconds(60);
    runner.run({}, options);
    if (fake->speed_tests != 2) {
        return Fail("Speed test should run again once the interval passed.");
    }

    options.mac_tracking = false;
    fake->hosts.erase("192.168.0.60");
    results = runner.run(cameras, options);
    if (results.cameras[0].up || results.cameras[0].ip_changed || results.cameras[0].mac) {
        return Fail("MAC tracking disabled must not relocate cameras.");
    }

    return 0;
}
