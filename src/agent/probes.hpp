#pragma once
#include <optional>
#include <string>

namespace sitewatch {

    struct ping_result {
        bool reachable = false;
        std::optional<double> avg_ms;
        std::optional<double> loss_pct;
    };

    struct speed_result {
        std::optional<double> download_mbps;
        std::optional<double> upload_mbps;
    };

    // Raw network primitives. The probe runner only talks to this seam so
    // tests can script reachability without touching the network.
    class Probes {
    public:
        virtual ~Probes() = default;

        virtual ping_result ping(const std::string& host, int count) = 0;
        virtual bool resolve(const std::string& host) = 0;
        virtual bool http_get(const std::string& url) = 0;
        virtual std::optional<std::string> mac_for_ip(const std::string& ip) = 0;
        virtual std::optional<std::string> ip_for_mac(const std::string& mac) = 0;
        // download/upload throughput against the collector speed test routes
        virtual speed_result speed_test(const std::string& server, const std::optional<std::string>& token,
            long long download_bytes, long long upload_bytes) = 0;
    };

    // Linux ping(8) output. A zero exit code alone is not enough: the output
    // must show a reply and less than 100% loss.
    ping_result parse_ping_output(const std::string& output, int exit_code);

    // host names and addresses that may go on the ping command line
    bool is_safe_host(const std::string& host);

    // lookups in /proc/net/arp formatted text; incomplete entries are skipped
    std::optional<std::string> arp_find_mac(const std::string& arp_table, const std::string& ip);
    std::optional<std::string> arp_find_ip(const std::string& arp_table, const std::string& mac);

    // bytes*8 / (seconds*1e6) rounded to 2 decimals, nullopt for a zero duration
    std::optional<double> to_mbps(long long bytes, double seconds);

    class SystemProbes : public Probes {
    public:
        explicit SystemProbes(int timeout_seconds = 10, int ping_attempts = 2);
        ~SystemProbes() override;

        ping_result ping(const std::string& host, int count) override;
        bool resolve(const std::string& host) override;
        bool http_get(const std::string& url) override;
        std::optional<std::string> mac_for_ip(const std::string& ip) override;
        std::optional<std::string> ip_for_mac(const std::string& mac) override;
        speed_result speed_test(const std::string& server, const std::optional<std::string>& token,
            long long download_bytes, long long upload_bytes) override;

    private:
        std::string read_arp_table() const;

        int timeout_seconds_;
        int ping_attempts_;
    };
} // namespace sitewatch
