#pragma once
#include "probes.hpp"
#include "src/common/protocol.hpp"
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace sitewatch {

    struct probe_options {
        std::vector<std::string> uplink_targets;
        std::string dns_probe_host;
        std::string http_probe_url;
        bool mac_tracking = true;
        bool speedtest = true;
        long long speed_download_bytes = 1024 * 1024;
        long long speed_upload_bytes = 512 * 1024;
        std::chrono::seconds speedtest_interval{60};
        int ping_count = 4;
        // collector used for the speed test
        std::string server;
        std::optional<std::string> token;
    };

    struct probe_set {
        std::vector<camera_result> cameras;
        network_results network;
    };

    // Runs the fixed probe set for one cycle. Camera probes run concurrently
    // and come back in configuration order. The only state kept between
    // cycles is the camera MAC cache and the last speed test result.
    class ProbeRunner {
    public:
        explicit ProbeRunner(std::shared_ptr<Probes> probes, clock_fn clock = {});
        ~ProbeRunner();

        probe_set run(const camera_list& cameras, const probe_options& options);

        std::vector<camera_result> probe_cameras(const camera_list& cameras, const probe_options& options);
        network_results probe_network(const probe_options& options);

        std::optional<std::string> cached_mac(const std::string& camera_id);

    private:
        struct mac_entry {
            std::string mac;
            std::string last_ip;
        };

        camera_result probe_camera(const camera_entry& camera, const probe_options& options);

        std::shared_ptr<Probes> probes_;
        clock_fn clock_;

        std::map<std::string, mac_entry> mac_cache_;    // camera id -> last known MAC
        std::mutex mac_mutex_;

        std::optional<speed_result> last_speed_;
        std::optional<time_point> last_speed_at_;
    };

    // 10/8, 172.16/12 and 192.168/16
    bool is_private_ipv4(const std::string& ip);
} // namespace sitewatch
