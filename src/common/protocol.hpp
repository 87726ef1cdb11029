#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// Types shared by the agent and the collector, and their JSON wire form.
namespace sitewatch {

    using system_clock = std::chrono::system_clock;
    using time_point = system_clock::time_point;
    using clock_fn = std::function<time_point()>;

    std::int64_t to_epoch_seconds(time_point tp);
    time_point from_epoch_seconds(std::int64_t seconds);

    struct camera_entry {
        std::string id;
        std::string name;
        std::string ip;
    };
    using camera_list = std::vector<camera_entry>;

    // configured id, else name, else ip
    std::string camera_key(const camera_entry& camera);

    struct camera_result {
        std::string camera_id;
        std::string name;
        std::string ip;
        bool up = false;
        std::optional<std::string> mac;
        std::optional<double> ping_ms;
        std::optional<double> packet_loss;
        bool suspicious = false;
        bool ip_changed = false;
        std::optional<std::string> old_ip;
    };

    struct network_results {
        bool dns_ok = false;
        bool http_ok = false;
        std::map<std::string, std::optional<double>> uplink_ping_ms;    // target -> avg ms, null if unreachable
        std::optional<double> download_mbps;
        std::optional<double> upload_mbps;

        // dns, http and every uplink target answered
        bool all_ok() const;
    };

    struct report {
        std::string agent_id;
        std::string site;
        std::string hostname;
        std::int64_t timestamp = 0;
        std::string agent_version;
        int interval_sec = 0;
        std::vector<camera_result> cameras;
        network_results network;

        int cameras_up() const;
    };

    struct agent_identity {
        std::string agent_id;
        std::string hostname;
        std::optional<std::string> site;
        std::optional<std::string> token;
    };

    // per-site settings served to agents
    struct site_config {
        camera_list cameras;
        std::optional<int> interval_sec;
        std::optional<bool> speedtest;
        std::optional<long long> speed_download_bytes;
        std::optional<long long> speed_upload_bytes;
    };

    enum class approval_state { pending, approved, rejected };

    struct agent_record {
        std::string agent_id;
        std::string hostname;
        std::optional<std::string> requested_site;
        std::optional<std::string> site;     // null unless approved
        approval_state state = approval_state::pending;
        time_point first_seen{};
        time_point last_seen{};
        std::optional<std::string> token;
    };

    enum class registration_status { approved, pending, rejected };

    struct registration_reply {
        registration_status status = registration_status::pending;
        std::string site;
        std::optional<std::string> token;
        site_config config;
    };

    enum class site_classification { ok, degraded, offline };

    struct site_status {
        std::string site;
        site_classification classification = site_classification::offline;
        int cameras_up = 0;
        int cameras_total = 0;
        std::optional<std::chrono::seconds> last_report_age;
    };

    struct release_info {
        std::string version;
        std::string sha256;
        std::uint64_t size = 0;
    };

    const char* to_string(approval_state state);
    const char* to_string(registration_status status);
    const char* to_string(site_classification classification);
    std::optional<registration_status> parse_registration_status(const std::string& value);

    void to_json(nlohmann::json& j, const camera_entry& c);
    void from_json(const nlohmann::json& j, camera_entry& c);
    void to_json(nlohmann::json& j, const camera_result& c);
    void from_json(const nlohmann::json& j, camera_result& c);
    void to_json(nlohmann::json& j, const network_results& n);
    void from_json(const nlohmann::json& j, network_results& n);
    void to_json(nlohmann::json& j, const report& r);
    void from_json(const nlohmann::json& j, report& r);
    void to_json(nlohmann::json& j, const site_config& c);
    void from_json(const nlohmann::json& j, site_config& c);
    void to_json(nlohmann::json& j, const agent_record& r);
    void to_json(nlohmann::json& j, const site_status& s);
    void to_json(nlohmann::json& j, const release_info& r);
    void from_json(const nlohmann::json& j, release_info& r);

    // cameras without an ip are dropped
    camera_list parse_camera_list(const nlohmann::json& j);
} // namespace sitewatch
