#pragma once
#include "src/common/protocol.hpp"
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace sitewatch {

    struct agent_config {
        std::string site;                   // requested site, optional
        std::string server;                 // collector base url
        std::optional<std::string> token;
        int interval_sec = 60;
        bool loop = false;
        camera_list cameras;                // local fallback when the server has none

        std::string state_path = "agent_state.json";
        std::string update_state_path = "agent_update.json";
        std::string package_path;           // empty: the running executable
        int update_check_interval_sec = 300;
        int rollback_after_failures = 3;
        int request_timeout_sec = 10;
        std::string log_path = "logs/";
        std::string log_level = "info";

        std::vector<std::string> uplink_targets{"1.1.1.1", "8.8.8.8"};
        std::string dns_probe_host = "google.com";
        std::string http_probe_url = "http://www.google.com/";
        bool speedtest = true;
        long long speed_download_bytes = 1024 * 1024;
        long long speed_upload_bytes = 512 * 1024;
        int speedtest_interval_sec = 60;
        bool mac_tracking = true;
        int rejected_backoff_max_sec = 900;
    };

    using env_lookup = std::function<std::optional<std::string>(const std::string&)>;

    // file values over defaults; throws nlohmann::json::exception on a wrongly typed field
    agent_config parse_agent_config(const nlohmann::json& j);

    // AGENT_* variables beat the file. Malformed numbers and booleans are
    // ignored with a warning. Cameras never come from the environment.
    void apply_env_overrides(agent_config& config, const env_lookup& env = {});
} // namespace sitewatch
