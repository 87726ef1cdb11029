#include "agent_config.hpp"
#include <cstdlib>
#include <type_traits>
#include <spdlog/spdlog.h>
#include "src/util/util.hpp"

namespace sitewatch {

    namespace {
        std::string trim_server(std::string server) {
            while (!server.empty() && server.back() == '/') {
                server.pop_back();
            }
            return server;
        }

        std::optional<std::string> process_env(const std::string& name) {
            const char* value = std::getenv(name.c_str());
            if (value == nullptr) {
                return std::nullopt;
            }
            return std::string(value);
        }
    }

    agent_config parse_agent_config(const nlohmann::json& j) {
        agent_config c;
        if (!j.is_object()) {
            return c;
        }
        c.site = j.value("site", c.site);
        c.server = trim_server(j.value("server", c.server));
        if (j.contains("token") && j["token"].is_string() && !j["token"].get<std::string>().empty()) {
            c.token = j["token"].get<std::string>();
        }
        c.interval_sec = j.value("interval_sec", c.interval_sec);
        c.loop = j.value("loop", c.loop);
        if (j.contains("cameras")) {
            c.cameras = parse_camera_list(j["cameras"]);
        }

        c.state_path = j.value("state_path", c.state_path);
        c.update_state_path = j.value("update_state_path", c.update_state_path);
        c.package_path = j.value("package_path", c.package_path);
        c.update_check_interval_sec = j.value("update_check_interval_sec", c.update_check_interval_sec);
        c.rollback_after_failures = j.value("rollback_after_failures", c.rollback_after_failures);
        c.request_timeout_sec = j.value("request_timeout_sec", c.request_timeout_sec);
        c.log_path = j.value("logpath", c.log_path);
        c.log_level = j.value("loglevel", c.log_level);

        if (j.contains("uplink_targets") && j["uplink_targets"].is_array()) {
            c.uplink_targets = j["uplink_targets"].get<std::vector<std::string>>();
        }
        c.dns_probe_host = j.value("dns_probe_host", c.dns_probe_host);
        c.http_probe_url = j.value("http_probe_url", c.http_probe_url);
        c.speedtest = j.value("speedtest", c.speedtest);
        c.speed_download_bytes = j.value("speed_download_bytes", c.speed_download_bytes);
        c.speed_upload_bytes = j.value("speed_upload_bytes", c.speed_upload_bytes);
        c.speedtest_interval_sec = j.value("speedtest_interval_sec", c.speedtest_interval_sec);
        c.mac_tracking = j.value("mac_tracking", c.mac_tracking);
        c.rejected_backoff_max_sec = j.value("rejected_backoff_max_sec", c.rejected_backoff_max_sec);

        if (c.interval_sec < 1) {
            spdlog::warn("interval_sec {} is invalid, using 60", c.interval_sec);
            c.interval_sec = 60;
        }
        if (c.rollback_after_failures < 1) {
            c.rollback_after_failures = 1;
        }
        return c;
    }

    void apply_env_overrides(agent_config& config, const env_lookup& env) {
        const env_lookup& lookup = env ? env : env_lookup(process_env);

        auto get_int = [&](const char* name, auto& target) {
            auto value = lookup(name);
            if (!value || value->empty()) return;
            auto parsed = util::parse_int(*value);
            if (!parsed || *parsed < 1) {
                spdlog::warn("Ignoring malformed {}={}", name, *value);
                return;
            }
            target = static_cast<std::remove_reference_t<decltype(target)>>(*parsed);
        };
        auto get_bool = [&](const char* name, bool& target) {
            auto value = lookup(name);
            if (!value || value->empty()) return;
            auto parsed = util::parse_bool(*value);
            if (!parsed) {
                spdlog::warn("Ignoring malformed {}={}", name, *value);
                return;
            }
            target = *parsed;
        };

        if (auto site = lookup("AGENT_SITE"); site && !site->empty()) config.site = *site;
        if (auto server = lookup("AGENT_SERVER"); server && !server->empty()) config.server = trim_server(*server);
        if (auto token = lookup("AGENT_TOKEN"); token && !token->empty()) config.token = *token;
        get_int("AGENT_INTERVAL_SEC", config.interval_sec);
        get_bool("AGENT_LOOP", config.loop);
        get_bool("AGENT_SPEEDTEST", config.speedtest);
        get_int("AGENT_SPEEDTEST_DOWNLOAD_BYTES", config.speed_download_bytes);
        get_int("AGENT_SPEEDTEST_UPLOAD_BYTES", config.speed_upload_bytes);
        get_bool("AGENT_MAC_TRACKING", config.mac_tracking);
    }
} // namespace sitewatch
