#include "protocol.hpp"

namespace sitewatch {

    namespace {
        template <typename T>
        void put_optional(nlohmann::json& j, const char* key, const std::optional<T>& value) {
            if (value) {
                j[key] = *value;
            } else {
                j[key] = nullptr;
            }
        }

        template <typename T>
        std::optional<T> get_optional(const nlohmann::json& j, const char* key) {
            auto it = j.find(key);
            if (it == j.end() || it->is_null()) {
                return std::nullopt;
            }
            return it->get<T>();
        }
    }

    std::int64_t to_epoch_seconds(time_point tp) {
        return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
    }

    time_point from_epoch_seconds(std::int64_t seconds) {
        return time_point(std::chrono::seconds(seconds));
    }

    std::string camera_key(const camera_entry& camera) {
        if (!camera.id.empty()) return camera.id;
        if (!camera.name.empty()) return camera.name;
        return camera.ip;
    }

    bool network_results::all_ok() const {
        if (!dns_ok || !http_ok) {
            return false;
        }
        for (const auto& [target, ms] : uplink_ping_ms) {
            if (!ms) {
                return false;
            }
        }
        return true;
    }

    int report::cameras_up() const {
        int up = 0;
        for (const auto& c : cameras) {
            if (c.up) ++up;
        }
        return up;
    }

    const char* to_string(approval_state state) {
        switch (state) {
            case approval_state::pending: return "pending";
            case approval_state::approved: return "approved";
            case approval_state::rejected: return "rejected";
        }
        return "unknown";
    }

    const char* to_string(registration_status status) {
        switch (status) {
            case registration_status::approved: return "approved";
            case registration_status::pending: return "pending";
            case registration_status::rejected: return "rejected";
        }
        return "unknown";
    }

    const char* to_string(site_classification classification) {
        switch (classification) {
            case site_classification::ok: return "OK";
            case site_classification::degraded: return "Degraded";
            case site_classification::offline: return "Offline";
        }
        return "Offline";
    }

    std::optional<registration_status> parse_registration_status(const std::string& value) {
        if (value == "approved") return registration_status::approved;
        if (value == "pending") return registration_status::pending;
        if (value == "rejected") return registration_status::rejected;
        return std::nullopt;
    }

    void to_json(nlohmann::json& j, const camera_entry& c) {
        j = nlohmann::json{{"ip", c.ip}};
        if (!c.id.empty()) j["id"] = c.id;
        if (!c.name.empty()) j["name"] = c.name;
    }

    void from_json(const nlohmann::json& j, camera_entry& c) {
        c.ip = j.value("ip", "");
        c.name = j.contains("name") && j["name"].is_string() ? j["name"].get<std::string>() : "";
        if (j.contains("id") && j["id"].is_string()) {
            c.id = j["id"].get<std::string>();
        } else if (j.contains("id") && j["id"].is_number_integer()) {
            c.id = std::to_string(j["id"].get<long long>());
        } else {
            c.id.clear();
        }
    }

    camera_list parse_camera_list(const nlohmann::json& j) {
        camera_list cameras;
        if (!j.is_array()) {
            return cameras;
        }
        for (const auto& item : j) {
            if (!item.is_object()) continue;
            auto camera = item.get<camera_entry>();
            if (!camera.ip.empty()) {
                cameras.push_back(std::move(camera));
            }
        }
        return cameras;
    }

    void to_json(nlohmann::json& j, const camera_result& c) {
        j = nlohmann::json{
            {"camera_id", c.camera_id},
            {"name", c.name},
            {"ip", c.ip},
            {"up", c.up},
            {"suspicious", c.suspicious},
            {"ip_changed", c.ip_changed}
        };
        put_optional(j, "mac", c.mac);
        put_optional(j, "ping_ms", c.ping_ms);
        put_optional(j, "packet_loss", c.packet_loss);
        put_optional(j, "old_ip", c.old_ip);
    }

    void from_json(const nlohmann::json& j, camera_result& c) {
        c.camera_id = j.at("camera_id").get<std::string>();
        c.name = j.value("name", "");
        c.ip = j.value("ip", "");
        c.up = j.at("up").get<bool>();
        c.mac = get_optional<std::string>(j, "mac");
        c.ping_ms = get_optional<double>(j, "ping_ms");
        c.packet_loss = get_optional<double>(j, "packet_loss");
        c.suspicious = j.value("suspicious", false);
        c.ip_changed = j.value("ip_changed", false);
        c.old_ip = get_optional<std::string>(j, "old_ip");
    }

    void to_json(nlohmann::json& j, const network_results& n) {
        nlohmann::json uplinks = nlohmann::json::object();
        for (const auto& [target, ms] : n.uplink_ping_ms) {
            if (ms) {
                uplinks[target] = *ms;
            } else {
                uplinks[target] = nullptr;
            }
        }
        j = nlohmann::json{
            {"dns_ok", n.dns_ok},
            {"http_ok", n.http_ok},
            {"uplink_ping_ms", uplinks}
        };
        put_optional(j, "download_mbps", n.download_mbps);
        put_optional(j, "upload_mbps", n.upload_mbps);
    }

    void from_json(const nlohmann::json& j, network_results& n) {
        n.dns_ok = j.at("dns_ok").get<bool>();
        n.http_ok = j.at("http_ok").get<bool>();
        n.uplink_ping_ms.clear();
        if (j.contains("uplink_ping_ms") && j["uplink_ping_ms"].is_object()) {
            for (const auto& [target, ms] : j["uplink_ping_ms"].items()) {
                n.uplink_ping_ms[target] = ms.is_null() ? std::nullopt : std::optional<double>(ms.get<double>());
            }
        }
        n.download_mbps = get_optional<double>(j, "download_mbps");
        n.upload_mbps = get_optional<double>(j, "upload_mbps");
    }

    void to_json(nlohmann::json& j, const report& r) {
        j = nlohmann::json{
            {"agent_id", r.agent_id},
            {"site", r.site},
            {"hostname", r.hostname},
            {"timestamp", r.timestamp},
            {"agent_version", r.agent_version},
            {"interval_sec", r.interval_sec},
            {"cameras", r.cameras},
            {"network", r.network}
        };
    }

    void from_json(const nlohmann::json& j, report& r) {
        r.agent_id = j.value("agent_id", "");
        r.site = j.value("site", "");
        r.hostname = j.value("hostname", "");
        r.timestamp = j.value("timestamp", static_cast<std::int64_t>(0));
        r.agent_version = j.value("agent_version", "");
        r.interval_sec = j.value("interval_sec", 0);
        r.cameras = j.value("cameras", std::vector<camera_result>{});
        r.network = j.at("network").get<network_results>();
    }

    void to_json(nlohmann::json& j, const site_config& c) {
        j = nlohmann::json{{"cameras", c.cameras}};
        if (c.interval_sec) j["interval_sec"] = *c.interval_sec;
        if (c.speedtest) j["speedtest"] = *c.speedtest;
        if (c.speed_download_bytes) j["speed_download_bytes"] = *c.speed_download_bytes;
        if (c.speed_upload_bytes) j["speed_upload_bytes"] = *c.speed_upload_bytes;
    }

    void from_json(const nlohmann::json& j, site_config& c) {
        c.cameras = parse_camera_list(j.value("cameras", nlohmann::json::array()));
        c.interval_sec = get_optional<int>(j, "interval_sec");
        c.speedtest = get_optional<bool>(j, "speedtest");
        c.speed_download_bytes = get_optional<long long>(j, "speed_download_bytes");
        c.speed_upload_bytes = get_optional<long long>(j, "speed_upload_bytes");
    }

    void to_json(nlohmann::json& j, const agent_record& r) {
        j = nlohmann::json{
            {"agent_id", r.agent_id},
            {"hostname", r.hostname},
            {"approval_state", to_string(r.state)},
            {"first_seen", to_epoch_seconds(r.first_seen)},
            {"last_seen", to_epoch_seconds(r.last_seen)}
        };
        put_optional(j, "site", r.site);
        put_optional(j, "requested_site", r.requested_site);
    }

    void to_json(nlohmann::json& j, const site_status& s) {
        j = nlohmann::json{
            {"site", s.site},
            {"classification", to_string(s.classification)},
            {"cameras_up", s.cameras_up},
            {"cameras_total", s.cameras_total}
        };
        if (s.last_report_age) {
            j["last_report_age"] = s.last_report_age->count();
        } else {
            j["last_report_age"] = nullptr;
        }
    }

    void to_json(nlohmann::json& j, const release_info& r) {
        j = nlohmann::json{{"version", r.version}, {"sha256", r.sha256}, {"size", r.size}};
    }

    void from_json(const nlohmann::json& j, release_info& r) {
        r.version = j.value("version", "");
        r.sha256 = j.value("sha256", "");
        r.size = j.value("size", static_cast<std::uint64_t>(0));
    }
} // namespace sitewatch
