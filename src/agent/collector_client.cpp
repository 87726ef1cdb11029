#include "collector_client.hpp"
#include <algorithm>
#include <fstream>
#include <spdlog/spdlog.h>
#include "src/util/util.hpp"

namespace sitewatch {

    static constexpr std::size_t MAX_PACKAGE_BYTES = 256 * 1024 * 1024;

    const char* to_string(call_status status) {
        switch (status) {
            case call_status::ok: return "ok";
            case call_status::network_error: return "network_error";
            case call_status::unauthorized: return "unauthorized";
            case call_status::not_found: return "not_found";
            case call_status::bad_response: return "bad_response";
        }
        return "unknown";
    }

    HttpCollectorClient::HttpCollectorClient(std::string server, int timeout_seconds)
        : server_(std::move(server)), client_(timeout_seconds) {}

    HttpCollectorClient::~HttpCollectorClient() {}

    call_status HttpCollectorClient::classify(int status_code) {
        if (status_code < 0) return call_status::network_error;
        if (status_code == 200) return call_status::ok;
        if (status_code == 401 || status_code == 403) return call_status::unauthorized;
        if (status_code == 404) return call_status::not_found;
        if (status_code >= 500) return call_status::network_error;
        return call_status::bad_response;
    }

    call_status HttpCollectorClient::register_agent(const agent_identity& identity,
            const std::optional<std::string>& requested_site, registration_reply& reply) {
        nlohmann::json body = {{"agent_id", identity.agent_id}, {"hostname", identity.hostname}};
        if (requested_site) {
            body["requested_site"] = *requested_site;
        }
        http_request req;
        req.url = server_ + "/api/agents/register";
        req.body = body.dump();
        req.headers["Content-Type"] = "application/json";
        http_response res;
        int code = client_.post(req, res);
        auto status = classify(code);
        if (status != call_status::ok) {
            spdlog::warn("Register with {} failed: status {} {}", server_, code, res.error);
            return status;
        }
        try {
            auto j = nlohmann::json::parse(res.body);
            auto parsed = parse_registration_status(j.at("status").get<std::string>());
            if (!parsed) {
                spdlog::warn("Unknown registration status in reply: {}", res.body);
                return call_status::bad_response;
            }
            reply = registration_reply{};
            reply.status = *parsed;
            if (reply.status == registration_status::approved) {
                reply.site = j.value("site", "");
                if (j.contains("token") && j["token"].is_string()) {
                    reply.token = j["token"].get<std::string>();
                }
                reply.config = j.get<site_config>();
            }
        } catch (const nlohmann::json::exception& e) {
            spdlog::warn("Bad registration reply from {}: {}", server_, e.what());
            return call_status::bad_response;
        }
        return call_status::ok;
    }

    call_status HttpCollectorClient::fetch_config(const std::string& site, const agent_identity& identity, site_config& config) {
        http_request req;
        req.url = server_ + "/api/agents/" + util::url_encode(site) + "/config";
        req.headers["X-Agent-Id"] = identity.agent_id;
        if (identity.token) {
            req.headers["X-Agent-Token"] = *identity.token;
        }
        http_response res;
        int code = client_.get(req, res);
        auto status = classify(code);
        if (status != call_status::ok) {
            spdlog::warn("Config fetch for site {} failed: status {} {}", site, code, res.error);
            return status;
        }
        try {
            config = nlohmann::json::parse(res.body).get<site_config>();
        } catch (const nlohmann::json::exception& e) {
            spdlog::warn("Bad config reply for site {}: {}", site, e.what());
            return call_status::bad_response;
        }
        return call_status::ok;
    }

    call_status HttpCollectorClient::submit_report(const std::string& site, const std::optional<std::string>& token, const report& r) {
        http_request req;
        req.url = server_ + "/api/agents/" + util::url_encode(site) + "/report";
        req.body = nlohmann::json(r).dump();
        req.headers["Content-Type"] = "application/json";
        req.headers["X-Agent-Id"] = r.agent_id;
        if (token) {
            req.headers["X-Agent-Token"] = *token;
        }
        http_response res;
        int code = client_.post(req, res);
        auto status = classify(code);
        if (status != call_status::ok) {
            spdlog::warn("Report for site {} rejected: status {} {}", site, code, res.error);
        }
        return status;
    }

    call_status HttpCollectorClient::latest_release(release_info& info) {
        http_request req;
        req.url = server_ + "/api/agent/version";
        http_response res;
        int code = client_.get(req, res);
        auto status = classify(code);
        if (status != call_status::ok) {
            if (status != call_status::not_found) {
                spdlog::warn("Version check failed: status {} {}", code, res.error);
            }
            return status;
        }
        try {
            info = nlohmann::json::parse(res.body).get<release_info>();
        } catch (const nlohmann::json::exception& e) {
            spdlog::warn("Bad version reply: {}", e.what());
            return call_status::bad_response;
        }
        return call_status::ok;
    }

    call_status HttpCollectorClient::download_package(const std::string& dest_path) {
        http_request req;
        req.url = server_ + "/api/agent/download";
        http_response res;
        HttpClient downloader(std::max(client_.timeout(), 120));
        downloader.set_body_limit(MAX_PACKAGE_BYTES);
        int code = downloader.get(req, res);
        auto status = classify(code);
        if (status != call_status::ok) {
            spdlog::warn("Package download failed: status {} {}", code, res.error);
            return status;
        }
        std::ofstream ofs(dest_path, std::ios::binary | std::ios::trunc);
        if (!ofs.is_open()) {
            spdlog::error("Cannot open {} for the downloaded package", dest_path);
            return call_status::bad_response;
        }
        ofs.write(res.body.data(), static_cast<std::streamsize>(res.body.size()));
        ofs.close();
        if (!ofs) {
            spdlog::error("Failed writing downloaded package to {}", dest_path);
            return call_status::bad_response;
        }
        return call_status::ok;
    }
} // namespace sitewatch
