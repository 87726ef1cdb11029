#include "collector_handler.hpp"
#include <algorithm>
#include <fstream>
#include <functional>
#include <iterator>
#include <spdlog/spdlog.h>
#include "src/util/util.hpp"

namespace sitewatch {

    static constexpr long long MAX_SPEEDTEST_BYTES = 64LL * 1024 * 1024;

    CollectorHandler::CollectorHandler(std::shared_ptr<CollectorRegistry> registry,
            std::shared_ptr<StatusAggregator> aggregator,
            std::shared_ptr<SiteConfigStore> store)
        : registry_(std::move(registry)),
          aggregator_(std::move(aggregator)),
          store_(std::move(store)) {
    }

    CollectorHandler::~CollectorHandler() {}

    void CollectorHandler::register_routes(HttpServer& server) {
        using namespace std::placeholders;
        server.register_route("/api/agents/register", std::bind(&CollectorHandler::register_agent, this, _1, _2, _3));
        server.register_route("/api/agents/{site}/config", std::bind(&CollectorHandler::agent_config, this, _1, _2, _3));
        server.register_route("/api/agents/{site}/report", std::bind(&CollectorHandler::agent_report, this, _1, _2, _3));
        server.register_route("/api/agent/version", std::bind(&CollectorHandler::agent_version, this, _1, _2, _3));
        server.register_route("/api/agent/download", std::bind(&CollectorHandler::agent_download, this, _1, _2, _3));
        server.register_route("/api/speedtest/download", std::bind(&CollectorHandler::speedtest_download, this, _1, _2, _3));
        server.register_route("/api/speedtest/upload", std::bind(&CollectorHandler::speedtest_upload, this, _1, _2, _3));
        server.register_route("/api/status", std::bind(&CollectorHandler::status_list, this, _1, _2, _3));
        server.register_route("/api/status/{site}", std::bind(&CollectorHandler::status_site, this, _1, _2, _3));
        server.register_route("/api/admin/agents", std::bind(&CollectorHandler::admin_agents, this, _1, _2, _3));
        server.register_route("/api/admin/agents/{agent_id}/approve", std::bind(&CollectorHandler::admin_approve, this, _1, _2, _3));
        server.register_route("/api/admin/agents/{agent_id}/reject", std::bind(&CollectorHandler::admin_reject, this, _1, _2, _3));
        server.register_route("/api/admin/sites/{site}/config", std::bind(&CollectorHandler::admin_site_config, this, _1, _2, _3));
    }

    void CollectorHandler::reply_json(const response_ptr& res, http::status status, const nlohmann::json& body) {
        res->result(status);
        res->set(http::field::content_type, "application/json");
        res->body() = body.dump();
    }

    std::optional<std::string> CollectorHandler::header(const request_ptr& req, const char* name) {
        auto it = req->find(name);
        if (it == req->end() || it->value().empty()) {
            return std::nullopt;
        }
        return std::string(it->value());
    }

    bool CollectorHandler::admin_allowed(const request_ptr& req) const {
        if (admin_key_.empty()) {
            return true;
        }
        auto key = header(req, "X-Admin-Key");
        return key && *key == admin_key_;
    }

    net::awaitable<void> CollectorHandler::register_agent(request_ptr req, response_ptr res, context_ptr ctx) {
        try {
            if (req->method() != http::verb::post) {
                res->result(http::status::method_not_allowed);
                spdlog::warn("Method not allowed, only POST is allowed, url: {}", std::string(req->target()));
                co_return;
            }
            auto body = nlohmann::json::parse(req->body());
            auto agent_id = body.at("agent_id").get<std::string>();
            auto hostname = body.value("hostname", "");
            std::optional<std::string> requested_site;
            if (body.contains("requested_site") && body["requested_site"].is_string()) {
                requested_site = body["requested_site"].get<std::string>();
            }
            if (agent_id.empty()) {
                reply_json(res, http::status::bad_request, {{"error", "agent_id is required"}});
                co_return;
            }

            auto reply = registry_->register_agent(agent_id, hostname, requested_site);
            nlohmann::json jbody = {{"status", to_string(reply.status)}};
            if (reply.status == registration_status::approved) {
                jbody["site"] = reply.site;
                if (reply.token) jbody["token"] = *reply.token;
                nlohmann::json cfg = reply.config;
                for (auto& [key, value] : cfg.items()) {
                    jbody[key] = value;
                }
            }
            spdlog::debug("Register {} from {} -> {}", agent_id, ctx->remote_address, to_string(reply.status));
            reply_json(res, http::status::ok, jbody);
            co_return;
        } catch (const nlohmann::json::exception& e) {
            reply_json(res, http::status::bad_request, {{"error", "invalid registration payload"}});
            spdlog::warn("Bad register payload from {}: {}", ctx->remote_address, e.what());
            co_return;
        } catch (const std::exception& e) {
            res->result(http::status::internal_server_error);
            spdlog::error("Internal server error in register handler: {}", e.what());
            co_return;
        }
    }

    net::awaitable<void> CollectorHandler::agent_config(request_ptr req, response_ptr res, context_ptr ctx) {
        try {
            if (req->method() != http::verb::get) {
                res->result(http::status::method_not_allowed);
                spdlog::warn("Method not allowed, only GET is allowed, url: {}", std::string(req->target()));
                co_return;
            }
            auto site = ctx->get_param("site");
            auto bound = registry_->agent_for_site(site);
            auto agent_id = header(req, "X-Agent-Id");
            site_config cfg;
            if (bound && (!agent_id || *agent_id == *bound)) {
                cfg = registry_->get_config(*bound, header(req, "X-Agent-Token"));
            } else {
                spdlog::debug("Config for site {} requested by unassigned agent {}", site, agent_id.value_or("-"));
            }
            nlohmann::json jbody = cfg;
            jbody["site"] = site;
            reply_json(res, http::status::ok, jbody);
            co_return;
        } catch (const std::exception& e) {
            res->result(http::status::internal_server_error);
            spdlog::error("Internal server error in config handler: {}", e.what());
            co_return;
        }
    }

    net::awaitable<void> CollectorHandler::agent_report(request_ptr req, response_ptr res, context_ptr ctx) {
        try {
            if (req->method() != http::verb::post) {
                res->result(http::status::method_not_allowed);
                spdlog::warn("Method not allowed, only POST is allowed, url: {}", std::string(req->target()));
                co_return;
            }
            auto site = ctx->get_param("site");
            auto r = nlohmann::json::parse(req->body()).get<report>();
            if (r.site.empty()) {
                r.site = site;
            }
            if (r.site != site) {
                reply_json(res, http::status::bad_request, {{"error", "site in body does not match url"}});
                co_return;
            }
            if (r.agent_id.empty()) {
                r.agent_id = header(req, "X-Agent-Id").value_or("");
            }
            auto agent_id = r.agent_id;
            auto result = registry_->submit_report(agent_id, header(req, "X-Agent-Token"), std::move(r));
            if (result == submit_result::unauthorized) {
                reply_json(res, http::status::unauthorized, {{"error", "unauthorized"}});
                co_return;
            }
            reply_json(res, http::status::ok, {{"ok", true}, {"site", site}});
            co_return;
        } catch (const nlohmann::json::exception& e) {
            reply_json(res, http::status::bad_request, {{"error", "invalid report payload"}});
            spdlog::warn("Bad report payload from {}: {}", ctx->remote_address, e.what());
            co_return;
        } catch (const std::exception& e) {
            res->result(http::status::internal_server_error);
            spdlog::error("Internal server error in report handler: {}", e.what());
            co_return;
        }
    }

    net::awaitable<void> CollectorHandler::agent_version(request_ptr req, response_ptr res, context_ptr ctx) {
        if (req->method() != http::verb::get) {
            res->result(http::status::method_not_allowed);
            co_return;
        }
        if (!release_) {
            reply_json(res, http::status::not_found, {{"error", "no release published"}});
            co_return;
        }
        reply_json(res, http::status::ok, release_->info);
        co_return;
    }

    net::awaitable<void> CollectorHandler::agent_download(request_ptr req, response_ptr res, context_ptr ctx) {
        try {
            if (req->method() != http::verb::get) {
                res->result(http::status::method_not_allowed);
                co_return;
            }
            if (!release_) {
                reply_json(res, http::status::not_found, {{"error", "no release published"}});
                co_return;
            }
            std::ifstream file(release_->package_path, std::ios::binary);
            if (!file.is_open()) {
                res->result(http::status::internal_server_error);
                spdlog::error("Failed to open release package: {}", release_->package_path);
                co_return;
            }
            std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
            res->body() = std::move(content);
            res->set(http::field::content_type, "application/octet-stream");
            res->set("X-Package-Version", release_->info.version);
            res->result(http::status::ok);
            spdlog::info("Package {} sent to {}", release_->info.version, ctx->remote_address);
            co_return;
        } catch (const std::exception& e) {
            res->result(http::status::internal_server_error);
            spdlog::error("Internal server error in download handler: {}", e.what());
            co_return;
        }
    }

    net::awaitable<void> CollectorHandler::speedtest_download(request_ptr req, response_ptr res, context_ptr ctx) {
        if (req->method() != http::verb::get) {
            res->result(http::status::method_not_allowed);
            co_return;
        }
        long long size = util::parse_int(ctx->get_param("size_bytes")).value_or(1024 * 1024);
        size = std::clamp(size, 1LL, MAX_SPEEDTEST_BYTES);
        res->body().assign(static_cast<size_t>(size), '\0');
        res->set(http::field::content_type, "application/octet-stream");
        res->result(http::status::ok);
        co_return;
    }

    net::awaitable<void> CollectorHandler::speedtest_upload(request_ptr req, response_ptr res, context_ptr ctx) {
        if (req->method() != http::verb::post) {
            res->result(http::status::method_not_allowed);
            co_return;
        }
        reply_json(res, http::status::ok, {{"received_bytes", req->body().size()}});
        co_return;
    }

    net::awaitable<void> CollectorHandler::status_list(request_ptr req, response_ptr res, context_ptr ctx) {
        try {
            if (req->method() != http::verb::get) {
                res->result(http::status::method_not_allowed);
                spdlog::warn("Method not allowed, only GET is allowed, url: {}", std::string(req->target()));
                co_return;
            }
            nlohmann::json jbody = nlohmann::json::array();
            for (const auto& status : aggregator_->status_all()) {
                jbody.push_back(status);
            }
            reply_json(res, http::status::ok, jbody);
            co_return;
        } catch (const std::exception& e) {
            res->result(http::status::internal_server_error);
            spdlog::error("Internal server error in status handler: {}", e.what());
            co_return;
        }
    }

    net::awaitable<void> CollectorHandler::status_site(request_ptr req, response_ptr res, context_ptr ctx) {
        try {
            if (req->method() != http::verb::get) {
                res->result(http::status::method_not_allowed);
                co_return;
            }
            auto site = ctx->get_param("site");
            auto status = aggregator_->status(site);
            if (!status) {
                reply_json(res, http::status::not_found, {{"error", "unknown site"}, {"site", site}});
                co_return;
            }
            reply_json(res, http::status::ok, *status);
            co_return;
        } catch (const std::exception& e) {
            res->result(http::status::internal_server_error);
            spdlog::error("Internal server error in site status handler: {}", e.what());
            co_return;
        }
    }

    net::awaitable<void> CollectorHandler::admin_agents(request_ptr req, response_ptr res, context_ptr ctx) {
        if (!admin_allowed(req)) {
            reply_json(res, http::status::unauthorized, {{"error", "unauthorized"}});
            co_return;
        }
        if (req->method() != http::verb::get) {
            res->result(http::status::method_not_allowed);
            co_return;
        }
        nlohmann::json jbody = nlohmann::json::array();
        for (const auto& record : registry_->list_agents()) {
            jbody.push_back(record);
        }
        reply_json(res, http::status::ok, jbody);
        co_return;
    }

    net::awaitable<void> CollectorHandler::admin_approve(request_ptr req, response_ptr res, context_ptr ctx) {
        try {
            if (!admin_allowed(req)) {
                reply_json(res, http::status::unauthorized, {{"error", "unauthorized"}});
                co_return;
            }
            if (req->method() != http::verb::post) {
                res->result(http::status::method_not_allowed);
                co_return;
            }
            std::string site;
            if (!req->body().empty()) {
                site = nlohmann::json::parse(req->body()).value("site", "");
            }
            auto agent_id = ctx->get_param("agent_id");
            auto outcome = registry_->approve(agent_id, site);
            switch (outcome.result) {
                case approve_result::ok:
                    reply_json(res, http::status::ok, {{"ok", true}, {"agent", *registry_->get_agent(agent_id)}});
                    break;
                case approve_result::conflict:
                    reply_json(res, http::status::conflict, {{"error", "conflict"}, {"reason", outcome.reason}});
                    break;
                case approve_result::unknown_agent:
                    reply_json(res, http::status::not_found, {{"error", "unknown agent"}, {"reason", outcome.reason}});
                    break;
                case approve_result::invalid:
                    reply_json(res, http::status::bad_request, {{"error", "invalid"}, {"reason", outcome.reason}});
                    break;
            }
            co_return;
        } catch (const nlohmann::json::exception& e) {
            reply_json(res, http::status::bad_request, {{"error", "invalid approve payload"}});
            co_return;
        } catch (const std::exception& e) {
            res->result(http::status::internal_server_error);
            spdlog::error("Internal server error in approve handler: {}", e.what());
            co_return;
        }
    }

    net::awaitable<void> CollectorHandler::admin_reject(request_ptr req, response_ptr res, context_ptr ctx) {
        if (!admin_allowed(req)) {
            reply_json(res, http::status::unauthorized, {{"error", "unauthorized"}});
            co_return;
        }
        if (req->method() != http::verb::post) {
            res->result(http::status::method_not_allowed);
            co_return;
        }
        auto agent_id = ctx->get_param("agent_id");
        if (!registry_->reject(agent_id)) {
            reply_json(res, http::status::not_found, {{"error", "unknown agent"}});
            co_return;
        }
        reply_json(res, http::status::ok, {{"ok", true}});
        co_return;
    }

    net::awaitable<void> CollectorHandler::admin_site_config(request_ptr req, response_ptr res, context_ptr ctx) {
        try {
            if (!admin_allowed(req)) {
                reply_json(res, http::status::unauthorized, {{"error", "unauthorized"}});
                co_return;
            }
            auto site = ctx->get_param("site");
            if (req->method() == http::verb::get) {
                nlohmann::json jbody = store_->get(site);
                reply_json(res, http::status::ok, jbody);
                co_return;
            }
            if (req->method() != http::verb::put) {
                res->result(http::status::method_not_allowed);
                co_return;
            }
            auto cfg = nlohmann::json::parse(req->body()).get<site_config>();
            store_->put(site, cfg);
            spdlog::info("Site {} config replaced: {} cameras", site, cfg.cameras.size());
            reply_json(res, http::status::ok, {{"ok", true}});
            co_return;
        } catch (const nlohmann::json::exception& e) {
            reply_json(res, http::status::bad_request, {{"error", "invalid site config"}});
            co_return;
        } catch (const std::exception& e) {
            res->result(http::status::internal_server_error);
            spdlog::error("Internal server error in site config handler: {}", e.what());
            co_return;
        }
    }
} // namespace sitewatch
