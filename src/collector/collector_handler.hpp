#pragma once
#include <memory>
#include <optional>
#include <string>
#include "src/http/http_server.hpp"
// Include Boost.Beast and Boost.Asio so this header is self-contained
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/asio.hpp>
#include <boost/asio/awaitable.hpp>
#include "collector_registry.hpp"
#include "site_config_store.hpp"
#include "status_aggregator.hpp"
#include <nlohmann/json.hpp>

namespace sitewatch {

    // agent package offered for self-update
    struct release_package {
        release_info info;
        std::string package_path;
    };

    class CollectorHandler {
    public:
        CollectorHandler(std::shared_ptr<CollectorRegistry> registry,
            std::shared_ptr<StatusAggregator> aggregator,
            std::shared_ptr<SiteConfigStore> store);
        ~CollectorHandler();

        void set_admin_key(const std::string& key) { admin_key_ = key; }
        void set_release(std::optional<release_package> release) { release_ = std::move(release); }

        // register every route below on the server
        void register_routes(HttpServer& server);

        // agent surface
        net::awaitable<void> register_agent(request_ptr req, response_ptr res, context_ptr ctx);
        net::awaitable<void> agent_config(request_ptr req, response_ptr res, context_ptr ctx);
        net::awaitable<void> agent_report(request_ptr req, response_ptr res, context_ptr ctx);
        net::awaitable<void> agent_version(request_ptr req, response_ptr res, context_ptr ctx);
        net::awaitable<void> agent_download(request_ptr req, response_ptr res, context_ptr ctx);
        net::awaitable<void> speedtest_download(request_ptr req, response_ptr res, context_ptr ctx);
        net::awaitable<void> speedtest_upload(request_ptr req, response_ptr res, context_ptr ctx);

        // dashboard surface
        net::awaitable<void> status_list(request_ptr req, response_ptr res, context_ptr ctx);
        net::awaitable<void> status_site(request_ptr req, response_ptr res, context_ptr ctx);

        // admin surface
        net::awaitable<void> admin_agents(request_ptr req, response_ptr res, context_ptr ctx);
        net::awaitable<void> admin_approve(request_ptr req, response_ptr res, context_ptr ctx);
        net::awaitable<void> admin_reject(request_ptr req, response_ptr res, context_ptr ctx);
        net::awaitable<void> admin_site_config(request_ptr req, response_ptr res, context_ptr ctx);

    private:
        bool admin_allowed(const request_ptr& req) const;
        static void reply_json(const response_ptr& res, http::status status, const nlohmann::json& body);
        static std::optional<std::string> header(const request_ptr& req, const char* name);

        std::shared_ptr<CollectorRegistry> registry_;
        std::shared_ptr<StatusAggregator> aggregator_;
        std::shared_ptr<SiteConfigStore> store_;
        std::string admin_key_;
        std::optional<release_package> release_;
    };
} // namespace sitewatch
