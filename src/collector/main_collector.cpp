#include "collector_handler.hpp"
#include "collector_registry.hpp"
#include "site_config_store.hpp"
#include "status_aggregator.hpp"
#include "src/http/http_server.hpp"
#include "src/util/config.hpp"
#include "src/util/util.hpp"
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <thread>
#include <spdlog/spdlog.h>

int main(int argc, char* argv[]) {
    if (argc < 2) {
        spdlog::error("Usage: sitewatch-collector <config.json>");
        return 1;
    }
    std::string config_path = argv[1];
    auto cfg = sitewatch::load_config(config_path);
    if (cfg.is_null()) {
        spdlog::error("Invalid or empty config: {}", config_path);
        return 1;
    }

    // Server defaults
    std::string address = "0.0.0.0";
    unsigned short port = 9000;
    int threads = 1;
    int request_timeout = 30;
    std::string log_path = "logs/";
    std::string log_level = "info";
    sitewatch::registry_options options;

    try {
        if (cfg.contains("server")) {
            auto s = cfg["server"];
            if (s.contains("address")) address = s["address"].get<std::string>();
            if (s.contains("port")) port = static_cast<unsigned short>(s["port"].get<int>());
            if (s.contains("threads")) threads = s["threads"].get<int>();
            if (s.contains("request_timeout")) request_timeout = s["request_timeout"].get<int>();
            if (s.contains("logpath")) log_path = s["logpath"].get<std::string>();
            if (s.contains("loglevel")) log_level = s["loglevel"].get<std::string>();
        }
        if (cfg.contains("registry")) {
            auto r = cfg["registry"];
            if (r.contains("offline_threshold_sec"))
                options.offline_threshold = std::chrono::seconds(r["offline_threshold_sec"].get<int>());
            if (r.contains("rejected_may_reapply"))
                options.rejected_may_reapply = r["rejected_may_reapply"].get<bool>();
        }
        if (cfg.contains("agent_tokens") && cfg["agent_tokens"].is_object()) {
            for (auto& [site, token] : cfg["agent_tokens"].items()) {
                options.agent_tokens[site] = token.get<std::string>();
            }
        }
    } catch (const nlohmann::json::exception& e) {
        spdlog::error("Bad value in config {}: {}", config_path, e.what());
        return 1;
    }

    sitewatch::init_logging("collector", log_path, log_level);

    auto store = std::make_shared<sitewatch::MemorySiteConfigStore>();
    if (cfg.contains("sites")) {
        store->load(cfg["sites"]);
    }
    auto registry = std::make_shared<sitewatch::CollectorRegistry>(store, options);
    auto aggregator = std::make_shared<sitewatch::StatusAggregator>(registry, options.offline_threshold);

    auto handler = std::make_shared<sitewatch::CollectorHandler>(registry, aggregator, store);
    if (cfg.contains("admin_key") && cfg["admin_key"].is_string()) {
        handler->set_admin_key(cfg["admin_key"].get<std::string>());
    } else {
        spdlog::warn("No admin_key configured, admin routes are open");
    }

    // release offered to agents for self-update
    if (cfg.contains("release") && cfg["release"].is_object()) {
        auto r = cfg["release"];
        sitewatch::release_package release;
        release.info.version = r.value("version", "");
        release.package_path = r.value("package_path", "");
        std::error_code ec;
        auto size = std::filesystem::file_size(release.package_path, ec);
        if (release.info.version.empty() || ec) {
            spdlog::error("Release package unusable: version '{}', path '{}'", release.info.version, release.package_path);
        } else {
            release.info.size = size;
            release.info.sha256 = sitewatch::util::sha256_file(release.package_path);
            spdlog::info("Offering agent release {} ({} bytes, sha256 {})",
                release.info.version, release.info.size, release.info.sha256);
            handler->set_release(release);
        }
    }

    sitewatch::HttpServer server;
    server.init(address, port, threads);
    server.set_request_timeout(request_timeout);
    handler->register_routes(server);

    sitewatch::net::io_context signal_ioc;
    sitewatch::net::signal_set signals(signal_ioc, SIGINT, SIGTERM);
    signals.async_wait([&server](const boost::system::error_code& ec, int signo) {
        if (ec) return;
        spdlog::info("Signal {} received, stopping collector", signo);
        server.stop();
    });
    std::thread signal_thread([&signal_ioc] { signal_ioc.run(); });

    spdlog::info("Collector start on {}:{} with {} threads", address, port, threads);
    std::cout << "***************Collector start****************" << std::endl;
    std::cout << "Address: " << address << std::endl;
    std::cout << "Port: " << port << std::endl;
    std::cout << "Threads: " << threads << std::endl;
    std::cout << "Offline threshold: " << options.offline_threshold.count() << "s" << std::endl;
    std::cout << "**********************************************" << std::endl;

    server.run_server();

    signal_ioc.stop();
    signal_thread.join();
    spdlog::info("Collector stopped");
    return 0;
}
