#include "agent_config.hpp"
#include "agent_loop.hpp"
#include "collector_client.hpp"
#include "identity_store.hpp"
#include "probe_runner.hpp"
#include "probes.hpp"
#include "update_manager.hpp"
#include "src/util/config.hpp"
#include <boost/asio.hpp>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <memory>
#include <thread>
#include <unistd.h>
#include <spdlog/spdlog.h>

#ifndef SITEWATCH_VERSION
#define SITEWATCH_VERSION "0.0.0"
#endif

int main(int argc, char* argv[]) {
    std::string config_path = argc >= 2 ? argv[1] : "agent.json";

    nlohmann::json cfg = nlohmann::json::object();
    if (std::filesystem::exists(config_path)) {
        cfg = sitewatch::load_config(config_path);
        if (cfg.is_null()) {
            spdlog::error("Invalid config: {}", config_path);
            return 1;
        }
    } else {
        spdlog::warn("Config {} not found, using defaults and environment", config_path);
    }

    sitewatch::agent_config config;
    try {
        config = sitewatch::parse_agent_config(cfg);
    } catch (const nlohmann::json::exception& e) {
        spdlog::error("Bad value in config {}: {}", config_path, e.what());
        return 1;
    }
    sitewatch::apply_env_overrides(config);
    if (config.server.empty()) {
        spdlog::error("No collector configured, set \"server\" in {} or AGENT_SERVER", config_path);
        return 1;
    }

    sitewatch::init_logging("agent", config.log_path, config.log_level);

    if (config.package_path.empty()) {
        std::error_code ec;
        config.package_path = std::filesystem::read_symlink("/proc/self/exe", ec).string();
        if (ec) {
            spdlog::warn("Cannot resolve the running executable ({}), self-update disabled", ec.message());
        }
    }

    std::string hostname = boost::asio::ip::host_name();

    auto identity_store = std::make_shared<sitewatch::IdentityStore>(config.state_path);
    auto api = std::make_shared<sitewatch::HttpCollectorClient>(config.server, config.request_timeout_sec);
    auto probes = std::make_shared<sitewatch::SystemProbes>(config.request_timeout_sec);
    auto runner = std::make_shared<sitewatch::ProbeRunner>(probes);

    std::shared_ptr<sitewatch::UpdateManager> updater;
    if (!config.package_path.empty()) {
        sitewatch::update_options update_opts;
        update_opts.package_path = config.package_path;
        update_opts.state_path = config.update_state_path;
        update_opts.rollback_after_failures = config.rollback_after_failures;
        updater = std::make_shared<sitewatch::UpdateManager>(api, update_opts);
    }

    sitewatch::AgentLoop loop(config, hostname, SITEWATCH_VERSION, identity_store, api, runner, updater);
    std::string package_path = config.package_path;
    loop.set_restart_hook([package_path, argv]() {
        spdlog::default_logger()->flush();
        execv(package_path.c_str(), argv);
        spdlog::error("execv {} failed: {}", package_path, std::strerror(errno));
        return false;
    });

    // signals only cut the sleep between cycles short
    boost::asio::io_context signal_ioc;
    boost::asio::signal_set signals(signal_ioc, SIGINT, SIGTERM);
    signals.async_wait([&loop](const boost::system::error_code& ec, int signo) {
        if (ec) return;
        spdlog::info("Signal {} received, stopping after the current cycle", signo);
        loop.request_stop();
    });
    std::thread signal_thread([&signal_ioc] { signal_ioc.run(); });

    spdlog::info("Agent start: server {}, site {}, interval {}s, {}", config.server,
        config.site.empty() ? "-" : config.site, config.interval_sec, config.loop ? "loop" : "single pass");
    std::cout << "***************Agent start****************" << std::endl;
    std::cout << "Server: " << config.server << std::endl;
    std::cout << "Host: " << hostname << std::endl;
    std::cout << "Version: " << SITEWATCH_VERSION << std::endl;
    std::cout << "Mode: " << (config.loop ? "loop" : "single pass") << std::endl;
    std::cout << "******************************************" << std::endl;

    int code = loop.run();

    signal_ioc.stop();
    signal_thread.join();
    return code;
}
