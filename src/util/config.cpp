#include "config.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/daily_file_sink.h>

namespace sitewatch {

    nlohmann::json load_config(const std::string& config_path) {
        nlohmann::json j;
        std::ifstream ifs(config_path);
        if (!ifs.is_open()) {
            spdlog::error("Failed to open config file: {}", config_path);
            return {};
        }
        try {
            ifs >> j;
        } catch (const std::exception& e) {
            spdlog::error("Failed to parse config JSON: {}", e.what());
            return {};
        }
        return j;
    }

    bool init_logging(const std::string& logger_name, std::string log_path, const std::string& log_level) {
        std::error_code ec;
        std::filesystem::create_directories(log_path, ec);
        if (ec) {
            spdlog::warn("Cannot create log directory {}: {}, logging to console", log_path, ec.message());
            return false;
        }
        try {
            auto logger = spdlog::daily_logger_mt(logger_name, log_path.append("/" + logger_name + ".log"), 0, 0, false, 7);
            spdlog::set_default_logger(logger);
            logger->flush_on(spdlog::level::info);
        } catch (const spdlog::spdlog_ex& e) {
            std::cerr << "Log init failed: " << e.what() << std::endl;
            return false;
        }
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

        if (log_level == "debug") {
            spdlog::set_level(spdlog::level::debug);
        } else if (log_level == "warn") {
            spdlog::set_level(spdlog::level::warn);
        } else if (log_level == "error") {
            spdlog::set_level(spdlog::level::err);
        } else if (log_level == "trace") {
            spdlog::set_level(spdlog::level::trace);
        } else {
            spdlog::set_level(spdlog::level::info);
        }
        return true;
    }
} // namespace sitewatch
