#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace sitewatch {
    // Load JSON config from file. On error returns a null json value.
    nlohmann::json load_config(const std::string& config_path);

    // Install a daily rotating file logger as the default spdlog logger.
    // Returns false (console logging kept) if the log directory is unusable.
    bool init_logging(const std::string& logger_name, std::string log_path, const std::string& log_level);
} // namespace sitewatch
