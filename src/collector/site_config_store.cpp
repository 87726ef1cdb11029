#include "site_config_store.hpp"
#include <mutex>
#include <spdlog/spdlog.h>

namespace sitewatch {

    MemorySiteConfigStore::MemorySiteConfigStore() {}
    MemorySiteConfigStore::~MemorySiteConfigStore() {}

    void MemorySiteConfigStore::load(const nlohmann::json& sites) {
        if (!sites.is_object()) {
            return;
        }
        std::unique_lock<std::shared_mutex> lock(mutex_);
        for (const auto& [site, value] : sites.items()) {
            if (!value.is_object()) {
                spdlog::warn("Ignoring site config for {}: not an object", site);
                continue;
            }
            try {
                configs_[site] = value.get<site_config>();
                spdlog::info("Loaded site {} with {} cameras", site, configs_[site].cameras.size());
            } catch (const nlohmann::json::exception& e) {
                spdlog::warn("Ignoring site config for {}: {}", site, e.what());
            }
        }
    }

    site_config MemorySiteConfigStore::get(const std::string& site) {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = configs_.find(site);
        if (it == configs_.end()) {
            return {};
        }
        return it->second;
    }

    void MemorySiteConfigStore::put(const std::string& site, const site_config& config) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        configs_[site] = config;
    }

    std::vector<std::string> MemorySiteConfigStore::sites() {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        std::vector<std::string> out;
        out.reserve(configs_.size());
        for (const auto& [site, cfg] : configs_) {
            out.push_back(site);
        }
        return out;
    }
} // namespace sitewatch
