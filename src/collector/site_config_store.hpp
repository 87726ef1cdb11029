#pragma once
#include "src/common/protocol.hpp"
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace sitewatch {

    // Per-site camera inventory and agent settings. The production store is an
    // external key-value service; the collector only goes through this seam.
    class SiteConfigStore {
    public:
        virtual ~SiteConfigStore() = default;

        // empty config for unknown sites
        virtual site_config get(const std::string& site) = 0;
        virtual void put(const std::string& site, const site_config& config) = 0;
        virtual std::vector<std::string> sites() = 0;
    };

    class MemorySiteConfigStore : public SiteConfigStore {
    public:
        MemorySiteConfigStore();
        ~MemorySiteConfigStore() override;

        // seed from the collector config "sites" object
        void load(const nlohmann::json& sites);

        site_config get(const std::string& site) override;
        void put(const std::string& site, const site_config& config) override;
        std::vector<std::string> sites() override;

    private:
        std::map<std::string, site_config> configs_;
        std::shared_mutex mutex_;
    };
} // namespace sitewatch
