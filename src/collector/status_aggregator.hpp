#pragma once
#include "src/common/protocol.hpp"
#include "collector_registry.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sitewatch {

    // Site health from the latest report and its receipt time. Offline wins
    // over everything once the report is older than the threshold.
    site_status classify_site(const std::string& site, const std::optional<report>& latest,
        const std::optional<time_point>& last_seen, time_point now, std::chrono::seconds offline_threshold);

    // Recomputes on every call; nothing is cached between reads.
    class StatusAggregator {
    public:
        StatusAggregator(std::shared_ptr<CollectorRegistry> registry, std::chrono::seconds offline_threshold, clock_fn clock = {});
        ~StatusAggregator();

        // nullopt for a site the collector has never heard of
        std::optional<site_status> status(const std::string& site);
        std::vector<site_status> status_all();

    private:
        std::shared_ptr<CollectorRegistry> registry_;
        std::chrono::seconds offline_threshold_;
        clock_fn clock_;
    };
} // namespace sitewatch
