#include "status_aggregator.hpp"

namespace sitewatch {

    site_status classify_site(const std::string& site, const std::optional<report>& latest,
            const std::optional<time_point>& last_seen, time_point now, std::chrono::seconds offline_threshold) {
        site_status status;
        status.site = site;
        status.classification = site_classification::offline;
        if (latest) {
            status.cameras_total = static_cast<int>(latest->cameras.size());
            status.cameras_up = latest->cameras_up();
        }
        if (!last_seen) {
            return status;
        }

        auto age = now - *last_seen;
        if (age < time_point::duration::zero()) {
            age = time_point::duration::zero();
        }
        // whole seconds for display only
        status.last_report_age = std::chrono::duration_cast<std::chrono::seconds>(age);
        if (age > offline_threshold || !latest) {
            return status;
        }

        if (!latest->network.all_ok() || status.cameras_up < status.cameras_total) {
            status.classification = site_classification::degraded;
        } else {
            status.classification = site_classification::ok;
        }
        return status;
    }

    StatusAggregator::StatusAggregator(std::shared_ptr<CollectorRegistry> registry, std::chrono::seconds offline_threshold, clock_fn clock)
        : registry_(std::move(registry)),
          offline_threshold_(offline_threshold),
          clock_(clock ? std::move(clock) : clock_fn([] { return system_clock::now(); })) {}

    StatusAggregator::~StatusAggregator() {}

    std::optional<site_status> StatusAggregator::status(const std::string& site) {
        auto snap = registry_->snapshot(site);
        if (!snap) {
            return std::nullopt;
        }
        return classify_site(snap->site, snap->latest, snap->last_seen, clock_(), offline_threshold_);
    }

    std::vector<site_status> StatusAggregator::status_all() {
        const auto now = clock_();
        std::vector<site_status> out;
        for (const auto& snap : registry_->snapshots()) {
            out.push_back(classify_site(snap.site, snap.latest, snap.last_seen, now, offline_threshold_));
        }
        return out;
    }
} // namespace sitewatch
