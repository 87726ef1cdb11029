#include "src/collector/collector_registry.hpp"
#include "src/collector/site_config_store.hpp"
#include "src/collector/status_aggregator.hpp"

#include <chrono>
#include <iostream>
#include <string>

namespace {
int Fail(const std::string& message) {
    std::cerr << message << std::endl;
    return 1;
}

sitewatch::report HealthyReport(int cameras_total, int cameras_up) {
    sitewatch::report r;
    for (int i = 0; i < cameras_total; ++i) {
        sitewatch::camera_result c;
        c.camera_id = "cam" + std::to_string(i);
        c.up = i < cameras_up;
        r.cameras.push_back(c);
    }
    r.network.dns_ok = true;
    r.network.http_ok = true;
    r.network.uplink_ping_ms["1.1.1.1"] = 12.0;
    return r;
}
} // namespace

int main() {
    using namespace std::chrono_literals;
    using sitewatch::site_classification;

    auto now = sitewatch::from_epoch_seconds(1700000000);
    auto clock = [&now] { return now; };
    auto store = std::make_shared<sitewatch::MemorySiteConfigStore>();
    store->load(nlohmann::json::parse(R"({"configured-only": {"cameras": []}})"));
    sitewatch::registry_options options;
    options.offline_threshold = 180s;
    auto registry = std::make_shared<sitewatch::CollectorRegistry>(store, options, clock);
    sitewatch::StatusAggregator aggregator(registry, options.offline_threshold, clock);

    registry->register_agent("agent-galpao", "host", std::nullopt);
    registry->approve("agent-galpao", "galpao");

    auto status = aggregator.status("galpao");
    if (!status || status->classification != site_classification::offline || status->last_report_age) {
        return Fail("Approved site without reports should be Offline.");
    }

    // scenario 2: all up, fresh
    const auto t0 = now;
    registry->submit_report("agent-galpao", std::nullopt, HealthyReport(2, 2));
    now = t0 + 30s;
    status = aggregator.status("galpao");
    if (!status || status->classification != site_classification::ok) {
        return Fail("Fresh healthy report should be OK.");
    }
    if (status->cameras_up != 2 || status->cameras_total != 2 || status->last_report_age != std::optional<std::chrono::seconds>(30s)) {
        return Fail("Camera counts or age wrong.");
    }

    // staleness is monotonic for a fixed report
    bool went_offline = false;
    for (int s = 0; s <= 400; s += 10) {
        now = t0 + std::chrono::seconds(s);
        auto cls = aggregator.status("galpao")->classification;
        if (s <= 180 && cls != site_classification::ok) {
            return Fail("Report within the threshold reported non-OK at " + std::to_string(s) + "s.");
        }
        if (cls == site_classification::offline) {
            went_offline = true;
        } else if (went_offline) {
            return Fail("Offline site recovered without a new report.");
        }
    }
    if (!went_offline) {
        return Fail("Stale report never went Offline.");
    }

    // scenario 4: perfect content but 200s old
    now = t0 + 200s;
    if (aggregator.status("galpao")->classification != site_classification::offline) {
        return Fail("Report older than the threshold must be Offline.");
    }

    // scenario 3: one camera down
    registry->submit_report("agent-galpao", std::nullopt, HealthyReport(2, 1));
    now += 5s;
    status = aggregator.status("galpao");
    if (status->classification != site_classification::degraded || status->cameras_up != 1) {
        return Fail("One camera down should be Degraded.");
    }

    // network failures degrade too
    auto no_dns = HealthyReport(2, 2);
    no_dns.network.dns_ok = false;
    registry->submit_report("agent-galpao", std::nullopt, no_dns);
    if (aggregator.status("galpao")->classification != site_classification::degraded) {
        return Fail("DNS failure should be Degraded.");
    }
    auto dead_uplink = HealthyReport(2, 2);
    dead_uplink.network.uplink_ping_ms["8.8.8.8"] = std::nullopt;
    registry->submit_report("agent-galpao", std::nullopt, dead_uplink);
    if (aggregator.status("galpao")->classification != site_classification::degraded) {
        return Fail("Unreachable uplink should be Degraded.");
    }

    // pure classification at the exact threshold
    auto fixed = HealthyReport(1, 1);
    auto at = sitewatch::classify_site("x", fixed, t0, t0 + 180s, 180s);
    auto past = sitewatch::classify_site("x", fixed, t0, t0 + 181s, 180s);
    if (at.classification != site_classification::ok || past.classification != site_classification::offline) {
        return Fail("Offline must start strictly after the threshold.");
    }
    auto just_past = sitewatch::classify_site("galpao", fixed, t0, t0 + 180s + 900ms, 180s);
    if (just_past.classification != site_classification::offline) {
        return Fail("Report less than a second past the threshold must be Offline.");
    }
    if (just_past.last_report_age != std::optional<std::chrono::seconds>(180s)) {
        return Fail("Reported age should be whole seconds.");
    }

    if (aggregator.status("unknown-site").has_value()) {
        return Fail("Unknown site should have no status.");
    }
    auto all = aggregator.status_all();
    if (all.size() != 2) {
        return Fail("status_all should list every known site.");
    }
    for (const auto& s : all) {
        if (s.site == "configured-only" && s.classification != site_classification::offline) {
            return Fail("Configured site without an agent should be Offline.");
        }
    }
    if (std::string(sitewatch::to_string(site_classification::degraded)) != "Degraded") {
        return Fail("Classification names wrong.");
    }
    nlohmann::json j = *aggregator.status("galpao");
    if (j.at("classification") != "Degraded" || j.at("cameras_total") != 2) {
        return Fail("Status JSON wrong: " + j.dump());
    }

    return 0;
}
