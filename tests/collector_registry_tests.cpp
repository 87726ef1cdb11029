#include "src/collector/collector_registry.hpp"
#include "src/collector/site_config_store.hpp"
#include "src/util/util.hpp"

#include <iostream>
#include <string>
#include <thread>
#include <vector>

namespace {
int Fail(const std::string& message) {
    std::cerr << message << std::endl;
    return 1;
}

std::shared_ptr<sitewatch::MemorySiteConfigStore> MakeStore() {
    auto store = std::make_shared<sitewatch::MemorySiteConfigStore>();
    store->load(nlohmann::json::parse(R"({
        "loja-centro": {"cameras": [{"id": "cam1", "ip": "192.168.0.10"}], "interval_sec": 30},
        "galpao": {"cameras": [{"ip": "10.0.0.5"}, {"ip": "10.0.0.6"}]}
    })"));
    return store;
}

sitewatch::report MakeReport(const std::string& agent_id, const std::string& site) {
    sitewatch::report r;
    r.agent_id = agent_id;
    r.site = site;
    r.cameras.push_back({"cam1", "Gate", "192.168.0.10", true});
    r.network.dns_ok = true;
    r.network.http_ok = true;
    return r;
}
} // namespace

int main() {
    // idempotent registration and scenario 1
    {
        sitewatch::CollectorRegistry registry(MakeStore(), {});
        const auto id = sitewatch::util::stable_id("PC-07");
        auto first = registry.register_agent(id, "PC-07", std::nullopt);
        auto second = registry.register_agent(id, "PC-07", std::nullopt);
        if (first.status != sitewatch::registration_status::pending ||
            second.status != sitewatch::registration_status::pending) {
            return Fail("Unapproved registration should stay pending.");
        }
        if (registry.list_agents().size() != 1) {
            return Fail("Repeated registration created a second record.");
        }
        if (!registry.get_config(id, std::nullopt).cameras.empty()) {
            return Fail("Pending agent must get an empty config.");
        }
        if (registry.submit_report(id, std::nullopt, MakeReport(id, "loja-centro")) != sitewatch::submit_result::unauthorized) {
            return Fail("Pending agent must not submit reports.");
        }

        if (registry.approve(id, "loja-centro").result != sitewatch::approve_result::ok) {
            return Fail("Approval failed.");
        }
        auto approved = registry.register_agent(id, "PC-07", std::nullopt);
        if (approved.status != sitewatch::registration_status::approved || approved.site != "loja-centro") {
            return Fail("Approved agent should register straight to approved.");
        }
        if (approved.config.cameras.size() != 1 || approved.config.interval_sec != std::optional<int>(30)) {
            return Fail("Registration should carry the site config.");
        }
        auto again = registry.register_agent(id, "PC-07", std::string("other-site"));
        if (again.status != sitewatch::registration_status::approved || again.site != "loja-centro") {
            return Fail("Re-registration must keep the original assignment.");
        }
        if (registry.agent_for_site("loja-centro") != std::optional<std::string>(id)) {
            return Fail("Site binding missing.");
        }
    }

    // site uniqueness
    {
        sitewatch::CollectorRegistry registry(MakeStore(), {});
        registry.register_agent("A", "host-a", std::nullopt);
        registry.register_agent("B", "host-b", std::string("site1"));
        if (registry.approve("A", "site1").result != sitewatch::approve_result::ok) {
            return Fail("First approval failed.");
        }
        auto conflict = registry.approve("B", "site1");
        if (conflict.result != sitewatch::approve_result::conflict || conflict.reason.empty()) {
            return Fail("Second agent on the same site must conflict.");
        }
        if (registry.get_agent("B")->state != sitewatch::approval_state::pending) {
            return Fail("Conflicting approval must leave the record pending.");
        }
        if (registry.approve("A", "site1").result != sitewatch::approve_result::ok) {
            return Fail("Re-approving the same binding should be fine.");
        }
        if (registry.approve("ghost", "site2").result != sitewatch::approve_result::unknown_agent) {
            return Fail("Unknown agent must be reported.");
        }
        registry.register_agent("C", "host-c", std::nullopt);
        if (registry.approve("C", "").result != sitewatch::approve_result::invalid) {
            return Fail("Approval without any site must be invalid.");
        }
        // missing site falls back to the requested one
        if (registry.approve("B", "").result != sitewatch::approve_result::conflict) {
            return Fail("Requested site1 is still taken.");
        }
        if (registry.approve("A", "site3").result != sitewatch::approve_result::ok ||
            registry.agent_for_site("site1").has_value()) {
            return Fail("Moving an agent should free its old site.");
        }
        if (registry.approve("B", "").result != sitewatch::approve_result::ok ||
            registry.get_agent("B")->site != std::optional<std::string>("site1")) {
            return Fail("Approval should fall back to the requested site.");
        }
    }

    // rejection, with and without re-application
    {
        sitewatch::CollectorRegistry strict(MakeStore(), {});
        strict.register_agent("R", "host-r", std::nullopt);
        if (!strict.reject("R") || strict.reject("nobody")) {
            return Fail("Reject result wrong.");
        }
        if (strict.register_agent("R", "host-r", std::nullopt).status != sitewatch::registration_status::rejected) {
            return Fail("Rejected agent should stay rejected.");
        }
        if (strict.approve("R", "galpao").result != sitewatch::approve_result::ok ||
            strict.register_agent("R", "host-r", std::nullopt).status != sitewatch::registration_status::approved) {
            return Fail("An admin may approve a rejected agent directly.");
        }
        strict.reject("R");
        if (strict.agent_for_site("galpao").has_value()) {
            return Fail("Rejecting an approved agent must free its site.");
        }

        sitewatch::registry_options lenient_options;
        lenient_options.rejected_may_reapply = true;
        sitewatch::CollectorRegistry lenient(MakeStore(), lenient_options);
        lenient.register_agent("R", "host-r", std::nullopt);
        lenient.reject("R");
        if (lenient.register_agent("R", "host-r", std::nullopt).status != sitewatch::registration_status::pending) {
            return Fail("Re-application should return a rejected agent to pending.");
        }
    }

    // token checks
    {
        sitewatch::registry_options options;
        options.agent_tokens["galpao"] = "s3cret";
        sitewatch::CollectorRegistry registry(MakeStore(), options);
        registry.register_agent("G", "host-g", std::nullopt);
        registry.approve("G", "galpao");
        auto reply = registry.register_agent("G", "host-g", std::nullopt);
        if (reply.token != std::optional<std::string>("s3cret")) {
            return Fail("Approved agent should receive the site token.");
        }
        if (!registry.get_config("G", std::string("wrong")).cameras.empty()) {
            return Fail("Invalid token must not receive the camera list.");
        }
        if (registry.get_config("G", std::string("s3cret")).cameras.size() != 2) {
            return Fail("Valid token should receive the camera list.");
        }
        if (registry.submit_report("G", std::nullopt, MakeReport("G", "galpao")) != sitewatch::submit_result::unauthorized) {
            return Fail("Missing token must be unauthorized.");
        }
        if (registry.submit_report("G", std::string("s3cret"), MakeReport("G", "other")) != sitewatch::submit_result::unauthorized) {
            return Fail("Report for a foreign site must be unauthorized.");
        }
        if (registry.submit_report("G", std::string("s3cret"), MakeReport("G", "galpao")) != sitewatch::submit_result::ok) {
            return Fail("Valid report rejected.");
        }
        auto snap = registry.snapshot("galpao");
        if (!snap || !snap->latest || !snap->last_seen || snap->latest->agent_id != "G") {
            return Fail("Report not stored as the latest for the site.");
        }
    }

    // concurrent reports for different sites, latest wins per site
    {
        auto now = sitewatch::from_epoch_seconds(1000);
        sitewatch::CollectorRegistry registry(MakeStore(), {}, [&now] { return now; });
        const int agents = 8;
        for (int i = 0; i < agents; ++i) {
            auto id = "agent-" + std::to_string(i);
            registry.register_agent(id, id, std::nullopt);
            if (registry.approve(id, "site-" + std::to_string(i)).result != sitewatch::approve_result::ok) {
                return Fail("Approval in concurrency setup failed.");
            }
        }
        std::vector<std::thread> writers;
        for (int i = 0; i < agents; ++i) {
            writers.emplace_back([&registry, i] {
                auto id = "agent-" + std::to_string(i);
                for (int n = 0; n < 200; ++n) {
                    auto r = MakeReport(id, "site-" + std::to_string(i));
                    r.timestamp = n;
                    registry.submit_report(id, std::nullopt, r);
                    registry.snapshots();
                }
            });
        }
        for (auto& t : writers) {
            t.join();
        }
        for (int i = 0; i < agents; ++i) {
            auto snap = registry.snapshot("site-" + std::to_string(i));
            if (!snap || !snap->latest || snap->latest->timestamp != 199 || snap->latest->agent_id != "agent-" + std::to_string(i)) {
                return Fail("Concurrent reports mixed up sites.");
            }
        }
        if (registry.snapshot("never-heard-of").has_value()) {
            return Fail("Unknown site should have no snapshot.");
        }
    }

    return 0;
}
