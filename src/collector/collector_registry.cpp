#include "collector_registry.hpp"
#include <algorithm>
#include <set>
#include <spdlog/spdlog.h>

namespace sitewatch {

    CollectorRegistry::CollectorRegistry(std::shared_ptr<SiteConfigStore> store, registry_options options, clock_fn clock)
        : store_(std::move(store)),
          options_(std::move(options)),
          clock_(clock ? std::move(clock) : clock_fn([] { return system_clock::now(); })) {}

    CollectorRegistry::~CollectorRegistry() {}

    std::shared_ptr<CollectorRegistry::agent_entry> CollectorRegistry::find_agent(const std::string& agent_id) {
        std::shared_lock<std::shared_mutex> lock(agents_mutex_);
        auto it = agents_.find(agent_id);
        if (it == agents_.end()) {
            return nullptr;
        }
        return it->second;
    }

    std::shared_ptr<CollectorRegistry::site_slot> CollectorRegistry::slot_for(const std::string& site, bool create) {
        {
            std::shared_lock<std::shared_mutex> lock(sites_mutex_);
            auto it = sites_.find(site);
            if (it != sites_.end()) {
                return it->second;
            }
        }
        if (!create) {
            return nullptr;
        }
        std::unique_lock<std::shared_mutex> lock(sites_mutex_);
        auto& slot = sites_[site];
        if (!slot) {
            slot = std::make_shared<site_slot>();
        }
        return slot;
    }

    bool CollectorRegistry::token_valid(const std::string& site, const std::optional<std::string>& token) const {
        if (options_.agent_tokens.empty()) {
            return true;
        }
        auto it = options_.agent_tokens.find(site);
        return it != options_.agent_tokens.end() && token && *token == it->second;
    }

    registration_reply CollectorRegistry::register_agent(const std::string& agent_id, const std::string& hostname,
            const std::optional<std::string>& requested_site) {
        const auto now = clock_();
        auto entry = find_agent(agent_id);
        if (!entry) {
            std::unique_lock<std::shared_mutex> lock(agents_mutex_);
            auto& slot = agents_[agent_id];
            if (!slot) {
                slot = std::make_shared<agent_entry>();
                slot->record.agent_id = agent_id;
                slot->record.hostname = hostname;
                slot->record.requested_site = requested_site;
                slot->record.state = approval_state::pending;
                slot->record.first_seen = now;
                slot->record.last_seen = now;
                spdlog::info("New agent {} ({}) awaiting approval, requested site: {}",
                    agent_id, hostname, requested_site.value_or("-"));
            }
            entry = slot;
        }

        registration_reply reply;
        std::string site;
        {
            std::lock_guard<std::mutex> lock(entry->mutex);
            auto& record = entry->record;
            record.last_seen = now;
            if (record.hostname != hostname) {
                spdlog::warn("Agent {} hostname changed from {} to {}", agent_id, record.hostname, hostname);
                record.hostname = hostname;
            }
            if (record.state == approval_state::pending && requested_site && !requested_site->empty()) {
                record.requested_site = requested_site;
            }
            if (record.state == approval_state::rejected && options_.rejected_may_reapply) {
                record.state = approval_state::pending;
                spdlog::info("Rejected agent {} asked again, back to pending", agent_id);
            }

            switch (record.state) {
                case approval_state::approved:
                    reply.status = registration_status::approved;
                    site = record.site.value_or("");
                    reply.site = site;
                    reply.token = record.token;
                    break;
                case approval_state::pending:
                    reply.status = registration_status::pending;
                    break;
                case approval_state::rejected:
                    reply.status = registration_status::rejected;
                    break;
            }
        }
        if (reply.status == registration_status::approved) {
            reply.config = store_->get(site);
        }
        return reply;
    }

    approve_outcome CollectorRegistry::approve(const std::string& agent_id, const std::string& site) {
        auto entry = find_agent(agent_id);
        if (!entry) {
            return {approve_result::unknown_agent, "unknown agent_id " + agent_id};
        }

        std::lock_guard<std::mutex> bindings_lock(bindings_mutex_);
        std::lock_guard<std::mutex> lock(entry->mutex);
        auto& record = entry->record;
        std::string target = site.empty() ? record.requested_site.value_or("") : site;
        if (target.empty()) {
            return {approve_result::invalid, "no site given and none requested"};
        }

        auto bound = site_bindings_.find(target);
        if (bound != site_bindings_.end() && bound->second != agent_id) {
            spdlog::warn("Approval of {} for site {} refused: site already bound to {}", agent_id, target, bound->second);
            return {approve_result::conflict, "site " + target + " is already assigned to agent " + bound->second};
        }

        if (record.state == approval_state::approved && record.site && *record.site != target) {
            site_bindings_.erase(*record.site);
            spdlog::info("Agent {} moved from site {} to {}", agent_id, *record.site, target);
        }
        record.state = approval_state::approved;
        record.site = target;
        auto token = options_.agent_tokens.find(target);
        record.token = token != options_.agent_tokens.end() ? std::optional<std::string>(token->second) : std::nullopt;
        site_bindings_[target] = agent_id;
        slot_for(target, true);
        spdlog::info("Agent {} ({}) approved for site {}", agent_id, record.hostname, target);
        return {approve_result::ok, ""};
    }

    bool CollectorRegistry::reject(const std::string& agent_id) {
        auto entry = find_agent(agent_id);
        if (!entry) {
            return false;
        }
        std::lock_guard<std::mutex> bindings_lock(bindings_mutex_);
        std::lock_guard<std::mutex> lock(entry->mutex);
        auto& record = entry->record;
        if (record.site) {
            auto bound = site_bindings_.find(*record.site);
            if (bound != site_bindings_.end() && bound->second == agent_id) {
                site_bindings_.erase(bound);
            }
        }
        record.state = approval_state::rejected;
        record.site.reset();
        record.token.reset();
        spdlog::info("Agent {} ({}) rejected", agent_id, record.hostname);
        return true;
    }

    site_config CollectorRegistry::get_config(const std::string& agent_id, const std::optional<std::string>& token) {
        auto entry = find_agent(agent_id);
        if (!entry) {
            return {};
        }
        std::string site;
        {
            std::lock_guard<std::mutex> lock(entry->mutex);
            if (entry->record.state != approval_state::approved || !entry->record.site) {
                return {};
            }
            site = *entry->record.site;
        }
        if (!token_valid(site, token)) {
            spdlog::warn("Config request for site {} by {} with invalid token", site, agent_id);
            return {};
        }
        return store_->get(site);
    }

    submit_result CollectorRegistry::submit_report(const std::string& agent_id, const std::optional<std::string>& token, report r) {
        auto entry = find_agent(agent_id);
        if (!entry) {
            spdlog::warn("Report from unknown agent {}", agent_id);
            return submit_result::unauthorized;
        }
        const auto now = clock_();
        std::string site;
        {
            std::lock_guard<std::mutex> lock(entry->mutex);
            auto& record = entry->record;
            if (record.state != approval_state::approved || !record.site) {
                spdlog::warn("Report from agent {} which is {}", agent_id, to_string(record.state));
                return submit_result::unauthorized;
            }
            if (!r.site.empty() && r.site != *record.site) {
                spdlog::warn("Agent {} reported for site {} but is assigned to {}", agent_id, r.site, *record.site);
                return submit_result::unauthorized;
            }
            site = *record.site;
            if (!token_valid(site, token)) {
                spdlog::warn("Report for site {} by {} with invalid token", site, agent_id);
                return submit_result::unauthorized;
            }
            record.last_seen = now;
        }

        r.site = site;
        r.agent_id = agent_id;
        auto slot = slot_for(site, true);
        std::unique_lock<std::shared_mutex> lock(slot->mutex);
        slot->latest = std::move(r);
        slot->last_seen = now;
        spdlog::debug("Report stored for site {} ({} cameras)", site, slot->latest->cameras.size());
        return submit_result::ok;
    }

    std::optional<std::string> CollectorRegistry::agent_for_site(const std::string& site) {
        std::lock_guard<std::mutex> lock(bindings_mutex_);
        auto it = site_bindings_.find(site);
        if (it == site_bindings_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::optional<agent_record> CollectorRegistry::get_agent(const std::string& agent_id) {
        auto entry = find_agent(agent_id);
        if (!entry) {
            return std::nullopt;
        }
        std::lock_guard<std::mutex> lock(entry->mutex);
        return entry->record;
    }

    std::vector<agent_record> CollectorRegistry::list_agents() {
        std::vector<std::shared_ptr<agent_entry>> entries;
        {
            std::shared_lock<std::shared_mutex> lock(agents_mutex_);
            for (const auto& [id, entry] : agents_) {
                entries.push_back(entry);
            }
        }
        std::vector<agent_record> out;
        out.reserve(entries.size());
        for (const auto& entry : entries) {
            std::lock_guard<std::mutex> lock(entry->mutex);
            out.push_back(entry->record);
        }
        return out;
    }

    std::vector<std::string> CollectorRegistry::known_sites() {
        std::set<std::string> sites;
        {
            std::lock_guard<std::mutex> lock(bindings_mutex_);
            for (const auto& [site, id] : site_bindings_) {
                sites.insert(site);
            }
        }
        {
            std::shared_lock<std::shared_mutex> lock(sites_mutex_);
            for (const auto& [site, slot] : sites_) {
                sites.insert(site);
            }
        }
        for (const auto& site : store_->sites()) {
            sites.insert(site);
        }
        return std::vector<std::string>(sites.begin(), sites.end());
    }

    std::optional<site_snapshot> CollectorRegistry::snapshot(const std::string& site) {
        auto slot = slot_for(site, false);
        if (!slot) {
            auto sites = known_sites();
            if (std::find(sites.begin(), sites.end(), site) == sites.end()) {
                return std::nullopt;
            }
            return site_snapshot{site, std::nullopt, std::nullopt};
        }
        std::shared_lock<std::shared_mutex> lock(slot->mutex);
        return site_snapshot{site, slot->latest, slot->last_seen};
    }

    std::vector<site_snapshot> CollectorRegistry::snapshots() {
        std::vector<site_snapshot> out;
        for (const auto& site : known_sites()) {
            auto snap = snapshot(site);
            if (snap) {
                out.push_back(std::move(*snap));
            }
        }
        return out;
    }
} // namespace sitewatch
