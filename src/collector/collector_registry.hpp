#pragma once
#include "src/common/protocol.hpp"
#include "site_config_store.hpp"
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace sitewatch {

    struct registry_options {
        std::chrono::seconds offline_threshold{180};
        // a rejected agent_id may ask again and drop back to pending
        bool rejected_may_reapply = false;
        // site -> token; empty map accepts any token (development mode)
        std::map<std::string, std::string> agent_tokens;
    };

    enum class approve_result { ok, conflict, unknown_agent, invalid };

    struct approve_outcome {
        approve_result result = approve_result::ok;
        std::string reason;
    };

    enum class submit_result { ok, unauthorized };

    struct site_snapshot {
        std::string site;
        std::optional<report> latest;
        std::optional<time_point> last_seen;    // receipt time of the latest report
    };

    // Holds agent identities, their approval state and the latest report per
    // site. Records and site slots are locked individually; the site binding
    // table is the only place site uniqueness is decided.
    class CollectorRegistry {
    public:
        CollectorRegistry(std::shared_ptr<SiteConfigStore> store, registry_options options, clock_fn clock = {});
        ~CollectorRegistry();

        registration_reply register_agent(const std::string& agent_id, const std::string& hostname,
            const std::optional<std::string>& requested_site);
        approve_outcome approve(const std::string& agent_id, const std::string& site);
        bool reject(const std::string& agent_id);

        // camera list for an approved agent; empty for anyone else
        site_config get_config(const std::string& agent_id, const std::optional<std::string>& token);
        submit_result submit_report(const std::string& agent_id, const std::optional<std::string>& token, report r);

        std::optional<std::string> agent_for_site(const std::string& site);
        std::optional<agent_record> get_agent(const std::string& agent_id);
        std::vector<agent_record> list_agents();

        std::optional<site_snapshot> snapshot(const std::string& site);
        std::vector<site_snapshot> snapshots();

        const registry_options& options() const { return options_; }
        time_point now() const { return clock_(); }

    private:
        struct agent_entry {
            std::mutex mutex;
            agent_record record;
        };

        struct site_slot {
            std::shared_mutex mutex;
            std::optional<report> latest;
            std::optional<time_point> last_seen;
        };

        std::shared_ptr<agent_entry> find_agent(const std::string& agent_id);
        std::shared_ptr<site_slot> slot_for(const std::string& site, bool create);
        bool token_valid(const std::string& site, const std::optional<std::string>& token) const;
        std::vector<std::string> known_sites();

        std::shared_ptr<SiteConfigStore> store_;
        registry_options options_;
        clock_fn clock_;

        std::map<std::string, std::shared_ptr<agent_entry>> agents_;
        std::shared_mutex agents_mutex_;
        std::map<std::string, std::string> site_bindings_;     // site -> approved agent_id
        std::mutex bindings_mutex_;
        std::map<std::string, std::shared_ptr<site_slot>> sites_;
        std::shared_mutex sites_mutex_;
    };
} // namespace sitewatch
