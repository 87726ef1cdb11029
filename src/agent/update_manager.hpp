#pragma once
#include "collector_client.hpp"
#include <memory>
#include <string>

namespace sitewatch {

    enum class update_result { no_update, updated, failed };

    struct update_outcome {
        update_result result = update_result::no_update;
        std::string version;    // target version when updated
        std::string reason;     // why it failed
    };

    // persisted so the restarted package knows it is on probation
    struct update_state {
        bool pending_confirmation = false;
        std::string previous_version;
        std::string target_version;
        std::string backup_path;
        int failed_attempts = 0;
    };

    struct update_options {
        std::string package_path;       // the running package
        std::string state_path = "agent_update.json";
        int rollback_after_failures = 3;
    };

    // <0, 0, >0 like strcmp. Dot-separated parts compare numerically when
    // both are numbers; missing parts count as 0.
    int compare_versions(const std::string& a, const std::string& b);

    // Stage, verify, swap. The running path only ever holds a complete
    // package: the new one is renamed over it after its checksum matched.
    class UpdateManager {
    public:
        UpdateManager(std::shared_ptr<CollectorApi> api, update_options options);
        ~UpdateManager();

        update_outcome check_and_apply(const std::string& current_version);

        // Feed every registration attempt while on probation. Only the
        // swapped-in version counts; a process still running the previous
        // package neither confirms nor fails it. Returns true when the
        // backup was restored and the process should restart.
        bool note_registration(const std::string& running_version, bool success);

        // the freshly swapped package could not be started
        void restart_failed();

        bool rollback();

        bool on_probation() const { return state_.pending_confirmation; }
        const update_state& state() const { return state_; }
        const update_options& options() const { return options_; }

    private:
        void load_state();
        bool save_state();

        std::shared_ptr<CollectorApi> api_;
        update_options options_;
        update_state state_;
    };
} // namespace sitewatch
