#pragma once
#include "agent_config.hpp"
#include "collector_client.hpp"
#include "identity_store.hpp"
#include "probe_runner.hpp"
#include "update_manager.hpp"
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace sitewatch {

    enum class agent_state { bootstrapping, awaiting_approval, active };

    enum class cycle_result { reported, awaiting_approval, rejected, failed };

    const char* to_string(agent_state state);
    const char* to_string(cycle_result result);

    // process exit code for a single pass: 0 reported, 2 not approved, 1 failure
    int exit_code(cycle_result result);

    // Bootstrapping -> AwaitingApproval -> Active. Every cycle registers
    // first, then in Active fetches config, probes, reports and checks for
    // updates. Failures are logged and end the cycle; they never end the loop.
    class AgentLoop {
    public:
        using restart_fn = std::function<bool()>;   // false when the process could not be replaced

        AgentLoop(agent_config config, std::string hostname, std::string version,
            std::shared_ptr<IdentityStore> identity_store,
            std::shared_ptr<CollectorApi> api,
            std::shared_ptr<ProbeRunner> runner,
            std::shared_ptr<UpdateManager> updater,
            clock_fn clock = {});
        ~AgentLoop();

        void set_restart_hook(restart_fn hook) { restart_ = std::move(hook); }

        cycle_result run_cycle();

        // single pass returns exit_code() of the cycle; loop mode returns 0 once stopped
        int run();

        // wakes the sleep between cycles; a cycle in progress finishes first
        void request_stop();
        bool stop_requested() const;

        agent_state state() const { return state_; }
        const agent_identity& identity() const { return identity_; }
        const camera_list& cameras() const { return cameras_; }
        int interval_sec() const { return interval_sec_; }

        // time to wait after a cycle, doubled per consecutive rejection
        std::chrono::seconds next_sleep(cycle_result last) const;

    private:
        bool handle_registration();
        void apply_server_config(const site_config& config);
        void maybe_update();
        bool restart(const char* why);
        probe_options make_probe_options() const;

        agent_config config_;
        std::string hostname_;
        std::string version_;
        std::shared_ptr<IdentityStore> identity_store_;
        std::shared_ptr<CollectorApi> api_;
        std::shared_ptr<ProbeRunner> runner_;
        std::shared_ptr<UpdateManager> updater_;
        clock_fn clock_;
        restart_fn restart_;

        agent_state state_ = agent_state::bootstrapping;
        agent_identity identity_;
        camera_list cameras_;
        int interval_sec_;
        bool speedtest_;
        long long speed_download_bytes_;
        long long speed_upload_bytes_;
        int rejections_ = 0;
        cycle_result last_registration_ = cycle_result::failed;
        std::optional<time_point> last_update_check_;

        mutable std::mutex stop_mutex_;
        std::condition_variable stop_cv_;
        bool stop_ = false;
    };
} // namespace sitewatch
