#include "agent_loop.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace sitewatch {

    const char* to_string(agent_state state) {
        switch (state) {
            case agent_state::bootstrapping: return "bootstrapping";
            case agent_state::awaiting_approval: return "awaiting_approval";
            case agent_state::active: return "active";
        }
        return "unknown";
    }

    const char* to_string(cycle_result result) {
        switch (result) {
            case cycle_result::reported: return "reported";
            case cycle_result::awaiting_approval: return "awaiting_approval";
            case cycle_result::rejected: return "rejected";
            case cycle_result::failed: return "failed";
        }
        return "unknown";
    }

    int exit_code(cycle_result result) {
        switch (result) {
            case cycle_result::reported: return 0;
            case cycle_result::awaiting_approval:
            case cycle_result::rejected: return 2;
            case cycle_result::failed: return 1;
        }
        return 1;
    }

    AgentLoop::AgentLoop(agent_config config, std::string hostname, std::string version,
            std::shared_ptr<IdentityStore> identity_store,
            std::shared_ptr<CollectorApi> api,
            std::shared_ptr<ProbeRunner> runner,
            std::shared_ptr<UpdateManager> updater,
            clock_fn clock)
        : config_(std::move(config)),
          hostname_(std::move(hostname)),
          version_(std::move(version)),
          identity_store_(std::move(identity_store)),
          api_(std::move(api)),
          runner_(std::move(runner)),
          updater_(std::move(updater)),
          clock_(clock ? std::move(clock) : clock_fn([] { return system_clock::now(); })) {
        cameras_ = config_.cameras;
        interval_sec_ = config_.interval_sec;
        speedtest_ = config_.speedtest;
        speed_download_bytes_ = config_.speed_download_bytes;
        speed_upload_bytes_ = config_.speed_upload_bytes;
    }

    AgentLoop::~AgentLoop() {}

    cycle_result AgentLoop::run_cycle() {
        if (state_ == agent_state::bootstrapping) {
            identity_ = identity_store_->load_or_create(hostname_);
            spdlog::info("Agent {} on {} starting, version {}", identity_.agent_id, hostname_, version_);
            state_ = agent_state::awaiting_approval;
        }

        if (!handle_registration()) {
            return last_registration_;
        }
        const std::string site = *identity_.site;

        // config always precedes probing so probes see the latest camera list
        site_config server_config;
        auto status = api_->fetch_config(site, identity_, server_config);
        if (status == call_status::ok) {
            apply_server_config(server_config);
        } else {
            spdlog::warn("Config fetch for {} failed ({}), using last known camera list", site, to_string(status));
        }

        auto probes = runner_->run(cameras_, make_probe_options());

        report r;
        r.agent_id = identity_.agent_id;
        r.site = site;
        r.hostname = hostname_;
        r.timestamp = to_epoch_seconds(clock_());
        r.agent_version = version_;
        r.interval_sec = interval_sec_;
        r.cameras = std::move(probes.cameras);
        r.network = std::move(probes.network);

        status = api_->submit_report(site, identity_.token, r);
        if (status != call_status::ok) {
            spdlog::warn("Report for {} not delivered ({}), retrying next cycle", site, to_string(status));
            return cycle_result::failed;
        }
        spdlog::info("Report submitted for {}: {}/{} cameras up, dns {}, http {}", site, r.cameras_up(),
            r.cameras.size(), r.network.dns_ok, r.network.http_ok);

        maybe_update();
        return cycle_result::reported;
    }

    bool AgentLoop::handle_registration() {
        std::optional<std::string> requested_site;
        if (!config_.site.empty()) {
            requested_site = config_.site;
        }
        registration_reply reply;
        auto status = api_->register_agent(identity_, requested_site, reply);
        if (updater_ && updater_->note_registration(version_, status == call_status::ok)) {
            restart("rolled back to the previous package");
        }

        if (status != call_status::ok) {
            spdlog::warn("Collector {} unreachable ({}), agent {} waits for the next cycle",
                config_.server, to_string(status), identity_.agent_id);
            state_ = agent_state::awaiting_approval;
            last_registration_ = cycle_result::failed;
            return false;
        }

        switch (reply.status) {
            case registration_status::pending:
                spdlog::info("Agent {} ({}) pending approval", identity_.agent_id, hostname_);
                state_ = agent_state::awaiting_approval;
                rejections_ = 0;
                last_registration_ = cycle_result::awaiting_approval;
                return false;
            case registration_status::rejected:
                ++rejections_;
                spdlog::warn("Agent {} ({}) rejected by the collector, attempt {}", identity_.agent_id, hostname_, rejections_);
                state_ = agent_state::awaiting_approval;
                last_registration_ = cycle_result::rejected;
                return false;
            case registration_status::approved:
                break;
        }

        if (reply.site.empty()) {
            spdlog::warn("Approval for {} carries no site", identity_.agent_id);
            last_registration_ = cycle_result::failed;
            return false;
        }
        rejections_ = 0;
        auto token = reply.token ? reply.token : config_.token;
        if (identity_.site != reply.site || identity_.token != token) {
            identity_.site = reply.site;
            identity_.token = token;
            identity_store_->save(identity_);
        }
        if (state_ != agent_state::active) {
            spdlog::info("Agent {} approved for site {}", identity_.agent_id, reply.site);
        }
        state_ = agent_state::active;
        last_registration_ = cycle_result::reported;
        apply_server_config(reply.config);
        return true;
    }

    void AgentLoop::apply_server_config(const site_config& config) {
        if (!config.cameras.empty()) {
            cameras_ = config.cameras;
        } else {
            // local list only as a fallback when the server has none
            cameras_ = config_.cameras;
        }
        interval_sec_ = (config.interval_sec && *config.interval_sec > 0) ? *config.interval_sec : config_.interval_sec;
        speedtest_ = config.speedtest.value_or(config_.speedtest);
        speed_download_bytes_ = config.speed_download_bytes.value_or(config_.speed_download_bytes);
        speed_upload_bytes_ = config.speed_upload_bytes.value_or(config_.speed_upload_bytes);
    }

    probe_options AgentLoop::make_probe_options() const {
        probe_options options;
        options.uplink_targets = config_.uplink_targets;
        options.dns_probe_host = config_.dns_probe_host;
        options.http_probe_url = config_.http_probe_url;
        options.mac_tracking = config_.mac_tracking;
        options.speedtest = speedtest_;
        options.speed_download_bytes = speed_download_bytes_;
        options.speed_upload_bytes = speed_upload_bytes_;
        options.speedtest_interval = std::chrono::seconds(config_.speedtest_interval_sec);
        options.server = config_.server;
        options.token = identity_.token;
        return options;
    }

    void AgentLoop::maybe_update() {
        if (!updater_) {
            return;
        }
        auto now = clock_();
        if (last_update_check_ && now - *last_update_check_ < std::chrono::seconds(config_.update_check_interval_sec)) {
            return;
        }
        last_update_check_ = now;

        auto outcome = updater_->check_and_apply(version_);
        switch (outcome.result) {
            case update_result::no_update:
                break;
            case update_result::failed:
                spdlog::warn("Update check failed: {}", outcome.reason);
                break;
            case update_result::updated:
                if (!restart(("update to " + outcome.version).c_str()) && restart_) {
                    updater_->restart_failed();
                }
                break;
        }
    }

    bool AgentLoop::restart(const char* why) {
        if (!restart_) {
            spdlog::warn("Restart needed ({}) but no restart hook is installed", why);
            return false;
        }
        spdlog::info("Restarting: {}", why);
        if (restart_()) {
            return true;
        }
        spdlog::critical("Restart failed ({})", why);
        return false;
    }

    std::chrono::seconds AgentLoop::next_sleep(cycle_result last) const {
        long long seconds = std::max(1, interval_sec_);
        if (last == cycle_result::rejected && rejections_ > 1) {
            long long cap = std::max<long long>(seconds, config_.rejected_backoff_max_sec);
            for (int i = 1; i < rejections_ && seconds < cap; ++i) {
                seconds *= 2;
            }
            seconds = std::min(seconds, cap);
        }
        return std::chrono::seconds(seconds);
    }

    int AgentLoop::run() {
        for (;;) {
            if (stop_requested()) {
                break;
            }
            auto result = run_cycle();
            if (!config_.loop) {
                spdlog::info("Single pass finished: {}", to_string(result));
                return exit_code(result);
            }
            auto wait = next_sleep(result);
            spdlog::debug("Cycle {} ({}), next in {}s", to_string(result), to_string(state_), wait.count());
            std::unique_lock<std::mutex> lock(stop_mutex_);
            if (stop_cv_.wait_for(lock, wait, [this] { return stop_; })) {
                break;
            }
        }
        spdlog::info("Agent loop stopped");
        return 0;
    }

    void AgentLoop::request_stop() {
        {
            std::lock_guard<std::mutex> lock(stop_mutex_);
            stop_ = true;
        }
        stop_cv_.notify_all();
    }

    bool AgentLoop::stop_requested() const {
        std::lock_guard<std::mutex> lock(stop_mutex_);
        return stop_;
    }
} // namespace sitewatch
