#include "probe_runner.hpp"
#include <future>
#include <spdlog/spdlog.h>
#include "src/util/util.hpp"

namespace sitewatch {

    static constexpr double SUSPICIOUS_LATENCY_MS = 500.0;

    bool is_private_ipv4(const std::string& ip) {
        auto parts = util::split(ip, '.');
        if (parts.size() != 4) {
            return false;
        }
        auto a = util::parse_int(parts[0]);
        auto b = util::parse_int(parts[1]);
        if (!a || !b) {
            return false;
        }
        return *a == 10 || (*a == 172 && *b >= 16 && *b <= 31) || (*a == 192 && *b == 168);
    }

    ProbeRunner::ProbeRunner(std::shared_ptr<Probes> probes, clock_fn clock)
        : probes_(std::move(probes)),
          clock_(clock ? std::move(clock) : clock_fn([] { return system_clock::now(); })) {}

    ProbeRunner::~ProbeRunner() {}

    probe_set ProbeRunner::run(const camera_list& cameras, const probe_options& options) {
        probe_set result;
        result.network = probe_network(options);
        result.cameras = probe_cameras(cameras, options);
        return result;
    }

    std::vector<camera_result> ProbeRunner::probe_cameras(const camera_list& cameras, const probe_options& options) {
        std::vector<std::future<camera_result>> pending;
        pending.reserve(cameras.size());
        for (const auto& camera : cameras) {
            pending.push_back(std::async(std::launch::async, [this, &camera, &options] {
                return probe_camera(camera, options);
            }));
        }
        std::vector<camera_result> results;
        results.reserve(cameras.size());
        for (auto& f : pending) {
            results.push_back(f.get());
        }
        return results;
    }

    camera_result ProbeRunner::probe_camera(const camera_entry& camera, const probe_options& options) {
        camera_result result;
        result.camera_id = camera_key(camera);
        result.name = camera.name;
        result.ip = camera.ip;

        auto ping = probes_->ping(camera.ip, options.ping_count);

        if (options.mac_tracking) {
            if (ping.reachable) {
                result.mac = probes_->mac_for_ip(camera.ip);
                if (result.mac) {
                    std::lock_guard<std::mutex> lock(mac_mutex_);
                    auto& entry = mac_cache_[result.camera_id];
                    if (entry.mac != *result.mac) {
                        spdlog::info("Cached MAC {} for camera {} ({})", *result.mac, result.camera_id, camera.ip);
                    }
                    entry.mac = *result.mac;
                    entry.last_ip = camera.ip;
                }
            } else if (auto mac = cached_mac(result.camera_id)) {
                auto new_ip = probes_->ip_for_mac(*mac);
                if (new_ip && *new_ip != camera.ip) {
                    spdlog::info("Camera {} offline at {}, MAC {} now seen at {}", result.camera_id, camera.ip, *mac, *new_ip);
                    auto retry = probes_->ping(*new_ip, options.ping_count);
                    if (retry.reachable) {
                        ping = retry;
                        result.ip_changed = true;
                        result.old_ip = camera.ip;
                        result.ip = *new_ip;
                        result.mac = mac;
                        std::lock_guard<std::mutex> lock(mac_mutex_);
                        mac_cache_[result.camera_id].last_ip = *new_ip;
                    }
                }
            }
        }

        result.up = ping.reachable;
        result.ping_ms = ping.avg_ms;
        result.packet_loss = ping.loss_pct;
        if (ping.reachable && ping.avg_ms && *ping.avg_ms > SUSPICIOUS_LATENCY_MS && is_private_ipv4(result.ip)) {
            result.suspicious = true;
        }
        return result;
    }

    std::optional<std::string> ProbeRunner::cached_mac(const std::string& camera_id) {
        std::lock_guard<std::mutex> lock(mac_mutex_);
        auto it = mac_cache_.find(camera_id);
        if (it == mac_cache_.end()) {
            return std::nullopt;
        }
        return it->second.mac;
    }

    network_results ProbeRunner::probe_network(const probe_options& options) {
        network_results net;
        for (const auto& target : options.uplink_targets) {
            auto ping = probes_->ping(target, options.ping_count);
            std::optional<double> ms;
            if (ping.reachable) {
                // a reply without a parsed average still counts as reachable
                ms = ping.avg_ms.value_or(0.0);
            }
            net.uplink_ping_ms[target] = ms;
        }
        net.dns_ok = !options.dns_probe_host.empty() && probes_->resolve(options.dns_probe_host);
        net.http_ok = !options.http_probe_url.empty() && probes_->http_get(options.http_probe_url);

        if (options.speedtest && !options.server.empty()) {
            auto now = clock_();
            if (!last_speed_at_ || now - *last_speed_at_ >= options.speedtest_interval) {
                last_speed_ = probes_->speed_test(options.server, options.token,
                    options.speed_download_bytes, options.speed_upload_bytes);
                last_speed_at_ = now;
                spdlog::debug("Speed test: down {} Mbps, up {} Mbps",
                    last_speed_->download_mbps.value_or(-1), last_speed_->upload_mbps.value_or(-1));
            }
            if (last_speed_) {
                net.download_mbps = last_speed_->download_mbps;
                net.upload_mbps = last_speed_->upload_mbps;
            }
        }
        return net;
    }
} // namespace sitewatch
