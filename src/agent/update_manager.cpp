#include "update_manager.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <spdlog/spdlog.h>
#include "src/util/util.hpp"

namespace fs = std::filesystem;

namespace sitewatch {

    namespace {
        bool all_digits(const std::string& s) {
            return !s.empty() && std::all_of(s.begin(), s.end(), [](char ch) { return std::isdigit(static_cast<unsigned char>(ch)); });
        }

        // numeric compare without overflow on long components
        int compare_numeric(std::string a, std::string b) {
            a.erase(0, std::min(a.find_first_not_of('0'), a.size()));
            b.erase(0, std::min(b.find_first_not_of('0'), b.size()));
            if (a.size() != b.size()) {
                return a.size() < b.size() ? -1 : 1;
            }
            return a.compare(b) < 0 ? -1 : (a == b ? 0 : 1);
        }

        std::string strip_prefix(const std::string& version) {
            if (!version.empty() && (version[0] == 'v' || version[0] == 'V')) {
                return version.substr(1);
            }
            return version;
        }
    }

    int compare_versions(const std::string& a, const std::string& b) {
        auto pa = util::split(strip_prefix(a), '.');
        auto pb = util::split(strip_prefix(b), '.');
        const std::size_t n = std::max(pa.size(), pb.size());
        for (std::size_t i = 0; i < n; ++i) {
            std::string x = i < pa.size() ? pa[i] : "0";
            std::string y = i < pb.size() ? pb[i] : "0";
            int cmp;
            if (all_digits(x) && all_digits(y)) {
                cmp = compare_numeric(x, y);
            } else {
                cmp = x.compare(y);
                cmp = cmp < 0 ? -1 : (cmp > 0 ? 1 : 0);
            }
            if (cmp != 0) {
                return cmp;
            }
        }
        return 0;
    }

    UpdateManager::UpdateManager(std::shared_ptr<CollectorApi> api, update_options options)
        : api_(std::move(api)), options_(std::move(options)) {
        load_state();
    }

    UpdateManager::~UpdateManager() {}

    void UpdateManager::load_state() {
        std::ifstream ifs(options_.state_path);
        if (!ifs.is_open()) {
            return;
        }
        try {
            nlohmann::json j;
            ifs >> j;
            state_.pending_confirmation = j.value("pending_confirmation", false);
            state_.previous_version = j.value("previous_version", "");
            state_.target_version = j.value("target_version", "");
            state_.backup_path = j.value("backup_path", "");
            state_.failed_attempts = j.value("failed_attempts", 0);
        } catch (const nlohmann::json::exception& e) {
            spdlog::warn("Update state {} is corrupt ({}), ignoring it", options_.state_path, e.what());
            state_ = update_state{};
        }
        if (state_.pending_confirmation) {
            spdlog::info("Running {} on probation, {} failed registrations so far",
                state_.target_version, state_.failed_attempts);
        }
    }

    bool UpdateManager::save_state() {
        nlohmann::json j = {
            {"pending_confirmation", state_.pending_confirmation},
            {"previous_version", state_.previous_version},
            {"target_version", state_.target_version},
            {"backup_path", state_.backup_path},
            {"failed_attempts", state_.failed_attempts},
        };
        std::string tmp_path = options_.state_path + ".tmp";
        {
            std::ofstream ofs(tmp_path, std::ios::trunc);
            if (!ofs.is_open()) {
                spdlog::error("Failed to write update state: {}", tmp_path);
                return false;
            }
            ofs << j.dump(2);
            if (!ofs.good()) {
                spdlog::error("Failed to write update state: {}", tmp_path);
                return false;
            }
        }
        std::error_code ec;
        fs::rename(tmp_path, options_.state_path, ec);
        if (ec) {
            spdlog::error("Failed to replace update state {}: {}", options_.state_path, ec.message());
            fs::remove(tmp_path, ec);
            return false;
        }
        return true;
    }

    update_outcome UpdateManager::check_and_apply(const std::string& current_version) {
        update_outcome outcome;
        if (state_.pending_confirmation) {
            spdlog::debug("Update to {} not yet confirmed, skipping version check", state_.target_version);
            return outcome;
        }

        release_info info;
        auto status = api_->latest_release(info);
        if (status == call_status::not_found) {
            return outcome;
        }
        if (status != call_status::ok || info.version.empty()) {
            outcome.result = update_result::failed;
            outcome.reason = std::string("version check failed: ") + to_string(status);
            return outcome;
        }
        if (compare_versions(info.version, current_version) <= 0) {
            spdlog::debug("Running {} is current (collector offers {})", current_version, info.version);
            return outcome;
        }

        auto fail = [&outcome](const std::string& reason) {
            outcome.result = update_result::failed;
            outcome.reason = reason;
            return outcome;
        };
        if (info.sha256.empty()) {
            return fail("release " + info.version + " has no checksum");
        }
        std::error_code ec;
        if (!fs::is_regular_file(options_.package_path, ec)) {
            return fail("running package not found: " + options_.package_path);
        }

        spdlog::info("Updating from {} to {}", current_version, info.version);
        const std::string staged = options_.package_path + ".download";
        fs::remove(staged, ec);
        status = api_->download_package(staged);
        if (status != call_status::ok) {
            fs::remove(staged, ec);
            return fail(std::string("download failed: ") + to_string(status));
        }

        auto staged_size = fs::file_size(staged, ec);
        auto digest = util::sha256_file(staged);
        if (ec || (info.size > 0 && staged_size != info.size) || digest != util::to_lower(info.sha256)) {
            spdlog::critical("Update {} failed verification (size {} sha256 {}, expected size {} sha256 {}), keeping {}",
                info.version, ec ? 0 : staged_size, digest, info.size, info.sha256, current_version);
            fs::remove(staged, ec);
            return fail("verification failed");
        }

        fs::permissions(staged, fs::status(options_.package_path, ec).permissions(), ec);
        if (ec) {
            spdlog::warn("Could not copy permissions onto {}: {}", staged, ec.message());
            ec.clear();
        }

        const std::string backup = options_.package_path + ".bak";
        fs::copy_file(options_.package_path, backup, fs::copy_options::overwrite_existing, ec);
        if (ec) {
            fs::remove(staged, ec);
            return fail("backup failed: " + ec.message());
        }

        // probation state goes to disk before the swap so a crash right after it still rolls back
        update_state previous = state_;
        state_.pending_confirmation = true;
        state_.previous_version = current_version;
        state_.target_version = info.version;
        state_.backup_path = backup;
        state_.failed_attempts = 0;
        if (!save_state()) {
            state_ = previous;
            fs::remove(staged, ec);
            return fail("cannot persist update state");
        }

        fs::rename(staged, options_.package_path, ec);
        if (ec) {
            std::string reason = "swap failed: " + ec.message();
            state_ = previous;
            save_state();
            fs::remove(staged, ec);
            return fail(reason);
        }

        spdlog::info("Package {} swapped in at {}, backup at {}", info.version, options_.package_path, backup);
        outcome.result = update_result::updated;
        outcome.version = info.version;
        return outcome;
    }

    bool UpdateManager::rollback() {
        std::error_code ec;
        if (state_.backup_path.empty() || !fs::is_regular_file(state_.backup_path, ec)) {
            spdlog::critical("No backup package to roll back to ({})", state_.backup_path);
            return false;
        }
        // copy then rename so the running path never holds a partial file; the backup stays
        const std::string restoring = options_.package_path + ".rollback";
        fs::copy_file(state_.backup_path, restoring, fs::copy_options::overwrite_existing, ec);
        if (!ec) {
            fs::rename(restoring, options_.package_path, ec);
        }
        if (ec) {
            spdlog::critical("Rollback to {} failed: {}", state_.previous_version, ec.message());
            std::error_code ignored;
            fs::remove(restoring, ignored);
            return false;
        }
        spdlog::warn("Rolled back from {} to {}", state_.target_version, state_.previous_version);
        state_ = update_state{};
        save_state();
        return true;
    }

    bool UpdateManager::note_registration(const std::string& running_version, bool success) {
        if (!state_.pending_confirmation) {
            return false;
        }
        if (compare_versions(running_version, state_.target_version) != 0) {
            spdlog::debug("Running {} while {} awaits its first start", running_version, state_.target_version);
            return false;
        }
        if (success) {
            spdlog::info("Update to {} confirmed", state_.target_version);
            state_.pending_confirmation = false;
            state_.failed_attempts = 0;
            save_state();
            return false;
        }
        ++state_.failed_attempts;
        spdlog::warn("Registration failed on probation for {} ({}/{})",
            state_.target_version, state_.failed_attempts, options_.rollback_after_failures);
        save_state();
        if (state_.failed_attempts < options_.rollback_after_failures) {
            return false;
        }
        return rollback();
    }

    void UpdateManager::restart_failed() {
        spdlog::critical("Restart into {} failed, restoring {}", state_.target_version, state_.previous_version);
        rollback();
    }
} // namespace sitewatch
