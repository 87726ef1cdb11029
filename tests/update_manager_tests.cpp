#include "src/agent/update_manager.hpp"
#include "src/util/util.hpp"
#include "fake_collector.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <unistd.h>

namespace {
int Fail(const std::string& message) {
    std::cerr << message << std::endl;
    return 1;
}

std::string ReadFile(const std::filesystem::path& path) {
    std::ifstream ifs(path, std::ios::binary);
    std::stringstream ss;
    ss << ifs.rdbuf();
    return ss.str();
}

void WriteFile(const std::filesystem::path& path, const std::string& content) {
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    ofs << content;
}
} // namespace

int main() {
    using sitewatch::compare_versions;
    if (!(compare_versions("1.3", "1.3.1") < 0 && compare_versions("1.3.1", "1.10") < 0)) {
        return Fail("Numeric version order broken.");
    }
    if (compare_versions("1.0", "1") != 0 || compare_versions("v2.0", "1.9.9") <= 0) {
        return Fail("Missing components or prefix handled wrongly.");
    }
    if (compare_versions("1.0-beta", "1.0-alpha") <= 0 || compare_versions("0010", "9") <= 0) {
        return Fail("Lexicographic or long numeric components compared wrongly.");
    }

    const auto dir = std::filesystem::temp_directory_path() /
        ("sitewatch-update-" + std::to_string(::getpid()) + "-" + sitewatch::util::random_hex(4));
    std::filesystem::create_directories(dir);
    const auto package = dir / "sitewatch-agent";
    const auto state_path = dir / "agent_update.json";
    WriteFile(package, "old-binary");

    auto api = std::make_shared<FakeCollector>();
    sitewatch::update_options options;
    options.package_path = package.string();
    options.state_path = state_path.string();
    options.rollback_after_failures = 3;
    auto manager = std::make_unique<sitewatch::UpdateManager>(api, options);

    if (manager->check_and_apply("1.0.0").result != sitewatch::update_result::no_update) {
        return Fail("No published release should mean no update.");
    }

    api->release_status = sitewatch::call_status::ok;
    api->release = {"1.0.0", sitewatch::util::sha256_hex("new-binary"), 10};
    if (manager->check_and_apply("1.0.0").result != sitewatch::update_result::no_update || api->downloads != 0) {
        return Fail("Same version must not download anything.");
    }

    // verification failure leaves the running package untouched
    api->release = {"1.1.0", sitewatch::util::sha256_hex("new-binary"), 10};
    api->package_bytes = "tampered!!";
    const auto running_digest = sitewatch::util::sha256_file(package.string());
    auto outcome = manager->check_and_apply("1.0.0");
    if (outcome.result != sitewatch::update_result::failed || outcome.reason != "verification failed") {
        return Fail("Checksum mismatch must fail verification: " + outcome.reason);
    }
    if (sitewatch::util::sha256_file(package.string()) != running_digest || ReadFile(package) != "old-binary") {
        return Fail("Running package changed after a failed verification.");
    }
    if (std::filesystem::exists(package.string() + ".download") || manager->on_probation()) {
        return Fail("Failed verification left a staged file or probation state.");
    }

    api->package_bytes = "new-binary-but-longer";
    api->release = {"1.1.0", sitewatch::util::sha256_hex("new-binary-but-longer"), 10};
    if (manager->check_and_apply("1.0.0").result != sitewatch::update_result::failed || ReadFile(package) != "old-binary") {
        return Fail("Size mismatch must fail verification.");
    }

    // verified swap
    api->package_bytes = "new-binary";
    api->release = {"1.1.0", sitewatch::util::sha256_hex("new-binary"), 10};
    outcome = manager->check_and_apply("1.0.0");
    if (outcome.result != sitewatch::update_result::updated || outcome.version != "1.1.0") {
        return Fail("Verified package should be swapped in: " + outcome.reason);
    }
    if (ReadFile(package) != "new-binary" || ReadFile(package.string() + ".bak") != "old-binary") {
        return Fail("Swap did not leave new package and backup in place.");
    }
    if (!manager->on_probation() || manager->state().previous_version != "1.0.0") {
        return Fail("Update should start probation.");
    }

    // the restarted process picks up probation from disk
    manager = std::make_unique<sitewatch::UpdateManager>(api, options);
    if (!manager->on_probation() || manager->state().target_version != "1.1.0") {
        return Fail("Probation state not persisted.");
    }
    const int downloads = api->downloads;
    if (manager->check_and_apply("1.1.0").result != sitewatch::update_result::no_update || api->downloads != downloads) {
        return Fail("No new update while the current one is unconfirmed.");
    }

    // the previous package is still running, its registrations do not count
    if (manager->note_registration("1.0.0", true) || manager->note_registration("1.0.0", false) || !manager->on_probation() ||
        manager->state().failed_attempts != 0) {
        return Fail("Registrations from the previous version must not touch probation.");
    }

    // N failed registrations restore the backup
    if (manager->note_registration("1.1.0", false) || manager->note_registration("1.1.0", false)) {
        return Fail("Rolled back before reaching the failure limit.");
    }
    if (!manager->note_registration("1.1.0", false)) {
        return Fail("Third failed registration should roll back.");
    }
    if (ReadFile(package) != "old-binary" || manager->on_probation()) {
        return Fail("Rollback did not restore the previous package.");
    }
    if (!std::filesystem::exists(package.string() + ".bak")) {
        return Fail("Backup should be kept after a rollback.");
    }

    // a successful registration confirms
    outcome = manager->check_and_apply("1.0.0");
    if (outcome.result != sitewatch::update_result::updated) {
        return Fail("Second update attempt failed: " + outcome.reason);
    }
    if (manager->note_registration("1.1.0", false) || manager->note_registration("1.1.0", true)) {
        return Fail("Confirmation must not request a restart.");
    }
    if (manager->on_probation() || ReadFile(package) != "new-binary") {
        return Fail("Confirmed update should stay in place.");
    }
    if (manager->note_registration("1.1.0", false)) {
        return Fail("Registration failures after confirmation must be ignored.");
    }

    // restart into the new package failed
    WriteFile(package, "old-binary");
    outcome = manager->check_and_apply("1.0.0");
    if (outcome.result != sitewatch::update_result::updated) {
        return Fail("Third update attempt failed: " + outcome.reason);
    }
    manager->restart_failed();
    if (ReadFile(package) != "old-binary" || manager->on_probation()) {
        return Fail("Failed restart should restore the backup immediately.");
    }

    std::filesystem::remove_all(dir);
    return 0;
}
