#include "identity_store.hpp"
#include <filesystem>
#include <fstream>
#include <spdlog/spdlog.h>
#include "src/util/util.hpp"

namespace sitewatch {

    IdentityStore::IdentityStore(std::string path) : path_(std::move(path)) {}

    IdentityStore::~IdentityStore() {}

    agent_identity IdentityStore::load_or_create(const std::string& hostname) {
        std::ifstream ifs(path_);
        if (ifs.is_open()) {
            try {
                nlohmann::json j;
                ifs >> j;
                agent_identity identity;
                identity.agent_id = j.at("agent_id").get<std::string>();
                identity.hostname = j.value("hostname", hostname);
                if (j.contains("site") && j["site"].is_string()) identity.site = j["site"].get<std::string>();
                if (j.contains("token") && j["token"].is_string()) identity.token = j["token"].get<std::string>();
                if (!identity.agent_id.empty()) {
                    if (identity.hostname != hostname) {
                        spdlog::warn("Identity file {} belongs to host {}, running on {}; keeping agent_id {}",
                            path_, identity.hostname, hostname, identity.agent_id);
                    }
                    return identity;
                }
                spdlog::warn("Identity file {} has an empty agent_id, regenerating", path_);
            } catch (const nlohmann::json::exception& e) {
                spdlog::warn("Identity file {} is corrupt ({}), regenerating", path_, e.what());
            }
        }

        agent_identity identity;
        identity.agent_id = util::stable_id(hostname);
        identity.hostname = hostname;
        if (save(identity)) {
            spdlog::info("Created agent identity {} for host {}", identity.agent_id, hostname);
        }
        return identity;
    }

    bool IdentityStore::save(const agent_identity& identity) {
        nlohmann::json j = {{"agent_id", identity.agent_id}, {"hostname", identity.hostname}};
        j["site"] = identity.site ? nlohmann::json(*identity.site) : nlohmann::json(nullptr);
        j["token"] = identity.token ? nlohmann::json(*identity.token) : nlohmann::json(nullptr);

        std::error_code ec;
        auto parent = std::filesystem::path(path_).parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent, ec);
        }
        std::string tmp_path = path_ + ".tmp";
        {
            std::ofstream ofs(tmp_path, std::ios::trunc);
            if (!ofs.is_open()) {
                spdlog::error("Failed to write identity file: {}", tmp_path);
                return false;
            }
            ofs << j.dump(2);
            if (!ofs.good()) {
                spdlog::error("Failed to write identity file: {}", tmp_path);
                return false;
            }
        }
        std::filesystem::rename(tmp_path, path_, ec);
        if (ec) {
            spdlog::error("Failed to replace identity file {}: {}", path_, ec.message());
            std::filesystem::remove(tmp_path, ec);
            return false;
        }
        return true;
    }
} // namespace sitewatch
