#pragma once
#include "src/common/protocol.hpp"
#include <string>

namespace sitewatch {

    // Durable agent identity kept in a small JSON file. The agent_id is a
    // pure function of the hostname at first run; afterwards the file wins,
    // so copying it to another machine clones the identity.
    class IdentityStore {
    public:
        explicit IdentityStore(std::string path);
        ~IdentityStore();

        // Returns the persisted identity, or derives and persists a new one
        // when the file is missing or unparsable. Never throws.
        agent_identity load_or_create(const std::string& hostname);

        // tmp file + rename, so a crash never leaves a torn identity file
        bool save(const agent_identity& identity);

        const std::string& path() const { return path_; }

    private:
        std::string path_;
    };
} // namespace sitewatch
