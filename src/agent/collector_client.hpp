#pragma once
#include "src/common/protocol.hpp"
#include "src/http/http_client.hpp"
#include <optional>
#include <string>

namespace sitewatch {

    enum class call_status { ok, network_error, unauthorized, not_found, bad_response };

    const char* to_string(call_status status);

    // Everything the agent asks of the collector.
    class CollectorApi {
    public:
        virtual ~CollectorApi() = default;

        virtual call_status register_agent(const agent_identity& identity, const std::optional<std::string>& requested_site,
            registration_reply& reply) = 0;
        virtual call_status fetch_config(const std::string& site, const agent_identity& identity, site_config& config) = 0;
        virtual call_status submit_report(const std::string& site, const std::optional<std::string>& token, const report& r) = 0;
        virtual call_status latest_release(release_info& info) = 0;
        // writes the package bytes to dest_path
        virtual call_status download_package(const std::string& dest_path) = 0;
    };

    class HttpCollectorClient : public CollectorApi {
    public:
        HttpCollectorClient(std::string server, int timeout_seconds);
        ~HttpCollectorClient() override;

        call_status register_agent(const agent_identity& identity, const std::optional<std::string>& requested_site,
            registration_reply& reply) override;
        call_status fetch_config(const std::string& site, const agent_identity& identity, site_config& config) override;
        call_status submit_report(const std::string& site, const std::optional<std::string>& token, const report& r) override;
        call_status latest_release(release_info& info) override;
        call_status download_package(const std::string& dest_path) override;

        const std::string& server() const { return server_; }

    private:
        static call_status classify(int status_code);

        std::string server_;
        HttpClient client_;
    };
} // namespace sitewatch
