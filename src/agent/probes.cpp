#include "probes.hpp"
#include <utility>
#include <boost/asio.hpp>
#include <boost/regex.hpp>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <map>
#include <sstream>
#include <thread>
#include <vector>
#include <sys/wait.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include "src/http/http_client.hpp"
#include "src/util/util.hpp"

namespace sitewatch {

    ping_result parse_ping_output(const std::string& output, int exit_code) {
        static const boost::regex rtt_regex(R"((?:rtt|round-trip) min/avg/max(?:/\w+)? = (\d+(?:\.\d+)?)/(\d+(?:\.\d+)?)/)");
        static const boost::regex loss_regex(R"((\d+(?:\.\d+)?)% packet loss)");
        static const boost::regex reply_regex(R"(bytes from|ttl=)", boost::regex::icase);

        ping_result result;
        boost::smatch match;
        if (boost::regex_search(output, match, rtt_regex)) {
            result.avg_ms = std::stod(match[2].str());
        }
        if (boost::regex_search(output, match, loss_regex)) {
            result.loss_pct = std::stod(match[1].str());
        }

        result.reachable = exit_code == 0;
        if (result.reachable && result.loss_pct && *result.loss_pct >= 100.0) {
            result.reachable = false;
        }
        if (result.reachable && !result.avg_ms && !boost::regex_search(output, reply_regex)) {
            result.reachable = false;
        }
        if (!result.reachable) {
            result.avg_ms.reset();
        }
        return result;
    }

    namespace {
        struct arp_entry {
            std::string ip;
            std::string mac;
        };

        std::vector<arp_entry> parse_arp_table(const std::string& arp_table) {
            std::vector<arp_entry> entries;
            std::istringstream lines(arp_table);
            std::string line;
            std::getline(lines, line);  // header
            while (std::getline(lines, line)) {
                std::istringstream fields(line);
                std::string ip, hw_type, flags, mac;
                if (!(fields >> ip >> hw_type >> flags >> mac)) {
                    continue;
                }
                if (flags == "0x0" || mac == "00:00:00:00:00:00") {
                    continue;
                }
                entries.push_back({ip, util::to_lower(mac)});
            }
            return entries;
        }
    }

    bool is_safe_host(const std::string& host) {
        // a leading '-' would be read as a ping option
        if (host.empty() || host.size() >= 256 || host.front() == '-') {
            return false;
        }
        return std::all_of(host.begin(), host.end(), [](char ch) {
            return std::isalnum(static_cast<unsigned char>(ch)) || ch == '.' || ch == '-' || ch == ':';
        });
    }

    std::optional<std::string> arp_find_mac(const std::string& arp_table, const std::string& ip) {
        for (const auto& entry : parse_arp_table(arp_table)) {
            if (entry.ip == ip) {
                return entry.mac;
            }
        }
        return std::nullopt;
    }

    std::optional<std::string> arp_find_ip(const std::string& arp_table, const std::string& mac) {
        auto wanted = util::to_lower(mac);
        for (const auto& entry : parse_arp_table(arp_table)) {
            if (entry.mac == wanted) {
                return entry.ip;
            }
        }
        return std::nullopt;
    }

    std::optional<double> to_mbps(long long bytes, double seconds) {
        if (seconds <= 0.0 || bytes < 0) {
            return std::nullopt;
        }
        double mbps = static_cast<double>(bytes) * 8.0 / (seconds * 1e6);
        return std::round(mbps * 100.0) / 100.0;
    }

    SystemProbes::SystemProbes(int timeout_seconds, int ping_attempts)
        : timeout_seconds_(timeout_seconds), ping_attempts_(std::max(1, ping_attempts)) {}

    SystemProbes::~SystemProbes() {}

    ping_result SystemProbes::ping(const std::string& host, int count) {
        if (!is_safe_host(host)) {
            spdlog::warn("Refusing to ping malformed host '{}'", host);
            return {};
        }
        std::string cmd = "ping -c " + std::to_string(std::max(1, count)) + " -W 1 " + host + " 2>&1";
        ping_result result;
        for (int attempt = 0; attempt < ping_attempts_; ++attempt) {
            FILE* pipe = popen(cmd.c_str(), "r");
            if (pipe == nullptr) {
                spdlog::error("Failed to run ping for {}", host);
                return {};
            }
            std::string output;
            char buffer[512];
            while (fgets(buffer, sizeof(buffer), pipe) != nullptr) {
                output.append(buffer);
            }
            int status = pclose(pipe);
            int exit_code = (status != -1 && WIFEXITED(status)) ? WEXITSTATUS(status) : -1;

            result = parse_ping_output(output, exit_code);
            if (result.reachable) {
                return result;
            }
            spdlog::debug("Ping {} attempt {} failed (exit {})", host, attempt + 1, exit_code);
            if (attempt + 1 < ping_attempts_) {
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
        }
        return result;
    }

    bool SystemProbes::resolve(const std::string& host) {
        boost::asio::io_context ioc;
        boost::asio::ip::tcp::resolver resolver(ioc);
        boost::system::error_code ec;
        auto results = resolver.resolve(host, "80", ec);
        if (ec) {
            spdlog::debug("DNS probe for {} failed: {}", host, ec.message());
            return false;
        }
        return !results.empty();
    }

    bool SystemProbes::http_get(const std::string& url) {
        HttpClient client(timeout_seconds_);
        http_request req;
        req.url = url;
        http_response res;
        int status = client.get(req, res);
        if (status < 200 || status >= 400) {
            spdlog::debug("HTTP probe {} failed: status {} {}", url, status, res.error);
            return false;
        }
        return true;
    }

    std::string SystemProbes::read_arp_table() const {
        std::ifstream ifs("/proc/net/arp");
        if (!ifs.is_open()) {
            spdlog::warn("ARP table /proc/net/arp is not readable");
            return "";
        }
        std::stringstream ss;
        ss << ifs.rdbuf();
        return ss.str();
    }

    std::optional<std::string> SystemProbes::mac_for_ip(const std::string& ip) {
        return arp_find_mac(read_arp_table(), ip);
    }

    std::optional<std::string> SystemProbes::ip_for_mac(const std::string& mac) {
        return arp_find_ip(read_arp_table(), mac);
    }

    speed_result SystemProbes::speed_test(const std::string& server, const std::optional<std::string>& token,
            long long download_bytes, long long upload_bytes) {
        speed_result result;
        HttpClient client(std::max(timeout_seconds_, 30));
        std::map<std::string, std::string> headers;
        if (token) {
            headers["X-Agent-Token"] = *token;
        }

        http_request dl;
        dl.url = server + "/api/speedtest/download?size_bytes=" + std::to_string(std::max(1LL, download_bytes));
        dl.headers = headers;
        http_response dl_res;
        client.set_body_limit(static_cast<std::size_t>(std::max(1LL, download_bytes)) + 4096);
        auto start = std::chrono::steady_clock::now();
        int status = client.get(dl, dl_res);
        std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start;
        if (status == 200) {
            result.download_mbps = to_mbps(static_cast<long long>(dl_res.body.size()), elapsed.count());
        } else {
            spdlog::warn("Speed test download failed: status {} {}", status, dl_res.error);
        }

        http_request ul;
        ul.url = server + "/api/speedtest/upload";
        ul.headers = headers;
        ul.headers["Content-Type"] = "application/octet-stream";
        ul.body.assign(static_cast<std::size_t>(std::max(1LL, upload_bytes)), '\0');
        http_response ul_res;
        start = std::chrono::steady_clock::now();
        status = client.post(ul, ul_res);
        elapsed = std::chrono::steady_clock::now() - start;
        if (status == 200) {
            long long sent = static_cast<long long>(ul.body.size());
            auto body = nlohmann::json::parse(ul_res.body, nullptr, false);
            if (body.is_object() && body.contains("received_bytes") && body["received_bytes"].is_number_integer()) {
                sent = body["received_bytes"].get<long long>();
            }
            result.upload_mbps = to_mbps(sent, elapsed.count());
        } else {
            spdlog::warn("Speed test upload failed: status {} {}", status, ul_res.error);
        }
        return result;
    }
} // namespace sitewatch
