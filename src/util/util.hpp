#pragma once
#include <string>
#include <cstdint>
#include <optional>
#include <vector>

namespace sitewatch {
    class util {
    public:
        // compute 64-bit MurMurHash
        static unsigned long long MurMurHash64(const void* ptr, unsigned long long len, unsigned long long seed);

        // stable 16-char hex id derived from a string, e.g. a hostname
        static std::string stable_id(const std::string& value);
        static std::string url_decode(const std::string& encoded_url);
        static std::string url_encode(const std::string& url);
        static std::vector<std::string> split(const std::string& str, char delimiter);
        static std::string to_lower(std::string value);

        // "1", "true", "yes" / "0", "false", "no" (case-insensitive)
        static std::optional<bool> parse_bool(const std::string& value);
        static std::optional<long long> parse_int(const std::string& value);

        // split http://host[:port][/target] into its parts
        static bool parse_url(const std::string& url, std::string& host, std::string& port, std::string& target);

        // lowercase hex SHA-256 of a file or buffer, empty on read error
        static std::string sha256_file(const std::string& path);
        static std::string sha256_hex(const std::string& data);
        static std::string random_hex(std::size_t bytes);
    };
} // namespace sitewatch
