#include "util.hpp"
#include <sstream>
#include <iomanip>
#include <cstring>
#include <cctype>
#include <fstream>
#include <random>
#include <vector>
#include <boost/regex.hpp>
#include <openssl/evp.h>
#include <spdlog/spdlog.h>

namespace sitewatch {

    static constexpr unsigned long long DEFAULT_MURMUR_SEED = 3339675888ULL;

    namespace {
        std::string to_hex(const unsigned char* data, std::size_t len) {
            std::ostringstream oss;
            oss << std::hex << std::nouppercase << std::setfill('0');
            for (std::size_t i = 0; i < len; ++i) {
                oss << std::setw(2) << static_cast<int>(data[i]);
            }
            return oss.str();
        }

        // RAII holder for an OpenSSL digest context
        struct digest_ctx {
            EVP_MD_CTX* ctx;
            digest_ctx() : ctx(EVP_MD_CTX_new()) {}
            ~digest_ctx() { if (ctx) EVP_MD_CTX_free(ctx); }
            digest_ctx(const digest_ctx&) = delete;
            digest_ctx& operator=(const digest_ctx&) = delete;
        };
    }

    unsigned long long util::MurMurHash64(const void* ptr, unsigned long long len, unsigned long long seed)
    {
        const unsigned long long mul = (0xc6a4a793ULL << 32ULL) + 0x5bd1e995ULL;
        const char* const buf = static_cast<const char*>(ptr);

        const int len_aligned = static_cast<int>(len & ~0x7);
        const char* const end = buf + len_aligned;
        unsigned long long hash = seed ^ (len * mul);
        for (const char* p = buf; p != end; p += 8)
        {
            // read 8 bytes as little-endian unsigned long long
            unsigned long long data;
            std::memcpy(&data, p, sizeof(data));
            data *= mul;
            data = (data ^ (data >> 47)) * mul;
            hash ^= data;
            hash *= mul;
        }
        if ((len & 0x7) != 0)
        {
            unsigned long long data = 0;
            int n = (len & 0x7) - 1;
            do {
                data = (data << 8) + static_cast<unsigned char>(end[n]);
            } while (--n >= 0);
            hash ^= data;
            hash *= mul;
        }
        hash = (hash ^ (hash >> 47)) * mul;
        hash = hash ^ (hash >> 47);
        return hash;
    }

    std::string util::stable_id(const std::string& value) {
        unsigned long long hash = MurMurHash64(value.data(), value.size(), DEFAULT_MURMUR_SEED);
        std::ostringstream oss;
        oss << std::hex << std::nouppercase << std::setfill('0') << std::setw(16) << hash;
        return oss.str();
    }

    std::string util::url_decode(const std::string &encoded_url) {
        std::string decoded_url;
        for (size_t i = 0; i < encoded_url.length(); ++i) {
            if (encoded_url[i] == '%' && i + 2 < encoded_url.length()) {
                int value;
                std::stringstream ss;
                ss << std::hex << encoded_url.substr(i + 1, 2);
                ss >> value;
                decoded_url += static_cast<char>(value);
                i += 2;  // Skip the next two characters (hex value)
            } else if (encoded_url[i] == '+') {
                decoded_url += ' ';
            } else {
                decoded_url += encoded_url[i];
            }
        }
        return decoded_url;
    }

    std::string util::url_encode(const std::string& url) {
        std::ostringstream encoded_url;
        for (unsigned char c : url) {
            if (isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
                encoded_url << c;
            } else {
                encoded_url << '%' << std::uppercase << std::setw(2) << std::setfill('0') << std::hex << static_cast<int>(c);
            }
        }
        return encoded_url.str();
    }

    std::vector<std::string> util::split(const std::string& str, char delimiter) {
        std::vector<std::string> tokens;
        std::stringstream ss(str);
        std::string token;
        while (std::getline(ss, token, delimiter)) {
            tokens.push_back(token);
        }
        return tokens;
    }

    std::string util::to_lower(std::string value) {
        for (auto& ch : value) {
            ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
        }
        return value;
    }

    std::optional<bool> util::parse_bool(const std::string& value) {
        auto normalized = to_lower(value);
        if (normalized == "1" || normalized == "true" || normalized == "yes") {
            return true;
        }
        if (normalized == "0" || normalized == "false" || normalized == "no") {
            return false;
        }
        return std::nullopt;
    }

    std::optional<long long> util::parse_int(const std::string& value) {
        try {
            size_t index = 0;
            long long parsed = std::stoll(value, &index);
            if (index == value.size()) {
                return parsed;
            }
        } catch (const std::exception&) {
        }
        return std::nullopt;
    }

    bool util::parse_url(const std::string& url, std::string& host, std::string& port, std::string& target) {
        static const boost::regex url_regex(R"(^(http|https)://([^:/]+)(?::(\d+))?(/.*)?$)");
        boost::smatch match;
        if (!boost::regex_match(url, match, url_regex)) {
            return false;
        }
        std::string scheme = match[1];
        host = match[2];
        port = match[3].str().empty() ? (scheme == "https" ? std::string("443") : std::string("80")) : match[3].str();
        target = match[4].str().empty() ? std::string("/") : match[4].str();
        return true;
    }

    std::string util::sha256_hex(const std::string& data) {
        unsigned char digest[EVP_MAX_MD_SIZE];
        unsigned int digest_len = 0;
        if (EVP_Digest(data.data(), data.size(), digest, &digest_len, EVP_sha256(), nullptr) != 1) {
            spdlog::error("EVP_Digest failed");
            return "";
        }
        return to_hex(digest, digest_len);
    }

    std::string util::sha256_file(const std::string& path) {
        std::ifstream file(path, std::ios::binary);
        if (!file.is_open()) {
            spdlog::error("Failed to open file for hashing: {}", path);
            return "";
        }
        digest_ctx md;
        if (md.ctx == nullptr || EVP_DigestInit_ex(md.ctx, EVP_sha256(), nullptr) != 1) {
            spdlog::error("EVP_DigestInit_ex failed for {}", path);
            return "";
        }
        std::vector<char> buffer(64 * 1024);
        while (file) {
            file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            auto got = file.gcount();
            if (got > 0 && EVP_DigestUpdate(md.ctx, buffer.data(), static_cast<size_t>(got)) != 1) {
                spdlog::error("EVP_DigestUpdate failed for {}", path);
                return "";
            }
        }
        if (file.bad()) {
            spdlog::error("Read error while hashing {}", path);
            return "";
        }
        unsigned char digest[EVP_MAX_MD_SIZE];
        unsigned int digest_len = 0;
        if (EVP_DigestFinal_ex(md.ctx, digest, &digest_len) != 1) {
            spdlog::error("EVP_DigestFinal_ex failed for {}", path);
            return "";
        }
        return to_hex(digest, digest_len);
    }

    std::string util::random_hex(std::size_t bytes) {
        static thread_local std::mt19937_64 rng{std::random_device{}()};
        std::uniform_int_distribution<int> dist(0, 255);
        std::ostringstream out;
        out << std::hex << std::nouppercase;
        for (size_t i = 0; i < bytes; ++i) {
            out << std::setw(2) << std::setfill('0') << dist(rng);
        }
        return out.str();
    }
} // namespace sitewatch
