#pragma once
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/asio.hpp>
#include <boost/asio/awaitable.hpp>
#include <cstddef>
#include <map>
#include <string>

namespace sitewatch {
    namespace beast = boost::beast;
    namespace http = beast::http;
    namespace net = boost::asio;
    using tcp = net::ip::tcp;

    struct http_request {
        std::string url;
        std::string body;
        std::map<std::string, std::string> headers;
    };

    struct http_response {
        int status_code = 0;
        std::string body;
        std::map<std::string, std::string> headers;
        std::string error;      // transport error, empty when a response arrived
    };

    // Blocking HTTP/1.1 client. Every call carries a deadline covering
    // resolve, connect, write and read.
    // Returns the HTTP status, or -1 invalid url, -2 timeout, -3 transport error.
    class HttpClient {
    public:
        static constexpr int ERR_INVALID_URL = -1;
        static constexpr int ERR_TIMEOUT = -2;
        static constexpr int ERR_TRANSPORT = -3;

        explicit HttpClient(int timeout_seconds = 10);
        ~HttpClient();

        int get(const http_request& req, http_response& res);
        int post(const http_request& req, http_response& res);
        int put(const http_request& req, http_response& res);

        void set_timeout(int seconds) { timeout_seconds_ = seconds; }
        int timeout() const { return timeout_seconds_; }
        void set_body_limit(std::size_t bytes) { body_limit_ = bytes; }

    private:
        int request_impl(http::verb verb, const http_request& req, http_response& res);
        net::awaitable<void> exchange(http::verb verb, const std::string& host, const std::string& port,
            const std::string& target, const http_request& req, http_response& res);

        int timeout_seconds_;
        std::size_t body_limit_ = 8 * 1024 * 1024;
    };
} // namespace sitewatch
