#pragma once
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/asio.hpp>
#include <boost/asio/awaitable.hpp>
#include <atomic>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace sitewatch {
    namespace beast = boost::beast;
    namespace http = beast::http;
    namespace net = boost::asio;
    using tcp = net::ip::tcp;

    struct request_context {
        std::map<std::string, std::string> path_params;     // from {name} route segments
        std::map<std::string, std::string> query_params;    // raw, not url-decoded
        std::string remote_address;

        // path parameter first, then query parameter, empty if absent
        std::string get_param(const std::string& name) const;
    };

    using request_ptr = std::shared_ptr<http::request<http::string_body>>;
    using response_ptr = std::shared_ptr<http::response<http::string_body>>;
    using context_ptr = std::shared_ptr<request_context>;
    using route_handler = std::function<net::awaitable<void>(request_ptr, response_ptr, context_ptr)>;

    // "/api/agents/{site}/config" against "/api/agents/north/config" -> {site: north}
    bool match_route(const std::string& pattern, const std::string& path, std::map<std::string, std::string>& params);
    bool parse_request_target(std::string_view target, std::string& path, std::map<std::string, std::string>& params);

    class HttpServer {
    public:
        HttpServer();
        ~HttpServer();

        void init(const std::string& address, unsigned short port, int threads);
        void set_request_timeout(int seconds) { request_timeout_ = seconds; }
        void set_max_request_body_size(std::size_t bytes) { max_request_body_size_ = bytes; }

        // routes are tried in registration order
        void register_route(const std::string& pattern, route_handler handler);
        bool has_route(const std::string& path) const;

        // blocks until stop() is called or the io_context runs out of work
        void run_server();
        void stop();

    private:
        net::awaitable<void> listener();
        net::awaitable<void> session(tcp::socket socket);
        net::awaitable<void> dispatch(request_ptr req, response_ptr res, context_ptr ctx);

        std::string address_ = "0.0.0.0";
        unsigned short port_ = 9000;
        int threads_ = 1;
        int request_timeout_ = 30;
        std::size_t max_request_body_size_ = 16 * 1024 * 1024;
        std::vector<std::pair<std::string, route_handler>> routes_;
        std::unique_ptr<net::io_context> ioc_;
        std::atomic<bool> stopped_{false};
    };
} // namespace sitewatch
