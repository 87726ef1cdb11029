#include "http_server.hpp"
#include "src/util/util.hpp"
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <chrono>
#include <thread>
#include <spdlog/spdlog.h>

namespace sitewatch {

    std::string request_context::get_param(const std::string& name) const {
        auto it = path_params.find(name);
        if (it != path_params.end()) {
            return it->second;
        }
        it = query_params.find(name);
        if (it != query_params.end()) {
            return it->second;
        }
        return "";
    }

    bool match_route(const std::string& pattern, const std::string& path, std::map<std::string, std::string>& params) {
        auto pattern_parts = util::split(pattern, '/');
        auto path_parts = util::split(path, '/');
        // a trailing slash on the request path is not significant
        if (path_parts.size() == pattern_parts.size() + 1 && path_parts.back().empty()) {
            path_parts.pop_back();
        }
        if (pattern_parts.size() != path_parts.size()) {
            return false;
        }
        std::map<std::string, std::string> found;
        for (size_t i = 0; i < pattern_parts.size(); ++i) {
            const auto& p = pattern_parts[i];
            if (p.size() > 2 && p.front() == '{' && p.back() == '}') {
                if (path_parts[i].empty()) {
                    return false;
                }
                found[p.substr(1, p.size() - 2)] = util::url_decode(path_parts[i]);
            } else if (p != path_parts[i]) {
                return false;
            }
        }
        params = std::move(found);
        return true;
    }

    bool parse_request_target(std::string_view target, std::string& path, std::map<std::string, std::string>& params) {
        if (target.empty()) {
            return false;
        }
        size_t pos = target.find('?');
        if (pos == std::string_view::npos) {
            path = std::string(target);
            return true;
        }
        path = std::string(target.substr(0, pos));
        std::string_view query = target.substr(pos + 1);
        while (!query.empty()) {
            size_t amp = query.find('&');
            std::string_view pair = query.substr(0, amp);
            size_t eq = pair.find('=');
            if (eq != std::string_view::npos) {
                params.emplace(std::string(pair.substr(0, eq)), std::string(pair.substr(eq + 1)));
            } else if (!pair.empty()) {
                params.emplace(std::string(pair), std::string());
            }
            if (amp == std::string_view::npos)
                break;
            query.remove_prefix(amp + 1);
        }
        return true;
    }

    HttpServer::HttpServer() {}

    HttpServer::~HttpServer() {
        stop();
    }

    void HttpServer::init(const std::string& address, unsigned short port, int threads) {
        address_ = address;
        port_ = port;
        threads_ = threads > 0 ? threads : 1;
        ioc_ = std::make_unique<net::io_context>(threads_);
    }

    void HttpServer::register_route(const std::string& pattern, route_handler handler) {
        routes_.emplace_back(pattern, std::move(handler));
    }

    bool HttpServer::has_route(const std::string& path) const {
        for (const auto& route : routes_) {
            std::map<std::string, std::string> params;
            if (match_route(route.first, path, params)) {
                return true;
            }
        }
        return false;
    }

    void HttpServer::run_server() {
        if (!ioc_) {
            init(address_, port_, threads_);
        }
        net::co_spawn(*ioc_, listener(), [](std::exception_ptr e) {
            if (!e) return;
            try {
                std::rethrow_exception(e);
            } catch (const std::exception& ex) {
                spdlog::critical("Listener stopped: {}", ex.what());
            }
        });

        std::vector<std::thread> workers;
        workers.reserve(threads_ - 1);
        for (int i = 1; i < threads_; ++i) {
            workers.emplace_back([this] { ioc_->run(); });
        }
        ioc_->run();
        for (auto& t : workers) {
            t.join();
        }
    }

    void HttpServer::stop() {
        if (stopped_.exchange(true)) {
            return;
        }
        if (ioc_) {
            ioc_->stop();
        }
    }

    net::awaitable<void> HttpServer::listener() {
        auto executor = co_await net::this_coro::executor;
        tcp::endpoint endpoint{net::ip::make_address(address_), port_};
        tcp::acceptor acceptor(executor);
        acceptor.open(endpoint.protocol());
        acceptor.set_option(net::socket_base::reuse_address(true));
        acceptor.bind(endpoint);
        acceptor.listen(net::socket_base::max_listen_connections);
        spdlog::info("Listening on {}:{}", address_, port_);

        for (;;) {
            tcp::socket socket = co_await acceptor.async_accept(net::use_awaitable);
            net::co_spawn(executor, session(std::move(socket)), net::detached);
        }
    }

    net::awaitable<void> HttpServer::session(tcp::socket socket) {
        std::string remote;
        {
            beast::error_code ec;
            auto ep = socket.remote_endpoint(ec);
            remote = ec ? std::string("unknown") : ep.address().to_string();
        }
        beast::tcp_stream stream(std::move(socket));
        beast::flat_buffer buffer;
        try {
            for (;;) {
                http::request_parser<http::string_body> parser;
                parser.body_limit(max_request_body_size_);
                stream.expires_after(std::chrono::seconds(request_timeout_));
                co_await http::async_read(stream, buffer, parser, net::use_awaitable);

                auto req = std::make_shared<http::request<http::string_body>>(parser.release());
                auto res = std::make_shared<http::response<http::string_body>>(http::status::ok, req->version());
                res->set(http::field::server, "sitewatch-collector");
                res->keep_alive(req->keep_alive());
                auto ctx = std::make_shared<request_context>();
                ctx->remote_address = remote;

                co_await dispatch(req, res, ctx);
                res->prepare_payload();

                stream.expires_after(std::chrono::seconds(request_timeout_));
                co_await http::async_write(stream, *res, net::use_awaitable);
                if (!res->keep_alive()) {
                    break;
                }
            }
        } catch (const beast::system_error& se) {
            if (se.code() != http::error::end_of_stream &&
                se.code() != beast::error::timeout &&
                se.code() != net::error::operation_aborted &&
                se.code() != beast::errc::connection_reset) {
                spdlog::warn("Session with {} ended: {}", remote, se.code().message());
            }
        } catch (const std::exception& e) {
            spdlog::error("Session with {} failed: {}", remote, e.what());
        }
        beast::error_code ec;
        stream.socket().shutdown(tcp::socket::shutdown_send, ec);
    }

    net::awaitable<void> HttpServer::dispatch(request_ptr req, response_ptr res, context_ptr ctx) {
        std::string path;
        if (!parse_request_target(std::string_view(req->target().data(), req->target().size()), path, ctx->query_params)) {
            res->result(http::status::bad_request);
            co_return;
        }
        for (const auto& [pattern, handler] : routes_) {
            std::map<std::string, std::string> params;
            if (match_route(pattern, path, params)) {
                ctx->path_params = std::move(params);
                co_await handler(req, res, ctx);
                spdlog::debug("{} {} -> {}", std::string(req->method_string()), std::string(req->target()), res->result_int());
                co_return;
            }
        }
        res->result(http::status::not_found);
        res->set(http::field::content_type, "application/json");
        res->body() = R"({"error":"not_found"})";
        spdlog::debug("No route for {}", path);
        co_return;
    }
} // namespace sitewatch
