#include "http_client.hpp"
#include "src/util/util.hpp"
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <chrono>
#include <exception>
#include <spdlog/spdlog.h>

#ifndef SITEWATCH_VERSION
#define SITEWATCH_VERSION "0.0.0"
#endif

namespace sitewatch {

    HttpClient::HttpClient(int timeout_seconds)
        : timeout_seconds_(timeout_seconds) {}

    HttpClient::~HttpClient() {}

    int HttpClient::get(const http_request& req, http_response& res) {
        return request_impl(http::verb::get, req, res);
    }

    int HttpClient::post(const http_request& req, http_response& res) {
        return request_impl(http::verb::post, req, res);
    }

    int HttpClient::put(const http_request& req, http_response& res) {
        return request_impl(http::verb::put, req, res);
    }

    int HttpClient::request_impl(http::verb verb, const http_request& req, http_response& res) {
        res = http_response{};
        std::string host, port, target;
        if (!util::parse_url(req.url, host, port, target)) {
            res.error = "invalid url: " + req.url;
            return ERR_INVALID_URL;
        }

        bool done = false;
        std::exception_ptr failure;
        net::io_context ioc;
        net::co_spawn(ioc, exchange(verb, host, port, target, req, res),
            [&done, &failure](std::exception_ptr e) {
                failure = e;
                done = true;
            });
        // the stream deadline covers connect/write/read; this one also bounds the resolver
        ioc.run_for(std::chrono::seconds(timeout_seconds_ + 1));
        if (!done) {
            ioc.stop();
            res.error = "request timed out after " + std::to_string(timeout_seconds_) + "s";
            return ERR_TIMEOUT;
        }
        if (failure) {
            try {
                std::rethrow_exception(failure);
            } catch (const beast::system_error& se) {
                res.error = se.code().message();
                return se.code() == beast::error::timeout ? ERR_TIMEOUT : ERR_TRANSPORT;
            } catch (const std::exception& e) {
                res.error = e.what();
            }
            return ERR_TRANSPORT;
        }
        return res.status_code;
    }

    net::awaitable<void> HttpClient::exchange(http::verb verb, const std::string& host, const std::string& port,
            const std::string& target, const http_request& req, http_response& res) {
        auto executor = co_await net::this_coro::executor;
        tcp::resolver resolver(executor);
        beast::tcp_stream stream(executor);
        const auto deadline = std::chrono::seconds(timeout_seconds_);

        auto results = co_await resolver.async_resolve(host, port, net::use_awaitable);
        stream.expires_after(deadline);
        co_await stream.async_connect(results, net::use_awaitable);

        http::request<http::string_body> http_req{verb, target, 11};
        http_req.set(http::field::host, host);
        http_req.set(http::field::user_agent, "sitewatch/" SITEWATCH_VERSION);
        for (const auto& [k, v] : req.headers) {
            http_req.set(k, v);
        }
        http_req.body() = req.body;
        http_req.prepare_payload();

        stream.expires_after(deadline);
        co_await http::async_write(stream, http_req, net::use_awaitable);

        beast::flat_buffer buffer;
        http::response_parser<http::string_body> parser;
        parser.body_limit(body_limit_);
        stream.expires_after(deadline);
        co_await http::async_read(stream, buffer, parser, net::use_awaitable);

        auto& http_res = parser.get();
        res.status_code = http_res.result_int();
        res.body = std::move(http_res.body());
        for (auto const& field : http_res.base()) {
            res.headers[std::string(field.name_string())] = std::string(field.value());
        }

        beast::error_code ec;
        stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        co_return;
    }
} // namespace sitewatch
