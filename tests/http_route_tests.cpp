#include "src/collector/collector_handler.hpp"
#include "src/http/http_server.hpp"

#include <chrono>
#include <iostream>
#include <map>
#include <memory>
#include <string>

namespace {
int Fail(const std::string& message) {
    std::cerr << message << std::endl;
    return 1;
}
} // namespace

int main() {
    std::map<std::string, std::string> params;
    if (!sitewatch::match_route("/api/agents/{site}/config", "/api/agents/loja%20centro/config", params)) {
        return Fail("Parameterised route did not match.");
    }
    if (params["site"] != "loja centro") {
        return Fail("Path parameter not url-decoded: " + params["site"]);
    }

    params.clear();
    if (!sitewatch::match_route("/api/status", "/api/status", params) || !params.empty()) {
        return Fail("Literal route did not match.");
    }
    if (sitewatch::match_route("/api/status/{site}", "/api/status", params)) {
        return Fail("Route with a parameter matched a shorter path.");
    }
    if (sitewatch::match_route("/api/agents/{site}/config", "/api/agents//config", params)) {
        return Fail("Empty path parameter should not match.");
    }
    if (sitewatch::match_route("/api/agents/{site}/config", "/api/agents/north/report", params)) {
        return Fail("Different literal segment matched.");
    }

    params.clear();
    if (!sitewatch::match_route("/api/admin/agents/{agent_id}/approve", "/api/admin/agents/abc123/approve", params) ||
        params["agent_id"] != "abc123") {
        return Fail("Admin approve route did not capture the agent id.");
    }

    std::string path;
    std::map<std::string, std::string> query;
    if (!sitewatch::parse_request_target("/api/speedtest/download?size_bytes=2048&x", path, query)) {
        return Fail("Request target not parsed.");
    }
    if (path != "/api/speedtest/download" || query["size_bytes"] != "2048" || query.count("x") != 1) {
        return Fail("Unexpected path or query split.");
    }

    sitewatch::request_context ctx;
    ctx.path_params["site"] = "north";
    ctx.query_params["site"] = "south";
    ctx.query_params["size_bytes"] = "10";
    if (ctx.get_param("site") != "north" || ctx.get_param("size_bytes") != "10" || !ctx.get_param("missing").empty()) {
        return Fail("get_param precedence is wrong.");
    }

    // the collector answers its API and nothing else
    auto store = std::make_shared<sitewatch::MemorySiteConfigStore>();
    auto registry = std::make_shared<sitewatch::CollectorRegistry>(store, sitewatch::registry_options{});
    auto aggregator = std::make_shared<sitewatch::StatusAggregator>(registry, std::chrono::seconds(180));
    sitewatch::CollectorHandler handler(registry, aggregator, store);
    sitewatch::HttpServer server;
    handler.register_routes(server);
    for (const char* target : {"/api/agents/register", "/api/agents/galpao/config", "/api/agents/galpao/report",
             "/api/agent/version", "/api/agent/download", "/api/speedtest/download", "/api/speedtest/upload",
             "/api/status", "/api/status/galpao", "/api/admin/agents", "/api/admin/agents/abc/approve",
             "/api/admin/agents/abc/reject", "/api/admin/sites/galpao/config"}) {
        if (!server.has_route(target)) {
            return Fail(std::string("Collector route missing: ") + target);
        }
    }
    if (server.has_route("/hello") || server.has_route("/")) {
        return Fail("Collector answers a path outside its API.");
    }

    return 0;
}
