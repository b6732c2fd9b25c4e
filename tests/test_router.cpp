/*
 * File: tests/test_router.cpp
 * Project: Demo HTTP Service
 * Purpose: Route contract without sockets
 * Last updated: 2026-10-19
 */

#include <catch2/catch_all.hpp>
#include <nlohmann/json.hpp>
#include "demo_http.hpp"

using Catch::Matchers::ContainsSubstring;
using nlohmann::json;

namespace {

http::response<http::string_body> call(ServiceState &s, const std::string &target,
                                       http::verb verb = http::verb::get)
{
    http::request<http::string_body> req{verb, target, 11};
    req.set(http::field::host, "localhost");
    return route_request(req, s);
}

} // namespace


TEST_CASE("GET / serves the html marker"){
ServiceState s;
auto res = call(s, "/");
REQUIRE(res.result()==http::status::ok);
REQUIRE_THAT(std::string(res[http::field::content_type]), ContainsSubstring("text/html"));
REQUIRE_THAT(res.body(), ContainsSubstring("Demo HTTP Service"));
}

TEST_CASE("GET /health reports healthy and uptime"){
ServiceState s;
auto res = call(s, "/health");
REQUIRE(res.result()==http::status::ok);
auto j = json::parse(res.body());
REQUIRE(j["status"]=="healthy");
REQUIRE(j["uptime"].is_number());
REQUIRE(j["uptime"].get<double>()>=0.0);
REQUIRE(j["timestamp"].get<std::string>().back()=='Z');
}

TEST_CASE("GET /info reports platform and pid"){
ServiceConfig cfg; cfg.environment = "test";
ServiceState s{cfg};
auto res = call(s, "/info");
REQUIRE(res.result()==http::status::ok);
auto j = json::parse(res.body());
REQUIRE(j["platform"]==os_family());
REQUIRE(j["pid"].get<long>()==current_pid());
REQUIRE(j["pid"].get<long>()>0);
REQUIRE(j["environment"]=="test");
REQUIRE(j.contains("arch"));
REQUIRE(j.contains("version"));
}

TEST_CASE("GET /metrics counts itself"){
ServiceState s;
auto res = call(s, "/metrics");
REQUIRE(res.result()==http::status::ok);
REQUIRE_THAT(std::string(res[http::field::content_type]), ContainsSubstring("text/plain"));
REQUIRE_THAT(res.body(), ContainsSubstring("http_requests_total 1\n"));
REQUIRE_THAT(res.body(), ContainsSubstring("# TYPE http_requests_total counter"));
}

TEST_CASE("unknown paths are 404 Not Found"){
ServiceState s;
for (const char *t : {"/nope", "/health/", "/HEALTH", "/metrics/x", "//"})
{
    auto res = call(s, t);
    REQUIRE(res.result()==http::status::not_found);
    REQUIRE(json::parse(res.body())==json{{"error", "Not Found"}});
}
}

TEST_CASE("non-GET on known paths is 404"){
ServiceState s;
for (auto v : {http::verb::post, http::verb::put, http::verb::delete_, http::verb::head})
{
    auto res = call(s, "/health", v);
    REQUIRE(res.result()==http::status::not_found);
    REQUIRE(json::parse(res.body())["error"]=="Not Found");
}
REQUIRE(s.requests.value()==4);
}

TEST_CASE("query string is ignored for matching"){
ServiceState s;
REQUIRE(call(s, "/health?verbose=1").result()==http::status::ok);
REQUIRE(call(s, "/?a=b").result()==http::status::ok);
REQUIRE(call(s, "/nope?x").result()==http::status::not_found);
}

TEST_CASE("fixed headers on every response"){
ServiceState s;
for (const char *t : {"/", "/health", "/info", "/metrics", "/missing"})
{
    auto res = call(s, t);
    REQUIRE(res[http::field::access_control_allow_origin]=="*");
    REQUIRE(res["X-Content-Type-Options"]=="nosniff");
}
}

TEST_CASE("404s are counted toward http_requests_total"){
ServiceState s;
call(s, "/");
call(s, "/nope");
call(s, "/also-missing", http::verb::post);
call(s, "/health");
REQUIRE(s.requests.value()==4);
REQUIRE_THAT(call(s, "/metrics").body(), ContainsSubstring("http_requests_total 5\n"));
}
