/*
 * File: include/common/probe.hpp
 * Project: Demo HTTP Service
 * Purpose: Liveness check used by demo_probe
 * Notes:
 *  - run_probe() returns the process exit status: 0 healthy, 1 otherwise
 * Last updated: 2026-10-19
 */

#pragma once
#include <ostream>
#include <stdexcept>
#include <string>
#include <boost/asio.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/core/flat_buffer.hpp>

#include <nlohmann/json.hpp>


struct BaseUrl {
std::string host;
std::string port{"80"};
};


// "http://host:port[/...]" or "host:port"; throws std::invalid_argument
inline BaseUrl parse_base_url(const std::string &base)
{
    std::string rest = base;
    auto scheme = rest.find("://");
    if (scheme != std::string::npos)
    {
        if (rest.substr(0, scheme) != "http")
            throw std::invalid_argument("unsupported scheme in '" + base + "'");
        rest = rest.substr(scheme + 3);
    }
    rest = rest.substr(0, rest.find('/'));

    BaseUrl url;
    auto colon = rest.find(':');
    url.host = rest.substr(0, colon);
    if (colon != std::string::npos)
        url.port = rest.substr(colon + 1);
    if (url.host.empty())
        throw std::invalid_argument("missing host in '" + base + "'");
    if (url.port.empty() || url.port.find_first_not_of("0123456789") != std::string::npos)
        throw std::invalid_argument("bad port in '" + base + "'");
    return url;
}

// 200, and for /health also {"status":"healthy"}
inline bool probe_passed(unsigned status, const std::string &path, const std::string &body)
{
    if (status != 200)
        return false;
    if (path != "/health")
        return true;
    auto j = nlohmann::json::parse(body, nullptr, false);
    return j.is_object() && j.value("status", std::string()) == "healthy";
}

inline int run_probe(const std::string &base, const std::string &path, std::ostream &out, std::ostream &err)
{
    namespace http = boost::beast::http;
    try
    {
        auto url = parse_base_url(base);

        boost::asio::io_context ioc;
        boost::asio::ip::tcp::resolver res{ioc};
        auto results = res.resolve(url.host, url.port);
        boost::asio::ip::tcp::socket sock{ioc};
        boost::asio::connect(sock, results.begin(), results.end());

        http::request<http::empty_body> req{http::verb::get, path, 11};
        req.set(http::field::host, url.host);
        req.set(http::field::connection, "close");
        http::write(sock, req);

        boost::beast::flat_buffer buf;
        http::response<http::string_body> resp;
        http::read(sock, buf, resp);

        boost::system::error_code ignored;
        sock.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ignored);

        out << "[demo_probe] status=" << resp.result_int() << " body=" << resp.body() << std::endl;
        if (!probe_passed(resp.result_int(), path, resp.body()))
        {
            err << "[demo_probe] unhealthy response\n";
            return 1;
        }
        return 0;
    }
    catch (const std::exception &e)
    {
        err << "[demo_probe] " << base << path << ": " << e.what() << "\n";
        return 1;
    }
}
