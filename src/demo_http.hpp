/*
 * File: src/demo_http.hpp
 * Project: Demo HTTP Service
 * Purpose: HTTP routing and handlers
 * Notes:
 *  - Every request is counted before routing, 404s included
 *  - Every response carries the CORS and nosniff headers
 *  - route_request() is socket-free so tests can drive it directly
 * Last updated: 2026-10-19
 */

#pragma once
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/asio.hpp>
#include <boost/asio/strand.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <atomic>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>

#include "demo_state.hpp"

namespace http = boost::beast::http;

// -------- helpers --------

// RFC3339 UTC with milliseconds (e.g., 2026-10-19T14:59:01.234Z)
inline std::string iso8601_now_ms()
{
    using namespace std::chrono;
    auto now = time_point_cast<milliseconds>(system_clock::now());
    auto ms = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;
    std::time_t tt = system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&tt, &tm);

    char base[32];
    std::strftime(base, sizeof(base), "%Y-%m-%dT%H:%M:%S", &tm);

    std::ostringstream oss;
    oss << base << '.' << std::setw(3) << std::setfill('0') << ms.count() << 'Z';
    return oss.str();
}

// "/health?verbose=1" -> "/health"
inline std::string target_path(boost::beast::string_view target)
{
    auto q = target.find('?');
    if (q != boost::beast::string_view::npos)
        target = target.substr(0, q);
    return std::string(target);
}

inline std::string metrics_text(const ServiceState &state)
{
    std::ostringstream out;
    out << "# HELP http_requests_total Total number of HTTP requests received\n"
        << "# TYPE http_requests_total counter\n"
        << "http_requests_total " << state.requests.value() << "\n"
        << "# HELP process_uptime_seconds Seconds since the service started listening\n"
        << "# TYPE process_uptime_seconds gauge\n"
        << "process_uptime_seconds " << std::fixed << std::setprecision(3) << state.uptime_seconds() << "\n";
    return out.str();
}

constexpr const char *kIndexHtml =
    "<!DOCTYPE html>\n"
    "<html><head><title>Demo HTTP Service</title></head>\n"
    "<body><h1>Demo HTTP Service</h1><p>The server is up and answering requests.</p></body></html>\n";

template <class Body, class Allocator>
http::response<http::string_body>
make_response(const http::request<Body, http::basic_fields<Allocator>> &req, http::status status,
              const char *content_type, std::string body)
{
    http::response<http::string_body> res{status, req.version()};
    res.set(http::field::server, "demo-beast");
    res.set(http::field::content_type, content_type);
    res.set(http::field::access_control_allow_origin, "*");
    res.set("X-Content-Type-Options", "nosniff");
    res.keep_alive(req.keep_alive());
    res.body() = std::move(body);
    res.prepare_payload();
    return res;
}

// Counts the request, then answers one of the fixed routes or 404.
template <class Body, class Allocator>
http::response<http::string_body>
route_request(const http::request<Body, http::basic_fields<Allocator>> &req, ServiceState &state)
{
    using nlohmann::json;

    state.requests.increment();

    const std::string path = target_path(req.target());
    const bool get = req.method() == http::verb::get;

    // GET /
    if (get && path == "/")
        return make_response(req, http::status::ok, "text/html; charset=utf-8", kIndexHtml);

    // GET /health
    if (get && path == "/health")
    {
        json body{{"status", "healthy"}, {"uptime", state.uptime_seconds()}, {"timestamp", iso8601_now_ms()}};
        return make_response(req, http::status::ok, "application/json", body.dump());
    }

    // GET /info
    if (get && path == "/info")
    {
        json body = host_info_to_json(state.host);
        body["environment"] = state.config.environment;
        body["version"] = DEMO_SERVICE_VERSION;
        return make_response(req, http::status::ok, "application/json", body.dump());
    }

    // GET /metrics (Prometheus text exposition)
    if (get && path == "/metrics")
        return make_response(req, http::status::ok, "text/plain; version=0.0.4", metrics_text(state));

    // 404 fallback, also for non-GET on the known paths
    return make_response(req, http::status::not_found, "application/json", R"({"error":"Not Found"})");
}

// -------- HTTP server --------

class HttpServer
{
    boost::asio::io_context &ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    boost::asio::steady_timer retry_timer_;
    std::atomic<uint64_t> accept_errors_{0};
    ServiceState &state_;

public:
    static constexpr std::chrono::milliseconds kAcceptRetry{250};

    // Throws std::runtime_error if the endpoint cannot be bound.
    HttpServer(boost::asio::io_context &ioc, boost::asio::ip::tcp::endpoint ep, ServiceState &s)
        : ioc_(ioc), acceptor_(boost::asio::make_strand(ioc)), retry_timer_(acceptor_.get_executor()), state_(s)
    {
        boost::system::error_code ec;
        auto fail = [&](const char *what)
        {
            std::ostringstream msg;
            msg << what << ' ' << ep << " failed: " << ec.message();
            throw std::runtime_error(msg.str());
        };
        acceptor_.open(ep.protocol(), ec);
        if (ec)
            fail("open");
        acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
        if (ec)
            fail("set reuse_address on");
        acceptor_.bind(ep, ec);
        if (ec)
            fail("bind");
        acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
        if (ec)
            fail("listen on");
        state_.mark_started();
        do_accept();
    }

    unsigned short port() const { return acceptor_.local_endpoint().port(); }
    uint64_t accept_errors() const { return accept_errors_.load(); }

    // Stops accepting and releases the port. Runs on the acceptor's strand,
    // so it may be called from any thread.
    void stop()
    {
        boost::asio::post(acceptor_.get_executor(), [this]
                          {
            boost::system::error_code ignored;
            retry_timer_.cancel();
            acceptor_.close(ignored); });
    }

private:
    void do_accept()
    {
        acceptor_.async_accept(boost::asio::make_strand(ioc_), [this](boost::beast::error_code ec, boost::asio::ip::tcp::socket socket)
                               {
            if (!acceptor_.is_open()) return;
            if (ec) return on_accept_error(ec);
            std::make_shared<Session>(std::move(socket), state_)->run();
            do_accept(); });
    }

    // EMFILE and friends: the pending connection stays in the backlog, so
    // re-arming at once would spin. Wait, then try again.
    void on_accept_error(const boost::beast::error_code &ec)
    {
        ++accept_errors_;
        std::cerr << "demo_server: accept failed: " << ec.message()
                  << ", retrying in " << kAcceptRetry.count() << "ms\n";
        retry_timer_.expires_after(kAcceptRetry);
        retry_timer_.async_wait([this](boost::beast::error_code wait_ec)
                                {
            if (wait_ec || !acceptor_.is_open()) return;
            do_accept(); });
    }

    struct Session : std::enable_shared_from_this<Session>
    {
        boost::asio::ip::tcp::socket socket;
        boost::beast::flat_buffer buffer;
        http::request<http::string_body> req;
        ServiceState &state;

        Session(boost::asio::ip::tcp::socket &&s, ServiceState &st)
            : socket(std::move(s)), state(st) {}

        void run() { do_read(); }

        void do_read()
        {
            req = {};
            auto self = shared_from_this();
            http::async_read(socket, buffer, req, [self](boost::beast::error_code ec, std::size_t)
                             {
                if (ec == http::error::end_of_stream) return self->do_close();
                if (ec) return;
                self->respond(route_request(self->req, self->state)); });
        }

        // response must stay alive until async_write completes
        void respond(http::response<http::string_body> &&res)
        {
            auto self = shared_from_this();
            auto sp = std::make_shared<http::response<http::string_body>>(std::move(res));
            http::async_write(socket, *sp, [self, sp](boost::beast::error_code ec, std::size_t)
                              {
                if (ec) return;
                if (sp->need_eof()) return self->do_close();
                self->do_read(); });
        }

        void do_close()
        {
            boost::system::error_code ignored;
            socket.shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored);
        }
    };
};
