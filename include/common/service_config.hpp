/*
 * File: include/common/service_config.hpp
 * Project: Demo HTTP Service
 * Purpose: Startup configuration (environment, then command line)
 * Notes:
 *  - Built once in main and copied into ServiceState
 *  - PORT falls back to 3000 when unset or invalid
 * Last updated: 2026-10-19
 */

#pragma once
#include <cstdlib>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

constexpr unsigned short kDefaultPort = 3000;
constexpr unsigned kMaxThreads = 64;


struct ServiceConfig {
std::string host{"0.0.0.0"};
unsigned short port{kDefaultPort};
std::string environment{"development"};  // reported only, no behavioural effect
unsigned threads{1};
};


// Whole string must be a decimal integer in [lo, hi].
inline std::optional<unsigned long> parse_bounded(const std::string &s, unsigned long lo, unsigned long hi)
{
    if (s.empty() || s.find_first_not_of("0123456789") != std::string::npos)
        return std::nullopt;
    // 19 digits always fit in 64 bits, so stoull cannot throw
    if (s.size() > 19)
        return std::nullopt;
    unsigned long long v = std::stoull(s);
    if (v < lo || v > hi)
        return std::nullopt;
    return static_cast<unsigned long>(v);
}

inline std::optional<unsigned short> parse_port(const std::string &s)
{
    auto v = parse_bounded(s, 1, 65535);
    if (!v)
        return std::nullopt;
    return static_cast<unsigned short>(*v);
}

inline ServiceConfig config_from_env(std::ostream &warn = std::cerr)
{
    ServiceConfig cfg;
    if (const char *h = std::getenv("LISTEN_HOST"); h && *h)
        cfg.host = h;
    if (const char *p = std::getenv("PORT"); p && *p)
    {
        if (auto port = parse_port(p))
            cfg.port = *port;
        else
            warn << "WARN: ignoring invalid PORT='" << p << "', using " << kDefaultPort << "\n";
    }
    if (const char *e = std::getenv("APP_ENV"); e && *e)
        cfg.environment = e;
    else if (const char *n = std::getenv("NODE_ENV"); n && *n)
        cfg.environment = n;
    return cfg;
}

inline std::string usage(const std::string &prog)
{
    return "usage: " + prog + " [--host ADDR] [--port N] [--env NAME] [--threads N] [--help]\n"
           "  environment: LISTEN_HOST, PORT (default 3000), APP_ENV or NODE_ENV\n";
}

// Applies command line overrides on top of cfg.
// Returns false when --help was given; throws std::invalid_argument on bad usage.
inline bool parse_args(int argc, char **argv, ServiceConfig &cfg)
{
    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        auto next = [&]() -> std::string
        {
            if (i + 1 >= argc)
                throw std::invalid_argument("missing value for " + a);
            return argv[++i];
        };
        if (a == "--help" || a == "-h")
            return false;
        else if (a == "--host")
            cfg.host = next();
        else if (a == "--port")
        {
            auto v = next();
            auto port = parse_port(v);
            if (!port)
                throw std::invalid_argument("invalid --port '" + v + "'");
            cfg.port = *port;
        }
        else if (a == "--env")
            cfg.environment = next();
        else if (a == "--threads")
        {
            auto v = next();
            auto n = parse_bounded(v, 1, kMaxThreads);
            if (!n)
                throw std::invalid_argument("invalid --threads '" + v + "'");
            cfg.threads = static_cast<unsigned>(*n);
        }
        else
            throw std::invalid_argument("unknown argument '" + a + "'");
    }
    return true;
}
