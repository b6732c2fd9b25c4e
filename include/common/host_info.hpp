/*
 * File: include/common/host_info.hpp
 * Project: Demo HTTP Service
 * Purpose: Host / process facts reported by GET /info
 * Last updated: 2026-10-19
 */

#pragma once
#include <string>
#include <boost/asio/ip/host_name.hpp>
#include <nlohmann/json.hpp>

#include <unistd.h>


// platform names as Node's os.platform() spells them
inline std::string os_family()
{
#if defined(__linux__)
    return "linux";
#elif defined(__APPLE__)
    return "darwin";
#elif defined(_WIN32)
    return "win32";
#elif defined(__FreeBSD__)
    return "freebsd";
#else
    return "unknown";
#endif
}

inline std::string cpu_arch()
{
#if defined(__x86_64__) || defined(_M_X64)
    return "x64";
#elif defined(__aarch64__) || defined(_M_ARM64)
    return "arm64";
#elif defined(__i386__) || defined(_M_IX86)
    return "ia32";
#elif defined(__arm__) || defined(_M_ARM)
    return "arm";
#else
    return "unknown";
#endif
}

inline long current_pid() { return static_cast<long>(::getpid()); }

inline std::string host_name_or_empty()
{
    boost::system::error_code ec;
    auto name = boost::asio::ip::host_name(ec);
    return ec ? std::string() : name;
}


struct HostInfo {
std::string platform;
std::string arch;
std::string hostname;
long pid{0};
};


inline HostInfo collect_host_info()
{
    return HostInfo{os_family(), cpu_arch(), host_name_or_empty(), current_pid()};
}

inline nlohmann::json host_info_to_json(const HostInfo &h)
{
    return nlohmann::json{
        {"platform", h.platform},
        {"arch", h.arch},
        {"hostname", h.hostname},
        {"pid", h.pid}};
}
