/*
 * File: src/demo_state.hpp
 * Project: Demo HTTP Service
 * Purpose: State shared by the server and the router
 * Notes:
 *  - One instance per process, owned by main (or by a test)
 *  - start is re-marked by HttpServer once the port is bound
 * Last updated: 2026-10-19
 */

#pragma once
#include <chrono>
#include <utility>
#include <string>
#include "common/host_info.hpp"
#include "common/request_counter.hpp"
#include "common/service_config.hpp"

#ifndef DEMO_SERVICE_VERSION
#define DEMO_SERVICE_VERSION "1.0.0"
#endif


struct ServiceState {
ServiceConfig config;
HostInfo host = collect_host_info();
RequestCounter requests;
std::chrono::steady_clock::time_point start = std::chrono::steady_clock::now();

ServiceState() = default;
explicit ServiceState(ServiceConfig cfg) : config(std::move(cfg)) {}

void mark_started(){ start = std::chrono::steady_clock::now(); }

double uptime_seconds() const {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}
};
