/*
 * File: include/common/request_counter.hpp
 * Project: Demo HTTP Service
 * Purpose: Process-lifetime request tally
 * Notes:
 *  - Owned by ServiceState, never a global
 *  - Safe to increment from several io_context threads
 * Last updated: 2026-10-19
 */

#pragma once
#include <atomic>
#include <cstdint>


class RequestCounter {
std::atomic<uint64_t> n_{0};
public:
RequestCounter() = default;
RequestCounter(const RequestCounter&) = delete;
RequestCounter& operator=(const RequestCounter&) = delete;

// returns the value after this request was counted
uint64_t increment(){ return n_.fetch_add(1, std::memory_order_relaxed) + 1; }
uint64_t value() const { return n_.load(std::memory_order_relaxed); }
};
