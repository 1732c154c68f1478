// SPDX-License-Identifier: Apache-2.0
// log_rate_limit.hpp - sampling for log lines on hot paths (overflow assignment, reclaim sweeps).
#pragma once

#include "common/logger.hpp"

#include <atomic>
#include <cstdint>

namespace bulletsim::log {

// True for the 1st, (n+1)th, (2n+1)th ... hit of `counter`. n == 0 disables sampling.
inline bool sample_every(std::atomic<uint64_t> &counter, uint64_t n)
{
    const uint64_t seen = counter.fetch_add(1, std::memory_order_relaxed);
    return n <= 1 || seen % n == 0;
}

} // namespace bulletsim::log

// One counter per call site, shared by every thread that reaches it.
// BULLETSIM_LOG_EVERY_N(warn, 100, "overflow onto slot 0 load={}", load);
#define BULLETSIM_LOG_EVERY_N(lvl, N, ...) \
    do { \
        static std::atomic<uint64_t> bulletsim_site_hits{0}; \
        if (bulletsim::log::sample_every(bulletsim_site_hits, (N))) \
            bulletsim::log::lvl(__VA_ARGS__); \
    } while (0)
