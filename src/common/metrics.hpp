// SPDX-License-Identifier: Apache-2.0
// metrics.hpp
// Process-wide bullet counters (atomics, no dynamic allocation). Written from dispatcher and worker
// loops with relaxed ordering; read by the Prometheus endpoint and the periodic runtime log line.
#pragma once
#include <atomic>
#include <cstdint>

namespace bulletsim::metrics {

struct BulletCounters
{
    // Dispatcher lifecycle
    std::atomic<uint64_t> queued_total{0};
    std::atomic<uint64_t> assigned_total{0};
    std::atomic<uint64_t> completed_total{0};
    std::atomic<uint64_t> cancelled_total{0};
    std::atomic<uint64_t> reclaimed_total{0};
    std::atomic<uint64_t> overflow_assignments_total{0}; // pool saturated, forced onto slot 0
    std::atomic<uint64_t> duplicate_completions_total{0}; // completion for an id no longer in flight
    // Worker outcomes
    std::atomic<uint64_t> hits_direct_total{0};
    std::atomic<uint64_t> hits_proximity_total{0};
    std::atomic<uint64_t> hits_geometry_total{0};
    std::atomic<uint64_t> misses_range_total{0};
    std::atomic<uint64_t> misses_lifetime_total{0};
    std::atomic<uint64_t> shooter_gone_total{0};
    std::atomic<uint64_t> malformed_messages_total{0};
    // Gauges
    std::atomic<uint64_t> queued{0};
    std::atomic<uint64_t> in_flight{0};
    std::atomic<uint64_t> simulated{0}; // projectile bullets currently stepped by workers
    std::atomic<uint64_t> connected_clients{0};
};

struct TickCounters
{
    std::atomic<uint64_t> tick_duration_ns_accum{0};
    std::atomic<uint64_t> tick_samples{0};
    // Power-of-two buckets for worker simulation pass duration (base 50k ns) -> up to ~25ms.
    static constexpr int TICK_BUCKETS = 10;
    std::atomic<uint64_t> tick_hist[TICK_BUCKETS]{}; // bucket 0:<50k,1:<100k,...
    static constexpr uint64_t TICK_BASE_NS = 50000;
};

inline BulletCounters &bullets()
{
    static BulletCounters inst;
    return inst;
}

inline TickCounters &ticks()
{
    static TickCounters inst;
    return inst;
}

inline void inc(std::atomic<uint64_t> &c, uint64_t n = 1)
{
    c.fetch_add(n, std::memory_order_relaxed);
}

// Saturating gauge decrement; duplicate signals must never wrap a gauge around.
inline void dec(std::atomic<uint64_t> &g, uint64_t n = 1)
{
    uint64_t cur = g.load(std::memory_order_relaxed);
    uint64_t next;
    do {
        next = cur > n ? cur - n : 0;
    } while (!g.compare_exchange_weak(cur, next, std::memory_order_relaxed));
}

inline void add_tick_duration(uint64_t ns)
{
    auto &t = ticks();
    t.tick_duration_ns_accum.fetch_add(ns, std::memory_order_relaxed);
    t.tick_samples.fetch_add(1, std::memory_order_relaxed);
    for (int i = 0; i < TickCounters::TICK_BUCKETS; ++i) {
        if (ns < (TickCounters::TICK_BASE_NS << i)) {
            t.tick_hist[i].fetch_add(1, std::memory_order_relaxed);
            return;
        }
    }
    t.tick_hist[TickCounters::TICK_BUCKETS - 1].fetch_add(1, std::memory_order_relaxed);
}

inline uint64_t approx_tick_p99()
{
    auto &t = ticks();
    uint64_t total = t.tick_samples.load(std::memory_order_relaxed);
    if (total == 0)
        return 0;
    uint64_t target = (total * 99 + 99 - 1) / 100; // ceil(total*0.99)
    uint64_t cumulative = 0;
    for (int i = 0; i < TickCounters::TICK_BUCKETS; ++i) {
        cumulative += t.tick_hist[i].load(std::memory_order_relaxed);
        if (cumulative >= target)
            return TickCounters::TICK_BASE_NS << i;
    }
    return TickCounters::TICK_BASE_NS << (TickCounters::TICK_BUCKETS - 1);
}

inline uint64_t avg_tick_ns()
{
    auto &t = ticks();
    uint64_t samples = t.tick_samples.load(std::memory_order_relaxed);
    return samples ? t.tick_duration_ns_accum.load(std::memory_order_relaxed) / samples : 0;
}

} // namespace bulletsim::metrics
