// SPDX-License-Identifier: Apache-2.0
// Counters, tick histogram, Prometheus rendering and the logger callback hook.
#include "common/log_rate_limit.hpp"
#include "common/logger.hpp"
#include "common/metrics.hpp"
#include "server/net/metrics_http.hpp"

#include <atomic>
#include <cassert>
#include <iostream>
#include <string>

static std::atomic<int> g_warn_lines{0};

static void on_log(int level, const char *msg, void *)
{
    if (level == static_cast<int>(bulletsim::log::level::warn) && std::string(msg).find("saturated") != std::string::npos)
        g_warn_lines.fetch_add(1);
}

int main()
{
    namespace m = bulletsim::metrics;
    // Gauges never wrap below zero.
    std::atomic<uint64_t> gauge{2};
    m::dec(gauge, 5);
    assert(gauge.load() == 0);
    m::inc(gauge, 3);
    m::dec(gauge);
    assert(gauge.load() == 2);

    // Tick histogram
    for (int i = 0; i < 99; ++i)
        m::add_tick_duration(10'000); // bucket 0
    m::add_tick_duration(10'000'000'000ull); // beyond the last bucket
    assert(m::ticks().tick_samples.load() == 100);
    assert(m::approx_tick_p99() == m::TickCounters::TICK_BASE_NS);
    assert(m::avg_tick_ns() == (99ull * 10'000 + 10'000'000'000ull) / 100);

    m::inc(m::bullets().hits_proximity_total, 4);
    auto body = bulletsim::net::build_metrics_body();
    assert(body.find("bulletsim_hits_total{kind=\"proximity\"} 4") != std::string::npos);
    assert(body.find("bulletsim_worker_tick_ns_count 100") != std::string::npos);
    assert(body.find("bulletsim_worker_tick_ns_bucket{le=\"+Inf\"} 100") != std::string::npos);
    assert(body.find("# TYPE bulletsim_misses_total counter") != std::string::npos);

    // Request routing of the scrape endpoint.
    auto ok = bulletsim::net::build_http_response("GET /metrics HTTP/1.1\r\nHost: x\r\n\r\n");
    assert(ok.rfind("HTTP/1.1 200 OK\r\n", 0) == 0);
    assert(ok.find("bulletsim_bullets_queued_total") != std::string::npos);
    assert(bulletsim::net::build_http_response("GET /healthz HTTP/1.1\r\n\r\n").find("\r\n\r\nok\n") != std::string::npos);
    assert(bulletsim::net::build_http_response("GET /other HTTP/1.1\r\n\r\n").rfind("HTTP/1.1 404", 0) == 0);
    assert(bulletsim::net::build_http_response("POST /metrics HTTP/1.1\r\n\r\n").rfind("HTTP/1.1 405", 0) == 0);

    // Rate-limited logging reaches the callback once per N calls.
    bulletsim::log::init();
    bulletsim::log::set_level("debug");
    bulletsim::log::set_callback(&on_log, nullptr);
    for (int i = 0; i < 25; ++i)
        BULLETSIM_LOG_EVERY_N(warn, 10, "pool saturated i={}", i);
    bulletsim::log::flush();
    assert(g_warn_lines.load() == 3);
    bulletsim::log::set_callback(nullptr, nullptr);
    std::cout << "unit_metrics OK" << std::endl;
    return 0;
}
