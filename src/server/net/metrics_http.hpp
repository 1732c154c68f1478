// SPDX-License-Identifier: Apache-2.0
// metrics_http.hpp - minimal HTTP scrape endpoint for the dispatcher counters.
#pragma once
#include <coro/coro.hpp>
#include <coro/io_scheduler.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace bulletsim::net {

// Counters and the worker pass histogram in Prometheus text exposition format.
std::string build_metrics_body();

// Full HTTP/1.1 response for one request head. Serves GET /metrics and GET /healthz.
std::string build_http_response(std::string_view request_head);

// Accepts scrapers on `port` until `stop` is set. One request per connection.
coro::task<void> run_metrics_endpoint(
    std::shared_ptr<coro::io_scheduler> scheduler, uint16_t port, std::shared_ptr<std::atomic_bool> stop);

} // namespace bulletsim::net
