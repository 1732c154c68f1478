// SPDX-License-Identifier: Apache-2.0
#include "server/net/metrics_http.hpp"

#include "common/logger.hpp"
#include "common/metrics.hpp"

#include <coro/net/tcp/client.hpp>
#include <coro/net/tcp/server.hpp>
#include <coro/poll.hpp>

#include <chrono>
#include <initializer_list>
#include <span>
#include <sstream>
#include <utility>

namespace bulletsim::net {

namespace {

using namespace std::chrono_literals;

class Exposition
{
public:
    void counter(const char *name, uint64_t v) { scalar(name, "counter", v); }
    void gauge(const char *name, uint64_t v) { scalar(name, "gauge", v); }

    // One metric family split by a single label.
    void labelled(const char *name, const char *label, std::initializer_list<std::pair<const char *, uint64_t>> rows)
    {
        m_out << "# TYPE bulletsim_" << name << " counter\n";
        for (auto &[value, n] : rows)
            m_out << "bulletsim_" << name << '{' << label << "=\"" << value << "\"} " << n << '\n';
    }

    void tick_histogram()
    {
        namespace m = bulletsim::metrics;
        auto &t = m::ticks();
        m_out << "# TYPE bulletsim_worker_tick_ns histogram\n";
        uint64_t running = 0;
        for (int i = 0; i < m::TickCounters::TICK_BUCKETS; ++i) {
            running += t.tick_hist[i].load(std::memory_order_relaxed);
            m_out << "bulletsim_worker_tick_ns_bucket{le=\"" << (m::TickCounters::TICK_BASE_NS << i) << "\"} "
                  << running << '\n';
        }
        m_out << "bulletsim_worker_tick_ns_bucket{le=\"+Inf\"} " << running << '\n'
              << "bulletsim_worker_tick_ns_sum " << t.tick_duration_ns_accum.load() << '\n'
              << "bulletsim_worker_tick_ns_count " << t.tick_samples.load() << '\n';
    }

    std::string str() const { return m_out.str(); }

private:
    void scalar(const char *name, const char *type, uint64_t v)
    {
        m_out << "# TYPE bulletsim_" << name << ' ' << type << '\n' << "bulletsim_" << name << ' ' << v << '\n';
    }

    std::ostringstream m_out;
};

std::string http_reply(const char *status, std::string_view body)
{
    std::ostringstream r;
    r << "HTTP/1.1 " << status << "\r\n"
      << "Content-Type: text/plain; version=0.0.4\r\n"
      << "Content-Length: " << body.size() << "\r\n"
      << "Connection: close\r\n\r\n"
      << body;
    return r.str();
}

coro::task<void> serve_one(std::shared_ptr<coro::io_scheduler> scheduler, coro::net::tcp::client client)
{
    co_await scheduler->schedule();
    if (co_await client.poll(coro::poll_op::read, 200ms) != coro::poll_status::event)
        co_return;
    std::string head(1024, '\0');
    auto [rs, got] = client.recv(head);
    if (rs != coro::net::recv_status::ok)
        co_return;
    auto reply = build_http_response(std::string_view(got.data(), got.size()));
    std::span<const char> pending{reply.data(), reply.size()};
    while (!pending.empty()) {
        if (co_await client.poll(coro::poll_op::write, 1s) != coro::poll_status::event)
            co_return;
        auto [ss, rest] = client.send(pending);
        if (ss != coro::net::send_status::ok && ss != coro::net::send_status::would_block)
            co_return;
        pending = rest;
    }
}

} // namespace

std::string build_metrics_body()
{
    namespace m = bulletsim::metrics;
    auto &b = m::bullets();
    Exposition e;
    e.counter("bullets_queued_total", b.queued_total.load());
    e.counter("bullets_assigned_total", b.assigned_total.load());
    e.counter("bullets_completed_total", b.completed_total.load());
    e.counter("bullets_cancelled_total", b.cancelled_total.load());
    e.counter("bullets_reclaimed_total", b.reclaimed_total.load());
    e.counter("overflow_assignments_total", b.overflow_assignments_total.load());
    e.counter("duplicate_completions_total", b.duplicate_completions_total.load());
    e.labelled(
        "hits_total", "kind",
        {{"direct", b.hits_direct_total.load()},
         {"proximity", b.hits_proximity_total.load()},
         {"geometry", b.hits_geometry_total.load()}});
    e.labelled(
        "misses_total", "cause",
        {{"range", b.misses_range_total.load()},
         {"lifetime", b.misses_lifetime_total.load()},
         {"shooter_gone", b.shooter_gone_total.load()}});
    e.counter("malformed_messages_total", b.malformed_messages_total.load());
    e.gauge("bullets_queued", b.queued.load());
    e.gauge("bullets_in_flight", b.in_flight.load());
    e.gauge("bullets_simulated", b.simulated.load());
    e.gauge("connected_clients", b.connected_clients.load());
    e.gauge("avg_tick_ns", m::avg_tick_ns());
    e.gauge("p99_tick_ns", m::approx_tick_p99());
    e.tick_histogram();
    return e.str();
}

std::string build_http_response(std::string_view request_head)
{
    auto line_end = request_head.find("\r\n");
    auto request_line = request_head.substr(0, line_end);
    if (request_line.rfind("GET ", 0) != 0)
        return http_reply("405 Method Not Allowed", "GET only\n");
    auto target = request_line.substr(4, request_line.find(' ', 4) - 4);
    if (target == "/metrics")
        return http_reply("200 OK", build_metrics_body());
    if (target == "/healthz")
        return http_reply("200 OK", "ok\n");
    return http_reply("404 Not Found", "not found\n");
}

coro::task<void> run_metrics_endpoint(
    std::shared_ptr<coro::io_scheduler> scheduler, uint16_t port, std::shared_ptr<std::atomic_bool> stop)
{
    co_await scheduler->schedule();
    coro::net::tcp::server listener{scheduler, coro::net::tcp::server::options{.port = port}};
    bulletsim::log::info("[metrics] scrape endpoint on port {}", port);
    while (!stop->load()) {
        auto ps = co_await listener.poll(250ms);
        if (ps == coro::poll_status::timeout)
            continue;
        if (ps != coro::poll_status::event) {
            bulletsim::log::error("[metrics] listener closed; endpoint stopped");
            co_return;
        }
        auto client = listener.accept();
        if (client.socket().is_valid())
            scheduler->spawn(serve_one(scheduler, std::move(client)));
    }
}

} // namespace bulletsim::net
