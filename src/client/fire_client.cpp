// SPDX-License-Identifier: Apache-2.0
// Command line load generator: fires bullets at a running server and prints the events it receives.
#include "bulletsim.pb.h"
#include "common/framing.hpp"
#include "common/logger.hpp"

#include <coro/coro.hpp>
#include <coro/default_executor.hpp>
#include <coro/io_scheduler.hpp>
#include <coro/net/tcp/client.hpp>

#include <span>
#include <string>
#include <unordered_set>
#include <vector>

using namespace std::chrono_literals;

namespace {

struct Options
{
    uint16_t port = 40100;
    uint32_t count = 20;
    bool instant = false;
    uint64_t participant = 1;
    uint32_t wait_secs = 20;
};

coro::task<bool> send_frame(coro::net::tcp::client &client, const bulletsim::ClientMessage &msg)
{
    std::string payload;
    if (!msg.SerializeToString(&payload))
        co_return false;
    auto frame = bulletsim::netutil::build_frame(payload);
    std::span<const char> rest(frame.data(), frame.size());
    while (!rest.empty()) {
        if (co_await client.poll(coro::poll_op::write, 5s) != coro::poll_status::event)
            co_return false;
        auto [st, remaining] = client.send(rest);
        if (st != coro::net::send_status::ok && st != coro::net::send_status::would_block)
            co_return false;
        rest = remaining;
    }
    co_return true;
}

// Reads whatever is available and appends complete messages to `out`. Returns false once the
// connection is unusable.
coro::task<bool> read_frames(
    coro::net::tcp::client &client,
    bulletsim::netutil::FrameParseState &state,
    std::vector<bulletsim::ServerMessage> &out)
{
    auto pst = co_await client.poll(coro::poll_op::read, 100ms);
    if (pst == coro::poll_status::timeout)
        co_return true;
    if (pst != coro::poll_status::event)
        co_return false;
    std::string tmp(4096, '\0');
    auto [st, span] = client.recv(tmp);
    if (st == coro::net::recv_status::would_block)
        co_return true;
    if (st != coro::net::recv_status::ok)
        co_return false;
    state.buffer.insert(state.buffer.end(), span.begin(), span.end());
    std::string payload;
    while (true) {
        auto ex = bulletsim::netutil::try_extract(state, payload);
        if (ex == bulletsim::netutil::extract_status::need_more)
            break;
        if (ex == bulletsim::netutil::extract_status::invalid)
            co_return false;
        bulletsim::ServerMessage sm;
        if (!sm.ParseFromArray(payload.data(), static_cast<int>(payload.size())))
            co_return false;
        out.push_back(std::move(sm));
    }
    co_return true;
}

coro::task<int> fire_flow(std::shared_ptr<coro::io_scheduler> scheduler, Options opt)
{
    co_await scheduler->schedule();
    coro::net::tcp::client cli{scheduler, {.address = coro::net::ip_address::from_string("127.0.0.1"), .port = opt.port}};
    if (co_await cli.connect(5s) != coro::net::connect_status::connected) {
        bulletsim::log::error("connect to port {} failed", opt.port);
        co_return 1;
    }
    bulletsim::log::info("connected to port {}", opt.port);

    for (uint32_t i = 0; i < opt.count; ++i) {
        bulletsim::ClientMessage msg;
        auto *f = msg.mutable_fire();
        f->set_kind(opt.instant ? bulletsim::FireRequest::INSTANT : bulletsim::FireRequest::PROJECTILE);
        f->set_participant(opt.participant);
        f->set_damage(10.f);
        f->set_range(150.f);
        f->mutable_origin();
        f->mutable_direction()->set_x(1.f);
        f->set_request_tag(i);
        if (!co_await send_frame(cli, msg)) {
            bulletsim::log::error("send failed");
            co_return 1;
        }
    }

    bulletsim::netutil::FrameParseState state;
    std::unordered_set<std::string> outstanding;
    uint32_t queued = 0, hits = 0, errors = 0;
    bool stats_sent = false, stats_seen = false;
    auto start = std::chrono::steady_clock::now();
    while (std::chrono::steady_clock::now() - start < std::chrono::seconds(opt.wait_secs)) {
        std::vector<bulletsim::ServerMessage> msgs;
        if (!co_await read_frames(cli, state, msgs)) {
            bulletsim::log::warn("connection closed by server");
            break;
        }
        for (auto &sm : msgs) {
            if (sm.has_queued()) {
                ++queued;
                outstanding.insert(sm.queued().bullet_id());
            } else if (sm.has_hit()) {
                ++hits;
                const auto &h = sm.hit();
                bulletsim::log::info(
                    "hit bullet={} target={} damage={} proximity={}", h.bullet_id(), h.target(), h.damage(),
                    h.proximity());
            } else if (sm.has_complete()) {
                outstanding.erase(sm.complete().bullet_id());
            } else if (sm.has_stats()) {
                const auto &s = sm.stats();
                stats_seen = true;
                bulletsim::log::info(
                    "stats queued={} in_flight={} workers={}", s.queued(), s.in_flight(), s.total_workers());
                for (const auto &w : s.workers())
                    bulletsim::log::info("  worker {} load={}", w.worker(), w.load());
            } else if (sm.has_error()) {
                ++errors;
                bulletsim::log::warn("server error: {}", sm.error().reason());
            }
        }
        if (queued + errors >= opt.count && outstanding.empty()) {
            if (stats_seen)
                break;
            if (!stats_sent) {
                bulletsim::ClientMessage stats;
                stats.mutable_stats();
                if (!co_await send_frame(cli, stats))
                    break;
                stats_sent = true;
            }
        }
    }
    bulletsim::log::info(
        "done queued={} hits={} errors={} unfinished={}", queued, hits, errors, outstanding.size());
    co_return outstanding.empty() ? 0 : 2;
}

} // namespace

int main(int argc, char **argv)
{
    Options opt;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        try {
            if (a == "--count" && i + 1 < argc) {
                opt.count = static_cast<uint32_t>(std::stoul(argv[++i]));
            } else if (a == "--participant" && i + 1 < argc) {
                opt.participant = std::stoull(argv[++i]);
            } else if (a == "--wait-seconds" && i + 1 < argc) {
                opt.wait_secs = static_cast<uint32_t>(std::stoul(argv[++i]));
            } else if (a == "--instant") {
                opt.instant = true;
            } else if (!a.empty() && a[0] != '-') {
                opt.port = static_cast<uint16_t>(std::stoi(a));
            }
        } catch (const std::exception &) {
            bulletsim::log::warn("Invalid value for '{}', ignoring", a);
        }
    }
    auto scheduler = coro::default_executor::io_executor();
    return coro::sync_wait(fire_flow(scheduler, opt));
}
