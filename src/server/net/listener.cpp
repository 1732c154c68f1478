// SPDX-License-Identifier: Apache-2.0
#include "server/net/listener.hpp"

#include "common/framing.hpp"
#include "common/logger.hpp"
#include "common/metrics.hpp"
#include "server/sim/wire.hpp"

#include <coro/net/tcp/client.hpp>
#include <coro/net/tcp/server.hpp>
#include <coro/poll.hpp>

#include <algorithm>
#include <span>
#include <stdexcept>
#include <string>

namespace bulletsim::net {

namespace {

bulletsim::ServerMessage make_error(const std::string &reason)
{
    bulletsim::ServerMessage msg;
    msg.mutable_error()->set_reason(reason);
    return msg;
}

bulletsim::ServerMessage make_stats(const bulletsim::sim::DispatcherStats &s)
{
    bulletsim::ServerMessage msg;
    auto *st = msg.mutable_stats();
    st->set_queued(static_cast<uint32_t>(s.queued));
    st->set_in_flight(static_cast<uint32_t>(s.in_flight));
    st->set_total_workers(s.total_workers);
    for (auto &w : s.workers) {
        auto *wl = st->add_workers();
        wl->set_worker(w.worker);
        wl->set_load(w.load);
        for (auto &id : w.bullets)
            wl->add_bullet_ids(id);
    }
    return msg;
}

bulletsim::sim::BulletId fire(const bulletsim::FireRequest &req, bulletsim::sim::BulletSimulator &sim)
{
    const auto origin = bulletsim::sim::wire::from_proto(req.origin());
    const auto direction = bulletsim::sim::wire::from_proto(req.direction());
    switch (req.kind()) {
        case bulletsim::FireRequest::INSTANT:
            return sim.queue_instant_bullet(req.participant(), req.damage(), req.range(), origin, direction);
        case bulletsim::FireRequest::PROJECTILE:
            return sim.queue_projectile_bullet(req.participant(), req.damage(), req.range(), origin, direction);
        default:
            break;
    }
    bulletsim::sim::BulletSpec spec{req.participant(), req.damage(), req.range(), origin, direction, req.instant()};
    std::optional<std::chrono::milliseconds> timeout;
    if (req.timeout_ms() > 0)
        timeout = std::chrono::milliseconds(req.timeout_ms());
    return sim.queue_general_bullet(spec, timeout);
}

} // namespace

std::optional<bulletsim::ServerMessage> handle_request(
    const bulletsim::ClientMessage &request,
    bulletsim::sim::BulletSimulator &sim,
    EventRouter &router,
    const std::shared_ptr<Outbox> &outbox)
{
    if (request.has_fire()) {
        const auto &req = request.fire();
        try {
            auto id = router.track(outbox, [&] { return fire(req, sim); });
            bulletsim::ServerMessage msg;
            auto *q = msg.mutable_queued();
            q->set_request_tag(req.request_tag());
            q->set_bullet_id(id);
            return msg;
        } catch (const std::logic_error &ex) {
            // invalid descriptor or simulator already shut down
            return make_error(ex.what());
        }
    }
    if (request.has_cancel()) {
        const auto &id = request.cancel().bullet_id();
        // A connection may only cancel bullets it fired itself.
        if (!router.owned_by(id, outbox.get()) || !sim.cancel_bullet(id))
            return make_error("unknown bullet " + id);
        router.release(id);
        return std::nullopt;
    }
    if (request.has_stats())
        return make_stats(sim.stats());
    return make_error("empty request");
}

static coro::task<bool> send_all(coro::net::tcp::client &client, std::span<const char> data)
{
    std::span<const char> rest = data;
    while (!rest.empty()) {
        auto pst = co_await client.poll(coro::poll_op::write, std::chrono::seconds(5));
        if (pst != coro::poll_status::event)
            co_return false;
        auto [s, remaining] = client.send(rest);
        if (s == coro::net::send_status::ok || s == coro::net::send_status::would_block) {
            rest = remaining;
            continue;
        }
        co_return false;
    }
    co_return true;
}

static coro::task<void> connection_loop(
    std::shared_ptr<coro::io_scheduler> scheduler,
    coro::net::tcp::client client,
    std::shared_ptr<bulletsim::sim::BulletSimulator> sim,
    std::shared_ptr<EventRouter> router)
{
    co_await scheduler->schedule();
    bulletsim::metrics::inc(bulletsim::metrics::bullets().connected_clients);
    bulletsim::log::info("[conn] new connection");
    auto outbox = std::make_shared<Outbox>();
    auto poll_timeout = std::max(sim->config().tick_interval, std::chrono::milliseconds(5));
    bulletsim::netutil::FrameParseState fps;
    while (!sim->shutting_down()) {
        // Flush queued replies and routed events first.
        auto pending = outbox->drain();
        if (!pending.empty()) {
            std::string batch;
            batch.reserve(pending.size() * 48);
            for (auto &msg : pending) {
                std::string out;
                if (!msg.SerializeToString(&out))
                    continue;
                bulletsim::netutil::append_frame(batch, out);
            }
            if (!co_await send_all(client, std::span<const char>(batch.data(), batch.size()))) {
                bulletsim::log::warn("[conn] send failed, closing");
                break;
            }
        }
        auto pstat = co_await client.poll(coro::poll_op::read, poll_timeout);
        if (pstat == coro::poll_status::timeout)
            continue;
        if (pstat != coro::poll_status::event) {
            bulletsim::log::info("[conn] poll closed/error");
            break;
        }
        std::string tmp(4096, '\0');
        auto [rstatus, span] = client.recv(tmp);
        if (rstatus == coro::net::recv_status::closed) {
            bulletsim::log::info("[conn] closed by peer");
            break;
        }
        if (rstatus == coro::net::recv_status::would_block)
            continue;
        if (rstatus != coro::net::recv_status::ok) {
            bulletsim::log::warn("[conn] recv error");
            break;
        }
        fps.buffer.insert(fps.buffer.end(), span.begin(), span.end());
        std::string payload;
        bool drop = false;
        while (true) {
            auto ex = bulletsim::netutil::try_extract(fps, payload);
            if (ex == bulletsim::netutil::extract_status::need_more)
                break;
            if (ex == bulletsim::netutil::extract_status::invalid) {
                bulletsim::log::warn("[conn] invalid frame length, dropping connection");
                drop = true;
                break;
            }
            bulletsim::ClientMessage cmsg;
            if (!cmsg.ParseFromArray(payload.data(), static_cast<int>(payload.size()))) {
                bulletsim::log::warn("[conn] failed to parse request, dropping connection");
                drop = true;
                break;
            }
            if (auto reply = handle_request(cmsg, *sim, *router, outbox))
                outbox->push(std::move(*reply));
        }
        if (drop)
            break;
    }
    router->release_connection(outbox.get());
    bulletsim::metrics::dec(bulletsim::metrics::bullets().connected_clients);
}

coro::task<void> run_listener(
    std::shared_ptr<coro::io_scheduler> scheduler,
    uint16_t port,
    std::shared_ptr<bulletsim::sim::BulletSimulator> sim,
    std::shared_ptr<EventRouter> router)
{
    co_await scheduler->schedule();
    bulletsim::log::info("[listener] starting TCP listener on port {}", port);
    coro::net::tcp::server server{scheduler, coro::net::tcp::server::options{.port = port}};
    while (!sim->shutting_down()) {
        auto status = co_await server.poll(std::chrono::milliseconds(250));
        if (status == coro::poll_status::event) {
            auto client = server.accept();
            if (client.socket().is_valid())
                scheduler->spawn(connection_loop(scheduler, std::move(client), sim, router));
        } else if (status == coro::poll_status::error || status == coro::poll_status::closed) {
            bulletsim::log::error("[listener] poll error/closed, exiting listener loop");
            co_return;
        }
    }
    bulletsim::log::info("[listener] stopped");
}

} // namespace bulletsim::net
