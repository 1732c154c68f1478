// SPDX-License-Identifier: Apache-2.0
#include "server/sim/dispatcher.hpp"

#include "bulletsim.pb.h"
#include "common/log_rate_limit.hpp"
#include "common/logger.hpp"
#include "common/metrics.hpp"
#include "server/sim/wire.hpp"

#include <algorithm>
#include <cstdio>
#include <random>
#include <stdexcept>

namespace bulletsim::sim {

Dispatcher::Dispatcher(
    const SimConfig &cfg,
    std::vector<std::shared_ptr<Channel>> workers,
    std::shared_ptr<Channel> completions,
    std::shared_ptr<IBulletEvents> events)
    : m_cfg(cfg)
    , m_completions(std::move(completions))
    , m_events(std::move(events))
{
    if (workers.empty())
        throw std::invalid_argument("dispatcher needs at least one worker");
    m_workers.reserve(workers.size());
    for (auto &inbox : workers) {
        WorkerState ws;
        ws.inbox = std::move(inbox);
        m_workers.push_back(std::move(ws));
    }
    std::random_device rd;
    char buf[24];
    std::snprintf(buf, sizeof(buf), "b_%08x_", static_cast<unsigned>(rd()));
    m_id_prefix = buf;
}

BulletId Dispatcher::next_id_locked()
{
    return m_id_prefix + std::to_string(m_next_seq++);
}

BulletId Dispatcher::queue_bullet(const BulletSpec &spec, std::optional<std::chrono::milliseconds> timeout)
{
    if (!is_valid(spec))
        throw std::invalid_argument("bullet needs a non-zero direction and a positive range");
    if (spec.range > m_cfg.max_range)
        throw std::invalid_argument(
            "bullet range " + std::to_string(spec.range) + " exceeds max_range " + std::to_string(m_cfg.max_range));
    if (timeout && timeout->count() <= 0)
        throw std::invalid_argument("bullet timeout override must be positive");
    std::scoped_lock lk{m_mutex};
    if (m_shut_down)
        throw std::logic_error("dispatcher is shut down");
    auto ticket = std::make_shared<BulletTicket>();
    ticket->id = next_id_locked();
    ticket->spec = spec;
    ticket->timeout = timeout;
    m_pending.emplace(ticket->id, ticket);
    m_pending_order.push_back(ticket->id);
    bulletsim::metrics::inc(bulletsim::metrics::bullets().queued_total);
    publish_gauges_locked();
    return ticket->id;
}

bool Dispatcher::cancel_bullet(const BulletId &id)
{
    std::scoped_lock lk{m_mutex};
    if (m_pending.erase(id)) {
        bulletsim::metrics::inc(bulletsim::metrics::bullets().cancelled_total);
        publish_gauges_locked();
        return true;
    }
    auto it = m_in_flight.find(id);
    if (it == m_in_flight.end())
        return false;
    auto ticket = it->second;
    if (ticket->worker)
        m_workers[*ticket->worker].inbox->push(wire::encode_cancel(id));
    release_locked(*ticket);
    bulletsim::metrics::inc(bulletsim::metrics::bullets().cancelled_total);
    publish_gauges_locked();
    return true;
}

DispatcherStats Dispatcher::stats() const
{
    std::scoped_lock lk{m_mutex};
    DispatcherStats s;
    s.queued = m_pending.size();
    s.in_flight = m_in_flight.size();
    s.total_workers = static_cast<uint32_t>(m_workers.size());
    s.workers.reserve(m_workers.size());
    for (uint32_t i = 0; i < m_workers.size(); ++i) {
        WorkerLoadSnapshot w;
        w.worker = i;
        w.load = m_workers[i].load;
        w.bullets.reserve(m_workers[i].assigned.size());
        for (auto &kv : m_workers[i].assigned)
            w.bullets.push_back(kv.first);
        std::sort(w.bullets.begin(), w.bullets.end());
        s.workers.push_back(std::move(w));
    }
    return s;
}

uint32_t Dispatcher::select_worker_locked(bool &overflow) const
{
    // Strictly lowest load below capacity; ties go to the first slot in pool order.
    uint32_t best = 0;
    uint32_t best_load = m_cfg.worker_capacity;
    bool found = false;
    for (uint32_t i = 0; i < m_workers.size(); ++i) {
        if (m_workers[i].load < best_load) {
            best = i;
            best_load = m_workers[i].load;
            found = true;
        }
    }
    overflow = !found;
    return found ? best : 0;
}

size_t Dispatcher::assignment_pass(TimePoint now)
{
    std::scoped_lock lk{m_mutex};
    if (m_shut_down || m_pending.empty()) {
        m_pending_order.clear();
        return 0;
    }
    size_t assigned = 0;
    for (size_t i = m_pending_order.size(); i-- > 0;) {
        auto it = m_pending.find(m_pending_order[i]);
        if (it == m_pending.end())
            continue; // cancelled while pending
        auto ticket = it->second;
        if (ticket->being_processed)
            continue;
        bool overflow = false;
        uint32_t slot = select_worker_locked(overflow);
        if (overflow) {
            bulletsim::metrics::inc(bulletsim::metrics::bullets().overflow_assignments_total);
            BULLETSIM_LOG_EVERY_N(
                warn, 50, "[dispatcher] pool saturated, overflowing id={} onto worker 0 load={}", ticket->id,
                m_workers[0].load);
        }
        ticket->being_processed = true;
        ticket->start_time = now;
        ticket->worker = slot;
        auto &ws = m_workers[slot];
        ws.load += 1;
        ws.assigned.emplace(ticket->id, ticket);
        m_in_flight.emplace(ticket->id, ticket);
        ws.inbox->push(wire::encode_process(ticket->id, ticket->spec));
        m_pending.erase(it);
        bulletsim::metrics::inc(bulletsim::metrics::bullets().assigned_total);
        ++assigned;
    }
    // Everything still pending kept its relative order.
    std::vector<BulletId> remaining;
    remaining.reserve(m_pending.size());
    for (auto &id : m_pending_order) {
        if (m_pending.count(id))
            remaining.push_back(id);
    }
    m_pending_order.swap(remaining);
    publish_gauges_locked();
    return assigned;
}

size_t Dispatcher::reclamation_pass(TimePoint now)
{
    std::vector<BulletId> reclaimed;
    {
        std::scoped_lock lk{m_mutex};
        std::vector<std::shared_ptr<BulletTicket>> stale;
        for (auto &kv : m_in_flight) {
            auto limit = kv.second->timeout.value_or(m_cfg.default_timeout);
            if (now - kv.second->start_time >= limit)
                stale.push_back(kv.second);
        }
        for (auto &ticket : stale) {
            if (ticket->worker)
                m_workers[*ticket->worker].inbox->push(wire::encode_cancel(ticket->id));
            release_locked(*ticket);
            bulletsim::metrics::inc(bulletsim::metrics::bullets().reclaimed_total);
            bulletsim::log::warn(
                "[dispatcher] reclaimed id={} worker={} after {}ms", ticket->id, ticket->worker.value_or(0),
                std::chrono::duration_cast<std::chrono::milliseconds>(now - ticket->start_time).count());
            reclaimed.push_back(ticket->id);
        }
        if (!stale.empty())
            publish_gauges_locked();
    }
    for (auto &id : reclaimed)
        m_events->on_bullet_reclaimed(id);
    return reclaimed.size();
}

size_t Dispatcher::drain_completions()
{
    size_t matched = 0;
    for (auto &bytes : m_completions->drain()) {
        bulletsim::WorkerEvent ev;
        if (bytes.empty() || !ev.ParseFromString(bytes) || !ev.has_bullet_complete()) {
            bulletsim::metrics::inc(bulletsim::metrics::bullets().malformed_messages_total);
            BULLETSIM_LOG_EVERY_N(warn, 100, "[dispatcher] dropping malformed worker event bytes={}", bytes.size());
            continue;
        }
        if (on_bullet_complete(ev.bullet_complete().id(), ev.bullet_complete().worker()))
            ++matched;
    }
    return matched;
}

bool Dispatcher::on_bullet_complete(const BulletId &id, uint32_t worker)
{
    {
        std::scoped_lock lk{m_mutex};
        auto it = m_in_flight.find(id);
        if (it == m_in_flight.end()) {
            bulletsim::metrics::inc(bulletsim::metrics::bullets().duplicate_completions_total);
            return false;
        }
        auto ticket = it->second;
        if (ticket->worker && *ticket->worker != worker)
            bulletsim::log::warn(
                "[dispatcher] completion for id={} from worker {} but assigned to {}", id, worker, *ticket->worker);
        release_locked(*ticket);
        bulletsim::metrics::inc(bulletsim::metrics::bullets().completed_total);
        publish_gauges_locked();
    }
    m_events->on_bullet_complete(id);
    return true;
}

void Dispatcher::release_locked(const BulletTicket &ticket)
{
    if (ticket.worker && *ticket.worker < m_workers.size()) {
        auto &ws = m_workers[*ticket.worker];
        ws.assigned.erase(ticket.id);
        ws.load = ws.load > 0 ? ws.load - 1 : 0;
    }
    m_in_flight.erase(ticket.id);
}

void Dispatcher::shutdown()
{
    std::scoped_lock lk{m_mutex};
    if (m_shut_down)
        return;
    m_shut_down = true;
    auto destruct = wire::encode_destruct();
    for (auto &ws : m_workers) {
        ws.inbox->push(destruct);
        ws.assigned.clear();
        ws.load = 0;
    }
    bulletsim::log::info(
        "[dispatcher] shutdown workers={} dropped_pending={} dropped_in_flight={}", m_workers.size(),
        m_pending.size(), m_in_flight.size());
    m_pending.clear();
    m_pending_order.clear();
    m_in_flight.clear();
    m_completions->clear();
    publish_gauges_locked();
}

bool Dispatcher::is_shut_down() const
{
    std::scoped_lock lk{m_mutex};
    return m_shut_down;
}

void Dispatcher::publish_gauges_locked() const
{
    auto &m = bulletsim::metrics::bullets();
    m.queued.store(m_pending.size(), std::memory_order_relaxed);
    m.in_flight.store(m_in_flight.size(), std::memory_order_relaxed);
}

} // namespace bulletsim::sim
