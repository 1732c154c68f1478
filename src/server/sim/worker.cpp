// SPDX-License-Identifier: Apache-2.0
#include "server/sim/worker.hpp"

#include "common/log_rate_limit.hpp"
#include "common/logger.hpp"
#include "common/metrics.hpp"
#include "server/sim/wire.hpp"

#include <chrono>

namespace bulletsim::sim {

namespace {

void count_outcome(Outcome o)
{
    auto &m = bulletsim::metrics::bullets();
    switch (o) {
        case Outcome::hit_target:
            bulletsim::metrics::inc(m.hits_direct_total);
            break;
        case Outcome::hit_proximity:
            bulletsim::metrics::inc(m.hits_proximity_total);
            break;
        case Outcome::hit_geometry:
            bulletsim::metrics::inc(m.hits_geometry_total);
            break;
        case Outcome::range_exhausted:
            bulletsim::metrics::inc(m.misses_range_total);
            break;
        case Outcome::lifetime_exceeded:
            bulletsim::metrics::inc(m.misses_lifetime_total);
            break;
        case Outcome::shooter_gone:
            bulletsim::metrics::inc(m.shooter_gone_total);
            break;
        case Outcome::active:
            break;
    }
}

} // namespace

Worker::Worker(
    uint32_t index,
    const SimConfig &cfg,
    std::shared_ptr<IWorldQuery> world,
    std::shared_ptr<IParticipantDirectory> participants,
    std::shared_ptr<IBulletEvents> events,
    std::shared_ptr<Channel> completions)
    : m_index(index)
    , m_dt(std::chrono::duration<float>(cfg.tick_interval).count())
    , m_params(hit_params_from(cfg))
    , m_world(std::move(world))
    , m_participants(std::move(participants))
    , m_events(std::move(events))
    , m_inbox(std::make_shared<Channel>())
    , m_completions(std::move(completions))
{
}

size_t Worker::process_inbox(TimePoint now)
{
    auto messages = m_inbox->drain();
    if (inert())
        return 0;
    size_t handled = 0;
    for (auto &bytes : messages) {
        bulletsim::WorkerMessage msg;
        if (bytes.empty() || !msg.ParseFromString(bytes)
            || msg.payload_case() == bulletsim::WorkerMessage::PAYLOAD_NOT_SET) {
            bulletsim::metrics::inc(bulletsim::metrics::bullets().malformed_messages_total);
            BULLETSIM_LOG_EVERY_N(warn, 100, "[worker] #{} dropping malformed message bytes={}", m_index, bytes.size());
            continue;
        }
        ++handled;
        if (msg.has_process_bullet()) {
            handle_process(msg.process_bullet(), now);
        } else if (msg.has_cancel_bullet()) {
            handle_cancel(msg.cancel_bullet().id());
        } else if (msg.has_destruct()) {
            handle_destruct();
            break; // remaining messages are discarded
        }
    }
    return handled;
}

void Worker::handle_process(const bulletsim::ProcessBullet &msg, TimePoint now)
{
    BulletId id = msg.id();
    BulletSpec spec = wire::spec_from_proto(msg);
    if (id.empty() || !is_valid(spec)) {
        bulletsim::metrics::inc(bulletsim::metrics::bullets().malformed_messages_total);
        bulletsim::log::warn("[worker] #{} rejecting bullet id='{}' range={} (invalid descriptor)", m_index, id, spec.range);
        if (!id.empty())
            m_completions->push(wire::encode_complete(id, m_index));
        return;
    }
    if (spec.instant) {
        finish(id, resolve_instant(id, spec, *m_world, m_params));
        return;
    }
    if (m_active.count(id)) {
        bulletsim::log::debug("[worker] #{} duplicate assignment id={} ignored", m_index, id);
        return;
    }
    m_active.emplace(id, make_sim_bullet(id, spec, now));
    bulletsim::metrics::inc(bulletsim::metrics::bullets().simulated);
}

void Worker::handle_cancel(const BulletId &id)
{
    if (m_active.erase(id)) {
        bulletsim::metrics::dec(bulletsim::metrics::bullets().simulated);
        bulletsim::log::debug("[worker] #{} cancelled id={}", m_index, id);
    }
}

void Worker::handle_destruct()
{
    bulletsim::metrics::dec(bulletsim::metrics::bullets().simulated, m_active.size());
    bulletsim::log::debug("[worker] #{} destruct active={}", m_index, m_active.size());
    m_active.clear();
    m_inert.store(true, std::memory_order_release);
}

void Worker::tick(TimePoint now)
{
    if (inert() || m_active.empty())
        return;
    auto tick_start = Clock::now();
    for (auto it = m_active.begin(); it != m_active.end();) {
        SimBullet &bullet = it->second;
        Resolution res = step_projectile(bullet, m_dt, now, *m_world, *m_participants, m_params);
        if (!is_terminal(res.outcome)) {
            ++it;
            continue;
        }
        BulletId id = it->first;
        it = m_active.erase(it);
        bulletsim::metrics::dec(bulletsim::metrics::bullets().simulated);
        finish(id, res);
    }
    auto tick_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(Clock::now() - tick_start).count();
    bulletsim::metrics::add_tick_duration(static_cast<uint64_t>(tick_ns));
}

void Worker::finish(const BulletId &id, const Resolution &res)
{
    count_outcome(res.outcome);
    if (res.hit) {
        bulletsim::log::debug(
            "[worker] #{} {} id={} target={} damage={}", m_index, outcome_name(res.outcome), id, res.hit->target,
            res.hit->damage);
        m_events->on_bullet_hit(*res.hit);
    } else {
        bulletsim::log::debug("[worker] #{} {} id={}", m_index, outcome_name(res.outcome), id);
    }
    m_completions->push(wire::encode_complete(id, m_index));
}

} // namespace bulletsim::sim
