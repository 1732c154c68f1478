// SPDX-License-Identifier: Apache-2.0
#include "server/sim/simulator.hpp"

#include "common/logger.hpp"

#include <algorithm>

namespace bulletsim::sim {

BulletSimulator::BulletSimulator(
    const SimConfig &cfg,
    std::shared_ptr<IWorldQuery> world,
    std::shared_ptr<IParticipantDirectory> participants,
    std::shared_ptr<IBulletEvents> events)
    : m_cfg(cfg)
    , m_completions(std::make_shared<Channel>())
{
    std::vector<std::shared_ptr<Channel>> inboxes;
    m_workers.reserve(cfg.worker_count);
    for (uint32_t i = 0; i < cfg.worker_count; ++i) {
        m_workers.push_back(std::make_shared<Worker>(i, cfg, world, participants, events, m_completions));
        inboxes.push_back(m_workers.back()->inbox());
    }
    m_dispatcher = std::make_unique<Dispatcher>(cfg, std::move(inboxes), m_completions, std::move(events));
    bulletsim::log::info(
        "[sim] pool workers={} capacity={} tick={}ms speed={} timeout={}ms", cfg.worker_count, cfg.worker_capacity,
        cfg.tick_interval.count(), cfg.projectile_speed, cfg.default_timeout.count());
}

BulletId BulletSimulator::queue_instant_bullet(
    ParticipantId participant, float damage, float range, const Vec3 &origin, const Vec3 &direction)
{
    return m_dispatcher->queue_bullet(BulletSpec{participant, damage, range, origin, direction, true});
}

BulletId BulletSimulator::queue_projectile_bullet(
    ParticipantId participant, float damage, float range, const Vec3 &origin, const Vec3 &direction)
{
    return m_dispatcher->queue_bullet(BulletSpec{participant, damage, range, origin, direction, false});
}

BulletId BulletSimulator::queue_general_bullet(const BulletSpec &spec, std::optional<std::chrono::milliseconds> timeout)
{
    return m_dispatcher->queue_bullet(spec, timeout);
}

bool BulletSimulator::cancel_bullet(const BulletId &id)
{
    return m_dispatcher->cancel_bullet(id);
}

DispatcherStats BulletSimulator::stats() const
{
    return m_dispatcher->stats();
}

void BulletSimulator::shutdown()
{
    if (m_shutdown_once.exchange(true, std::memory_order_acq_rel))
        return;
    auto deadline = Clock::now() + m_cfg.destruct_grace;
    m_destruct_deadline_ns.store(deadline.time_since_epoch().count(), std::memory_order_release);
    m_dispatcher->shutdown();
    m_shutdown_requested.store(true, std::memory_order_release);
}

TimePoint BulletSimulator::destruct_deadline() const
{
    return TimePoint(Clock::duration(m_destruct_deadline_ns.load(std::memory_order_acquire)));
}

void BulletSimulator::step(TimePoint now)
{
    m_dispatcher->drain_completions();
    m_dispatcher->assignment_pass(now);
    for (auto &w : m_workers) {
        w->process_inbox(now);
        w->tick(now);
    }
    m_dispatcher->drain_completions();
    if (!m_next_reclaim)
        m_next_reclaim = now + m_cfg.reclaim_interval();
    if (now >= *m_next_reclaim) {
        m_dispatcher->reclamation_pass(now);
        m_next_reclaim = now + m_cfg.reclaim_interval();
    }
}

coro::task<void> run_dispatcher(std::shared_ptr<coro::io_scheduler> scheduler, std::shared_ptr<BulletSimulator> sim)
{
    co_await scheduler->schedule();
    auto tick = sim->config().tick_interval;
    auto next = Clock::now();
    while (!sim->shutting_down()) {
        auto now = Clock::now();
        if (now < next) {
            co_await scheduler->yield_for(next - now);
            continue;
        }
        next += tick;
        if (next < now)
            next = now + tick; // fell behind; do not burst
        sim->dispatcher().drain_completions();
        sim->dispatcher().assignment_pass(now);
    }
    bulletsim::log::debug("[sim] dispatcher loop exit");
    sim->loop_finished();
}

coro::task<void> run_reclaimer(std::shared_ptr<coro::io_scheduler> scheduler, std::shared_ptr<BulletSimulator> sim)
{
    co_await scheduler->schedule();
    auto interval = sim->config().reclaim_interval();
    auto poll = std::min<std::chrono::milliseconds>(interval, std::chrono::milliseconds(250));
    auto next = Clock::now() + interval;
    while (!sim->shutting_down()) {
        auto now = Clock::now();
        if (now < next) {
            co_await scheduler->yield_for(std::min<Clock::duration>(next - now, poll));
            continue;
        }
        next = now + interval;
        sim->dispatcher().reclamation_pass(now);
    }
    bulletsim::log::debug("[sim] reclaimer loop exit");
    sim->loop_finished();
}

coro::task<void> run_worker(
    std::shared_ptr<coro::io_scheduler> scheduler, std::shared_ptr<BulletSimulator> sim, uint32_t index)
{
    co_await scheduler->schedule();
    Worker &worker = sim->worker(index);
    auto tick = sim->config().tick_interval;
    auto next = Clock::now();
    while (true) {
        auto now = Clock::now();
        worker.process_inbox(now);
        if (worker.inert())
            break;
        if (sim->shutting_down() && now >= sim->destruct_deadline()) {
            bulletsim::log::warn("[sim] worker #{} ignored destruct, tearing down", index);
            break;
        }
        if (now < next) {
            co_await scheduler->yield_for(next - now);
            continue;
        }
        next += tick;
        if (next < now)
            next = now + tick;
        worker.tick(now);
    }
    bulletsim::log::debug("[sim] worker #{} loop exit", index);
    sim->loop_finished();
}

void spawn_simulator(const std::shared_ptr<coro::io_scheduler> &scheduler, const std::shared_ptr<BulletSimulator> &sim)
{
    sim->loop_started();
    scheduler->spawn(run_dispatcher(scheduler, sim));
    sim->loop_started();
    scheduler->spawn(run_reclaimer(scheduler, sim));
    for (uint32_t i = 0; i < sim->worker_count(); ++i) {
        sim->loop_started();
        scheduler->spawn(run_worker(scheduler, sim, i));
    }
}

} // namespace bulletsim::sim
