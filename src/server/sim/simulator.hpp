// SPDX-License-Identifier: Apache-2.0
// simulator.hpp - Owns the dispatcher, the worker pool and their channels; runs them as coroutine loops.
#pragma once
#include "server/sim/collaborators.hpp"
#include "server/sim/dispatcher.hpp"
#include "server/sim/types.hpp"
#include "server/sim/worker.hpp"

#include <coro/coro.hpp>
#include <coro/io_scheduler.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <vector>

namespace bulletsim::sim {

class BulletSimulator
{
public:
    BulletSimulator(
        const SimConfig &cfg,
        std::shared_ptr<IWorldQuery> world,
        std::shared_ptr<IParticipantDirectory> participants,
        std::shared_ptr<IBulletEvents> events);

    BulletId queue_instant_bullet(
        ParticipantId participant, float damage, float range, const Vec3 &origin, const Vec3 &direction);
    BulletId queue_projectile_bullet(
        ParticipantId participant, float damage, float range, const Vec3 &origin, const Vec3 &direction);
    BulletId queue_general_bullet(
        const BulletSpec &spec, std::optional<std::chrono::milliseconds> timeout = std::nullopt);
    bool cancel_bullet(const BulletId &id);
    DispatcherStats stats() const;
    void shutdown();

    bool shutting_down() const { return m_shutdown_requested.load(std::memory_order_acquire); }
    // Set once shutdown() ran; workers still live after this point are torn down.
    TimePoint destruct_deadline() const;

    // One synchronous round without a scheduler: completions, assignment, every worker (inbox then tick),
    // completions again, and reclamation when due.
    void step(TimePoint now);

    const SimConfig &config() const { return m_cfg; }
    Dispatcher &dispatcher() { return *m_dispatcher; }
    Worker &worker(size_t i) { return *m_workers.at(i); }
    size_t worker_count() const { return m_workers.size(); }

    // Coroutine loop bookkeeping (see spawn_simulator).
    void loop_started() { m_live_loops.fetch_add(1, std::memory_order_acq_rel); }
    void loop_finished() { m_live_loops.fetch_sub(1, std::memory_order_acq_rel); }
    bool stopped() const { return m_live_loops.load(std::memory_order_acquire) == 0; }

private:
    SimConfig m_cfg;
    std::shared_ptr<Channel> m_completions;
    std::vector<std::shared_ptr<Worker>> m_workers;
    std::unique_ptr<Dispatcher> m_dispatcher;
    std::atomic<bool> m_shutdown_once{false};
    std::atomic<bool> m_shutdown_requested{false}; // published after the deadline is set
    std::atomic<int64_t> m_destruct_deadline_ns{0};
    std::atomic<int> m_live_loops{0};
    std::optional<TimePoint> m_next_reclaim; // step() only
};

// Assignment loop: every tick drains completions, then assigns pending bullets.
coro::task<void> run_dispatcher(std::shared_ptr<coro::io_scheduler> scheduler, std::shared_ptr<BulletSimulator> sim);
// Reclamation loop: every default_timeout / 2.
coro::task<void> run_reclaimer(std::shared_ptr<coro::io_scheduler> scheduler, std::shared_ptr<BulletSimulator> sim);
// Per-slot simulation loop; exits once the worker is inert or the destruct grace period lapses.
coro::task<void> run_worker(
    std::shared_ptr<coro::io_scheduler> scheduler, std::shared_ptr<BulletSimulator> sim, uint32_t index);

// Spawns the dispatcher, reclaimer and every worker loop on the scheduler.
void spawn_simulator(const std::shared_ptr<coro::io_scheduler> &scheduler, const std::shared_ptr<BulletSimulator> &sim);

} // namespace bulletsim::sim
