// SPDX-License-Identifier: Apache-2.0
// dispatcher.hpp - Pending queue, least-loaded assignment, in-flight registry and timeout reclamation.
// All state sits behind one mutex; workers never touch it and report back only through the completion channel.
#pragma once
#include "common/mailbox.hpp"
#include "server/sim/collaborators.hpp"
#include "server/sim/types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace bulletsim::sim {

using Channel = Mailbox<std::string>;

struct BulletTicket
{
    BulletId id;
    BulletSpec spec;
    bool being_processed{false};
    std::optional<uint32_t> worker; // set on assignment
    TimePoint start_time{}; // stamped on assignment, not on queue
    std::optional<std::chrono::milliseconds> timeout; // overrides the default in-flight timeout
};

class Dispatcher
{
public:
    // `workers` are the per-slot inboxes in pool order; `completions` is the shared worker -> dispatcher channel.
    Dispatcher(
        const SimConfig &cfg,
        std::vector<std::shared_ptr<Channel>> workers,
        std::shared_ptr<Channel> completions,
        std::shared_ptr<IBulletEvents> events);

    // Never blocks and never rejects for capacity. Throws std::invalid_argument for a zero direction or a
    // non-positive range, std::logic_error after shutdown().
    BulletId queue_bullet(const BulletSpec &spec, std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    // Returns false when the id is neither pending nor in flight.
    bool cancel_bullet(const BulletId &id);

    DispatcherStats stats() const;

    // Assigns every pending ticket; returns the number assigned.
    size_t assignment_pass(TimePoint now);

    // Force-cancels in-flight bullets older than their timeout; returns the number reclaimed.
    size_t reclamation_pass(TimePoint now);

    // Applies every BulletComplete queued by workers; returns the number that matched an in-flight bullet.
    size_t drain_completions();

    // Idempotent: unknown or already reclaimed ids are ignored.
    bool on_bullet_complete(const BulletId &id, uint32_t worker);

    // Broadcasts Destruct to every worker and clears all state.
    void shutdown();

    bool is_shut_down() const;

    uint32_t worker_count() const { return static_cast<uint32_t>(m_workers.size()); }

private:
    struct WorkerState
    {
        std::shared_ptr<Channel> inbox;
        uint32_t load{0};
        std::unordered_map<BulletId, std::shared_ptr<BulletTicket>> assigned;
    };

    BulletId next_id_locked();
    uint32_t select_worker_locked(bool &overflow) const;
    // Drops the ticket from its worker's map and from the in-flight registry.
    void release_locked(const BulletTicket &ticket);
    void publish_gauges_locked() const;

    mutable std::mutex m_mutex;
    SimConfig m_cfg;
    std::vector<WorkerState> m_workers;
    std::shared_ptr<Channel> m_completions;
    std::shared_ptr<IBulletEvents> m_events;
    std::unordered_map<BulletId, std::shared_ptr<BulletTicket>> m_pending;
    std::vector<BulletId> m_pending_order; // insertion order; may hold ids already cancelled
    std::unordered_map<BulletId, std::shared_ptr<BulletTicket>> m_in_flight;
    std::string m_id_prefix;
    uint64_t m_next_seq{1};
    bool m_shut_down{false};
};

} // namespace bulletsim::sim
