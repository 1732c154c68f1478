// SPDX-License-Identifier: Apache-2.0
// worker.hpp - Isolated simulation unit owning a private set of in-flight projectiles.
// A worker is touched only from its own loop; the dispatcher reaches it solely through the inbox.
#pragma once
#include "bulletsim.pb.h"
#include "common/mailbox.hpp"
#include "server/sim/collaborators.hpp"
#include "server/sim/hit_detection.hpp"
#include "server/sim/types.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>

namespace bulletsim::sim {

using Channel = Mailbox<std::string>;

class Worker
{
public:
    Worker(
        uint32_t index,
        const SimConfig &cfg,
        std::shared_ptr<IWorldQuery> world,
        std::shared_ptr<IParticipantDirectory> participants,
        std::shared_ptr<IBulletEvents> events,
        std::shared_ptr<Channel> completions);

    uint32_t index() const { return m_index; }

    // Dispatcher -> worker channel.
    const std::shared_ptr<Channel> &inbox() const { return m_inbox; }

    // Applies every message queued so far. Instant bullets resolve here. Returns the number of messages handled.
    size_t process_inbox(TimePoint now);

    // One simulation pass over the active set with a fixed step of one tick interval.
    void tick(TimePoint now);

    bool inert() const { return m_inert.load(std::memory_order_acquire); }

    size_t active_count() const { return m_active.size(); }

    bool is_active(const BulletId &id) const { return m_active.count(id) != 0; }

private:
    void handle_process(const bulletsim::ProcessBullet &msg, TimePoint now);
    void handle_cancel(const BulletId &id);
    void handle_destruct();
    void finish(const BulletId &id, const Resolution &res);

    uint32_t m_index;
    float m_dt;
    HitParams m_params;
    std::shared_ptr<IWorldQuery> m_world;
    std::shared_ptr<IParticipantDirectory> m_participants;
    std::shared_ptr<IBulletEvents> m_events;
    std::shared_ptr<Channel> m_inbox;
    std::shared_ptr<Channel> m_completions;
    std::unordered_map<BulletId, SimBullet> m_active;
    std::atomic<bool> m_inert{false};
};

} // namespace bulletsim::sim
