// SPDX-License-Identifier: Apache-2.0
// event_router.hpp - Delivers hit / completion events to the API connection that fired each bullet.
#pragma once
#include "bulletsim.pb.h"
#include "common/mailbox.hpp"
#include "server/sim/collaborators.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace bulletsim::net {

using Outbox = Mailbox<bulletsim::ServerMessage>;

class EventRouter : public bulletsim::sim::IBulletEvents
{
public:
    // Runs `queue` under the routing lock and binds the returned id to `outbox`, so an event can never
    // arrive before its route exists.
    bulletsim::sim::BulletId track(
        const std::shared_ptr<Outbox> &outbox, const std::function<bulletsim::sim::BulletId()> &queue);

    // True when `id` was fired through `outbox` and has not finished yet.
    bool owned_by(const bulletsim::sim::BulletId &id, const Outbox *outbox) const;
    void release(const bulletsim::sim::BulletId &id);
    // Drops every route owned by a closing connection.
    void release_connection(const Outbox *outbox);
    size_t route_count() const;

    void on_bullet_hit(const bulletsim::sim::BulletHit &hit) override;
    void on_bullet_complete(const bulletsim::sim::BulletId &id) override;
    void on_bullet_reclaimed(const bulletsim::sim::BulletId &id) override;

private:
    mutable std::mutex m_mutex;
    std::unordered_map<bulletsim::sim::BulletId, std::weak_ptr<Outbox>> m_routes;
};

} // namespace bulletsim::net
