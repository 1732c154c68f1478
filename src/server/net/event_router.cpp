// SPDX-License-Identifier: Apache-2.0
#include "server/net/event_router.hpp"

#include "server/sim/wire.hpp"

namespace bulletsim::net {

bulletsim::sim::BulletId EventRouter::track(
    const std::shared_ptr<Outbox> &outbox, const std::function<bulletsim::sim::BulletId()> &queue)
{
    std::scoped_lock lk{m_mutex};
    auto id = queue();
    m_routes[id] = outbox;
    return id;
}

bool EventRouter::owned_by(const bulletsim::sim::BulletId &id, const Outbox *outbox) const
{
    std::scoped_lock lk{m_mutex};
    auto it = m_routes.find(id);
    if (it == m_routes.end())
        return false;
    auto sp = it->second.lock();
    return sp && sp.get() == outbox;
}

void EventRouter::release(const bulletsim::sim::BulletId &id)
{
    std::scoped_lock lk{m_mutex};
    m_routes.erase(id);
}

void EventRouter::release_connection(const Outbox *outbox)
{
    std::scoped_lock lk{m_mutex};
    for (auto it = m_routes.begin(); it != m_routes.end();) {
        auto sp = it->second.lock();
        if (!sp || sp.get() == outbox)
            it = m_routes.erase(it);
        else
            ++it;
    }
}

size_t EventRouter::route_count() const
{
    std::scoped_lock lk{m_mutex};
    return m_routes.size();
}

void EventRouter::on_bullet_hit(const bulletsim::sim::BulletHit &hit)
{
    std::shared_ptr<Outbox> out;
    {
        std::scoped_lock lk{m_mutex};
        auto it = m_routes.find(hit.bullet_id);
        if (it == m_routes.end())
            return;
        out = it->second.lock();
    }
    if (!out)
        return;
    bulletsim::ServerMessage msg;
    auto *ev = msg.mutable_hit();
    ev->set_bullet_id(hit.bullet_id);
    ev->set_participant(hit.participant);
    ev->set_damage(hit.damage);
    ev->set_target(hit.target);
    bulletsim::sim::wire::to_proto(hit.point, ev->mutable_point());
    ev->set_proximity(hit.proximity);
    out->push(std::move(msg));
}

void EventRouter::on_bullet_complete(const bulletsim::sim::BulletId &id)
{
    std::shared_ptr<Outbox> out;
    {
        std::scoped_lock lk{m_mutex};
        auto it = m_routes.find(id);
        if (it == m_routes.end())
            return;
        out = it->second.lock();
        m_routes.erase(it);
    }
    if (!out)
        return;
    bulletsim::ServerMessage msg;
    msg.mutable_complete()->set_bullet_id(id);
    out->push(std::move(msg));
}

void EventRouter::on_bullet_reclaimed(const bulletsim::sim::BulletId &id)
{
    release(id);
}

} // namespace bulletsim::net
