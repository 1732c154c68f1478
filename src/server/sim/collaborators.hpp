// SPDX-License-Identifier: Apache-2.0
// collaborators.hpp - Host environment seams consumed by workers and the dispatcher.
// Implementations are called concurrently from every worker thread and must synchronise internally.
#pragma once
#include "server/sim/types.hpp"

#include <memory>
#include <optional>
#include <vector>

namespace bulletsim::sim {

struct RayHit
{
    Vec3 point{0.f};
    EntityHandle entity{0}; // collider that was struck
    EntityHandle parent{0}; // owner of the collider (participant for living hits)
    bool living{false}; // owner carries a living component
};

struct ProximityHit
{
    EntityHandle entity{0};
    Vec3 position{0.f};
    float distance{0.f};
};

class IWorldQuery
{
public:
    virtual ~IWorldQuery() = default;
    // Closest hit along the segment from -> to, ignoring colliders owned by `exclude`.
    virtual std::optional<RayHit> ray_intersect(const Vec3 &from, const Vec3 &to, ParticipantId exclude) = 0;
    // Nearest living, currently moving entity within `radius` of `center`, excluding `exclude`.
    virtual std::optional<ProximityHit> proximity_search(const Vec3 &center, float radius, ParticipantId exclude) = 0;
};

class IParticipantDirectory
{
public:
    virtual ~IParticipantDirectory() = default;
    virtual std::optional<Vec3> resolve(ParticipantId participant) = 0;
};

struct BulletHit
{
    BulletId bullet_id;
    ParticipantId participant{0};
    float damage{0.f};
    EntityHandle target{0};
    Vec3 point{0.f};
    bool proximity{false};
};

// Output events; fire-and-forget.
class IBulletEvents
{
public:
    virtual ~IBulletEvents() = default;
    virtual void on_bullet_hit(const BulletHit &hit) = 0;
    virtual void on_bullet_complete(const BulletId &id) = 0;
    virtual void on_bullet_reclaimed(const BulletId &id) = 0;
};

// Forwards each event to every registered sink. Sinks are registered before the simulator starts.
class EventFanout : public IBulletEvents
{
public:
    void add(std::shared_ptr<IBulletEvents> sink) { m_sinks.push_back(std::move(sink)); }

    void on_bullet_hit(const BulletHit &hit) override
    {
        for (auto &s : m_sinks)
            s->on_bullet_hit(hit);
    }

    void on_bullet_complete(const BulletId &id) override
    {
        for (auto &s : m_sinks)
            s->on_bullet_complete(id);
    }

    void on_bullet_reclaimed(const BulletId &id) override
    {
        for (auto &s : m_sinks)
            s->on_bullet_reclaimed(id);
    }

private:
    std::vector<std::shared_ptr<IBulletEvents>> m_sinks;
};

} // namespace bulletsim::sim
