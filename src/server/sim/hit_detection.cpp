// SPDX-License-Identifier: Apache-2.0
#include "server/sim/hit_detection.hpp"

#include "server/sim/kinematics.hpp"

#include <algorithm>
#include <cmath>

namespace bulletsim::sim {

SimBullet make_sim_bullet(const BulletId &id, const BulletSpec &spec, TimePoint now)
{
    SimBullet b;
    b.id = id;
    b.participant = spec.participant;
    b.damage = spec.damage;
    b.range = spec.range;
    b.origin = spec.origin;
    b.direction = spec.direction;
    b.position = spec.origin;
    b.traveled = 0.f;
    b.start_time = now;
    b.instant = spec.instant;
    return b;
}

const char *outcome_name(Outcome o)
{
    switch (o) {
        case Outcome::active:
            return "active";
        case Outcome::hit_target:
            return "hit_target";
        case Outcome::hit_proximity:
            return "hit_proximity";
        case Outcome::hit_geometry:
            return "hit_geometry";
        case Outcome::range_exhausted:
            return "range_exhausted";
        case Outcome::lifetime_exceeded:
            return "lifetime_exceeded";
        case Outcome::shooter_gone:
            return "shooter_gone";
    }
    return "unknown";
}

HitParams hit_params_from(const SimConfig &cfg)
{
    HitParams p;
    p.speed = cfg.projectile_speed;
    p.proximity_radius = cfg.proximity_radius;
    p.proximity_fallback = cfg.proximity_fallback;
    p.max_lifetime = cfg.max_lifetime;
    return p;
}

namespace {

BulletHit direct_hit(const BulletId &id, ParticipantId participant, float damage, const RayHit &ray)
{
    BulletHit h;
    h.bullet_id = id;
    h.participant = participant;
    h.damage = damage;
    h.target = ray.parent != 0 ? ray.parent : ray.entity;
    h.point = ray.point;
    h.proximity = false;
    return h;
}

BulletHit proximity_hit(const BulletId &id, ParticipantId participant, float damage, const ProximityHit &near)
{
    BulletHit h;
    h.bullet_id = id;
    h.participant = participant;
    h.damage = damage;
    h.target = near.entity;
    h.point = near.position;
    h.proximity = true;
    return h;
}

} // namespace

Resolution resolve_instant(const BulletId &id, const BulletSpec &spec, IWorldQuery &world, const HitParams &params)
{
    const Vec3 dir = glm::normalize(spec.direction);
    const Vec3 end = spec.origin + dir * spec.range;
    auto ray = world.ray_intersect(spec.origin, end, spec.participant);
    if (ray && ray->living)
        return {Outcome::hit_target, direct_hit(id, spec.participant, spec.damage, *ray)};
    if (params.proximity_fallback && params.proximity_radius > 0.f) {
        const double interval = static_cast<double>(params.proximity_radius) * 0.5;
        const double wanted = std::ceil(static_cast<double>(spec.range) / interval);
        const size_t samples = wanted >= static_cast<double>(kMaxInstantProximitySamples)
            ? kMaxInstantProximitySamples
            : std::max<size_t>(1, static_cast<size_t>(wanted));
        for (size_t i = 0; i <= samples; ++i) {
            float t = static_cast<float>(i) / static_cast<float>(samples);
            Vec3 p = spec.origin + dir * (spec.range * t);
            if (auto near = world.proximity_search(p, params.proximity_radius, spec.participant))
                return {Outcome::hit_proximity, proximity_hit(id, spec.participant, spec.damage, *near)};
        }
    }
    if (ray)
        return {Outcome::hit_geometry, std::nullopt};
    return {Outcome::range_exhausted, std::nullopt};
}

Resolution step_projectile(
    SimBullet &bullet,
    float dt,
    TimePoint now,
    IWorldQuery &world,
    IParticipantDirectory &participants,
    const HitParams &params)
{
    if (!participants.resolve(bullet.participant))
        return {Outcome::shooter_gone, std::nullopt};
    KinematicStep step = advance(bullet.position, bullet.direction, params.speed, dt);
    bullet.traveled += step.distance;
    if (bullet.traveled >= bullet.range)
        return {Outcome::range_exhausted, std::nullopt};
    if (now - bullet.start_time >= params.max_lifetime)
        return {Outcome::lifetime_exceeded, std::nullopt};
    if (auto ray = world.ray_intersect(bullet.position, step.position, bullet.participant)) {
        if (ray->living)
            return {Outcome::hit_target, direct_hit(bullet.id, bullet.participant, bullet.damage, *ray)};
        return {Outcome::hit_geometry, std::nullopt};
    }
    if (params.proximity_fallback) {
        if (auto near = world.proximity_search(step.position, params.proximity_radius, bullet.participant))
            return {Outcome::hit_proximity, proximity_hit(bullet.id, bullet.participant, bullet.damage, *near)};
    }
    bullet.position = step.position;
    return {Outcome::active, std::nullopt};
}

} // namespace bulletsim::sim
