// SPDX-License-Identifier: Apache-2.0
// hit_detection.hpp - Two-tier hit resolution (ray intersection, then proximity fallback)
#pragma once
#include "server/sim/collaborators.hpp"
#include "server/sim/types.hpp"

#include <chrono>
#include <cstddef>
#include <optional>

namespace bulletsim::sim {

// Worker-private projectile state.
struct SimBullet
{
    BulletId id;
    ParticipantId participant{0};
    float damage{0.f};
    float range{0.f};
    Vec3 origin{0.f};
    Vec3 direction{0.f};
    Vec3 position{0.f};
    float traveled{0.f};
    TimePoint start_time{};
    bool instant{false};
};

SimBullet make_sim_bullet(const BulletId &id, const BulletSpec &spec, TimePoint now);

enum class Outcome
{
    active, // still in flight
    hit_target, // ray struck a living entity
    hit_proximity, // proximity fallback found a moving target
    hit_geometry, // ray struck static geometry or a non-living entity
    range_exhausted,
    lifetime_exceeded,
    shooter_gone
};

const char *outcome_name(Outcome o);

inline bool is_terminal(Outcome o)
{
    return o != Outcome::active;
}

// Upper bound on proximity queries made for one instant bullet; longer segments are sampled more sparsely.
inline constexpr size_t kMaxInstantProximitySamples = 256;

struct HitParams
{
    float speed{1000.f};
    float proximity_radius{8.5f};
    bool proximity_fallback{true};
    std::chrono::milliseconds max_lifetime{12000};
};

HitParams hit_params_from(const SimConfig &cfg);

struct Resolution
{
    Outcome outcome{Outcome::active};
    std::optional<BulletHit> hit; // set only when a living target was struck
};

// Hitscan: one ray across origin -> origin + dir*range. When it misses or strikes non-living geometry the
// segment is sampled every radius/2 and the first proximity match wins.
Resolution resolve_instant(const BulletId &id, const BulletSpec &spec, IWorldQuery &world, const HitParams &params);

// Advances one projectile by dt. The ray runs from the previous tick position to the new one so fast bullets
// cannot tunnel through thin colliders. Position is committed only when the bullet stays active.
Resolution step_projectile(
    SimBullet &bullet,
    float dt,
    TimePoint now,
    IWorldQuery &world,
    IParticipantDirectory &participants,
    const HitParams &params);

} // namespace bulletsim::sim
