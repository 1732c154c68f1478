// SPDX-License-Identifier: Apache-2.0
// arena.hpp - Planar Box2D host world: walls, crates and wandering bot participants.
// Serves ray/proximity queries and participant lookups to the worker pool and takes damage from hit events.
#pragma once
#include "server/config/server_config.hpp"
#include "server/sim/collaborators.hpp"
#include "server/sim/simulator.hpp"

#include <box2d/box2d.h>
#include <coro/coro.hpp>
#include <coro/io_scheduler.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <random>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace bulletsim::world {

using bulletsim::sim::EntityHandle;
using bulletsim::sim::ParticipantId;
using bulletsim::sim::Vec3;

// Collision categories
enum Category : uint32_t
{
    CAT_WALL = 0x0001,
    CAT_CRATE = 0x0002,
    CAT_BOT = 0x0004
};

// Handle ranges; bots use their participant id directly.
inline constexpr EntityHandle kCrateHandleBase = 1'000'000;
inline constexpr EntityHandle kWallHandleBase = 2'000'000;

// Targets slower than this are exempt from proximity hits.
inline constexpr float kMovingThreshold = 0.05f;

class Arena : public bulletsim::sim::IWorldQuery,
              public bulletsim::sim::IParticipantDirectory,
              public bulletsim::sim::IBulletEvents
{
public:
    explicit Arena(const config::ArenaConfig &cfg, uint32_t seed = 1);
    ~Arena() override;
    Arena(const Arena &) = delete;
    Arena &operator=(const Arena &) = delete;

    std::optional<bulletsim::sim::RayHit> ray_intersect(const Vec3 &from, const Vec3 &to, ParticipantId exclude) override;
    std::optional<bulletsim::sim::ProximityHit> proximity_search(
        const Vec3 &center, float radius, ParticipantId exclude) override;
    std::optional<Vec3> resolve(ParticipantId participant) override;

    // Applies damage; a bot at 0 hp leaves the world until respawn.
    void on_bullet_hit(const bulletsim::sim::BulletHit &hit) override;
    void on_bullet_complete(const bulletsim::sim::BulletId &) override {}
    void on_bullet_reclaimed(const bulletsim::sim::BulletId &) override {}

    // Moves bots, steps the physics world and counts down respawns.
    void step(float dt);

    struct FireOrder
    {
        ParticipantId shooter{0};
        Vec3 origin{0.f};
        Vec3 direction{0.f};
        bool instant{false};
    };

    // Bots whose fire timer elapsed aim at the nearest other bot; shots alternate instant / projectile.
    std::vector<FireOrder> collect_fire_orders(float dt);

    ParticipantId add_bot(float x, float y, bool idle);
    EntityHandle add_crate(float x, float y, float half_extent);
    void set_bot_velocity(ParticipantId id, float vx, float vy);
    void remove_bot(ParticipantId id);
    std::optional<float> bot_hp(ParticipantId id) const;
    std::vector<ParticipantId> live_bots() const;

    static constexpr float kBotRadius = 1.0f;

private:
    struct Bot
    {
        ParticipantId id{0};
        b2BodyId body{b2_nullBodyId};
        float hp{0.f};
        bool idle{false};
        bool alive{false};
        b2Vec2 heading{1.f, 0.f};
        float retarget_timer{0.f};
        float respawn_timer{0.f};
        float fire_timer{0.f};
        uint32_t shots{0};
    };

    b2BodyId create_bot_body(ParticipantId id, float x, float y);
    void create_wall(float cx, float cy, float hx, float hy);
    b2Vec2 random_point();
    void kill_bot_locked(Bot &bot);

    config::ArenaConfig m_cfg;
    mutable std::shared_mutex m_mutex;
    b2WorldId m_world{b2_nullWorldId};
    std::unordered_map<ParticipantId, Bot> m_bots;
    std::vector<b2BodyId> m_crates;
    ParticipantId m_next_bot_id{1};
    EntityHandle m_next_crate{kCrateHandleBase};
    EntityHandle m_next_wall{kWallHandleBase};
    std::mt19937 m_rng;
};

// Steps the arena at the simulator tick rate and, with auto-fire on, queues bot shots.
coro::task<void> run_arena(
    std::shared_ptr<coro::io_scheduler> scheduler,
    std::shared_ptr<Arena> arena,
    std::shared_ptr<bulletsim::sim::BulletSimulator> sim,
    config::ArenaConfig cfg);

} // namespace bulletsim::world
