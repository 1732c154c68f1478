// SPDX-License-Identifier: Apache-2.0
// Instant resolution, projectile stepping order, swept rays and the proximity fallback.
#include "server/sim/hit_detection.hpp"
#include "test_world.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <string>

using namespace bulletsim::sim;
using bulletsim::test::approx;
using bulletsim::test::FakeWorld;

static HitParams params(bool fallback = true)
{
    HitParams p;
    p.speed = 1000.f;
    p.proximity_radius = 8.5f;
    p.proximity_fallback = fallback;
    p.max_lifetime = std::chrono::milliseconds(12000);
    return p;
}

static BulletSpec spec(float range, bool instant, ParticipantId shooter = 1)
{
    return BulletSpec{shooter, 25.f, range, Vec3{0.f}, Vec3{1.f, 0.f, 0.f}, instant};
}

static void instant_direct_hit()
{
    FakeWorld world;
    world.add_target(10, Vec3{10.f, 0.f, 0.f});
    auto r = resolve_instant("b1", spec(50.f, true), world, params());
    assert(r.outcome == Outcome::hit_target);
    assert(r.hit && r.hit->target == 10 && !r.hit->proximity);
    assert(r.hit->bullet_id == "b1" && r.hit->participant == 1 && approx(r.hit->damage, 25.f));
    assert(approx(r.hit->point.x, 9.f));
}

static void instant_hit_reports_collider_owner()
{
    FakeWorld world;
    world.add(bulletsim::test::Sphere{500, 7, Vec3{10.f, 0.f, 0.f}, 1.f, true, false});
    auto r = resolve_instant("b1", spec(50.f, true), world, params());
    assert(r.outcome == Outcome::hit_target && r.hit->target == 7);
}

static void instant_ignores_shooter_collider()
{
    FakeWorld world;
    world.add_target(1, Vec3{0.f}); // shooter's own body around the muzzle
    world.add_target(10, Vec3{10.f, 0.f, 0.f});
    auto r = resolve_instant("b1", spec(50.f, true, 1), world, params());
    assert(r.outcome == Outcome::hit_target && r.hit->target == 10);
}

static void instant_proximity_fallback()
{
    FakeWorld world;
    world.add_target(20, Vec3{20.f, 5.f, 0.f}, 0.5f, true);
    auto r = resolve_instant("b1", spec(50.f, true), world, params());
    assert(r.outcome == Outcome::hit_proximity);
    assert(r.hit && r.hit->proximity && r.hit->target == 20);

    auto off = resolve_instant("b2", spec(50.f, true), world, params(false));
    assert(off.outcome == Outcome::range_exhausted && !off.hit);
}

static void instant_stationary_target_is_exempt()
{
    FakeWorld world;
    world.add_target(20, Vec3{20.f, 5.f, 0.f}, 0.5f, false);
    auto r = resolve_instant("b1", spec(50.f, true), world, params());
    assert(r.outcome == Outcome::range_exhausted && !r.hit);
}

static void instant_geometry_is_terminal()
{
    FakeWorld world;
    world.add_wall(2'000'000, Vec3{30.f, 0.f, 0.f}, 2.f);
    auto r = resolve_instant("b1", spec(50.f, true), world, params());
    assert(r.outcome == Outcome::hit_geometry && !r.hit);
}

static void projectile_swept_ray_catches_thin_target()
{
    FakeWorld world;
    world.set_participant(1, Vec3{0.f});
    world.add_target(9, Vec3{15.f, 0.f, 0.f}, 0.1f);
    auto now = Clock::now();
    SimBullet b = make_sim_bullet("p1", spec(100.f, false), now);
    // One step covers 33 units, far past the 0.2-wide target.
    auto r = step_projectile(b, 0.033f, now, world, world, params());
    assert(r.outcome == Outcome::hit_target && r.hit->target == 9);
    assert(b.position == Vec3(0.f)); // not committed on a terminal step
}

static void projectile_active_then_range()
{
    FakeWorld world;
    world.set_participant(1, Vec3{0.f});
    auto now = Clock::now();
    SimBullet b = make_sim_bullet("p1", spec(50.f, false), now);
    auto r = step_projectile(b, 0.033f, now, world, world, params());
    assert(r.outcome == Outcome::active && !r.hit);
    assert(approx(b.position.x, 33.f) && approx(b.traveled, 33.f));
    r = step_projectile(b, 0.033f, now, world, world, params());
    assert(r.outcome == Outcome::range_exhausted);
    assert(approx(b.position.x, 33.f));
}

static void projectile_ray_starts_at_previous_position()
{
    FakeWorld world;
    world.set_participant(1, Vec3{0.f});
    auto now = Clock::now();
    SimBullet b = make_sim_bullet("p1", spec(200.f, false), now);
    assert(step_projectile(b, 0.033f, now, world, world, params()).outcome == Outcome::active);
    // A living target the bullet has already passed; a ray from the muzzle would still strike it.
    world.add_target(9, Vec3{10.f, 0.f, 0.f});
    auto r = step_projectile(b, 0.033f, now, world, world, params());
    assert(r.outcome == Outcome::active && !r.hit);
    auto rays = world.rays();
    assert(rays.size() == 2);
    assert(rays[0].first == Vec3(0.f) && approx(rays[0].second.x, 33.f));
    assert(approx(rays[1].first.x, 33.f) && approx(rays[1].second.x, 66.f));
    assert(approx(b.position.x, 66.f));
}

static void instant_long_range_bounds_proximity_queries()
{
    FakeWorld world;
    for (float range : {1e4f, 1e8f, 1e10f, 3e38f}) {
        const size_t before = world.proximity_calls();
        auto r = resolve_instant("far", spec(range, true), world, params());
        assert(r.outcome == Outcome::range_exhausted && !r.hit);
        assert(world.proximity_calls() - before <= kMaxInstantProximitySamples + 1);
    }
    // Short ranges still sample at half the proximity radius.
    const size_t before = world.proximity_calls();
    resolve_instant("near", spec(17.f, true), world, params());
    assert(world.proximity_calls() - before == 5);
}

static void projectile_short_range_misses_on_first_step()
{
    FakeWorld world;
    world.set_participant(1, Vec3{0.f});
    world.add_target(9, Vec3{10.f, 0.f, 0.f});
    auto now = Clock::now();
    SimBullet b = make_sim_bullet("p1", spec(5.f, false), now);
    // Range is checked before the ray, so the target beyond range is never struck.
    auto r = step_projectile(b, 0.033f, now, world, world, params());
    assert(r.outcome == Outcome::range_exhausted && !r.hit);
}

static void projectile_lifetime()
{
    FakeWorld world;
    world.set_participant(1, Vec3{0.f});
    auto p = params();
    p.speed = 1.f;
    p.max_lifetime = std::chrono::milliseconds(100);
    auto start = Clock::now();
    SimBullet b = make_sim_bullet("p1", spec(1000.f, false), start);
    assert(step_projectile(b, 0.01f, start + std::chrono::milliseconds(50), world, world, p).outcome == Outcome::active);
    auto r = step_projectile(b, 0.01f, start + std::chrono::milliseconds(100), world, world, p);
    assert(r.outcome == Outcome::lifetime_exceeded);
}

static void projectile_shooter_gone()
{
    FakeWorld world;
    auto now = Clock::now();
    SimBullet b = make_sim_bullet("p1", spec(100.f, false), now);
    auto r = step_projectile(b, 0.033f, now, world, world, params());
    assert(r.outcome == Outcome::shooter_gone && b.traveled == 0.f);
    assert(world.ray_calls() == 0);
}

static void projectile_proximity_and_geometry()
{
    auto now = Clock::now();
    {
        FakeWorld world;
        world.set_participant(1, Vec3{0.f});
        world.add_target(4, Vec3{33.f, 4.f, 0.f}, 0.5f, true);
        SimBullet b = make_sim_bullet("p1", spec(100.f, false), now);
        auto r = step_projectile(b, 0.033f, now, world, world, params());
        assert(r.outcome == Outcome::hit_proximity && r.hit->proximity && r.hit->target == 4);
    }
    {
        FakeWorld world;
        world.set_participant(1, Vec3{0.f});
        world.add_target(4, Vec3{33.f, 4.f, 0.f}, 0.5f, false);
        SimBullet b = make_sim_bullet("p1", spec(100.f, false), now);
        assert(step_projectile(b, 0.033f, now, world, world, params()).outcome == Outcome::active);
    }
    {
        FakeWorld world;
        world.set_participant(1, Vec3{0.f});
        world.add_wall(1'000'000, Vec3{20.f, 0.f, 0.f}, 1.f);
        world.add_target(4, Vec3{25.f, 3.f, 0.f}, 0.5f, true);
        SimBullet b = make_sim_bullet("p1", spec(100.f, false), now);
        auto r = step_projectile(b, 0.033f, now, world, world, params());
        assert(r.outcome == Outcome::hit_geometry && !r.hit);
    }
}

int main()
{
    instant_direct_hit();
    instant_hit_reports_collider_owner();
    instant_ignores_shooter_collider();
    instant_proximity_fallback();
    instant_stationary_target_is_exempt();
    instant_geometry_is_terminal();
    projectile_swept_ray_catches_thin_target();
    projectile_active_then_range();
    projectile_short_range_misses_on_first_step();
    projectile_ray_starts_at_previous_position();
    instant_long_range_bounds_proximity_queries();
    projectile_lifetime();
    projectile_shooter_gone();
    projectile_proximity_and_geometry();
    assert(std::string(outcome_name(Outcome::hit_proximity)) == "hit_proximity");
    assert(!is_terminal(Outcome::active) && is_terminal(Outcome::shooter_gone));
    std::cout << "unit_hit_detection OK" << std::endl;
    return 0;
}
