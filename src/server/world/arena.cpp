// SPDX-License-Identifier: Apache-2.0
#include "server/world/arena.hpp"

#include "common/logger.hpp"

#include <cmath>
#include <limits>
#include <mutex>
#include <stdexcept>

namespace bulletsim::world {

namespace {

void *handle_to_user_data(EntityHandle h)
{
    return reinterpret_cast<void *>(static_cast<uintptr_t>(h));
}

EntityHandle user_data_to_handle(void *p)
{
    return static_cast<EntityHandle>(reinterpret_cast<uintptr_t>(p));
}

struct RayContext
{
    EntityHandle exclude{0};
    bool hit{false};
    b2Vec2 point{0.f, 0.f};
    EntityHandle entity{0};
    float fraction{1.f};
};

float ray_callback(b2ShapeId shape, b2Vec2 point, b2Vec2 normal, float fraction, void *context)
{
    (void)normal;
    auto *ctx = static_cast<RayContext *>(context);
    EntityHandle h = user_data_to_handle(b2Body_GetUserData(b2Shape_GetBody(shape)));
    if (h == ctx->exclude)
        return -1.f; // shooter's own collider: ignore and continue
    if (fraction < ctx->fraction || !ctx->hit) {
        ctx->hit = true;
        ctx->point = point;
        ctx->entity = h;
        ctx->fraction = fraction;
    }
    return fraction; // clip to the closest hit so far
}

} // namespace

Arena::Arena(const config::ArenaConfig &cfg, uint32_t seed)
    : m_cfg(cfg)
    , m_rng(seed)
{
    b2WorldDef def = b2DefaultWorldDef();
    def.gravity = {0.f, 0.f};
    m_world = b2CreateWorld(&def);
    // Perimeter walls around an origin-centred map.
    const float half_w = cfg.width * 0.5f;
    const float half_h = cfg.height * 0.5f;
    const float thickness = 1.0f;
    create_wall(0.f, half_h + thickness * 0.5f, half_w + thickness, thickness * 0.5f);
    create_wall(0.f, -half_h - thickness * 0.5f, half_w + thickness, thickness * 0.5f);
    create_wall(-half_w - thickness * 0.5f, 0.f, thickness * 0.5f, half_h + thickness);
    create_wall(half_w + thickness * 0.5f, 0.f, thickness * 0.5f, half_h + thickness);
    for (uint32_t i = 0; i < cfg.crate_count; ++i) {
        b2Vec2 p = random_point();
        add_crate(p.x, p.y, 1.2f);
    }
    const uint32_t idle_count = static_cast<uint32_t>(std::lround(cfg.bot_count * cfg.idle_bot_fraction));
    for (uint32_t i = 0; i < cfg.bot_count; ++i) {
        b2Vec2 p = random_point();
        add_bot(p.x, p.y, i < idle_count);
    }
    bulletsim::log::info(
        "[arena] {}x{} bots={} idle={} crates={}", cfg.width, cfg.height, cfg.bot_count, idle_count, cfg.crate_count);
}

Arena::~Arena()
{
    if (b2World_IsValid(m_world))
        b2DestroyWorld(m_world);
}

b2Vec2 Arena::random_point()
{
    std::uniform_real_distribution<float> ux(-m_cfg.width * 0.45f, m_cfg.width * 0.45f);
    std::uniform_real_distribution<float> uy(-m_cfg.height * 0.45f, m_cfg.height * 0.45f);
    float x = ux(m_rng);
    float y = uy(m_rng);
    return {x, y};
}

void Arena::create_wall(float cx, float cy, float hx, float hy)
{
    b2BodyDef bd = b2DefaultBodyDef();
    bd.type = b2_staticBody;
    bd.position = {cx, cy};
    bd.userData = handle_to_user_data(m_next_wall++);
    b2BodyId body = b2CreateBody(m_world, &bd);
    b2ShapeDef sd = b2DefaultShapeDef();
    sd.filter.categoryBits = CAT_WALL;
    sd.filter.maskBits = CAT_BOT | CAT_CRATE;
    b2Polygon poly = b2MakeBox(hx, hy);
    b2CreatePolygonShape(body, &sd, &poly);
}

EntityHandle Arena::add_crate(float x, float y, float half_extent)
{
    std::unique_lock lk{m_mutex};
    EntityHandle h = m_next_crate++;
    b2BodyDef bd = b2DefaultBodyDef();
    bd.type = b2_staticBody;
    bd.position = {x, y};
    bd.userData = handle_to_user_data(h);
    b2BodyId body = b2CreateBody(m_world, &bd);
    b2ShapeDef sd = b2DefaultShapeDef();
    sd.filter.categoryBits = CAT_CRATE;
    sd.filter.maskBits = CAT_BOT | CAT_WALL;
    b2Polygon box = b2MakeBox(half_extent, half_extent);
    b2CreatePolygonShape(body, &sd, &box);
    m_crates.push_back(body);
    return h;
}

b2BodyId Arena::create_bot_body(ParticipantId id, float x, float y)
{
    b2BodyDef bd = b2DefaultBodyDef();
    bd.type = b2_kinematicBody;
    bd.position = {x, y};
    bd.userData = handle_to_user_data(id);
    b2BodyId body = b2CreateBody(m_world, &bd);
    b2ShapeDef sd = b2DefaultShapeDef();
    sd.filter.categoryBits = CAT_BOT;
    sd.filter.maskBits = CAT_WALL | CAT_CRATE | CAT_BOT;
    b2Circle circle{{0.f, 0.f}, kBotRadius};
    b2CreateCircleShape(body, &sd, &circle);
    return body;
}

ParticipantId Arena::add_bot(float x, float y, bool idle)
{
    std::unique_lock lk{m_mutex};
    Bot bot;
    bot.id = m_next_bot_id++;
    bot.body = create_bot_body(bot.id, x, y);
    bot.hp = m_cfg.bot_hp;
    bot.idle = idle;
    bot.alive = true;
    std::uniform_real_distribution<float> ang(0.f, 6.2831853f);
    float a = ang(m_rng);
    bot.heading = {std::cos(a), std::sin(a)};
    if (!idle)
        b2Body_SetLinearVelocity(bot.body, {bot.heading.x * m_cfg.bot_speed, bot.heading.y * m_cfg.bot_speed});
    // Stagger the first volley.
    std::uniform_real_distribution<float> stagger(0.f, m_cfg.bot_fire_interval_ms / 1000.f);
    bot.fire_timer = stagger(m_rng);
    ParticipantId id = bot.id;
    m_bots.emplace(id, bot);
    return id;
}

void Arena::set_bot_velocity(ParticipantId id, float vx, float vy)
{
    std::unique_lock lk{m_mutex};
    auto it = m_bots.find(id);
    if (it == m_bots.end() || !it->second.alive)
        return;
    b2Body_SetLinearVelocity(it->second.body, {vx, vy});
    float len = std::sqrt(vx * vx + vy * vy);
    if (len > 1e-6f)
        it->second.heading = {vx / len, vy / len};
}

void Arena::kill_bot_locked(Bot &bot)
{
    if (b2Body_IsValid(bot.body))
        b2DestroyBody(bot.body);
    bot.body = b2_nullBodyId;
    bot.alive = false;
    bot.hp = 0.f;
    bot.respawn_timer = m_cfg.bot_respawn_sec;
}

void Arena::remove_bot(ParticipantId id)
{
    std::unique_lock lk{m_mutex};
    auto it = m_bots.find(id);
    if (it == m_bots.end())
        return;
    if (it->second.alive && b2Body_IsValid(it->second.body))
        b2DestroyBody(it->second.body);
    m_bots.erase(it);
}

std::optional<float> Arena::bot_hp(ParticipantId id) const
{
    std::shared_lock lk{m_mutex};
    auto it = m_bots.find(id);
    if (it == m_bots.end())
        return std::nullopt;
    return it->second.hp;
}

std::vector<ParticipantId> Arena::live_bots() const
{
    std::shared_lock lk{m_mutex};
    std::vector<ParticipantId> out;
    for (auto &kv : m_bots)
        if (kv.second.alive)
            out.push_back(kv.first);
    return out;
}

std::optional<bulletsim::sim::RayHit> Arena::ray_intersect(const Vec3 &from, const Vec3 &to, ParticipantId exclude)
{
    b2Vec2 origin{from.x, from.y};
    b2Vec2 translation{to.x - from.x, to.y - from.y};
    if (translation.x * translation.x + translation.y * translation.y < 1e-12f)
        return std::nullopt; // travel purely along z: nothing to hit in the plane
    RayContext ctx;
    ctx.exclude = exclude;
    {
        std::shared_lock lk{m_mutex};
        b2World_CastRay(m_world, origin, translation, b2DefaultQueryFilter(), ray_callback, &ctx);
    }
    if (!ctx.hit)
        return std::nullopt;
    bulletsim::sim::RayHit hit;
    hit.point = Vec3{ctx.point.x, ctx.point.y, 0.f};
    hit.entity = ctx.entity;
    hit.living = ctx.entity != 0 && ctx.entity < kCrateHandleBase;
    hit.parent = hit.living ? ctx.entity : 0;
    return hit;
}

std::optional<bulletsim::sim::ProximityHit> Arena::proximity_search(
    const Vec3 &center, float radius, ParticipantId exclude)
{
    std::shared_lock lk{m_mutex};
    std::optional<bulletsim::sim::ProximityHit> best;
    float best_dist = std::numeric_limits<float>::max();
    for (auto &kv : m_bots) {
        const Bot &bot = kv.second;
        if (!bot.alive || bot.id == exclude)
            continue;
        b2Vec2 v = b2Body_GetLinearVelocity(bot.body);
        if (std::sqrt(v.x * v.x + v.y * v.y) <= kMovingThreshold)
            continue; // stationary targets are exempt
        b2Vec2 p = b2Body_GetPosition(bot.body);
        float dx = p.x - center.x;
        float dy = p.y - center.y;
        float dist = std::sqrt(dx * dx + dy * dy);
        if (dist <= radius && dist < best_dist) {
            best_dist = dist;
            best = bulletsim::sim::ProximityHit{bot.id, Vec3{p.x, p.y, 0.f}, dist};
        }
    }
    return best;
}

std::optional<Vec3> Arena::resolve(ParticipantId participant)
{
    std::shared_lock lk{m_mutex};
    auto it = m_bots.find(participant);
    if (it == m_bots.end() || !it->second.alive)
        return std::nullopt;
    b2Vec2 p = b2Body_GetPosition(it->second.body);
    return Vec3{p.x, p.y, 0.f};
}

void Arena::on_bullet_hit(const bulletsim::sim::BulletHit &hit)
{
    std::unique_lock lk{m_mutex};
    auto it = m_bots.find(hit.target);
    if (it == m_bots.end() || !it->second.alive)
        return;
    Bot &bot = it->second;
    bot.hp -= hit.damage;
    if (bot.hp <= 0.f) {
        kill_bot_locked(bot);
        bulletsim::log::info("[arena] bot {} destroyed by {} (bullet {})", bot.id, hit.participant, hit.bullet_id);
    }
}

void Arena::step(float dt)
{
    std::unique_lock lk{m_mutex};
    const float half_w = m_cfg.width * 0.5f - kBotRadius * 2.f;
    const float half_h = m_cfg.height * 0.5f - kBotRadius * 2.f;
    std::uniform_real_distribution<float> ang(0.f, 6.2831853f);
    std::uniform_real_distribution<float> retarget(1.f, 4.f);
    for (auto &kv : m_bots) {
        Bot &bot = kv.second;
        if (!bot.alive) {
            bot.respawn_timer -= dt;
            if (bot.respawn_timer <= 0.f) {
                b2Vec2 p = random_point();
                bot.body = create_bot_body(bot.id, p.x, p.y);
                bot.hp = m_cfg.bot_hp;
                bot.alive = true;
                if (!bot.idle)
                    b2Body_SetLinearVelocity(
                        bot.body, {bot.heading.x * m_cfg.bot_speed, bot.heading.y * m_cfg.bot_speed});
                bulletsim::log::debug("[arena] bot {} respawned at ({}, {})", bot.id, p.x, p.y);
            }
            continue;
        }
        if (bot.idle)
            continue;
        bot.retarget_timer -= dt;
        b2Vec2 p = b2Body_GetPosition(bot.body);
        bool out_x = (p.x > half_w && bot.heading.x > 0.f) || (p.x < -half_w && bot.heading.x < 0.f);
        bool out_y = (p.y > half_h && bot.heading.y > 0.f) || (p.y < -half_h && bot.heading.y < 0.f);
        if (out_x)
            bot.heading.x = -bot.heading.x;
        if (out_y)
            bot.heading.y = -bot.heading.y;
        if (!out_x && !out_y && bot.retarget_timer <= 0.f) {
            float a = ang(m_rng);
            bot.heading = {std::cos(a), std::sin(a)};
            bot.retarget_timer = retarget(m_rng);
        }
        b2Body_SetLinearVelocity(bot.body, {bot.heading.x * m_cfg.bot_speed, bot.heading.y * m_cfg.bot_speed});
    }
    b2World_Step(m_world, dt, 4);
}

std::vector<Arena::FireOrder> Arena::collect_fire_orders(float dt)
{
    std::unique_lock lk{m_mutex};
    std::vector<FireOrder> orders;
    const float interval = m_cfg.bot_fire_interval_ms / 1000.f;
    for (auto &kv : m_bots) {
        Bot &shooter = kv.second;
        if (!shooter.alive)
            continue;
        shooter.fire_timer -= dt;
        if (shooter.fire_timer > 0.f)
            continue;
        shooter.fire_timer += interval;
        b2Vec2 sp = b2Body_GetPosition(shooter.body);
        const Bot *target = nullptr;
        float best = std::numeric_limits<float>::max();
        for (auto &other : m_bots) {
            if (other.first == shooter.id || !other.second.alive)
                continue;
            b2Vec2 op = b2Body_GetPosition(other.second.body);
            float d = (op.x - sp.x) * (op.x - sp.x) + (op.y - sp.y) * (op.y - sp.y);
            if (d < best) {
                best = d;
                target = &other.second;
            }
        }
        if (!target || best < 1e-6f)
            continue;
        b2Vec2 tp = b2Body_GetPosition(target->body);
        float len = std::sqrt(best);
        Vec3 dir{(tp.x - sp.x) / len, (tp.y - sp.y) / len, 0.f};
        FireOrder order;
        order.shooter = shooter.id;
        order.origin = Vec3{sp.x, sp.y, 0.f};
        order.direction = dir;
        order.instant = (shooter.shots++ % 2) == 0;
        orders.push_back(order);
    }
    return orders;
}

coro::task<void> run_arena(
    std::shared_ptr<coro::io_scheduler> scheduler,
    std::shared_ptr<Arena> arena,
    std::shared_ptr<bulletsim::sim::BulletSimulator> sim,
    config::ArenaConfig cfg)
{
    co_await scheduler->schedule();
    using clock = std::chrono::steady_clock;
    auto tick = sim->config().tick_interval;
    const float dt = std::chrono::duration<float>(tick).count();
    auto next = clock::now();
    uint64_t fired = 0;
    while (!sim->shutting_down()) {
        auto now = clock::now();
        if (now < next) {
            co_await scheduler->yield_for(next - now);
            continue;
        }
        next += tick;
        if (next < now)
            next = now + tick;
        arena->step(dt);
        if (!cfg.auto_fire)
            continue;
        for (auto &order : arena->collect_fire_orders(dt)) {
            try {
                if (order.instant)
                    sim->queue_instant_bullet(order.shooter, cfg.bot_damage, cfg.bot_range, order.origin, order.direction);
                else
                    sim->queue_projectile_bullet(
                        order.shooter, cfg.bot_damage, cfg.bot_range, order.origin, order.direction);
                ++fired;
            } catch (const std::exception &ex) {
                bulletsim::log::debug("[arena] bot {} shot rejected: {}", order.shooter, ex.what());
            }
        }
    }
    bulletsim::log::info("[arena] loop exit shots_fired={}", fired);
}

} // namespace bulletsim::world
