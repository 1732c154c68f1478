// SPDX-License-Identifier: Apache-2.0
#include "server/config/server_config.hpp"

#include <cmath>
#include <stdexcept>

namespace bulletsim::config {

void apply_overrides(ServerConfig &cfg, const YAML::Node &root)
{
    auto &sim = cfg.sim;
    if (root["worker_count"])
        sim.worker_count = root["worker_count"].as<uint32_t>();
    if (root["worker_capacity"])
        sim.worker_capacity = root["worker_capacity"].as<uint32_t>();
    if (root["tick_interval_ms"])
        sim.tick_interval = std::chrono::milliseconds(root["tick_interval_ms"].as<uint32_t>());
    if (root["projectile_speed"])
        sim.projectile_speed = root["projectile_speed"].as<float>();
    if (root["max_bullet_lifetime_sec"])
        sim.max_lifetime = std::chrono::milliseconds(
            static_cast<int64_t>(root["max_bullet_lifetime_sec"].as<double>() * 1000.0));
    if (root["default_timeout_sec"])
        sim.default_timeout =
            std::chrono::milliseconds(static_cast<int64_t>(root["default_timeout_sec"].as<double>() * 1000.0));
    if (root["proximity_radius"])
        sim.proximity_radius = root["proximity_radius"].as<float>();
    if (root["max_range"])
        sim.max_range = root["max_range"].as<float>();
    if (root["proximity_fallback"])
        sim.proximity_fallback = root["proximity_fallback"].as<bool>();
    if (root["destruct_grace_ms"])
        sim.destruct_grace = std::chrono::milliseconds(root["destruct_grace_ms"].as<uint32_t>());
    if (root["listen_port"])
        cfg.listen_port = root["listen_port"].as<uint16_t>();
    if (root["metrics_port"])
        cfg.metrics_port = root["metrics_port"].as<uint16_t>();
    if (root["log_level"]) {
        cfg.log_level = root["log_level"].as<std::string>();
    }
    if (root["log_json"]) {
        cfg.log_json = root["log_json"].as<bool>();
    }
    auto &arena = cfg.arena;
    if (root["arena_width"])
        arena.width = root["arena_width"].as<float>();
    if (root["arena_height"])
        arena.height = root["arena_height"].as<float>();
    if (root["bot_count"])
        arena.bot_count = root["bot_count"].as<uint32_t>();
    if (root["idle_bot_fraction"])
        arena.idle_bot_fraction = root["idle_bot_fraction"].as<float>();
    if (root["bot_speed"])
        arena.bot_speed = root["bot_speed"].as<float>();
    if (root["bot_hp"])
        arena.bot_hp = root["bot_hp"].as<float>();
    if (root["bot_respawn_sec"])
        arena.bot_respawn_sec = root["bot_respawn_sec"].as<float>();
    if (root["crate_count"])
        arena.crate_count = root["crate_count"].as<uint32_t>();
    if (root["auto_fire"])
        arena.auto_fire = root["auto_fire"].as<bool>();
    if (root["bot_fire_interval_ms"])
        arena.bot_fire_interval_ms = root["bot_fire_interval_ms"].as<uint32_t>();
    if (root["bot_damage"])
        arena.bot_damage = root["bot_damage"].as<float>();
    if (root["bot_range"])
        arena.bot_range = root["bot_range"].as<float>();
}

void validate(const ServerConfig &cfg)
{
    const auto &sim = cfg.sim;
    if (sim.worker_count < 1)
        throw std::invalid_argument("worker_count must be >= 1");
    if (sim.worker_capacity < 1)
        throw std::invalid_argument("worker_capacity must be >= 1");
    if (sim.tick_interval.count() < 1)
        throw std::invalid_argument("tick_interval_ms must be >= 1");
    if (!(sim.projectile_speed > 0.f))
        throw std::invalid_argument("projectile_speed must be positive");
    if (sim.max_lifetime.count() <= 0)
        throw std::invalid_argument("max_bullet_lifetime_sec must be positive");
    if (sim.default_timeout < std::chrono::milliseconds(2))
        throw std::invalid_argument("default_timeout_sec must be at least 0.002");
    if (!(sim.proximity_radius > 0.f))
        throw std::invalid_argument("proximity_radius must be positive");
    if (!std::isfinite(sim.max_range) || !(sim.max_range > 0.f))
        throw std::invalid_argument("max_range must be positive");
    const auto &arena = cfg.arena;
    if (!(arena.width > 0.f) || !(arena.height > 0.f))
        throw std::invalid_argument("arena_width and arena_height must be positive");
    if (arena.idle_bot_fraction < 0.f || arena.idle_bot_fraction > 1.f)
        throw std::invalid_argument("idle_bot_fraction must be within [0, 1]");
    if (!(arena.bot_hp > 0.f))
        throw std::invalid_argument("bot_hp must be positive");
    if (arena.auto_fire && arena.bot_fire_interval_ms < 1)
        throw std::invalid_argument("bot_fire_interval_ms must be >= 1");
}

ServerConfig load_config(const std::string &path)
{
    YAML::Node root = YAML::LoadFile(path);
    ServerConfig cfg;
    apply_overrides(cfg, root);
    validate(cfg);
    return cfg;
}

} // namespace bulletsim::config
