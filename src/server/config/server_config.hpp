// SPDX-License-Identifier: Apache-2.0
// server_config.hpp - YAML server configuration (simulation pool, network, arena)
#pragma once
#include "server/sim/types.hpp"

#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <string>

namespace bulletsim::config {

struct ArenaConfig
{
    float width{200.f};
    float height{200.f};
    uint32_t bot_count{8};
    float idle_bot_fraction{0.25f}; // share of bots that never move (proximity-exempt)
    float bot_speed{6.f};
    float bot_hp{100.f};
    float bot_respawn_sec{3.f};
    uint32_t crate_count{12};
    bool auto_fire{true};
    uint32_t bot_fire_interval_ms{500};
    float bot_damage{20.f};
    float bot_range{150.f};
};

struct ServerConfig
{
    bulletsim::sim::SimConfig sim;
    ArenaConfig arena;
    uint16_t listen_port{40100};
    uint16_t metrics_port{0}; // 0 disables
    std::string log_level{"info"};
    bool log_json{false};
};

// Only keys present in the node override the defaults already in `cfg`.
void apply_overrides(ServerConfig &cfg, const YAML::Node &root);

// Throws std::invalid_argument naming the first offending key.
void validate(const ServerConfig &cfg);

// Loads, applies and validates. Throws YAML::Exception for unreadable files or bad values.
ServerConfig load_config(const std::string &path);

} // namespace bulletsim::config
