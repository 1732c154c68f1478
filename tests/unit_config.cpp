// SPDX-License-Identifier: Apache-2.0
#include "server/config/server_config.hpp"

#include <yaml-cpp/yaml.h>

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

using namespace bulletsim::config;
using namespace std::chrono_literals;

static std::string validate_message(const ServerConfig &cfg)
{
    try {
        validate(cfg);
    } catch (const std::invalid_argument &ex) {
        return ex.what();
    }
    return {};
}

int main()
{
    // Empty document keeps every default.
    {
        ServerConfig cfg;
        apply_overrides(cfg, YAML::Load("{}"));
        assert(cfg.sim.worker_count == 14 && cfg.sim.worker_capacity == 35);
        assert(cfg.sim.tick_interval == 33ms && cfg.sim.default_timeout == 15000ms);
        assert(cfg.sim.max_lifetime == 12000ms && cfg.sim.reclaim_interval() == 7500ms);
        assert(cfg.sim.proximity_radius == 8.5f && cfg.sim.proximity_fallback);
        assert(cfg.sim.max_range == 5000.f);
        assert(cfg.listen_port == 40100 && cfg.metrics_port == 0);
        assert(validate_message(cfg).empty());
    }
    // Partial overrides.
    {
        ServerConfig cfg;
        apply_overrides(cfg, YAML::Load(R"(
worker_count: 3
tick_interval_ms: 16
default_timeout_sec: 2.5
max_bullet_lifetime_sec: 4
proximity_fallback: false
listen_port: 41000
log_level: debug
bot_count: 2
auto_fire: false
)"));
        assert(cfg.sim.worker_count == 3 && cfg.sim.worker_capacity == 35);
        assert(cfg.sim.tick_interval == 16ms);
        assert(cfg.sim.default_timeout == 2500ms && cfg.sim.reclaim_interval() == 1250ms);
        assert(cfg.sim.max_lifetime == 4000ms);
        assert(!cfg.sim.proximity_fallback);
        assert(cfg.listen_port == 41000 && cfg.log_level == "debug");
        assert(cfg.arena.bot_count == 2 && !cfg.arena.auto_fire);
    }
    // Validation names the offending key.
    {
        ServerConfig cfg;
        cfg.sim.worker_count = 0;
        assert(validate_message(cfg).find("worker_count") != std::string::npos);
        cfg = ServerConfig{};
        cfg.sim.projectile_speed = -1.f;
        assert(validate_message(cfg).find("projectile_speed") != std::string::npos);
        cfg = ServerConfig{};
        cfg.arena.idle_bot_fraction = 1.5f;
        assert(validate_message(cfg).find("idle_bot_fraction") != std::string::npos);
        cfg = ServerConfig{};
        cfg.sim.max_range = 0.f;
        assert(validate_message(cfg).find("max_range") != std::string::npos);
    }
    // A millisecond timeout would give the reclaimer a zero interval.
    {
        ServerConfig cfg;
        apply_overrides(cfg, YAML::Load("default_timeout_sec: 0.001"));
        assert(cfg.sim.default_timeout == 1ms);
        assert(validate_message(cfg).find("default_timeout_sec") != std::string::npos);
        assert(cfg.sim.reclaim_interval() == 1ms);
        apply_overrides(cfg, YAML::Load("default_timeout_sec: 0.002\nmax_range: 750"));
        assert(validate_message(cfg).empty());
        assert(cfg.sim.reclaim_interval() == 1ms && cfg.sim.max_range == 750.f);
    }
    // Bad value types surface as YAML exceptions.
    {
        ServerConfig cfg;
        bool threw = false;
        try {
            apply_overrides(cfg, YAML::Load("worker_count: many"));
        } catch (const YAML::Exception &) {
            threw = true;
        }
        assert(threw);
    }
    // File round trip and missing file.
    {
        auto path = std::filesystem::temp_directory_path() / "bulletsim_unit_config.yaml";
        {
            std::ofstream out(path);
            out << "worker_capacity: 7\nmetrics_port: 9200\n";
        }
        auto cfg = load_config(path.string());
        assert(cfg.sim.worker_capacity == 7 && cfg.metrics_port == 9200);
        std::filesystem::remove(path);
        bool threw = false;
        try {
            load_config(path.string());
        } catch (const YAML::Exception &) {
            threw = true;
        }
        assert(threw);
    }
    // Shipped configs load and validate (test runs from the source root).
    {
        auto prod = load_config("config/server.yaml");
        assert(prod.sim.worker_count == 14 && prod.metrics_port == 9100);
        auto fast = load_config("config/server_test.yaml");
        assert(fast.sim.worker_count == 2 && !fast.arena.auto_fire);
    }
    std::cout << "unit_config OK" << std::endl;
    return 0;
}
