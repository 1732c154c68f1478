// SPDX-License-Identifier: Apache-2.0
#include "common/logger.hpp"
#include "common/metrics.hpp"
#include "server/config/server_config.hpp"
#include "server/net/event_router.hpp"
#include "server/net/listener.hpp"
#include "server/net/metrics_http.hpp"
#include "server/sim/simulator.hpp"
#include "server/world/arena.hpp"

#include <coro/default_executor.hpp>
#include <coro/io_scheduler.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <memory>
#include <optional>
#include <random>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>

namespace bulletsim {
std::atomic_bool g_shutdown{false};
}

static void handle_signal(int)
{
    bulletsim::g_shutdown.store(true);
}

static std::string runtime_json(const char *tag)
{
    auto &b = bulletsim::metrics::bullets();
    std::ostringstream j;
    j << "{\"metric\":\"" << tag << "\"";
    j << ",\"avg_tick_ns\":" << bulletsim::metrics::avg_tick_ns();
    j << ",\"p99_tick_ns\":" << bulletsim::metrics::approx_tick_p99();
    j << ",\"queued\":" << b.queued.load();
    j << ",\"in_flight\":" << b.in_flight.load();
    j << ",\"simulated\":" << b.simulated.load();
    j << ",\"queued_total\":" << b.queued_total.load();
    j << ",\"completed_total\":" << b.completed_total.load();
    j << ",\"cancelled_total\":" << b.cancelled_total.load();
    j << ",\"reclaimed_total\":" << b.reclaimed_total.load();
    j << ",\"overflow_total\":" << b.overflow_assignments_total.load();
    j << ",\"hits_direct\":" << b.hits_direct_total.load();
    j << ",\"hits_proximity\":" << b.hits_proximity_total.load();
    j << ",\"hits_geometry\":" << b.hits_geometry_total.load();
    j << ",\"connected_clients\":" << b.connected_clients.load();
    j << "}";
    return j.str();
}

namespace {

struct CliOptions
{
    std::string config_path = "config/server.yaml";
    std::optional<uint16_t> port;
    std::chrono::seconds duration{0}; // zero: run until a signal arrives
    std::optional<bool> auto_fire;
};

CliOptions parse_cli(int argc, char **argv)
{
    CliOptions o;
    for (int i = 1; i < argc; ++i) {
        std::string_view a = argv[i];
        const bool has_value = i + 1 < argc;
        try {
            if (a == "--port" && has_value)
                o.port = static_cast<uint16_t>(std::stoi(argv[++i]));
            else if (a == "--duration" && has_value)
                o.duration = std::chrono::seconds(std::stoi(argv[++i]));
            else if (a == "--auto-fire")
                o.auto_fire = true;
            else if (a == "--no-auto-fire")
                o.auto_fire = false;
            else if (!a.empty() && a.front() != '-')
                o.config_path = std::string(a);
            else
                bulletsim::log::warn("Unknown argument '{}', ignoring", a);
        } catch (const std::exception &) {
            bulletsim::log::warn("Invalid value '{}' for {}, ignoring", argv[i], a);
        }
    }
    return o;
}

void apply_logging(const bulletsim::config::ServerConfig &cfg)
{
    bulletsim::log::init();
    // The environment wins over the config file.
    if (!cfg.log_level.empty() && std::getenv("BULLETSIM_LOG_LEVEL") == nullptr)
        bulletsim::log::set_level(cfg.log_level);
    if (cfg.log_json)
        bulletsim::log::set_json(true);
}

// Blocks the main thread until a signal or the --duration deadline, reporting counters once a minute.
void wait_for_shutdown(std::chrono::seconds duration)
{
    using clock = std::chrono::steady_clock;
    const auto started = clock::now();
    auto next_report = started + std::chrono::minutes(1);
    while (!bulletsim::g_shutdown.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(250));
        const auto now = clock::now();
        if (duration.count() > 0 && now - started >= duration) {
            bulletsim::log::info("Run duration of {}s reached", duration.count());
            bulletsim::g_shutdown.store(true);
        }
        if (now >= next_report) {
            next_report = now + std::chrono::minutes(1);
            bulletsim::log::info("{}", runtime_json("runtime"));
        }
    }
}

} // namespace

int main(int argc, char **argv)
{
    const CliOptions cli = parse_cli(argc, argv);
    bulletsim::config::ServerConfig cfg;
    try {
        cfg = bulletsim::config::load_config(cli.config_path);
    } catch (const std::exception &ex) {
        bulletsim::log::error("Failed to load config '{}': {}", cli.config_path, ex.what());
        bulletsim::log::flush();
        return 1;
    }
    if (cli.port)
        cfg.listen_port = *cli.port;
    if (cli.auto_fire)
        cfg.arena.auto_fire = *cli.auto_fire;

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);
    apply_logging(cfg);
    bulletsim::log::info(
        "bulletsim server starting config={} port={} workers={}x{} auto_fire={}", cli.config_path, cfg.listen_port,
        cfg.sim.worker_count, cfg.sim.worker_capacity, cfg.arena.auto_fire);

    auto scheduler = coro::default_executor::io_executor();
    auto arena = std::make_shared<bulletsim::world::Arena>(cfg.arena, static_cast<uint32_t>(std::random_device{}()));
    auto router = std::make_shared<bulletsim::net::EventRouter>();
    auto fanout = std::make_shared<bulletsim::sim::EventFanout>();
    fanout->add(arena);
    fanout->add(router);
    auto sim = std::make_shared<bulletsim::sim::BulletSimulator>(cfg.sim, arena, arena, fanout);
    auto metrics_stop = std::make_shared<std::atomic_bool>(false);

    bulletsim::sim::spawn_simulator(scheduler, sim);
    scheduler->spawn(bulletsim::world::run_arena(scheduler, arena, sim, cfg.arena));
    scheduler->spawn(bulletsim::net::run_listener(scheduler, cfg.listen_port, sim, router));
    if (cfg.metrics_port != 0)
        scheduler->spawn(bulletsim::net::run_metrics_endpoint(scheduler, cfg.metrics_port, metrics_stop));

    wait_for_shutdown(cli.duration);

    bulletsim::log::info("Shutting down");
    sim->shutdown();
    metrics_stop->store(true);
    // Workers get the destruct grace period plus two ticks to leave their loops.
    const auto deadline = std::chrono::steady_clock::now() + cfg.sim.destruct_grace + cfg.sim.tick_interval * 2;
    while (!sim->stopped() && std::chrono::steady_clock::now() < deadline)
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    if (!sim->stopped())
        bulletsim::log::warn("Simulator loops still running after grace period");
    bulletsim::log::info("{}", runtime_json("runtime_final"));
    bulletsim::log::flush();
    return 0;
}
