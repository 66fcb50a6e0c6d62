#include "config/horde_config.hpp"
#include "core/log.hpp"
#include "core/types.hpp"
#include "map/heightmap.hpp"
#include "sim/horde_ai.hpp"
#include "sim/separation.hpp"

#include <cmath>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <random>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace {

struct DemoOptions {
    hf::fs::path config_file;
    hf::fs::path log_file = "hordeflow.log";
    hf::u32 agents = 500;
    hf::u32 ticks = 300;
    hf::u32 seed = 1337;
};

constexpr hf::f32 SECONDS_PER_TICK = 0.1f;

void print_usage() {
    std::cout << "HordeFlow v0.1.0\n"
              << "Flow-field horde simulation driver\n\n"
              << "Usage:\n"
              << "  horde_sim [options]\n\n"
              << "Options:\n"
              << "  --config <path>  Lua tuning script (Horde table)\n"
              << "  --agents <n>     Number of agents to spawn (default: 500)\n"
              << "  --ticks <n>      Number of 0.1s ticks to run (default: 300)\n"
              << "  --seed <n>       Spawn RNG seed (default: 1337)\n"
              << "  --log <path>     Log file (default: hordeflow.log)\n"
              << "  --help           Show this help message\n";
}

hf::u32 parse_u32(const char* text, hf::u32 fallback) {
    char* end = nullptr;
    unsigned long v = std::strtoul(text, &end, 10);
    if (end == text || *end != '\0') {
        spdlog::warn("Ignoring invalid number '{}'", text);
        return fallback;
    }
    return static_cast<hf::u32>(v);
}

DemoOptions parse_args(int argc, char* argv[]) {
    DemoOptions opts;
    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            opts.config_file = argv[++i];
        } else if (std::strcmp(argv[i], "--agents") == 0 && i + 1 < argc) {
            opts.agents = parse_u32(argv[++i], opts.agents);
        } else if (std::strcmp(argv[i], "--ticks") == 0 && i + 1 < argc) {
            opts.ticks = parse_u32(argv[++i], opts.ticks);
        } else if (std::strcmp(argv[i], "--seed") == 0 && i + 1 < argc) {
            opts.seed = parse_u32(argv[++i], opts.seed);
        } else if (std::strcmp(argv[i], "--log") == 0 && i + 1 < argc) {
            opts.log_file = argv[++i];
        } else if (std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            std::exit(0);
        }
    }
    return opts;
}

/// Spawn agents on a ring around the target with jittered radius and speed.
std::vector<hf::sim::Agent> spawn_ring(std::mt19937& rng, hf::u32 count,
                                       const hf::Vector3& center) {
    std::uniform_real_distribution<hf::f32> angle(0.0f, 6.2831853f);
    std::uniform_real_distribution<hf::f32> radius(40.0f, 70.0f);
    std::uniform_real_distribution<hf::f32> speed(4.0f, 7.0f);

    std::vector<hf::sim::Agent> agents(count);
    for (auto& a : agents) {
        hf::f32 t = angle(rng);
        hf::f32 r = radius(rng);
        a.position = {center.x + std::cos(t) * r, 0.0f,
                      center.z + std::sin(t) * r};
        a.max_speed = speed(rng);
        a.ai = hf::sim::AIComponent(80.0f, 2.0f, 1.0f);
    }
    return agents;
}

} // namespace

int main(int argc, char* argv[]) {
    DemoOptions opts = parse_args(argc, argv);
    hf::log::init(opts.log_file);

    hf::config::HordeConfig cfg;
    if (!opts.config_file.empty()) {
        auto loaded = hf::config::load_horde_config(opts.config_file);
        if (loaded) {
            cfg = loaded.value();
        } else {
            spdlog::warn("{}; using defaults", loaded.error().message);
        }
    }

    const hf::Vector3 target{0.0f, 0.0f, 0.0f};
    hf::sim::HordeAI horde(cfg);
    horde.update_target(target);

    // Obstacles are grid-relative, so centre the field before placing them
    horde.force_solve();

    // Wall across +Z with a single gap at x = 0
    for (hf::f32 x = -60.0f; x <= 60.0f; x += cfg.flow_field.cell_size) {
        if (std::fabs(x) < 4.0f) continue;
        horde.add_obstacle({x, 0.0f, 20.0f}, 0.5f);
    }
    horde.force_solve();

    auto terrain = hf::map::Heightmap::flat(
        200, 200, 0.0f, {-100.0f, -100.0f}, 1.0f);

    std::mt19937 rng(opts.seed);
    auto agents = spawn_ring(rng, opts.agents, target);
    spdlog::info("Spawned {} agents (seed {}), running {} ticks", agents.size(),
                 opts.seed, opts.ticks);

    for (hf::u32 tick = 1; tick <= opts.ticks; ++tick) {
        auto stats = horde.update(agents, SECONDS_PER_TICK, &terrain);
        hf::sim::apply_separation(agents, cfg.separation.radius,
                                  cfg.separation.force);

        if (tick % 10 == 0) {
            hf::f64 total = 0.0;
            for (const auto& a : agents) total += (target - a.position).length();
            hf::f64 mean = agents.empty() ? 0.0 : total / agents.size();
            spdlog::info("tick {:4}: idle={} chasing={} attacking={} "
                         "mean_dist={:.2f} solves={}",
                         tick, stats.count(hf::sim::AIState::Idle),
                         stats.count(hf::sim::AIState::Chasing),
                         stats.count(hf::sim::AIState::Attacking), mean,
                         horde.goal_tracker().solve_count());
        }
    }

    hf::log::shutdown();
    return 0;
}
