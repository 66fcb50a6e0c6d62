#include "config/horde_config.hpp"
#include "lua/lua_state.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <spdlog/spdlog.h>

namespace hf::config {

namespace {

/// Read a number field into `out`, clamped to [lo, hi]. Leaves `out`
/// unchanged when the field is absent or not a number.
template <typename T>
void read_number(const lua::LuaState& state, const char* section,
                 const char* field, T& out, double lo, double hi) {
    bool type_error = false;
    auto value = state.get_number_field(-1, field, &type_error);
    if (type_error) {
        spdlog::warn("Horde.{}.{}: expected a number, keeping {}", section,
                     field, out);
        return;
    }
    if (!value) return;

    double v = *value;
    if (!std::isfinite(v)) {
        spdlog::warn("Horde.{}.{}: non-finite value, keeping {}", section,
                     field, out);
        return;
    }
    if (v < lo || v > hi) {
        double clamped = std::clamp(v, lo, hi);
        spdlog::warn("Horde.{}.{}: {} out of range [{}, {}], clamped to {}",
                     section, field, v, lo, hi, clamped);
        v = clamped;
    }
    out = static_cast<T>(v);
}

constexpr double MAX_GRID_CELLS = 4096;
constexpr double BIG = 1.0e6;

} // namespace

HordeConfig read_horde_config(const lua::LuaState& state) {
    HordeConfig cfg;
    if (!state.push_global_table("Horde")) {
        spdlog::info("Horde config: no Horde table, using defaults");
        return cfg;
    }

    if (state.push_table_field(-1, "FlowField")) {
        auto& ff = cfg.flow_field;
        read_number(state, "FlowField", "Width", ff.width, 1, MAX_GRID_CELLS);
        read_number(state, "FlowField", "Height", ff.height, 1,
                    MAX_GRID_CELLS);
        read_number(state, "FlowField", "CellSize", ff.cell_size, 0.01, BIG);
        read_number(state, "FlowField", "OriginX", ff.origin.x, -BIG, BIG);
        read_number(state, "FlowField", "OriginZ", ff.origin.y, -BIG, BIG);
        state.pop();
    }

    if (state.push_table_field(-1, "GoalTracker")) {
        read_number(state, "GoalTracker", "UpdateInterval",
                    cfg.update_interval, 0.0, 60.0);
        state.pop();
    }

    if (state.push_table_field(-1, "Movement")) {
        auto& mv = cfg.movement;
        read_number(state, "Movement", "DirectPursuitBlend",
                    mv.direct_pursuit_blend, 0.0, 1.0);
        read_number(state, "Movement", "VelocitySmoothing",
                    mv.velocity_smoothing, 0.0, 1.0);
        read_number(state, "Movement", "IdleDamping", mv.idle_damping, 0.0,
                    1.0);
        read_number(state, "Movement", "FleeSpeedMultiplier",
                    mv.flee_speed_multiplier, 0.0, 100.0);
        state.pop();
    }

    if (state.push_table_field(-1, "Separation")) {
        auto& sep = cfg.separation;
        read_number(state, "Separation", "Radius", sep.radius, 0.01, BIG);
        read_number(state, "Separation", "Force", sep.force, 0.0, BIG);
        state.pop();
    }

    state.pop(); // Horde
    return cfg;
}

Result<HordeConfig> load_horde_config(const fs::path& path) {
    lua::LuaState state;
    state.register_logging();

    auto result = state.do_file(path);
    if (!result) {
        return Error("Horde config " + path.string() + ": " +
                     result.error().message);
    }

    HordeConfig cfg = read_horde_config(state);
    spdlog::info("Horde config loaded from {} ({}x{} field, cell {})",
                 path.string(), cfg.flow_field.width, cfg.flow_field.height,
                 cfg.flow_field.cell_size);
    return cfg;
}

Result<HordeConfig> load_horde_config_string(std::string_view code) {
    lua::LuaState state;
    state.register_logging();

    auto result = state.do_string(code);
    if (!result) {
        return Error("Horde config: " + result.error().message);
    }
    return read_horde_config(state);
}

} // namespace hf::config
