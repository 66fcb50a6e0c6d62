#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "core/vector.hpp"

#include <string_view>

namespace hf::lua {
class LuaState;
}

namespace hf::config {

struct FlowFieldConfig {
    u32 width = 100;
    u32 height = 100;
    f32 cell_size = 2.0f;
    Vector2 origin{-100.0f, -100.0f};
};

struct MovementConfig {
    f32 direct_pursuit_blend = 0.35f; // 0 = pure flow, 1 = pure pursuit
    f32 velocity_smoothing = 0.25f;   // share of target velocity per tick
    f32 idle_damping = 0.9f;          // velocity multiplier per idle tick
    f32 flee_speed_multiplier = 1.5f;
};

struct SeparationConfig {
    f32 radius = 2.5f;
    f32 force = 8.0f;
};

/// Horde tuning. Defaults match the shipped game settings.
struct HordeConfig {
    FlowFieldConfig flow_field;
    f32 update_interval = 0.35f; // seconds between flow-field solves
    MovementConfig movement;
    SeparationConfig separation;
};

/// Read the `Horde` global table from a state that has already run a
/// tuning script. Missing fields keep their defaults; bad values are
/// clamped or ignored with a warning.
HordeConfig read_horde_config(const lua::LuaState& state);

/// Run a tuning script file and read the `Horde` table from it.
Result<HordeConfig> load_horde_config(const fs::path& path);

/// Same as load_horde_config, from an in-memory script.
Result<HordeConfig> load_horde_config_string(std::string_view code);

} // namespace hf::config
