#pragma once

#include "core/types.hpp"
#include "core/vector.hpp"
#include "sim/ai_state.hpp"

namespace hf::sim {

/// Caller-owned view of one horde member. The engine reads position and AI
/// parameters and writes velocity, position (while moving), yaw and state.
struct Agent {
    Vector3 position;
    Vector3 velocity;
    f32 max_speed = 0;
    f32 yaw = 0; // radians about +Y; 0 faces +Z
    AIComponent ai;
    bool ragdoll = false; // physics-driven; skipped by movement and separation

    /// Whether the agent takes part in per-tick movement and separation.
    bool ambulatory() const { return !ragdoll && ai.state != AIState::Dead; }
};

} // namespace hf::sim
