#pragma once

#include "core/types.hpp"

namespace hf::sim {

enum class AIState : u8 {
    Idle,
    Chasing,
    Attacking,
    Fleeing,
    Dead,
};

const char* ai_state_name(AIState state);

/// Leaving a state needs the distance to exceed its entry threshold by this
/// factor, so agents sitting on a boundary don't flap between states.
constexpr f32 HYSTERESIS_FACTOR = 1.5f;

/// Distance-driven transition. Fleeing and Dead are only left by the caller.
AIState next_ai_state(AIState current, f32 distance, f32 aggro_range,
                      f32 attack_range);

/// States that translate the agent each tick.
inline bool is_moving(AIState s) {
    return s == AIState::Chasing || s == AIState::Fleeing;
}

struct AIComponent {
    AIState state = AIState::Idle;
    f32 aggro_range = 0;
    f32 attack_range = 0;
    f32 attack_cooldown = 0;
    f32 current_cooldown = 0;

    AIComponent() = default;
    AIComponent(f32 aggro, f32 attack, f32 cooldown)
        : aggro_range(aggro), attack_range(attack), attack_cooldown(cooldown) {}

    bool can_attack() const { return current_cooldown <= 0.0f; }
    void trigger_attack() { current_cooldown = attack_cooldown; }
    void update_cooldown(f32 dt);
};

} // namespace hf::sim
