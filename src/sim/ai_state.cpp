#include "sim/ai_state.hpp"

#include <algorithm>

namespace hf::sim {

const char* ai_state_name(AIState state) {
    switch (state) {
    case AIState::Idle: return "Idle";
    case AIState::Chasing: return "Chasing";
    case AIState::Attacking: return "Attacking";
    case AIState::Fleeing: return "Fleeing";
    case AIState::Dead: return "Dead";
    }
    return "Unknown";
}

AIState next_ai_state(AIState current, f32 distance, f32 aggro_range,
                      f32 attack_range) {
    switch (current) {
    case AIState::Idle:
        if (distance < aggro_range) return AIState::Chasing;
        return AIState::Idle;
    case AIState::Chasing:
        if (distance < attack_range) return AIState::Attacking;
        if (distance > aggro_range * HYSTERESIS_FACTOR) return AIState::Idle;
        return AIState::Chasing;
    case AIState::Attacking:
        if (distance > attack_range * HYSTERESIS_FACTOR)
            return AIState::Chasing;
        return AIState::Attacking;
    case AIState::Fleeing:
    case AIState::Dead:
        return current;
    }
    return current;
}

void AIComponent::update_cooldown(f32 dt) {
    current_cooldown = std::max(0.0f, current_cooldown - dt);
}

} // namespace hf::sim
