#pragma once

#include "config/horde_config.hpp"
#include "core/types.hpp"
#include "core/vector.hpp"
#include "map/field_sampler.hpp"
#include "map/flow_field.hpp"
#include "sim/agent.hpp"
#include "sim/goal_tracker.hpp"

#include <array>
#include <vector>

namespace hf::map {
class TerrainSampler;
}

namespace hf::sim {

/// Per-tick counts from HordeAI::update, indexed by AIState.
struct HordeTickStats {
    std::array<u32, 5> state_counts{};
    u32 moved = 0;
    bool solved = false;

    u32 count(AIState s) const { return state_counts[static_cast<size_t>(s)]; }
};

/// Drives a horde toward one target: owns the flow field, throttles its
/// solves, runs the per-agent state machine and blends flow-field steering
/// with direct pursuit.
///
/// Separation is not applied here; call apply_separation() after update()
/// so the impulse lands on top of the smoothed velocity.
class HordeAI {
public:
    explicit HordeAI(const config::HordeConfig& config = {});

    // The sampler refers to the owned field, so the object stays put.
    HordeAI(const HordeAI&) = delete;
    HordeAI& operator=(const HordeAI&) = delete;

    /// Target position (usually the player).
    void update_target(const Vector3& target);
    const Vector3& target() const { return tracker_.target(); }

    /// Advance every agent by dt. When terrain is given, moving agents are
    /// snapped to its surface height.
    HordeTickStats update(std::vector<Agent>& agents, f32 dt,
                          const map::TerrainSampler* terrain = nullptr);

    /// Block every cell within `radius` (square footprint) of a world
    /// position. Takes effect on the next solve.
    void add_obstacle(const Vector3& position, f32 radius);

    /// Unblock everything. Obstacles that should persist must be re-added.
    void clear_obstacles();

    /// Solve now instead of waiting for the interval.
    void force_solve() { tracker_.force_solve(field_); }

    map::FlowField& flow_field() { return field_; }
    const map::FlowField& flow_field() const { return field_; }
    const map::FieldSampler& sampler() const { return sampler_; }
    const GoalTracker& goal_tracker() const { return tracker_; }
    const config::HordeConfig& config() const { return config_; }

    /// Movement for one agent in its current state. Exposed for tests.
    void steer(Agent& agent, const Vector3& to_target, f32 dt) const;

private:
    static void face(Agent& agent, const Vector3& dir);

    config::HordeConfig config_;
    map::FlowField field_;
    map::FieldSampler sampler_;
    GoalTracker tracker_;
};

} // namespace hf::sim
