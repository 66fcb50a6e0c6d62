#pragma once

#include "core/types.hpp"
#include "core/vector.hpp"

namespace hf::map {
class FlowField;
}

namespace hf::sim {

/// Throttles full flow-field solves for a moving goal.
/// Each solve is a whole-grid sweep, so the field is refreshed on a fixed
/// interval rather than every tick.
class GoalTracker {
public:
    static constexpr f32 DEFAULT_UPDATE_INTERVAL = 0.35f;

    explicit GoalTracker(f32 update_interval = DEFAULT_UPDATE_INTERVAL);

    void set_target(const Vector3& target) { target_ = target; }
    const Vector3& target() const { return target_; }

    f32 update_interval() const { return update_interval_; }
    void set_update_interval(f32 seconds);

    /// Advance the timer; re-centre and solve once the interval elapses.
    /// Returns true when a solve ran this call.
    bool update(map::FlowField& field, f32 dt);

    /// Solve now and restart the interval.
    void force_solve(map::FlowField& field);

    u32 solve_count() const { return solve_count_; }

private:
    Vector3 target_;
    f32 update_interval_;
    f32 time_since_update_ = 0;
    u32 solve_count_ = 0;
};

} // namespace hf::sim
