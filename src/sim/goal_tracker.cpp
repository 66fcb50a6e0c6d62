#include "sim/goal_tracker.hpp"
#include "map/flow_field.hpp"

#include <cmath>
#include <spdlog/spdlog.h>

namespace hf::sim {

GoalTracker::GoalTracker(f32 update_interval) {
    set_update_interval(update_interval);
}

void GoalTracker::set_update_interval(f32 seconds) {
    if (!(seconds >= 0.0f) || !std::isfinite(seconds)) {
        spdlog::warn("GoalTracker: invalid update interval {}, using {}",
                     seconds, DEFAULT_UPDATE_INTERVAL);
        seconds = DEFAULT_UPDATE_INTERVAL;
    }
    update_interval_ = seconds;
}

bool GoalTracker::update(map::FlowField& field, f32 dt) {
    if (dt > 0.0f) time_since_update_ += dt;
    if (dt <= 0.0f || time_since_update_ < update_interval_) return false;

    force_solve(field);
    return true;
}

void GoalTracker::force_solve(map::FlowField& field) {
    time_since_update_ = 0.0f;
    ++solve_count_;
    auto outcome = field.set_goal(target_);
    if (outcome != map::SolveOutcome::Solved) {
        spdlog::debug("GoalTracker: target ({:.1f}, {:.1f}) unreachable ({})",
                      target_.x, target_.z, map::solve_outcome_name(outcome));
    }
}

} // namespace hf::sim
