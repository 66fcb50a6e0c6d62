#include "map/wavefront_solver.hpp"

#include <algorithm>

namespace hf::map {

const char* solve_outcome_name(SolveOutcome outcome) {
    switch (outcome) {
    case SolveOutcome::NotSolved: return "NotSolved";
    case SolveOutcome::Solved: return "Solved";
    case SolveOutcome::GoalBlocked: return "GoalBlocked";
    case SolveOutcome::GoalIsolated: return "GoalIsolated";
    }
    return "Unknown";
}

SolveStats WavefrontSolver::solve(const std::vector<u8>& costs, u32 width,
                                  u32 height, GridCoord goal) {
    SolveStats stats = compute_integration(costs, width, height, goal);
    compute_flow(costs, width, height);
    return stats;
}

SolveStats WavefrontSolver::compute_integration(const std::vector<u8>& costs,
                                                u32 width, u32 height,
                                                GridCoord goal) {
    const size_t total = static_cast<size_t>(width) * height;
    integration_.assign(total, UNREACHED);
    worklist_.clear();

    SolveStats stats;
    const u32 goal_idx = static_cast<u32>(goal.z) * width +
                         static_cast<u32>(goal.x);
    if (costs[goal_idx] == BLOCKED) {
        stats.outcome = SolveOutcome::GoalBlocked;
        return stats;
    }

    integration_[goal_idx] = 0;
    worklist_.push_back(goal_idx);
    stats.relaxations = 1;

    const i32 w = static_cast<i32>(width);
    const i32 h = static_cast<i32>(height);

    while (!worklist_.empty()) {
        u32 cur_idx = worklist_.front();
        worklist_.pop_front();

        const i32 cx = static_cast<i32>(cur_idx % width);
        const i32 cz = static_cast<i32>(cur_idx / width);
        const u32 current = integration_[cur_idx];

        for (const auto& n : NEIGHBORS) {
            i32 nx = cx + n.dx;
            i32 nz = cz + n.dz;
            if (nx < 0 || nz < 0 || nx >= w || nz >= h) continue;

            u32 n_idx = static_cast<u32>(nz) * width + static_cast<u32>(nx);
            u8 cell_cost = costs[n_idx];
            if (cell_cost == BLOCKED) continue;

            // Saturate one below the sentinel so a reached cell never reads
            // as unreached.
            u32 candidate = current + n.base_cost +
                            static_cast<u32>(cell_cost) * CELL_COST_SCALE;
            u16 new_cost = static_cast<u16>(
                std::min<u32>(candidate, UNREACHED - 1));

            if (new_cost < integration_[n_idx]) {
                integration_[n_idx] = new_cost;
                worklist_.push_back(n_idx);
                ++stats.relaxations;
            }
        }
    }

    stats.reached_cells = static_cast<u32>(
        std::count_if(integration_.begin(), integration_.end(),
                      [](u16 v) { return v != UNREACHED; }));
    stats.outcome = stats.reached_cells > 1 ? SolveOutcome::Solved
                                            : SolveOutcome::GoalIsolated;
    return stats;
}

void WavefrontSolver::compute_flow(const std::vector<u8>& costs, u32 width,
                                   u32 height) {
    directions_.assign(static_cast<size_t>(width) * height, Vector2{});

    const i32 w = static_cast<i32>(width);
    const i32 h = static_cast<i32>(height);

    for (i32 z = 0; z < h; ++z) {
        for (i32 x = 0; x < w; ++x) {
            const u32 idx = static_cast<u32>(z) * width + static_cast<u32>(x);
            if (costs[idx] == BLOCKED || integration_[idx] == UNREACHED)
                continue;

            u16 best_cost = integration_[idx];
            Vector2 best_dir;

            for (const auto& n : NEIGHBORS) {
                i32 nx = x + n.dx;
                i32 nz = z + n.dz;
                if (nx < 0 || nz < 0 || nx >= w || nz >= h) continue;

                u16 neighbor_cost =
                    integration_[static_cast<u32>(nz) * width +
                                 static_cast<u32>(nx)];
                if (neighbor_cost < best_cost) {
                    best_cost = neighbor_cost;
                    best_dir = {static_cast<f32>(n.dx),
                                static_cast<f32>(n.dz)};
                }
            }

            directions_[idx] = best_dir.normalized_or_zero();
        }
    }
}

} // namespace hf::map
