#pragma once

#include "core/types.hpp"
#include "core/vector.hpp"

#include <array>
#include <deque>
#include <vector>

namespace hf::map {

/// Result of one wavefront solve. The field contents are the same for every
/// outcome; the outcome only reports why the reached region may be empty.
enum class SolveOutcome : u8 {
    NotSolved,    // no goal has been set since construction / clear()
    Solved,       // goal walkable and at least one other cell reached
    GoalBlocked,  // goal cell is an obstacle; nothing reached
    GoalIsolated, // goal walkable but fully enclosed; only the goal reached
};

const char* solve_outcome_name(SolveOutcome outcome);

struct SolveStats {
    SolveOutcome outcome = SolveOutcome::NotSolved;
    u32 reached_cells = 0;
    u32 relaxations = 0; // worklist pushes, including the goal
};

/// Two-phase integration + flow solve over a flat cost grid.
///
/// Integration is a FIFO relaxation sweep from the goal: neighbours are
/// re-queued whenever their distance strictly improves, so it converges to
/// the same distances as Dijkstra without a priority queue. Flow then points
/// every reached cell at its lowest-integration neighbour.
///
/// The solver owns its output buffers. A caller publishes a finished solve by
/// swapping them into its own storage, which hands the old arrays back as
/// scratch for the next run.
class WavefrontSolver {
public:
    static constexpr u8 BLOCKED = 255;
    static constexpr u16 UNREACHED = 0xFFFF;
    static constexpr u16 CARDINAL_COST = 10;
    static constexpr u16 DIAGONAL_COST = 14; // ~sqrt(2) * 10
    static constexpr u16 CELL_COST_SCALE = 10;

    struct Offset {
        i32 dx;
        i32 dz;
        u16 base_cost;
    };

    /// Fixed scan order. The first strict minimum wins during flow
    /// derivation, which keeps solves reproducible.
    static constexpr std::array<Offset, 8> NEIGHBORS = {{
        {-1, 0, CARDINAL_COST},
        {1, 0, CARDINAL_COST},
        {0, -1, CARDINAL_COST},
        {0, 1, CARDINAL_COST},
        {-1, -1, DIAGONAL_COST},
        {1, -1, DIAGONAL_COST},
        {-1, 1, DIAGONAL_COST},
        {1, 1, DIAGONAL_COST},
    }};

    /// Run both phases. `goal` must already be inside [0,width)x[0,height)
    /// and `costs` must hold width*height entries.
    SolveStats solve(const std::vector<u8>& costs, u32 width, u32 height,
                     GridCoord goal);

    std::vector<u16>& integration() { return integration_; }
    std::vector<Vector2>& directions() { return directions_; }

private:
    SolveStats compute_integration(const std::vector<u8>& costs, u32 width,
                                   u32 height, GridCoord goal);
    void compute_flow(const std::vector<u8>& costs, u32 width, u32 height);

    std::vector<u16> integration_;
    std::vector<Vector2> directions_;
    std::deque<u32> worklist_;
};

} // namespace hf::map
