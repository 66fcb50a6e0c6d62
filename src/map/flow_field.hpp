#pragma once

#include "core/types.hpp"
#include "core/vector.hpp"
#include "map/wavefront_solver.hpp"

#include <optional>
#include <vector>

namespace hf::map {

/// Planar flow field shared by every agent chasing one goal.
///
/// Backing store is three index-aligned row-major arrays (cost, integration,
/// direction) addressed by `iz * width + ix`. The grid has a fixed size and a
/// movable world origin so it can be re-centred on a moving goal.
///
/// Cost and goal edits only take effect in integration/direction on the next
/// solve: between solves the field is an as-of-last-solve snapshot.
class FlowField {
public:
    static constexpr u8 BLOCKED = WavefrontSolver::BLOCKED;
    static constexpr u8 MIN_COST = 1;
    static constexpr u8 MAX_COST = 254;
    static constexpr u16 UNREACHED = WavefrontSolver::UNREACHED;
    static constexpr f32 MIN_CELL_SIZE = 0.01f;

    /// width/height: cell counts (at least 1).
    /// cell_size: world units per square cell.
    /// origin: world XZ of the (0,0) corner.
    FlowField(u32 width, u32 height, f32 cell_size, Vector2 origin = {});

    u32 width() const { return width_; }
    u32 height() const { return height_; }
    f32 cell_size() const { return cell_size_; }
    size_t cell_count() const { return costs_.size(); }

    const Vector2& origin() const { return origin_; }
    void set_origin(const Vector2& origin) { origin_ = origin; }

    /// World XZ of the middle of the addressable area.
    Vector2 center() const;

    bool in_bounds(i32 ix, i32 iz) const {
        return ix >= 0 && iz >= 0 && static_cast<u32>(ix) < width_ &&
               static_cast<u32>(iz) < height_;
    }

    /// Flat index; no bounds check.
    size_t index(i32 ix, i32 iz) const {
        return static_cast<size_t>(iz) * width_ + static_cast<size_t>(ix);
    }

    /// floor((p.xz - origin) / cell_size). Not clamped.
    GridCoord world_to_grid(const Vector3& world_pos) const;

    /// World position of a cell centre (y = 0).
    Vector3 grid_to_world(i32 ix, i32 iz) const;

    /// False when out of range or blocked.
    bool is_walkable(i32 ix, i32 iz) const;

    /// Per-cell reads. Out of range reads as BLOCKED / UNREACHED / zero.
    u8 cost(i32 ix, i32 iz) const;
    u16 integration(i32 ix, i32 iz) const;
    Vector2 direction(i32 ix, i32 iz) const;

    // Obstacle editing

    /// Mark a cell as an obstacle. Idempotent; out of range is a no-op.
    void set_blocked(i32 ix, i32 iz);

    /// Set traversal cost, clamped into [MIN_COST, MAX_COST].
    /// Out of range is a no-op.
    void set_cost(i32 ix, i32 iz, i32 cost);

    /// Reset every cost to 1, drop the solve and the goal.
    void clear();

    // Goal / solve

    /// Re-centre on the goal, then solve from the goal's (clamped) cell.
    SolveOutcome set_goal(const Vector3& world_pos);

    /// Solve from a cell without moving the origin. Coordinates are clamped
    /// into the grid.
    SolveOutcome set_goal_cell(i32 ix, i32 iz);

    const std::optional<GridCoord>& goal() const { return goal_; }
    SolveOutcome last_outcome() const { return last_stats_.outcome; }
    const SolveStats& last_stats() const { return last_stats_; }

    const std::vector<u8>& costs() const { return costs_; }
    const std::vector<u16>& integration_field() const { return integration_; }
    const std::vector<Vector2>& directions() const { return directions_; }

private:
    u32 width_;
    u32 height_;
    f32 cell_size_;
    Vector2 origin_;
    std::vector<u8> costs_;
    std::vector<u16> integration_;
    std::vector<Vector2> directions_;
    std::optional<GridCoord> goal_;
    SolveStats last_stats_;
    WavefrontSolver solver_;
};

} // namespace hf::map
