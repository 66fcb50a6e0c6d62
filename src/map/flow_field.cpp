#include "map/flow_field.hpp"

#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>
#include <utility>

namespace hf::map {

namespace {

// Keeps far-off or non-finite queries inside i32 so they land out of range
// instead of overflowing.
i32 floor_to_cell(f32 v) {
    constexpr f32 LIMIT = static_cast<f32>(1 << 30);
    if (std::isnan(v)) return -(1 << 30);
    f32 f = std::floor(v);
    return static_cast<i32>(std::clamp(f, -LIMIT, LIMIT));
}

} // namespace

FlowField::FlowField(u32 width, u32 height, f32 cell_size, Vector2 origin)
    : width_(width), height_(height), cell_size_(cell_size), origin_(origin) {
    if (width_ == 0 || height_ == 0) {
        spdlog::warn("FlowField: degenerate size {}x{}, using at least 1x1",
                     width, height);
        width_ = std::max<u32>(width_, 1);
        height_ = std::max<u32>(height_, 1);
    }
    if (!(cell_size_ >= MIN_CELL_SIZE) || !std::isfinite(cell_size_)) {
        spdlog::warn("FlowField: invalid cell size {}, using {}", cell_size,
                     MIN_CELL_SIZE);
        cell_size_ = MIN_CELL_SIZE;
    }

    const size_t total = static_cast<size_t>(width_) * height_;
    costs_.assign(total, MIN_COST);
    integration_.assign(total, UNREACHED);
    directions_.assign(total, Vector2{});
}

Vector2 FlowField::center() const {
    return {origin_.x + static_cast<f32>(width_) * cell_size_ * 0.5f,
            origin_.y + static_cast<f32>(height_) * cell_size_ * 0.5f};
}

GridCoord FlowField::world_to_grid(const Vector3& world_pos) const {
    f32 lx = world_pos.x - origin_.x;
    f32 lz = world_pos.z - origin_.y;
    return {floor_to_cell(lx / cell_size_), floor_to_cell(lz / cell_size_)};
}

Vector3 FlowField::grid_to_world(i32 ix, i32 iz) const {
    return {origin_.x + (static_cast<f32>(ix) + 0.5f) * cell_size_, 0.0f,
            origin_.y + (static_cast<f32>(iz) + 0.5f) * cell_size_};
}

bool FlowField::is_walkable(i32 ix, i32 iz) const {
    if (!in_bounds(ix, iz)) return false;
    return costs_[index(ix, iz)] != BLOCKED;
}

u8 FlowField::cost(i32 ix, i32 iz) const {
    if (!in_bounds(ix, iz)) return BLOCKED;
    return costs_[index(ix, iz)];
}

u16 FlowField::integration(i32 ix, i32 iz) const {
    if (!in_bounds(ix, iz)) return UNREACHED;
    return integration_[index(ix, iz)];
}

Vector2 FlowField::direction(i32 ix, i32 iz) const {
    if (!in_bounds(ix, iz)) return {};
    return directions_[index(ix, iz)];
}

void FlowField::set_blocked(i32 ix, i32 iz) {
    if (!in_bounds(ix, iz)) return;
    costs_[index(ix, iz)] = BLOCKED;
}

void FlowField::set_cost(i32 ix, i32 iz, i32 cost) {
    if (!in_bounds(ix, iz)) return;
    costs_[index(ix, iz)] = static_cast<u8>(
        std::clamp<i32>(cost, MIN_COST, MAX_COST));
}

void FlowField::clear() {
    std::fill(costs_.begin(), costs_.end(), MIN_COST);
    std::fill(integration_.begin(), integration_.end(), UNREACHED);
    std::fill(directions_.begin(), directions_.end(), Vector2{});
    goal_.reset();
    last_stats_ = SolveStats{};
}

SolveOutcome FlowField::set_goal(const Vector3& world_pos) {
    const f32 half_w = static_cast<f32>(width_) * cell_size_ * 0.5f;
    const f32 half_h = static_cast<f32>(height_) * cell_size_ * 0.5f;
    origin_ = {world_pos.x - half_w, world_pos.z - half_h};

    GridCoord cell = world_to_grid(world_pos);
    return set_goal_cell(cell.x, cell.z);
}

SolveOutcome FlowField::set_goal_cell(i32 ix, i32 iz) {
    GridCoord cell{std::clamp<i32>(ix, 0, static_cast<i32>(width_) - 1),
                   std::clamp<i32>(iz, 0, static_cast<i32>(height_) - 1)};
    goal_ = cell;

    last_stats_ = solver_.solve(costs_, width_, height_, cell);

    // Publish: the previous arrays become the solver's scratch space.
    integration_.swap(solver_.integration());
    directions_.swap(solver_.directions());

    spdlog::debug("FlowField: solved goal ({},{}) -> {} ({} cells reached, "
                  "{} relaxations)",
                  cell.x, cell.z, solve_outcome_name(last_stats_.outcome),
                  last_stats_.reached_cells, last_stats_.relaxations);
    return last_stats_.outcome;
}

} // namespace hf::map
