#pragma once

#include "core/types.hpp"
#include "core/vector.hpp"

namespace hf::map {

class FlowField;

/// Read-only direction queries against a solved FlowField.
/// Safe to use from AI and debug-overlay code alike; never returns NaN.
class FieldSampler {
public:
    explicit FieldSampler(const FlowField& field);

    /// Direction stored in the cell under world_pos. Outside the grid, the
    /// unit vector back toward the field centre.
    Vector2 sample(const Vector3& world_pos) const;

    /// 3x3 weighted average around world_pos (centre 2, edges 1, corners
    /// 0.7), ignoring empty cells. Falls back to a bilinear blend of the four
    /// nearest cell directions when every neighbour is empty.
    Vector2 sample_smooth(const Vector3& world_pos) const;

    static constexpr f32 WEIGHT_CENTER = 2.0f;
    static constexpr f32 WEIGHT_EDGE = 1.0f;
    static constexpr f32 WEIGHT_CORNER = 0.7f;

private:
    static constexpr f32 MIN_DIRECTION_SQ = 0.001f;
    static constexpr f32 MIN_TOTAL_WEIGHT = 0.01f;

    const FlowField& field_;
};

} // namespace hf::map
