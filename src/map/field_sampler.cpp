#include "map/field_sampler.hpp"
#include "map/flow_field.hpp"

#include <algorithm>
#include <cmath>

namespace hf::map {

FieldSampler::FieldSampler(const FlowField& field) : field_(field) {}

Vector2 FieldSampler::sample(const Vector3& world_pos) const {
    GridCoord cell = field_.world_to_grid(world_pos);
    if (!field_.in_bounds(cell.x, cell.z)) {
        // Strays outside the field still head back toward the action
        return (field_.center() - world_pos.xz()).normalized_or_zero();
    }
    return field_.direction(cell.x, cell.z);
}

Vector2 FieldSampler::sample_smooth(const Vector3& world_pos) const {
    const f32 cs = field_.cell_size();
    const Vector2& origin = field_.origin();

    // Grid space shifted by half a cell so (x0,z0) is the nearest cell centre
    // at or below the query point.
    f32 gx = (world_pos.x - origin.x) / cs - 0.5f;
    f32 gz = (world_pos.z - origin.y) / cs - 0.5f;
    if (!std::isfinite(gx) || !std::isfinite(gz)) return {};

    constexpr f32 LIMIT = static_cast<f32>(1 << 30);
    f32 flx = std::clamp(std::floor(gx), -LIMIT, LIMIT);
    f32 flz = std::clamp(std::floor(gz), -LIMIT, LIMIT);
    i32 x0 = static_cast<i32>(flx);
    i32 z0 = static_cast<i32>(flz);
    f32 fx = gx - flx;
    f32 fz = gz - flz;

    Vector2 acc;
    f32 total_w = 0.0f;

    for (i32 dz = -1; dz <= 1; ++dz) {
        for (i32 dx = -1; dx <= 1; ++dx) {
            Vector2 d = field_.direction(x0 + dx, z0 + dz);
            if (d.length_squared() <= MIN_DIRECTION_SQ) continue;

            f32 w;
            if (dx == 0 && dz == 0)
                w = WEIGHT_CENTER;
            else if (dx == 0 || dz == 0)
                w = WEIGHT_EDGE;
            else
                w = WEIGHT_CORNER;

            acc += d * w;
            total_w += w;
        }
    }

    if (total_w > MIN_TOTAL_WEIGHT) {
        return (acc * (1.0f / total_w)).normalized_or_zero();
    }

    Vector2 d00 = field_.direction(x0, z0);
    Vector2 d10 = field_.direction(x0 + 1, z0);
    Vector2 d01 = field_.direction(x0, z0 + 1);
    Vector2 d11 = field_.direction(x0 + 1, z0 + 1);
    Vector2 d0 = d00 * (1.0f - fx) + d10 * fx;
    Vector2 d1 = d01 * (1.0f - fx) + d11 * fx;
    return (d0 * (1.0f - fz) + d1 * fz).normalized_or_zero();
}

} // namespace hf::map
