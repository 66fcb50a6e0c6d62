#pragma once

#include "core/types.hpp"
#include "core/vector.hpp"
#include "map/terrain_sampler.hpp"

#include <vector>

namespace hf::map {

/// Regular grid of height samples with bilinear queries.
/// Sample (gx, gz) sits at world (origin.x + gx * spacing, origin.y + gz *
/// spacing); there are (cells_x + 1) x (cells_z + 1) samples.
class Heightmap : public TerrainSampler {
public:
    /// raw_data: row-major [gz * (cells_x + 1) + gx], scaled by `scale`.
    /// A size mismatch is padded with zeros / truncated (logged).
    Heightmap(u32 cells_x, u32 cells_z, f32 scale, std::vector<i16> raw_data,
              Vector2 origin = {}, f32 spacing = 1.0f);

    /// A perfectly flat heightmap at the given height.
    static Heightmap flat(u32 cells_x, u32 cells_z, f32 height,
                          Vector2 origin = {}, f32 spacing = 1.0f);

    /// Bilinear height at world (x, z); clamped to the covered area.
    f32 get_height(f32 x, f32 z) const;

    /// Raw height at a sample (no interpolation, no bounds check).
    f32 get_height_at_sample(u32 gx, u32 gz) const;

    f32 surface_height(f32 x, f32 z) const override { return get_height(x, z); }

    u32 samples_x() const { return samples_x_; }
    u32 samples_z() const { return samples_z_; }
    f32 spacing() const { return spacing_; }
    const Vector2& origin() const { return origin_; }

private:
    u32 samples_x_;
    u32 samples_z_;
    f32 scale_;
    f32 spacing_;
    Vector2 origin_;
    std::vector<i16> data_;
};

} // namespace hf::map
