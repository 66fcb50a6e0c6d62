#include "map/heightmap.hpp"

#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>

namespace hf::map {

Heightmap::Heightmap(u32 cells_x, u32 cells_z, f32 scale,
                     std::vector<i16> raw_data, Vector2 origin, f32 spacing)
    : samples_x_(std::max<u32>(cells_x, 1) + 1),
      samples_z_(std::max<u32>(cells_z, 1) + 1),
      scale_(scale),
      spacing_(spacing > 0.0f ? spacing : 1.0f),
      origin_(origin),
      data_(std::move(raw_data)) {
    const size_t expected = static_cast<size_t>(samples_x_) * samples_z_;
    if (data_.size() != expected) {
        spdlog::warn("Heightmap: expected {} samples, got {}", expected,
                     data_.size());
        data_.resize(expected, 0);
    }
}

Heightmap Heightmap::flat(u32 cells_x, u32 cells_z, f32 height,
                          Vector2 origin, f32 spacing) {
    const size_t count = static_cast<size_t>(std::max<u32>(cells_x, 1) + 1) *
                         (std::max<u32>(cells_z, 1) + 1);
    return Heightmap(cells_x, cells_z, height, std::vector<i16>(count, 1),
                     origin, spacing);
}

f32 Heightmap::get_height_at_sample(u32 gx, u32 gz) const {
    return static_cast<f32>(data_[gz * samples_x_ + gx]) * scale_;
}

f32 Heightmap::get_height(f32 x, f32 z) const {
    // Into sample space, clamped to the covered range
    f32 max_x = static_cast<f32>(samples_x_ - 1);
    f32 max_z = static_cast<f32>(samples_z_ - 1);
    f32 sx = (x - origin_.x) / spacing_;
    f32 sz = (z - origin_.y) / spacing_;
    if (std::isnan(sx)) sx = 0.0f;
    if (std::isnan(sz)) sz = 0.0f;
    sx = std::clamp(sx, 0.0f, max_x);
    sz = std::clamp(sz, 0.0f, max_z);

    u32 gx = static_cast<u32>(sx);
    u32 gz = static_cast<u32>(sz);

    // Stay one sample short of the far edge so gx+1 / gz+1 are valid
    if (gx >= samples_x_ - 1) gx = samples_x_ - 2;
    if (gz >= samples_z_ - 1) gz = samples_z_ - 2;

    f32 fx = sx - static_cast<f32>(gx);
    f32 fz = sz - static_cast<f32>(gz);

    f32 h00 = get_height_at_sample(gx, gz);
    f32 h10 = get_height_at_sample(gx + 1, gz);
    f32 h01 = get_height_at_sample(gx, gz + 1);
    f32 h11 = get_height_at_sample(gx + 1, gz + 1);

    f32 h0 = h00 + (h10 - h00) * fx;
    f32 h1 = h01 + (h11 - h01) * fx;
    return h0 + (h1 - h0) * fz;
}

} // namespace hf::map
