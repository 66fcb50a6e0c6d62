#pragma once

#include "core/types.hpp"

namespace hf::map {

/// Height source used to keep agents on the ground. The flow field itself
/// is planar; anything that can answer "how high is the ground at (x, z)"
/// can drive agent Y.
class TerrainSampler {
public:
    virtual ~TerrainSampler() = default;

    /// Walkable surface height at world position (x, z).
    virtual f32 surface_height(f32 x, f32 z) const = 0;
};

} // namespace hf::map
