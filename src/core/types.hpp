#pragma once

#include <cstdint>
#include <filesystem>
#include <limits>

namespace hf {

namespace fs = std::filesystem;

using u8 = uint8_t;
using u16 = uint16_t;
using u32 = uint32_t;
using u64 = uint64_t;
using i16 = int16_t;
using i32 = int32_t;
using i64 = int64_t;
using f32 = float;
using f64 = double;

/// Integer cell coordinate on a planar grid (x along world X, z along world Z).
struct GridCoord {
    i32 x = 0;
    i32 z = 0;

    bool operator==(const GridCoord& o) const { return x == o.x && z == o.z; }
    bool operator!=(const GridCoord& o) const { return !(*this == o); }
};

} // namespace hf
