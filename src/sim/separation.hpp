#pragma once

#include "core/types.hpp"
#include "core/vector.hpp"
#include "sim/agent.hpp"

#include <unordered_map>
#include <vector>

namespace hf::sim {

/// Uniform XZ bucket grid rebuilt from scratch every tick.
/// With the bucket size equal to the query radius, every neighbour within
/// that radius lies in the 3x3 buckets around a point.
class SpatialHash {
public:
    explicit SpatialHash(f32 bucket_size);

    f32 bucket_size() const { return bucket_size_; }

    void clear();
    void insert(u32 index, const Vector3& pos);

    /// Number of non-empty buckets.
    size_t bucket_count() const { return buckets_.size(); }

    /// Visit every index stored in the 3x3 buckets around pos.
    template <typename F>
    void for_each_near(const Vector3& pos, F&& fn) const {
        GridCoord c = bucket_of(pos);
        for (i32 dz = -1; dz <= 1; ++dz) {
            for (i32 dx = -1; dx <= 1; ++dx) {
                auto it = buckets_.find(key(c.x + dx, c.z + dz));
                if (it == buckets_.end()) continue;
                for (u32 idx : it->second) fn(idx);
            }
        }
    }

    GridCoord bucket_of(const Vector3& pos) const;

private:
    static u64 key(i32 bx, i32 bz) {
        return (static_cast<u64>(static_cast<u32>(bx)) << 32) |
               static_cast<u64>(static_cast<u32>(bz));
    }

    f32 bucket_size_;
    f32 inv_bucket_size_;
    std::unordered_map<u64, std::vector<u32>> buckets_;
};

/// Per-position repulsion from every other position within `radius` on the
/// XZ plane, weighted linearly by closeness. Each result is either zero or a
/// horizontal vector of length `force`.
std::vector<Vector3> compute_separation(const std::vector<Vector3>& positions,
                                        f32 radius, f32 force);

/// Add separation impulses to the velocities of ambulatory agents.
/// Ragdolled and dead agents neither push nor get pushed.
void apply_separation(std::vector<Agent>& agents, f32 radius, f32 force);

} // namespace hf::sim
