#include "sim/separation.hpp"

#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>

namespace hf::sim {

namespace {

constexpr f32 MIN_DIST_SQ = 0.001f;   // coincident agents push nothing
constexpr f32 MIN_IMPULSE_SQ = 0.01f;

i32 bucket_coord(f32 v) {
    constexpr f32 LIMIT = static_cast<f32>(1 << 30);
    if (std::isnan(v)) return 0;
    return static_cast<i32>(std::clamp(std::floor(v), -LIMIT, LIMIT));
}

} // namespace

SpatialHash::SpatialHash(f32 bucket_size)
    : bucket_size_(bucket_size > 0.0f ? bucket_size : 1.0f),
      inv_bucket_size_(1.0f / bucket_size_) {}

void SpatialHash::clear() {
    buckets_.clear();
}

GridCoord SpatialHash::bucket_of(const Vector3& pos) const {
    return {bucket_coord(pos.x * inv_bucket_size_),
            bucket_coord(pos.z * inv_bucket_size_)};
}

void SpatialHash::insert(u32 index, const Vector3& pos) {
    GridCoord c = bucket_of(pos);
    buckets_[key(c.x, c.z)].push_back(index);
}

std::vector<Vector3> compute_separation(const std::vector<Vector3>& positions,
                                        f32 radius, f32 force) {
    std::vector<Vector3> forces(positions.size());
    if (positions.size() < 2) return forces;
    if (!(radius > 0.0f)) {
        spdlog::warn("compute_separation: non-positive radius {}", radius);
        return forces;
    }

    SpatialHash hash(radius);
    for (u32 i = 0; i < positions.size(); ++i) {
        hash.insert(i, positions[i]);
    }

    const f32 radius_sq = radius * radius;

    for (u32 i = 0; i < positions.size(); ++i) {
        const Vector3& pos = positions[i];
        Vector3 push;
        u32 count = 0;

        hash.for_each_near(pos, [&](u32 other) {
            if (other == i) return;
            f32 dx = pos.x - positions[other].x;
            f32 dz = pos.z - positions[other].z;
            f32 dist_sq = dx * dx + dz * dz;
            if (dist_sq >= radius_sq || dist_sq <= MIN_DIST_SQ) return;

            f32 dist = std::sqrt(dist_sq);
            f32 strength = std::max(0.0f, 1.0f - dist / radius);
            push += Vector3{dx / dist, 0.0f, dz / dist} * strength;
            ++count;
        });

        if (count > 0) {
            forces[i] = push.normalized_or_zero() * force;
        }
    }

    return forces;
}

void apply_separation(std::vector<Agent>& agents, f32 radius, f32 force) {
    std::vector<u32> members;
    std::vector<Vector3> positions;
    members.reserve(agents.size());
    positions.reserve(agents.size());

    for (u32 i = 0; i < agents.size(); ++i) {
        if (!agents[i].ambulatory()) continue;
        members.push_back(i);
        positions.push_back(agents[i].position);
    }

    auto forces = compute_separation(positions, radius, force);
    for (size_t k = 0; k < members.size(); ++k) {
        if (forces[k].length_squared() > MIN_IMPULSE_SQ) {
            agents[members[k]].velocity += forces[k];
        }
    }
}

} // namespace hf::sim
