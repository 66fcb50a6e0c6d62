#include "sim/horde_ai.hpp"
#include "map/terrain_sampler.hpp"

#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>

namespace hf::sim {

namespace {

constexpr f32 MIN_SPEED = 0.01f;
constexpr f32 MIN_DIR_SQ = 0.01f;

} // namespace

HordeAI::HordeAI(const config::HordeConfig& config)
    : config_(config),
      field_(config.flow_field.width, config.flow_field.height,
             config.flow_field.cell_size, config.flow_field.origin),
      sampler_(field_),
      tracker_(config.update_interval) {}

void HordeAI::update_target(const Vector3& target) {
    tracker_.set_target(target);
}

HordeTickStats HordeAI::update(std::vector<Agent>& agents, f32 dt,
                               const map::TerrainSampler* terrain) {
    HordeTickStats stats;
    stats.solved = tracker_.update(field_, dt);

    const Vector3& target = tracker_.target();

    for (auto& agent : agents) {
        if (agent.ragdoll) continue;

        Vector3 to_target = target - agent.position;
        f32 distance = to_target.length();

        agent.ai.state = next_ai_state(agent.ai.state, distance,
                                       agent.ai.aggro_range,
                                       agent.ai.attack_range);
        if (agent.ai.state == AIState::Attacking) {
            agent.ai.update_cooldown(dt);
        }

        steer(agent, to_target, dt);
        stats.state_counts[static_cast<size_t>(agent.ai.state)]++;

        if (is_moving(agent.ai.state)) {
            ++stats.moved;
            if (terrain) {
                agent.position.y = terrain->surface_height(agent.position.x,
                                                           agent.position.z);
            }
        }
    }

    return stats;
}

void HordeAI::steer(Agent& agent, const Vector3& to_target, f32 dt) const {
    const auto& mv = config_.movement;

    switch (agent.ai.state) {
    case AIState::Chasing: {
        Vector2 flow = sampler_.sample_smooth(agent.position);
        Vector3 direct = to_target.flat().normalized_or_zero();

        // An empty cell (unreached or off-field) falls back to pursuit
        Vector3 flow_3d = flow.length_squared() > MIN_DIR_SQ
                              ? Vector3{flow.x, 0.0f, flow.y}
                              : direct;

        Vector3 move_dir = (flow_3d * (1.0f - mv.direct_pursuit_blend) +
                            direct * mv.direct_pursuit_blend)
                               .normalized_or_zero();
        Vector3 target_vel = move_dir * agent.max_speed;

        if (agent.velocity.length() > MIN_SPEED) {
            Vector3 smoothed = agent.velocity * (1.0f - mv.velocity_smoothing) +
                               target_vel * mv.velocity_smoothing;
            agent.velocity = smoothed.normalized_or_zero() * agent.max_speed;
        } else {
            agent.velocity = target_vel;
        }

        agent.position += agent.velocity * dt;
        face(agent, agent.velocity);
        break;
    }
    case AIState::Attacking:
        // Hold position and turn toward the target
        agent.velocity = {};
        face(agent, to_target.flat());
        break;
    case AIState::Idle:
        agent.velocity *= mv.idle_damping;
        break;
    case AIState::Fleeing: {
        Vector3 flee_dir = (-to_target).flat().normalized_or_zero();
        agent.velocity = flee_dir * agent.max_speed * mv.flee_speed_multiplier;
        agent.position += agent.velocity * dt;
        face(agent, agent.velocity);
        break;
    }
    case AIState::Dead:
        agent.velocity = {};
        break;
    }
}

void HordeAI::face(Agent& agent, const Vector3& dir) {
    Vector3 flat = dir.flat();
    if (flat.length_squared() <= MIN_DIR_SQ) return;
    agent.yaw = std::atan2(flat.x, flat.z);
}

void HordeAI::add_obstacle(const Vector3& position, f32 radius) {
    GridCoord center = field_.world_to_grid(position);

    const i64 w = static_cast<i64>(field_.width());
    const i64 h = static_cast<i64>(field_.height());
    i64 grid_radius = 0;
    if (radius > 0.0f && std::isfinite(radius)) {
        f32 cells = std::ceil(radius / field_.cell_size());
        grid_radius = static_cast<i64>(
            std::min(cells, static_cast<f32>(std::max(w, h))));
    }

    // Footprint clipped to the grid; cells outside are ignored
    i64 x0 = std::max<i64>(center.x - grid_radius, 0);
    i64 x1 = std::min<i64>(center.x + grid_radius, w - 1);
    i64 z0 = std::max<i64>(center.z - grid_radius, 0);
    i64 z1 = std::min<i64>(center.z + grid_radius, h - 1);

    u32 blocked = 0;
    for (i64 z = z0; z <= z1; ++z) {
        for (i64 x = x0; x <= x1; ++x) {
            field_.set_blocked(static_cast<i32>(x), static_cast<i32>(z));
            ++blocked;
        }
    }

    spdlog::debug("HordeAI: obstacle at ({:.1f}, {:.1f}) r={} blocked {} cells",
                  position.x, position.z, radius, blocked);
}

void HordeAI::clear_obstacles() {
    field_.clear();
    spdlog::debug("HordeAI: obstacles cleared");
}

} // namespace hf::sim
