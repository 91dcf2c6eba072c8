#pragma once

#include <sightline/collision/collision_system.hpp>
#include <sightline/core/config.hpp>
#include <sightline/math/math.hpp>
#include <span>
#include <cstdint>

namespace sightline::vision {

// Outcome of one selective line-of-sight trace
struct RayTraceResult {
    bool blocked = false;
    math::Vec2 hit_point{0.0};                                  // First blocking sample
    const collision::CollisionBody* blocking_body = nullptr;    // Points into the collision system
    uint32_t samples_tested = 0;
};

/**
 * @brief Trace a ray against walls and non-excluded footprints
 *
 * At each sample walls are tested first and always block. Footprints block
 * unless their piece appears in excluded_pieces, which must be sorted
 * (normally the union of source and target occupancy).
 * Throws std::invalid_argument for non-finite endpoints or a non-positive step.
 */
RayTraceResult trace_ray(const math::Vec2& from, const math::Vec2& to,
                         const collision::CollisionSystem& system,
                         std::span<const uint32_t> excluded_pieces,
                         double step = core::DEFAULT_RAY_SAMPLE_STEP);

// Same decision as trace_ray without the diagnostics
bool is_blocked(const math::Vec2& from, const math::Vec2& to,
                const collision::CollisionSystem& system,
                std::span<const uint32_t> excluded_pieces,
                double step = core::DEFAULT_RAY_SAMPLE_STEP);

} // namespace sightline::vision
