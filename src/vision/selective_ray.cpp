#include <sightline/vision/selective_ray.hpp>
#include <sightline/vision/ray_sampler.hpp>

namespace sightline::vision {

using collision::BodyRole;

RayTraceResult trace_ray(const math::Vec2& from, const math::Vec2& to,
                         const collision::CollisionSystem& system,
                         std::span<const uint32_t> excluded_pieces,
                         double step) {
    RayTraceResult result;

    RaySampler::trace(from, to, step, [&](const math::Vec2& point, uint32_t) {
        ++result.samples_tested;

        const collision::CollisionBody* hit = system.first_hit(point, BodyRole::Wall);
        if (!hit) {
            hit = system.first_hit(point, BodyRole::Footprint, excluded_pieces);
        }
        if (hit) {
            result.blocked = true;
            result.hit_point = point;
            result.blocking_body = hit;
            return false;
        }
        return true;
    });

    return result;
}

bool is_blocked(const math::Vec2& from, const math::Vec2& to,
                const collision::CollisionSystem& system,
                std::span<const uint32_t> excluded_pieces,
                double step) {
    return trace_ray(from, to, system, excluded_pieces, step).blocked;
}

} // namespace sightline::vision
