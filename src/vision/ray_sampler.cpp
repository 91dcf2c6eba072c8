#include <sightline/vision/ray_sampler.hpp>
#include <format>
#include <limits>
#include <stdexcept>

namespace sightline::vision {

uint32_t RaySampler::sample_count(const math::Vec2& from, const math::Vec2& to, double step) {
    if (!std::isfinite(step) || step <= 0.0) {
        throw std::invalid_argument(std::format("Ray step must be positive, got {}", step));
    }
    if (!math::utils::is_finite(from) || !math::utils::is_finite(to)) {
        throw std::invalid_argument(std::format("Ray endpoints must be finite, got ({}, {}) -> ({}, {})",
                                                from.x, from.y, to.x, to.y));
    }

    double distance = glm::length(to - from);
    if (distance < step) {
        return 2;
    }

    // The sample index is a uint32_t, so the segment count must leave room for the endpoint
    const double segments = std::ceil(distance / step);
    if (segments > static_cast<double>(std::numeric_limits<uint32_t>::max() - 1)) {
        throw std::invalid_argument(std::format("Ray of length {} needs too many samples at step {}",
                                                distance, step));
    }
    return static_cast<uint32_t>(segments) + 1;
}

std::vector<math::Vec2> RaySampler::sample_points(const math::Vec2& from, const math::Vec2& to, double step) {
    std::vector<math::Vec2> points;
    points.reserve(sample_count(from, to, step));
    trace(from, to, step, [&](const math::Vec2& point, uint32_t) {
        points.push_back(point);
        return true;
    });
    return points;
}

} // namespace sightline::vision
