#include <sightline/math/math.hpp>

#include <cmath>
#include <limits>
#include <algorithm>

namespace sightline::math {

namespace utils {

Vec2 rotate(const Vec2& v, double radians) noexcept {
    return rotate(v, std::cos(radians), std::sin(radians));
}

bool approximately_equal(double a, double b, double epsilon) noexcept {
    return std::abs(a - b) <= epsilon;
}

bool approximately_equal(const Vec2& a, const Vec2& b, double epsilon) noexcept {
    return approximately_equal(a.x, b.x, epsilon) && approximately_equal(a.y, b.y, epsilon);
}

bool is_finite(const Vec2& v) noexcept {
    return std::isfinite(v.x) && std::isfinite(v.y);
}

} // namespace utils

namespace geometry {

AABB AABB::empty() noexcept {
    constexpr double inf = std::numeric_limits<double>::infinity();
    return AABB{Vec2(inf), Vec2(-inf)};
}

bool AABB::contains(const Vec2& point) const noexcept {
    return point.x >= min.x && point.x <= max.x &&
           point.y >= min.y && point.y <= max.y;
}

bool AABB::intersects(const AABB& other) const noexcept {
    return min.x <= other.max.x && max.x >= other.min.x &&
           min.y <= other.max.y && max.y >= other.min.y;
}

void AABB::expand_to_include(const Vec2& point) noexcept {
    min = glm::min(min, point);
    max = glm::max(max, point);
}

void AABB::expand_to_include(const AABB& other) noexcept {
    if (other.is_empty()) {
        return;
    }
    min = glm::min(min, other.min);
    max = glm::max(max, other.max);
}

bool point_on_segment(const Vec2& point, const Vec2& a, const Vec2& b, double epsilon) noexcept {
    Vec2 ab = b - a;
    double length_sq = glm::length2(ab);
    if (length_sq <= epsilon * epsilon) {
        return glm::length2(point - a) <= epsilon * epsilon;
    }

    double t = std::clamp(glm::dot(point - a, ab) / length_sq, 0.0, 1.0);
    Vec2 closest = a + ab * t;
    return glm::length2(point - closest) <= epsilon * epsilon;
}

bool point_in_polygon(const Vec2& point, std::span<const Vec2> vertices) noexcept {
    const std::size_t count = vertices.size();
    if (count < 3) {
        return false;
    }

    bool inside = false;
    for (std::size_t i = 0, j = count - 1; i < count; j = i++) {
        const Vec2& vi = vertices[i];
        const Vec2& vj = vertices[j];

        if (point_on_segment(point, vj, vi)) {
            return true;
        }

        // Edge straddles the horizontal line through the point and lies to its right
        if ((vi.y > point.y) != (vj.y > point.y) &&
            point.x < (vj.x - vi.x) * (point.y - vi.y) / (vj.y - vi.y) + vi.x) {
            inside = !inside;
        }
    }

    return inside;
}

AABB bounds_of(std::span<const Vec2> vertices) noexcept {
    AABB bounds = AABB::empty();
    for (const Vec2& v : vertices) {
        bounds.expand_to_include(v);
    }
    return bounds;
}

} // namespace geometry

} // namespace sightline::math
