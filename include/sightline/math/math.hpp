#pragma once

#include <glm/glm.hpp>
#include <glm/gtx/norm.hpp>
#include <cstdint>
#include <span>

namespace sightline::math {

// Board coordinates in inches, origin top-left, x right, y down.
// Double precision keeps boundary tests reproducible across runs.
using Vec2 = glm::dvec2;

// Utility functions
namespace utils {
    constexpr double PI = 3.14159265358979323846;
    constexpr double DEG_TO_RAD = PI / 180.0;

    // Tolerance for boundary-inclusive containment tests
    constexpr double GEOMETRY_EPSILON = 1e-9;

    constexpr double degrees_to_radians(double degrees) noexcept { return degrees * DEG_TO_RAD; }

    // Rotate a vector counter-clockwise in a y-down frame (clockwise on screen)
    Vec2 rotate(const Vec2& v, double radians) noexcept;

    // Rotation with precomputed sine/cosine for hot loops
    inline Vec2 rotate(const Vec2& v, double cos_a, double sin_a) noexcept {
        return Vec2(v.x * cos_a - v.y * sin_a, v.x * sin_a + v.y * cos_a);
    }

    bool approximately_equal(double a, double b, double epsilon = 1e-9) noexcept;
    bool approximately_equal(const Vec2& a, const Vec2& b, double epsilon = 1e-9) noexcept;

    bool is_finite(const Vec2& v) noexcept;
}

// Geometric primitives for containment and indexing
namespace geometry {
    struct AABB {
        Vec2 min{0.0};
        Vec2 max{0.0};

        static AABB empty() noexcept;

        Vec2 get_size() const noexcept { return max - min; }
        bool is_empty() const noexcept { return min.x > max.x || min.y > max.y; }

        bool contains(const Vec2& point) const noexcept;
        bool intersects(const AABB& other) const noexcept;
        void expand_to_include(const Vec2& point) noexcept;
        void expand_to_include(const AABB& other) noexcept;
    };

    // Distance-based test, true when point lies on segment [a, b] within epsilon
    bool point_on_segment(const Vec2& point, const Vec2& a, const Vec2& b,
                          double epsilon = utils::GEOMETRY_EPSILON) noexcept;

    // Even-odd ray casting along +x. Points on an edge count as inside.
    bool point_in_polygon(const Vec2& point, std::span<const Vec2> vertices) noexcept;

    // Bounding box of a vertex list
    AABB bounds_of(std::span<const Vec2> vertices) noexcept;
}

} // namespace sightline::math
