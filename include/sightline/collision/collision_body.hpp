#pragma once

#include <sightline/math/math.hpp>
#include <sightline/terrain/terrain_types.hpp>
#include <span>
#include <string>
#include <variant>
#include <vector>
#include <cstdint>

namespace sightline::collision {

// Footprints can be seen across by a model standing on them; walls always block
enum class BodyRole : uint8_t {
    Footprint,
    Wall
};

// Box of half extents rotated by angle about its center
struct OrientedBox {
    math::Vec2 center{0.0};
    math::Vec2 half_extents{0.0};
    double angle_radians = 0.0;
    double cos_angle = 1.0;
    double sin_angle = 0.0;

    bool contains(const math::Vec2& point) const noexcept;
};

// Polygon in absolute board coordinates
struct WorldPolygon {
    std::vector<math::Vec2> points;

    bool contains(const math::Vec2& point) const noexcept;
};

struct WorldCircle {
    math::Vec2 center{0.0};
    double radius = 0.0;

    bool contains(const math::Vec2& point) const noexcept;
};

using BodyGeometry = std::variant<OrientedBox, WorldPolygon, WorldCircle>;

// World-space body derived from one shape of one blocking piece
struct CollisionBody {
    BodyGeometry geometry;
    math::geometry::AABB bounds;
    uint32_t piece_index = 0;       // Index into the piece list the system was built from
    std::string piece_id;
    uint32_t shape_index = 0;       // 0 for footprints
    BodyRole role = BodyRole::Footprint;

    bool is_footprint() const noexcept { return role == BodyRole::Footprint; }

    // Boundary points count as intersecting
    bool contains(const math::Vec2& point) const noexcept;
};

using BodyRefs = std::vector<const CollisionBody*>;

OrientedBox make_oriented_box(const math::Vec2& center, const math::Vec2& half_extents,
                              double angle_radians) noexcept;

// Build the world-space body for piece.shapes[shape_index].
// Throws std::invalid_argument for malformed shapes (for example a polygon with fewer than 3 points).
CollisionBody make_body(const terrain::TerrainPiece& piece, uint32_t piece_index,
                        uint32_t shape_index, BodyRole role);

// Linear scan of a body set
bool point_intersects(std::span<const CollisionBody> bodies, const math::Vec2& point) noexcept;
bool point_intersects(std::span<const CollisionBody* const> bodies, const math::Vec2& point) noexcept;

const char* role_name(BodyRole role) noexcept;

} // namespace sightline::collision
