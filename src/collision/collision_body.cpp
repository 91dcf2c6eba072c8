#include <sightline/collision/collision_body.hpp>
#include <sightline/terrain/shape_transform.hpp>
#include <cmath>
#include <format>
#include <stdexcept>
#include <type_traits>

namespace sightline::collision {

using math::Vec2;
using math::utils::GEOMETRY_EPSILON;

bool OrientedBox::contains(const Vec2& point) const noexcept {
    // Move the point into the box frame with the inverse rotation
    Vec2 local = math::utils::rotate(point - center, cos_angle, -sin_angle);
    return std::abs(local.x) <= half_extents.x + GEOMETRY_EPSILON &&
           std::abs(local.y) <= half_extents.y + GEOMETRY_EPSILON;
}

bool WorldPolygon::contains(const Vec2& point) const noexcept {
    return math::geometry::point_in_polygon(point, points);
}

bool WorldCircle::contains(const Vec2& point) const noexcept {
    return glm::length2(point - center) <= radius * radius + GEOMETRY_EPSILON;
}

bool CollisionBody::contains(const Vec2& point) const noexcept {
    if (!bounds.contains(point)) {
        return false;
    }
    return std::visit([&](const auto& g) { return g.contains(point); }, geometry);
}

OrientedBox make_oriented_box(const Vec2& center, const Vec2& half_extents, double angle_radians) noexcept {
    OrientedBox box;
    box.center = center;
    box.half_extents = half_extents;
    box.angle_radians = angle_radians;
    box.cos_angle = std::cos(angle_radians);
    box.sin_angle = std::sin(angle_radians);
    return box;
}

CollisionBody make_body(const terrain::TerrainPiece& piece, uint32_t piece_index,
                        uint32_t shape_index, BodyRole role) {
    if (shape_index >= piece.shapes.size()) {
        throw std::out_of_range(std::format("Piece '{}' has no shape {}", piece.id, shape_index));
    }

    const terrain::Shape& shape = piece.shapes[shape_index];
    if (auto valid = terrain::validate_shape(shape); !valid) {
        throw std::invalid_argument(std::format("Piece '{}' shape {}: {}",
                                                piece.id, shape_index, valid.error().message));
    }

    const terrain::PieceTransform transform(piece);

    CollisionBody body;
    body.piece_index = piece_index;
    body.piece_id = piece.id;
    body.shape_index = shape_index;
    body.role = role;
    body.bounds = terrain::world_bounds(shape, transform);

    body.geometry = std::visit([&](const auto& s) -> BodyGeometry {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, terrain::Rectangle>) {
            // Position is the reference corner, so the box center is the transformed local center
            Vec2 half(s.width * 0.5, s.height * 0.5);
            return make_oriented_box(transform.local_to_world(half), half, transform.rotation_radians());
        } else if constexpr (std::is_same_v<T, terrain::Polygon>) {
            WorldPolygon polygon;
            polygon.points.reserve(s.points.size());
            for (const Vec2& p : s.points) {
                polygon.points.push_back(transform.local_to_world(p));
            }
            return polygon;
        } else if constexpr (std::is_same_v<T, terrain::Circle>) {
            return WorldCircle{transform.local_to_world(Vec2(0.0)), s.radius};
        } else {
            // Endpoints go through the full transform so mirroring flips the segment angle too
            Vec2 a = transform.local_to_world(s.start);
            Vec2 b = transform.local_to_world(s.end);
            Vec2 delta = b - a;
            double length = glm::length(delta);
            double angle = length > GEOMETRY_EPSILON ? std::atan2(delta.y, delta.x)
                                                     : transform.rotation_radians();
            return make_oriented_box((a + b) * 0.5, Vec2(length * 0.5, s.thickness * 0.5), angle);
        }
    }, shape);

    return body;
}

bool point_intersects(std::span<const CollisionBody> bodies, const Vec2& point) noexcept {
    for (const CollisionBody& body : bodies) {
        if (body.contains(point)) {
            return true;
        }
    }
    return false;
}

bool point_intersects(std::span<const CollisionBody* const> bodies, const Vec2& point) noexcept {
    for (const CollisionBody* body : bodies) {
        if (body->contains(point)) {
            return true;
        }
    }
    return false;
}

const char* role_name(BodyRole role) noexcept {
    switch (role) {
        case BodyRole::Footprint: return "footprint";
        case BodyRole::Wall: return "wall";
        default: return "unknown";
    }
}

} // namespace sightline::collision
