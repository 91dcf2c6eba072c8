#pragma once

#include <sightline/core/types.hpp>
#include <sightline/math/math.hpp>
#include <sightline/terrain/terrain_types.hpp>

namespace sightline::terrain {

/**
 * @brief Local <-> world transform of a terrain piece
 *
 * Forward: mirror -> rotate about the piece position -> translate by position.
 * Inverse applies the exact reverse. Sine and cosine are computed once so the
 * transform can be reused for every containment test of a run.
 */
class PieceTransform {
public:
    PieceTransform() = default;
    PieceTransform(const Point& position, double rotation_degrees, Mirror mirror) noexcept;
    explicit PieceTransform(const TerrainPiece& piece) noexcept;

    Point local_to_world(const Point& local) const noexcept;
    Point world_to_local(const Point& world) const noexcept;

    const Point& position() const noexcept { return position_; }
    double rotation_radians() const noexcept { return rotation_radians_; }
    Mirror mirror() const noexcept { return mirror_; }

private:
    Point position_{0.0};
    double rotation_radians_ = 0.0;
    double cos_ = 1.0;
    double sin_ = 0.0;
    Mirror mirror_ = Mirror::None;
};

Point local_to_world(const Point& local, const TerrainPiece& piece) noexcept;
Point world_to_local(const Point& world, const TerrainPiece& piece) noexcept;

// Containment of a local-space point. Boundary points are inside; walls contain nothing.
bool shape_contains_local(const Shape& shape, const Point& local) noexcept;

// Containment of a world-space point in a shape owned by the given transform
bool point_in_shape(const Point& world, const Shape& shape, const PieceTransform& transform) noexcept;
bool point_in_shape(const Point& world, const Shape& shape, const TerrainPiece& piece) noexcept;

// World-space bounds of a transformed shape (walls include half their thickness)
math::geometry::AABB world_bounds(const Shape& shape, const PieceTransform& transform) noexcept;

// Reject shapes that would produce undefined geometry
Result<void, Error> validate_shape(const Shape& shape);

// Validate id, transform and every shape of a piece
Result<void, Error> validate_piece(const TerrainPiece& piece);

} // namespace sightline::terrain
