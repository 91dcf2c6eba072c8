#include <sightline/terrain/shape_transform.hpp>
#include <cmath>
#include <format>
#include <type_traits>

namespace sightline::terrain {

using math::utils::GEOMETRY_EPSILON;

const char* shape_type_name(const Shape& shape) noexcept {
    switch (shape.index()) {
        case 0: return "rectangle";
        case 1: return "polygon";
        case 2: return "circle";
        case 3: return "wall";
        default: return "unknown";
    }
}

const char* mirror_name(Mirror mirror) noexcept {
    switch (mirror) {
        case Mirror::None: return "none";
        case Mirror::Horizontal: return "horizontal";
        case Mirror::Vertical: return "vertical";
        default: return "unknown";
    }
}

namespace {

Point apply_mirror(const Point& p, Mirror mirror) noexcept {
    switch (mirror) {
        case Mirror::Horizontal: return Point(-p.x, p.y);
        case Mirror::Vertical: return Point(p.x, -p.y);
        default: return p;
    }
}

} // namespace

PieceTransform::PieceTransform(const Point& position, double rotation_degrees, Mirror mirror) noexcept
    : position_(position)
    , rotation_radians_(math::utils::degrees_to_radians(rotation_degrees))
    , cos_(std::cos(rotation_radians_))
    , sin_(std::sin(rotation_radians_))
    , mirror_(mirror) {
}

PieceTransform::PieceTransform(const TerrainPiece& piece) noexcept
    : PieceTransform(piece.position, piece.rotation_degrees, piece.mirror) {
}

Point PieceTransform::local_to_world(const Point& local) const noexcept {
    Point mirrored = apply_mirror(local, mirror_);
    return math::utils::rotate(mirrored, cos_, sin_) + position_;
}

Point PieceTransform::world_to_local(const Point& world) const noexcept {
    // Inverse rotation uses (cos, -sin); mirroring is its own inverse
    Point unrotated = math::utils::rotate(world - position_, cos_, -sin_);
    return apply_mirror(unrotated, mirror_);
}

Point local_to_world(const Point& local, const TerrainPiece& piece) noexcept {
    return PieceTransform(piece).local_to_world(local);
}

Point world_to_local(const Point& world, const TerrainPiece& piece) noexcept {
    return PieceTransform(piece).world_to_local(world);
}

bool shape_contains_local(const Shape& shape, const Point& local) noexcept {
    return std::visit([&](const auto& s) -> bool {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, Rectangle>) {
            return local.x >= -GEOMETRY_EPSILON && local.x <= s.width + GEOMETRY_EPSILON &&
                   local.y >= -GEOMETRY_EPSILON && local.y <= s.height + GEOMETRY_EPSILON;
        } else if constexpr (std::is_same_v<T, Polygon>) {
            return math::geometry::point_in_polygon(local, s.points);
        } else if constexpr (std::is_same_v<T, Circle>) {
            // Squared comparison, no square root
            return glm::length2(local) <= s.radius * s.radius + GEOMETRY_EPSILON;
        } else {
            return false;
        }
    }, shape);
}

bool point_in_shape(const Point& world, const Shape& shape, const PieceTransform& transform) noexcept {
    if (std::holds_alternative<Wall>(shape)) {
        return false;
    }
    return shape_contains_local(shape, transform.world_to_local(world));
}

bool point_in_shape(const Point& world, const Shape& shape, const TerrainPiece& piece) noexcept {
    return point_in_shape(world, shape, PieceTransform(piece));
}

math::geometry::AABB world_bounds(const Shape& shape, const PieceTransform& transform) noexcept {
    math::geometry::AABB bounds = math::geometry::AABB::empty();

    std::visit([&](const auto& s) {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, Rectangle>) {
            bounds.expand_to_include(transform.local_to_world(Point(0.0, 0.0)));
            bounds.expand_to_include(transform.local_to_world(Point(s.width, 0.0)));
            bounds.expand_to_include(transform.local_to_world(Point(s.width, s.height)));
            bounds.expand_to_include(transform.local_to_world(Point(0.0, s.height)));
        } else if constexpr (std::is_same_v<T, Polygon>) {
            for (const Point& p : s.points) {
                bounds.expand_to_include(transform.local_to_world(p));
            }
        } else if constexpr (std::is_same_v<T, Circle>) {
            Point center = transform.local_to_world(Point(0.0, 0.0));
            bounds.expand_to_include(center - Point(s.radius));
            bounds.expand_to_include(center + Point(s.radius));
        } else {
            double half = s.thickness * 0.5;
            Point a = transform.local_to_world(s.start);
            Point b = transform.local_to_world(s.end);
            bounds.expand_to_include(glm::min(a, b) - Point(half));
            bounds.expand_to_include(glm::max(a, b) + Point(half));
        }
    }, shape);

    // Pad so boundary-inclusive containment never gets rejected by the bounds check
    bounds.min -= Point(GEOMETRY_EPSILON);
    bounds.max += Point(GEOMETRY_EPSILON);
    return bounds;
}

Result<void, Error> validate_shape(const Shape& shape) {
    auto invalid = [](std::string message) {
        return std::unexpected(Error(ErrorCode::InvalidShape, std::move(message)));
    };
    auto positive = [](double v) { return std::isfinite(v) && v > 0.0; };

    if (const auto* rect = std::get_if<Rectangle>(&shape)) {
        if (!positive(rect->width) || !positive(rect->height)) {
            return invalid(std::format("Rectangle size must be positive, got {}x{}", rect->width, rect->height));
        }
    } else if (const auto* poly = std::get_if<Polygon>(&shape)) {
        if (poly->points.size() < 3) {
            return invalid(std::format("Polygon needs at least 3 points, got {}", poly->points.size()));
        }
        for (const Point& p : poly->points) {
            if (!math::utils::is_finite(p)) {
                return invalid("Polygon has a non-finite vertex");
            }
        }
    } else if (const auto* circle = std::get_if<Circle>(&shape)) {
        if (!positive(circle->radius)) {
            return invalid(std::format("Circle radius must be positive, got {}", circle->radius));
        }
    } else if (const auto* wall = std::get_if<Wall>(&shape)) {
        if (!math::utils::is_finite(wall->start) || !math::utils::is_finite(wall->end)) {
            return invalid("Wall has a non-finite endpoint");
        }
        if (!std::isfinite(wall->thickness) || wall->thickness < 0.0) {
            return invalid(std::format("Wall thickness must be non-negative, got {}", wall->thickness));
        }
    }

    return {};
}

Result<void, Error> validate_piece(const TerrainPiece& piece) {
    if (piece.id.empty()) {
        return std::unexpected(Error(ErrorCode::InvalidLayout, "Terrain piece has an empty id"));
    }
    if (!math::utils::is_finite(piece.position) || !std::isfinite(piece.rotation_degrees)) {
        return std::unexpected(Error(ErrorCode::InvalidLayout,
                                     std::format("Piece '{}' has a non-finite transform", piece.id)));
    }

    for (std::size_t i = 0; i < piece.shapes.size(); ++i) {
        if (auto valid = validate_shape(piece.shapes[i]); !valid) {
            return std::unexpected(Error(valid.error().code,
                std::format("Piece '{}' shape {}: {}", piece.id, i, valid.error().message)));
        }
    }

    return {};
}

} // namespace sightline::terrain
