#include <sightline/terrain/zone_sampler.hpp>
#include <sightline/terrain/shape_transform.hpp>
#include <sightline/core/log.hpp>
#include <cmath>
#include <format>
#include <stdexcept>

namespace sightline::terrain {

namespace {

// Exact extent of a zone shape; zones are never rotated or mirrored
math::geometry::AABB zone_extent(const DeploymentZone& zone) noexcept {
    math::geometry::AABB bounds = math::geometry::AABB::empty();
    if (const auto* rect = std::get_if<Rectangle>(&zone.shape)) {
        bounds.min = zone.position;
        bounds.max = zone.position + Point(rect->width, rect->height);
    } else if (const auto* poly = std::get_if<Polygon>(&zone.shape)) {
        bounds = math::geometry::bounds_of(poly->points);
        bounds.min += zone.position;
        bounds.max += zone.position;
    } else if (const auto* circle = std::get_if<Circle>(&zone.shape)) {
        bounds.min = zone.position - Point(circle->radius);
        bounds.max = zone.position + Point(circle->radius);
    }
    return bounds;
}

} // namespace

std::vector<Point> sample_zone_points(const DeploymentZone& zone, double spacing) {
    if (!std::isfinite(spacing) || spacing <= 0.0) {
        throw std::invalid_argument(std::format("Zone sample spacing must be positive, got {}", spacing));
    }

    std::vector<Point> points;
    const math::geometry::AABB bounds = zone_extent(zone);
    if (bounds.is_empty()) {
        return points;
    }

    const PieceTransform transform(zone.position, 0.0, Mirror::None);
    const Point min = bounds.min;
    const Point max = bounds.max;

    // Index-based so the lattice does not drift with accumulated additions
    for (uint32_t i = 0;; ++i) {
        double x = min.x + spacing * 0.5 + spacing * i;
        if (!(x < max.x)) {
            break;
        }
        for (uint32_t j = 0;; ++j) {
            double y = min.y + spacing * 0.5 + spacing * j;
            if (!(y < max.y)) {
                break;
            }
            Point p(x, y);
            if (point_in_shape(p, zone.shape, transform)) {
                points.push_back(p);
            }
        }
    }

    LOG_DEBUG(Terrain, "Zone '{}': {} sample points at {:.1f}\" spacing", zone.name, points.size(), spacing);
    return points;
}

std::vector<Point> sample_player_zones(std::span<const DeploymentZone> zones, const std::string& player,
                                       double spacing) {
    std::vector<Point> points;
    for (const DeploymentZone& zone : zones) {
        if (zone.player != player) {
            continue;
        }
        std::vector<Point> zone_points = sample_zone_points(zone, spacing);
        points.insert(points.end(), zone_points.begin(), zone_points.end());
    }
    return points;
}

} // namespace sightline::terrain
