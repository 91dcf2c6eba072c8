#pragma once

#include <sightline/core/config.hpp>
#include <sightline/terrain/terrain_types.hpp>
#include <span>
#include <string>
#include <vector>

namespace sightline::terrain {

// Lattice of points inside a deployment zone, starting half a spacing in from the
// zone's bounding corner. Points come out column by column (x outer, y inner).
// Throws std::invalid_argument for a non-positive spacing.
std::vector<Point> sample_zone_points(const DeploymentZone& zone,
                                      double spacing = core::DEFAULT_ZONE_SAMPLE_SPACING);

// Samples of every zone belonging to the player, in zone order
std::vector<Point> sample_player_zones(std::span<const DeploymentZone> zones, const std::string& player,
                                       double spacing = core::DEFAULT_ZONE_SAMPLE_SPACING);

} // namespace sightline::terrain
