#pragma once

#include <sightline/math/math.hpp>
#include <sightline/terrain/terrain_types.hpp>
#include <sightline/terrain/shape_transform.hpp>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>
#include <cstdint>

namespace sightline::terrain {

// Indices into the piece list an analysis was built from, ascending and unique
using PieceIndexSet = std::vector<uint32_t>;

// Ids of blocking pieces whose footprint (shape 0) contains the point, in input order.
// Non-blocking pieces and wall footprints never match.
std::vector<std::string> occupied_by(const Point& point, std::span<const TerrainPiece> pieces);

// Union of two sorted index sets into out (out is cleared first)
void merge_piece_sets(const PieceIndexSet& a, const PieceIndexSet& b, PieceIndexSet& out);

/**
 * @brief Footprint containment over a fixed piece list
 *
 * Footprints are copied with their precomputed transforms and world bounds,
 * so the detector does not reference the input after construction and is
 * safe to query from several threads.
 */
class TerrainOccupancyDetector {
public:
    explicit TerrainOccupancyDetector(std::span<const TerrainPiece> pieces);

    PieceIndexSet occupancy(const Point& point) const;
    std::vector<std::string> occupied_ids(const Point& point) const;

    std::size_t footprint_count() const noexcept { return footprints_.size(); }

private:
    struct Footprint {
        uint32_t piece_index;
        std::string piece_id;
        Shape shape;
        PieceTransform transform;
        math::geometry::AABB bounds;
    };

    std::vector<Footprint> footprints_;
};

/**
 * @brief Memoizes occupancy per distinct coordinate for the duration of one run
 *
 * Not thread-safe; fill it before sharing results read-only.
 */
class OccupancyCache {
public:
    explicit OccupancyCache(const TerrainOccupancyDetector& detector) : detector_(detector) {}

    const PieceIndexSet& get(const Point& point);

    std::size_t size() const noexcept { return entries_.size(); }
    uint64_t hits() const noexcept { return hits_; }
    uint64_t misses() const noexcept { return misses_; }

private:
    struct KeyHash {
        std::size_t operator()(const Point& p) const noexcept {
            // Adding +0.0 folds -0.0 into 0.0 so equal keys hash equally
            std::size_t h1 = std::hash<double>{}(p.x + 0.0);
            std::size_t h2 = std::hash<double>{}(p.y + 0.0);
            return h1 ^ (h2 << 1);
        }
    };

    const TerrainOccupancyDetector& detector_;
    std::unordered_map<Point, PieceIndexSet, KeyHash> entries_;
    uint64_t hits_ = 0;
    uint64_t misses_ = 0;
};

} // namespace sightline::terrain
