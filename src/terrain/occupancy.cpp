#include <sightline/terrain/occupancy.hpp>
#include <sightline/core/log.hpp>
#include <algorithm>
#include <iterator>

namespace sightline::terrain {

std::vector<std::string> occupied_by(const Point& point, std::span<const TerrainPiece> pieces) {
    std::vector<std::string> occupied;

    for (const TerrainPiece& piece : pieces) {
        if (!piece.blocking || !piece.has_footprint()) {
            continue;
        }
        if (point_in_shape(point, piece.shapes.front(), piece)) {
            occupied.push_back(piece.id);
        }
    }

    return occupied;
}

void merge_piece_sets(const PieceIndexSet& a, const PieceIndexSet& b, PieceIndexSet& out) {
    out.clear();
    std::set_union(a.begin(), a.end(), b.begin(), b.end(), std::back_inserter(out));
}

TerrainOccupancyDetector::TerrainOccupancyDetector(std::span<const TerrainPiece> pieces) {
    for (std::size_t i = 0; i < pieces.size(); ++i) {
        const TerrainPiece& piece = pieces[i];
        if (!piece.blocking || !piece.has_footprint()) {
            continue;
        }

        PieceTransform transform(piece);
        const Shape& shape = piece.shapes.front();
        footprints_.push_back(Footprint{
            static_cast<uint32_t>(i),
            piece.id,
            shape,
            transform,
            world_bounds(shape, transform)
        });
    }

    LOG_DEBUG(Terrain, "Occupancy detector: {} footprints from {} pieces", footprints_.size(), pieces.size());
}

PieceIndexSet TerrainOccupancyDetector::occupancy(const Point& point) const {
    PieceIndexSet result;

    // Footprints are stored in piece order, so the result is already sorted
    for (const Footprint& footprint : footprints_) {
        if (!footprint.bounds.contains(point)) {
            continue;
        }
        if (shape_contains_local(footprint.shape, footprint.transform.world_to_local(point))) {
            result.push_back(footprint.piece_index);
        }
    }

    return result;
}

std::vector<std::string> TerrainOccupancyDetector::occupied_ids(const Point& point) const {
    std::vector<std::string> ids;
    for (const Footprint& footprint : footprints_) {
        if (footprint.bounds.contains(point) &&
            shape_contains_local(footprint.shape, footprint.transform.world_to_local(point))) {
            ids.push_back(footprint.piece_id);
        }
    }
    return ids;
}

const PieceIndexSet& OccupancyCache::get(const Point& point) {
    auto it = entries_.find(point);
    if (it != entries_.end()) {
        ++hits_;
        return it->second;
    }

    ++misses_;
    auto [inserted, _] = entries_.emplace(point, detector_.occupancy(point));
    return inserted->second;
}

} // namespace sightline::terrain
