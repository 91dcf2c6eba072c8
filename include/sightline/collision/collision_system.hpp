#pragma once

#include <sightline/collision/collision_body.hpp>
#include <sightline/collision/spatial_index.hpp>
#include <sightline/core/types.hpp>
#include <sightline/terrain/terrain_types.hpp>
#include <algorithm>
#include <span>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace sightline::collision {

/**
 * @brief Read-only store of world-space bodies for one analysis run
 *
 * Every blocking piece contributes its footprint (shape 0, skipped when it is
 * a Wall) and one wall body per remaining shape. Bodies are kept in a single
 * list tagged with piece and role, ordered by piece then shape index, and
 * indexed by a uniform grid over their world bounds. The system is never
 * mutated after build(), so any number of threads may query it.
 */
class CollisionSystem {
public:
    CollisionSystem() = default;

    // Throws std::invalid_argument when a blocking piece carries a malformed shape
    // or two blocking pieces share a non-empty id
    static CollisionSystem build(std::span<const terrain::TerrainPiece> pieces,
                                 double index_cell_size = 2.0);

    const std::vector<CollisionBody>& bodies() const noexcept { return bodies_; }
    std::size_t body_count() const noexcept { return bodies_.size(); }
    bool empty() const noexcept { return bodies_.empty(); }

    BodyRefs footprint_bodies() const;
    BodyRefs wall_bodies() const;
    BodyRefs bodies_for_piece(std::string_view piece_id) const;

    // Index of the piece in the build input, if it was blocking and contributed bodies
    Option<uint32_t> piece_index(std::string_view piece_id) const;

    // Any body (optionally of one role) containing the point
    bool point_intersects(const math::Vec2& point) const noexcept;
    bool point_intersects(const math::Vec2& point, BodyRole role) const noexcept;

    /**
     * @brief First body of the role containing the point whose piece is not excluded
     * @param excluded Sorted piece indices to ignore
     * @return nullptr when no body matches
     */
    const CollisionBody* first_hit(const math::Vec2& point, BodyRole role,
                                   std::span<const uint32_t> excluded = {}) const noexcept {
        for (uint32_t index : index_.candidates(point)) {
            const CollisionBody& body = bodies_[index];
            if (body.role != role) {
                continue;
            }
            if (!excluded.empty() &&
                std::binary_search(excluded.begin(), excluded.end(), body.piece_index)) {
                continue;
            }
            if (body.contains(point)) {
                return &body;
            }
        }
        return nullptr;
    }

    const UniformGridIndex& index() const noexcept { return index_; }

private:
    std::vector<CollisionBody> bodies_;
    std::unordered_map<std::string, uint32_t> piece_lookup_;
    UniformGridIndex index_;
};

} // namespace sightline::collision
