#include <sightline/collision/collision_system.hpp>
#include <sightline/core/log.hpp>
#include <sightline/terrain/shape_transform.hpp>
#include <format>
#include <stdexcept>

namespace sightline::collision {

CollisionSystem CollisionSystem::build(std::span<const terrain::TerrainPiece> pieces, double index_cell_size) {
    LOG_SCOPE_TIMER_CAT("CollisionSystem::build", Collision);

    CollisionSystem system;
    std::size_t footprints = 0;
    std::size_t walls = 0;

    for (std::size_t i = 0; i < pieces.size(); ++i) {
        const terrain::TerrainPiece& piece = pieces[i];
        if (!piece.blocking || piece.shapes.empty()) {
            continue;
        }

        if (auto valid = terrain::validate_piece(piece); !valid) {
            LOG_ERROR(Collision, "Rejecting terrain: {}", valid.error().message);
            throw std::invalid_argument(valid.error().message);
        }

        const auto piece_index = static_cast<uint32_t>(i);
        // Footprint exclusions name pieces by id, so two blocking pieces may not share one
        if (!system.piece_lookup_.emplace(piece.id, piece_index).second && !piece.id.empty()) {
            LOG_ERROR(Collision, "Rejecting terrain: duplicate piece id '{}'", piece.id);
            throw std::invalid_argument(std::format("Duplicate piece id '{}'", piece.id));
        }

        for (uint32_t shape_index = 0; shape_index < piece.shapes.size(); ++shape_index) {
            const bool is_footprint_slot = shape_index == 0;
            if (is_footprint_slot && std::holds_alternative<terrain::Wall>(piece.shapes[0])) {
                // A wall in the footprint slot leaves nothing to stand on
                continue;
            }

            BodyRole role = is_footprint_slot ? BodyRole::Footprint : BodyRole::Wall;
            system.bodies_.push_back(make_body(piece, piece_index, shape_index, role));
            ++(role == BodyRole::Footprint ? footprints : walls);
        }
    }

    std::vector<math::geometry::AABB> bounds;
    bounds.reserve(system.bodies_.size());
    for (const CollisionBody& body : system.bodies_) {
        bounds.push_back(body.bounds);
    }
    system.index_.build(bounds, index_cell_size);

    LOG_DEBUG(Collision, "Collision system: {} footprint bodies, {} wall bodies, index {}x{} @ {:.2f}\"",
              footprints, walls, system.index_.columns(), system.index_.rows(), system.index_.cell_size());

    return system;
}

BodyRefs CollisionSystem::footprint_bodies() const {
    BodyRefs refs;
    for (const CollisionBody& body : bodies_) {
        if (body.role == BodyRole::Footprint) {
            refs.push_back(&body);
        }
    }
    return refs;
}

BodyRefs CollisionSystem::wall_bodies() const {
    BodyRefs refs;
    for (const CollisionBody& body : bodies_) {
        if (body.role == BodyRole::Wall) {
            refs.push_back(&body);
        }
    }
    return refs;
}

BodyRefs CollisionSystem::bodies_for_piece(std::string_view piece_id) const {
    BodyRefs refs;
    auto index = piece_index(piece_id);
    if (!index) {
        return refs;
    }
    for (const CollisionBody& body : bodies_) {
        if (body.piece_index == *index) {
            refs.push_back(&body);
        }
    }
    return refs;
}

Option<uint32_t> CollisionSystem::piece_index(std::string_view piece_id) const {
    auto it = piece_lookup_.find(std::string(piece_id));
    if (it == piece_lookup_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool CollisionSystem::point_intersects(const math::Vec2& point) const noexcept {
    for (uint32_t index : index_.candidates(point)) {
        if (bodies_[index].contains(point)) {
            return true;
        }
    }
    return false;
}

bool CollisionSystem::point_intersects(const math::Vec2& point, BodyRole role) const noexcept {
    return first_hit(point, role) != nullptr;
}

} // namespace sightline::collision
