#pragma once

#include <sightline/math/math.hpp>
#include <span>
#include <vector>
#include <cstdint>

namespace sightline::collision {

/**
 * @brief Uniform grid over world bounds, mapping each bucket to the items overlapping it
 *
 * Items are inserted into every bucket their bounds touch. Buckets are stored
 * flat (offsets + items) and each bucket lists item indices in ascending
 * order, so queries are deterministic. The index is immutable after build().
 */
class UniformGridIndex {
public:
    // Upper bound on buckets per axis; cell size grows for very large extents
    static constexpr uint32_t MAX_CELLS_PER_AXIS = 512;

    UniformGridIndex() = default;

    void build(std::span<const math::geometry::AABB> item_bounds, double cell_size);

    // Items whose bounds may contain the point (empty outside the indexed area)
    std::span<const uint32_t> candidates(const math::Vec2& point) const noexcept;

    bool empty() const noexcept { return items_.empty(); }
    uint32_t columns() const noexcept { return columns_; }
    uint32_t rows() const noexcept { return rows_; }
    double cell_size() const noexcept { return cell_size_; }
    const math::geometry::AABB& bounds() const noexcept { return bounds_; }

private:
    math::geometry::AABB bounds_ = math::geometry::AABB::empty();
    double cell_size_ = 1.0;
    uint32_t columns_ = 0;
    uint32_t rows_ = 0;
    std::vector<uint32_t> offsets_;     // columns_ * rows_ + 1 entries
    std::vector<uint32_t> items_;
};

} // namespace sightline::collision
