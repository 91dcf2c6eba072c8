#include <sightline/collision/spatial_index.hpp>
#include <algorithm>
#include <cmath>

namespace sightline::collision {

namespace {

uint32_t cell_coord(double value, double origin, double inv_cell_size, uint32_t count) noexcept {
    double c = std::floor((value - origin) * inv_cell_size);
    if (c < 0.0) return 0;
    return std::min(static_cast<uint32_t>(c), count - 1);
}

} // namespace

void UniformGridIndex::build(std::span<const math::geometry::AABB> item_bounds, double cell_size) {
    bounds_ = math::geometry::AABB::empty();
    offsets_.clear();
    items_.clear();
    columns_ = 0;
    rows_ = 0;

    for (const auto& b : item_bounds) {
        bounds_.expand_to_include(b);
    }
    if (bounds_.is_empty()) {
        return;
    }

    math::Vec2 extent = bounds_.get_size();
    double longest = std::max(extent.x, extent.y);
    cell_size_ = std::max(cell_size, longest / MAX_CELLS_PER_AXIS);
    if (!(cell_size_ > 0.0)) {
        cell_size_ = 1.0;
    }
    const double inv_cell_size = 1.0 / cell_size_;

    columns_ = std::max<uint32_t>(1, static_cast<uint32_t>(std::ceil(extent.x * inv_cell_size)));
    rows_ = std::max<uint32_t>(1, static_cast<uint32_t>(std::ceil(extent.y * inv_cell_size)));

    struct CellRange { uint32_t x0, y0, x1, y1; };
    std::vector<CellRange> ranges;
    ranges.reserve(item_bounds.size());
    for (const auto& b : item_bounds) {
        if (b.is_empty()) {
            ranges.push_back(CellRange{1, 1, 0, 0});
            continue;
        }
        ranges.push_back(CellRange{
            cell_coord(b.min.x, bounds_.min.x, inv_cell_size, columns_),
            cell_coord(b.min.y, bounds_.min.y, inv_cell_size, rows_),
            cell_coord(b.max.x, bounds_.min.x, inv_cell_size, columns_),
            cell_coord(b.max.y, bounds_.min.y, inv_cell_size, rows_)
        });
    }

    // Pass 1: count items per bucket
    std::vector<uint32_t> counts(static_cast<std::size_t>(columns_) * rows_, 0);
    for (const CellRange& r : ranges) {
        for (uint32_t y = r.y0; y <= r.y1 && r.x0 <= r.x1; ++y) {
            for (uint32_t x = r.x0; x <= r.x1; ++x) {
                ++counts[static_cast<std::size_t>(y) * columns_ + x];
            }
        }
    }

    offsets_.resize(counts.size() + 1);
    offsets_[0] = 0;
    for (std::size_t i = 0; i < counts.size(); ++i) {
        offsets_[i + 1] = offsets_[i] + counts[i];
    }

    // Pass 2: fill in item order so every bucket stays ascending
    items_.resize(offsets_.back());
    std::vector<uint32_t> cursor(offsets_.begin(), offsets_.end() - 1);
    for (uint32_t item = 0; item < ranges.size(); ++item) {
        const CellRange& r = ranges[item];
        for (uint32_t y = r.y0; y <= r.y1 && r.x0 <= r.x1; ++y) {
            for (uint32_t x = r.x0; x <= r.x1; ++x) {
                items_[cursor[static_cast<std::size_t>(y) * columns_ + x]++] = item;
            }
        }
    }
}

std::span<const uint32_t> UniformGridIndex::candidates(const math::Vec2& point) const noexcept {
    if (columns_ == 0 || !bounds_.contains(point)) {
        return {};
    }

    const double inv_cell_size = 1.0 / cell_size_;
    uint32_t x = cell_coord(point.x, bounds_.min.x, inv_cell_size, columns_);
    uint32_t y = cell_coord(point.y, bounds_.min.y, inv_cell_size, rows_);
    std::size_t cell = static_cast<std::size_t>(y) * columns_ + x;

    return std::span<const uint32_t>(items_.data() + offsets_[cell], offsets_[cell + 1] - offsets_[cell]);
}

} // namespace sightline::collision
