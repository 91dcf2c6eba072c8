#pragma once

#include <sightline/vision/visibility_map.hpp>
#include <string>
#include <cstdint>

namespace sightline::vision {

// Cell counts and coverage of one grid
struct VisibilityStats {
    uint32_t total_cells = 0;
    uint32_t danger_cells = 0;
    uint32_t safe_cells = 0;
    uint32_t unanalyzed_cells = 0;
    double danger_percentage = 0.0;     // 0-100 of total_cells
    double safe_percentage = 0.0;
};

// Single pass over the grid; percentages are 0 for an empty grid
VisibilityStats summarize(const VisibilityGrid& grid) noexcept;

// One-line summary for console logging
std::string to_string(const VisibilityStats& stats);

// Text picture of the grid, one line per row: '#' danger, '.' safe, '?' unanalyzed
std::string render_ascii(const VisibilityGrid& grid);

} // namespace sightline::vision
