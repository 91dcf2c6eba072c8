#include <sightline/vision/visibility_stats.hpp>
#include <iomanip>
#include <sstream>

namespace sightline::vision {

VisibilityStats summarize(const VisibilityGrid& grid) noexcept {
    VisibilityStats stats;
    stats.total_cells = grid.rows * grid.columns;

    for (const auto& row : grid.cells) {
        for (const GridCell& cell : row) {
            switch (cell.classification) {
                case CellClassification::Danger: ++stats.danger_cells; break;
                case CellClassification::Safe: ++stats.safe_cells; break;
                default: ++stats.unanalyzed_cells; break;
            }
        }
    }

    if (stats.total_cells > 0) {
        stats.danger_percentage = 100.0 * stats.danger_cells / stats.total_cells;
        stats.safe_percentage = 100.0 * stats.safe_cells / stats.total_cells;
    }
    return stats;
}

std::string to_string(const VisibilityStats& stats) {
    std::stringstream ss;
    ss << "Cells: " << stats.total_cells
       << ", danger: " << stats.danger_cells
       << " (" << std::fixed << std::setprecision(1) << stats.danger_percentage << "%)"
       << ", safe: " << stats.safe_cells
       << " (" << stats.safe_percentage << "%)";
    if (stats.unanalyzed_cells > 0) {
        ss << ", unanalyzed: " << stats.unanalyzed_cells;
    }
    return ss.str();
}

std::string render_ascii(const VisibilityGrid& grid) {
    std::string out;
    out.reserve(static_cast<std::size_t>(grid.rows) * (grid.columns + 1));

    for (const auto& row : grid.cells) {
        for (const GridCell& cell : row) {
            switch (cell.classification) {
                case CellClassification::Danger: out += '#'; break;
                case CellClassification::Safe: out += '.'; break;
                default: out += '?'; break;
            }
        }
        out += '\n';
    }
    return out;
}

} // namespace sightline::vision
