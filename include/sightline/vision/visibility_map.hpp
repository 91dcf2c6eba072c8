#pragma once

#include <sightline/core/config.hpp>
#include <sightline/core/types.hpp>
#include <sightline/math/math.hpp>
#include <sightline/terrain/terrain_types.hpp>
#include <chrono>
#include <functional>
#include <span>
#include <stop_token>
#include <string>
#include <vector>
#include <cstdint>

namespace sightline::vision {

enum class CellClassification : uint8_t {
    Unanalyzed,     // Not reached (cancelled run) or evaluation failed
    Danger,         // Visible from at least one source point
    Safe            // Hidden from every source point
};

enum class RunStatus : uint8_t {
    Completed,
    Cancelled,
    DeadlineExceeded,
    Failed          // Every cell visited, some could not be evaluated
};

struct GridCell {
    uint32_t column = 0;
    uint32_t row = 0;
    math::Vec2 center{0.0};
    CellClassification classification = CellClassification::Unanalyzed;
    // Rays traced for this cell. Evaluation stops at the first clear ray, so a
    // Danger cell can report fewer than the number of sources; Safe cells test all.
    uint32_t sources_tested = 0;
};

// Classified board, cells[row][column]. Immutable once returned.
struct VisibilityGrid {
    std::vector<std::vector<GridCell>> cells;
    double resolution = 0.0;
    uint32_t columns = 0;
    uint32_t rows = 0;
    std::chrono::system_clock::time_point timestamp;
    RunStatus status = RunStatus::Completed;
    std::string error;              // First failure or the reason the run stopped early
    uint32_t failed_cells = 0;

    const GridCell& at(uint32_t column, uint32_t row) const { return cells.at(row).at(column); }

    // Cell whose square contains the point, nullptr off the grid
    const GridCell* cell_at_point(const math::Vec2& point) const noexcept;

    bool is_complete() const noexcept { return status == RunStatus::Completed; }
};

// Receives 0-100, always from the thread that called generate()
using ProgressSink = std::function<void(double)>;

/**
 * @brief Sweeps the board and classifies every cell against a set of source points
 *
 * The collision system is built once per run and shared read-only by the
 * worker tasks, together with the cached source occupancy. Rows are dealt
 * round-robin to workers. A stop request is honored between cells and the
 * deadline between rows; either returns the partial grid. A cell that throws
 * is left unanalyzed and the run carries on, tagging the grid Failed.
 */
class VisibilityMapGenerator {
public:
    explicit VisibilityMapGenerator(core::AnalysisConfig config = {});

    // Throws std::invalid_argument for an invalid config or malformed terrain
    VisibilityGrid generate(std::span<const math::Vec2> sources,
                            std::span<const terrain::TerrainPiece> pieces,
                            const ProgressSink& on_progress = {},
                            std::stop_token stop = {}) const;

    const core::AnalysisConfig& config() const noexcept { return config_; }

    // Worker tasks a run will use for the given row count
    uint32_t resolve_worker_count(uint32_t rows) const noexcept;

private:
    core::AnalysisConfig config_;
};

// Sweep with default settings on a 60 x 44 board at the given resolution (clamped)
VisibilityGrid generate_visibility_map(std::span<const math::Vec2> sources,
                                       std::span<const terrain::TerrainPiece> pieces,
                                       double resolution = core::DEFAULT_GRID_RESOLUTION,
                                       const ProgressSink& on_progress = {});

const char* to_string(CellClassification classification) noexcept;
const char* to_string(RunStatus status) noexcept;

} // namespace sightline::vision
