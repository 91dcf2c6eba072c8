#pragma once

#include <sightline/core/log.hpp>
#include <sightline/core/types.hpp>
#include <string>
#include <cstdint>

namespace sightline::core {

// Board and sweep limits (inches)
constexpr double DEFAULT_BOARD_WIDTH = 60.0;
constexpr double DEFAULT_BOARD_HEIGHT = 44.0;
constexpr double DEFAULT_GRID_RESOLUTION = 2.0;
constexpr double MIN_GRID_RESOLUTION = 0.5;
constexpr double MAX_GRID_RESOLUTION = 2.0;
constexpr double DEFAULT_RAY_SAMPLE_STEP = 0.2;
constexpr double MIN_RAY_SAMPLE_STEP = 0.001;
constexpr double DEFAULT_ZONE_SAMPLE_SPACING = 4.0;

// Logging settings applied to the Logger singleton
struct LoggingConfig {
    LogLevel min_level = LogLevel::Info;
    bool console = false;
    std::string file_path;                  // Empty = no log file
    bool trace_rays = false;                // Per-ray Trace diagnostics (very verbose)
};

// Settings for one visibility analysis run
struct AnalysisConfig {
    double board_width = DEFAULT_BOARD_WIDTH;
    double board_height = DEFAULT_BOARD_HEIGHT;
    double grid_resolution = DEFAULT_GRID_RESOLUTION;   // Inches per cell
    double ray_step = DEFAULT_RAY_SAMPLE_STEP;          // Inches between ray samples
    uint32_t worker_count = 0;                          // 0 = hardware concurrency
    uint32_t deadline_ms = 0;                           // 0 = no deadline
    double index_cell_size = 2.0;                       // Spatial index bucket size (inches)
    uint32_t progress_steps = 10;                       // Progress reports per run
    double zone_sample_spacing = DEFAULT_ZONE_SAMPLE_SPACING;
    LoggingConfig logging;
};

// Clamp a requested resolution into the allowed range
double clamp_grid_resolution(double resolution) noexcept;

// Check values that would make a sweep meaningless (non-positive sizes, zero step)
Result<void, Error> validate_config(const AnalysisConfig& config);

// Parse JSON text; unknown keys are ignored, missing keys keep defaults
Result<AnalysisConfig, Error> parse_analysis_config(const std::string& json_text);

// Load JSON config from disk
Result<AnalysisConfig, Error> load_analysis_config(const std::string& path);

// Push the logging section into the Logger singleton
void apply_logging_config(const LoggingConfig& config);

} // namespace sightline::core
