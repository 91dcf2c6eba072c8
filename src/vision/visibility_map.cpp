#include <sightline/vision/visibility_map.hpp>
#include <sightline/collision/collision_system.hpp>
#include <sightline/core/log.hpp>
#include <sightline/terrain/occupancy.hpp>
#include <sightline/vision/selective_ray.hpp>
#include <algorithm>
#include <atomic>
#include <cmath>
#include <format>
#include <future>
#include <limits>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace sightline::vision {

namespace {

// State shared by the workers of one sweep. Each worker writes only its own rows of the grid.
class SweepContext {
public:
    SweepContext(const collision::CollisionSystem& system,
                 const terrain::TerrainOccupancyDetector& detector,
                 std::span<const math::Vec2> sources,
                 const std::vector<terrain::PieceIndexSet>& source_occupancy,
                 double ray_step, bool trace_rays, std::stop_token stop)
        : system(system)
        , detector(detector)
        , sources(sources)
        , source_occupancy(source_occupancy)
        , ray_step(ray_step)
        , trace_rays(trace_rays)
        , stop(std::move(stop)) {
    }

    // Keeps the failure of the lowest cell index so the message does not depend on scheduling
    void record_failure(uint64_t cell_index, const char* message) {
        failed_cells.fetch_add(1, std::memory_order_relaxed);
        std::lock_guard<std::mutex> lock(error_mutex);
        if (cell_index < first_error_cell) {
            first_error_cell = cell_index;
            first_error = message;
        }
    }

    const collision::CollisionSystem& system;
    const terrain::TerrainOccupancyDetector& detector;
    std::span<const math::Vec2> sources;
    const std::vector<terrain::PieceIndexSet>& source_occupancy;
    const double ray_step;
    const bool trace_rays;
    const std::stop_token stop;
    Option<std::chrono::steady_clock::time_point> deadline;

    std::atomic<uint64_t> cells_done{0};
    std::atomic<uint32_t> failed_cells{0};
    std::atomic<bool> cancelled{false};
    std::atomic<bool> deadline_hit{false};

    std::mutex error_mutex;
    uint64_t first_error_cell = std::numeric_limits<uint64_t>::max();
    std::string first_error;
};

void evaluate_cell(const SweepContext& ctx, GridCell& cell) {
    const terrain::PieceIndexSet target_occupancy = ctx.detector.occupancy(cell.center);
    terrain::PieceIndexSet excluded;
    cell.sources_tested = 0;

    for (std::size_t i = 0; i < ctx.sources.size(); ++i) {
        // Exclusions are per pair: standing on a footprint at either end lets the ray cross it
        terrain::merge_piece_sets(ctx.source_occupancy[i], target_occupancy, excluded);
        ++cell.sources_tested;

        if (ctx.trace_rays) {
            RayTraceResult trace = trace_ray(ctx.sources[i], cell.center, ctx.system, excluded, ctx.ray_step);
            LOG_TRACE(Vision, "Ray ({:.2f}, {:.2f}) -> ({:.2f}, {:.2f}): {} after {} samples{}",
                      ctx.sources[i].x, ctx.sources[i].y, cell.center.x, cell.center.y,
                      trace.blocked ? "blocked" : "clear", trace.samples_tested,
                      trace.blocking_body
                          ? std::format(" by {} of '{}'", collision::role_name(trace.blocking_body->role),
                                        trace.blocking_body->piece_id)
                          : std::string());
            if (!trace.blocked) {
                cell.classification = CellClassification::Danger;
                return;
            }
            continue;
        }

        if (!is_blocked(ctx.sources[i], cell.center, ctx.system, excluded, ctx.ray_step)) {
            cell.classification = CellClassification::Danger;
            return;
        }
    }

    cell.classification = CellClassification::Safe;
}

void sweep_rows(SweepContext& ctx, VisibilityGrid& grid, uint32_t first_row, uint32_t stride) {
    for (uint32_t row = first_row; row < grid.rows; row += stride) {
        if (ctx.cancelled.load(std::memory_order_relaxed) || ctx.deadline_hit.load(std::memory_order_relaxed)) {
            return;
        }
        if (ctx.deadline && std::chrono::steady_clock::now() >= *ctx.deadline) {
            ctx.deadline_hit.store(true, std::memory_order_relaxed);
            return;
        }

        for (GridCell& cell : grid.cells[row]) {
            if (ctx.stop.stop_requested()) {
                ctx.cancelled.store(true, std::memory_order_relaxed);
                return;
            }

            try {
                evaluate_cell(ctx, cell);
            } catch (const std::exception& e) {
                cell.classification = CellClassification::Unanalyzed;
                LOG_DEBUG(Vision, "Cell ({}, {}) failed: {}", cell.column, cell.row, e.what());
                ctx.record_failure(static_cast<uint64_t>(row) * grid.columns + cell.column, e.what());
            }

            ctx.cells_done.fetch_add(1, std::memory_order_relaxed);
        }
    }
}

} // namespace

const GridCell* VisibilityGrid::cell_at_point(const math::Vec2& point) const noexcept {
    if (!(resolution > 0.0) || !(point.x >= 0.0) || !(point.y >= 0.0)) {
        return nullptr;
    }

    double column = std::floor(point.x / resolution);
    double row = std::floor(point.y / resolution);
    if (column >= static_cast<double>(columns) || row >= static_cast<double>(rows)) {
        return nullptr;
    }

    return &cells[static_cast<std::size_t>(row)][static_cast<std::size_t>(column)];
}

VisibilityMapGenerator::VisibilityMapGenerator(core::AnalysisConfig config)
    : config_(std::move(config)) {
}

uint32_t VisibilityMapGenerator::resolve_worker_count(uint32_t rows) const noexcept {
    uint32_t workers = config_.worker_count;
    if (workers == 0) {
        workers = std::thread::hardware_concurrency();
    }
    return std::clamp<uint32_t>(workers, 1, std::max<uint32_t>(rows, 1));
}

VisibilityGrid VisibilityMapGenerator::generate(std::span<const math::Vec2> sources,
                                                std::span<const terrain::TerrainPiece> pieces,
                                                const ProgressSink& on_progress,
                                                std::stop_token stop) const {
    LOG_SCOPE_TIMER_CAT("VisibilityMapGenerator::generate", Performance);

    if (auto valid = core::validate_config(config_); !valid) {
        throw std::invalid_argument(valid.error().message);
    }

    const double resolution = core::clamp_grid_resolution(config_.grid_resolution);
    if (resolution != config_.grid_resolution) {
        LOG_WARNING(Vision, "Grid resolution {:.2f}\" clamped to {:.2f}\"", config_.grid_resolution, resolution);
    }

    // Terrain is fixed for the run: build once, then share read-only
    const collision::CollisionSystem system = collision::CollisionSystem::build(pieces, config_.index_cell_size);
    const terrain::TerrainOccupancyDetector detector(pieces);

    std::vector<terrain::PieceIndexSet> source_occupancy;
    source_occupancy.reserve(sources.size());
    {
        terrain::OccupancyCache cache(detector);
        for (const math::Vec2& source : sources) {
            source_occupancy.push_back(cache.get(source));
        }
        LOG_DEBUG(Vision, "Source occupancy cached: {} sources, {} distinct", sources.size(), cache.size());
    }

    VisibilityGrid grid;
    grid.resolution = resolution;
    grid.columns = static_cast<uint32_t>(std::ceil(config_.board_width / resolution));
    grid.rows = static_cast<uint32_t>(std::ceil(config_.board_height / resolution));
    grid.cells.resize(grid.rows);
    for (uint32_t row = 0; row < grid.rows; ++row) {
        std::vector<GridCell>& cells = grid.cells[row];
        cells.reserve(grid.columns);
        for (uint32_t column = 0; column < grid.columns; ++column) {
            GridCell cell;
            cell.column = column;
            cell.row = row;
            cell.center = math::Vec2(column * resolution + resolution * 0.5,
                                     row * resolution + resolution * 0.5);
            cells.push_back(cell);
        }
    }

    if (sources.empty()) {
        LOG_WARNING(Vision, "No source points given, every cell will be classified safe");
    }

    SweepContext ctx(system, detector, sources, source_occupancy,
                     config_.ray_step, config_.logging.trace_rays, std::move(stop));
    if (config_.deadline_ms > 0) {
        ctx.deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(config_.deadline_ms);
    }

    const uint64_t total_cells = static_cast<uint64_t>(grid.rows) * grid.columns;
    const uint32_t workers = resolve_worker_count(grid.rows);

    LOG_INFO(Vision, "Visibility sweep: {}x{} cells @ {:.2f}\", {} sources, {} bodies, {} workers",
             grid.columns, grid.rows, resolution, sources.size(), system.body_count(), workers);

    std::vector<std::future<void>> futures;
    futures.reserve(workers);
    for (uint32_t w = 0; w < workers; ++w) {
        futures.push_back(std::async(std::launch::async, [&ctx, &grid, w, workers]() {
            sweep_rows(ctx, grid, w, workers);
        }));
    }

    // Coarse progress from this thread while the workers run
    const uint32_t steps = std::max<uint32_t>(config_.progress_steps, 1);
    uint32_t next_step = 1;
    auto report_progress = [&]() {
        const uint64_t done = ctx.cells_done.load(std::memory_order_relaxed);
        while (next_step < steps && done * steps >= total_cells * next_step) {
            if (on_progress) {
                on_progress(100.0 * next_step / steps);
            }
            ++next_step;
        }
    };

    for (auto& future : futures) {
        while (future.wait_for(std::chrono::milliseconds(10)) != std::future_status::ready) {
            report_progress();
        }
    }
    report_progress();

    for (auto& future : futures) {
        future.get();
    }

    grid.failed_cells = ctx.failed_cells.load();
    if (ctx.cancelled.load()) {
        grid.status = RunStatus::Cancelled;
        grid.error = "Analysis cancelled";
    } else if (ctx.deadline_hit.load()) {
        grid.status = RunStatus::DeadlineExceeded;
        grid.error = std::format("Deadline of {} ms exceeded", config_.deadline_ms);
    } else if (grid.failed_cells > 0) {
        grid.status = RunStatus::Failed;
        grid.error = ctx.first_error;
    } else {
        grid.status = RunStatus::Completed;
    }

    // Every cell was visited, so completion is reported regardless of rounding
    if ((grid.status == RunStatus::Completed || grid.status == RunStatus::Failed) && on_progress) {
        on_progress(100.0);
    }

    grid.timestamp = std::chrono::system_clock::now();

    if (grid.status == RunStatus::Completed) {
        LOG_INFO(Vision, "Visibility sweep completed: {} cells", total_cells);
    } else if (grid.status == RunStatus::Failed) {
        LOG_ERROR(Vision, "Visibility sweep finished with {} failed cells: {}", grid.failed_cells, grid.error);
    } else {
        LOG_WARNING(Vision, "Visibility sweep stopped early ({}): {} of {} cells evaluated",
                    to_string(grid.status), ctx.cells_done.load(), total_cells);
    }

    return grid;
}

VisibilityGrid generate_visibility_map(std::span<const math::Vec2> sources,
                                       std::span<const terrain::TerrainPiece> pieces,
                                       double resolution,
                                       const ProgressSink& on_progress) {
    core::AnalysisConfig config;
    config.grid_resolution = core::clamp_grid_resolution(resolution);
    return VisibilityMapGenerator(config).generate(sources, pieces, on_progress);
}

const char* to_string(CellClassification classification) noexcept {
    switch (classification) {
        case CellClassification::Unanalyzed: return "unanalyzed";
        case CellClassification::Danger: return "danger";
        case CellClassification::Safe: return "safe";
        default: return "unknown";
    }
}

const char* to_string(RunStatus status) noexcept {
    switch (status) {
        case RunStatus::Completed: return "completed";
        case RunStatus::Cancelled: return "cancelled";
        case RunStatus::DeadlineExceeded: return "deadline exceeded";
        case RunStatus::Failed: return "failed";
        default: return "unknown";
    }
}

} // namespace sightline::vision
