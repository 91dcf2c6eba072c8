#pragma once

#include <sightline/core/config.hpp>
#include <sightline/core/types.hpp>
#include <sightline/vision/visibility_map.hpp>
#include <sightline/vision/visibility_stats.hpp>
#include <atomic>
#include <memory>
#include <mutex>
#include <span>
#include <stop_token>

namespace sightline::vision {

enum class AnalysisState : uint8_t {
    Idle,
    Running,
    Completed
};

/**
 * @brief One analysis session: Idle -> Running -> Completed, clear() back to Idle
 *
 * Only a completed sweep is committed. A cancelled, timed-out or failed run
 * leaves the session Idle with no grid and reports why through the returned
 * error. run() blocks the calling thread; state(), progress(), cancel() and
 * clear() may be called from any other thread meanwhile.
 */
class VisibilityAnalysis {
public:
    explicit VisibilityAnalysis(core::AnalysisConfig config = {});

    Result<void, Error> run(std::span<const math::Vec2> sources,
                            std::span<const terrain::TerrainPiece> pieces,
                            const ProgressSink& on_progress = {});

    // Request a running sweep to stop; no-op otherwise
    void cancel();

    // Drop the committed result. A running sweep is cancelled instead.
    void clear();

    AnalysisState state() const;
    double progress() const noexcept { return progress_.load(std::memory_order_relaxed); }

    // Committed grid, nullptr unless Completed
    std::shared_ptr<const VisibilityGrid> grid() const;
    Option<VisibilityStats> stats() const;

    const core::AnalysisConfig& config() const noexcept { return config_; }

private:
    void reset_to_idle();

    const core::AnalysisConfig config_;

    mutable std::mutex mutex_;
    AnalysisState state_ = AnalysisState::Idle;
    std::stop_source stop_source_;
    std::shared_ptr<const VisibilityGrid> grid_;
    Option<VisibilityStats> stats_;
    std::atomic<double> progress_{0.0};
};

const char* to_string(AnalysisState state) noexcept;

} // namespace sightline::vision
