#include <sightline/vision/visibility_analysis.hpp>
#include <sightline/core/log.hpp>
#include <stdexcept>

namespace sightline::vision {

VisibilityAnalysis::VisibilityAnalysis(core::AnalysisConfig config)
    : config_(std::move(config)) {
}

Result<void, Error> VisibilityAnalysis::run(std::span<const math::Vec2> sources,
                                           std::span<const terrain::TerrainPiece> pieces,
                                           const ProgressSink& on_progress) {
    std::stop_token stop;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == AnalysisState::Running) {
            return std::unexpected(Error(ErrorCode::AnalysisBusy, "An analysis is already running"));
        }
        state_ = AnalysisState::Running;
        grid_.reset();
        stats_.reset();
        stop_source_ = std::stop_source();
        stop = stop_source_.get_token();
    }
    progress_.store(0.0, std::memory_order_relaxed);

    LOG_INFO(Analysis, "Analysis started: {} pieces, {} source points", pieces.size(), sources.size());

    auto track_progress = [this, &on_progress](double percent) {
        progress_.store(percent, std::memory_order_relaxed);
        if (on_progress) {
            on_progress(percent);
        }
    };

    VisibilityGrid grid;
    try {
        grid = VisibilityMapGenerator(config_).generate(sources, pieces, track_progress, stop);
    } catch (const std::invalid_argument& e) {
        LOG_ERROR(Analysis, "Analysis rejected its input: {}", e.what());
        reset_to_idle();
        return std::unexpected(Error(ErrorCode::InvalidArgument, e.what()));
    } catch (const std::exception& e) {
        LOG_ERROR(Analysis, "Analysis aborted: {}", e.what());
        reset_to_idle();
        return std::unexpected(Error(ErrorCode::AnalysisFailed, e.what()));
    }

    if (grid.status != RunStatus::Completed) {
        ErrorCode code = ErrorCode::AnalysisFailed;
        if (grid.status == RunStatus::Cancelled) {
            code = ErrorCode::Cancelled;
        } else if (grid.status == RunStatus::DeadlineExceeded) {
            code = ErrorCode::Timeout;
        }
        LOG_WARNING(Analysis, "Analysis not committed ({}): {}", to_string(grid.status), grid.error);
        reset_to_idle();
        return std::unexpected(Error(code, grid.error));
    }

    VisibilityStats stats = summarize(grid);
    LOG_INFO(Analysis, "Analysis completed: {}", to_string(stats));

    std::lock_guard<std::mutex> lock(mutex_);
    grid_ = std::make_shared<const VisibilityGrid>(std::move(grid));
    stats_ = stats;
    state_ = AnalysisState::Completed;
    return {};
}

void VisibilityAnalysis::cancel() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == AnalysisState::Running) {
        stop_source_.request_stop();
        LOG_DEBUG(Analysis, "Cancellation requested");
    }
}

void VisibilityAnalysis::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == AnalysisState::Running) {
        stop_source_.request_stop();
        return;
    }
    grid_.reset();
    stats_.reset();
    state_ = AnalysisState::Idle;
    progress_.store(0.0, std::memory_order_relaxed);
}

AnalysisState VisibilityAnalysis::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::shared_ptr<const VisibilityGrid> VisibilityAnalysis::grid() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return grid_;
}

Option<VisibilityStats> VisibilityAnalysis::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

void VisibilityAnalysis::reset_to_idle() {
    std::lock_guard<std::mutex> lock(mutex_);
    grid_.reset();
    stats_.reset();
    state_ = AnalysisState::Idle;
    progress_.store(0.0, std::memory_order_relaxed);
}

const char* to_string(AnalysisState state) noexcept {
    switch (state) {
        case AnalysisState::Idle: return "idle";
        case AnalysisState::Running: return "running";
        case AnalysisState::Completed: return "completed";
        default: return "unknown";
    }
}

} // namespace sightline::vision
