#include <sightline/vision/visibility_analysis.hpp>

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <limits>
#include <thread>
#include <vector>

using namespace sightline;
using namespace sightline::vision;
using namespace sightline::terrain;

class VisibilityAnalysisTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.board_width = 30.0;
        config.board_height = 20.0;
        config.worker_count = 2;

        sources = {{6.0, 0.0}, {15.0, 0.0}, {24.0, 0.0}};

        TerrainPiece block;
        block.id = "block";
        block.position = Point(9.0, 4.0);
        block.shapes.push_back(Rectangle{12.0, 6.0});
        pieces.push_back(block);
    }

    // Enough work that a run is still going when another thread reacts to it
    static core::AnalysisConfig slow_config() {
        core::AnalysisConfig slow;
        slow.grid_resolution = 0.5;
        slow.ray_step = 0.005;
        slow.worker_count = 2;
        return slow;
    }

    core::AnalysisConfig config;
    std::vector<Point> sources;
    std::vector<TerrainPiece> pieces;
};

TEST_F(VisibilityAnalysisTest, StartsIdle) {
    VisibilityAnalysis analysis(config);

    EXPECT_EQ(analysis.state(), AnalysisState::Idle);
    EXPECT_EQ(analysis.grid(), nullptr);
    EXPECT_FALSE(analysis.stats().has_value());
    EXPECT_DOUBLE_EQ(analysis.progress(), 0.0);
}

TEST_F(VisibilityAnalysisTest, CompletedRunCommitsGridAndStats) {
    VisibilityAnalysis analysis(config);
    std::vector<double> reports;

    auto result = analysis.run(sources, pieces, [&](double percent) { reports.push_back(percent); });
    ASSERT_TRUE(result.has_value()) << result.error().to_string();

    EXPECT_EQ(analysis.state(), AnalysisState::Completed);
    ASSERT_NE(analysis.grid(), nullptr);
    EXPECT_TRUE(analysis.grid()->is_complete());
    ASSERT_TRUE(analysis.stats().has_value());
    EXPECT_EQ(analysis.stats()->unanalyzed_cells, 0u);
    EXPECT_EQ(analysis.stats()->total_cells, 150u);
    EXPECT_GT(analysis.stats()->safe_cells, 0u);
    EXPECT_DOUBLE_EQ(analysis.progress(), 100.0);
    ASSERT_FALSE(reports.empty());
    EXPECT_DOUBLE_EQ(reports.back(), 100.0);
}

TEST_F(VisibilityAnalysisTest, ClearReturnsToIdle) {
    VisibilityAnalysis analysis(config);
    ASSERT_TRUE(analysis.run(sources, pieces).has_value());

    std::shared_ptr<const VisibilityGrid> kept = analysis.grid();
    analysis.clear();

    EXPECT_EQ(analysis.state(), AnalysisState::Idle);
    EXPECT_EQ(analysis.grid(), nullptr);
    EXPECT_FALSE(analysis.stats().has_value());
    // Readers holding the old grid keep it alive
    ASSERT_NE(kept, nullptr);
    EXPECT_EQ(kept->columns, 15u);
}

TEST_F(VisibilityAnalysisTest, RerunReplacesResult) {
    VisibilityAnalysis analysis(config);
    ASSERT_TRUE(analysis.run(sources, pieces).has_value());
    const uint32_t safe_with_block = analysis.stats()->safe_cells;

    ASSERT_TRUE(analysis.run(sources, {}).has_value());
    EXPECT_EQ(analysis.stats()->safe_cells, 0u);
    EXPECT_GT(safe_with_block, 0u);
}

TEST_F(VisibilityAnalysisTest, InvalidTerrainLeavesSessionIdle) {
    TerrainPiece sliver;
    sliver.id = "sliver";
    sliver.shapes.push_back(Polygon{{{0.0, 0.0}, {1.0, 0.0}}});
    pieces.push_back(sliver);

    VisibilityAnalysis analysis(config);
    auto result = analysis.run(sources, pieces);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(analysis.state(), AnalysisState::Idle);
}

TEST_F(VisibilityAnalysisTest, FailedCellsAreNotCommitted) {
    sources.push_back(Point(std::numeric_limits<double>::quiet_NaN(), 0.0));

    VisibilityAnalysis analysis(config);
    auto result = analysis.run(sources, pieces);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::AnalysisFailed);
    EXPECT_EQ(analysis.state(), AnalysisState::Idle);
    EXPECT_EQ(analysis.grid(), nullptr);
}

TEST_F(VisibilityAnalysisTest, DeadlineReportsTimeout) {
    core::AnalysisConfig slow = slow_config();
    slow.worker_count = 1;
    slow.deadline_ms = 1;

    VisibilityAnalysis analysis(slow);
    auto result = analysis.run(std::vector<Point>{{30.0, 0.0}}, {});

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::Timeout);
    EXPECT_EQ(analysis.state(), AnalysisState::Idle);
}

TEST_F(VisibilityAnalysisTest, CancelFromAnotherThread) {
    VisibilityAnalysis analysis(slow_config());
    const std::vector<Point> far_sources = {{30.0, 0.0}};

    std::atomic<bool> finished{false};
    Result<void, Error> result;
    std::thread runner([&]() {
        result = analysis.run(far_sources, {});
        finished = true;
    });

    while (!finished && analysis.state() != AnalysisState::Running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }

    // A second run is refused while the first is in flight
    auto second = analysis.run(far_sources, {});
    ASSERT_FALSE(second.has_value());
    EXPECT_EQ(second.error().code, ErrorCode::AnalysisBusy);

    analysis.cancel();
    runner.join();

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::Cancelled);
    EXPECT_EQ(analysis.state(), AnalysisState::Idle);
    EXPECT_EQ(analysis.grid(), nullptr);
}

TEST(AnalysisStateNamesTest, Names) {
    EXPECT_STREQ(to_string(AnalysisState::Idle), "idle");
    EXPECT_STREQ(to_string(AnalysisState::Running), "running");
    EXPECT_STREQ(to_string(AnalysisState::Completed), "completed");
}
