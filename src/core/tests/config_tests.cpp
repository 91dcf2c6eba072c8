#include <sightline/core/config.hpp>

#include <gtest/gtest.h>

#include <cmath>
#include <string>

using namespace sightline;
using namespace sightline::core;

TEST(AnalysisConfigTest, DefaultsMatchStandardBoard) {
    AnalysisConfig config;
    EXPECT_DOUBLE_EQ(config.board_width, 60.0);
    EXPECT_DOUBLE_EQ(config.board_height, 44.0);
    EXPECT_DOUBLE_EQ(config.grid_resolution, 2.0);
    EXPECT_DOUBLE_EQ(config.ray_step, 0.2);
    EXPECT_EQ(config.worker_count, 0u);
    EXPECT_EQ(config.deadline_ms, 0u);
    EXPECT_EQ(config.progress_steps, 10u);
    EXPECT_TRUE(validate_config(config).has_value());
}

TEST(AnalysisConfigTest, ResolutionIsClampedToAllowedRange) {
    EXPECT_DOUBLE_EQ(clamp_grid_resolution(5.0), MAX_GRID_RESOLUTION);
    EXPECT_DOUBLE_EQ(clamp_grid_resolution(0.1), MIN_GRID_RESOLUTION);
    EXPECT_DOUBLE_EQ(clamp_grid_resolution(1.0), 1.0);
    EXPECT_DOUBLE_EQ(clamp_grid_resolution(std::nan("")), DEFAULT_GRID_RESOLUTION);
}

TEST(AnalysisConfigTest, ParsesAllKeys) {
    const std::string text = R"({
        "boardWidth": 44, "boardHeight": 30, "gridResolution": 1,
        "rayStep": 0.1, "workers": 3, "deadlineMs": 500,
        "indexCellSize": 4, "progressSteps": 5, "zoneSampleSpacing": 2,
        "logging": {"level": "debug", "console": true, "file": "run.log", "traceRays": true}
    })";

    auto config = parse_analysis_config(text);
    ASSERT_TRUE(config.has_value()) << config.error().to_string();
    EXPECT_DOUBLE_EQ(config->board_width, 44.0);
    EXPECT_DOUBLE_EQ(config->board_height, 30.0);
    EXPECT_DOUBLE_EQ(config->grid_resolution, 1.0);
    EXPECT_DOUBLE_EQ(config->ray_step, 0.1);
    EXPECT_EQ(config->worker_count, 3u);
    EXPECT_EQ(config->deadline_ms, 500u);
    EXPECT_DOUBLE_EQ(config->index_cell_size, 4.0);
    EXPECT_EQ(config->progress_steps, 5u);
    EXPECT_DOUBLE_EQ(config->zone_sample_spacing, 2.0);
    EXPECT_EQ(config->logging.min_level, LogLevel::Debug);
    EXPECT_TRUE(config->logging.console);
    EXPECT_EQ(config->logging.file_path, "run.log");
    EXPECT_TRUE(config->logging.trace_rays);
}

TEST(AnalysisConfigTest, MissingKeysKeepDefaults) {
    auto config = parse_analysis_config(R"({"gridResolution": 8})");
    ASSERT_TRUE(config.has_value());
    EXPECT_DOUBLE_EQ(config->grid_resolution, MAX_GRID_RESOLUTION);
    EXPECT_DOUBLE_EQ(config->board_width, DEFAULT_BOARD_WIDTH);
    EXPECT_DOUBLE_EQ(config->ray_step, DEFAULT_RAY_SAMPLE_STEP);
    EXPECT_EQ(config->logging.min_level, LogLevel::Info);
}

TEST(AnalysisConfigTest, RejectsMalformedJson) {
    auto config = parse_analysis_config("{ not json");
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, ErrorCode::ConfigParseError);

    auto array_root = parse_analysis_config("[1, 2]");
    ASSERT_FALSE(array_root.has_value());
    EXPECT_EQ(array_root.error().code, ErrorCode::ConfigParseError);
}

TEST(AnalysisConfigTest, RejectsUnknownLogLevel) {
    auto config = parse_analysis_config(R"({"logging": {"level": "chatty"}})");
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, ErrorCode::InvalidConfig);
}

TEST(AnalysisConfigTest, RejectsNonPositiveValues) {
    auto zero_step = parse_analysis_config(R"({"rayStep": 0})");
    ASSERT_FALSE(zero_step.has_value());
    EXPECT_EQ(zero_step.error().code, ErrorCode::InvalidConfig);

    AnalysisConfig config;
    config.board_height = -1.0;
    auto valid = validate_config(config);
    ASSERT_FALSE(valid.has_value());
    EXPECT_EQ(valid.error().code, ErrorCode::InvalidConfig);
}

TEST(AnalysisConfigTest, RejectsRayStepBelowMinimum) {
    auto tiny_step = parse_analysis_config(R"({"rayStep": 1e-9})");
    ASSERT_FALSE(tiny_step.has_value());
    EXPECT_EQ(tiny_step.error().code, ErrorCode::InvalidConfig);

    auto minimum = parse_analysis_config(R"({"rayStep": 0.001})");
    ASSERT_TRUE(minimum.has_value()) << minimum.error().to_string();
    EXPECT_DOUBLE_EQ(minimum->ray_step, MIN_RAY_SAMPLE_STEP);
}

TEST(AnalysisConfigTest, RejectsIntegersOutsideUint32) {
    auto deadline = parse_analysis_config(R"({"deadlineMs": 4294967296})");
    ASSERT_FALSE(deadline.has_value());
    EXPECT_EQ(deadline.error().code, ErrorCode::InvalidConfig);

    auto workers = parse_analysis_config(R"({"workers": -2})");
    ASSERT_FALSE(workers.has_value());
    EXPECT_EQ(workers.error().code, ErrorCode::InvalidConfig);

    auto largest = parse_analysis_config(R"({"progressSteps": 4294967295})");
    ASSERT_TRUE(largest.has_value()) << largest.error().to_string();
    EXPECT_EQ(largest->progress_steps, 4294967295u);
}

TEST(AnalysisConfigTest, LoadMissingFileReportsNotFound) {
    auto config = load_analysis_config("/nonexistent/sightline/config.json");
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, ErrorCode::FileNotFound);
}

TEST(AnalysisConfigTest, LoadsSampleConfig) {
    auto config = load_analysis_config(std::string(SIGHTLINE_TEST_DATA_DIR) + "/config/analysis.json");
    ASSERT_TRUE(config.has_value()) << config.error().to_string();
    EXPECT_DOUBLE_EQ(config->grid_resolution, 1.0);
    EXPECT_EQ(config->deadline_ms, 60000u);
    EXPECT_TRUE(config->logging.console);
}
