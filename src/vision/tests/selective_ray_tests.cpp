#include <sightline/vision/ray_sampler.hpp>
#include <sightline/vision/selective_ray.hpp>

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <limits>
#include <stdexcept>
#include <vector>

using namespace sightline;
using namespace sightline::vision;
using namespace sightline::terrain;
using namespace testing;

TEST(RaySamplerTest, SamplesIncludeBothEndpoints) {
    std::vector<Point> points = RaySampler::sample_points(Point(0.0, 0.0), Point(1.0, 0.0), 0.25);

    ASSERT_EQ(points.size(), 5u);
    EXPECT_EQ(points.front(), Point(0.0, 0.0));
    EXPECT_EQ(points[2], Point(0.5, 0.0));
    EXPECT_EQ(points.back(), Point(1.0, 0.0));
}

TEST(RaySamplerTest, ShortRaySamplesEndpointsOnly) {
    std::vector<Point> points = RaySampler::sample_points(Point(3.0, 3.0), Point(3.1, 3.0), 0.2);
    EXPECT_THAT(points, ElementsAre(Point(3.0, 3.0), Point(3.1, 3.0)));
}

TEST(RaySamplerTest, ZeroLengthRaySamplesCoincidentEndpoints) {
    std::vector<Point> points = RaySampler::sample_points(Point(5.0, 5.0), Point(5.0, 5.0), 0.2);
    EXPECT_THAT(points, ElementsAre(Point(5.0, 5.0), Point(5.0, 5.0)));
}

TEST(RaySamplerTest, UnevenLengthRoundsSegmentCountUp) {
    // 1.1 / 0.25 = 4.4 -> 5 equal segments
    EXPECT_EQ(RaySampler::sample_count(Point(0.0), Point(1.1, 0.0), 0.25), 6u);
}

TEST(RaySamplerTest, VisitorCanStopEarly) {
    uint32_t visited = 0;
    RaySampler::trace(Point(0.0), Point(10.0, 0.0), 1.0, [&](const Point&, uint32_t index) {
        ++visited;
        return index < 2;
    });
    EXPECT_EQ(visited, 3u);
}

TEST(RaySamplerTest, RejectsInvalidInput) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    EXPECT_THROW(RaySampler::sample_count(Point(0.0), Point(1.0), 0.0), std::invalid_argument);
    EXPECT_THROW(RaySampler::sample_count(Point(0.0), Point(1.0), -1.0), std::invalid_argument);
    EXPECT_THROW(RaySampler::sample_count(Point(nan, 0.0), Point(1.0), 0.2), std::invalid_argument);
}

TEST(RaySamplerTest, RejectsCountBeyondIndexRange) {
    // The board diagonal (~74.4") at a 1e-9 step would need ~7.4e10 samples
    EXPECT_THROW(RaySampler::sample_count(Point(0.0), Point(60.0, 44.0), 1e-9), std::invalid_argument);
    EXPECT_EQ(RaySampler::sample_count(Point(0.0), Point(60.0, 44.0), 0.001), 74406u);
}

class SelectiveRayTest : public ::testing::Test {
protected:
    void SetUp() override {
        // 10 x 6 footprint covering x in [10, 20], y in [7, 13]
        TerrainPiece ruin;
        ruin.id = "ruin";
        ruin.position = Point(10.0, 7.0);
        ruin.shapes.push_back(Rectangle{10.0, 6.0});
        open_pieces.push_back(ruin);

        // Same footprint with a wall along y = 9
        ruin.shapes.push_back(Wall{Point(0.0, 2.0), Point(10.0, 2.0), 1.0});
        walled_pieces.push_back(ruin);

        open_system = collision::CollisionSystem::build(open_pieces);
        walled_system = collision::CollisionSystem::build(walled_pieces);
    }

    std::vector<TerrainPiece> open_pieces;
    std::vector<TerrainPiece> walled_pieces;
    collision::CollisionSystem open_system;
    collision::CollisionSystem walled_system;
    const std::vector<uint32_t> no_exclusions;
    const std::vector<uint32_t> ruin_excluded = {0};
};

TEST_F(SelectiveRayTest, RayOutsideEveryBodyIsClear) {
    EXPECT_FALSE(is_blocked(Point(0.0, 0.0), Point(5.0, 30.0), open_system, no_exclusions));
}

TEST_F(SelectiveRayTest, EmptySystemNeverBlocks) {
    collision::CollisionSystem empty = collision::CollisionSystem::build({});
    EXPECT_FALSE(is_blocked(Point(0.0, 0.0), Point(60.0, 44.0), empty, no_exclusions));
}

TEST_F(SelectiveRayTest, FootprintBlocksWhenNotExcluded) {
    RayTraceResult result = trace_ray(Point(15.0, 0.0), Point(15.0, 20.0), open_system, no_exclusions);

    EXPECT_TRUE(result.blocked);
    ASSERT_NE(result.blocking_body, nullptr);
    EXPECT_EQ(result.blocking_body->role, collision::BodyRole::Footprint);
    EXPECT_EQ(result.blocking_body->piece_id, "ruin");
    EXPECT_GE(result.hit_point.y, 7.0 - 1e-9);
    EXPECT_LT(result.hit_point.y, 7.3);
}

TEST_F(SelectiveRayTest, OccupiedFootprintIsSeenAcross) {
    // Target stands on the footprint
    EXPECT_FALSE(is_blocked(Point(15.0, 0.0), Point(15.0, 10.0), open_system, ruin_excluded));
    // Source stands on the footprint
    EXPECT_FALSE(is_blocked(Point(15.0, 10.0), Point(15.0, 30.0), open_system, ruin_excluded));
}

TEST_F(SelectiveRayTest, WallBlocksEvenOnOccupiedFootprint) {
    RayTraceResult result = trace_ray(Point(15.0, 0.0), Point(15.0, 11.0), walled_system, ruin_excluded);

    EXPECT_TRUE(result.blocked);
    ASSERT_NE(result.blocking_body, nullptr);
    EXPECT_EQ(result.blocking_body->role, collision::BodyRole::Wall);
    EXPECT_NEAR(result.hit_point.y, 8.5, 0.25);
}

TEST_F(SelectiveRayTest, RayAlongsideWallOnFootprintIsClear) {
    // Both ends on the footprint below the wall
    EXPECT_FALSE(is_blocked(Point(11.0, 11.0), Point(19.0, 12.0), walled_system, ruin_excluded));
}

TEST_F(SelectiveRayTest, ZeroLengthRay) {
    EXPECT_TRUE(is_blocked(Point(15.0, 11.0), Point(15.0, 11.0), open_system, no_exclusions));
    EXPECT_FALSE(is_blocked(Point(15.0, 11.0), Point(15.0, 11.0), open_system, ruin_excluded));
    EXPECT_FALSE(is_blocked(Point(2.0, 2.0), Point(2.0, 2.0), open_system, no_exclusions));
}

TEST_F(SelectiveRayTest, SampleCountStopsAtFirstHit) {
    RayTraceResult clear = trace_ray(Point(0.0, 0.0), Point(0.0, 10.0), open_system, no_exclusions, 1.0);
    EXPECT_FALSE(clear.blocked);
    EXPECT_EQ(clear.samples_tested, 11u);

    RayTraceResult blocked = trace_ray(Point(15.0, 0.0), Point(15.0, 20.0), open_system, no_exclusions, 1.0);
    EXPECT_TRUE(blocked.blocked);
    EXPECT_EQ(blocked.samples_tested, 8u);
}

TEST_F(SelectiveRayTest, BoundaryContactBlocks) {
    // Ray grazes the footprint's top edge
    EXPECT_TRUE(is_blocked(Point(0.0, 7.0), Point(30.0, 7.0), open_system, no_exclusions, 0.5));
}
