#include <gtest/gtest.h>

#include <cmath>

#include "core/hexagon.h"
#include "core/lead_in.h"
#include "core/tool_compensation.h"

using namespace nwss::toolpath;

// ---------------------------------------------------------------------------
// Distances and points
// ---------------------------------------------------------------------------

TEST(LeadIn, DistanceFromRampAngle) {
    double expected = 0.025 / std::tan(3.0 * 3.14159265358979323846 / 180.0);
    EXPECT_NEAR(LeadIn::leadInDistance(3.0, 0.025), expected, 1e-12);
}

TEST(LeadIn, DistanceFallsBackWhenUnusable) {
    EXPECT_DOUBLE_EQ(LeadIn::leadInDistance(0.0, 0.025), LeadIn::DEFAULT_DISTANCE);
    EXPECT_DOUBLE_EQ(LeadIn::leadInDistance(3.0, 0.0), LeadIn::DEFAULT_DISTANCE);
    EXPECT_DOUBLE_EQ(LeadIn::leadInDistance(-5.0, 0.1), LeadIn::DEFAULT_DISTANCE);
}

TEST(LeadIn, CircleLeadInIsRadiallyOutward) {
    Point2D p = LeadIn::circleLeadInPoint(Point2D(2, 2), 0.5, 0.25);
    EXPECT_NEAR(p.x, 2.75, 1e-12);
    EXPECT_NEAR(p.y, 2.0, 1e-12);

    // 12 o'clock approach
    p = LeadIn::circleLeadInPoint(Point2D(2, 2), 0.5, 0.25, 0.0);
    EXPECT_NEAR(p.x, 2.0, 1e-12);
    EXPECT_NEAR(p.y, 2.75, 1e-12);
}

TEST(LeadIn, HexagonLeadInExtendsFirstEdgeBackward) {
    std::vector<Point2D> v = Hexagon::vertices(Point2D(0, 0), 1.0);
    Point2D p = LeadIn::hexagonLeadInPoint(v, 0.25);

    // Edge v0 -> v1 heads down-right at -30 degrees
    EXPECT_NEAR(p.x, -0.25 * std::cos(Geometry::toRadians(30.0)), 1e-9);
    EXPECT_NEAR(p.y, v[0].y + 0.125, 1e-9);
}

TEST(LeadIn, OpenLineLeadInExtendsFirstSegment) {
    std::vector<PathPoint> line = {PathPoint::start(1, 1), PathPoint::straight(2, 1)};
    Point2D p = LeadIn::lineLeadInPoint(line, 0.25, CompensationMode::NONE);
    EXPECT_NEAR(p.x, 0.75, 1e-12);
    EXPECT_NEAR(p.y, 1.0, 1e-12);
}

TEST(LeadIn, ClosedCompensatedLineEntersFromWasteSide) {
    std::vector<PathPoint> square = {PathPoint::start(0, 0), PathPoint::straight(1, 0),
                                     PathPoint::straight(1, 1), PathPoint::straight(0, 1),
                                     PathPoint::straight(0, 0)};

    Point2D pocket = LeadIn::lineLeadInPoint(square, 0.25, CompensationMode::INTERIOR);
    EXPECT_NEAR(pocket.x, 0.0, 1e-12);
    EXPECT_NEAR(pocket.y, 0.25, 1e-12);

    Point2D profile = LeadIn::lineLeadInPoint(square, 0.25, CompensationMode::EXTERIOR);
    EXPECT_NEAR(profile.x, 0.0, 1e-12);
    EXPECT_NEAR(profile.y, -0.25, 1e-12);
}

// ---------------------------------------------------------------------------
// Helix sizing and feeds
// ---------------------------------------------------------------------------

TEST(LeadIn, CircleHelixRadius) {
    double radius = 0.0;
    ASSERT_TRUE(LeadIn::circleHelixRadius(0.5, 0.25, radius));
    EXPECT_NEAR(radius, 0.15, 1e-12);

    ASSERT_TRUE(LeadIn::circleHelixRadius(0.1, 0.25, radius));
    EXPECT_NEAR(radius, 0.075, 1e-12);

    EXPECT_FALSE(LeadIn::circleHelixRadius(0.06, 0.25, radius));

    // Roomy circle, but a 0.03 tool only needs a 0.04 helix
    radius = -1.0;
    EXPECT_FALSE(LeadIn::circleHelixRadius(0.5, 0.03, radius));
    EXPECT_DOUBLE_EQ(radius, -1.0);
}

TEST(LeadIn, HexagonHelixRadius) {
    double radius = 0.0;
    ASSERT_TRUE(LeadIn::hexagonHelixRadius(1.0, 0.25, CompensationMode::INTERIOR, radius));
    EXPECT_NEAR(radius, 0.15, 1e-12);

    EXPECT_FALSE(LeadIn::hexagonHelixRadius(0.35, 0.25, CompensationMode::INTERIOR, radius));
}

TEST(LeadIn, HelixRevolutions) {
    EXPECT_EQ(LeadIn::helixRevolutions(0.125, 0.04), 4);
    EXPECT_EQ(LeadIn::helixRevolutions(0.01, 0.04), 1);
    EXPECT_EQ(LeadIn::helixRevolutions(0.1, 0.0), 1);
}

TEST(LeadIn, HelixFeedsStepTowardCuttingFeed) {
    std::vector<double> one = LeadIn::helixFeeds(1, 5.0, 10.0);
    ASSERT_EQ(one.size(), 1u);
    EXPECT_DOUBLE_EQ(one[0], 8.75);

    std::vector<double> two = LeadIn::helixFeeds(2, 5.0, 10.0);
    ASSERT_EQ(two.size(), 2u);
    EXPECT_DOUBLE_EQ(two[0], 7.5);
    EXPECT_DOUBLE_EQ(two[1], 8.75);

    std::vector<double> four = LeadIn::helixFeeds(4, 5.0, 10.0);
    ASSERT_EQ(four.size(), 4u);
    EXPECT_DOUBLE_EQ(four[0], 6.25);
    EXPECT_DOUBLE_EQ(four[1], 7.5);
    EXPECT_DOUBLE_EQ(four[2], 8.75);
    EXPECT_DOUBLE_EQ(four[3], 8.75);

    EXPECT_TRUE(LeadIn::helixFeeds(0, 5.0, 10.0).empty());
}

// ---------------------------------------------------------------------------
// Planning
// ---------------------------------------------------------------------------

TEST(LeadIn, PlanCircleHelical) {
    LeadInPlan plan = LeadIn::planCircle(Point2D(3, 3), 0.5, 0.25, LeadInType::HELICAL, 90.0, 0.3);

    EXPECT_EQ(plan.type, LeadInType::HELICAL);
    EXPECT_FALSE(plan.helicalFallback);
    EXPECT_NEAR(plan.profileStart.x, 3.5, 1e-12);
    EXPECT_NEAR(plan.profileStart.y, 3.0, 1e-12);
    EXPECT_NEAR(plan.helixRadius, 0.15, 1e-12);

    Point2D entry = plan.entryPoint();
    EXPECT_NEAR(entry.x, 3.15, 1e-12);
    EXPECT_NEAR(entry.y, 3.0, 1e-12);
}

TEST(LeadIn, PlanCircleFallsBackToRamp) {
    LeadInPlan plan = LeadIn::planCircle(Point2D(0, 0), 0.06, 0.25, LeadInType::HELICAL, 90.0, 0.3);

    EXPECT_EQ(plan.type, LeadInType::RAMP);
    EXPECT_TRUE(plan.helicalFallback);
    EXPECT_NEAR(plan.leadInPoint.x, 0.36, 1e-12);
    EXPECT_TRUE(plan.entryPoint() == plan.leadInPoint);
}

TEST(LeadIn, PlanCircleWithTinyToolFallsBackToRamp) {
    LeadInPlan plan = LeadIn::planCircle(Point2D(2, 2), 0.5, 0.03, LeadInType::HELICAL, 90.0, 0.3);

    EXPECT_EQ(plan.type, LeadInType::RAMP);
    EXPECT_TRUE(plan.helicalFallback);
    EXPECT_NEAR(plan.leadInPoint.x, 2.8, 1e-12);
    EXPECT_NEAR(plan.leadInPoint.y, 2.0, 1e-12);
}

TEST(LeadIn, PlanCircleWithoutLeadInEntersAtProfile) {
    LeadInPlan plan = LeadIn::planCircle(Point2D(1, 1), 0.5, 0.25, LeadInType::NONE, 0.0, 0.3);

    EXPECT_EQ(plan.type, LeadInType::NONE);
    EXPECT_NEAR(plan.profileStart.x, 1.0, 1e-12);
    EXPECT_NEAR(plan.profileStart.y, 1.5, 1e-12);
    EXPECT_TRUE(plan.entryPoint() == plan.profileStart);
}

TEST(LeadIn, PlanHexagonRadialManualRamp) {
    Point2D center(0, 0);
    std::vector<Point2D> vertices =
        ToolCompensation::hexagonVertices(center, 1.0, 0.25, CompensationMode::INTERIOR);

    LeadInPlan plan = LeadIn::planHexagon(center, 1.0, CompensationMode::INTERIOR, vertices, 0.25,
                                          LeadInType::RAMP, 180.0, true, 0.2);

    EXPECT_EQ(plan.type, LeadInType::RAMP);
    EXPECT_TRUE(plan.profileStart == vertices[0]);
    double expected = vertices[0].distanceTo(center) + 0.2;
    EXPECT_NEAR(plan.leadInPoint.x, 0.0, 1e-9);
    EXPECT_NEAR(plan.leadInPoint.y, -expected, 1e-9);
}

TEST(LeadIn, PlanLineOnlyRamps) {
    std::vector<PathPoint> line = {PathPoint::start(0, 0), PathPoint::straight(1, 0)};

    LeadInPlan helical = LeadIn::planLine(line, CompensationMode::NONE, LeadInType::HELICAL,
                                          false, 90.0, 0.25);
    EXPECT_EQ(helical.type, LeadInType::NONE);

    LeadInPlan ramp = LeadIn::planLine(line, CompensationMode::NONE, LeadInType::RAMP,
                                       false, 90.0, 0.25);
    EXPECT_EQ(ramp.type, LeadInType::RAMP);
    EXPECT_NEAR(ramp.leadInPoint.x, -0.25, 1e-12);
}

TEST(LeadIn, ManualLineApproachOverridesPathDirection) {
    std::vector<PathPoint> line = {PathPoint::start(1, 1), PathPoint::straight(2, 1)};

    LeadInPlan plan = LeadIn::planLine(line, CompensationMode::NONE, LeadInType::RAMP,
                                       true, 180.0, 0.5);
    EXPECT_NEAR(plan.leadInPoint.x, 1.0, 1e-9);
    EXPECT_NEAR(plan.leadInPoint.y, 0.5, 1e-9);
}
