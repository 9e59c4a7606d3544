#include <gtest/gtest.h>

#include <cmath>

#include "core/errors.h"
#include "core/hexagon.h"
#include "core/tool_compensation.h"

using namespace nwss::toolpath;

// Helper: closed unit square, counter-clockwise
static std::vector<PathPoint> unitSquare() {
    return {PathPoint::start(0, 0), PathPoint::straight(1, 0), PathPoint::straight(1, 1),
            PathPoint::straight(0, 1), PathPoint::straight(0, 0)};
}

static void expectPoint(const PathPoint& p, double x, double y) {
    EXPECT_NEAR(p.x, x, 1e-9) << "at (" << p.x << ", " << p.y << ")";
    EXPECT_NEAR(p.y, y, 1e-9) << "at (" << p.x << ", " << p.y << ")";
}

// ---------------------------------------------------------------------------
// Offsets and circles
// ---------------------------------------------------------------------------

TEST(ToolCompensation, OffsetPerMode) {
    EXPECT_DOUBLE_EQ(ToolCompensation::getCompensationOffset(0.25, CompensationMode::NONE), 0.0);
    EXPECT_DOUBLE_EQ(ToolCompensation::getCompensationOffset(0.25, CompensationMode::INTERIOR), -0.125);
    EXPECT_DOUBLE_EQ(ToolCompensation::getCompensationOffset(0.25, CompensationMode::EXTERIOR), 0.125);
}

TEST(ToolCompensation, CircleRadiusOrdering) {
    const double tools[] = {0.0625, 0.125, 0.25, 0.5};
    for (double tool : tools) {
        double interior = ToolCompensation::cutRadius(1.0, tool, CompensationMode::INTERIOR);
        double none = ToolCompensation::cutRadius(1.0, tool, CompensationMode::NONE);
        double exterior = ToolCompensation::cutRadius(1.0, tool, CompensationMode::EXTERIOR);
        EXPECT_LT(interior, none);
        EXPECT_LT(none, exterior);
        EXPECT_DOUBLE_EQ(exterior - interior, tool);
    }
}

TEST(ToolCompensation, InteriorCircleSmallerThanToolFails) {
    EXPECT_THROW(ToolCompensation::cutRadius(0.25, 0.25, CompensationMode::INTERIOR),
                 InvalidGeometryError);
    EXPECT_THROW(ToolCompensation::cutRadius(0.1, 0.25, CompensationMode::INTERIOR),
                 InvalidGeometryError);
    EXPECT_NO_THROW(ToolCompensation::cutRadius(0.1, 0.25, CompensationMode::EXTERIOR));
}

// ---------------------------------------------------------------------------
// Hexagons
// ---------------------------------------------------------------------------

TEST(ToolCompensation, HexagonFlatsMoveByToolRadius) {
    Point2D center(5, 5);
    std::vector<Point2D> interior =
        ToolCompensation::hexagonVertices(center, 1.0, 0.25, CompensationMode::INTERIOR);
    std::vector<Point2D> exterior =
        ToolCompensation::hexagonVertices(center, 1.0, 0.25, CompensationMode::EXTERIOR);

    // Vertex 1 lies on the right flat, so its x is center + apothem
    EXPECT_NEAR(interior[1].x - center.x, 0.5 - 0.125, 1e-9);
    EXPECT_NEAR(exterior[1].x - center.x, 0.5 + 0.125, 1e-9);

    // Top vertex moves along its bisector by r * 2 / sqrt(3)
    double r = Hexagon::circumradius(1.0);
    EXPECT_NEAR(interior[0].y - center.y, r - 0.125 * 2.0 / std::sqrt(3.0), 1e-9);
}

TEST(ToolCompensation, HexagonNoneIsNominal) {
    std::vector<Point2D> nominal = Hexagon::vertices(Point2D(1, 1), 0.75);
    std::vector<Point2D> none =
        ToolCompensation::hexagonVertices(Point2D(1, 1), 0.75, 0.25, CompensationMode::NONE);
    ASSERT_EQ(none.size(), 6u);
    for (size_t i = 0; i < 6; ++i) {
        EXPECT_TRUE(none[i] == nominal[i]);
    }
}

TEST(ToolCompensation, HexagonTooSmallFails) {
    EXPECT_THROW(ToolCompensation::hexagonVertices(Point2D(0, 0), 0.2, 0.25,
                                                   CompensationMode::INTERIOR),
                 InvalidGeometryError);
}

// ---------------------------------------------------------------------------
// Line paths
// ---------------------------------------------------------------------------

TEST(ToolCompensation, SquareExterior) {
    std::vector<PathPoint> result =
        ToolCompensation::compensateLinePath(unitSquare(), 0.25, CompensationMode::EXTERIOR);

    ASSERT_EQ(result.size(), 5u);
    expectPoint(result[0], -0.125, -0.125);
    expectPoint(result[1], 1.125, -0.125);
    expectPoint(result[2], 1.125, 1.125);
    expectPoint(result[3], -0.125, 1.125);
    expectPoint(result[4], -0.125, -0.125);
    EXPECT_EQ(result[0].type, PathPointType::START);
}

TEST(ToolCompensation, SquareInterior) {
    std::vector<PathPoint> result =
        ToolCompensation::compensateLinePath(unitSquare(), 0.25, CompensationMode::INTERIOR);

    ASSERT_EQ(result.size(), 5u);
    expectPoint(result[0], 0.125, 0.125);
    expectPoint(result[1], 0.875, 0.125);
    expectPoint(result[2], 0.875, 0.875);
    expectPoint(result[3], 0.125, 0.875);
    expectPoint(result[4], 0.125, 0.125);
}

TEST(ToolCompensation, ClockwiseSquareCompensatesToTheSameSide) {
    std::vector<PathPoint> cw = {PathPoint::start(0, 0), PathPoint::straight(0, 1),
                                 PathPoint::straight(1, 1), PathPoint::straight(1, 0),
                                 PathPoint::straight(0, 0)};

    ToolCompensation::PathResult result =
        ToolCompensation::compensateLinePathDetailed(cw, 0.25, CompensationMode::EXTERIOR);

    EXPECT_TRUE(result.closed);
    EXPECT_LT(result.winding, 0.0);
    ASSERT_EQ(result.points.size(), 5u);
    expectPoint(result.points[0], -0.125, -0.125);
    expectPoint(result.points[1], -0.125, 1.125);
    expectPoint(result.points[2], 1.125, 1.125);
    expectPoint(result.points[3], 1.125, -0.125);
}

TEST(ToolCompensation, NoneReturnsInputUnchanged) {
    std::vector<PathPoint> input = unitSquare();
    std::vector<PathPoint> result =
        ToolCompensation::compensateLinePath(input, 0.25, CompensationMode::NONE);

    ASSERT_EQ(result.size(), input.size());
    for (size_t i = 0; i < input.size(); ++i) {
        expectPoint(result[i], input[i].x, input[i].y);
    }
}

TEST(ToolCompensation, OpenPathKeepsItsEnds) {
    std::vector<PathPoint> open = {PathPoint::start(0, 0), PathPoint::straight(2, 0),
                                   PathPoint::straight(2, 2)};

    ToolCompensation::PathResult result =
        ToolCompensation::compensateLinePathDetailed(open, 0.5, CompensationMode::EXTERIOR);

    EXPECT_FALSE(result.closed);
    ASSERT_EQ(result.points.size(), 3u);
    // Counter-clockwise winding, exterior offsets to the right of travel
    EXPECT_GT(result.winding, 0.0);
    expectPoint(result.points[0], 0.0, -0.25);
    expectPoint(result.points[1], 2.25, -0.25);
    expectPoint(result.points[2], 2.25, 2.0);
}

TEST(ToolCompensation, ParallelSegmentsFallBackToOffsetEndpoint) {
    std::vector<PathPoint> straight = {PathPoint::start(0, 0), PathPoint::straight(1, 0),
                                       PathPoint::straight(2, 0)};

    std::vector<PathPoint> result =
        ToolCompensation::compensateLinePath(straight, 0.25, CompensationMode::EXTERIOR);

    ASSERT_EQ(result.size(), 3u);
    expectPoint(result[0], 0.0, -0.125);
    expectPoint(result[1], 1.0, -0.125);
    expectPoint(result[2], 2.0, -0.125);
}

TEST(ToolCompensation, ExteriorArcGrowsRadius) {
    // Half disc: arc over the top, straight back along the diameter
    std::vector<PathPoint> halfDisc = {PathPoint::start(1, 0),
                                       PathPoint::arc(-1, 0, 0, 0, ArcHint::CCW),
                                       PathPoint::straight(1, 0)};

    std::vector<PathPoint> result =
        ToolCompensation::compensateLinePath(halfDisc, 0.25, CompensationMode::EXTERIOR);

    ASSERT_EQ(result.size(), 3u);
    ASSERT_TRUE(result[1].isArc());
    EXPECT_TRUE(result[1].center == Point2D(0, 0));
    EXPECT_EQ(result[1].hint, ArcHint::CCW);
    EXPECT_NEAR(result[1].position().length(), 1.125, 1e-9);
    EXPECT_NEAR(result[0].position().length(), 1.125, 1e-9);
    EXPECT_NEAR(result[0].y, -0.125, 1e-9);
}

TEST(ToolCompensation, InteriorArcBelowToolRadiusFails) {
    std::vector<PathPoint> tiny = {PathPoint::start(0.1, 0),
                                   PathPoint::arc(-0.1, 0, 0, 0, ArcHint::CCW),
                                   PathPoint::straight(0.1, 0)};

    EXPECT_THROW(ToolCompensation::compensateLinePath(tiny, 0.25, CompensationMode::INTERIOR),
                 InvalidGeometryError);
}

TEST(ToolCompensation, ZeroLengthSegmentFails) {
    std::vector<PathPoint> doubled = {PathPoint::start(0, 0), PathPoint::straight(1, 0),
                                      PathPoint::straight(1, 0), PathPoint::straight(1, 1)};

    EXPECT_THROW(ToolCompensation::compensateLinePath(doubled, 0.25, CompensationMode::EXTERIOR),
                 InvalidGeometryError);
}
