#include <gtest/gtest.h>

#include "core/tube_void.h"

using namespace nwss::toolpath;

static MaterialSpec tube2x1() {
    MaterialSpec material;
    material.name = "2x1 tube";
    material.form = MaterialForm::TUBE;
    material.outerWidth = 2.0;
    material.outerHeight = 1.0;
    material.wallThickness = 0.125;
    return material;
}

static ExpandedCircle smallCircle(double x, double y) {
    ExpandedCircle circle;
    circle.center = Point2D(x, y);
    circle.diameter = 0.25;
    circle.compensation = CompensationMode::INTERIOR;
    return circle;
}

TEST(TubeVoid, VoidBounds) {
    Bounds b = TubeVoid::voidBounds(2.0, 1.0, 0.125);
    EXPECT_DOUBLE_EQ(b.minX, 0.125);
    EXPECT_DOUBLE_EQ(b.minY, 0.125);
    EXPECT_DOUBLE_EQ(b.maxX, 1.875);
    EXPECT_DOUBLE_EQ(b.maxY, 0.875);
}

TEST(TubeVoid, PointNeedsClearMargin) {
    Bounds b = TubeVoid::voidBounds(2.0, 1.0, 0.125);
    EXPECT_TRUE(TubeVoid::pointInVoid(Point2D(1.0, 0.5), b, 0.1));
    EXPECT_FALSE(TubeVoid::pointInVoid(Point2D(0.2, 0.5), b, 0.1));
    EXPECT_FALSE(TubeVoid::pointInVoid(Point2D(0.125, 0.5), b));
}

TEST(TubeVoid, CircleInsideVoid) {
    Bounds b = TubeVoid::voidBounds(2.0, 1.0, 0.125);
    EXPECT_TRUE(TubeVoid::circleInVoid(smallCircle(1.0, 0.5), b, 0.125));

    ExpandedCircle large = smallCircle(1.0, 0.5);
    large.diameter = 0.7;
    large.compensation = CompensationMode::EXTERIOR;
    EXPECT_FALSE(TubeVoid::circleInVoid(large, b, 0.125));
}

TEST(TubeVoid, HexagonInsideVoid) {
    Bounds b = TubeVoid::voidBounds(2.0, 1.0, 0.125);

    ExpandedHexagon hexagon;
    hexagon.center = Point2D(1.0, 0.5);
    hexagon.flatToFlat = 0.3;
    hexagon.compensation = CompensationMode::INTERIOR;
    EXPECT_TRUE(TubeVoid::hexagonInVoid(hexagon, b, 0.125));

    hexagon.center = Point2D(0.25, 0.5);
    EXPECT_FALSE(TubeVoid::hexagonInVoid(hexagon, b, 0.125));
}

TEST(TubeVoid, OnlyActiveForTubesWithSkipEnabled) {
    MaterialSpec sheet;
    EXPECT_FALSE(TubeVoid::isActive(sheet, true));
    EXPECT_FALSE(TubeVoid::isActive(tube2x1(), false));
    EXPECT_TRUE(TubeVoid::isActive(tube2x1(), true));
}

TEST(TubeVoid, FilterRemovesWholeOperations) {
    ExpandedOperations ops;
    ops.drillPoints.push_back(Point2D(1.0, 0.5));
    ops.drillPoints.push_back(Point2D(0.05, 0.5));
    ops.circles.push_back(smallCircle(1.0, 0.5));
    ops.circles.push_back(smallCircle(0.1, 0.1));

    LineOperation line;
    line.points.push_back(PathPoint::start(0.9, 0.5));
    line.points.push_back(PathPoint::straight(1.1, 0.5));
    ops.lines.push_back(line);

    TubeVoid::FilterResult result = TubeVoid::filter(ops, tube2x1(), true, 0.125, 0.125);

    EXPECT_EQ(result.skippedCount(), 2u);
    ASSERT_EQ(result.operations.drillPoints.size(), 1u);
    EXPECT_TRUE(result.operations.drillPoints[0] == Point2D(0.05, 0.5));
    ASSERT_EQ(result.operations.circles.size(), 1u);
    EXPECT_TRUE(result.operations.circles[0].center == Point2D(0.1, 0.1));
    // Lines inside the void are kept
    EXPECT_EQ(result.operations.lines.size(), 1u);

    std::vector<std::string> descriptions = result.describeSkipped();
    ASSERT_EQ(descriptions.size(), 2u);
    EXPECT_NE(descriptions[0].find("Drill at (1, 0.5)"), std::string::npos);
    EXPECT_NE(descriptions[1].find("inside the tube void"), std::string::npos);
}

TEST(TubeVoid, InactiveFilterReturnsInput) {
    ExpandedOperations ops;
    ops.drillPoints.push_back(Point2D(1.0, 0.5));
    ops.circles.push_back(smallCircle(1.0, 0.5));

    TubeVoid::FilterResult result = TubeVoid::filter(ops, tube2x1(), false, 0.125, 0.125);
    EXPECT_EQ(result.skippedCount(), 0u);
    EXPECT_EQ(result.operations.drillPoints.size(), 1u);
    EXPECT_EQ(result.operations.circles.size(), 1u);
}
