#include <gtest/gtest.h>

#include "core/validator.h"

using namespace nwss::toolpath;

static ToolParams endMill() {
    ToolParams params;
    params.feedRate = 10.0;
    params.plungeRate = 5.0;
    params.passDepth = 0.025;
    params.toolDiameter = 0.25;
    return params;
}

static CircleOperation circle(double x, double y, double diameter) {
    CircleOperation op;
    op.center = Point2D(x, y);
    op.diameter = diameter;
    return op;
}

static bool hasPrefix(const std::vector<std::string>& messages, const std::string& prefix) {
    for (const auto& message : messages) {
        if (message.compare(0, prefix.size(), prefix) == 0) {
            return true;
        }
    }
    return false;
}

// ---------------------------------------------------------------------------
// Structure and bounds
// ---------------------------------------------------------------------------

TEST(Validator, StructuralErrorsAreIndexedAndStopBoundsChecks) {
    OperationSet ops;

    DrillOperation bad;
    bad.id = "holes";
    bad.pattern = PatternType::LINEAR;
    bad.spacing = 0.5;
    bad.count = 0;
    ops.drillHoles.push_back(bad);

    DrillOperation outside;
    outside.start = Point2D(30, 1);
    ops.drillHoles.push_back(outside);

    LineOperation stub;
    stub.points.push_back(PathPoint::start(1, 1));
    ops.lineCuts.push_back(stub);

    std::vector<std::string> errors = Validator::validate(ops, GenerationSettings(), 0.0);
    ASSERT_EQ(errors.size(), 2u);
    EXPECT_EQ(errors[0], "Drill operation 1 (holes): count must be at least 1");
    EXPECT_EQ(errors[1], "Line operation 1: a line path needs at least 2 points");
}

TEST(Validator, DrillBounds) {
    OperationSet ops;
    DrillOperation far;
    far.start = Point2D(30, 1);
    ops.drillHoles.push_back(far);
    DrillOperation negative;
    negative.start = Point2D(-1, 1);
    ops.drillHoles.push_back(negative);

    GenerationSettings settings;
    std::vector<std::string> errors = Validator::validate(ops, settings, 0.0);
    ASSERT_EQ(errors.size(), 2u);
    EXPECT_EQ(errors[0], "Drill operation 1: drill point (30, 1) exceeds machine bounds");
    EXPECT_EQ(errors[1],
              "Drill operation 2: drill point (-1, 1) is outside machine bounds (negative coordinate)");

    settings.allowNegativeCoordinates = true;
    errors = Validator::validate(ops, settings, 0.0);
    ASSERT_EQ(errors.size(), 1u);
}

TEST(Validator, PatternIsCheckedPerInstance) {
    OperationSet ops;
    DrillOperation row;
    row.pattern = PatternType::LINEAR;
    row.start = Point2D(20, 1);
    row.spacing = 2.0;
    row.count = 4;
    ops.drillHoles.push_back(row);

    // 20, 22 and 24 fit; only the last hole is past the edge
    std::vector<std::string> errors = Validator::validate(ops, GenerationSettings(), 0.0);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0], "Drill operation 1: drill point (26, 1) exceeds machine bounds");
}

TEST(Validator, CircleBoundsIncludeTheRadius) {
    OperationSet ops;
    ops.circularCuts.push_back(circle(23.8, 5, 1.0));
    ops.circularCuts.push_back(circle(0.2, 5, 1.0));
    ops.circularCuts.push_back(circle(5, 5, 1.0));

    std::vector<std::string> errors = Validator::validate(ops, GenerationSettings(), 0.0);
    ASSERT_EQ(errors.size(), 2u);
    EXPECT_EQ(errors[0], "Circle operation 1: circle at (23.8, 5) extends outside machine bounds");
    EXPECT_EQ(errors[1], "Circle operation 2: circle at (0.2, 5) extends past zero");
}

TEST(Validator, HexagonBounds) {
    OperationSet ops;
    HexagonOperation hexagon;
    hexagon.center = Point2D(5, 17.8);
    hexagon.flatToFlat = 1.0;
    ops.hexagonalCuts.push_back(hexagon);

    std::vector<std::string> errors = Validator::validate(ops, GenerationSettings(), 0.0);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0], "Hexagon operation 1: hexagon at (5, 17.8) extends outside machine bounds");
}

TEST(Validator, CompensationFeasibility) {
    OperationSet ops;
    ops.circularCuts.push_back(circle(5, 5, 1.0));
    CircleOperation tiny = circle(8, 5, 0.2);
    tiny.id = "pilot";
    ops.circularCuts.push_back(tiny);

    std::vector<std::string> errors = Validator::validate(ops, GenerationSettings(), 0.25);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].rfind("Circle operation 2 (pilot): Circle diameter", 0), 0u);
    EXPECT_NE(errors[0].find("too small for interior compensation"), std::string::npos);

    // Without a tool the check is skipped
    EXPECT_TRUE(Validator::validate(ops, GenerationSettings(), 0.0).empty());
}

TEST(Validator, LineCompensationErrorsNameTheOperation) {
    OperationSet ops;
    LineOperation fine;
    fine.points = {PathPoint::start(1, 1), PathPoint::straight(2, 1)};
    ops.lineCuts.push_back(fine);

    LineOperation doubled;
    doubled.id = "slot";
    doubled.compensation = CompensationMode::EXTERIOR;
    doubled.points = {PathPoint::start(1, 1), PathPoint::straight(2, 1),
                      PathPoint::straight(2, 1), PathPoint::straight(2, 2)};
    ops.lineCuts.push_back(doubled);

    std::vector<std::string> errors = Validator::validate(ops, GenerationSettings(), 0.25);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].rfind("Line operation 2 (slot): Line path has a zero-length segment", 0), 0u);
}

TEST(Validator, BoundsErrorsNameTheLaterOperation) {
    OperationSet ops;
    HexagonOperation inside;
    inside.center = Point2D(5, 5);
    inside.flatToFlat = 1.0;
    ops.hexagonalCuts.push_back(inside);

    HexagonOperation row;
    row.id = "nuts";
    row.pattern = PatternType::LINEAR;
    row.center = Point2D(21, 5);
    row.flatToFlat = 1.0;
    row.spacing = 2.0;
    row.count = 3;
    ops.hexagonalCuts.push_back(row);

    // 21 and 23 fit, the apothem takes 25 past the 24 inch edge
    std::vector<std::string> errors = Validator::validate(ops, GenerationSettings(), 0.0);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0], "Hexagon operation 2 (nuts): hexagon at (25, 5) extends outside machine bounds");
}

TEST(Validator, LinePointsUseThreeDecimals) {
    OperationSet ops;
    LineOperation line;
    line.points = {PathPoint::start(1, 1), PathPoint::straight(25.5, 1)};
    ops.lineCuts.push_back(line);

    std::vector<std::string> errors = Validator::validate(ops, GenerationSettings(), 0.25);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0], "Line operation 1: line point (25.500, 1.000) exceeds machine bounds");
}

// ---------------------------------------------------------------------------
// Warnings
// ---------------------------------------------------------------------------

TEST(Validator, ArcGeometry) {
    std::vector<PathPoint> good = {PathPoint::start(1, 0), PathPoint::arc(0, 1, 0, 0)};
    EXPECT_TRUE(Validator::validateArcGeometry(good).empty());

    std::vector<PathPoint> bad = {PathPoint::start(1, 0), PathPoint::arc(0, 1.1, 0, 0)};
    std::vector<std::string> warnings = Validator::validateArcGeometry(bad);
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_NE(warnings[0].find("has invalid geometry"), std::string::npos);

    std::vector<PathPoint> leading = {PathPoint::arc(0, 1, 0, 0), PathPoint::straight(1, 1)};
    warnings = Validator::validateArcGeometry(leading);
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_EQ(warnings[0], "Arc at point 0: arc cannot be the first point in path");
}

TEST(Validator, Stepdown) {
    ValidationReport tooDeep;
    Validator::validateStepdown(0.3, 0.25, 0.5, tooDeep);
    EXPECT_FALSE(tooDeep.isValid());
    EXPECT_EQ(tooDeep.errors.size(), 1u);

    ValidationReport aggressive;
    Validator::validateStepdown(0.15, 0.25, 0.5, aggressive);
    EXPECT_TRUE(aggressive.isValid());
    ASSERT_EQ(aggressive.warnings.size(), 1u);
    EXPECT_NE(aggressive.warnings[0].find("60% of tool diameter"), std::string::npos);

    ValidationReport fine;
    Validator::validateStepdown(0.1, 0.25, 0.5, fine);
    EXPECT_TRUE(fine.isValid());
    EXPECT_FALSE(fine.hasWarnings());
}

TEST(Validator, PlungeFasterThanFeedWarns) {
    EXPECT_EQ(Validator::validateFeedRates(10.0, 12.0).size(), 1u);
    EXPECT_TRUE(Validator::validateFeedRates(10.0, 5.0).empty());
}

TEST(Validator, DisabledLeadInsAreNamedOnce) {
    OperationSet ops;
    ops.circularCuts.push_back(circle(5, 5, 1.0));
    LineOperation line;
    line.points = {PathPoint::start(1, 1), PathPoint::straight(2, 1)};
    ops.lineCuts.push_back(line);

    GenerationSettings settings;
    settings.circleLeadIn = LeadInType::NONE;
    settings.hexagonLeadIn = LeadInType::NONE;
    settings.lineLeadIn = LeadInType::NONE;

    std::vector<std::string> warnings = Validator::leadInWarnings(ops, settings);
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_TRUE(hasPrefix(warnings, "Lead-in is disabled for circle, line cuts."));

    EXPECT_TRUE(Validator::leadInWarnings(ops, GenerationSettings()).empty());
}

TEST(Validator, SelfIntersectingClosedPath) {
    OperationSet ops;
    LineOperation bow;
    bow.id = "bow";
    bow.points = {PathPoint::start(0, 0), PathPoint::straight(1, 1), PathPoint::straight(1, 0),
                  PathPoint::straight(0, 1), PathPoint::straight(0, 0)};
    ops.lineCuts.push_back(bow);

    std::vector<std::string> warnings = Validator::selfIntersectionWarnings(ops);
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_EQ(warnings[0], "Line operation 1 (bow): closed path crosses itself, compensation may be wrong");
}

// ---------------------------------------------------------------------------
// Projects
// ---------------------------------------------------------------------------

TEST(Validator, ProjectNeedsToolAndOperations) {
    Project drilling;
    drilling.type = ProjectType::DRILL;
    ValidationReport report = Validator::validateProject(drilling, GenerationSettings(), nullptr, nullptr);
    EXPECT_FALSE(report.isValid());
    EXPECT_EQ(report.errors[0], "No drill tool selected");
    EXPECT_EQ(report.errors[1], "Project has no operations");

    Project cutting;
    cutting.operations.circularCuts.push_back(circle(5, 5, 1.0));
    report = Validator::validateProject(cutting, GenerationSettings(), nullptr, nullptr);
    ASSERT_EQ(report.errors.size(), 1u);
    EXPECT_EQ(report.errors[0], "No end mill tool selected");
}

TEST(Validator, ProjectOnlyChecksItsOwnOperationKinds) {
    Project cutting;
    cutting.operations.circularCuts.push_back(circle(5, 5, 1.0));
    DrillOperation far;
    far.start = Point2D(30, 30);
    cutting.operations.drillHoles.push_back(far);

    ToolParams params = endMill();
    ValidationReport report = Validator::validateProject(cutting, GenerationSettings(), nullptr, &params);
    EXPECT_TRUE(report.isValid());
}

TEST(Validator, ProjectCollectsWarnings) {
    Project cutting;
    cutting.operations.circularCuts.push_back(circle(5, 5, 1.0));

    ToolParams params = endMill();
    params.plungeRate = 15.0;
    params.passDepth = 0.15;

    ValidationReport report = Validator::validateProject(cutting, GenerationSettings(), nullptr, &params);
    EXPECT_TRUE(report.isValid());
    EXPECT_EQ(report.warnings.size(), 2u);
}
