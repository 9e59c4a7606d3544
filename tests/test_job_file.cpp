#include <gtest/gtest.h>

#include <sstream>

#include "nwss-toolpath/job_file.h"

using namespace nwss::toolpath;

static bool load(JobFile& job, const std::string& text) {
    std::istringstream input(text);
    return job.loadFromStream(input);
}

TEST(JobFile, ProjectAndOperations) {
    JobFile job;
    ASSERT_TRUE(load(job,
        "# bracket\n"
        "[project]\n"
        "name = Bracket\n"
        "type = cut\n"
        "tube_void_skip = yes\n"
        "tube_orientation = narrow\n"
        "\n"
        "[circle]\n"
        "id = bores\n"
        "pattern = linear\n"
        "x = 1\n"
        "y = 1.5\n"
        "diameter = 0.5\n"
        "compensation = exterior\n"
        "axis = y\n"
        "spacing = 2\n"
        "count = 3\n"
        "hold_time = 1.5\n"
        "\n"
        "[hexagon]\n"
        "x = 4\n"
        "y = 4\n"
        "flat_to_flat = 0.75\n"
        "lead_in_mode = manual\n"
        "lead_in_type = ramp\n"
        "approach_angle = 180\n"));

    const Project& project = job.getProject();
    EXPECT_EQ(project.name, "Bracket");
    EXPECT_EQ(project.type, ProjectType::CUT);
    EXPECT_TRUE(project.tubeVoidSkip);
    EXPECT_TRUE(project.narrowFaceUp);

    ASSERT_EQ(project.operations.circularCuts.size(), 1u);
    const CircleOperation& circle = project.operations.circularCuts[0];
    EXPECT_EQ(circle.id, "bores");
    EXPECT_EQ(circle.pattern, PatternType::LINEAR);
    EXPECT_TRUE(circle.center == Point2D(1, 1.5));
    EXPECT_EQ(circle.compensation, CompensationMode::EXTERIOR);
    EXPECT_EQ(circle.axis, PatternAxis::Y);
    EXPECT_EQ(circle.count, 3);
    EXPECT_DOUBLE_EQ(circle.holdTime, 1.5);

    ASSERT_EQ(project.operations.hexagonalCuts.size(), 1u);
    const HexagonOperation& hexagon = project.operations.hexagonalCuts[0];
    EXPECT_TRUE(hexagon.leadIn.isManual());
    EXPECT_EQ(hexagon.leadIn.type, LeadInType::RAMP);
    EXPECT_DOUBLE_EQ(hexagon.leadIn.approachAngle, 180.0);
}

TEST(JobFile, DrillGrid) {
    JobFile job;
    ASSERT_TRUE(load(job,
        "[project]\ntype=drill\n"
        "[drill]\npattern=grid\nx=1\ny=2\nx_spacing=0.5\ny_spacing=0.25\nx_count=4\ny_count=3\n"
        "[drill]\nx=10\ny=10\n"));

    const OperationSet& ops = job.getProject().operations;
    ASSERT_EQ(ops.drillHoles.size(), 2u);
    EXPECT_EQ(ops.drillHoles[0].pattern, PatternType::GRID);
    EXPECT_EQ(ops.drillHoles[0].xCount, 4);
    EXPECT_EQ(ops.drillHoles[0].yCount, 3);
    EXPECT_DOUBLE_EQ(ops.drillHoles[0].ySpacing, 0.25);
    EXPECT_EQ(ops.drillHoles[1].pattern, PatternType::SINGLE);
    EXPECT_TRUE(ops.drillHoles[1].start == Point2D(10, 10));
}

TEST(JobFile, LinePoints) {
    JobFile job;
    ASSERT_TRUE(load(job,
        "[line]\n"
        "compensation = interior\n"
        "point = start 0 0\n"
        "point = straight 1 0\n"
        "point = arc 1 2 1 1 ccw\n"
        "point = arc 0 1 0.5 1.5\n"
        "point = straight 0 0\n"));

    const std::vector<LineOperation>& lines = job.getProject().operations.lineCuts;
    ASSERT_EQ(lines.size(), 1u);
    const std::vector<PathPoint>& points = lines[0].points;
    ASSERT_EQ(points.size(), 5u);
    EXPECT_EQ(lines[0].compensation, CompensationMode::INTERIOR);
    EXPECT_EQ(points[0].type, PathPointType::START);
    EXPECT_EQ(points[2].type, PathPointType::ARC);
    EXPECT_TRUE(points[2].center == Point2D(1, 1));
    EXPECT_EQ(points[2].hint, ArcHint::CCW);
    EXPECT_EQ(points[3].hint, ArcHint::AUTO);
}

TEST(JobFile, ErrorsCarryLineNumbers) {
    JobFile job;
    EXPECT_FALSE(load(job,
        "[circle]\n"
        "diameter = wide\n"
        "colour = red\n"
        "[sphere]\n"
        "x\n"));

    const std::vector<std::string>& errors = job.getErrors();
    ASSERT_EQ(errors.size(), 4u);
    EXPECT_EQ(errors[0], "Line 2: Invalid value 'wide' for diameter");
    EXPECT_EQ(errors[1], "Line 3: Unknown key 'colour'");
    EXPECT_EQ(errors[2], "Line 4: Unknown section [sphere]");
    EXPECT_EQ(errors[3], "Line 5: Expected key=value, got 'x'");
}

TEST(JobFile, BadPoints) {
    JobFile job;
    EXPECT_FALSE(load(job,
        "[line]\n"
        "point = start 0\n"
        "point = straight 1 0 5\n"
        "point = arc 1 1 0 0 sideways\n"
        "point = curve 1 1\n"));
    EXPECT_EQ(job.getErrors().size(), 4u);
}

TEST(JobFile, KeysOutsideSectionsAndLateProject) {
    JobFile job;
    EXPECT_FALSE(load(job,
        "name = loose\n"
        "[drill]\nx=1\ny=1\n"
        "[project]\nname=late\n"));

    const std::vector<std::string>& errors = job.getErrors();
    ASSERT_EQ(errors.size(), 2u);
    EXPECT_EQ(errors[0], "Line 1: Key 'name' is outside of any section");
    EXPECT_EQ(errors[1], "Line 5: [project] must come before the operations");
}

TEST(JobFile, ReloadStartsFresh) {
    JobFile job;
    ASSERT_TRUE(load(job, "[drill]\nx=1\ny=1\n"));
    ASSERT_TRUE(load(job, "[project]\nname=Second\n"));
    EXPECT_TRUE(job.getProject().operations.empty());
    EXPECT_EQ(job.getProject().name, "Second");
}

TEST(JobFile, MissingFile) {
    JobFile job;
    EXPECT_FALSE(job.loadFromFile("/nonexistent/nwss/job.ini"));
    ASSERT_EQ(job.getErrors().size(), 1u);
}
