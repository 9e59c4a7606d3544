#include <gtest/gtest.h>

#include "core/errors.h"
#include "core/gcode_format.h"

using namespace nwss::toolpath;

TEST(GCodeFormat, CoordinateAndFeedPrecision) {
  EXPECT_EQ(GCodeFormat::coordinate(1.5), "1.5000");
  EXPECT_EQ(GCodeFormat::coordinate(-0.125), "-0.1250");
  EXPECT_EQ(GCodeFormat::coordinate(2.0, 2), "2.00");
  EXPECT_EQ(GCodeFormat::feed(12.0), "12.0");
  EXPECT_EQ(GCodeFormat::feed(7.5), "7.5");
}

TEST(GCodeFormat, NoNegativeZero) {
  EXPECT_EQ(GCodeFormat::coordinate(-0.0), "0.0000");
  EXPECT_EQ(GCodeFormat::coordinate(-0.00001), "0.0000");
  EXPECT_EQ(GCodeFormat::feed(-0.01), "0.0");
}

TEST(GCodeFormat, CommandWords) {
  std::string line = GCodeCommand("G01").x(1).y(2).z(-0.025).f(10);
  EXPECT_EQ(line, "G01 X1.0000 Y2.0000 Z-0.0250 F10.0");

  EXPECT_EQ(GCodeCommand("G02").i(-0.375).j(0).str(), "G02 I-0.3750 J0.0000");
  EXPECT_EQ(GCodeCommand("M03").s(18000).str(), "M03 S18000");
  EXPECT_EQ(GCodeCommand("G04").p(1500).str(), "G04 P1500");
}

TEST(GCodeFormat, HeaderAndFooter) {
  std::vector<std::string> header = GCodeFormat::header(12000, 3, 0.5);
  std::vector<std::string> expectedHeader = {"G20 G90", "G00 X0 Y0 Z0",
                                             "G00 Z0.5000", "M03 S12000",
                                             "G04 P3"};
  EXPECT_EQ(header, expectedHeader);

  std::vector<std::string> footer = GCodeFormat::footer(0.5);
  std::vector<std::string> expectedFooter = {"M05", "G00 Z0.5000", "G00 X0 Y0",
                                             "M30"};
  EXPECT_EQ(footer, expectedFooter);
}

TEST(GCodeFormat, Rapids) {
  EXPECT_EQ(GCodeFormat::rapid(0.1), "G00 Z0.1000");
  EXPECT_EQ(GCodeFormat::rapid(1, 2), "G00 X1.0000 Y2.0000");
  EXPECT_EQ(GCodeFormat::rapid(1, 2, 0.1), "G00 X1.0000 Y2.0000 Z0.1000");
}

TEST(GCodeFormat, SubroutinePathAndCall) {
  std::string path =
      GCodeFormat::subroutinePath("C:/Mach3/GCode", "Bracket", 1100);
  EXPECT_EQ(path, "C:\\Mach3\\GCode\\Bracket\\1100.nc");

  EXPECT_EQ(GCodeFormat::subroutineCall(path, 5),
            "M98 (-C:\\Mach3\\GCode\\Bracket\\1100.nc) L5");

  std::vector<std::string> end = GCodeFormat::subroutineEnd();
  ASSERT_EQ(end.size(), 2u);
  EXPECT_EQ(end[0], "M99");
  EXPECT_EQ(end[1], "%");
}

TEST(GCodeFormat, SanitizeProjectName) {
  EXPECT_EQ(GCodeFormat::sanitizeProjectName("My Part #2 (rev-b)"),
            "My_Part_2_rev-b");
  EXPECT_EQ(GCodeFormat::sanitizeProjectName("../etc"), "etc");
  EXPECT_EQ(GCodeFormat::sanitizeProjectName(std::string(60, 'a')).size(), 50u);
  EXPECT_EQ(GCodeFormat::sanitizeProjectName(""), "");
}

TEST(GCodeFormat, CommentDetection) {
  EXPECT_TRUE(GCodeFormat::isCommentFree("G01 X1.0000 F10.0"));
  EXPECT_TRUE(GCodeFormat::isCommentFree("M98 (-C:\\a\\b\\1000.nc) L3"));

  EXPECT_FALSE(GCodeFormat::isCommentFree("G01 X1.0000 (finish)"));
  EXPECT_FALSE(GCodeFormat::isCommentFree("G00 Z0.5 ; retract"));
  EXPECT_FALSE(GCodeFormat::isCommentFree("M98 (-C:\\a\\1000.nc) L3 (x)"));
  EXPECT_FALSE(GCodeFormat::isCommentFree("M98 (-unterminated"));
}

TEST(GCodeFormat, JoinUsesNewlinesWithoutTrailingOne) {
  EXPECT_EQ(GCodeFormat::join({"G20 G90", "M30"}), "G20 G90\nM30");
  EXPECT_EQ(GCodeFormat::join({}), "");
}

TEST(GCodeFormat, JoinRefusesComments) {
  EXPECT_THROW(GCodeFormat::join({"G20 G90", "(hello)"}), ToolpathError);
}
