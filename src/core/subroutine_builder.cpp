#include "core/subroutine_builder.h"

#include <algorithm>
#include <cmath>
#include <string>

#include "core/arc_direction.h"
#include "core/corner_detection.h"
#include "core/errors.h"
#include "core/gcode_format.h"
#include "core/lead_in.h"

namespace nwss {
namespace toolpath {

namespace {

// Offsets smaller than this are left out of relative moves
const double NEGLIGIBLE_OFFSET = 0.0001;

// Helix and profile radii closer than this need no transition arc
const double RADIUS_MATCH_TOLERANCE = 0.001;

const char *kindName(SubroutineKind kind) {
  switch (kind) {
  case SubroutineKind::CIRCLE:
    return "circle";
  case SubroutineKind::HEXAGON:
    return "hexagon";
  case SubroutineKind::LINE:
    return "line";
  case SubroutineKind::DRILL:
    break;
  }
  return "drill";
}

} // namespace

// ================================
// SubroutineAllocator
// ================================

void SubroutineAllocator::range(SubroutineKind kind, int &first, int &last) {
  switch (kind) {
  case SubroutineKind::CIRCLE:
    first = 1100;
    break;
  case SubroutineKind::HEXAGON:
    first = 1200;
    break;
  case SubroutineKind::LINE:
    first = 1300;
    break;
  case SubroutineKind::DRILL:
  default:
    first = 1000;
    break;
  }
  last = first + 99;
}

int SubroutineAllocator::next(SubroutineKind kind) {
  int first = 0;
  int last = 0;
  range(kind, first, last);

  for (int candidate = first; candidate <= last; ++candidate) {
    if (!isUsed(candidate)) {
      m_used.push_back(candidate);
      return candidate;
    }
  }

  // Spilling into the next range would collide with another kind's files
  throw ValidationError("Too many " + std::string(kindName(kind)) +
                        " subroutines: numbers " + std::to_string(first) +
                        "-" + std::to_string(last) + " are all in use");
}

bool SubroutineAllocator::isUsed(int number) const {
  return std::find(m_used.begin(), m_used.end(), number) != m_used.end();
}

// ================================
// Shared pieces
// ================================

void SubroutineBuilder::insertDwell(std::vector<std::string> &lines,
                                    double holdTime) {
  if (holdTime <= 0.0) {
    return;
  }
  // Dwell in milliseconds, right after the first G91
  long ms = static_cast<long>(holdTime * 1000.0);
  std::string dwell = GCodeCommand("G04").p(ms);
  lines.insert(lines.begin() + std::min<size_t>(1, lines.size()), dwell);
}

std::vector<std::string> SubroutineBuilder::plungePreamble(double passDepth,
                                                           double plungeRate) {
  return std::vector<std::string>{
      "G91", GCodeCommand("G01").z(-passDepth).f(plungeRate), "G90"};
}

std::vector<std::string> SubroutineBuilder::rampPreamble(const Point2D &from,
                                                         const Point2D &to,
                                                         double passDepth,
                                                         double plungeRate) {
  return std::vector<std::string>{"G91",
                                  GCodeCommand("G01")
                                      .x(to.x - from.x)
                                      .y(to.y - from.y)
                                      .z(-passDepth)
                                      .f(plungeRate),
                                  "G90"};
}

std::string SubroutineBuilder::file(const std::vector<std::string> &body) {
  std::vector<std::string> lines = body;
  for (const auto &line : GCodeFormat::subroutineEnd()) {
    lines.push_back(line);
  }
  return GCodeFormat::join(lines);
}

// ================================
// Bodies
// ================================

std::vector<std::string>
SubroutineBuilder::peckDrill(const std::vector<double> &pecks,
                             double plungeRate, double travelHeight,
                             PatternAxis axis, double spacing) {
  std::vector<std::string> lines;
  lines.push_back("G00 Z0");
  lines.push_back("G91");

  // Each peck starts from the surface after the previous full retract
  for (double depth : pecks) {
    lines.push_back(GCodeCommand("G01").z(-depth).f(plungeRate));
    lines.push_back(GCodeCommand("G00").z(depth));
  }

  lines.push_back(GCodeCommand("G00").z(travelHeight));
  if (axis == PatternAxis::X) {
    lines.push_back(GCodeCommand("G00").x(spacing));
  } else {
    lines.push_back(GCodeCommand("G00").y(spacing));
  }
  lines.push_back("G90");
  return lines;
}

std::vector<std::string>
SubroutineBuilder::circlePass(const CirclePassSpec &spec) {
  std::vector<std::string> lines;

  double angle = Geometry::approachAngleToRadians(spec.approachAngle);
  double c = std::cos(angle);
  double s = std::sin(angle);
  double r = spec.cutRadius;
  double h = spec.helixRadius;

  bool helical = spec.leadIn == LeadInType::HELICAL && h > 0.0;
  bool ramp = spec.leadIn == LeadInType::RAMP && spec.leadInDistance > 0.0;

  if (helical) {
    // Full relative circles around the center, then out to the profile
    int revolutions = LeadIn::helixRevolutions(spec.passDepth, spec.helixPitch);
    double depthPerRev = spec.passDepth / revolutions;
    std::vector<double> feeds =
        LeadIn::helixFeeds(revolutions, spec.plungeRate, spec.arcFeed);

    lines.push_back("G91");
    for (int rev = 0; rev < revolutions; ++rev) {
      lines.push_back(GCodeCommand("G02")
                          .x(0.0)
                          .y(0.0)
                          .z(-depthPerRev)
                          .i(-h * c)
                          .j(-h * s)
                          .f(feeds[rev]));
    }
    if (std::fabs(h - r) > RADIUS_MATCH_TOLERANCE) {
      lines.push_back(GCodeCommand("G02")
                          .x((r - h) * c)
                          .y((r - h) * s)
                          .i(-h * c)
                          .j(-h * s)
                          .f(spec.arcFeed));
    }
    lines.push_back("G90");
  } else if (ramp) {
    double dx = -spec.leadInDistance * c;
    double dy = -spec.leadInDistance * s;
    GCodeCommand move("G01");
    move.x(dx);
    if (std::fabs(dy) >= NEGLIGIBLE_OFFSET) {
      move.y(dy);
    }
    move.z(-spec.passDepth).f(spec.plungeRate);
    lines.push_back("G91");
    lines.push_back(move);
    lines.push_back("G90");
  } else {
    lines = plungePreamble(spec.passDepth, spec.plungeRate);
  }

  insertDwell(lines, spec.holdTime);

  double iOffset = -r * c;
  double jOffset = -r * s;
  lines.push_back(GCodeCommand("G02").i(iOffset).j(jOffset).f(spec.arcFeed));

  if (helical) {
    if (std::fabs(h - r) > RADIUS_MATCH_TOLERANCE) {
      lines.push_back("G91");
      lines.push_back(GCodeCommand("G02")
                          .x((h - r) * c)
                          .y((h - r) * s)
                          .i(iOffset)
                          .j(jOffset)
                          .f(spec.arcFeed));
      lines.push_back("G90");
    }
  } else if (ramp) {
    double dx = spec.leadInDistance * c;
    double dy = spec.leadInDistance * s;
    GCodeCommand move("G01");
    move.x(dx);
    if (std::fabs(dy) >= NEGLIGIBLE_OFFSET) {
      move.y(dy);
    }
    move.f(spec.feedRate);
    lines.push_back("G91");
    lines.push_back(move);
    lines.push_back("G90");
  }

  return lines;
}

std::vector<std::string>
SubroutineBuilder::hexagonPass(const HexagonPassSpec &spec) {
  std::vector<std::string> lines;
  if (spec.vertices.empty()) {
    return lines;
  }

  const Point2D &v0 = spec.vertices[0];
  bool helical = spec.leadIn == LeadInType::HELICAL && spec.helixRadius > 0.0;
  bool ramp = spec.leadIn == LeadInType::RAMP;

  Point2D helixStart =
      LeadIn::pointAtAngle(spec.center, spec.helixRadius, spec.approachAngle);

  if (helical) {
    double angle = Geometry::approachAngleToRadians(spec.approachAngle);
    double h = spec.helixRadius;
    int revolutions = LeadIn::helixRevolutions(spec.passDepth, spec.helixPitch);
    double depthPerRev = spec.passDepth / revolutions;
    std::vector<double> feeds =
        LeadIn::helixFeeds(revolutions, spec.plungeRate, spec.helixEndFeed);

    lines.push_back("G91");
    for (int rev = 0; rev < revolutions; ++rev) {
      lines.push_back(GCodeCommand("G02")
                          .x(0.0)
                          .y(0.0)
                          .z(-depthPerRev)
                          .i(-h * std::cos(angle))
                          .j(-h * std::sin(angle))
                          .f(feeds[rev]));
    }
    lines.push_back("G90");
    lines.push_back(GCodeCommand("G01").x(v0.x).y(v0.y).f(spec.helixEndFeed));
  } else if (ramp) {
    lines = rampPreamble(spec.leadInPoint, v0, spec.passDepth, spec.plungeRate);
  } else {
    lines = plungePreamble(spec.passDepth, spec.plungeRate);
  }

  insertDwell(lines, spec.holdTime);

  for (size_t i = 1; i < spec.vertices.size(); ++i) {
    const Point2D &v = spec.vertices[i];
    lines.push_back(GCodeCommand("G01").x(v.x).y(v.y).f(spec.feedRate));
  }
  lines.push_back(GCodeCommand("G01").x(v0.x).y(v0.y));

  if (helical) {
    lines.push_back(GCodeCommand("G01").x(helixStart.x).y(helixStart.y));
  } else if (ramp) {
    lines.push_back(
        GCodeCommand("G01").x(spec.leadInPoint.x).y(spec.leadInPoint.y));
  }

  return lines;
}

std::vector<std::string>
SubroutineBuilder::linePath(const LinePassSpec &spec,
                            const SafetyCoordinator &safety) {
  std::vector<std::string> lines;
  if (spec.points.empty()) {
    return lines;
  }

  Point2D start = spec.points[0].position();
  if (spec.hasLeadIn) {
    lines = rampPreamble(spec.leadInPoint, start, spec.passDepth,
                         spec.plungeRate);
  } else {
    lines = plungePreamble(spec.passDepth, spec.plungeRate);
  }

  insertDwell(lines, spec.holdTime);

  // The body repeats for every pass, so no pass counts as the first one
  const int anyPass = -1;
  std::vector<double> severities = CornerDetector::cornerSeverities(spec.points);

  Point2D current = start;
  for (size_t i = 1; i < spec.points.size(); ++i) {
    const PathPoint &point = spec.points[i];
    double feed = safety.getAdjustedFeed(spec.feedRate, anyPass, point.isArc(),
                                         severities[i]);

    if (point.isArc()) {
      ArcDirection direction = ArcResolver::resolve(
          current, point.position(), point.center, point.hint);
      Point2D ij = ArcResolver::offsets(current, point.center);
      lines.push_back(GCodeCommand(ArcResolver::gcode(direction))
                          .x(point.x)
                          .y(point.y)
                          .i(ij.x)
                          .j(ij.y)
                          .f(feed));
    } else {
      lines.push_back(GCodeCommand("G01").x(point.x).y(point.y).f(feed));
    }
    current = point.position();
  }

  if (spec.hasLeadIn && Geometry::isClosed(pathPositions(spec.points))) {
    lines.push_back(
        GCodeCommand("G01").x(spec.leadInPoint.x).y(spec.leadInPoint.y));
  }

  return lines;
}

} // namespace toolpath
} // namespace nwss
