#include "core/gcode_generator.h"

#include <cmath>
#include <iostream>
#include <sstream>

#include "core/arc_direction.h"
#include "core/corner_detection.h"
#include "core/gcode_format.h"
#include "core/hexagon.h"
#include "core/multipass.h"
#include "core/pattern_expander.h"
#include "core/tool_compensation.h"
#include "core/tube_void.h"
#include "core/validator.h"

namespace nwss {
namespace toolpath {

namespace {

// Used when a tool record carries no pass depth
const double DEFAULT_PASS_DEPTH = 0.025;

const double RADIUS_MATCH_TOLERANCE = 0.001;

void append(std::vector<std::string> &lines,
            const std::vector<std::string> &more) {
  lines.insert(lines.end(), more.begin(), more.end());
}

std::string formatValue(double value) {
  std::ostringstream ss;
  ss << value;
  return ss.str();
}

} // namespace

GCodeGenerator::GCodeGenerator(const GenerationSettings &settings,
                               const std::string &projectName,
                               double materialDepth)
    : m_settings(settings),
      m_projectName(GCodeFormat::sanitizeProjectName(projectName)),
      m_materialDepth(materialDepth) {}

double GCodeGenerator::passDepthOf(const ToolParams &params) {
  return params.passDepth > 0.0 ? params.passDepth : DEFAULT_PASS_DEPTH;
}

std::string GCodeGenerator::subroutinePath(int number) const {
  return GCodeFormat::subroutinePath(m_settings.basePath, m_projectName,
                                     number);
}

void GCodeGenerator::appendCall(std::vector<std::string> &lines,
                                const Point2D &entry, int number,
                                int loopCount) const {
  lines.push_back(
      GCodeFormat::rapid(entry.x, entry.y, m_settings.travelHeight));
  lines.push_back(GCodeFormat::rapid(0.0));
  lines.push_back(
      GCodeFormat::subroutineCall(subroutinePath(number), loopCount));
  lines.push_back(GCodeFormat::rapid(m_settings.safetyHeight));
}

void GCodeGenerator::addFallbackWarning(Run &run, const LeadInPlan &plan,
                                        const std::string &label) {
  if (plan.helicalFallback) {
    run.warnings.push_back(label + " too small for helical lead-in, using ramp");
  }
}

// ================================
// Entry points
// ================================

GenerationResult GCodeGenerator::generate(const ExpandedOperations &operations,
                                          const ToolParams *drillParams,
                                          const ToolParams *cutParams,
                                          const OperationSet *original) const {
  GenerationResult result;
  result.projectName = m_projectName;

  Run run;
  run.safety = SafetyCoordinator::create(
      m_settings.firstPassFeedFactor, m_settings.cornerSlowdownEnabled,
      m_settings.cornerFeedFactor, m_settings.arcSlowdownEnabled,
      m_settings.arcFeedFactor);

  if (cutParams && cutParams->passDepth > 0.0) {
    run.leadInDistance =
        LeadIn::leadInDistance(m_settings.rampAngle, cutParams->passDepth);
  }

  int spindleSpeed = 1000;
  if (drillParams) {
    spindleSpeed = drillParams->spindleSpeed;
  } else if (cutParams) {
    spindleSpeed = cutParams->spindleSpeed;
  }

  if (m_settings.verbose) {
    std::cout << "DEBUG: Generating '" << m_projectName << "', material depth "
              << m_materialDepth << ", subroutines "
              << (m_settings.supportsSubroutines ? "ENABLED" : "DISABLED")
              << std::endl;
    std::cout << "DEBUG: Lead-in distance " << run.leadInDistance
              << ", feed adjusters:";
    for (const auto &name : run.safety.enabledAdjusters()) {
      std::cout << " " << name;
    }
    std::cout << std::endl;
  }

  std::vector<std::string> lines =
      GCodeFormat::header(spindleSpeed, m_settings.spindleWarmupSeconds,
                          m_settings.safetyHeight);

  try {
    if (drillParams && !operations.drillPoints.empty()) {
      append(lines,
             drillLines(run, operations.drillPoints, *drillParams,
                        original ? &original->drillHoles : nullptr));
    }
    if (cutParams && !operations.circles.empty()) {
      append(lines, circleLines(run, operations.circles, *cutParams));
    }
    if (cutParams && !operations.hexagons.empty()) {
      append(lines, hexagonLines(run, operations.hexagons, *cutParams));
    }
    if (cutParams && !operations.lines.empty()) {
      append(lines, lineLines(run, operations.lines, *cutParams));
    }

    append(lines, GCodeFormat::footer(m_settings.safetyHeight));

    result.mainProgram = GCodeFormat::join(lines);
  } catch (const std::exception &e) {
    std::cerr << "Error: G-code generation failed: " << e.what() << std::endl;
    result.success = false;
    result.errors.push_back(e.what());
    result.warnings = run.warnings;
    return result;
  }

  result.subroutines = run.subroutines;
  result.warnings = run.warnings;

  if (m_settings.verbose) {
    std::cout << "DEBUG: Main program " << lines.size() << " lines, "
              << result.subroutines.size() << " subroutines, "
              << result.warnings.size() << " warnings" << std::endl;
  }
  return result;
}

double GCodeGenerator::projectMaterialDepth(const Project &project,
                                            const GenerationSettings &settings,
                                            const ToolParams *drillParams) {
  double depth = MultiPass::materialDepth(project.material);
  if (project.type == ProjectType::DRILL) {
    if (drillParams) {
      depth += drillParams->tipCompensation;
    }
  } else {
    depth += settings.cutThroughBuffer;
  }
  return depth;
}

GenerationResult
GCodeGenerator::generateProject(const Project &project,
                                const GenerationSettings &settings,
                                const ToolParams *drillParams,
                                const ToolParams *cutParams) {
  const ToolParams *drill =
      project.type == ProjectType::DRILL ? drillParams : nullptr;
  const ToolParams *cut =
      project.type == ProjectType::CUT ? cutParams : nullptr;

  ValidationReport report =
      Validator::validateProject(project, settings, drill, cut);
  if (!report.isValid()) {
    GenerationResult failed;
    failed.success = false;
    failed.projectName = GCodeFormat::sanitizeProjectName(project.name);
    failed.errors = report.errors;
    failed.warnings = report.warnings;
    return failed;
  }

  ExpandedOperations expanded;
  try {
    expanded = PatternExpander::expandAll(project.operations);
  } catch (const std::exception &e) {
    GenerationResult failed;
    failed.success = false;
    failed.projectName = GCodeFormat::sanitizeProjectName(project.name);
    failed.errors.push_back(e.what());
    return failed;
  }

  double drillDiameter = drill ? drill->toolDiameter : 0.0;
  double endMillDiameter = cut ? cut->toolDiameter : 0.0;
  TubeVoid::FilterResult filtered =
      TubeVoid::filter(expanded, project.material, project.tubeVoidSkip,
                       drillDiameter, endMillDiameter);

  if (settings.verbose && filtered.skippedCount() > 0) {
    std::cout << "DEBUG: Tube void filter removed " << filtered.skippedCount()
              << " operations" << std::endl;
  }

  GCodeGenerator generator(settings, project.name,
                           projectMaterialDepth(project, settings, drill));
  GenerationResult result = generator.generate(filtered.operations, drill,
                                               cut, &project.operations);

  result.warnings.insert(result.warnings.begin(), report.warnings.begin(),
                         report.warnings.end());
  result.skippedOperations = filtered.describeSkipped();
  return result;
}

// ================================
// Drilling
// ================================

std::vector<std::string>
GCodeGenerator::inlineDrill(const std::vector<Point2D> &points,
                            const std::vector<double> &pecks,
                            const ToolParams &params) const {
  std::vector<std::string> lines;
  for (const auto &point : points) {
    lines.push_back(
        GCodeFormat::rapid(point.x, point.y, m_settings.travelHeight));
    lines.push_back(GCodeFormat::rapid(0.0));
    for (size_t i = 0; i < pecks.size(); ++i) {
      lines.push_back(
          GCodeCommand("G01").z(-pecks[i]).f(params.plungeRate));
      lines.push_back(GCodeFormat::rapid(m_settings.safetyHeight));
      if (i + 1 < pecks.size()) {
        lines.push_back(GCodeFormat::rapid(0.0));
      }
    }
  }
  return lines;
}

std::vector<std::string> GCodeGenerator::drillLines(
    Run &run, const std::vector<Point2D> &points, const ToolParams &params,
    const std::vector<DrillOperation> *operations) const {
  std::vector<double> pecks =
      MultiPass::passDepths(m_materialDepth, params.peckingDepth);

  if (!m_settings.supportsSubroutines || operations == nullptr) {
    return inlineDrill(points, pecks, params);
  }

  std::vector<std::string> lines;
  std::vector<bool> consumed(points.size(), false);

  for (const auto &op : *operations) {
    // Match the pattern's holes against what survived filtering
    std::vector<Point2D> expanded = PatternExpander::expandDrill(op);
    std::vector<Point2D> remaining;
    bool complete = true;
    for (const auto &hole : expanded) {
      bool found = false;
      for (size_t k = 0; k < points.size(); ++k) {
        if (!consumed[k] && points[k] == hole) {
          consumed[k] = true;
          found = true;
          break;
        }
      }
      if (found) {
        remaining.push_back(hole);
      } else {
        complete = false;
      }
    }

    bool patterned = op.pattern != PatternType::SINGLE;
    if (!patterned || !complete || expanded.size() < 2) {
      append(lines, inlineDrill(remaining, pecks, params));
      continue;
    }

    int number = run.allocator.next(SubroutineKind::DRILL);
    std::string path = subroutinePath(number);

    if (op.pattern == PatternType::LINEAR) {
      run.subroutines[number] = SubroutineBuilder::file(
          SubroutineBuilder::peckDrill(pecks, params.plungeRate,
                                       m_settings.travelHeight, op.axis,
                                       op.spacing));
      lines.push_back(
          GCodeFormat::rapid(op.start.x, op.start.y, m_settings.travelHeight));
      lines.push_back(GCodeFormat::subroutineCall(path, op.count));
    } else {
      // One call per row, the subroutine steps along X
      run.subroutines[number] = SubroutineBuilder::file(
          SubroutineBuilder::peckDrill(pecks, params.plungeRate,
                                       m_settings.travelHeight,
                                       PatternAxis::X, op.xSpacing));
      for (int row = 0; row < op.yCount; ++row) {
        double y = op.start.y + row * op.ySpacing;
        lines.push_back(
            GCodeFormat::rapid(op.start.x, y, m_settings.travelHeight));
        lines.push_back(GCodeFormat::subroutineCall(path, op.xCount));
      }
    }
  }

  // Points that belong to no operation
  std::vector<Point2D> leftover;
  for (size_t k = 0; k < points.size(); ++k) {
    if (!consumed[k]) {
      leftover.push_back(points[k]);
    }
  }
  append(lines, inlineDrill(leftover, pecks, params));

  return lines;
}

// ================================
// Circles
// ================================

GCodeGenerator::CutPath
GCodeGenerator::circleCutPath(Run &run, const ExpandedCircle &circle,
                              const ToolParams &params) const {
  double cutRadius = ToolCompensation::cutRadius(
      circle.diameter, params.toolDiameter, circle.compensation);

  LeadInType type = m_settings.circleLeadIn;
  double angle = 90.0;
  if (circle.leadIn.isManual()) {
    type = circle.leadIn.type;
    angle = circle.leadIn.approachAngle;
  }

  CutPath path;
  path.leadIn = LeadIn::planCircle(circle.center, cutRadius,
                                   params.toolDiameter, type, angle,
                                   run.leadInDistance);
  addFallbackWarning(run, path.leadIn,
                     "Circle d=" + formatValue(circle.diameter) + "\"");

  PathMove move;
  move.type = PathMove::FULL_CIRCLE;
  move.to = path.leadIn.profileStart;
  move.center = circle.center;
  path.moves.push_back(move);

  path.closed = true;
  path.arcTransition = true;
  path.profileRadius = cutRadius;
  return path;
}

std::vector<std::string>
GCodeGenerator::circleLines(Run &run,
                            const std::vector<ExpandedCircle> &circles,
                            const ToolParams &params) const {
  std::vector<std::string> lines;

  std::vector<const ExpandedCircle *> automatic;
  for (const auto &circle : circles) {
    if (circle.leadIn.isManual()) {
      // Custom approach angles cannot share a subroutine
      append(lines, pathCut(run, circleCutPath(run, circle, params), params));
    } else {
      automatic.push_back(&circle);
    }
  }

  if (automatic.empty()) {
    return lines;
  }

  if (!m_settings.supportsSubroutines) {
    for (const auto *circle : automatic) {
      append(lines, pathCut(run, circleCutPath(run, *circle, params), params));
    }
    return lines;
  }

  // Circles with the same diameter, compensation and hold time share a body
  std::vector<std::vector<const ExpandedCircle *>> groups;
  for (const auto *circle : automatic) {
    bool placed = false;
    for (auto &group : groups) {
      const ExpandedCircle *first = group.front();
      if (first->diameter == circle->diameter &&
          first->compensation == circle->compensation &&
          first->holdTime == circle->holdTime) {
        group.push_back(circle);
        placed = true;
        break;
      }
    }
    if (!placed) {
      groups.push_back(std::vector<const ExpandedCircle *>(1, circle));
    }
  }

  double passDepth = passDepthOf(params);
  int numPasses = MultiPass::numPasses(m_materialDepth, passDepth);
  double actualPassDepth = m_materialDepth / numPasses;

  for (const auto &group : groups) {
    const ExpandedCircle &first = *group.front();
    double cutRadius = ToolCompensation::cutRadius(
        first.diameter, params.toolDiameter, first.compensation);

    // Planned around the origin; each circle offsets by its own center
    LeadInPlan plan = LeadIn::planCircle(Point2D(0.0, 0.0), cutRadius,
                                         params.toolDiameter,
                                         m_settings.circleLeadIn, 90.0,
                                         run.leadInDistance);
    addFallbackWarning(run, plan,
                       "Circle d=" + formatValue(first.diameter) + "\"");

    CirclePassSpec spec;
    spec.cutRadius = cutRadius;
    spec.passDepth = actualPassDepth;
    spec.plungeRate = params.plungeRate;
    spec.feedRate = params.feedRate;
    spec.arcFeed = run.safety.getAdjustedFeed(params.feedRate, -1, true);
    spec.leadIn = plan.type;
    spec.leadInDistance = run.leadInDistance;
    spec.helixRadius = plan.helixRadius;
    spec.helixPitch = m_settings.helixPitch;
    spec.approachAngle = 90.0;
    spec.holdTime = first.holdTime;

    int number = run.allocator.next(SubroutineKind::CIRCLE);
    run.subroutines[number] =
        SubroutineBuilder::file(SubroutineBuilder::circlePass(spec));

    Point2D relativeEntry = plan.entryPoint();
    for (const auto *circle : group) {
      appendCall(lines, circle->center + relativeEntry, number, numPasses);
    }
  }

  return lines;
}

// ================================
// Hexagons
// ================================

GCodeGenerator::CutPath
GCodeGenerator::hexagonCutPath(Run &run, const ExpandedHexagon &hexagon,
                               const ToolParams &params) const {
  std::vector<Point2D> vertices = ToolCompensation::hexagonVertices(
      hexagon.center, hexagon.flatToFlat, params.toolDiameter,
      hexagon.compensation);

  LeadInType type = m_settings.hexagonLeadIn;
  double angle = 90.0;
  bool manual = hexagon.leadIn.isManual();
  if (manual) {
    type = hexagon.leadIn.type;
    angle = hexagon.leadIn.approachAngle;
  }

  CutPath path;
  path.leadIn = LeadIn::planHexagon(
      hexagon.center, hexagon.flatToFlat, hexagon.compensation, vertices,
      params.toolDiameter, type, angle, manual, run.leadInDistance);

  std::ostringstream label;
  label << "Hexagon ftf=" << hexagon.flatToFlat << "\" at ("
        << hexagon.center.x << ", " << hexagon.center.y << ")";
  addFallbackWarning(run, path.leadIn, label.str());

  for (size_t i = 1; i < vertices.size(); ++i) {
    PathMove move;
    move.to = vertices[i];
    path.moves.push_back(move);
  }
  PathMove close;
  close.to = vertices[0];
  path.moves.push_back(close);

  path.closed = true;
  path.arcTransition = false;
  return path;
}

std::vector<std::string>
GCodeGenerator::hexagonLines(Run &run,
                             const std::vector<ExpandedHexagon> &hexagons,
                             const ToolParams &params) const {
  std::vector<std::string> lines;

  if (!m_settings.supportsSubroutines) {
    for (const auto &hexagon : hexagons) {
      append(lines, pathCut(run, hexagonCutPath(run, hexagon, params), params));
    }
    return lines;
  }

  double passDepth = passDepthOf(params);
  int numPasses = MultiPass::numPasses(m_materialDepth, passDepth);
  double actualPassDepth = m_materialDepth / numPasses;

  // Vertices are absolute, so every hexagon gets its own body
  for (const auto &hexagon : hexagons) {
    CutPath path = hexagonCutPath(run, hexagon, params);

    HexagonPassSpec spec;
    spec.vertices = ToolCompensation::hexagonVertices(
        hexagon.center, hexagon.flatToFlat, params.toolDiameter,
        hexagon.compensation);
    spec.center = hexagon.center;
    spec.passDepth = actualPassDepth;
    spec.plungeRate = params.plungeRate;
    spec.feedRate = params.feedRate;
    spec.helixEndFeed = run.safety.getAdjustedFeed(params.feedRate, -1, true);
    spec.leadIn = path.leadIn.type;
    spec.leadInPoint = path.leadIn.leadInPoint;
    spec.helixRadius = path.leadIn.helixRadius;
    spec.helixPitch = m_settings.helixPitch;
    spec.approachAngle = path.leadIn.approachAngle;
    spec.holdTime = hexagon.holdTime;

    int number = run.allocator.next(SubroutineKind::HEXAGON);
    run.subroutines[number] =
        SubroutineBuilder::file(SubroutineBuilder::hexagonPass(spec));

    appendCall(lines, path.leadIn.entryPoint(), number, numPasses);
  }

  return lines;
}

// ================================
// Line paths
// ================================

GCodeGenerator::CutPath
GCodeGenerator::lineCutPath(const std::vector<PathPoint> &points,
                            const LeadInPlan &leadIn) const {
  CutPath path;
  path.leadIn = leadIn;
  path.closed = Geometry::isClosed(pathPositions(points));
  path.cornerSlowdown = m_settings.cornerSlowdownEnabled;
  path.arcTransition = false;

  std::vector<double> severities = CornerDetector::cornerSeverities(points);
  for (size_t i = 1; i < points.size(); ++i) {
    PathMove move;
    move.type = points[i].isArc() ? PathMove::ARC : PathMove::LINEAR;
    move.to = points[i].position();
    move.center = points[i].center;
    move.hint = points[i].hint;
    move.cornerFactor = severities[i];
    path.moves.push_back(move);
  }
  return path;
}

std::vector<std::string>
GCodeGenerator::lineLines(Run &run, const std::vector<LineOperation> &lineOps,
                          const ToolParams &params) const {
  std::vector<std::string> lines;

  double passDepth = passDepthOf(params);
  int numPasses = MultiPass::numPasses(m_materialDepth, passDepth);
  double actualPassDepth = m_materialDepth / numPasses;

  for (const auto &op : lineOps) {
    if (op.points.empty()) {
      continue;
    }

    std::vector<std::string> arcWarnings =
        Validator::validateArcGeometry(op.points);
    run.warnings.insert(run.warnings.end(), arcWarnings.begin(),
                        arcWarnings.end());

    std::vector<PathPoint> points = ToolCompensation::compensateLinePath(
        op.points, params.toolDiameter, op.compensation);

    LeadInType type = m_settings.lineLeadIn;
    bool manual = op.leadIn.isManual();
    if (manual) {
      type = op.leadIn.type;
    }
    LeadInPlan plan =
        LeadIn::planLine(points, op.compensation, type, manual,
                         op.leadIn.approachAngle, run.leadInDistance);

    bool closed = Geometry::isClosed(pathPositions(points));

    // An open path cannot repeat from where it ended, so multi-pass open
    // paths are cut inline with a retract between passes
    if (!m_settings.supportsSubroutines || (!closed && numPasses > 1)) {
      append(lines, pathCut(run, lineCutPath(points, plan), params));
      continue;
    }

    LinePassSpec spec;
    spec.points = points;
    spec.passDepth = actualPassDepth;
    spec.plungeRate = params.plungeRate;
    spec.feedRate = params.feedRate;
    spec.hasLeadIn = plan.type == LeadInType::RAMP;
    spec.leadInPoint = plan.leadInPoint;
    spec.holdTime = op.holdTime;

    int number = run.allocator.next(SubroutineKind::LINE);
    run.subroutines[number] = SubroutineBuilder::file(
        SubroutineBuilder::linePath(spec, run.safety));

    appendCall(lines, plan.entryPoint(), number, numPasses);
  }

  return lines;
}

// ================================
// Inline profile cutting
// ================================

std::vector<std::string> GCodeGenerator::pathCut(Run &run,
                                                 const CutPath &path,
                                                 const ToolParams &params) const {
  std::vector<std::string> lines;
  const LeadInPlan &leadIn = path.leadIn;

  bool helical =
      leadIn.type == LeadInType::HELICAL && leadIn.helixRadius > 0.0;
  bool ramp = leadIn.type == LeadInType::RAMP;

  Point2D entry = leadIn.entryPoint();
  Point2D helixStart = leadIn.helixStart();
  const Point2D &profileStart = leadIn.profileStart;

  lines.push_back(GCodeFormat::rapid(entry.x, entry.y, m_settings.travelHeight));
  lines.push_back(GCodeFormat::rapid(0.0));

  std::vector<double> depths =
      MultiPass::passDepths(m_materialDepth, passDepthOf(params));

  double previousDepth = 0.0;
  for (size_t pass = 0; pass < depths.size(); ++pass) {
    int passNum = static_cast<int>(pass);
    double depth = depths[pass];
    double feed = run.safety.getAdjustedFeed(params.feedRate, passNum);

    if (helical) {
      double angle = Geometry::approachAngleToRadians(leadIn.approachAngle);
      double iOffset = -leadIn.helixRadius * std::cos(angle);
      double jOffset = -leadIn.helixRadius * std::sin(angle);

      // Descend from the previous pass depth to this one
      double drop = depth - previousDepth;
      int revolutions = LeadIn::helixRevolutions(drop, m_settings.helixPitch);
      std::vector<double> feeds =
          LeadIn::helixFeeds(revolutions, params.plungeRate, feed);
      for (int rev = 0; rev < revolutions; ++rev) {
        double z = -(previousDepth + drop * (rev + 1) / revolutions);
        lines.push_back(GCodeCommand("G02")
                            .x(helixStart.x)
                            .y(helixStart.y)
                            .z(z)
                            .i(iOffset)
                            .j(jOffset)
                            .f(feeds[rev]));
      }

      if (path.arcTransition) {
        if (std::fabs(leadIn.helixRadius - path.profileRadius) >
            RADIUS_MATCH_TOLERANCE) {
          lines.push_back(GCodeCommand("G02")
                              .x(profileStart.x)
                              .y(profileStart.y)
                              .i(iOffset)
                              .j(jOffset)
                              .f(feed));
        }
      } else {
        lines.push_back(
            GCodeCommand("G01").x(profileStart.x).y(profileStart.y).f(feed));
      }
    } else if (ramp) {
      lines.push_back(GCodeCommand("G01")
                          .x(profileStart.x)
                          .y(profileStart.y)
                          .z(-depth)
                          .f(params.plungeRate));
    } else {
      lines.push_back(GCodeCommand("G01").z(-depth).f(params.plungeRate));
    }

    Point2D current = profileStart;
    for (const auto &move : path.moves) {
      bool isArc = move.type != PathMove::LINEAR;
      double corner = path.cornerSlowdown ? move.cornerFactor : 1.0;
      double moveFeed =
          run.safety.getAdjustedFeed(params.feedRate, passNum, isArc, corner);

      if (move.type == PathMove::FULL_CIRCLE) {
        Point2D ij = ArcResolver::offsets(current, move.center);
        lines.push_back(GCodeCommand("G02").i(ij.x).j(ij.y).f(moveFeed));
      } else if (move.type == PathMove::ARC) {
        ArcDirection direction =
            ArcResolver::resolve(current, move.to, move.center, move.hint);
        Point2D ij = ArcResolver::offsets(current, move.center);
        lines.push_back(GCodeCommand(ArcResolver::gcode(direction))
                            .x(move.to.x)
                            .y(move.to.y)
                            .i(ij.x)
                            .j(ij.y)
                            .f(moveFeed));
      } else {
        lines.push_back(
            GCodeCommand("G01").x(move.to.x).y(move.to.y).f(moveFeed));
      }
      current = move.to;
    }

    bool lastPass = pass + 1 == depths.size();
    if (path.closed) {
      if (helical) {
        lines.push_back(
            GCodeCommand("G01").x(helixStart.x).y(helixStart.y).f(feed));
      } else if (ramp) {
        lines.push_back(GCodeCommand("G01")
                            .x(leadIn.leadInPoint.x)
                            .y(leadIn.leadInPoint.y)
                            .f(feed));
      }
    } else if (!lastPass) {
      // Open path: lift out and start the next pass from the entry point
      lines.push_back(GCodeFormat::rapid(m_settings.travelHeight));
      lines.push_back(GCodeFormat::rapid(entry.x, entry.y));
      lines.push_back(GCodeFormat::rapid(0.0));
    }

    previousDepth = depth;
  }

  lines.push_back(GCodeFormat::rapid(m_settings.safetyHeight));
  return lines;
}

} // namespace toolpath
} // namespace nwss
