#include "core/validator.h"
#include "core/errors.h"
#include "core/hexagon.h"
#include "core/pattern_expander.h"
#include "core/tool_compensation.h"
#include <cmath>
#include <iomanip>
#include <sstream>

namespace nwss {
namespace toolpath {

namespace {

std::string num(double value) {
    std::ostringstream ss;
    ss << value;
    return ss.str();
}

std::string fixed(double value, int precision) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(precision) << value;
    return ss.str();
}

std::string point(double x, double y) {
    return "(" + num(x) + ", " + num(y) + ")";
}

// "Drill operation 2 (holes-a)"
std::string label(const std::string& kind, size_t index, const std::string& id) {
    std::string text = kind + " operation " + std::to_string(index + 1);
    if (!id.empty()) {
        text += " (" + id + ")";
    }
    return text;
}

void checkPattern(std::vector<std::string>& errors, const std::string& name,
                  PatternType pattern, int count, double spacing) {
    if (pattern != PatternType::LINEAR) {
        return;
    }
    if (count < 1) {
        errors.push_back(name + ": count must be at least 1");
    }
    if (spacing <= 0.0) {
        errors.push_back(name + ": spacing must be greater than 0");
    }
}

bool exceedsMax(double x, double y, const GenerationSettings& settings) {
    return x > settings.maxX || y > settings.maxY;
}

bool belowZero(double x, double y, const GenerationSettings& settings) {
    return !settings.allowNegativeCoordinates && (x < 0.0 || y < 0.0);
}

} // namespace

void Validator::addError(ValidationReport& report, const std::string& message) {
    report.errors.push_back(message);
    report.success = false;
}

void Validator::addWarning(ValidationReport& report, const std::string& message) {
    report.warnings.push_back(message);
}

std::vector<std::string> Validator::validate(const OperationSet& operations,
                                             const GenerationSettings& settings,
                                             double toolDiameter) {
    std::vector<std::string> errors;

    // Structure first: bounds are meaningless for a malformed pattern
    for (size_t i = 0; i < operations.drillHoles.size(); ++i) {
        const DrillOperation& op = operations.drillHoles[i];
        std::string name = label("Drill", i, op.id);
        checkPattern(errors, name, op.pattern, op.count, op.spacing);
        if (op.pattern == PatternType::GRID) {
            if (op.xCount < 1 || op.yCount < 1) {
                errors.push_back(name + ": grid counts must be at least 1");
            }
            if (op.xSpacing <= 0.0 || op.ySpacing <= 0.0) {
                errors.push_back(name + ": grid spacing must be greater than 0");
            }
        }
    }

    for (size_t i = 0; i < operations.circularCuts.size(); ++i) {
        const CircleOperation& op = operations.circularCuts[i];
        std::string name = label("Circle", i, op.id);
        if (op.diameter <= 0.0) {
            errors.push_back(name + ": diameter must be greater than 0");
        }
        if (op.pattern == PatternType::GRID) {
            errors.push_back(name + ": grid patterns are not supported for circular cuts");
        }
        checkPattern(errors, name, op.pattern, op.count, op.spacing);
    }

    for (size_t i = 0; i < operations.hexagonalCuts.size(); ++i) {
        const HexagonOperation& op = operations.hexagonalCuts[i];
        std::string name = label("Hexagon", i, op.id);
        if (op.flatToFlat <= 0.0) {
            errors.push_back(name + ": flat-to-flat must be greater than 0");
        }
        if (op.pattern == PatternType::GRID) {
            errors.push_back(name + ": grid patterns are not supported for hexagonal cuts");
        }
        checkPattern(errors, name, op.pattern, op.count, op.spacing);
    }

    for (size_t i = 0; i < operations.lineCuts.size(); ++i) {
        const LineOperation& op = operations.lineCuts[i];
        std::string name = label("Line", i, op.id);
        if (op.points.size() < 2) {
            errors.push_back(name + ": a line path needs at least 2 points");
        } else if (op.points[0].type != PathPointType::START) {
            errors.push_back(name + ": the first point must be a start point");
        }
    }

    if (!errors.empty()) {
        return errors;
    }

    // Each operation is expanded on its own so its messages carry its index
    for (size_t i = 0; i < operations.drillHoles.size(); ++i) {
        const DrillOperation& op = operations.drillHoles[i];
        std::string name = label("Drill", i, op.id);
        for (const auto& p : PatternExpander::expandDrill(op)) {
            if (exceedsMax(p.x, p.y, settings)) {
                errors.push_back(name + ": drill point " + point(p.x, p.y) +
                                 " exceeds machine bounds");
            } else if (belowZero(p.x, p.y, settings)) {
                errors.push_back(name + ": drill point " + point(p.x, p.y) +
                                 " is outside machine bounds (negative coordinate)");
            }
        }
    }

    for (size_t i = 0; i < operations.circularCuts.size(); ++i) {
        const CircleOperation& op = operations.circularCuts[i];
        std::string name = label("Circle", i, op.id);
        for (const auto& c : PatternExpander::expandCircle(op)) {
            double radius = c.diameter / 2.0;
            if (exceedsMax(c.center.x + radius, c.center.y + radius, settings)) {
                errors.push_back(name + ": circle at " + point(c.center.x, c.center.y) +
                                 " extends outside machine bounds");
            } else if (belowZero(c.center.x - radius, c.center.y - radius, settings)) {
                errors.push_back(name + ": circle at " + point(c.center.x, c.center.y) +
                                 " extends past zero");
            }
        }

        // Every instance shares the diameter, one check covers the pattern
        if (toolDiameter > 0.0) {
            try {
                ToolCompensation::cutRadius(op.diameter, toolDiameter, op.compensation);
            } catch (const InvalidGeometryError& e) {
                errors.push_back(name + ": " + e.what());
            }
        }
    }

    for (size_t i = 0; i < operations.hexagonalCuts.size(); ++i) {
        const HexagonOperation& op = operations.hexagonalCuts[i];
        std::string name = label("Hexagon", i, op.id);
        double apothem = Hexagon::apothem(op.flatToFlat);
        double circumradius = Hexagon::circumradius(op.flatToFlat);
        for (const auto& h : PatternExpander::expandHexagon(op)) {
            if (exceedsMax(h.center.x + apothem, h.center.y + circumradius, settings)) {
                errors.push_back(name + ": hexagon at " + point(h.center.x, h.center.y) +
                                 " extends outside machine bounds");
            } else if (belowZero(h.center.x - apothem, h.center.y - circumradius, settings)) {
                errors.push_back(name + ": hexagon at " + point(h.center.x, h.center.y) +
                                 " extends past zero");
            }
        }

        if (toolDiameter > 0.0) {
            try {
                ToolCompensation::hexagonVertices(op.center, op.flatToFlat, toolDiameter,
                                                  op.compensation);
            } catch (const InvalidGeometryError& e) {
                errors.push_back(name + ": " + e.what());
            }
        }
    }

    for (size_t i = 0; i < operations.lineCuts.size(); ++i) {
        const LineOperation& line = operations.lineCuts[i];
        std::string name = label("Line", i, line.id);
        std::vector<PathPoint> points = line.points;
        if (line.compensation != CompensationMode::NONE && toolDiameter > 0.0) {
            try {
                points = ToolCompensation::compensateLinePath(line.points, toolDiameter,
                                                              line.compensation);
            } catch (const InvalidGeometryError& e) {
                errors.push_back(name + ": " + e.what());
                continue;
            }
        }

        for (const auto& p : points) {
            if (exceedsMax(p.x, p.y, settings)) {
                errors.push_back(name + ": line point (" + fixed(p.x, 3) + ", " +
                                 fixed(p.y, 3) + ") exceeds machine bounds");
            } else if (belowZero(p.x, p.y, settings)) {
                errors.push_back(name + ": line point (" + fixed(p.x, 3) + ", " +
                                 fixed(p.y, 3) + ") has negative coordinate");
            }
        }
    }

    return errors;
}

std::vector<std::string> Validator::validateArcGeometry(const std::vector<PathPoint>& points,
                                                        double tolerance) {
    std::vector<std::string> warnings;

    for (size_t i = 0; i < points.size(); ++i) {
        const PathPoint& end = points[i];
        if (!end.isArc()) {
            continue;
        }
        if (i == 0) {
            warnings.push_back("Arc at point 0: arc cannot be the first point in path");
            continue;
        }

        const PathPoint& start = points[i - 1];
        double startRadius = start.position().distanceTo(end.center);
        double endRadius = end.position().distanceTo(end.center);
        double difference = std::fabs(startRadius - endRadius);

        if (difference > tolerance) {
            warnings.push_back(
                "Arc from " + point(start.x, start.y) + " to " + point(end.x, end.y) +
                " has invalid geometry: start is " + fixed(startRadius, 4) +
                "\" from center " + point(end.center.x, end.center.y) + ", but end is " +
                fixed(endRadius, 4) + "\" from center. Difference of " + fixed(difference, 4) +
                "\" exceeds tolerance of " + num(tolerance) +
                "\". This will cause discontinuities in tool-compensated paths.");
        }
    }

    return warnings;
}

void Validator::validateStepdown(double passDepth, double toolDiameter,
                                 double maxStepdownFactor, ValidationReport& report) {
    if (passDepth <= 0.0 || toolDiameter <= 0.0) {
        return;
    }

    double ratio = passDepth / toolDiameter;
    if (ratio > 1.0) {
        addError(report, "Pass depth (" + fixed(passDepth, 4) + "\") exceeds tool diameter (" +
                             fixed(toolDiameter, 4) +
                             "\"). This will almost certainly break the end mill. "
                             "Reduce pass depth.");
    } else if (ratio > maxStepdownFactor) {
        addWarning(report, "Pass depth (" + fixed(passDepth, 4) + "\") is " +
                               fixed(ratio * 100.0, 0) + "% of tool diameter (" +
                               fixed(toolDiameter, 4) + "\"). Recommended maximum is " +
                               fixed(maxStepdownFactor * 100.0, 0) +
                               "%. Consider reducing pass depth to avoid tool breakage.");
    }
}

std::vector<std::string> Validator::validateFeedRates(double feedRate, double plungeRate) {
    std::vector<std::string> warnings;
    if (plungeRate > feedRate) {
        warnings.push_back("Plunge rate (" + num(plungeRate) + " in/min) exceeds feed rate (" +
                           num(feedRate) +
                           " in/min). Verify this is intentional for your material and tool.");
    }
    return warnings;
}

std::vector<std::string> Validator::leadInWarnings(const OperationSet& operations,
                                                   const GenerationSettings& settings) {
    std::vector<std::string> disabled;
    if (!operations.circularCuts.empty() && settings.circleLeadIn == LeadInType::NONE) {
        disabled.push_back("circle");
    }
    if (!operations.hexagonalCuts.empty() && settings.hexagonLeadIn == LeadInType::NONE) {
        disabled.push_back("hexagon");
    }
    if (!operations.lineCuts.empty() && settings.lineLeadIn == LeadInType::NONE) {
        disabled.push_back("line");
    }

    std::vector<std::string> warnings;
    if (disabled.empty()) {
        return warnings;
    }

    std::string types;
    for (size_t i = 0; i < disabled.size(); ++i) {
        if (i > 0) {
            types += ", ";
        }
        types += disabled[i];
    }
    warnings.push_back("Lead-in is disabled for " + types +
                       " cuts. This increases risk of end mill breakage from vertical plunge. "
                       "Consider enabling helical or ramp lead-in in the general settings.");
    return warnings;
}

std::vector<std::string> Validator::selfIntersectionWarnings(const OperationSet& operations) {
    std::vector<std::string> warnings;
    for (size_t i = 0; i < operations.lineCuts.size(); ++i) {
        const LineOperation& op = operations.lineCuts[i];
        std::vector<Point2D> positions = pathPositions(op.points);
        if (positions.size() < 4 || !Geometry::isClosed(positions)) {
            continue;
        }
        // Arc points are checked by their endpoints only
        Polygon outline(positions);
        if (outline.hasSelfIntersections()) {
            warnings.push_back(label("Line", i, op.id) +
                               ": closed path crosses itself, compensation may be wrong");
        }
    }
    return warnings;
}

ValidationReport Validator::validateProject(const Project& project,
                                            const GenerationSettings& settings,
                                            const ToolParams* drillParams,
                                            const ToolParams* cutParams) {
    ValidationReport report;
    const OperationSet& ops = project.operations;
    bool drillProject = project.type == ProjectType::DRILL;

    if (drillProject) {
        if (!drillParams) {
            addError(report, "No drill tool selected");
        }
    } else if (!cutParams) {
        addError(report, "No end mill tool selected");
    }

    bool hasOperations = drillProject
        ? !ops.drillHoles.empty()
        : !(ops.circularCuts.empty() && ops.hexagonalCuts.empty() && ops.lineCuts.empty());
    if (!hasOperations) {
        addError(report, "Project has no operations");
    }

    if (!drillProject && cutParams) {
        validateStepdown(cutParams->passDepth, cutParams->toolDiameter,
                         settings.maxStepdownFactor, report);
        for (const auto& warning : validateFeedRates(cutParams->feedRate, cutParams->plungeRate)) {
            addWarning(report, warning);
        }
    }

    // Only the operations this project type cuts are checked
    OperationSet relevant;
    if (drillProject) {
        relevant.drillHoles = ops.drillHoles;
    } else {
        relevant.circularCuts = ops.circularCuts;
        relevant.hexagonalCuts = ops.hexagonalCuts;
        relevant.lineCuts = ops.lineCuts;
    }

    double toolDiameter = (!drillProject && cutParams) ? cutParams->toolDiameter : 0.0;
    for (const auto& error : validate(relevant, settings, toolDiameter)) {
        addError(report, error);
    }

    if (!drillProject) {
        for (const auto& warning : leadInWarnings(relevant, settings)) {
            addWarning(report, warning);
        }
        for (const auto& warning : selfIntersectionWarnings(relevant)) {
            addWarning(report, warning);
        }
    }

    return report;
}

} // namespace toolpath
} // namespace nwss
