#include "core/pattern_expander.h"
#include "core/errors.h"

namespace nwss {
namespace toolpath {

std::vector<Point2D> PatternExpander::expandLinear(const Point2D& start, PatternAxis axis,
                                                   double spacing, int count) {
    std::vector<Point2D> points;
    if (count <= 0) {
        return points;
    }

    points.reserve(static_cast<size_t>(count));
    for (int i = 0; i < count; ++i) {
        if (axis == PatternAxis::X) {
            points.push_back(Point2D(start.x + i * spacing, start.y));
        } else {
            points.push_back(Point2D(start.x, start.y + i * spacing));
        }
    }

    return points;
}

std::vector<Point2D> PatternExpander::expandGrid(const Point2D& start,
                                                 double xSpacing, double ySpacing,
                                                 int xCount, int yCount) {
    std::vector<Point2D> points;
    if (xCount <= 0 || yCount <= 0) {
        return points;
    }

    points.reserve(static_cast<size_t>(xCount) * static_cast<size_t>(yCount));
    for (int row = 0; row < yCount; ++row) {
        for (int col = 0; col < xCount; ++col) {
            points.push_back(Point2D(start.x + col * xSpacing, start.y + row * ySpacing));
        }
    }

    return points;
}

std::vector<Point2D> PatternExpander::expandDrill(const DrillOperation& op) {
    switch (op.pattern) {
        case PatternType::LINEAR:
            return expandLinear(op.start, op.axis, op.spacing, op.count);
        case PatternType::GRID:
            return expandGrid(op.start, op.xSpacing, op.ySpacing, op.xCount, op.yCount);
        case PatternType::SINGLE:
            break;
    }
    return std::vector<Point2D>(1, op.start);
}

std::vector<ExpandedCircle> PatternExpander::expandCircle(const CircleOperation& op) {
    std::vector<Point2D> centers;
    switch (op.pattern) {
        case PatternType::SINGLE:
            centers.push_back(op.center);
            break;
        case PatternType::LINEAR:
            centers = expandLinear(op.center, op.axis, op.spacing, op.count);
            break;
        case PatternType::GRID:
            throw ValidationError("Circle '" + op.id + "': grid patterns are not supported for circular cuts");
    }

    std::vector<ExpandedCircle> circles;
    circles.reserve(centers.size());
    for (const auto& center : centers) {
        ExpandedCircle circle;
        circle.sourceId = op.id;
        circle.center = center;
        circle.diameter = op.diameter;
        circle.compensation = op.compensation;
        circle.leadIn = op.leadIn;
        circle.holdTime = op.holdTime;
        circles.push_back(circle);
    }
    return circles;
}

std::vector<ExpandedHexagon> PatternExpander::expandHexagon(const HexagonOperation& op) {
    std::vector<Point2D> centers;
    switch (op.pattern) {
        case PatternType::SINGLE:
            centers.push_back(op.center);
            break;
        case PatternType::LINEAR:
            centers = expandLinear(op.center, op.axis, op.spacing, op.count);
            break;
        case PatternType::GRID:
            throw ValidationError("Hexagon '" + op.id + "': grid patterns are not supported for hexagonal cuts");
    }

    std::vector<ExpandedHexagon> hexagons;
    hexagons.reserve(centers.size());
    for (const auto& center : centers) {
        ExpandedHexagon hexagon;
        hexagon.sourceId = op.id;
        hexagon.center = center;
        hexagon.flatToFlat = op.flatToFlat;
        hexagon.compensation = op.compensation;
        hexagon.leadIn = op.leadIn;
        hexagon.holdTime = op.holdTime;
        hexagons.push_back(hexagon);
    }
    return hexagons;
}

ExpandedOperations PatternExpander::expandAll(const OperationSet& operations) {
    ExpandedOperations expanded;

    for (const auto& op : operations.drillHoles) {
        std::vector<Point2D> points = expandDrill(op);
        expanded.drillPoints.insert(expanded.drillPoints.end(), points.begin(), points.end());
    }

    for (const auto& op : operations.circularCuts) {
        std::vector<ExpandedCircle> circles = expandCircle(op);
        expanded.circles.insert(expanded.circles.end(), circles.begin(), circles.end());
    }

    for (const auto& op : operations.hexagonalCuts) {
        std::vector<ExpandedHexagon> hexagons = expandHexagon(op);
        expanded.hexagons.insert(expanded.hexagons.end(), hexagons.begin(), hexagons.end());
    }

    expanded.lines = operations.lineCuts;
    return expanded;
}

} // namespace toolpath
} // namespace nwss
