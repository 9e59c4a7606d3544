#include "core/tool_compensation.h"
#include "core/arc_direction.h"
#include "core/errors.h"
#include "core/hexagon.h"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace nwss {
namespace toolpath {

namespace {

const double PI = 3.14159265358979323846;

// Below this a straight segment has no usable direction
const double MIN_SEGMENT_LENGTH = 1e-9;

std::string formatLength(double value) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(4) << value;
    return ss.str();
}

} // namespace

// ================================
// Circles and hexagons
// ================================

double ToolCompensation::getCompensationOffset(double toolDiameter, CompensationMode mode) {
    double toolRadius = toolDiameter / 2.0;
    switch (mode) {
        case CompensationMode::INTERIOR: return -toolRadius;
        case CompensationMode::EXTERIOR: return toolRadius;
        case CompensationMode::NONE: break;
    }
    return 0.0;
}

double ToolCompensation::cutRadius(double featureDiameter, double toolDiameter, CompensationMode mode) {
    double radius = featureDiameter / 2.0 + getCompensationOffset(toolDiameter, mode);
    if (radius <= 0.0) {
        throw InvalidGeometryError("Circle diameter " + formatLength(featureDiameter) +
                                   " is too small for " + toString(mode) +
                                   " compensation with tool diameter " + formatLength(toolDiameter));
    }
    return radius;
}

std::vector<Point2D> ToolCompensation::hexagonVertices(const Point2D& center, double flatToFlat,
                                                       double toolDiameter, CompensationMode mode) {
    std::vector<Point2D> vertices = Hexagon::vertices(center, flatToFlat);

    double offset = getCompensationOffset(toolDiameter, mode);
    double compensatedApothem = Hexagon::apothem(flatToFlat) + offset;
    if (compensatedApothem <= 0.0) {
        throw InvalidGeometryError("Hexagon flat-to-flat " + formatLength(flatToFlat) +
                                   " is too small for " + toString(mode) +
                                   " compensation with tool diameter " + formatLength(toolDiameter));
    }

    if (mode == CompensationMode::NONE) {
        return vertices;
    }

    // Moving a vertex by r / sin(60) along its bisector moves both adjacent flats by r
    double bisectorOffset = (toolDiameter / 2.0) * 2.0 / std::sqrt(3.0);
    double towardCenter = (mode == CompensationMode::INTERIOR) ? bisectorOffset : -bisectorOffset;

    for (auto& vertex : vertices) {
        Point2D toCenter = center - vertex;
        double distance = toCenter.length();
        if (distance == 0.0) {
            continue;
        }
        vertex = vertex + toCenter * (towardCenter / distance);
    }

    return vertices;
}

// ================================
// Line paths
// ================================

double ToolCompensation::pathWinding(const std::vector<PathPoint>& points) {
    return Geometry::signedArea(pathPositions(points));
}

std::vector<PathPoint> ToolCompensation::compensateLinePath(const std::vector<PathPoint>& points,
                                                            double toolDiameter,
                                                            CompensationMode mode) {
    return compensateLinePathDetailed(points, toolDiameter, mode).points;
}

ToolCompensation::PathResult ToolCompensation::compensateLinePathDetailed(
    const std::vector<PathPoint>& points,
    double toolDiameter,
    CompensationMode mode) {

    PathResult result;
    result.points = points;

    std::vector<Point2D> positions = pathPositions(points);
    result.closed = Geometry::isClosed(positions);

    if (mode == CompensationMode::NONE || points.size() < 2) {
        return result;
    }

    double toolRadius = toolDiameter / 2.0;
    result.winding = pathWinding(points);

    // Left of travel is inside for CCW paths and outside for CW paths
    if (mode == CompensationMode::INTERIOR) {
        result.signedOffset = result.winding >= 0 ? toolRadius : -toolRadius;
    } else {
        result.signedOffset = result.winding >= 0 ? -toolRadius : toolRadius;
    }

    bool closed = result.closed;

    // Closed paths drop the duplicate closing point; the closing segment takes
    // its type and arc data from the original last point
    size_t n = closed ? points.size() - 1 : points.size();
    size_t segmentCount = closed ? n : n - 1;

    std::vector<OffsetSegment> segments;
    segments.reserve(segmentCount);

    for (size_t i = 0; i < segmentCount; ++i) {
        size_t j = (i + 1) % n;
        Point2D p1 = points[i].position();
        Point2D p2 = points[j].position();
        const PathPoint& source = (closed && j == 0) ? points.back() : points[j];

        if (source.isArc()) {
            segments.push_back(offsetArc(p1, p2, result.signedOffset, toolRadius, source, mode));
        } else {
            if (p1.distanceTo(p2) < MIN_SEGMENT_LENGTH) {
                throw InvalidGeometryError("Line path has a zero-length segment ending at point " +
                                           std::to_string(j) + " (" + formatLength(p2.x) + ", " +
                                           formatLength(p2.y) + ")");
            }
            segments.push_back(offsetStraight(p1, p2, result.signedOffset, source));
        }
    }

    if (segments.empty()) {
        return result;
    }

    std::vector<PathPoint> compensated;
    compensated.reserve(segments.size() + 2);

    for (size_t i = 0; i < segments.size(); ++i) {
        const OffsetSegment& seg = segments[i];

        if (i == 0) {
            Point2D first = seg.start;
            if (closed) {
                const OffsetSegment& last = segments.back();
                if (!(last.isArc && seg.isArc)) {
                    first = joinSegments(last, seg);
                }
            }
            compensated.push_back(withPosition(points.front(), first));
        }

        bool hasNext = (i + 1 < segments.size()) || closed;
        if (!hasNext) {
            // Open path: last point is the end of the last offset segment
            compensated.push_back(withPosition(seg.source, seg.end));
            continue;
        }

        const OffsetSegment& next = segments[(i + 1) % segments.size()];

        if (seg.isArc && next.isArc) {
            // Each arc keeps its own compensated circle; bridge them with a short line
            compensated.push_back(withPosition(seg.source, seg.end));
            compensated.push_back(PathPoint::straight(next.start.x, next.start.y));
            continue;
        }

        compensated.push_back(withPosition(seg.source, joinSegments(seg, next)));
    }

    result.points = compensated;
    return result;
}

ToolCompensation::OffsetSegment ToolCompensation::offsetStraight(const Point2D& p1, const Point2D& p2,
                                                                 double offset, const PathPoint& source) {
    Point2D normal = Geometry::leftNormal(p1, p2);

    OffsetSegment segment;
    segment.isArc = false;
    segment.start = p1 + normal * offset;
    segment.end = p2 + normal * offset;
    segment.source = source;
    return segment;
}

ToolCompensation::OffsetSegment ToolCompensation::offsetArc(const Point2D& p1, const Point2D& p2,
                                                            double offset, double toolRadius,
                                                            const PathPoint& source,
                                                            CompensationMode mode) {
    const Point2D& center = source.center;
    ArcDirection direction = ArcResolver::resolve(p1, p2, center, source.hint);

    double startAngle = std::atan2(p1.y - center.y, p1.x - center.x);
    double endAngle = std::atan2(p2.y - center.y, p2.x - center.x);

    if (direction == ArcDirection::CW) {
        if (startAngle < endAngle) {
            startAngle += 2.0 * PI;
        }
    } else {
        if (endAngle < startAngle) {
            endAngle += 2.0 * PI;
        }
    }
    double midAngle = (startAngle + endAngle) / 2.0;

    // Which side of the chord the arc bulges toward
    double radius = p1.distanceTo(center);
    Point2D arcMid(center.x + radius * std::cos(midAngle), center.y + radius * std::sin(midAngle));
    Point2D chord = p2 - p1;
    Point2D toArc = arcMid - p1;
    bool bulgesLeft = (chord.x * toArc.y - chord.y * toArc.x) > 0;
    bool offsetLeft = offset > 0;

    // Offsetting toward the bulge grows the arc, away from it shrinks the arc
    double radiusChange = (bulgesLeft == offsetLeft) ? toolRadius : -toolRadius;

    double radius1 = p1.distanceTo(center);
    double radius2 = p2.distanceTo(center);
    double newRadius1 = radius1 + radiusChange;
    double newRadius2 = radius2 + radiusChange;

    if (newRadius1 <= 0.0 || newRadius2 <= 0.0) {
        throw InvalidGeometryError("Arc radius (" + formatLength(std::min(radius1, radius2)) +
                                   ") is too small for " + toString(mode) +
                                   " compensation with tool radius " + formatLength(toolRadius));
    }

    double scale1 = radius1 > 0 ? newRadius1 / radius1 : 1.0;
    double scale2 = radius2 > 0 ? newRadius2 / radius2 : 1.0;

    OffsetSegment segment;
    segment.isArc = true;
    segment.start = center + (p1 - center) * scale1;
    segment.end = center + (p2 - center) * scale2;
    segment.center = center;
    segment.source = source;
    return segment;
}

Point2D ToolCompensation::joinSegments(const OffsetSegment& first, const OffsetSegment& second) {
    Point2D corner;

    if (!first.isArc && !second.isArc) {
        if (Geometry::lineIntersection(first.start, first.end, second.start, second.end, corner)) {
            return corner;
        }
        return first.end;
    }

    if (first.isArc && !second.isArc) {
        double radius = first.end.distanceTo(first.center);
        if (Geometry::lineCircleIntersection(second.start, second.end, first.center, radius,
                                             first.end, corner)) {
            return corner;
        }
        return first.end;
    }

    if (!first.isArc && second.isArc) {
        double radius = second.start.distanceTo(second.center);
        if (Geometry::lineCircleIntersection(first.start, first.end, second.center, radius,
                                             second.start, corner)) {
            return corner;
        }
        return second.start;
    }

    return first.end;
}

PathPoint ToolCompensation::withPosition(const PathPoint& source, const Point2D& position) {
    PathPoint point = source;
    point.x = position.x;
    point.y = position.y;
    return point;
}

} // namespace toolpath
} // namespace nwss
