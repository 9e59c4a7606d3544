#include "core/corner_detection.h"
#include "core/arc_direction.h"
#include <algorithm>
#include <cmath>

namespace nwss {
namespace toolpath {

namespace {

const double MIN_VECTOR_LENGTH = 1e-4;

} // namespace

double CornerDetector::severityFactor(double angle) {
    if (angle >= CORNER_ANGLE_THRESHOLD) return 1.0;
    if (angle >= 90.0) return 0.75;
    if (angle >= 60.0) return 0.5;
    if (angle >= 30.0) return 0.4;
    return 0.3;
}

double CornerDetector::interiorAngle(const Point2D& incoming, const Point2D& outgoing) {
    Point2D a = normalized(incoming);
    Point2D b = normalized(outgoing);

    double dot = std::max(-1.0, std::min(1.0, a.x * b.x + a.y * b.y));
    double turn = Geometry::toDegrees(std::acos(dot));
    return 180.0 - turn;
}

Point2D CornerDetector::normalized(const Point2D& v) {
    double length = v.length();
    if (length < MIN_VECTOR_LENGTH) {
        return Point2D(1.0, 0.0);
    }
    return v * (1.0 / length);
}

Point2D CornerDetector::arcTangent(const PathPoint& arcEnd, const Point2D& from, const Point2D& at) {
    Point2D radial = at - arcEnd.center;
    ArcDirection direction = ArcResolver::resolve(from, arcEnd.position(), arcEnd.center, arcEnd.hint);
    if (direction == ArcDirection::CCW) {
        return normalized(Point2D(-radial.y, radial.x));
    }
    return normalized(Point2D(radial.y, -radial.x));
}

Point2D CornerDetector::incomingTangent(const std::vector<PathPoint>& points, size_t index) {
    if (index == 0 || index >= points.size()) {
        return Point2D(1.0, 0.0);
    }
    const PathPoint& end = points[index];
    Point2D from = points[index - 1].position();

    if (end.isArc()) {
        return arcTangent(end, from, end.position());
    }
    return normalized(end.position() - from);
}

Point2D CornerDetector::outgoingTangent(const std::vector<PathPoint>& points, size_t index) {
    if (index + 1 >= points.size()) {
        return Point2D(1.0, 0.0);
    }
    const PathPoint& next = points[index + 1];
    Point2D from = points[index].position();

    if (next.isArc()) {
        return arcTangent(next, from, from);
    }
    return normalized(next.position() - from);
}

std::vector<double> CornerDetector::cornerSeverities(const std::vector<PathPoint>& points) {
    std::vector<double> severities(points.size(), 1.0);
    if (points.size() < 3) {
        return severities;
    }

    for (size_t i = 1; i + 1 < points.size(); ++i) {
        double angle = interiorAngle(incomingTangent(points, i), outgoingTangent(points, i));
        severities[i] = severityFactor(angle);
    }
    return severities;
}

} // namespace toolpath
} // namespace nwss
