#include "core/geometry.h"
#include <clipper2/clipper.h>
#include <algorithm>

namespace nwss {
namespace toolpath {

namespace {

const double PI = 3.14159265358979323846;

// Decimal places kept when handing coordinates to Clipper2
const int CLIPPER_PRECISION = 4;

Clipper2Lib::PathD toClipperPath(const std::vector<Point2D>& points) {
    Clipper2Lib::PathD path;
    path.reserve(points.size());

    for (const auto& point : points) {
        // Validate input coordinates
        if (!std::isfinite(point.x) || !std::isfinite(point.y)) {
            continue;
        }
        path.push_back(Clipper2Lib::PointD(point.x, point.y));
    }

    return path;
}

} // namespace

double Polygon::signedArea() const {
    return Geometry::signedArea(m_points);
}

double Polygon::area() const {
    return std::abs(signedArea());
}

bool Polygon::isClockwise() const {
    if (m_points.size() < 3) {
        return false;
    }
    return signedArea() < 0;
}

bool Polygon::hasSelfIntersections() const {
    if (m_points.size() < 4) {
        return false; // Need at least 4 points to self-intersect
    }

    std::vector<Point2D> ring = m_points;
    if (Geometry::isClosed(ring)) {
        ring.pop_back();
    }
    if (ring.size() < 4) {
        return false;
    }

    // A simple outline unions to exactly one polygon. Crossing edges split it
    // into lobes (or leave a hole when the outline loops over itself).
    Clipper2Lib::PathsD subject;
    subject.push_back(toClipperPath(ring));
    Clipper2Lib::PathsD merged = Clipper2Lib::Union(subject, Clipper2Lib::FillRule::NonZero,
                                                    CLIPPER_PRECISION);
    return merged.size() != 1;
}

void Polygon::getBounds(double& minX, double& minY, double& maxX, double& maxY) const {
    if (m_points.empty()) {
        minX = minY = maxX = maxY = 0.0;
        return;
    }

    minX = maxX = m_points[0].x;
    minY = maxY = m_points[0].y;

    for (const auto& point : m_points) {
        minX = std::min(minX, point.x);
        minY = std::min(minY, point.y);
        maxX = std::max(maxX, point.x);
        maxY = std::max(maxY, point.y);
    }
}

// ================================
// Geometry helpers
// ================================

Point2D Geometry::leftNormal(const Point2D& p1, const Point2D& p2) {
    Point2D d = p2 - p1;
    double length = d.length();
    if (length == 0.0) {
        return Point2D(0.0, 0.0);
    }
    return Point2D(-d.y / length, d.x / length);
}

Point2D Geometry::direction(const Point2D& p1, const Point2D& p2) {
    Point2D d = p2 - p1;
    double length = d.length();
    if (length < 0.0001) {
        return Point2D(1.0, 0.0);
    }
    return d * (1.0 / length);
}

bool Geometry::lineIntersection(const Point2D& a1, const Point2D& a2,
                                const Point2D& b1, const Point2D& b2,
                                Point2D& result) {
    double denom = (a1.x - a2.x) * (b1.y - b2.y) - (a1.y - a2.y) * (b1.x - b2.x);
    if (std::abs(denom) < 1e-10) {
        return false; // Parallel
    }

    double t = ((a1.x - b1.x) * (b1.y - b2.y) - (a1.y - b1.y) * (b1.x - b2.x)) / denom;
    result = Point2D(a1.x + t * (a2.x - a1.x), a1.y + t * (a2.y - a1.y));
    return true;
}

bool Geometry::lineCircleIntersection(const Point2D& p1, const Point2D& p2,
                                      const Point2D& center, double radius,
                                      const Point2D& preferNear,
                                      Point2D& result) {
    double dx = p2.x - p1.x;
    double dy = p2.y - p1.y;
    double ax = p1.x - center.x;
    double ay = p1.y - center.y;

    // A*t^2 + B*t + C = 0
    double a = dx * dx + dy * dy;
    double b = 2.0 * (ax * dx + ay * dy);
    double c = ax * ax + ay * ay - radius * radius;

    if (std::abs(a) < 1e-10) {
        return false;
    }

    double discriminant = b * b - 4.0 * a * c;
    if (discriminant < 0) {
        return false;
    }

    double sqrtDisc = std::sqrt(discriminant);
    double t1 = (-b - sqrtDisc) / (2.0 * a);
    double t2 = (-b + sqrtDisc) / (2.0 * a);

    Point2D first(p1.x + t1 * dx, p1.y + t1 * dy);
    Point2D second(p1.x + t2 * dx, p1.y + t2 * dy);

    result = first.distanceTo(preferNear) <= second.distanceTo(preferNear) ? first : second;
    return true;
}

double Geometry::signedArea(const std::vector<Point2D>& points) {
    if (points.size() < 3) {
        return 0.0;
    }
    return Clipper2Lib::Area(toClipperPath(points));
}

bool Geometry::isClosed(const std::vector<Point2D>& points, double tolerance) {
    if (points.size() < 2) {
        return false;
    }

    const Point2D& first = points.front();
    const Point2D& last = points.back();
    return std::abs(first.x - last.x) < tolerance && std::abs(first.y - last.y) < tolerance;
}

double Geometry::approachAngleToRadians(double approachAngleDeg) {
    return toRadians(90.0 - approachAngleDeg);
}

double Geometry::toRadians(double degrees) {
    return degrees * PI / 180.0;
}

double Geometry::toDegrees(double radians) {
    return radians * 180.0 / PI;
}

} // namespace toolpath
} // namespace nwss
