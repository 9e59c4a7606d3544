#ifndef NWSS_TOOLPATH_GEOMETRY_H
#define NWSS_TOOLPATH_GEOMETRY_H

#include <vector>
#include <cmath>

namespace nwss {
namespace toolpath {

/**
 * Represents a 2D point with x and y coordinates (inches, machine home origin)
 */
struct Point2D {
    double x;
    double y;

    Point2D(double _x = 0, double _y = 0) : x(_x), y(_y) {}

    // Calculate distance to another point
    double distanceTo(const Point2D& other) const {
        double dx = x - other.x;
        double dy = y - other.y;
        return std::sqrt(dx*dx + dy*dy);
    }

    double length() const {
        return std::sqrt(x*x + y*y);
    }

    // Operators for point manipulation
    Point2D operator+(const Point2D& other) const {
        return Point2D(x + other.x, y + other.y);
    }

    Point2D operator-(const Point2D& other) const {
        return Point2D(x - other.x, y - other.y);
    }

    Point2D operator*(double scalar) const {
        return Point2D(x * scalar, y * scalar);
    }

    bool operator==(const Point2D& other) const {
        // Using small epsilon for floating point comparison
        const double epsilon = 1e-6;
        return std::fabs(x - other.x) < epsilon && std::fabs(y - other.y) < epsilon;
    }
};

/**
 * Axis-aligned bounding box
 */
struct Bounds {
    double minX;
    double minY;
    double maxX;
    double maxY;

    Bounds(double x0 = 0, double y0 = 0, double x1 = 0, double y1 = 0)
        : minX(x0), minY(y0), maxX(x1), maxY(y1) {}

    double width() const { return maxX - minX; }
    double height() const { return maxY - minY; }
};

/**
 * Represents a closed polygon (hexagon outlines, closed line paths)
 */
class Polygon {
public:
    Polygon() = default;
    explicit Polygon(const std::vector<Point2D>& points) : m_points(points) {}

    // Add a point to the polygon
    void addPoint(const Point2D& point) {
        m_points.push_back(point);
    }

    // Get all points
    const std::vector<Point2D>& getPoints() const {
        return m_points;
    }

    // Get number of points
    size_t size() const {
        return m_points.size();
    }

    // Check if polygon is empty
    bool empty() const {
        return m_points.empty();
    }

    // Signed area (positive = counter-clockwise with Y up)
    double signedArea() const;

    // Calculate the area of the polygon
    double area() const;

    // Check if the polygon is clockwise
    bool isClockwise() const;

    // Check whether the outline crosses itself
    bool hasSelfIntersections() const;

    // Get the bounding box
    void getBounds(double& minX, double& minY, double& maxX, double& maxY) const;

private:
    std::vector<Point2D> m_points;
};

/**
 * Stateless 2D helpers shared by compensation, lead-in and preview code
 */
class Geometry {
public:
    /// Tolerance used to decide whether a path's first and last points coincide
    static constexpr double CLOSED_PATH_TOLERANCE = 0.0001;

    /**
     * Unit normal pointing to the left of the direction p1 -> p2
     * @return (0,0) for a zero-length segment
     */
    static Point2D leftNormal(const Point2D& p1, const Point2D& p2);

    /**
     * Unit vector from p1 to p2
     * @return (1,0) for a zero-length segment
     */
    static Point2D direction(const Point2D& p1, const Point2D& p2);

    /**
     * Intersection of two infinite lines, each given by two points
     * @param result Receives the intersection point
     * @return False when the lines are parallel
     */
    static bool lineIntersection(const Point2D& a1, const Point2D& a2,
                                 const Point2D& b1, const Point2D& b2,
                                 Point2D& result);

    /**
     * Intersection of an infinite line and a circle
     * @param preferNear When both roots exist, the one nearest to this point is returned
     * @param result Receives the intersection point
     * @return False for a degenerate line or when the line misses the circle
     */
    static bool lineCircleIntersection(const Point2D& p1, const Point2D& p2,
                                       const Point2D& center, double radius,
                                       const Point2D& preferNear,
                                       Point2D& result);

    /**
     * Signed area of a point sequence (shoelace), positive = counter-clockwise
     */
    static double signedArea(const std::vector<Point2D>& points);

    /**
     * True when the first and last points coincide within tolerance on both axes
     */
    static bool isClosed(const std::vector<Point2D>& points,
                         double tolerance = CLOSED_PATH_TOLERANCE);

    /**
     * Convert an approach angle (0 = 12 o'clock, clockwise) to a math angle in radians
     */
    static double approachAngleToRadians(double approachAngleDeg);

    static double toRadians(double degrees);
    static double toDegrees(double radians);
};

} // namespace toolpath
} // namespace nwss

#endif // NWSS_TOOLPATH_GEOMETRY_H
