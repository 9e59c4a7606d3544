#ifndef NWSS_TOOLPATH_CORNER_DETECTION_H
#define NWSS_TOOLPATH_CORNER_DETECTION_H

#include "core/geometry.h"
#include "core/operations.h"
#include <vector>

namespace nwss {
namespace toolpath {

/**
 * Classifies direction changes along a line path
 */
class CornerDetector {
public:
    /// Interior angles at or above this are not treated as corners
    static constexpr double CORNER_ANGLE_THRESHOLD = 120.0;

    /**
     * Feed multiplier for a corner with the given interior angle
     * @param angle Interior angle in degrees (180 = straight through)
     * @return 1.0 (no corner), 0.75, 0.5, 0.4 or 0.3
     */
    static double severityFactor(double angle);

    /**
     * Interior angle between an incoming and an outgoing direction
     * @return 180 minus the turn between the two tangents, in degrees
     */
    static double interiorAngle(const Point2D& incoming, const Point2D& outgoing);

    /**
     * Unit tangent of the segment ending at points[index], taken at its end
     */
    static Point2D incomingTangent(const std::vector<PathPoint>& points, size_t index);

    /**
     * Unit tangent of the segment starting at points[index], taken at its start
     */
    static Point2D outgoingTangent(const std::vector<PathPoint>& points, size_t index);

    /**
     * Severity factor for every point of a path. The first and last points of an
     * open path always get 1.0.
     */
    static std::vector<double> cornerSeverities(const std::vector<PathPoint>& points);

private:
    static Point2D normalized(const Point2D& v);
    static Point2D arcTangent(const PathPoint& arcEnd, const Point2D& from, const Point2D& at);
};

} // namespace toolpath
} // namespace nwss

#endif // NWSS_TOOLPATH_CORNER_DETECTION_H
