#ifndef NWSS_TOOLPATH_TOOL_COMPENSATION_H
#define NWSS_TOOLPATH_TOOL_COMPENSATION_H

#include "core/geometry.h"
#include "core/operations.h"
#include <vector>
#include <string>

namespace nwss {
namespace toolpath {

/**
 * Tool radius compensation for circles, hexagons and polyline/arc paths
 *
 * Interior compensation moves a boundary toward the area it encloses, exterior
 * away from it. Compensation that would invert geometry is an error
 * (InvalidGeometryError), never a clamp.
 */
class ToolCompensation {
public:
    /**
     * Result of compensating a line path
     */
    struct PathResult {
        std::vector<PathPoint> points;      // Compensated path
        bool closed;                        // Whether the input was closed
        double winding;                     // Signed area of the input (positive = CCW)
        double signedOffset;                // Offset applied to straight segments (+ = left)

        PathResult() : closed(false), winding(0.0), signedOffset(0.0) {}
    };

    /**
     * Radial offset for a compensation mode
     * @param toolDiameter Tool diameter (inches)
     * @param mode Compensation mode
     * @return 0 for NONE, -radius for INTERIOR, +radius for EXTERIOR
     */
    static double getCompensationOffset(double toolDiameter, CompensationMode mode);

    /**
     * Toolpath radius for a circular feature
     * @param featureDiameter Desired feature diameter
     * @param toolDiameter Tool diameter
     * @param mode Compensation mode
     * @return feature radius + offset
     * @throws InvalidGeometryError if the result is <= 0
     */
    static double cutRadius(double featureDiameter, double toolDiameter, CompensationMode mode);

    /**
     * Hexagon vertices offset along their angle bisectors by tool_radius * 2/sqrt(3)
     * @return Six vertices, vertex 0 at the top, clockwise
     * @throws InvalidGeometryError if the compensated apothem is <= 0
     */
    static std::vector<Point2D> hexagonVertices(const Point2D& center, double flatToFlat,
                                                double toolDiameter, CompensationMode mode);

    /**
     * Compensate a polyline/arc path.
     *
     * Straight segments are offset along their left normal by a signed distance chosen
     * from the path winding; arc segments change radius. Adjacent offset segments are
     * re-joined at their intersection, falling back to the offset endpoint when no
     * intersection exists.
     *
     * @param points Input path (first point START)
     * @param toolDiameter Tool diameter
     * @param mode Compensation mode; NONE returns the input unchanged
     * @return Compensated path; for closed input the first and last points coincide
     * @throws InvalidGeometryError when an arc radius would become <= 0 or a
     *         straight segment has zero length
     */
    static std::vector<PathPoint> compensateLinePath(const std::vector<PathPoint>& points,
                                                     double toolDiameter,
                                                     CompensationMode mode);

    /**
     * Same as compensateLinePath but also reports closure, winding and offset
     */
    static PathResult compensateLinePathDetailed(const std::vector<PathPoint>& points,
                                                 double toolDiameter,
                                                 CompensationMode mode);

    /**
     * Signed area of the path positions (positive = counter-clockwise)
     */
    static double pathWinding(const std::vector<PathPoint>& points);

private:
    struct OffsetSegment {
        bool isArc;
        Point2D start;
        Point2D end;
        Point2D center;
        PathPoint source;   // Point that defines this segment's end (type, arc data)
    };

    static OffsetSegment offsetStraight(const Point2D& p1, const Point2D& p2,
                                        double offset, const PathPoint& source);

    static OffsetSegment offsetArc(const Point2D& p1, const Point2D& p2,
                                   double offset, double toolRadius,
                                   const PathPoint& source, CompensationMode mode);

    static Point2D joinSegments(const OffsetSegment& first, const OffsetSegment& second);

    static PathPoint withPosition(const PathPoint& source, const Point2D& position);
};

} // namespace toolpath
} // namespace nwss

#endif // NWSS_TOOLPATH_TOOL_COMPENSATION_H
