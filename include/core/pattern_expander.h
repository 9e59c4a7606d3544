#ifndef NWSS_TOOLPATH_PATTERN_EXPANDER_H
#define NWSS_TOOLPATH_PATTERN_EXPANDER_H

#include "core/geometry.h"
#include "core/operations.h"
#include <vector>

namespace nwss {
namespace toolpath {

/**
 * Turns single/linear/grid pattern specs into concrete coordinates.
 * The order of the returned points is the machining order.
 */
class PatternExpander {
public:
    /**
     * Expand a linear pattern
     * @param start First point
     * @param axis Axis the pattern advances along
     * @param spacing Distance between consecutive points
     * @param count Number of points (0 or less yields an empty list)
     * @return Points start + i*spacing along the axis, i in [0, count)
     */
    static std::vector<Point2D> expandLinear(const Point2D& start, PatternAxis axis,
                                             double spacing, int count);

    /**
     * Expand a grid pattern in row-major order (rows along Y, columns along X)
     * @return xCount * yCount points, first = start
     */
    static std::vector<Point2D> expandGrid(const Point2D& start,
                                           double xSpacing, double ySpacing,
                                           int xCount, int yCount);

    static std::vector<Point2D> expandDrill(const DrillOperation& op);

    /**
     * Expand a circle operation; each instance keeps the operation's diameter,
     * compensation, lead-in and hold time
     * @throws ValidationError for grid patterns
     */
    static std::vector<ExpandedCircle> expandCircle(const CircleOperation& op);

    /**
     * @throws ValidationError for grid patterns
     */
    static std::vector<ExpandedHexagon> expandHexagon(const HexagonOperation& op);

    /**
     * Expand every operation of a project, keeping per-kind order
     */
    static ExpandedOperations expandAll(const OperationSet& operations);
};

} // namespace toolpath
} // namespace nwss

#endif // NWSS_TOOLPATH_PATTERN_EXPANDER_H
