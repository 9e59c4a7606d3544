#ifndef NWSS_TOOLPATH_ARC_DIRECTION_H
#define NWSS_TOOLPATH_ARC_DIRECTION_H

#include "core/geometry.h"
#include "core/operations.h"
#include <string>

namespace nwss {
namespace toolpath {

/**
 * Determines G02/G03 direction for arc moves and their I/J offsets
 */
class ArcResolver {
public:
    /**
     * Resolve the travel direction of an arc
     * @param current Arc start (current tool position)
     * @param destination Arc end
     * @param center Arc center
     * @param hint Explicit direction; anything but AUTO is returned as-is
     * @return CCW when the start-to-end sweep around the center turns left,
     *         CW otherwise (including the collinear 180 degree case)
     */
    static ArcDirection resolve(const Point2D& current, const Point2D& destination,
                                const Point2D& center, ArcHint hint = ArcHint::AUTO);

    /**
     * I/J offsets from the current position to the arc center
     */
    static Point2D offsets(const Point2D& current, const Point2D& center);

    /**
     * "G02" for CW, "G03" for CCW
     */
    static std::string gcode(ArcDirection direction);
};

} // namespace toolpath
} // namespace nwss

#endif // NWSS_TOOLPATH_ARC_DIRECTION_H
