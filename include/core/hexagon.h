#ifndef NWSS_TOOLPATH_HEXAGON_H
#define NWSS_TOOLPATH_HEXAGON_H

#include "core/geometry.h"
#include <vector>

namespace nwss {
namespace toolpath {

/**
 * Point-up hexagon geometry (vertices at top and bottom, flats left and right)
 */
class Hexagon {
public:
    static double apothem(double flatToFlat);
    static double circumradius(double flatToFlat);

    /**
     * Compute the six vertices of a point-up hexagon
     * @param center Hexagon center
     * @param flatToFlat Distance between the left and right flats
     * @return Vertex 0 at the top, then clockwise
     */
    static std::vector<Point2D> vertices(const Point2D& center, double flatToFlat);

    /**
     * Extent of the hexagon: apothem in X, circumradius in Y
     */
    static Bounds bounds(const Point2D& center, double flatToFlat);

    /**
     * Outline as a polygon (for preview and area checks)
     */
    static Polygon outline(const Point2D& center, double flatToFlat);
};

} // namespace toolpath
} // namespace nwss

#endif // NWSS_TOOLPATH_HEXAGON_H
