#ifndef NWSS_TOOLPATH_TUBE_VOID_H
#define NWSS_TOOLPATH_TUBE_VOID_H

#include "core/geometry.h"
#include "core/operations.h"
#include <string>
#include <vector>

namespace nwss {
namespace toolpath {

/**
 * Drops features that would be cut entirely over the hollow of tube stock
 */
class TubeVoid {
public:
    /**
     * Operations left after filtering plus a description of each removed one
     */
    struct FilterResult {
        ExpandedOperations operations;
        std::vector<Point2D> skippedDrills;
        std::vector<ExpandedCircle> skippedCircles;
        std::vector<ExpandedHexagon> skippedHexagons;

        size_t skippedCount() const {
            return skippedDrills.size() + skippedCircles.size() + skippedHexagons.size();
        }

        std::vector<std::string> describeSkipped() const;
    };

    /**
     * Hollow region of a tube: (wall, wall, width - wall, height - wall)
     */
    static Bounds voidBounds(double outerWidth, double outerHeight, double wallThickness);

    /**
     * True when the square of half-size margin around the point lies strictly inside
     */
    static bool pointInVoid(const Point2D& point, const Bounds& bounds, double margin = 0.0);

    /**
     * @param toolDiameter Cutting tool, the circle is compensated before testing
     */
    static bool circleInVoid(const ExpandedCircle& circle, const Bounds& bounds, double toolDiameter);

    /**
     * Tests the compensated apothem in X and the compensated circumradius in Y
     */
    static bool hexagonInVoid(const ExpandedHexagon& hexagon, const Bounds& bounds, double toolDiameter);

    /**
     * Whether filtering applies at all
     */
    static bool isActive(const MaterialSpec& material, bool skipEnabled);

    /**
     * Remove whole operations lying inside the void. Lines are never removed.
     * Without an active void the input is returned unchanged.
     */
    static FilterResult filter(const ExpandedOperations& operations, const MaterialSpec& material,
                               bool skipEnabled, double drillDiameter, double endMillDiameter);
};

} // namespace toolpath
} // namespace nwss

#endif // NWSS_TOOLPATH_TUBE_VOID_H
