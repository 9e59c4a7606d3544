#include "core/tube_void.h"
#include "core/hexagon.h"
#include "core/tool_compensation.h"
#include <cmath>
#include <sstream>

namespace nwss {
namespace toolpath {

Bounds TubeVoid::voidBounds(double outerWidth, double outerHeight, double wallThickness) {
    return Bounds(wallThickness, wallThickness,
                  outerWidth - wallThickness, outerHeight - wallThickness);
}

bool TubeVoid::pointInVoid(const Point2D& point, const Bounds& bounds, double margin) {
    return point.x - margin > bounds.minX && point.x + margin < bounds.maxX &&
           point.y - margin > bounds.minY && point.y + margin < bounds.maxY;
}

bool TubeVoid::circleInVoid(const ExpandedCircle& circle, const Bounds& bounds, double toolDiameter) {
    double toolRadius = toolDiameter / 2.0;
    double cutRadius = circle.diameter / 2.0 +
                       ToolCompensation::getCompensationOffset(toolDiameter, circle.compensation);
    return pointInVoid(circle.center, bounds, cutRadius + toolRadius);
}

bool TubeVoid::hexagonInVoid(const ExpandedHexagon& hexagon, const Bounds& bounds, double toolDiameter) {
    double toolRadius = toolDiameter / 2.0;
    double offset = ToolCompensation::getCompensationOffset(toolDiameter, hexagon.compensation);
    double apothem = Hexagon::apothem(hexagon.flatToFlat) + offset;
    double circumradius = Hexagon::circumradius(hexagon.flatToFlat) + offset * 2.0 / std::sqrt(3.0);

    const Point2D& c = hexagon.center;
    double marginX = apothem + toolRadius;
    double marginY = circumradius + toolRadius;
    return c.x - marginX > bounds.minX && c.x + marginX < bounds.maxX &&
           c.y - marginY > bounds.minY && c.y + marginY < bounds.maxY;
}

bool TubeVoid::isActive(const MaterialSpec& material, bool skipEnabled) {
    return skipEnabled && material.form == MaterialForm::TUBE;
}

TubeVoid::FilterResult TubeVoid::filter(const ExpandedOperations& operations,
                                        const MaterialSpec& material, bool skipEnabled,
                                        double drillDiameter, double endMillDiameter) {
    FilterResult result;
    if (!isActive(material, skipEnabled)) {
        result.operations = operations;
        return result;
    }

    Bounds bounds = voidBounds(material.outerWidth, material.outerHeight, material.wallThickness);

    for (const auto& point : operations.drillPoints) {
        if (pointInVoid(point, bounds, drillDiameter / 2.0)) {
            result.skippedDrills.push_back(point);
        } else {
            result.operations.drillPoints.push_back(point);
        }
    }

    for (const auto& circle : operations.circles) {
        if (circleInVoid(circle, bounds, endMillDiameter)) {
            result.skippedCircles.push_back(circle);
        } else {
            result.operations.circles.push_back(circle);
        }
    }

    for (const auto& hexagon : operations.hexagons) {
        if (hexagonInVoid(hexagon, bounds, endMillDiameter)) {
            result.skippedHexagons.push_back(hexagon);
        } else {
            result.operations.hexagons.push_back(hexagon);
        }
    }

    result.operations.lines = operations.lines;
    return result;
}

std::vector<std::string> TubeVoid::FilterResult::describeSkipped() const {
    std::vector<std::string> descriptions;

    for (const auto& point : skippedDrills) {
        std::ostringstream ss;
        ss << "Drill at (" << point.x << ", " << point.y << ") is inside the tube void";
        descriptions.push_back(ss.str());
    }
    for (const auto& circle : skippedCircles) {
        std::ostringstream ss;
        ss << "Circle d=" << circle.diameter << " at (" << circle.center.x << ", "
           << circle.center.y << ") is inside the tube void";
        descriptions.push_back(ss.str());
    }
    for (const auto& hexagon : skippedHexagons) {
        std::ostringstream ss;
        ss << "Hexagon ftf=" << hexagon.flatToFlat << " at (" << hexagon.center.x << ", "
           << hexagon.center.y << ") is inside the tube void";
        descriptions.push_back(ss.str());
    }
    return descriptions;
}

} // namespace toolpath
} // namespace nwss
