#include "core/arc_direction.h"

namespace nwss {
namespace toolpath {

ArcDirection ArcResolver::resolve(const Point2D& current, const Point2D& destination,
                                  const Point2D& center, ArcHint hint) {
    if (hint == ArcHint::CW) {
        return ArcDirection::CW;
    }
    if (hint == ArcHint::CCW) {
        return ArcDirection::CCW;
    }

    // Radius vectors from the center to both endpoints
    Point2D fromStart = current - center;
    Point2D toEnd = destination - center;
    double cross = fromStart.x * toEnd.y - fromStart.y * toEnd.x;

    return cross > 0 ? ArcDirection::CCW : ArcDirection::CW;
}

Point2D ArcResolver::offsets(const Point2D& current, const Point2D& center) {
    return Point2D(center.x - current.x, center.y - current.y);
}

std::string ArcResolver::gcode(ArcDirection direction) {
    return direction == ArcDirection::CCW ? "G03" : "G02";
}

} // namespace toolpath
} // namespace nwss
