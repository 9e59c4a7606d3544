#include "core/hexagon.h"

namespace nwss {
namespace toolpath {

namespace {
const double PI = 3.14159265358979323846;
}

double Hexagon::apothem(double flatToFlat) {
    return flatToFlat / 2.0;
}

double Hexagon::circumradius(double flatToFlat) {
    return flatToFlat / std::sqrt(3.0);
}

std::vector<Point2D> Hexagon::vertices(const Point2D& center, double flatToFlat) {
    double radius = circumradius(flatToFlat);

    std::vector<Point2D> result;
    result.reserve(6);

    // 90, 30, -30, -90, -150, -210 degrees: top first, clockwise
    for (int i = 0; i < 6; ++i) {
        double angle = PI / 2.0 - i * PI / 3.0;
        result.push_back(Point2D(center.x + radius * std::cos(angle),
                                 center.y + radius * std::sin(angle)));
    }

    return result;
}

Bounds Hexagon::bounds(const Point2D& center, double flatToFlat) {
    double a = apothem(flatToFlat);
    double r = circumradius(flatToFlat);
    return Bounds(center.x - a, center.y - r, center.x + a, center.y + r);
}

Polygon Hexagon::outline(const Point2D& center, double flatToFlat) {
    return Polygon(vertices(center, flatToFlat));
}

} // namespace toolpath
} // namespace nwss
