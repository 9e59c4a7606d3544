#include "core/lead_in.h"
#include "core/hexagon.h"
#include "core/tool_compensation.h"
#include <algorithm>
#include <cmath>

namespace nwss {
namespace toolpath {

namespace {

// Edges shorter than this have no usable direction
const double MIN_EDGE_LENGTH = 1e-4;

} // namespace

Point2D LeadInPlan::helixStart() const {
    return LeadIn::pointAtAngle(helixCenter, helixRadius, approachAngle);
}

Point2D LeadInPlan::entryPoint() const {
    switch (type) {
        case LeadInType::HELICAL: return helixStart();
        case LeadInType::RAMP: return leadInPoint;
        case LeadInType::NONE: break;
    }
    return profileStart;
}

double LeadIn::leadInDistance(double rampAngle, double passDepth) {
    if (rampAngle <= 0.0 || passDepth <= 0.0) {
        return DEFAULT_DISTANCE;
    }
    double distance = passDepth / std::tan(Geometry::toRadians(rampAngle));
    if (!std::isfinite(distance) || distance <= 0.0) {
        return DEFAULT_DISTANCE;
    }
    return distance;
}

Point2D LeadIn::pointAtAngle(const Point2D& center, double radius, double approachAngle) {
    double angle = Geometry::approachAngleToRadians(approachAngle);
    return Point2D(center.x + radius * std::cos(angle), center.y + radius * std::sin(angle));
}

Point2D LeadIn::circleLeadInPoint(const Point2D& center, double cutRadius,
                                  double distance, double approachAngle) {
    return pointAtAngle(center, cutRadius + distance, approachAngle);
}

Point2D LeadIn::hexagonLeadInPoint(const std::vector<Point2D>& vertices, double distance) {
    if (vertices.size() < 2) {
        return vertices.empty() ? Point2D() : vertices[0];
    }

    const Point2D& v0 = vertices[0];
    const Point2D& v1 = vertices[1];
    if (v0.distanceTo(v1) < MIN_EDGE_LENGTH) {
        return v0;
    }

    Point2D dir = Geometry::direction(v0, v1);
    return v0 - dir * distance;
}

Point2D LeadIn::hexagonLeadInPoint(const std::vector<Point2D>& vertices, const Point2D& center,
                                   double distance, double approachAngle) {
    double vertexDistance = vertices.empty() ? 0.0 : vertices[0].distanceTo(center);
    return pointAtAngle(center, vertexDistance + distance, approachAngle);
}

Point2D LeadIn::lineLeadInPoint(const std::vector<PathPoint>& points, double distance,
                                CompensationMode compensation) {
    if (points.size() < 2) {
        return points.empty() ? Point2D() : points[0].position();
    }

    Point2D p0 = points[0].position();
    Point2D p1 = points[1].position();
    if (p0.distanceTo(p1) < MIN_EDGE_LENGTH) {
        return p0;
    }

    bool closed = Geometry::isClosed(pathPositions(points));
    if (closed && compensation != CompensationMode::NONE) {
        // Enter from the waste side, square to the first segment
        Point2D normal = Geometry::leftNormal(p0, p1);
        double winding = ToolCompensation::pathWinding(points);
        double side = winding >= 0 ? 1.0 : -1.0;
        if (compensation == CompensationMode::EXTERIOR) {
            side = -side;
        }
        return p0 + normal * (side * distance);
    }

    return p0 - Geometry::direction(p0, p1) * distance;
}

Point2D LeadIn::lineLeadInPoint(const std::vector<PathPoint>& points, double distance,
                                double approachAngle) {
    if (points.empty()) {
        return Point2D();
    }
    return pointAtAngle(points[0].position(), distance, approachAngle);
}

bool LeadIn::circleHelixRadius(double cutRadius, double toolDiameter, double& radius) {
    double maxRadius = cutRadius - HELIX_CLEARANCE;
    if (maxRadius < MIN_HELIX_RADIUS) {
        return false;
    }
    // Small tools give a helix under the minimum even in a large circle
    double candidate = std::min(maxRadius, toolDiameter / 2.0 + HELIX_CLEARANCE);
    if (candidate < MIN_HELIX_RADIUS) {
        return false;
    }
    radius = candidate;
    return true;
}

bool LeadIn::hexagonHelixRadius(double flatToFlat, double toolDiameter,
                                CompensationMode compensation, double& radius) {
    double toolRadius = toolDiameter / 2.0;
    double available = Hexagon::apothem(flatToFlat) - HELIX_CLEARANCE;
    if (compensation == CompensationMode::INTERIOR) {
        available -= toolRadius;
    }

    double candidate = std::min(available, toolRadius + HELIX_CLEARANCE);
    if (candidate < MIN_HELIX_RADIUS) {
        return false;
    }
    radius = candidate;
    return true;
}

int LeadIn::helixRevolutions(double depth, double pitch) {
    if (pitch <= 0.0) {
        return 1;
    }
    int revolutions = static_cast<int>(std::ceil(depth / pitch));
    return std::max(1, revolutions);
}

std::vector<double> LeadIn::helixFeeds(int revolutions, double plungeRate, double endFeed) {
    static const double STEPS[] = {0.25, 0.5, 0.75};

    std::vector<double> feeds;
    if (revolutions <= 0) {
        return feeds;
    }

    std::vector<double> fractions;
    if (revolutions == 1) {
        fractions.push_back(0.75);
    } else if (revolutions == 2) {
        fractions.push_back(0.5);
        fractions.push_back(0.75);
    } else {
        for (int i = 0; i < revolutions; ++i) {
            fractions.push_back(STEPS[std::min(i, 2)]);
        }
    }

    for (double fraction : fractions) {
        feeds.push_back(plungeRate + (endFeed - plungeRate) * fraction);
    }
    return feeds;
}

// ================================
// Per-shape planning
// ================================

LeadInPlan LeadIn::planCircle(const Point2D& center, double cutRadius, double toolDiameter,
                              LeadInType requested, double approachAngle,
                              double leadInDistance) {
    LeadInPlan plan;
    plan.type = requested;
    plan.approachAngle = approachAngle;
    plan.profileStart = pointAtAngle(center, cutRadius, approachAngle);
    plan.helixCenter = center;

    if (requested == LeadInType::HELICAL) {
        double radius = 0.0;
        if (circleHelixRadius(cutRadius, toolDiameter, radius)) {
            plan.helixRadius = radius;
        } else {
            plan.type = LeadInType::RAMP;
            plan.helicalFallback = true;
        }
    }

    if (plan.type == LeadInType::RAMP) {
        plan.leadInPoint = circleLeadInPoint(center, cutRadius, leadInDistance, approachAngle);
    }
    return plan;
}

LeadInPlan LeadIn::planHexagon(const Point2D& center, double flatToFlat,
                               CompensationMode compensation,
                               const std::vector<Point2D>& vertices, double toolDiameter,
                               LeadInType requested, double approachAngle,
                               bool radialLeadIn, double leadInDistance) {
    LeadInPlan plan;
    plan.type = requested;
    plan.approachAngle = approachAngle;
    plan.profileStart = vertices.empty() ? center : vertices[0];
    plan.helixCenter = center;

    if (requested == LeadInType::HELICAL) {
        double radius = 0.0;
        if (hexagonHelixRadius(flatToFlat, toolDiameter, compensation, radius)) {
            plan.helixRadius = radius;
        } else {
            plan.type = LeadInType::RAMP;
            plan.helicalFallback = true;
        }
    }

    if (plan.type == LeadInType::RAMP) {
        plan.leadInPoint = radialLeadIn
            ? hexagonLeadInPoint(vertices, center, leadInDistance, approachAngle)
            : hexagonLeadInPoint(vertices, leadInDistance);
    }
    return plan;
}

LeadInPlan LeadIn::planLine(const std::vector<PathPoint>& points,
                            CompensationMode compensation, LeadInType requested,
                            bool useApproachAngle, double approachAngle,
                            double leadInDistance) {
    LeadInPlan plan;
    plan.approachAngle = approachAngle;
    if (!points.empty()) {
        plan.profileStart = points[0].position();
    }

    if (requested != LeadInType::RAMP || points.size() < 2) {
        plan.type = LeadInType::NONE;
        return plan;
    }

    plan.type = LeadInType::RAMP;
    plan.leadInPoint = useApproachAngle
        ? lineLeadInPoint(points, leadInDistance, approachAngle)
        : lineLeadInPoint(points, leadInDistance, compensation);
    return plan;
}

} // namespace toolpath
} // namespace nwss
