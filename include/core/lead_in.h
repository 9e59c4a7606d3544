#ifndef NWSS_TOOLPATH_LEAD_IN_H
#define NWSS_TOOLPATH_LEAD_IN_H

#include "core/geometry.h"
#include "core/operations.h"
#include <vector>

namespace nwss {
namespace toolpath {

/**
 * Resolved entry strategy for one profile cut
 */
struct LeadInPlan {
    LeadInType type;            // Effective type after fallback
    double approachAngle;       // Degrees, 0 = 12 o'clock, clockwise
    Point2D profileStart;       // Where the profile itself begins
    Point2D leadInPoint;        // RAMP: where the ramp starts
    Point2D helixCenter;        // HELICAL
    double helixRadius;         // HELICAL
    bool helicalFallback;       // Helical was requested but the feature is too small

    LeadInPlan()
        : type(LeadInType::NONE)
        , approachAngle(90.0)
        , helixRadius(0.0)
        , helicalFallback(false)
    {}

    /**
     * Helix start point on the approach angle
     */
    Point2D helixStart() const;

    /**
     * XY position the tool is brought to before descending
     */
    Point2D entryPoint() const;
};

/**
 * Ramp and helical entry geometry for profile cuts (never used for drilling)
 */
class LeadIn {
public:
    /// Smallest helix that still gives smooth helical motion
    static constexpr double MIN_HELIX_RADIUS = 0.05;
    /// Gap kept between the helix and the cut profile
    static constexpr double HELIX_CLEARANCE = 0.025;
    /// Used when the ramp angle or pass depth is unusable
    static constexpr double DEFAULT_DISTANCE = 0.25;

    /**
     * Horizontal length of a ramp that descends one pass at the given angle
     * @param rampAngle Entry angle in degrees
     * @param passDepth Depth per pass
     * @return passDepth / tan(rampAngle), or DEFAULT_DISTANCE when either is <= 0
     */
    static double leadInDistance(double rampAngle, double passDepth);

    /**
     * Point on a circle of the given radius at an approach angle
     */
    static Point2D pointAtAngle(const Point2D& center, double radius, double approachAngle);

    /**
     * Circle lead-in point, radially outward from the profile start
     */
    static Point2D circleLeadInPoint(const Point2D& center, double cutRadius,
                                     double distance, double approachAngle = 90.0);

    /**
     * Hexagon lead-in point found by extending edge v0 -> v1 backward
     */
    static Point2D hexagonLeadInPoint(const std::vector<Point2D>& vertices, double distance);

    /**
     * Hexagon lead-in point on the approach angle, at vertex distance + distance from center
     */
    static Point2D hexagonLeadInPoint(const std::vector<Point2D>& vertices, const Point2D& center,
                                      double distance, double approachAngle);

    /**
     * Line lead-in point derived from the path.
     *
     * Closed compensated paths put the lead-in on the waste side, perpendicular
     * to the first segment. Everything else extends p0 -> p1 backward.
     */
    static Point2D lineLeadInPoint(const std::vector<PathPoint>& points, double distance,
                                   CompensationMode compensation);

    /**
     * Line lead-in point on an explicit approach angle from the first point
     */
    static Point2D lineLeadInPoint(const std::vector<PathPoint>& points, double distance,
                                   double approachAngle);

    /**
     * Helix radius for a circle cut
     * @param radius Receives min(cutRadius - clearance, toolRadius + clearance)
     * @return False if the circle is too small for helical entry
     */
    static bool circleHelixRadius(double cutRadius, double toolDiameter, double& radius);

    /**
     * Helix radius for a hexagon cut, centered on the hexagon
     * @return False if the hexagon is too small for helical entry
     */
    static bool hexagonHelixRadius(double flatToFlat, double toolDiameter,
                                   CompensationMode compensation, double& radius);

    /**
     * Full revolutions needed to descend a depth at a pitch (at least 1)
     */
    static int helixRevolutions(double depth, double pitch);

    /**
     * Feed for each helix revolution, ramping from the plunge rate toward endFeed.
     * One revolution runs at 75% of the range, two at 50% and 75%,
     * three or more at 25%, 50%, then 75%.
     */
    static std::vector<double> helixFeeds(int revolutions, double plungeRate, double endFeed);

    /**
     * Plan the entry for a circle cut. A helical request on a circle that is too
     * small becomes RAMP with helicalFallback set.
     */
    static LeadInPlan planCircle(const Point2D& center, double cutRadius, double toolDiameter,
                                 LeadInType requested, double approachAngle,
                                 double leadInDistance);

    /**
     * Plan the entry for a hexagon cut
     * @param vertices Compensated vertices
     * @param radialLeadIn Place a ramp lead-in on the approach angle instead of along edge v0 -> v1
     */
    static LeadInPlan planHexagon(const Point2D& center, double flatToFlat,
                                  CompensationMode compensation,
                                  const std::vector<Point2D>& vertices, double toolDiameter,
                                  LeadInType requested, double approachAngle,
                                  bool radialLeadIn, double leadInDistance);

    /**
     * Plan the entry for a line cut. Lines only ramp; any other request yields NONE.
     * @param points Path as it will be cut (already compensated)
     * @param useApproachAngle Manual mode: the approach angle overrides path direction
     */
    static LeadInPlan planLine(const std::vector<PathPoint>& points,
                               CompensationMode compensation, LeadInType requested,
                               bool useApproachAngle, double approachAngle,
                               double leadInDistance);
};

} // namespace toolpath
} // namespace nwss

#endif // NWSS_TOOLPATH_LEAD_IN_H
