#ifndef NWSS_TOOLPATH_SUBROUTINE_BUILDER_H
#define NWSS_TOOLPATH_SUBROUTINE_BUILDER_H

#include <string>
#include <vector>

#include "core/feed_safety.h"
#include "core/geometry.h"
#include "core/operations.h"

namespace nwss {
namespace toolpath {

enum class SubroutineKind { DRILL, CIRCLE, HEXAGON, LINE };

/**
 * Hands out subroutine numbers from a fixed range per operation kind.
 * One allocator lives for one generation run.
 */
class SubroutineAllocator {
public:
  /**
   * Number range of a kind: drill 1000-1099, circle 1100-1199,
   * hexagon 1200-1299, line 1300-1399
   */
  static void range(SubroutineKind kind, int &first, int &last);

  /**
   * Lowest unused number in the kind's range.
   * @throws ValidationError when all 100 numbers of the range are taken
   */
  int next(SubroutineKind kind);

  bool isUsed(int number) const;
  const std::vector<int> &used() const { return m_used; }

private:
  std::vector<int> m_used;
};

/**
 * One pass around a circle, relative to the position the caller left the tool at
 */
struct CirclePassSpec {
  double cutRadius = 0.0;
  double passDepth = 0.0;
  double plungeRate = 0.0;
  double feedRate = 0.0;     // Straight lead-out moves
  double arcFeed = 0.0;      // Every arc move
  LeadInType leadIn = LeadInType::NONE;
  double leadInDistance = 0.0;
  double helixRadius = 0.0;
  double helixPitch = 0.04;
  double approachAngle = 90.0;
  double holdTime = 0.0;     // Seconds
};

/**
 * One pass around a hexagon at absolute XY
 */
struct HexagonPassSpec {
  std::vector<Point2D> vertices;
  Point2D center;
  double passDepth = 0.0;
  double plungeRate = 0.0;
  double feedRate = 0.0;
  double helixEndFeed = 0.0;
  LeadInType leadIn = LeadInType::NONE;
  Point2D leadInPoint;
  double helixRadius = 0.0;
  double helixPitch = 0.04;
  double approachAngle = 90.0;
  double holdTime = 0.0;
};

/**
 * One pass along a line path at absolute XY
 */
struct LinePassSpec {
  std::vector<PathPoint> points;
  double passDepth = 0.0;
  double plungeRate = 0.0;
  double feedRate = 0.0;
  bool hasLeadIn = false;
  Point2D leadInPoint;
  double holdTime = 0.0;
};

/**
 * Bodies of the numbered subroutine files.
 *
 * Every body descends with relative Z (inside a G91/G90 bracket) so that an
 * M98 call with L{n} cuts n passes, one pass deeper per repeat.
 */
class SubroutineBuilder {
public:
  /**
   * Peck one hole from Z0, retract to travel height and step to the next hole
   * @param pecks Cumulative peck depths
   */
  static std::vector<std::string> peckDrill(const std::vector<double> &pecks,
                                            double plungeRate,
                                            double travelHeight,
                                            PatternAxis axis, double spacing);

  static std::vector<std::string> circlePass(const CirclePassSpec &spec);

  static std::vector<std::string> hexagonPass(const HexagonPassSpec &spec);

  /**
   * Arc moves take the arc slowdown, corner points the corner slowdown
   */
  static std::vector<std::string> linePath(const LinePassSpec &spec,
                                           const SafetyCoordinator &safety);

  /**
   * Complete file text: body followed by M99 and %
   */
  static std::string file(const std::vector<std::string> &body);

private:
  static void insertDwell(std::vector<std::string> &lines, double holdTime);
  static std::vector<std::string> plungePreamble(double passDepth,
                                                 double plungeRate);
  static std::vector<std::string> rampPreamble(const Point2D &from,
                                               const Point2D &to,
                                               double passDepth,
                                               double plungeRate);
};

} // namespace toolpath
} // namespace nwss

#endif // NWSS_TOOLPATH_SUBROUTINE_BUILDER_H
