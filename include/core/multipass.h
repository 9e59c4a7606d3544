#ifndef NWSS_TOOLPATH_MULTIPASS_H
#define NWSS_TOOLPATH_MULTIPASS_H

#include "core/operations.h"
#include <vector>

namespace nwss {
namespace toolpath {

/**
 * Depth sequencing for pecks and profile passes.
 * Passes are evenly redistributed: every step is totalDepth / numPasses.
 */
class MultiPass {
public:
    /// Fallback cut depth when the material has no usable thickness
    static constexpr double DEFAULT_MATERIAL_DEPTH = 0.125;

    /**
     * Number of passes needed so that no pass exceeds passDepth
     * @return At least 1; exactly 1 when passDepth <= 0
     */
    static int numPasses(double totalDepth, double passDepth);

    /**
     * Cumulative depth reached after each pass
     * @return numPasses values, the last one equal to totalDepth
     */
    static std::vector<double> passDepths(double totalDepth, double passDepth);

    /**
     * Depth removed by each pass
     */
    static double perPassDepth(double totalDepth, double passDepth);

    /**
     * Base depth to cut through: sheet thickness or tube wall
     */
    static double materialDepth(const MaterialSpec& material);
};

} // namespace toolpath
} // namespace nwss

#endif // NWSS_TOOLPATH_MULTIPASS_H
