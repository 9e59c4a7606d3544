#include "core/multipass.h"
#include <algorithm>
#include <cmath>

namespace nwss {
namespace toolpath {

int MultiPass::numPasses(double totalDepth, double passDepth) {
    if (passDepth <= 0.0 || totalDepth <= 0.0) {
        return 1;
    }
    // Small epsilon so that an exact multiple does not round up to an extra pass
    int passes = static_cast<int>(std::ceil(totalDepth / passDepth - 1e-9));
    return std::max(1, passes);
}

std::vector<double> MultiPass::passDepths(double totalDepth, double passDepth) {
    int passes = numPasses(totalDepth, passDepth);

    std::vector<double> depths;
    depths.reserve(passes);
    for (int i = 1; i < passes; ++i) {
        depths.push_back(i * totalDepth / passes);
    }
    depths.push_back(totalDepth);
    return depths;
}

double MultiPass::perPassDepth(double totalDepth, double passDepth) {
    return totalDepth / numPasses(totalDepth, passDepth);
}

double MultiPass::materialDepth(const MaterialSpec& material) {
    double depth = material.form == MaterialForm::TUBE ? material.wallThickness
                                                       : material.thickness;
    if (depth <= 0.0) {
        return DEFAULT_MATERIAL_DEPTH;
    }
    return depth;
}

} // namespace toolpath
} // namespace nwss
