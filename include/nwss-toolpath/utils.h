#ifndef NWSS_TOOLPATH_UTILS_H
#define NWSS_TOOLPATH_UTILS_H

#include <string>
#include "core/gcode_generator.h"
#include "core/operations.h"
#include "core/preview.h"
#include "nwss-toolpath/config.h"

namespace nwss {
namespace toolpath {

class Utils {
public:
    // Write main.tap, every {number}.nc and config.txt into {baseDir}/{project}
    // directory receives the project directory that was written
    static bool writeOutputDirectory(const std::string& baseDir,
                                     const GenerationResult& result,
                                     const std::string& configDump,
                                     std::string& directory);

    // Human-readable record of everything a generation run used
    static std::string formatConfigDump(const Project& project,
                                        const ToolpathConfig& config,
                                        double materialDepth);

    // Serialise a preview scene to an SVG file
    static bool writePreviewSVG(const Scene& scene, const std::string& filename);

    // Write text exactly as given (no newline is added)
    static bool writeTextFile(const std::string& filename, const std::string& content);

    // Format a number with a specific precision
    static std::string formatNumber(double value, int precision = 4);
};

} // namespace toolpath
} // namespace nwss

#endif // NWSS_TOOLPATH_UTILS_H
