#ifndef NWSS_TOOLPATH_VALIDATOR_H
#define NWSS_TOOLPATH_VALIDATOR_H

#include "core/gcode_generator.h"
#include "core/operations.h"
#include <string>
#include <vector>

namespace nwss {
namespace toolpath {

/**
 * Errors block generation, warnings are passed through to the result
 */
struct ValidationReport {
    bool success;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    ValidationReport() : success(true) {}

    bool hasWarnings() const { return !warnings.empty(); }
    bool hasErrors() const { return !errors.empty(); }
    bool isValid() const { return success && errors.empty(); }
};

/**
 * Pre-generation checks. Nothing here throws; every problem becomes a message.
 */
class Validator {
public:
    /// Largest allowed difference between an arc's start and end radius
    static constexpr double ARC_RADIUS_TOLERANCE = 0.001;

    /**
     * Structural checks, machine bounds and compensation feasibility
     * @param operations Unexpanded operations
     * @param settings Machine bounds and the negative coordinate switch
     * @param toolDiameter End mill diameter for compensation, 0 when unknown
     * @return Errors, indexed per operation where one is at fault
     */
    static std::vector<std::string> validate(const OperationSet& operations,
                                             const GenerationSettings& settings,
                                             double toolDiameter);

    /**
     * Arcs whose start and end are not the same distance from the center
     */
    static std::vector<std::string> validateArcGeometry(const std::vector<PathPoint>& points,
                                                        double tolerance = ARC_RADIUS_TOLERANCE);

    /**
     * Pass depth above the tool diameter is an error, above maxStepdownFactor
     * times the diameter a warning
     */
    static void validateStepdown(double passDepth, double toolDiameter,
                                 double maxStepdownFactor, ValidationReport& report);

    static std::vector<std::string> validateFeedRates(double feedRate, double plungeRate);

    /**
     * One warning naming every cut type whose default lead-in is NONE
     */
    static std::vector<std::string> leadInWarnings(const OperationSet& operations,
                                                   const GenerationSettings& settings);

    static std::vector<std::string> selfIntersectionWarnings(const OperationSet& operations);

    /**
     * Everything the project needs before it can be generated
     */
    static ValidationReport validateProject(const Project& project,
                                            const GenerationSettings& settings,
                                            const ToolParams* drillParams,
                                            const ToolParams* cutParams);

private:
    static void addError(ValidationReport& report, const std::string& message);
    static void addWarning(ValidationReport& report, const std::string& message);
};

} // namespace toolpath
} // namespace nwss

#endif // NWSS_TOOLPATH_VALIDATOR_H
