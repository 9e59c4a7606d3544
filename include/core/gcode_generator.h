#ifndef NWSS_TOOLPATH_GCODE_GENERATOR_H
#define NWSS_TOOLPATH_GCODE_GENERATOR_H

#include "core/feed_safety.h"
#include "core/geometry.h"
#include "core/lead_in.h"
#include "core/operations.h"
#include "core/subroutine_builder.h"
#include <map>
#include <string>
#include <vector>

namespace nwss {
namespace toolpath {

/**
 * Machine and general settings for one generation run
 */
struct GenerationSettings {
    // Heights and spindle
    double safetyHeight;          // Z for retracts between features
    double travelHeight;          // Z for rapid positioning above a feature
    int spindleWarmupSeconds;     // Dwell after M03

    // Lead-ins
    LeadInType circleLeadIn;      // Auto-mode lead-in per shape
    LeadInType hexagonLeadIn;
    LeadInType lineLeadIn;
    double rampAngle;             // Degrees, sets the ramp lead-in distance
    double helixPitch;            // Z drop per helix revolution

    // Feed safety
    double maxStepdownFactor;     // Pass depth warning threshold, fraction of tool diameter
    double firstPassFeedFactor;
    bool cornerSlowdownEnabled;
    double cornerFeedFactor;
    bool arcSlowdownEnabled;
    double arcFeedFactor;

    // Machine
    bool supportsSubroutines;     // Emit M98 calls and subroutine files
    double maxX;
    double maxY;
    std::string basePath;         // Controller-side directory holding the subroutine files
    bool allowNegativeCoordinates;

    double cutThroughBuffer;      // Extra depth below the material for cut projects
    bool verbose;                 // Print DEBUG diagnostics to stdout

    GenerationSettings() :
        safetyHeight(0.5),
        travelHeight(0.2),
        spindleWarmupSeconds(2),
        circleLeadIn(LeadInType::HELICAL),
        hexagonLeadIn(LeadInType::HELICAL),
        lineLeadIn(LeadInType::RAMP),
        rampAngle(3.0),
        helixPitch(0.04),
        maxStepdownFactor(0.5),
        firstPassFeedFactor(0.7),
        cornerSlowdownEnabled(true),
        cornerFeedFactor(0.5),
        arcSlowdownEnabled(true),
        arcFeedFactor(0.8),
        supportsSubroutines(true),
        maxX(24.0),
        maxY(18.0),
        basePath("C:\\Mach3\\GCode"),
        allowNegativeCoordinates(false),
        cutThroughBuffer(0.0),
        verbose(false)
    {}
};

/**
 * Cutting parameters of one tool in one material
 */
struct ToolParams {
    int spindleSpeed;
    double feedRate;              // in/min
    double plungeRate;            // in/min
    double peckingDepth;          // Drills
    double passDepth;             // End mills
    double toolDiameter;
    double tipCompensation;       // Drills: extra depth for the point angle

    ToolParams() :
        spindleSpeed(1000),
        feedRate(10.0),
        plungeRate(5.0),
        peckingDepth(0.05),
        passDepth(0.025),
        toolDiameter(0.125),
        tipCompensation(0.0)
    {}
};

/**
 * Output of one run: main program, numbered subroutine files and messages
 */
struct GenerationResult {
    bool success;
    std::string mainProgram;
    std::map<int, std::string> subroutines;
    std::string projectName;                  // Sanitized
    std::vector<std::string> warnings;
    std::vector<std::string> errors;
    std::vector<std::string> skippedOperations;

    GenerationResult() : success(true) {}

    bool hasWarnings() const { return !warnings.empty(); }
    bool hasErrors() const { return !errors.empty(); }
    bool isValid() const { return success && errors.empty(); }
};

/**
 * Turns expanded operations into a main program and subroutine files.
 *
 * Emission order is drill, circle, hexagon, line. A generator holds only its
 * configuration; every call to generate() is independent.
 */
class GCodeGenerator {
public:
    /**
     * @param settings Machine and general settings
     * @param projectName Project name, sanitized for the subroutine paths
     * @param materialDepth Total depth to cut or drill
     */
    GCodeGenerator(const GenerationSettings& settings, const std::string& projectName,
                   double materialDepth);

    /**
     * Generate the program for already expanded (and filtered) operations
     * @param operations Expanded operations
     * @param drillParams Drill parameters, or nullptr when nothing is drilled
     * @param cutParams End mill parameters, or nullptr when nothing is cut
     * @param original Unexpanded operations; lets drill patterns become subroutines
     * @return Result; on any geometry error success is false and no G-code is returned
     */
    GenerationResult generate(const ExpandedOperations& operations,
                              const ToolParams* drillParams,
                              const ToolParams* cutParams,
                              const OperationSet* original = nullptr) const;

    /**
     * Validate, expand, filter the tube void and generate a whole project
     */
    static GenerationResult generateProject(const Project& project,
                                            const GenerationSettings& settings,
                                            const ToolParams* drillParams,
                                            const ToolParams* cutParams);

    /**
     * Base material depth plus tip compensation (drill projects) or the
     * cut-through buffer (cut projects)
     */
    static double projectMaterialDepth(const Project& project,
                                       const GenerationSettings& settings,
                                       const ToolParams* drillParams);

    const std::string& projectName() const { return m_projectName; }
    double materialDepth() const { return m_materialDepth; }

private:
    /**
     * One move of an inline profile cut
     */
    struct PathMove {
        enum Type { LINEAR, ARC, FULL_CIRCLE };

        Type type;
        Point2D to;
        Point2D center;           // ARC and FULL_CIRCLE
        ArcHint hint;
        double cornerFactor;

        PathMove() : type(LINEAR), hint(ArcHint::AUTO), cornerFactor(1.0) {}
    };

    /**
     * Everything an inline profile cut needs
     */
    struct CutPath {
        std::vector<PathMove> moves;
        LeadInPlan leadIn;
        bool closed;
        bool cornerSlowdown;
        bool arcTransition;       // Circle: arc from helix to profile, otherwise a line
        double profileRadius;

        CutPath() : closed(true), cornerSlowdown(false), arcTransition(false), profileRadius(0.0) {}
    };

    /**
     * Mutable state of one generate() call
     */
    struct Run {
        std::map<int, std::string> subroutines;
        SubroutineAllocator allocator;
        std::vector<std::string> warnings;
        SafetyCoordinator safety;
        double leadInDistance;

        Run() : leadInDistance(LeadIn::DEFAULT_DISTANCE) {}
    };

    GenerationSettings m_settings;
    std::string m_projectName;
    double m_materialDepth;

    std::vector<std::string> drillLines(Run& run, const std::vector<Point2D>& points,
                                        const ToolParams& params,
                                        const std::vector<DrillOperation>* operations) const;

    std::vector<std::string> inlineDrill(const std::vector<Point2D>& points,
                                         const std::vector<double>& pecks,
                                         const ToolParams& params) const;

    std::vector<std::string> circleLines(Run& run, const std::vector<ExpandedCircle>& circles,
                                         const ToolParams& params) const;

    std::vector<std::string> hexagonLines(Run& run, const std::vector<ExpandedHexagon>& hexagons,
                                          const ToolParams& params) const;

    std::vector<std::string> lineLines(Run& run, const std::vector<LineOperation>& lines,
                                       const ToolParams& params) const;

    /**
     * Multi-pass inline cut: position, per-pass entry, profile moves, lead-out, retract
     */
    std::vector<std::string> pathCut(Run& run, const CutPath& path, const ToolParams& params) const;

    CutPath circleCutPath(Run& run, const ExpandedCircle& circle, const ToolParams& params) const;
    CutPath hexagonCutPath(Run& run, const ExpandedHexagon& hexagon, const ToolParams& params) const;
    CutPath lineCutPath(const std::vector<PathPoint>& points, const LeadInPlan& leadIn) const;

    /**
     * Position above an entry point, descend to the surface, call and retract
     */
    void appendCall(std::vector<std::string>& lines, const Point2D& entry,
                    int number, int loopCount) const;

    std::string subroutinePath(int number) const;

    static double passDepthOf(const ToolParams& params);
    static void addFallbackWarning(Run& run, const LeadInPlan& plan, const std::string& label);
};

} // namespace toolpath
} // namespace nwss

#endif // NWSS_TOOLPATH_GCODE_GENERATOR_H
