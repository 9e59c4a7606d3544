#ifndef NWSS_TOOLPATH_OPERATIONS_H
#define NWSS_TOOLPATH_OPERATIONS_H

#include "core/geometry.h"
#include <string>
#include <vector>

namespace nwss {
namespace toolpath {

/**
 * Tool radius compensation applied to a feature outline
 */
enum class CompensationMode {
    NONE,       // Tool center follows the outline
    INTERIOR,   // Boundary moves toward the enclosed area
    EXTERIOR    // Boundary moves away from the enclosed area
};

enum class PatternType {
    SINGLE,
    LINEAR,
    GRID
};

enum class PatternAxis {
    X,
    Y
};

enum class LeadInMode {
    AUTO,       // Use the global per-shape default, direction from geometry
    MANUAL      // Use the operation's own type and approach angle
};

enum class LeadInType {
    NONE,
    RAMP,
    HELICAL
};

enum class PathPointType {
    START,
    STRAIGHT,
    ARC
};

/**
 * Resolved arc direction
 */
enum class ArcDirection {
    CW,     // G02
    CCW     // G03
};

/**
 * Optional arc direction supplied with an arc point
 */
enum class ArcHint {
    AUTO,
    CW,
    CCW
};

enum class MaterialForm {
    SHEET,
    TUBE
};

enum class ProjectType {
    DRILL,
    CUT
};

/**
 * Per-operation lead-in choice
 */
struct LeadInSpec {
    LeadInMode mode;
    LeadInType type;          // Only used in MANUAL mode
    double approachAngle;     // Degrees, 0 = 12 o'clock, measured clockwise

    LeadInSpec()
        : mode(LeadInMode::AUTO)
        , type(LeadInType::HELICAL)
        , approachAngle(90.0)
    {}

    static LeadInSpec manual(LeadInType t, double angle = 90.0) {
        LeadInSpec spec;
        spec.mode = LeadInMode::MANUAL;
        spec.type = t;
        spec.approachAngle = angle;
        return spec;
    }

    bool isManual() const { return mode == LeadInMode::MANUAL; }
};

/**
 * One point of a line path. The first point of a path is always START.
 */
struct PathPoint {
    PathPointType type;
    double x;
    double y;
    Point2D center;     // Arc center, only meaningful for ARC
    ArcHint hint;       // Arc direction override, only meaningful for ARC

    PathPoint()
        : type(PathPointType::STRAIGHT), x(0.0), y(0.0), hint(ArcHint::AUTO) {}

    static PathPoint start(double x, double y);
    static PathPoint straight(double x, double y);
    static PathPoint arc(double x, double y, double cx, double cy, ArcHint hint = ArcHint::AUTO);

    Point2D position() const { return Point2D(x, y); }
    bool isArc() const { return type == PathPointType::ARC; }
};

/**
 * Drill holes: a single hole, a row along one axis, or a row-major grid
 */
struct DrillOperation {
    std::string id;
    PatternType pattern;
    Point2D start;          // Hole position for SINGLE, first hole otherwise

    // LINEAR
    PatternAxis axis;
    double spacing;
    int count;

    // GRID
    double xSpacing;
    double ySpacing;
    int xCount;
    int yCount;

    DrillOperation()
        : pattern(PatternType::SINGLE)
        , axis(PatternAxis::X)
        , spacing(0.0)
        , count(1)
        , xSpacing(0.0)
        , ySpacing(0.0)
        , xCount(1)
        , yCount(1)
    {}
};

/**
 * Circular cut (single or linear pattern)
 */
struct CircleOperation {
    std::string id;
    PatternType pattern;
    Point2D center;
    double diameter;
    CompensationMode compensation;
    LeadInSpec leadIn;
    double holdTime;        // Seconds of dwell at the start of each pass

    PatternAxis axis;
    double spacing;
    int count;

    CircleOperation()
        : pattern(PatternType::SINGLE)
        , diameter(0.0)
        , compensation(CompensationMode::INTERIOR)
        , holdTime(0.0)
        , axis(PatternAxis::X)
        , spacing(0.0)
        , count(1)
    {}
};

/**
 * Point-up hexagonal cut (single or linear pattern)
 */
struct HexagonOperation {
    std::string id;
    PatternType pattern;
    Point2D center;
    double flatToFlat;
    CompensationMode compensation;
    LeadInSpec leadIn;
    double holdTime;

    PatternAxis axis;
    double spacing;
    int count;

    HexagonOperation()
        : pattern(PatternType::SINGLE)
        , flatToFlat(0.0)
        , compensation(CompensationMode::INTERIOR)
        , holdTime(0.0)
        , axis(PatternAxis::X)
        , spacing(0.0)
        , count(1)
    {}
};

/**
 * Polyline/arc path. Closed when the first and last points coincide.
 */
struct LineOperation {
    std::string id;
    std::vector<PathPoint> points;
    CompensationMode compensation;
    LeadInSpec leadIn;
    double holdTime;

    LineOperation()
        : compensation(CompensationMode::NONE)
        , holdTime(0.0)
    {
        leadIn.type = LeadInType::RAMP;
    }
};

/**
 * All operations of a project, grouped by kind
 */
struct OperationSet {
    std::vector<DrillOperation> drillHoles;
    std::vector<CircleOperation> circularCuts;
    std::vector<HexagonOperation> hexagonalCuts;
    std::vector<LineOperation> lineCuts;

    bool empty() const {
        return drillHoles.empty() && circularCuts.empty() &&
               hexagonalCuts.empty() && lineCuts.empty();
    }
};

/**
 * One concrete circle after pattern expansion
 */
struct ExpandedCircle {
    std::string sourceId;
    Point2D center;
    double diameter;
    CompensationMode compensation;
    LeadInSpec leadIn;
    double holdTime;

    ExpandedCircle()
        : diameter(0.0), compensation(CompensationMode::INTERIOR), holdTime(0.0) {}
};

/**
 * One concrete hexagon after pattern expansion
 */
struct ExpandedHexagon {
    std::string sourceId;
    Point2D center;
    double flatToFlat;
    CompensationMode compensation;
    LeadInSpec leadIn;
    double holdTime;

    ExpandedHexagon()
        : flatToFlat(0.0), compensation(CompensationMode::INTERIOR), holdTime(0.0) {}
};

/**
 * Output of pattern expansion, ready for filtering and generation
 */
struct ExpandedOperations {
    std::vector<Point2D> drillPoints;
    std::vector<ExpandedCircle> circles;
    std::vector<ExpandedHexagon> hexagons;
    std::vector<LineOperation> lines;
};

/**
 * Stock material
 */
struct MaterialSpec {
    std::string name;
    MaterialForm form;
    double thickness;       // Sheet thickness
    double outerWidth;      // Tube outer width
    double outerHeight;     // Tube outer height
    double wallThickness;   // Tube wall

    MaterialSpec()
        : name("Aluminum sheet")
        , form(MaterialForm::SHEET)
        , thickness(0.125)
        , outerWidth(0.0)
        , outerHeight(0.0)
        , wallThickness(0.0)
    {}
};

/**
 * A machining job: what to cut, in which stock
 */
struct Project {
    std::string name;
    ProjectType type;
    OperationSet operations;
    MaterialSpec material;
    bool tubeVoidSkip;          // Drop operations that fall inside a tube's hollow
    double workingLength;       // Tube length laid out along X (preview only)
    bool narrowFaceUp;          // Tube lies on its narrow face (preview only)

    Project()
        : name("Untitled")
        , type(ProjectType::CUT)
        , tubeVoidSkip(false)
        , workingLength(12.0)
        , narrowFaceUp(false)
    {}
};

// String conversions used by the job file, config file and messages.
// The parse functions are case-insensitive and return false for unknown values.
std::string toString(CompensationMode mode);
std::string toString(PatternType pattern);
std::string toString(PatternAxis axis);
std::string toString(LeadInMode mode);
std::string toString(LeadInType type);
std::string toString(ArcHint hint);
std::string toString(MaterialForm form);
std::string toString(ProjectType type);

bool parseCompensation(const std::string& text, CompensationMode& mode);
bool parsePatternType(const std::string& text, PatternType& pattern);
bool parsePatternAxis(const std::string& text, PatternAxis& axis);
bool parseLeadInMode(const std::string& text, LeadInMode& mode);
bool parseLeadInType(const std::string& text, LeadInType& type);
bool parseArcHint(const std::string& text, ArcHint& hint);
bool parseMaterialForm(const std::string& text, MaterialForm& form);
bool parseProjectType(const std::string& text, ProjectType& type);

// Positions of a line path as plain points
std::vector<Point2D> pathPositions(const std::vector<PathPoint>& points);

} // namespace toolpath
} // namespace nwss

#endif // NWSS_TOOLPATH_OPERATIONS_H
