#include "core/operations.h"
#include <algorithm>
#include <cctype>

namespace nwss {
namespace toolpath {

namespace {

std::string lower(const std::string& text) {
    std::string result = text;
    std::transform(result.begin(), result.end(), result.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return result;
}

} // namespace

PathPoint PathPoint::start(double x, double y) {
    PathPoint point;
    point.type = PathPointType::START;
    point.x = x;
    point.y = y;
    return point;
}

PathPoint PathPoint::straight(double x, double y) {
    PathPoint point;
    point.type = PathPointType::STRAIGHT;
    point.x = x;
    point.y = y;
    return point;
}

PathPoint PathPoint::arc(double x, double y, double cx, double cy, ArcHint hint) {
    PathPoint point;
    point.type = PathPointType::ARC;
    point.x = x;
    point.y = y;
    point.center = Point2D(cx, cy);
    point.hint = hint;
    return point;
}

std::string toString(CompensationMode mode) {
    switch (mode) {
        case CompensationMode::INTERIOR: return "interior";
        case CompensationMode::EXTERIOR: return "exterior";
        case CompensationMode::NONE: break;
    }
    return "none";
}

std::string toString(PatternType pattern) {
    switch (pattern) {
        case PatternType::LINEAR: return "linear";
        case PatternType::GRID: return "grid";
        case PatternType::SINGLE: break;
    }
    return "single";
}

std::string toString(PatternAxis axis) {
    return axis == PatternAxis::X ? "x" : "y";
}

std::string toString(LeadInMode mode) {
    return mode == LeadInMode::MANUAL ? "manual" : "auto";
}

std::string toString(LeadInType type) {
    switch (type) {
        case LeadInType::RAMP: return "ramp";
        case LeadInType::HELICAL: return "helical";
        case LeadInType::NONE: break;
    }
    return "none";
}

std::string toString(ArcHint hint) {
    switch (hint) {
        case ArcHint::CW: return "cw";
        case ArcHint::CCW: return "ccw";
        case ArcHint::AUTO: break;
    }
    return "auto";
}

std::string toString(MaterialForm form) {
    return form == MaterialForm::TUBE ? "tube" : "sheet";
}

std::string toString(ProjectType type) {
    return type == ProjectType::DRILL ? "drill" : "cut";
}

bool parseCompensation(const std::string& text, CompensationMode& mode) {
    std::string value = lower(text);
    if (value == "none") mode = CompensationMode::NONE;
    else if (value == "interior") mode = CompensationMode::INTERIOR;
    else if (value == "exterior") mode = CompensationMode::EXTERIOR;
    else return false;
    return true;
}

bool parsePatternType(const std::string& text, PatternType& pattern) {
    std::string value = lower(text);
    if (value == "single") pattern = PatternType::SINGLE;
    else if (value == "linear" || value == "pattern_linear") pattern = PatternType::LINEAR;
    else if (value == "grid" || value == "pattern_grid") pattern = PatternType::GRID;
    else return false;
    return true;
}

bool parsePatternAxis(const std::string& text, PatternAxis& axis) {
    std::string value = lower(text);
    if (value == "x") axis = PatternAxis::X;
    else if (value == "y") axis = PatternAxis::Y;
    else return false;
    return true;
}

bool parseLeadInMode(const std::string& text, LeadInMode& mode) {
    std::string value = lower(text);
    if (value == "auto") mode = LeadInMode::AUTO;
    else if (value == "manual") mode = LeadInMode::MANUAL;
    else return false;
    return true;
}

bool parseLeadInType(const std::string& text, LeadInType& type) {
    std::string value = lower(text);
    if (value == "none") type = LeadInType::NONE;
    else if (value == "ramp") type = LeadInType::RAMP;
    else if (value == "helical") type = LeadInType::HELICAL;
    else return false;
    return true;
}

bool parseArcHint(const std::string& text, ArcHint& hint) {
    std::string value = lower(text);
    if (value.empty() || value == "auto") hint = ArcHint::AUTO;
    else if (value == "cw" || value == "g02") hint = ArcHint::CW;
    else if (value == "ccw" || value == "g03") hint = ArcHint::CCW;
    else return false;
    return true;
}

bool parseMaterialForm(const std::string& text, MaterialForm& form) {
    std::string value = lower(text);
    if (value == "sheet") form = MaterialForm::SHEET;
    else if (value == "tube") form = MaterialForm::TUBE;
    else return false;
    return true;
}

bool parseProjectType(const std::string& text, ProjectType& type) {
    std::string value = lower(text);
    if (value == "drill") type = ProjectType::DRILL;
    else if (value == "cut") type = ProjectType::CUT;
    else return false;
    return true;
}

std::vector<Point2D> pathPositions(const std::vector<PathPoint>& points) {
    std::vector<Point2D> positions;
    positions.reserve(points.size());
    for (const auto& point : points) {
        positions.push_back(point.position());
    }
    return positions;
}

} // namespace toolpath
} // namespace nwss
