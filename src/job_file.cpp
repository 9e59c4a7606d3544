#include "nwss-toolpath/job_file.h"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

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

JobFile::JobFile() : m_section(Section::NONE) {}

void JobFile::reset() {
    m_project = Project();
    m_errors.clear();
    m_section = Section::NONE;
    m_drill = DrillOperation();
    m_circle = CircleOperation();
    m_hexagon = HexagonOperation();
    m_line = LineOperation();
}

bool JobFile::loadFromFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Error: Could not open job file: " << filename << std::endl;
        reset();
        m_errors.push_back("Could not open job file: " + filename);
        return false;
    }

    bool ok = loadFromStream(file);
    file.close();
    return ok;
}

bool JobFile::loadFromStream(std::istream& input) {
    reset();

    std::string line;
    int lineNumber = 0;

    while (std::getline(input, line)) {
        ++lineNumber;
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        if (line[0] == '[') {
            if (line[line.length() - 1] != ']') {
                addError(lineNumber, "Unterminated section header '" + line + "'");
                continue;
            }
            beginSection(trim(line.substr(1, line.length() - 2)), lineNumber);
            continue;
        }

        size_t pos = line.find('=');
        if (pos == std::string::npos) {
            addError(lineNumber, "Expected key=value, got '" + line + "'");
            continue;
        }

        std::string key = lower(trim(line.substr(0, pos)));
        std::string value = trim(line.substr(pos + 1));
        if (key.empty()) {
            addError(lineNumber, "Missing key before '='");
            continue;
        }
        applyKey(key, value, lineNumber);
    }

    finishSection();
    return m_errors.empty();
}

void JobFile::beginSection(const std::string& name, int lineNumber) {
    finishSection();

    std::string section = lower(name);
    if (section == "project") {
        if (!m_project.operations.empty()) {
            addError(lineNumber, "[project] must come before the operations");
        }
        m_section = Section::PROJECT;
    } else if (section == "drill") {
        m_drill = DrillOperation();
        m_section = Section::DRILL;
    } else if (section == "circle") {
        m_circle = CircleOperation();
        m_section = Section::CIRCLE;
    } else if (section == "hexagon") {
        m_hexagon = HexagonOperation();
        m_section = Section::HEXAGON;
    } else if (section == "line") {
        m_line = LineOperation();
        m_section = Section::LINE;
    } else {
        addError(lineNumber, "Unknown section [" + name + "]");
        m_section = Section::NONE;
    }
}

void JobFile::finishSection() {
    switch (m_section) {
        case Section::DRILL:
            m_project.operations.drillHoles.push_back(m_drill);
            break;
        case Section::CIRCLE:
            m_project.operations.circularCuts.push_back(m_circle);
            break;
        case Section::HEXAGON:
            m_project.operations.hexagonalCuts.push_back(m_hexagon);
            break;
        case Section::LINE:
            m_project.operations.lineCuts.push_back(m_line);
            break;
        case Section::PROJECT:
        case Section::NONE:
            break;
    }
    m_section = Section::NONE;
}

void JobFile::applyKey(const std::string& key, const std::string& value, int lineNumber) {
    KeyResult result = KeyResult::UNKNOWN_KEY;
    switch (m_section) {
        case Section::PROJECT: result = applyProjectKey(key, value); break;
        case Section::DRILL: result = applyDrillKey(key, value); break;
        case Section::CIRCLE: result = applyCircleKey(key, value); break;
        case Section::HEXAGON: result = applyHexagonKey(key, value); break;
        case Section::LINE: result = applyLineKey(key, value); break;
        case Section::NONE:
            addError(lineNumber, "Key '" + key + "' is outside of any section");
            return;
    }

    if (result == KeyResult::UNKNOWN_KEY) {
        addError(lineNumber, "Unknown key '" + key + "'");
    } else if (result == KeyResult::BAD_VALUE) {
        addError(lineNumber, "Invalid value '" + value + "' for " + key);
    }
}

JobFile::KeyResult JobFile::check(bool ok) {
    return ok ? KeyResult::OK : KeyResult::BAD_VALUE;
}

JobFile::KeyResult JobFile::applyProjectKey(const std::string& key, const std::string& value) {
    if (key == "name") {
        m_project.name = value;
        return KeyResult::OK;
    }
    if (key == "type") return check(parseProjectType(value, m_project.type));
    if (key == "tube_void_skip") return check(parseBool(value, m_project.tubeVoidSkip));
    if (key == "working_length") return check(parseNumber(value, m_project.workingLength));
    if (key == "tube_orientation") {
        std::string orientation = lower(value);
        if (orientation == "wide") {
            m_project.narrowFaceUp = false;
        } else if (orientation == "narrow") {
            m_project.narrowFaceUp = true;
        } else {
            return KeyResult::BAD_VALUE;
        }
        return KeyResult::OK;
    }
    return KeyResult::UNKNOWN_KEY;
}

JobFile::KeyResult JobFile::applyCommonKey(std::string& id, double& holdTime, LeadInSpec& leadIn,
                                           const std::string& key, const std::string& value) {
    if (key == "id") {
        id = value;
        return KeyResult::OK;
    }
    if (key == "hold_time") return check(parseNumber(value, holdTime));
    if (key == "lead_in_mode") return check(parseLeadInMode(value, leadIn.mode));
    if (key == "lead_in_type") return check(parseLeadInType(value, leadIn.type));
    if (key == "approach_angle") return check(parseNumber(value, leadIn.approachAngle));
    return KeyResult::UNKNOWN_KEY;
}

JobFile::KeyResult JobFile::applyDrillKey(const std::string& key, const std::string& value) {
    DrillOperation& op = m_drill;
    if (key == "id") {
        op.id = value;
        return KeyResult::OK;
    }
    if (key == "pattern") return check(parsePatternType(value, op.pattern));
    if (key == "x") return check(parseNumber(value, op.start.x));
    if (key == "y") return check(parseNumber(value, op.start.y));
    if (key == "axis") return check(parsePatternAxis(value, op.axis));
    if (key == "spacing") return check(parseNumber(value, op.spacing));
    if (key == "count") return check(parseCount(value, op.count));
    if (key == "x_spacing") return check(parseNumber(value, op.xSpacing));
    if (key == "y_spacing") return check(parseNumber(value, op.ySpacing));
    if (key == "x_count") return check(parseCount(value, op.xCount));
    if (key == "y_count") return check(parseCount(value, op.yCount));
    return KeyResult::UNKNOWN_KEY;
}

JobFile::KeyResult JobFile::applyCircleKey(const std::string& key, const std::string& value) {
    CircleOperation& op = m_circle;
    if (key == "pattern") return check(parsePatternType(value, op.pattern));
    if (key == "x") return check(parseNumber(value, op.center.x));
    if (key == "y") return check(parseNumber(value, op.center.y));
    if (key == "diameter") return check(parseNumber(value, op.diameter));
    if (key == "compensation") return check(parseCompensation(value, op.compensation));
    if (key == "axis") return check(parsePatternAxis(value, op.axis));
    if (key == "spacing") return check(parseNumber(value, op.spacing));
    if (key == "count") return check(parseCount(value, op.count));
    return applyCommonKey(op.id, op.holdTime, op.leadIn, key, value);
}

JobFile::KeyResult JobFile::applyHexagonKey(const std::string& key, const std::string& value) {
    HexagonOperation& op = m_hexagon;
    if (key == "pattern") return check(parsePatternType(value, op.pattern));
    if (key == "x") return check(parseNumber(value, op.center.x));
    if (key == "y") return check(parseNumber(value, op.center.y));
    if (key == "flat_to_flat") return check(parseNumber(value, op.flatToFlat));
    if (key == "compensation") return check(parseCompensation(value, op.compensation));
    if (key == "axis") return check(parsePatternAxis(value, op.axis));
    if (key == "spacing") return check(parseNumber(value, op.spacing));
    if (key == "count") return check(parseCount(value, op.count));
    return applyCommonKey(op.id, op.holdTime, op.leadIn, key, value);
}

JobFile::KeyResult JobFile::applyLineKey(const std::string& key, const std::string& value) {
    LineOperation& op = m_line;
    if (key == "point") {
        PathPoint point;
        if (!parsePoint(value, point)) {
            return KeyResult::BAD_VALUE;
        }
        op.points.push_back(point);
        return KeyResult::OK;
    }
    if (key == "compensation") return check(parseCompensation(value, op.compensation));
    return applyCommonKey(op.id, op.holdTime, op.leadIn, key, value);
}

bool JobFile::parsePoint(const std::string& value, PathPoint& point) {
    std::istringstream tokens(value);
    std::vector<std::string> parts;
    std::string token;
    while (tokens >> token) {
        parts.push_back(token);
    }
    if (parts.empty()) {
        return false;
    }

    std::string kind = lower(parts[0]);
    double x = 0.0;
    double y = 0.0;
    if (parts.size() < 3 || !parseNumber(parts[1], x) || !parseNumber(parts[2], y)) {
        return false;
    }

    if (kind == "start" || kind == "straight") {
        if (parts.size() != 3) {
            return false;
        }
        point = kind == "start" ? PathPoint::start(x, y) : PathPoint::straight(x, y);
        return true;
    }

    if (kind == "arc") {
        double cx = 0.0;
        double cy = 0.0;
        ArcHint hint = ArcHint::AUTO;
        if (parts.size() < 5 || parts.size() > 6 ||
            !parseNumber(parts[3], cx) || !parseNumber(parts[4], cy)) {
            return false;
        }
        if (parts.size() == 6 && !parseArcHint(parts[5], hint)) {
            return false;
        }
        point = PathPoint::arc(x, y, cx, cy, hint);
        return true;
    }

    return false;
}

bool JobFile::parseNumber(const std::string& text, double& value) {
    try {
        size_t used = 0;
        double parsed = std::stod(text, &used);
        if (used != text.size()) {
            return false;
        }
        value = parsed;
        return true;
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

bool JobFile::parseCount(const std::string& text, int& value) {
    try {
        size_t used = 0;
        int parsed = std::stoi(text, &used);
        if (used != text.size()) {
            return false;
        }
        value = parsed;
        return true;
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

bool JobFile::parseBool(const std::string& text, bool& value) {
    std::string flag = lower(text);
    if (flag == "true" || flag == "yes" || flag == "1") {
        value = true;
        return true;
    }
    if (flag == "false" || flag == "no" || flag == "0") {
        value = false;
        return true;
    }
    return false;
}

std::string JobFile::trim(const std::string& str) {
    auto start = std::find_if_not(str.begin(), str.end(), [](unsigned char c) {
        return std::isspace(c);
    });

    auto end = std::find_if_not(str.rbegin(), str.rend(), [](unsigned char c) {
        return std::isspace(c);
    }).base();

    return (start < end) ? std::string(start, end) : std::string();
}

void JobFile::addError(int lineNumber, const std::string& message) {
    m_errors.push_back("Line " + std::to_string(lineNumber) + ": " + message);
}

} // namespace toolpath
} // namespace nwss
