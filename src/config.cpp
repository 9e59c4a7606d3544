#include "nwss-toolpath/config.h"
#include <fstream>
#include <iostream>
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace nwss {
namespace toolpath {

ToolpathConfig::ToolpathConfig() {
    setDefaults();
}

ToolpathConfig::~ToolpathConfig() = default;

void ToolpathConfig::setDefaults() {
    // Machine and general defaults live in GenerationSettings
    m_machineName = "CNC Router";
    m_controller = "Mach3";
    m_settings = GenerationSettings();

    m_material = MaterialSpec();

    m_toolType = ToolType::END_MILL;
    m_tool = ToolParams();
}

bool ToolpathConfig::isFirstRun(const std::string& filename) {
    std::ifstream file(filename);
    return !file.good();
}

bool ToolpathConfig::loadFromFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Error: Could not open config file: " << filename << std::endl;
        return false;
    }

    std::string line;
    std::string section;
    int lineNumber = 0;

    // First set defaults, then override with values from file
    setDefaults();

    while (std::getline(file, line)) {
        ++lineNumber;
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        // Check for section header
        if (line[0] == '[' && line[line.length() - 1] == ']') {
            section = trim(line.substr(1, line.length() - 2));
            continue;
        }

        // Parse key=value
        std::string key, value;
        if (!parseLine(line, key, value)) {
            continue;
        }

        bool ok = false;
        try {
            ok = applyValue(section, key, value);
        } catch (const std::exception&) {
            ok = false;
        }
        if (!ok) {
            std::cerr << "Error: Invalid value '" << value << "' for " << section << "." << key
                      << " at line " << lineNumber << " of " << filename << std::endl;
            return false;
        }
    }

    file.close();
    return true;
}

bool ToolpathConfig::applyValue(const std::string& section, const std::string& key,
                                const std::string& value) {
    if (section == "machine") {
        if (key == "name") m_machineName = value;
        else if (key == "controller") m_controller = value;
        else if (key == "max_x") m_settings.maxX = std::stod(value);
        else if (key == "max_y") m_settings.maxY = std::stod(value);
        else if (key == "supports_subroutines") return parseBool(value, m_settings.supportsSubroutines);
        else if (key == "gcode_base_path") m_settings.basePath = value;
    }
    else if (section == "general") {
        if (key == "safety_height") m_settings.safetyHeight = std::stod(value);
        else if (key == "travel_height") m_settings.travelHeight = std::stod(value);
        else if (key == "spindle_warmup_seconds") m_settings.spindleWarmupSeconds = std::stoi(value);
        else if (key == "circle_lead_in") return parseLeadInType(value, m_settings.circleLeadIn);
        else if (key == "hexagon_lead_in") return parseLeadInType(value, m_settings.hexagonLeadIn);
        else if (key == "line_lead_in") return parseLeadInType(value, m_settings.lineLeadIn);
        else if (key == "ramp_angle") m_settings.rampAngle = std::stod(value);
        else if (key == "helix_pitch") m_settings.helixPitch = std::stod(value);
        else if (key == "first_pass_feed_factor") m_settings.firstPassFeedFactor = std::stod(value);
        else if (key == "max_stepdown_factor") m_settings.maxStepdownFactor = std::stod(value);
        else if (key == "corner_slowdown") return parseBool(value, m_settings.cornerSlowdownEnabled);
        else if (key == "corner_feed_factor") m_settings.cornerFeedFactor = std::stod(value);
        else if (key == "arc_slowdown") return parseBool(value, m_settings.arcSlowdownEnabled);
        else if (key == "arc_feed_factor") m_settings.arcFeedFactor = std::stod(value);
        else if (key == "allow_negative_coordinates") return parseBool(value, m_settings.allowNegativeCoordinates);
        else if (key == "cut_through_buffer") m_settings.cutThroughBuffer = std::stod(value);
    }
    else if (section == "material") {
        if (key == "name") m_material.name = value;
        else if (key == "form") return parseMaterialForm(value, m_material.form);
        else if (key == "thickness") m_material.thickness = std::stod(value);
        else if (key == "outer_width") m_material.outerWidth = std::stod(value);
        else if (key == "outer_height") m_material.outerHeight = std::stod(value);
        else if (key == "wall_thickness") m_material.wallThickness = std::stod(value);
    }
    else if (section == "tool") {
        if (key == "type") return setToolTypeFromString(value);
        else if (key == "diameter") m_tool.toolDiameter = std::stod(value);
        else if (key == "tip_compensation") m_tool.tipCompensation = std::stod(value);
        else if (key == "spindle_speed") m_tool.spindleSpeed = std::stoi(value);
        else if (key == "feed_rate") m_tool.feedRate = std::stod(value);
        else if (key == "plunge_rate") m_tool.plungeRate = std::stod(value);
        else if (key == "pecking_depth") m_tool.peckingDepth = std::stod(value);
        else if (key == "pass_depth") m_tool.passDepth = std::stod(value);
    }
    return true;
}

bool ToolpathConfig::saveToFile(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Error: Could not open config file for writing: " << filename << std::endl;
        return false;
    }

    const char* on = "true";
    const char* off = "false";

    // Write file header
    file << "# NWSS Toolpath Configuration File" << std::endl;
    file << "# Automatically generated" << std::endl << std::endl;

    // Machine section
    file << "[machine]" << std::endl;
    file << "name=" << m_machineName << std::endl;
    file << "controller=" << m_controller << std::endl;
    file << "max_x=" << m_settings.maxX << std::endl;
    file << "max_y=" << m_settings.maxY << std::endl;
    file << "supports_subroutines=" << (m_settings.supportsSubroutines ? on : off) << std::endl;
    file << "gcode_base_path=" << m_settings.basePath << std::endl << std::endl;

    // General section
    file << "[general]" << std::endl;
    file << "safety_height=" << m_settings.safetyHeight << std::endl;
    file << "travel_height=" << m_settings.travelHeight << std::endl;
    file << "spindle_warmup_seconds=" << m_settings.spindleWarmupSeconds << std::endl;
    file << "circle_lead_in=" << toString(m_settings.circleLeadIn) << std::endl;
    file << "hexagon_lead_in=" << toString(m_settings.hexagonLeadIn) << std::endl;
    file << "line_lead_in=" << toString(m_settings.lineLeadIn) << std::endl;
    file << "ramp_angle=" << m_settings.rampAngle << std::endl;
    file << "helix_pitch=" << m_settings.helixPitch << std::endl;
    file << "first_pass_feed_factor=" << m_settings.firstPassFeedFactor << std::endl;
    file << "max_stepdown_factor=" << m_settings.maxStepdownFactor << std::endl;
    file << "corner_slowdown=" << (m_settings.cornerSlowdownEnabled ? on : off) << std::endl;
    file << "corner_feed_factor=" << m_settings.cornerFeedFactor << std::endl;
    file << "arc_slowdown=" << (m_settings.arcSlowdownEnabled ? on : off) << std::endl;
    file << "arc_feed_factor=" << m_settings.arcFeedFactor << std::endl;
    file << "allow_negative_coordinates=" << (m_settings.allowNegativeCoordinates ? on : off) << std::endl;
    file << "cut_through_buffer=" << m_settings.cutThroughBuffer << std::endl << std::endl;

    // Material section
    file << "[material]" << std::endl;
    file << "name=" << m_material.name << std::endl;
    file << "form=" << toString(m_material.form) << std::endl;
    file << "thickness=" << m_material.thickness << std::endl;
    file << "outer_width=" << m_material.outerWidth << std::endl;
    file << "outer_height=" << m_material.outerHeight << std::endl;
    file << "wall_thickness=" << m_material.wallThickness << std::endl << std::endl;

    // Tool section
    file << "[tool]" << std::endl;
    file << "type=" << getToolTypeString() << std::endl;
    file << "diameter=" << m_tool.toolDiameter << std::endl;
    file << "tip_compensation=" << m_tool.tipCompensation << std::endl;
    file << "spindle_speed=" << m_tool.spindleSpeed << std::endl;
    file << "feed_rate=" << m_tool.feedRate << std::endl;
    file << "plunge_rate=" << m_tool.plungeRate << std::endl;
    file << "pecking_depth=" << m_tool.peckingDepth << std::endl;
    file << "pass_depth=" << m_tool.passDepth << std::endl;

    file.close();
    return true;
}

bool ToolpathConfig::parseLine(const std::string& line, std::string& key, std::string& value) const {
    size_t pos = line.find('=');
    if (pos == std::string::npos) {
        return false;
    }

    key = trim(line.substr(0, pos));
    value = trim(line.substr(pos + 1));

    return !key.empty();
}

std::string ToolpathConfig::trim(const std::string& str) {
    auto start = std::find_if_not(str.begin(), str.end(), [](unsigned char c) {
        return std::isspace(c);
    });

    auto end = std::find_if_not(str.rbegin(), str.rend(), [](unsigned char c) {
        return std::isspace(c);
    }).base();

    return (start < end) ? std::string(start, end) : std::string();
}

bool ToolpathConfig::parseBool(const std::string& text, bool& value) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (lower == "true" || lower == "yes" || lower == "1" || lower == "on") {
        value = true;
        return true;
    }
    if (lower == "false" || lower == "no" || lower == "0" || lower == "off") {
        value = false;
        return true;
    }
    return false;
}

std::string ToolpathConfig::getToolTypeString() const {
    return (m_toolType == ToolType::DRILL) ? "drill" : "end_mill";
}

bool ToolpathConfig::setToolTypeFromString(const std::string& type) {
    if (type == "drill") {
        m_toolType = ToolType::DRILL;
    } else if (type == "end_mill" || type == "endmill") {
        m_toolType = ToolType::END_MILL;
    } else {
        return false;
    }
    return true;
}

} // namespace toolpath
} // namespace nwss
