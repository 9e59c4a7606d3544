#ifndef NWSS_TOOLPATH_CONFIG_H
#define NWSS_TOOLPATH_CONFIG_H

#include "core/gcode_generator.h"
#include "core/operations.h"
#include <string>

namespace nwss {
namespace toolpath {

/**
 * Enum for the class of cutting tool loaded in the spindle
 */
enum class ToolType {
    DRILL,
    END_MILL
};

/**
 * Machine, general, material and tool settings kept in an INI-style file
 */
class ToolpathConfig {
public:
    ToolpathConfig();
    ~ToolpathConfig();

    /**
     * Initialize with default values
     */
    void setDefaults();

    /**
     * Load configuration from file. Keys missing from the file keep their defaults.
     * @param filename Path to the config file
     * @return True if loaded successfully; false when the file cannot be read
     *         or a value is malformed
     */
    bool loadFromFile(const std::string& filename);

    /**
     * Save configuration to file
     * @param filename Path where to save the config
     * @return True if saved successfully
     */
    bool saveToFile(const std::string& filename) const;

    /**
     * Check if this is the first run (no config file exists)
     * @param filename Path to the config file
     * @return True if the config file doesn't exist
     */
    static bool isFirstRun(const std::string& filename);

    // Machine
    const std::string& getMachineName() const { return m_machineName; }
    void setMachineName(const std::string& name) { m_machineName = name; }

    const std::string& getController() const { return m_controller; }
    void setController(const std::string& controller) { m_controller = controller; }

    double getMaxX() const { return m_settings.maxX; }
    void setMaxX(double maxX) { m_settings.maxX = maxX; }

    double getMaxY() const { return m_settings.maxY; }
    void setMaxY(double maxY) { m_settings.maxY = maxY; }

    bool getSupportsSubroutines() const { return m_settings.supportsSubroutines; }
    void setSupportsSubroutines(bool enabled) { m_settings.supportsSubroutines = enabled; }

    const std::string& getGCodeBasePath() const { return m_settings.basePath; }
    void setGCodeBasePath(const std::string& path) { m_settings.basePath = path; }

    // General
    double getSafetyHeight() const { return m_settings.safetyHeight; }
    void setSafetyHeight(double height) { m_settings.safetyHeight = height; }

    double getTravelHeight() const { return m_settings.travelHeight; }
    void setTravelHeight(double height) { m_settings.travelHeight = height; }

    LeadInType getCircleLeadIn() const { return m_settings.circleLeadIn; }
    void setCircleLeadIn(LeadInType type) { m_settings.circleLeadIn = type; }

    LeadInType getHexagonLeadIn() const { return m_settings.hexagonLeadIn; }
    void setHexagonLeadIn(LeadInType type) { m_settings.hexagonLeadIn = type; }

    LeadInType getLineLeadIn() const { return m_settings.lineLeadIn; }
    void setLineLeadIn(LeadInType type) { m_settings.lineLeadIn = type; }

    double getRampAngle() const { return m_settings.rampAngle; }
    void setRampAngle(double angle) { m_settings.rampAngle = angle; }

    double getCutThroughBuffer() const { return m_settings.cutThroughBuffer; }
    void setCutThroughBuffer(double buffer) { m_settings.cutThroughBuffer = buffer; }

    // Material
    const MaterialSpec& getMaterial() const { return m_material; }
    void setMaterial(const MaterialSpec& material) { m_material = material; }

    // Tool
    ToolType getToolType() const { return m_toolType; }
    void setToolType(ToolType type) { m_toolType = type; }
    std::string getToolTypeString() const;
    bool setToolTypeFromString(const std::string& type);

    double getToolDiameter() const { return m_tool.toolDiameter; }
    void setToolDiameter(double diameter) { m_tool.toolDiameter = diameter; }

    int getSpindleSpeed() const { return m_tool.spindleSpeed; }
    void setSpindleSpeed(int speed) { m_tool.spindleSpeed = speed; }

    double getFeedRate() const { return m_tool.feedRate; }
    void setFeedRate(double rate) { m_tool.feedRate = rate; }

    double getPlungeRate() const { return m_tool.plungeRate; }
    void setPlungeRate(double rate) { m_tool.plungeRate = rate; }

    double getPassDepth() const { return m_tool.passDepth; }
    void setPassDepth(double depth) { m_tool.passDepth = depth; }

    /**
     * Settings for the generator; verbose is always off here
     */
    GenerationSettings toGenerationSettings() const { return m_settings; }

    ToolParams toToolParams() const { return m_tool; }

    MaterialSpec toMaterialSpec() const { return m_material; }

private:
    std::string m_machineName;
    std::string m_controller;
    GenerationSettings m_settings;    // [machine] and [general]
    MaterialSpec m_material;          // [material]
    ToolType m_toolType;              // [tool]
    ToolParams m_tool;

    // Helper methods for parsing
    bool parseLine(const std::string& line, std::string& key, std::string& value) const;
    bool applyValue(const std::string& section, const std::string& key, const std::string& value);
    static std::string trim(const std::string& str);
    static bool parseBool(const std::string& text, bool& value);
};

} // namespace toolpath
} // namespace nwss

#endif // NWSS_TOOLPATH_CONFIG_H
