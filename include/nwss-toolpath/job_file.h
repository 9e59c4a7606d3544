#ifndef NWSS_TOOLPATH_JOB_FILE_H
#define NWSS_TOOLPATH_JOB_FILE_H

#include "core/operations.h"
#include <istream>
#include <string>
#include <vector>

namespace nwss {
namespace toolpath {

/**
 * Reads a project's operations from an INI-style job file.
 *
 * Each [drill], [circle], [hexagon] or [line] section is one operation. An
 * optional [project] section must come first. Line paths list their points
 * with repeated "point=" keys.
 */
class JobFile {
public:
    JobFile();

    /**
     * Load a job file
     * @param filename Path to the job file
     * @return True if the file was read and every line parsed
     */
    bool loadFromFile(const std::string& filename);

    /**
     * Load job text from a stream
     * @param input Stream holding the job text
     * @return True if every line parsed; otherwise getErrors() lists the problems
     */
    bool loadFromStream(std::istream& input);

    /**
     * Project built from the last load. The material is left at its default;
     * it comes from the configuration.
     */
    const Project& getProject() const { return m_project; }

    const std::vector<std::string>& getErrors() const { return m_errors; }

private:
    enum class Section {
        NONE,
        PROJECT,
        DRILL,
        CIRCLE,
        HEXAGON,
        LINE
    };

    enum class KeyResult {
        OK,
        UNKNOWN_KEY,
        BAD_VALUE
    };

    Project m_project;
    std::vector<std::string> m_errors;

    // Operation being filled in by the current section
    Section m_section;
    DrillOperation m_drill;
    CircleOperation m_circle;
    HexagonOperation m_hexagon;
    LineOperation m_line;

    void reset();
    void beginSection(const std::string& name, int lineNumber);
    void finishSection();
    void applyKey(const std::string& key, const std::string& value, int lineNumber);

    KeyResult applyProjectKey(const std::string& key, const std::string& value);
    KeyResult applyDrillKey(const std::string& key, const std::string& value);
    KeyResult applyCircleKey(const std::string& key, const std::string& value);
    KeyResult applyHexagonKey(const std::string& key, const std::string& value);
    KeyResult applyLineKey(const std::string& key, const std::string& value);

    // Keys shared by every operation kind: id, hold_time and the lead-in keys
    static KeyResult applyCommonKey(std::string& id, double& holdTime, LeadInSpec& leadIn,
                                    const std::string& key, const std::string& value);
    static KeyResult check(bool ok);
    static bool parsePoint(const std::string& value, PathPoint& point);
    static bool parseNumber(const std::string& text, double& value);
    static bool parseCount(const std::string& text, int& value);
    static bool parseBool(const std::string& text, bool& value);
    static std::string trim(const std::string& str);

    void addError(int lineNumber, const std::string& message);
};

} // namespace toolpath
} // namespace nwss

#endif // NWSS_TOOLPATH_JOB_FILE_H
