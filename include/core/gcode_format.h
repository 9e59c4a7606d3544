#ifndef NWSS_TOOLPATH_GCODE_FORMAT_H
#define NWSS_TOOLPATH_GCODE_FORMAT_H

#include <string>
#include <utility>
#include <vector>

namespace nwss {
namespace toolpath {

/**
 * Builds one G-code line from a command word and address words.
 *
 * Every value goes through a numeric formatter, so a command built here can
 * never contain comment tokens.
 */
class GCodeCommand {
public:
  explicit GCodeCommand(const std::string &code);

  GCodeCommand &x(double value);
  GCodeCommand &y(double value);
  GCodeCommand &z(double value);
  GCodeCommand &i(double value);
  GCodeCommand &j(double value);
  GCodeCommand &f(double feed);
  GCodeCommand &p(long value);
  GCodeCommand &s(long value);

  std::string str() const;
  operator std::string() const { return str(); }

private:
  GCodeCommand &word(char letter, const std::string &value);

  std::string m_code;
  std::vector<std::pair<char, std::string>> m_words;
};

/**
 * Formatting helpers for the single output dialect (inches, Mach3-style M98 calls)
 */
class GCodeFormat {
public:
  static const char *const CALL_PREFIX; // "M98 (-"

  /**
   * Fixed-point formatting
   * @param precision Decimal places (4 for coordinates, 1 for feeds)
   */
  static std::string coordinate(double value, int precision = 4);
  static std::string feed(double value);

  /**
   * Program header: units, absolute mode, home, safety height, spindle on, warm-up dwell
   */
  static std::vector<std::string> header(int spindleSpeed, int warmupSeconds,
                                         double safetyHeight);

  /**
   * Program footer: spindle off, retract, return home, end
   */
  static std::vector<std::string> footer(double safetyHeight);

  /**
   * G00 with only the given axes
   */
  static std::string rapid(double z);
  static std::string rapid(double x, double y);
  static std::string rapid(double x, double y, double z);

  /**
   * "M98 (-{path}) L{loops}"
   */
  static std::string subroutineCall(const std::string &path, int loopCount);

  /**
   * The two closing lines of every subroutine file: "M99", "%"
   */
  static std::vector<std::string> subroutineEnd();

  /**
   * Absolute controller-side path of a subroutine file, always with backslashes
   */
  static std::string subroutinePath(const std::string &basePath,
                                    const std::string &projectName,
                                    int number);

  /**
   * Spaces become underscores, anything outside [A-Za-z0-9_-] is dropped,
   * the result is cut to 50 characters
   */
  static std::string sanitizeProjectName(const std::string &name);

  /**
   * True when a line carries no '(' or ';' outside an M98 call's path
   */
  static bool isCommentFree(const std::string &line);

  /**
   * Join lines with '\n'
   * @throws ToolpathError if any line would carry a comment token
   */
  static std::string join(const std::vector<std::string> &lines);
};

} // namespace toolpath
} // namespace nwss

#endif // NWSS_TOOLPATH_GCODE_FORMAT_H
