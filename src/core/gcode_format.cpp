#include "core/gcode_format.h"

#include <cctype>
#include <cmath>
#include <iomanip>
#include <sstream>

#include "core/errors.h"

namespace nwss {
namespace toolpath {

namespace {

const size_t MAX_PROJECT_NAME_LENGTH = 50;

} // namespace

// ================================
// GCodeCommand
// ================================

GCodeCommand::GCodeCommand(const std::string &code) : m_code(code) {}

GCodeCommand &GCodeCommand::word(char letter, const std::string &value) {
  m_words.push_back(std::make_pair(letter, value));
  return *this;
}

GCodeCommand &GCodeCommand::x(double value) {
  return word('X', GCodeFormat::coordinate(value));
}

GCodeCommand &GCodeCommand::y(double value) {
  return word('Y', GCodeFormat::coordinate(value));
}

GCodeCommand &GCodeCommand::z(double value) {
  return word('Z', GCodeFormat::coordinate(value));
}

GCodeCommand &GCodeCommand::i(double value) {
  return word('I', GCodeFormat::coordinate(value));
}

GCodeCommand &GCodeCommand::j(double value) {
  return word('J', GCodeFormat::coordinate(value));
}

GCodeCommand &GCodeCommand::f(double feed) {
  return word('F', GCodeFormat::feed(feed));
}

GCodeCommand &GCodeCommand::p(long value) {
  return word('P', std::to_string(value));
}

GCodeCommand &GCodeCommand::s(long value) {
  return word('S', std::to_string(value));
}

std::string GCodeCommand::str() const {
  std::string line = m_code;
  for (const auto &w : m_words) {
    line += ' ';
    line += w.first;
    line += w.second;
  }
  return line;
}

// ================================
// GCodeFormat
// ================================

const char *const GCodeFormat::CALL_PREFIX = "M98 (-";

std::string GCodeFormat::coordinate(double value, int precision) {
  // Values that round to zero print without a sign
  if (std::fabs(value) < 0.5 * std::pow(10.0, -precision)) {
    value = 0.0;
  }
  std::ostringstream ss;
  ss << std::fixed << std::setprecision(precision) << value;
  return ss.str();
}

std::string GCodeFormat::feed(double value) { return coordinate(value, 1); }

std::vector<std::string> GCodeFormat::header(int spindleSpeed,
                                             int warmupSeconds,
                                             double safetyHeight) {
  std::vector<std::string> lines;
  lines.push_back("G20 G90");
  lines.push_back("G00 X0 Y0 Z0");
  lines.push_back(GCodeCommand("G00").z(safetyHeight));
  lines.push_back(GCodeCommand("M03").s(spindleSpeed));
  lines.push_back(GCodeCommand("G04").p(warmupSeconds));
  return lines;
}

std::vector<std::string> GCodeFormat::footer(double safetyHeight) {
  std::vector<std::string> lines;
  lines.push_back("M05");
  lines.push_back(GCodeCommand("G00").z(safetyHeight));
  lines.push_back("G00 X0 Y0");
  lines.push_back("M30");
  return lines;
}

std::string GCodeFormat::rapid(double z) { return GCodeCommand("G00").z(z); }

std::string GCodeFormat::rapid(double x, double y) {
  return GCodeCommand("G00").x(x).y(y);
}

std::string GCodeFormat::rapid(double x, double y, double z) {
  return GCodeCommand("G00").x(x).y(y).z(z);
}

std::string GCodeFormat::subroutineCall(const std::string &path,
                                        int loopCount) {
  return std::string(CALL_PREFIX) + path + ") L" + std::to_string(loopCount);
}

std::vector<std::string> GCodeFormat::subroutineEnd() {
  return std::vector<std::string>{"M99", "%"};
}

std::string GCodeFormat::subroutinePath(const std::string &basePath,
                                        const std::string &projectName,
                                        int number) {
  std::string path =
      basePath + "\\" + projectName + "\\" + std::to_string(number) + ".nc";
  for (auto &c : path) {
    if (c == '/') {
      c = '\\';
    }
  }
  return path;
}

std::string GCodeFormat::sanitizeProjectName(const std::string &name) {
  std::string sanitized;
  for (char c : name) {
    if (c == ' ') {
      sanitized += '_';
    } else if (std::isalnum(static_cast<unsigned char>(c)) || c == '_' ||
               c == '-') {
      sanitized += c;
    }
  }
  if (sanitized.size() > MAX_PROJECT_NAME_LENGTH) {
    sanitized.resize(MAX_PROJECT_NAME_LENGTH);
  }
  return sanitized;
}

bool GCodeFormat::isCommentFree(const std::string &line) {
  std::string checked = line;
  if (line.compare(0, std::string(CALL_PREFIX).size(), CALL_PREFIX) == 0) {
    // The call path is the only parenthesized text allowed
    size_t close = line.find(')');
    if (close == std::string::npos) {
      return false;
    }
    checked = line.substr(close + 1);
  }
  return checked.find('(') == std::string::npos &&
         checked.find(')') == std::string::npos &&
         checked.find(';') == std::string::npos;
}

std::string GCodeFormat::join(const std::vector<std::string> &lines) {
  std::string text;
  for (size_t i = 0; i < lines.size(); ++i) {
    if (!isCommentFree(lines[i])) {
      throw ToolpathError("Refusing to emit comment token in line: " +
                          lines[i]);
    }
    if (i > 0) {
      text += '\n';
    }
    text += lines[i];
  }
  return text;
}

} // namespace toolpath
} // namespace nwss
