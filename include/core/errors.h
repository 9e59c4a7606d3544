#ifndef NWSS_TOOLPATH_ERRORS_H
#define NWSS_TOOLPATH_ERRORS_H

#include <stdexcept>
#include <string>

namespace nwss {
namespace toolpath {

/**
 * Base class for all errors raised by the toolpath engine
 */
class ToolpathError : public std::runtime_error {
public:
    explicit ToolpathError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * Raised when compensation or a degenerate segment makes a feature impossible to cut
 * (compensated radius or apothem <= 0, zero-length segment)
 */
class InvalidGeometryError : public ToolpathError {
public:
    explicit InvalidGeometryError(const std::string& message) : ToolpathError(message) {}
};

/**
 * Raised for caller-correctable input problems (unknown kinds, bad counts)
 */
class ValidationError : public ToolpathError {
public:
    explicit ValidationError(const std::string& message) : ToolpathError(message) {}
};

} // namespace toolpath
} // namespace nwss

#endif // NWSS_TOOLPATH_ERRORS_H
