#pragma once

#include <cstdarg>
#include <stdexcept>
#include <string>
#include <utility>

enum class LogLevel : int { Debug = 0, Notice = 1, Warning = 2, Error = 3, Silent = 4 };

void setLogLevel(LogLevel level);
LogLevel getLogLevel();

// printf-style logging to stderr
void notice(const char* format, ...);
void warning(const char* format, ...);
void debug(const char* format, ...);
// Logs the message and throws std::runtime_error
[[noreturn]] void error(const char* format, ...);

std::string vformatString(const char* format, va_list args);
std::string formatString(const char* format, ...);

// Validation failures. Each message names the offending axis, dtype or size.
class TypeMismatchError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

class ShapeError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

class ConfigError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

class MissingCoordinateError : public std::out_of_range {
public:
    using std::out_of_range::out_of_range;
};

template<typename E, typename... Args>
[[noreturn]] void fail(const char* format, Args&&... args) {
    throw E(formatString(format, std::forward<Args>(args)...));
}
