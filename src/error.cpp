#include "error.hpp"
#include <atomic>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <mutex>
#include <vector>

namespace {

LogLevel initialLevel() {
    const char* env = std::getenv("SPOTCALL_LOG_LEVEL");
    if (env == nullptr) return LogLevel::Notice;
    if (strcmp(env, "debug") == 0) return LogLevel::Debug;
    if (strcmp(env, "notice") == 0) return LogLevel::Notice;
    if (strcmp(env, "warning") == 0) return LogLevel::Warning;
    if (strcmp(env, "error") == 0) return LogLevel::Error;
    if (strcmp(env, "silent") == 0) return LogLevel::Silent;
    return LogLevel::Notice;
}

std::atomic<int> g_level{static_cast<int>(initialLevel())};
std::mutex g_logMtx;

void emit(LogLevel level, const char* tag, const char* format, va_list args) {
    if (static_cast<int>(level) < g_level.load()) return;
    std::string msg = vformatString(format, args);
    char stamp[32];
    time_t now = time(nullptr);
    struct tm tmv;
    localtime_r(&now, &tmv);
    strftime(stamp, sizeof(stamp), "%Y/%m/%d %H:%M:%S", &tmv);
    std::lock_guard<std::mutex> lock(g_logMtx);
    fprintf(stderr, "%s [%s] %s\n", stamp, tag, msg.c_str());
    fflush(stderr);
}

} // namespace

void setLogLevel(LogLevel level) {
    g_level.store(static_cast<int>(level));
}

LogLevel getLogLevel() {
    return static_cast<LogLevel>(g_level.load());
}

std::string vformatString(const char* format, va_list args) {
    va_list copy;
    va_copy(copy, args);
    int n = vsnprintf(nullptr, 0, format, copy);
    va_end(copy);
    if (n < 0) return std::string(format);
    std::vector<char> buf(static_cast<size_t>(n) + 1);
    vsnprintf(buf.data(), buf.size(), format, args);
    return std::string(buf.data(), static_cast<size_t>(n));
}

std::string formatString(const char* format, ...) {
    va_list args;
    va_start(args, format);
    std::string s = vformatString(format, args);
    va_end(args);
    return s;
}

void notice(const char* format, ...) {
    va_list args;
    va_start(args, format);
    emit(LogLevel::Notice, "NOTICE", format, args);
    va_end(args);
}

void warning(const char* format, ...) {
    va_list args;
    va_start(args, format);
    emit(LogLevel::Warning, "WARNING", format, args);
    va_end(args);
}

void debug(const char* format, ...) {
    va_list args;
    va_start(args, format);
    emit(LogLevel::Debug, "DEBUG", format, args);
    va_end(args);
}

void error(const char* format, ...) {
    va_list args;
    va_start(args, format);
    std::string msg = vformatString(format, args);
    va_end(args);
    if (static_cast<int>(LogLevel::Error) >= g_level.load()) {
        std::lock_guard<std::mutex> lock(g_logMtx);
        fprintf(stderr, "[ERROR] %s\n", msg.c_str());
        fflush(stderr);
    }
    throw std::runtime_error(msg);
}
