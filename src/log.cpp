#include "log.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <memory>

#ifdef __ANDROID__
#include <android/log.h>
#else
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#endif

namespace {

std::atomic<int> g_log_level(LOG_LEVEL_INFO);

#ifdef __ANDROID__
int toAndroidPriority(LogLevel level) {
    switch (level) {
        case LOG_LEVEL_DEBUG: return ANDROID_LOG_DEBUG;
        case LOG_LEVEL_INFO: return ANDROID_LOG_INFO;
        case LOG_LEVEL_WARN: return ANDROID_LOG_WARN;
        case LOG_LEVEL_ERROR: return ANDROID_LOG_ERROR;
        default: return ANDROID_LOG_SILENT;
    }
}
#else
const char* kLoggerName = "docscan";

spdlog::level::level_enum toSpdlogLevel(LogLevel level) {
    switch (level) {
        case LOG_LEVEL_DEBUG: return spdlog::level::debug;
        case LOG_LEVEL_INFO: return spdlog::level::info;
        case LOG_LEVEL_WARN: return spdlog::level::warn;
        case LOG_LEVEL_ERROR: return spdlog::level::err;
        default: return spdlog::level::off;
    }
}

// Own logger on stderr: filtering is done by g_log_level, and the host's
// default logger and global level are left alone
std::shared_ptr<spdlog::logger> docscanLogger() {
    static std::shared_ptr<spdlog::logger> logger = [] {
        std::shared_ptr<spdlog::logger> existing = spdlog::get(kLoggerName);
        if (existing) {
            return existing;
        }
        std::shared_ptr<spdlog::logger> created = spdlog::stderr_color_mt(kLoggerName);
        created->set_level(spdlog::level::trace);
        return created;
    }();
    return logger;
}
#endif

}  // namespace

void setLogLevel(LogLevel level) {
    g_log_level.store(level);
}

LogLevel getLogLevel() {
    return static_cast<LogLevel>(g_log_level.load());
}

void logMessage(LogLevel level, const char* tag, const char* fmt, ...) {
    if (level < g_log_level.load() || level >= LOG_LEVEL_OFF) {
        return;
    }

    char buf[512];
    va_list args;
    va_start(args, fmt);
    vsnprintf(buf, sizeof(buf), fmt, args);
    va_end(args);

#ifdef __ANDROID__
    __android_log_write(toAndroidPriority(level), tag, buf);
#else
    docscanLogger()->log(toSpdlogLevel(level), "[{}] {}", tag, buf);
#endif
}
