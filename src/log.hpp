#ifndef DOCSCAN_LOG_HPP
#define DOCSCAN_LOG_HPP

enum LogLevel {
    LOG_LEVEL_DEBUG = 0,
    LOG_LEVEL_INFO = 1,
    LOG_LEVEL_WARN = 2,
    LOG_LEVEL_ERROR = 3,
    LOG_LEVEL_OFF = 4
};

// printf-style message routed to logcat on Android and to spdlog elsewhere
void logMessage(LogLevel level, const char* tag, const char* fmt, ...)
#if defined(__GNUC__) || defined(__clang__)
    __attribute__((format(printf, 3, 4)))
#endif
    ;

void setLogLevel(LogLevel level);
LogLevel getLogLevel();

#define DOCSCAN_LOGD(tag, ...) logMessage(LOG_LEVEL_DEBUG, tag, __VA_ARGS__)
#define DOCSCAN_LOGI(tag, ...) logMessage(LOG_LEVEL_INFO, tag, __VA_ARGS__)
#define DOCSCAN_LOGW(tag, ...) logMessage(LOG_LEVEL_WARN, tag, __VA_ARGS__)
#define DOCSCAN_LOGE(tag, ...) logMessage(LOG_LEVEL_ERROR, tag, __VA_ARGS__)

#endif // DOCSCAN_LOG_HPP
