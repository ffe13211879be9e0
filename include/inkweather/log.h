#ifndef INKWEATHER_LOG_H
#define INKWEATHER_LOG_H

#include <string>

namespace inkweather
{

enum class LogLevel
{
    Debug = 0,
    Info,
    Warning,
    Error,
    None
};

// Receives one fully formatted line, "[Tag] message", without a newline.
using LogSink = void (*)(LogLevel level, const char *line);

void setLogSink(LogSink sink);
void setLogLevel(LogLevel level);
LogLevel logLevel();

// Accepts DEBUG, INFO, WARNING/WARN, ERROR, NONE (case-insensitive).
bool parseLogLevel(const std::string &text, LogLevel &level);

void logf(LogLevel level, const char *tag, const char *format, ...)
    __attribute__((format(printf, 3, 4)));

} // namespace inkweather

#define INKWEATHER_LOGD(tag, ...) ::inkweather::logf(::inkweather::LogLevel::Debug, tag, __VA_ARGS__)
#define INKWEATHER_LOGI(tag, ...) ::inkweather::logf(::inkweather::LogLevel::Info, tag, __VA_ARGS__)
#define INKWEATHER_LOGW(tag, ...) ::inkweather::logf(::inkweather::LogLevel::Warning, tag, __VA_ARGS__)
#define INKWEATHER_LOGE(tag, ...) ::inkweather::logf(::inkweather::LogLevel::Error, tag, __VA_ARGS__)

#endif // INKWEATHER_LOG_H
