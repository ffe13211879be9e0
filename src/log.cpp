#include "inkweather/log.h"

#include <cctype>
#include <cstdarg>
#include <cstdio>

namespace inkweather
{
namespace
{
void writeToStderr(LogLevel, const char *line)
{
    std::fputs(line, stderr);
    std::fputc('\n', stderr);
}

LogSink activeSink = writeToStderr;
LogLevel activeLevel = LogLevel::Info;
} // namespace

void setLogSink(LogSink sink)
{
    activeSink = sink != nullptr ? sink : writeToStderr;
}

void setLogLevel(LogLevel level)
{
    activeLevel = level;
}

LogLevel logLevel()
{
    return activeLevel;
}

bool parseLogLevel(const std::string &text, LogLevel &level)
{
    std::string upper;
    upper.reserve(text.size());
    for (const char c : text)
    {
        upper.push_back(static_cast<char>(toupper(static_cast<unsigned char>(c))));
    }

    if (upper == "DEBUG")
    {
        level = LogLevel::Debug;
    }
    else if (upper == "INFO")
    {
        level = LogLevel::Info;
    }
    else if (upper == "WARNING" || upper == "WARN")
    {
        level = LogLevel::Warning;
    }
    else if (upper == "ERROR")
    {
        level = LogLevel::Error;
    }
    else if (upper == "NONE")
    {
        level = LogLevel::None;
    }
    else
    {
        return false;
    }
    return true;
}

void logf(LogLevel level, const char *tag, const char *format, ...)
{
    if (level < activeLevel || level == LogLevel::None)
    {
        return;
    }

    char line[384];
    int offset = std::snprintf(line, sizeof(line), "[%s] ", tag != nullptr ? tag : "Log");
    if (offset < 0)
    {
        return;
    }
    if (static_cast<size_t>(offset) >= sizeof(line))
    {
        offset = sizeof(line) - 1;
    }

    va_list args;
    va_start(args, format);
    std::vsnprintf(line + offset, sizeof(line) - offset, format, args);
    va_end(args);

    activeSink(level, line);
}

} // namespace inkweather
