#include "inkweather/time_util.h"

namespace inkweather
{

struct tm toLocalTm(time_t utc, int offsetSeconds)
{
    const time_t shifted = utc + static_cast<time_t>(offsetSeconds);
    struct tm timeInfo = {};
    gmtime_r(&shifted, &timeInfo);
    return timeInfo;
}

std::string formatLocal(time_t utc, int offsetSeconds, const char *pattern)
{
    const struct tm timeInfo = toLocalTm(utc, offsetSeconds);
    char buffer[64];
    const size_t written = strftime(buffer, sizeof(buffer), pattern, &timeInfo);
    return std::string(buffer, written);
}

std::string localDate(time_t utc, int offsetSeconds)
{
    return formatLocal(utc, offsetSeconds, "%Y-%m-%d");
}

} // namespace inkweather
