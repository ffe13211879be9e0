#ifndef INKWEATHER_TIME_UTIL_H
#define INKWEATHER_TIME_UTIL_H

#include <ctime>
#include <string>

namespace inkweather
{

// Local time is UTC shifted by the provider's timezone offset, broken down
// with gmtime_r so no TZ database is needed on the device.
struct tm toLocalTm(time_t utc, int offsetSeconds);

std::string formatLocal(time_t utc, int offsetSeconds, const char *pattern);

// YYYY-MM-DD in local time.
std::string localDate(time_t utc, int offsetSeconds);

} // namespace inkweather

#endif // INKWEATHER_TIME_UTIL_H
