#ifndef INKWEATHER_WEATHER_FORMAT_H
#define INKWEATHER_WEATHER_FORMAT_H

#include <string>

namespace inkweather
{

// none < 0.1, drizzle < 0.5, light < 1.0, moderate < 2.5, heavy < 10 mm/h.
const char *precipitationIntensity(float millimetersPerHour);

// Beaufort scale name for a speed in m/s.
const char *windDescription(float metersPerSecond);
int beaufortNumber(float metersPerSecond);

// 16-point compass abbreviation ("N", "NNE", ...); "--" when unknown.
const char *compassPoint(float degrees);

// "21.4 C", or "--.- C" when the value is missing.
std::string formatTemperature(float value, const std::string &unit);

} // namespace inkweather

#endif // INKWEATHER_WEATHER_FORMAT_H
