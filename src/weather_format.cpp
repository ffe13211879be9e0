#include "inkweather/weather_format.h"

#include <cmath>
#include <cstdio>

namespace inkweather
{
namespace
{
struct BeaufortStep
{
    float upperBound;
    const char *name;
};

// Upper bounds in m/s, WMO table.
constexpr BeaufortStep BEAUFORT_SCALE[] = {
    {0.5F, "Calm"},
    {1.6F, "Light air"},
    {3.4F, "Light breeze"},
    {5.5F, "Gentle breeze"},
    {8.0F, "Moderate breeze"},
    {10.8F, "Fresh breeze"},
    {13.9F, "Strong breeze"},
    {17.2F, "Near gale"},
    {20.8F, "Gale"},
    {24.5F, "Strong gale"},
    {28.5F, "Storm"},
    {32.7F, "Violent storm"},
};

constexpr char HURRICANE[] = "Hurricane force";

constexpr const char *COMPASS_POINTS[] = {"N", "NNE", "NE", "ENE", "E", "ESE", "SE", "SSE",
                                          "S", "SSW", "SW", "WSW", "W", "WNW", "NW", "NNW"};
} // namespace

const char *precipitationIntensity(float millimetersPerHour)
{
    if (std::isnan(millimetersPerHour) || millimetersPerHour < 0.1F)
    {
        return "None";
    }
    if (millimetersPerHour < 0.5F)
    {
        return "Drizzle";
    }
    if (millimetersPerHour < 1.0F)
    {
        return "Light";
    }
    if (millimetersPerHour < 2.5F)
    {
        return "Moderate";
    }
    if (millimetersPerHour < 10.0F)
    {
        return "Heavy";
    }
    return "Very heavy";
}

int beaufortNumber(float metersPerSecond)
{
    if (std::isnan(metersPerSecond))
    {
        return 0;
    }
    int number = 0;
    for (const BeaufortStep &step : BEAUFORT_SCALE)
    {
        if (metersPerSecond < step.upperBound)
        {
            return number;
        }
        ++number;
    }
    return number;
}

const char *windDescription(float metersPerSecond)
{
    const int number = beaufortNumber(metersPerSecond);
    constexpr int steps = sizeof(BEAUFORT_SCALE) / sizeof(BEAUFORT_SCALE[0]);
    return number < steps ? BEAUFORT_SCALE[number].name : HURRICANE;
}

const char *compassPoint(float degrees)
{
    if (std::isnan(degrees))
    {
        return "--";
    }
    float normalized = std::fmod(degrees, 360.0F);
    if (normalized < 0.0F)
    {
        normalized += 360.0F;
    }
    const int index = static_cast<int>(std::floor(normalized / 22.5F + 0.5F)) % 16;
    return COMPASS_POINTS[index];
}

std::string formatTemperature(float value, const std::string &unit)
{
    if (std::isnan(value))
    {
        return "--.- " + unit;
    }
    char buffer[24];
    std::snprintf(buffer, sizeof(buffer), "%.1f ", value);
    return buffer + unit;
}

} // namespace inkweather
