#ifndef INKWEATHER_WEATHER_H
#define INKWEATHER_WEATHER_H

#include <cmath>
#include <ctime>
#include <string>
#include <vector>

namespace inkweather
{

struct TomorrowForecast
{
    float temperature{NAN};
    float minTemperature{NAN};
    float maxTemperature{NAN};
    int conditionCode{0};
    std::string description;
};

struct WeatherPayload
{
    float temperature{NAN};
    // "C" or "F", following the provider units.
    std::string temperatureUnit{"C"};
    int conditionCode{0};
    std::string description;

    float pressure{NAN};
    std::string pressureTrendText;
    std::string pressureTrendArrow;
    float pressureChange3h{NAN};

    // m/s regardless of provider units.
    float windSpeed{NAN};
    float windDirection{NAN};

    // mm/h
    float precipitation{0.0F};
    float precipitationObserved{0.0F};
    float forecastPrecipitation2h{0.0F};
    std::string forecastPrecipitationTime;

    TomorrowForecast tomorrow;

    time_t sunrise{};
    time_t sunset{};

    std::string location;
    std::vector<std::string> sources;
    std::string temperatureSource;
    std::string pressureSource;

    time_t observedAt{};
    int timezoneOffset{0};
    bool testData{false};
};

// Compact JSON rendering of the payload for diagnostic log lines.
std::string serializeWeather(const WeatherPayload &weather);

} // namespace inkweather

#endif // INKWEATHER_WEATHER_H
