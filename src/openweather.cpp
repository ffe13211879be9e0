#include "inkweather/openweather.h"

#include <ArduinoJson.h>
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <limits>

#include "inkweather/log.h"
#include "inkweather/time_util.h"

namespace inkweather
{
namespace
{
constexpr char TAG[] = "Weather";
constexpr char API_BASE[] = "https://api.openweathermap.org/data/2.5/";
constexpr size_t CURRENT_DOCUMENT_CAPACITY = 8 * 1024;
constexpr size_t FORECAST_DOCUMENT_CAPACITY = 32 * 1024;
constexpr float MPH_TO_METERS_PER_SECOND = 0.44704F;
constexpr float FORECAST_SLOT_HOURS = 3.0F;
constexpr long SECONDS_PER_DAY = 24L * 3600L;
constexpr long LOCAL_NOON_SECONDS = 12L * 3600L;

std::string buildUrl(const char *endpoint, const WeatherSettings &settings)
{
    char coordinates[64];
    std::snprintf(coordinates, sizeof(coordinates), "lat=%.6f&lon=%.6f", settings.latitude, settings.longitude);

    std::string url = API_BASE;
    url += endpoint;
    url += "?";
    url += coordinates;
    url += "&units=";
    url += settings.units;
    url += "&lang=";
    url += settings.language;
    url += "&appid=";
    url += settings.apiKey;
    return url;
}

// rain/snow blocks are absent when nothing falls.
float precipitationAmount(JsonObjectConst entry, const char *window)
{
    const float rain = entry["rain"][window] | 0.0F;
    const float snow = entry["snow"][window] | 0.0F;
    return rain + snow;
}

long secondsFromLocalNoon(time_t utc, int offset)
{
    const struct tm local = toLocalTm(utc, offset);
    const long secondsOfDay = local.tm_hour * 3600L + local.tm_min * 60L + local.tm_sec;
    return std::labs(secondsOfDay - LOCAL_NOON_SECONDS);
}
} // namespace

std::string buildCurrentWeatherUrl(const WeatherSettings &settings)
{
    return buildUrl("weather", settings);
}

std::string buildForecastUrl(const WeatherSettings &settings)
{
    return buildUrl("forecast", settings);
}

bool parseCurrentWeather(const std::string &json, const std::string &units, WeatherPayload &weather,
                         std::string &error)
{
    DynamicJsonDocument doc(CURRENT_DOCUMENT_CAPACITY);
    const DeserializationError err = deserializeJson(doc, json);
    if (err)
    {
        INKWEATHER_LOGE(TAG, "Current JSON parse error: %s", err.c_str());
        error = std::string("Weather update failed: JSON ") + err.c_str();
        return false;
    }

    JsonObjectConst root = doc.as<JsonObjectConst>();
    JsonObjectConst readings = root["main"].as<JsonObjectConst>();
    if (readings.isNull())
    {
        error = "Weather update failed: no current conditions";
        return false;
    }

    const bool imperial = units == "imperial";
    weather.temperature = readings["temp"] | NAN;
    weather.temperatureUnit = imperial ? "F" : "C";
    weather.pressure = readings["pressure"] | NAN;

    JsonObjectConst condition = root["weather"][0].as<JsonObjectConst>();
    weather.conditionCode = condition["id"] | 0;
    weather.description = condition["description"] | "";

    weather.windSpeed = root["wind"]["speed"] | NAN;
    if (imperial && !std::isnan(weather.windSpeed))
    {
        weather.windSpeed *= MPH_TO_METERS_PER_SECOND;
    }
    weather.windDirection = root["wind"]["deg"] | NAN;

    weather.precipitationObserved = precipitationAmount(root, "1h");
    weather.precipitation = weather.precipitationObserved;

    weather.sunrise = static_cast<time_t>(root["sys"]["sunrise"] | 0L);
    weather.sunset = static_cast<time_t>(root["sys"]["sunset"] | 0L);
    weather.location = root["name"] | "";
    weather.observedAt = static_cast<time_t>(root["dt"] | 0L);
    weather.timezoneOffset = root["timezone"] | 0;

    weather.sources.clear();
    weather.sources.push_back(OPENWEATHER_SOURCE);
    weather.temperatureSource = OPENWEATHER_SOURCE;
    weather.pressureSource = OPENWEATHER_SOURCE;
    weather.testData = false;
    return true;
}

bool parseForecast(const std::string &json, time_t now, WeatherPayload &weather, std::string &error)
{
    DynamicJsonDocument doc(FORECAST_DOCUMENT_CAPACITY);
    const DeserializationError err = deserializeJson(doc, json);
    if (err)
    {
        INKWEATHER_LOGE(TAG, "Forecast JSON parse error: %s", err.c_str());
        error = std::string("Weather update failed: JSON ") + err.c_str();
        return false;
    }

    JsonArrayConst list = doc["list"].as<JsonArrayConst>();
    if (list.isNull() || list.size() == 0)
    {
        error = "Weather update failed: empty forecast";
        return false;
    }

    const int offset = doc["city"]["timezone"] | weather.timezoneOffset;

    JsonObjectConst upcoming;
    for (JsonVariantConst item : list)
    {
        JsonObjectConst entry = item.as<JsonObjectConst>();
        if (static_cast<time_t>(entry["dt"] | 0L) >= now)
        {
            upcoming = entry;
            break;
        }
    }
    if (upcoming.isNull())
    {
        upcoming = list[0].as<JsonObjectConst>();
    }

    const time_t upcomingAt = static_cast<time_t>(upcoming["dt"] | 0L);
    weather.forecastPrecipitation2h = precipitationAmount(upcoming, "3h") / FORECAST_SLOT_HOURS;
    weather.forecastPrecipitationTime =
        weather.forecastPrecipitation2h > 0.0F ? formatLocal(upcomingAt, offset, "%H:%M") : std::string();

    const std::string tomorrowDate = localDate(now + SECONDS_PER_DAY, offset);
    TomorrowForecast tomorrow;
    float minimum = std::numeric_limits<float>::infinity();
    float maximum = -std::numeric_limits<float>::infinity();
    long bestDistance = std::numeric_limits<long>::max();

    for (JsonVariantConst item : list)
    {
        JsonObjectConst entry = item.as<JsonObjectConst>();
        const time_t at = static_cast<time_t>(entry["dt"] | 0L);
        if (localDate(at, offset) != tomorrowDate)
        {
            continue;
        }

        const float temperature = entry["main"]["temp"] | NAN;
        if (!std::isnan(temperature))
        {
            minimum = std::min(minimum, temperature);
            maximum = std::max(maximum, temperature);
        }

        const long distance = secondsFromLocalNoon(at, offset);
        if (distance < bestDistance)
        {
            bestDistance = distance;
            tomorrow.temperature = temperature;
            tomorrow.conditionCode = entry["weather"][0]["id"] | 0;
            tomorrow.description = entry["weather"][0]["description"] | "";
        }
    }

    if (minimum != std::numeric_limits<float>::infinity())
    {
        tomorrow.minTemperature = minimum;
        tomorrow.maxTemperature = maximum;
    }
    weather.tomorrow = tomorrow;

    INKWEATHER_LOGI(TAG, "Forecast parsed: next slot %.2f mm/h, tomorrow %s", weather.forecastPrecipitation2h,
                    tomorrowDate.c_str());
    return true;
}

} // namespace inkweather
