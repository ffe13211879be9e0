#ifndef INKWEATHER_OPENWEATHER_H
#define INKWEATHER_OPENWEATHER_H

#include <ctime>
#include <string>

#include "inkweather/config.h"
#include "inkweather/weather.h"

namespace inkweather
{

constexpr char OPENWEATHER_SOURCE[] = "OpenWeatherMap";

std::string buildCurrentWeatherUrl(const WeatherSettings &settings);
std::string buildForecastUrl(const WeatherSettings &settings);

// /data/2.5/weather response: current conditions, sun times and timezone.
bool parseCurrentWeather(const std::string &json, const std::string &units, WeatherPayload &weather,
                         std::string &error);

// /data/2.5/forecast response: precipitation over the next slot and the
// tomorrow block. Expects parseCurrentWeather to have run first.
bool parseForecast(const std::string &json, time_t now, WeatherPayload &weather, std::string &error);

} // namespace inkweather

#endif // INKWEATHER_OPENWEATHER_H
