#ifndef INKWEATHER_FIRMWARE_WEATHER_FETCH_H
#define INKWEATHER_FIRMWARE_WEATHER_FETCH_H

#include "inkweather/config.h"
#include "inkweather/controller.h"

namespace inkweather
{

bool connectToWifi(const WifiSettings &settings);
void powerDownWifi();

// Downloads current conditions and the 5 day / 3 hour forecast from
// OpenWeatherMap. The radio is switched off again after every fetch.
class OpenWeatherSource : public WeatherSource
{
public:
    OpenWeatherSource(const WifiSettings &wifi, const WeatherSettings &weather);

    bool fetch(time_t now, WeatherPayload &weather, std::string &error) override;

private:
    bool fetchOnline(time_t now, WeatherPayload &weather, std::string &error);

    WifiSettings wifi_;
    WeatherSettings weather_;
};

} // namespace inkweather

#endif // INKWEATHER_FIRMWARE_WEATHER_FETCH_H
