#include "inkweather/weather.h"

#include <ArduinoJson.h>

namespace inkweather
{
namespace
{
// NaN has no JSON form; missing readings are left out.
void putNumber(JsonObject object, const char *key, float value)
{
    if (!std::isnan(value))
    {
        object[key] = value;
    }
}
} // namespace

std::string serializeWeather(const WeatherPayload &weather)
{
    DynamicJsonDocument doc(2048);
    JsonObject root = doc.to<JsonObject>();

    putNumber(root, "temperature", weather.temperature);
    root["temperature_unit"] = weather.temperatureUnit;
    root["condition_code"] = weather.conditionCode;
    root["description"] = weather.description;
    putNumber(root, "pressure", weather.pressure);
    root["pressure_trend_text"] = weather.pressureTrendText;
    root["pressure_trend_arrow"] = weather.pressureTrendArrow;
    putNumber(root, "pressure_change_3h", weather.pressureChange3h);
    putNumber(root, "wind_speed", weather.windSpeed);
    putNumber(root, "wind_direction", weather.windDirection);
    root["precipitation"] = weather.precipitation;
    root["precipitation_observed"] = weather.precipitationObserved;
    root["forecast_precipitation_2h"] = weather.forecastPrecipitation2h;
    root["forecast_time"] = weather.forecastPrecipitationTime;

    JsonObject tomorrow = root.createNestedObject("tomorrow");
    putNumber(tomorrow, "temperature", weather.tomorrow.temperature);
    putNumber(tomorrow, "min", weather.tomorrow.minTemperature);
    putNumber(tomorrow, "max", weather.tomorrow.maxTemperature);
    tomorrow["condition_code"] = weather.tomorrow.conditionCode;
    tomorrow["description"] = weather.tomorrow.description;

    root["sunrise"] = static_cast<long>(weather.sunrise);
    root["sunset"] = static_cast<long>(weather.sunset);
    root["location"] = weather.location;

    JsonArray sources = root.createNestedArray("sources");
    for (const std::string &source : weather.sources)
    {
        sources.add(source);
    }
    root["temperature_source"] = weather.temperatureSource;
    root["pressure_source"] = weather.pressureSource;
    root["observed_at"] = static_cast<long>(weather.observedAt);
    root["timezone"] = weather.timezoneOffset;
    root["test_data"] = weather.testData;

    std::string out;
    serializeJson(doc, out);
    return out;
}

} // namespace inkweather
