#include "weather_fetch.h"

#include <HTTPClient.h>
#include <WiFi.h>
#include <WiFiClientSecure.h>

#include "inkweather/log.h"
#include "inkweather/openweather.h"

namespace inkweather
{
namespace
{
constexpr char WIFI_TAG[] = "WiFi";
constexpr char TAG[] = "Weather";

bool httpGet(WiFiClientSecure &client, const std::string &url, const char *label, std::string &body,
             std::string &error)
{
    HTTPClient http;
    if (!http.begin(client, url.c_str()))
    {
        error = std::string("Weather update failed: HTTP client init (") + label + ")";
        INKWEATHER_LOGE(TAG, "HTTP client failed to initialise (%s).", label);
        return false;
    }

    const int code = http.GET();
    INKWEATHER_LOGI(TAG, "%s HTTP status code: %d", label, code);
    const String payload = http.getString();
    http.end();

    if (code != HTTP_CODE_OK)
    {
        if (payload.length() > 0)
        {
            INKWEATHER_LOGW(TAG, "%s response body: %s", label, payload.c_str());
        }
        error = "Weather update failed: HTTP " + std::to_string(code);
        return false;
    }

    body.assign(payload.c_str(), payload.length());
    return true;
}
} // namespace

bool connectToWifi(const WifiSettings &settings)
{
    if (WiFi.status() == WL_CONNECTED)
    {
        INKWEATHER_LOGD(WIFI_TAG, "Already connected to %s", WiFi.SSID().c_str());
        return true;
    }

    INKWEATHER_LOGI(WIFI_TAG, "Connecting to %s...", settings.ssid.c_str());
    WiFi.mode(WIFI_STA);
    WiFi.setSleep(false);
    WiFi.begin(settings.ssid.c_str(), settings.password.c_str());

    const uint32_t start = millis();
    while (WiFi.status() != WL_CONNECTED)
    {
        if (millis() - start > settings.connectTimeoutMs)
        {
            INKWEATHER_LOGW(WIFI_TAG, "Connection timed out; will retry later.");
            WiFi.disconnect(true);
            return false;
        }
        delay(500);
    }

    INKWEATHER_LOGI(WIFI_TAG, "Connected to %s", WiFi.SSID().c_str());
    return true;
}

void powerDownWifi()
{
    if (WiFi.getMode() == WIFI_MODE_NULL)
    {
        return;
    }

    INKWEATHER_LOGD(WIFI_TAG, "Disabling radio to conserve power.");
    WiFi.disconnect(true);
    WiFi.mode(WIFI_MODE_NULL);
    WiFi.setSleep(true);
}

OpenWeatherSource::OpenWeatherSource(const WifiSettings &wifi, const WeatherSettings &weather)
    : wifi_(wifi), weather_(weather)
{
}

bool OpenWeatherSource::fetch(time_t now, WeatherPayload &weather, std::string &error)
{
    if (!connectToWifi(wifi_))
    {
        error = "WiFi connection failed";
        powerDownWifi();
        return false;
    }

    const bool ok = fetchOnline(now, weather, error);
    powerDownWifi();
    return ok;
}

bool OpenWeatherSource::fetchOnline(time_t now, WeatherPayload &weather, std::string &error)
{
    INKWEATHER_LOGI(TAG, "Requesting latest conditions from OpenWeatherMap...");

    WiFiClientSecure client;
    client.setInsecure();

    std::string body;
    if (!httpGet(client, buildCurrentWeatherUrl(weather_), "current", body, error))
    {
        return false;
    }

    WeatherPayload parsed;
    if (!parseCurrentWeather(body, weather_.units, parsed, error))
    {
        error = "Weather update failed: " + error;
        return false;
    }

    // Current conditions alone are still worth showing.
    std::string forecastError;
    if (!httpGet(client, buildForecastUrl(weather_), "forecast", body, forecastError) ||
        !parseForecast(body, now, parsed, forecastError))
    {
        INKWEATHER_LOGW(TAG, "Forecast unusable: %s", forecastError.c_str());
    }

    weather = parsed;
    INKWEATHER_LOGI(TAG, "Weather data parsed successfully.");
    return true;
}

} // namespace inkweather
