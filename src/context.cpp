#include "inkweather/context.h"

#include <cmath>
#include <cstdio>

#include "inkweather/log.h"
#include "inkweather/time_util.h"

namespace inkweather
{
namespace
{
constexpr char TAG[] = "Context";
constexpr int DAYLIGHT_FALLBACK_START_HOUR = 6;
constexpr int DAYLIGHT_FALLBACK_END_HOUR = 18;
} // namespace

SignalValue SignalValue::fromNumber(double value)
{
    SignalValue signal;
    signal.type = Type::Number;
    signal.number = value;
    return signal;
}

SignalValue SignalValue::fromBool(bool value)
{
    SignalValue signal;
    signal.type = Type::Boolean;
    signal.flag = value;
    return signal;
}

SignalValue SignalValue::fromText(const std::string &value)
{
    SignalValue signal;
    signal.type = Type::Text;
    signal.text = value;
    return signal;
}

std::string SignalValue::toString() const
{
    switch (type)
    {
    case Type::Number:
    {
        char buffer[32];
        std::snprintf(buffer, sizeof(buffer), "%g", number);
        return buffer;
    }
    case Type::Boolean:
        return flag ? "true" : "false";
    case Type::Text:
        return "'" + text + "'";
    }
    return "?";
}

bool operator==(const SignalValue &lhs, const SignalValue &rhs)
{
    if (lhs.type != rhs.type)
    {
        return false;
    }
    switch (lhs.type)
    {
    case SignalValue::Type::Number:
        return lhs.number == rhs.number;
    case SignalValue::Type::Boolean:
        return lhs.flag == rhs.flag;
    case SignalValue::Type::Text:
        return lhs.text == rhs.text;
    }
    return false;
}

ContextSnapshot::ContextSnapshot(time_t capturedAt, int timezoneOffset)
    : capturedAt_(capturedAt), timezoneOffset_(timezoneOffset)
{
}

void ContextSnapshot::set(const std::string &name, const SignalValue &value)
{
    signals_[name] = value;
}

bool ContextSnapshot::has(const std::string &name) const
{
    return signals_.find(name) != signals_.end();
}

bool ContextSnapshot::get(const std::string &name, SignalValue &value) const
{
    const auto it = signals_.find(name);
    if (it == signals_.end())
    {
        return false;
    }
    value = it->second;
    return true;
}

double ContextSnapshot::number(const std::string &name, double fallback) const
{
    const auto it = signals_.find(name);
    if (it == signals_.end() || it->second.type != SignalValue::Type::Number)
    {
        return fallback;
    }
    return it->second.number;
}

bool ContextSnapshot::flag(const std::string &name, bool fallback) const
{
    const auto it = signals_.find(name);
    if (it == signals_.end() || it->second.type != SignalValue::Type::Boolean)
    {
        return fallback;
    }
    return it->second.flag;
}

std::string ContextSnapshot::text(const std::string &name, const std::string &fallback) const
{
    const auto it = signals_.find(name);
    if (it == signals_.end() || it->second.type != SignalValue::Type::Text)
    {
        return fallback;
    }
    return it->second.text;
}

bool isDaylight(const WeatherPayload &weather, time_t now)
{
    if (weather.sunrise != 0 && weather.sunset != 0 && weather.sunrise < weather.sunset)
    {
        return weather.sunrise <= now && now <= weather.sunset;
    }

    const struct tm local = toLocalTm(now, weather.timezoneOffset);
    return local.tm_hour >= DAYLIGHT_FALLBACK_START_HOUR && local.tm_hour <= DAYLIGHT_FALLBACK_END_HOUR;
}

ContextSnapshot buildContext(const WeatherPayload &weather, time_t now, const UserPreferences &preferences)
{
    ContextSnapshot context(now, weather.timezoneOffset);
    const struct tm local = toLocalTm(now, weather.timezoneOffset);

    // Missing readings stay absent so the evaluator applies its defaults.
    context.set("precipitation", SignalValue::fromNumber(weather.precipitation));
    context.set("forecast_precipitation_2h", SignalValue::fromNumber(weather.forecastPrecipitation2h));
    if (!std::isnan(weather.temperature))
    {
        context.set("temperature", SignalValue::fromNumber(weather.temperature));
    }
    if (!std::isnan(weather.windSpeed))
    {
        context.set("wind_speed", SignalValue::fromNumber(weather.windSpeed));
    }
    if (!weather.pressureTrendArrow.empty())
    {
        context.set("pressure_trend", SignalValue::fromText(weather.pressureTrendArrow));
    }
    context.set("time_hour", SignalValue::fromNumber(local.tm_hour));
    context.set("time_month", SignalValue::fromNumber(local.tm_mon + 1));
    context.set("time_weekday", SignalValue::fromNumber((local.tm_wday + 6) % 7));
    context.set("is_daylight", SignalValue::fromBool(isDaylight(weather, now)));
    context.set("user_preference", SignalValue::fromText(preferences.modulePreference));

    INKWEATHER_LOGD(TAG, "precipitation=%.2f forecast_2h=%.2f hour=%d daylight=%s",
                    weather.precipitation, weather.forecastPrecipitation2h, local.tm_hour,
                    context.flag("is_daylight", true) ? "yes" : "no");
    return context;
}

} // namespace inkweather
