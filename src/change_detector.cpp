#include "inkweather/change_detector.h"

#include <cstdio>
#include <exception>

#include "inkweather/log.h"
#include "inkweather/time_util.h"

namespace inkweather
{
namespace
{
constexpr char TAG[] = "Change";

std::string formatNumber(float value)
{
    if (std::isnan(value))
    {
        return "n/a";
    }
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.2f", value);
    return buffer;
}

std::string formatTime(time_t value)
{
    return std::to_string(static_cast<long long>(value));
}

std::string quoted(const std::string &value)
{
    return "'" + value + "'";
}

bool numberChanged(float previous, float current, double tolerance)
{
    const bool previousMissing = std::isnan(previous);
    const bool currentMissing = std::isnan(current);
    if (previousMissing || currentMissing)
    {
        return previousMissing != currentMissing;
    }
    return std::fabs(static_cast<double>(current) - static_cast<double>(previous)) >= tolerance;
}
} // namespace

ObservableWeatherState ObservableWeatherState::observe(const WeatherPayload &weather, time_t now)
{
    ObservableWeatherState state;
    state.temperature = weather.temperature;
    state.conditionCode = weather.conditionCode;
    state.description = weather.description;
    state.pressure = weather.pressure;
    state.pressureTrendText = weather.pressureTrendText;
    state.pressureTrendArrow = weather.pressureTrendArrow;
    state.tomorrowTemperature = weather.tomorrow.temperature;
    state.tomorrowConditionCode = weather.tomorrow.conditionCode;
    state.tomorrowDescription = weather.tomorrow.description;
    state.sunrise = weather.sunrise;
    state.sunset = weather.sunset;
    state.date = localDate(now, weather.timezoneOffset);
    state.lastRedrawAt = now;
    return state;
}

const char *toString(UpdateReason reason)
{
    switch (reason)
    {
    case UpdateReason::LayoutChange:
        return "layout change";
    case UpdateReason::FirstRun:
        return "first run";
    case UpdateReason::Watchdog:
        return "watchdog";
    case UpdateReason::DateRollover:
        return "date rollover";
    case UpdateReason::FieldChange:
        return "field change";
    case UpdateReason::NoChange:
        return "no change";
    case UpdateReason::DetectionError:
        return "detection error";
    }
    return "unknown";
}

ChangeDetector::ChangeDetector(const LayoutResolver &resolver, const ChangeDetectorSettings &settings)
    : resolver_(resolver), settings_(settings)
{
}

UpdateDecision ChangeDetector::shouldUpdate(const ContextSnapshot &context, const WeatherPayload &weather,
                                            const DisplayState &accepted) const
{
    UpdateDecision decision;
    const time_t now = context.capturedAt();

    try
    {
        decision.layout = resolver_.resolve(context);

        if (accepted.hasLayout && decision.layout != accepted.layout)
        {
            decision.update = true;
            decision.reason = UpdateReason::LayoutChange;
            decision.detail = describeLayoutChange(accepted.layout, decision.layout);
            return decision;
        }

        decide(ObservableWeatherState::observe(weather, now), accepted, now, decision);
    }
    catch (const std::exception &e)
    {
        INKWEATHER_LOGE(TAG, "Change detection failed: %s", e.what());
        decision.update = true;
        decision.reason = UpdateReason::DetectionError;
        decision.detail = e.what();
        if (decision.layout.activeModules.empty())
        {
            decision.layout = accepted.hasLayout ? accepted.layout : resolver_.legacyLayout(now);
        }
    }
    return decision;
}

void ChangeDetector::decide(const ObservableWeatherState &current, const DisplayState &accepted, time_t now,
                            UpdateDecision &decision) const
{
    decision.update = true;

    if (!accepted.hasWeather)
    {
        decision.reason = UpdateReason::FirstRun;
        decision.detail = "no accepted state";
        return;
    }

    const ObservableWeatherState &previous = accepted.weather;
    const long elapsed = static_cast<long>(now - previous.lastRedrawAt);
    if (elapsed > settings_.watchdogSeconds)
    {
        decision.reason = UpdateReason::Watchdog;
        decision.detail = std::to_string(elapsed / 60) + " min since last redraw";
        return;
    }

    if (current.date != previous.date)
    {
        decision.reason = UpdateReason::DateRollover;
        decision.detail = previous.date + " -> " + current.date;
        return;
    }

    if (diffFields(previous, current, decision.detail))
    {
        decision.reason = UpdateReason::FieldChange;
        return;
    }

    decision.update = false;
    decision.reason = UpdateReason::NoChange;
    decision.detail.clear();
}

bool ChangeDetector::diffFields(const ObservableWeatherState &previous, const ObservableWeatherState &current,
                                std::string &detail) const
{
    const double tolerance = settings_.numericTolerance;

    if (numberChanged(previous.temperature, current.temperature, tolerance))
    {
        detail = "temperature: " + formatNumber(previous.temperature) + " -> " + formatNumber(current.temperature);
        return true;
    }
    if (previous.conditionCode != current.conditionCode)
    {
        detail = "condition_code: " + std::to_string(previous.conditionCode) + " -> " +
                 std::to_string(current.conditionCode);
        return true;
    }
    if (previous.description != current.description)
    {
        detail = "description: " + quoted(previous.description) + " -> " + quoted(current.description);
        return true;
    }
    if (numberChanged(previous.pressure, current.pressure, tolerance))
    {
        detail = "pressure: " + formatNumber(previous.pressure) + " -> " + formatNumber(current.pressure);
        return true;
    }
    if (previous.pressureTrendText != current.pressureTrendText)
    {
        detail = "pressure_trend_text: " + quoted(previous.pressureTrendText) + " -> " +
                 quoted(current.pressureTrendText);
        return true;
    }
    if (previous.pressureTrendArrow != current.pressureTrendArrow)
    {
        detail = "pressure_trend_arrow: " + quoted(previous.pressureTrendArrow) + " -> " +
                 quoted(current.pressureTrendArrow);
        return true;
    }
    if (numberChanged(previous.tomorrowTemperature, current.tomorrowTemperature, tolerance))
    {
        detail = "tomorrow_temperature: " + formatNumber(previous.tomorrowTemperature) + " -> " +
                 formatNumber(current.tomorrowTemperature);
        return true;
    }
    if (previous.tomorrowConditionCode != current.tomorrowConditionCode)
    {
        detail = "tomorrow_condition_code: " + std::to_string(previous.tomorrowConditionCode) + " -> " +
                 std::to_string(current.tomorrowConditionCode);
        return true;
    }
    if (previous.tomorrowDescription != current.tomorrowDescription)
    {
        detail = "tomorrow_description: " + quoted(previous.tomorrowDescription) + " -> " +
                 quoted(current.tomorrowDescription);
        return true;
    }
    if (previous.sunrise != current.sunrise)
    {
        detail = "sunrise: " + formatTime(previous.sunrise) + " -> " + formatTime(current.sunrise);
        return true;
    }
    if (previous.sunset != current.sunset)
    {
        detail = "sunset: " + formatTime(previous.sunset) + " -> " + formatTime(current.sunset);
        return true;
    }
    return false;
}

} // namespace inkweather
