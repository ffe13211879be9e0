#ifndef INKWEATHER_CHANGE_DETECTOR_H
#define INKWEATHER_CHANGE_DETECTOR_H

#include <cmath>
#include <ctime>
#include <string>

#include "inkweather/context.h"
#include "inkweather/layout.h"
#include "inkweather/weather.h"

namespace inkweather
{

// The part of the weather payload whose change is visible on the panel.
struct ObservableWeatherState
{
    float temperature{NAN};
    int conditionCode{0};
    std::string description;
    float pressure{NAN};
    std::string pressureTrendText;
    std::string pressureTrendArrow;
    float tomorrowTemperature{NAN};
    int tomorrowConditionCode{0};
    std::string tomorrowDescription;
    time_t sunrise{};
    time_t sunset{};
    std::string date;
    time_t lastRedrawAt{};

    static ObservableWeatherState observe(const WeatherPayload &weather, time_t now);
};

// What is on the panel right now. Replaced only after a successful redraw.
struct DisplayState
{
    bool hasWeather{false};
    ObservableWeatherState weather;
    bool hasLayout{false};
    LayoutState layout;
};

enum class UpdateReason
{
    LayoutChange,
    FirstRun,
    Watchdog,
    DateRollover,
    FieldChange,
    NoChange,
    DetectionError
};

const char *toString(UpdateReason reason);

struct UpdateDecision
{
    bool update{false};
    UpdateReason reason{UpdateReason::NoChange};
    std::string detail;
    LayoutState layout;
};

struct ChangeDetectorSettings
{
    long watchdogSeconds{30L * 60L};
    double numericTolerance{0.1};
};

class ChangeDetector
{
public:
    ChangeDetector(const LayoutResolver &resolver, const ChangeDetectorSettings &settings);

    // Never throws; an internal failure yields an update with DetectionError.
    UpdateDecision shouldUpdate(const ContextSnapshot &context, const WeatherPayload &weather,
                                const DisplayState &accepted) const;

    const ChangeDetectorSettings &settings() const { return settings_; }

private:
    void decide(const ObservableWeatherState &current, const DisplayState &accepted, time_t now,
                UpdateDecision &decision) const;
    bool diffFields(const ObservableWeatherState &previous, const ObservableWeatherState &current,
                    std::string &detail) const;

    const LayoutResolver &resolver_;
    ChangeDetectorSettings settings_;
};

} // namespace inkweather

#endif // INKWEATHER_CHANGE_DETECTOR_H
