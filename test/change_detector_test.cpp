#include <gtest/gtest.h>

#include <cmath>
#include <stdexcept>
#include <string>

#include "fakes.h"
#include "inkweather/change_detector.h"

using namespace inkweather;

namespace
{

LayoutConfig rainLayout()
{
    LayoutConfig config;
    LayoutSection top;
    top.name = "top";
    top.groups.push_back(ModuleGroup{"normal", {"main_weather"}});
    LayoutSection bottom;
    bottom.name = "bottom";
    bottom.groups.push_back(ModuleGroup{"normal", {"barometer_module"}});
    bottom.groups.push_back(ModuleGroup{"precipitation_active", {"precipitation_module"}});
    config.sections = {top, bottom};

    TriggerDefinition rain;
    rain.name = "rain";
    rain.condition = "precipitation > 0 OR forecast_precipitation_2h > 0.2";
    rain.targetSection = "bottom";
    rain.activateGroup = "precipitation_active";
    rain.priority = 90;
    config.triggers.push_back(rain);
    return config;
}

class FailingResolver : public LayoutResolver
{
public:
    FailingResolver(const LayoutConfig &config, const ConditionEvaluator &evaluator) : LayoutResolver(config, evaluator)
    {
    }

    LayoutState resolve(const ContextSnapshot &) const override
    {
        throw std::runtime_error("context unavailable");
    }
};

class ChangeDetectorTest : public ::testing::Test
{
protected:
    ChangeDetectorTest() : resolver_(rainLayout(), evaluator_), detector_(resolver_, ChangeDetectorSettings()) {}

    // State as it would be right after a redraw of `weather` at `at`.
    DisplayState acceptedAt(const WeatherPayload &weather, time_t at) const
    {
        DisplayState state;
        state.hasWeather = true;
        state.weather = ObservableWeatherState::observe(weather, at);
        state.hasLayout = true;
        state.layout = resolver_.resolve(buildContext(weather, at, UserPreferences()));
        return state;
    }

    UpdateDecision decide(const WeatherPayload &weather, time_t now, const DisplayState &accepted) const
    {
        return detector_.shouldUpdate(buildContext(weather, now, UserPreferences()), weather, accepted);
    }

    ConditionEvaluator evaluator_;
    LayoutResolver resolver_;
    ChangeDetector detector_;
};

} // namespace

TEST_F(ChangeDetectorTest, FirstRunAlwaysRedraws)
{
    const UpdateDecision decision = decide(fakes::sampleWeather(), fakes::NEW_YEAR_NOON, DisplayState());

    EXPECT_TRUE(decision.update);
    EXPECT_EQ(decision.reason, UpdateReason::FirstRun);
    EXPECT_EQ(decision.layout.activeModules, (std::vector<std::string>{"main_weather", "barometer_module"}));
}

TEST_F(ChangeDetectorTest, UnchangedWeatherDoesNotRedraw)
{
    const WeatherPayload weather = fakes::sampleWeather();
    const DisplayState accepted = acceptedAt(weather, fakes::NEW_YEAR_NOON - 60);

    const UpdateDecision decision = decide(weather, fakes::NEW_YEAR_NOON, accepted);

    EXPECT_FALSE(decision.update);
    EXPECT_EQ(decision.reason, UpdateReason::NoChange);
    EXPECT_STREQ(toString(decision.reason), "no change");
}

TEST_F(ChangeDetectorTest, TemperatureWithinToleranceIsIgnored)
{
    WeatherPayload weather = fakes::sampleWeather();
    const DisplayState accepted = acceptedAt(weather, fakes::NEW_YEAR_NOON - 60);

    weather.temperature = 20.05F;
    EXPECT_FALSE(decide(weather, fakes::NEW_YEAR_NOON, accepted).update);

    weather.temperature = 20.15F;
    const UpdateDecision decision = decide(weather, fakes::NEW_YEAR_NOON, accepted);
    EXPECT_TRUE(decision.update);
    EXPECT_EQ(decision.reason, UpdateReason::FieldChange);
    EXPECT_EQ(decision.detail, "temperature: 20.00 -> 20.15");
}

TEST_F(ChangeDetectorTest, PressureAndTomorrowUseTolerance)
{
    WeatherPayload weather = fakes::sampleWeather();
    const DisplayState accepted = acceptedAt(weather, fakes::NEW_YEAR_NOON - 60);

    weather.pressure = 1013.04F;
    weather.tomorrow.temperature = 18.05F;
    EXPECT_FALSE(decide(weather, fakes::NEW_YEAR_NOON, accepted).update);

    weather.tomorrow.temperature = 19.0F;
    const UpdateDecision decision = decide(weather, fakes::NEW_YEAR_NOON, accepted);
    EXPECT_EQ(decision.reason, UpdateReason::FieldChange);
    EXPECT_EQ(decision.detail.find("tomorrow_temperature"), 0U);
}

TEST_F(ChangeDetectorTest, TextFieldsUseExactEquality)
{
    WeatherPayload weather = fakes::sampleWeather();
    const DisplayState accepted = acceptedAt(weather, fakes::NEW_YEAR_NOON - 60);

    weather.description = "few clouds";
    const UpdateDecision decision = decide(weather, fakes::NEW_YEAR_NOON, accepted);

    EXPECT_TRUE(decision.update);
    EXPECT_EQ(decision.detail, "description: 'clear sky' -> 'few clouds'");
}

TEST_F(ChangeDetectorTest, TrendAndSunTimesAreObserved)
{
    WeatherPayload weather = fakes::sampleWeather();
    const DisplayState accepted = acceptedAt(weather, fakes::NEW_YEAR_NOON - 60);

    WeatherPayload trend = weather;
    trend.pressureTrendText = "Falling";
    EXPECT_EQ(decide(trend, fakes::NEW_YEAR_NOON, accepted).detail.find("pressure_trend_text"), 0U);

    WeatherPayload sunset = weather;
    sunset.sunset = 1735747200;
    EXPECT_EQ(decide(sunset, fakes::NEW_YEAR_NOON, accepted).detail.find("sunset"), 0U);
}

TEST_F(ChangeDetectorTest, MissingValueAppearingIsAChange)
{
    WeatherPayload weather = fakes::sampleWeather();
    weather.pressure = NAN;
    const DisplayState accepted = acceptedAt(weather, fakes::NEW_YEAR_NOON - 60);

    EXPECT_FALSE(decide(weather, fakes::NEW_YEAR_NOON, accepted).update);

    weather.pressure = 1009.0F;
    const UpdateDecision decision = decide(weather, fakes::NEW_YEAR_NOON, accepted);
    EXPECT_TRUE(decision.update);
    EXPECT_EQ(decision.detail, "pressure: n/a -> 1009.00");
}

TEST_F(ChangeDetectorTest, WatchdogForcesRedrawAfterThirtyMinutes)
{
    const WeatherPayload weather = fakes::sampleWeather();

    const UpdateDecision late = decide(weather, fakes::NEW_YEAR_NOON, acceptedAt(weather, fakes::NEW_YEAR_NOON - 31 * 60));
    EXPECT_TRUE(late.update);
    EXPECT_EQ(late.reason, UpdateReason::Watchdog);
    EXPECT_EQ(late.detail, "31 min since last redraw");

    const UpdateDecision early =
        decide(weather, fakes::NEW_YEAR_NOON, acceptedAt(weather, fakes::NEW_YEAR_NOON - 29 * 60));
    EXPECT_FALSE(early.update);
}

TEST_F(ChangeDetectorTest, DateRolloverForcesRedraw)
{
    const WeatherPayload weather = fakes::sampleWeather();
    const time_t lateEvening = 1735775400; // 2025-01-01 23:50 UTC
    const time_t pastMidnight = 1735776300; // 2025-01-02 00:05 UTC

    const UpdateDecision decision = decide(weather, pastMidnight, acceptedAt(weather, lateEvening));

    EXPECT_TRUE(decision.update);
    EXPECT_EQ(decision.reason, UpdateReason::DateRollover);
    EXPECT_EQ(decision.detail, "2025-01-01 -> 2025-01-02");
}

TEST_F(ChangeDetectorTest, DateUsesProviderTimezone)
{
    WeatherPayload weather = fakes::sampleWeather();
    weather.timezoneOffset = 3600;
    const time_t beforeLocalMidnight = 1735772400 - 10 * 60; // 2025-01-01 22:50 UTC
    const time_t afterLocalMidnight = 1735772400 + 5 * 60;   // 2025-01-01 23:05 UTC

    const UpdateDecision decision = decide(weather, afterLocalMidnight, acceptedAt(weather, beforeLocalMidnight));

    EXPECT_EQ(decision.reason, UpdateReason::DateRollover);
}

TEST_F(ChangeDetectorTest, LayoutChangeTakesPrecedence)
{
    WeatherPayload weather = fakes::sampleWeather();
    const DisplayState accepted = acceptedAt(weather, fakes::NEW_YEAR_NOON - 45 * 60);

    weather.forecastPrecipitation2h = 0.3F;
    const UpdateDecision decision = decide(weather, fakes::NEW_YEAR_NOON, accepted);

    EXPECT_TRUE(decision.update);
    EXPECT_EQ(decision.reason, UpdateReason::LayoutChange);
    EXPECT_NE(decision.detail.find("bottom: normal -> precipitation_active"), std::string::npos);
    EXPECT_EQ(decision.layout.activeModules, (std::vector<std::string>{"main_weather", "precipitation_module"}));
}

TEST_F(ChangeDetectorTest, PrecipitationBelowThresholdKeepsLayout)
{
    WeatherPayload weather = fakes::sampleWeather();
    const DisplayState accepted = acceptedAt(weather, fakes::NEW_YEAR_NOON - 60);

    weather.forecastPrecipitation2h = 0.1F;
    const UpdateDecision decision = decide(weather, fakes::NEW_YEAR_NOON, accepted);

    EXPECT_FALSE(decision.update);
    EXPECT_EQ(decision.layout, accepted.layout);
}

TEST_F(ChangeDetectorTest, CustomToleranceIsHonoured)
{
    ChangeDetectorSettings settings;
    settings.numericTolerance = 0.5;
    settings.watchdogSeconds = 600;
    const ChangeDetector coarse(resolver_, settings);

    WeatherPayload weather = fakes::sampleWeather();
    const DisplayState accepted = acceptedAt(weather, fakes::NEW_YEAR_NOON - 60);
    weather.temperature = 20.3F;

    EXPECT_FALSE(coarse.shouldUpdate(buildContext(weather, fakes::NEW_YEAR_NOON, UserPreferences()), weather, accepted)
                     .update);
    EXPECT_EQ(coarse.shouldUpdate(buildContext(weather, fakes::NEW_YEAR_NOON + 660, UserPreferences()), weather,
                                  accepted)
                  .reason,
              UpdateReason::Watchdog);
}

TEST_F(ChangeDetectorTest, InternalFailureForcesRedrawWithAcceptedLayout)
{
    const WeatherPayload weather = fakes::sampleWeather();
    const DisplayState accepted = acceptedAt(weather, fakes::NEW_YEAR_NOON - 60);
    const FailingResolver failing(rainLayout(), evaluator_);
    const ChangeDetector detector(failing, ChangeDetectorSettings());

    const UpdateDecision decision =
        detector.shouldUpdate(buildContext(weather, fakes::NEW_YEAR_NOON, UserPreferences()), weather, accepted);

    EXPECT_TRUE(decision.update);
    EXPECT_EQ(decision.reason, UpdateReason::DetectionError);
    EXPECT_EQ(decision.detail, "context unavailable");
    EXPECT_EQ(decision.layout, accepted.layout);
}

TEST_F(ChangeDetectorTest, InternalFailureWithoutAcceptedLayoutUsesLegacyList)
{
    LayoutConfig config = rainLayout();
    config.legacyModules = {"main_weather", "clock_module"};
    const FailingResolver failing(config, evaluator_);
    const ChangeDetector detector(failing, ChangeDetectorSettings());
    const WeatherPayload weather = fakes::sampleWeather();

    const UpdateDecision decision =
        detector.shouldUpdate(buildContext(weather, fakes::NEW_YEAR_NOON, UserPreferences()), weather, DisplayState());

    EXPECT_TRUE(decision.update);
    EXPECT_EQ(decision.reason, UpdateReason::DetectionError);
    EXPECT_TRUE(decision.layout.legacy);
    EXPECT_EQ(decision.layout.activeModules, (std::vector<std::string>{"main_weather", "clock_module"}));
}
