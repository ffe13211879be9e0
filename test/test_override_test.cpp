#include <gtest/gtest.h>

#include <string>

#include "fakes.h"
#include "inkweather/test_override.h"

using namespace inkweather;

namespace
{

DebugSettings allowing()
{
    DebugSettings debug;
    debug.allowTestData = true;
    debug.testTimeoutHours = 2.0;
    return debug;
}

} // namespace

TEST(TestOverrideTest, IgnoredUnlessAllowed)
{
    fakes::MemoryFileStore store;
    DebugSettings debug;
    store.files[debug.testDataPath] = R"({"enabled": true, "precipitation": 2.0})";
    TestOverride testData;

    EXPECT_FALSE(loadTestOverride(store, debug, fakes::NEW_YEAR_NOON, testData));
    EXPECT_TRUE(loadTestOverride(store, allowing(), fakes::NEW_YEAR_NOON, testData));
    EXPECT_FLOAT_EQ(testData.precipitation, 2.0F);
    EXPECT_EQ(testData.description, "Test data active");
}

TEST(TestOverrideTest, MissingOrDisabledFileIsIgnored)
{
    fakes::MemoryFileStore store;
    const DebugSettings debug = allowing();
    TestOverride testData;

    EXPECT_FALSE(loadTestOverride(store, debug, fakes::NEW_YEAR_NOON, testData));

    store.files[debug.testDataPath] = R"({"enabled": false, "precipitation": 2.0})";
    EXPECT_FALSE(loadTestOverride(store, debug, fakes::NEW_YEAR_NOON, testData));

    store.files[debug.testDataPath] = "not json";
    EXPECT_FALSE(loadTestOverride(store, debug, fakes::NEW_YEAR_NOON, testData));
}

TEST(TestOverrideTest, ExpiredFileIsRemoved)
{
    fakes::MemoryFileStore store;
    const DebugSettings debug = allowing();
    TestOverride testData;

    store.files[debug.testDataPath] =
        R"({"enabled": true, "precipitation": 1.0, "created_at": )" + std::to_string(fakes::NEW_YEAR_NOON - 3600) + "}";
    EXPECT_TRUE(loadTestOverride(store, debug, fakes::NEW_YEAR_NOON, testData));

    EXPECT_FALSE(loadTestOverride(store, debug, fakes::NEW_YEAR_NOON + 2 * 3600, testData));
    EXPECT_FALSE(store.exists(debug.testDataPath));
}

TEST(TestOverrideTest, ObservedValueWins)
{
    TestOverride testData;
    testData.precipitation = 0.2F;
    testData.precipitationObserved = 1.4F;
    WeatherPayload weather = fakes::sampleWeather();

    applyTestOverride(testData, weather);

    EXPECT_FLOAT_EQ(weather.precipitation, 1.4F);
    EXPECT_FLOAT_EQ(weather.precipitationObserved, 1.4F);
    EXPECT_TRUE(weather.testData);
    ASSERT_EQ(weather.sources.size(), 2U);
    EXPECT_EQ(weather.sources.back(), TEST_DATA_SOURCE);
}

TEST(TestOverrideTest, ForecastFieldsOnlyWhenPresent)
{
    fakes::MemoryFileStore store;
    const DebugSettings debug = allowing();
    store.files[debug.testDataPath] =
        R"({"enabled": true, "forecast_precipitation_2h": 0.7, "forecast_time": "15:30", "description": "drill"})";
    TestOverride testData;
    ASSERT_TRUE(loadTestOverride(store, debug, fakes::NEW_YEAR_NOON, testData));
    EXPECT_TRUE(testData.hasForecast);
    EXPECT_EQ(testData.description, "drill");

    WeatherPayload weather = fakes::sampleWeather();
    applyTestOverride(testData, weather);
    EXPECT_FLOAT_EQ(weather.precipitation, 0.0F);
    EXPECT_FLOAT_EQ(weather.forecastPrecipitation2h, 0.7F);
    EXPECT_EQ(weather.forecastPrecipitationTime, "15:30");

    TestOverride noForecast;
    WeatherPayload untouched = fakes::sampleWeather();
    untouched.forecastPrecipitation2h = 0.4F;
    applyTestOverride(noForecast, untouched);
    EXPECT_FLOAT_EQ(untouched.forecastPrecipitation2h, 0.4F);
}
