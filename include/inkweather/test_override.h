#ifndef INKWEATHER_TEST_OVERRIDE_H
#define INKWEATHER_TEST_OVERRIDE_H

#include <ctime>
#include <string>

#include "inkweather/config.h"
#include "inkweather/file_store.h"
#include "inkweather/weather.h"

namespace inkweather
{

constexpr char TEST_DATA_SOURCE[] = "Test data";

// Debug-only precipitation values injected from a file on the SD card, used
// to force precipitation triggers without waiting for rain.
struct TestOverride
{
    time_t createdAt{};
    float precipitation{0.0F};
    float precipitationObserved{0.0F};
    bool hasForecast{false};
    float forecastPrecipitation2h{0.0F};
    std::string forecastTime;
    std::string description;
};

// Returns true only when test data is allowed, the file exists, is enabled
// and has not expired. Expired files are deleted.
bool loadTestOverride(FileStore &store, const DebugSettings &debug, time_t now, TestOverride &out);

// An observed value above zero wins over the plain precipitation value.
void applyTestOverride(const TestOverride &testData, WeatherPayload &weather);

} // namespace inkweather

#endif // INKWEATHER_TEST_OVERRIDE_H
