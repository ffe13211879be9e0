#ifndef INKWEATHER_PRESSURE_HISTORY_H
#define INKWEATHER_PRESSURE_HISTORY_H

#include <cmath>
#include <ctime>
#include <string>
#include <vector>

#include "inkweather/file_store.h"
#include "inkweather/weather.h"

namespace inkweather
{

struct PressureSample
{
    time_t timestamp{};
    float pressure{NAN};
    std::string source;
};

struct PressureTrend
{
    enum class Direction
    {
        Rising,
        Falling,
        Stable,
        InsufficientData
    };

    Direction direction{Direction::InsufficientData};
    float change3h{NAN};
    float hoursOfData{0.0F};

    // "rising", "falling" or "stable"; "stable" while data is collected.
    const char *arrow() const;
    // "Rising", "Falling", "Steady" or "Collecting data".
    const char *text() const;
};

// Rolling pressure log used for the 3 hour trend. Samples older than 24 h
// are pruned on every record().
class PressureHistory
{
public:
    static constexpr long RETENTION_SECONDS = 24L * 3600L;
    static constexpr long TREND_WINDOW_SECONDS = 3L * 3600L;
    static constexpr float MIN_TREND_HOURS = 1.5F;
    static constexpr float TREND_THRESHOLD_HPA = 1.5F;

    PressureHistory(FileStore &store, const std::string &path);

    // A missing file is an empty history, not an error.
    bool load(std::string &error);
    bool save(std::string &error);

    void record(time_t now, float pressure, const std::string &source);
    PressureTrend trend(time_t now) const;

    // record() + trend() + copy into the payload's pressure trend fields.
    void apply(time_t now, WeatherPayload &weather);

    const std::vector<PressureSample> &samples() const { return samples_; }

private:
    void prune(time_t now);

    FileStore &store_;
    std::string path_;
    std::vector<PressureSample> samples_;
};

} // namespace inkweather

#endif // INKWEATHER_PRESSURE_HISTORY_H
