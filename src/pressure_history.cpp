#include "inkweather/pressure_history.h"

#include <ArduinoJson.h>
#include <algorithm>
#include <cstdlib>

#include "inkweather/log.h"

namespace inkweather
{
namespace
{
constexpr char TAG[] = "Pressure";
constexpr size_t HISTORY_DOCUMENT_CAPACITY = 16 * 1024;
// Keeps the 24 h log to roughly 150 samples.
constexpr long MIN_SAMPLE_SPACING_SECONDS = 10L * 60L;
} // namespace

constexpr long PressureHistory::RETENTION_SECONDS;
constexpr long PressureHistory::TREND_WINDOW_SECONDS;
constexpr float PressureHistory::MIN_TREND_HOURS;
constexpr float PressureHistory::TREND_THRESHOLD_HPA;

const char *PressureTrend::arrow() const
{
    switch (direction)
    {
    case Direction::Rising:
        return "rising";
    case Direction::Falling:
        return "falling";
    case Direction::Stable:
    case Direction::InsufficientData:
        break;
    }
    return "stable";
}

const char *PressureTrend::text() const
{
    switch (direction)
    {
    case Direction::Rising:
        return "Rising";
    case Direction::Falling:
        return "Falling";
    case Direction::Stable:
        return "Steady";
    case Direction::InsufficientData:
        break;
    }
    return "Collecting data";
}

PressureHistory::PressureHistory(FileStore &store, const std::string &path) : store_(store), path_(path)
{
}

bool PressureHistory::load(std::string &error)
{
    samples_.clear();
    std::string source = path_;
    if (!store_.exists(source))
    {
        // An interrupted writeFileAtomically() leaves only the temporary copy.
        source = path_ + ".tmp";
        if (!store_.exists(source))
        {
            INKWEATHER_LOGI(TAG, "No history at %s; starting empty.", path_.c_str());
            return true;
        }
        INKWEATHER_LOGW(TAG, "Recovering history from %s", source.c_str());
    }

    std::string contents;
    if (!store_.read(source, contents))
    {
        error = "Cannot read " + source;
        return false;
    }

    DynamicJsonDocument doc(HISTORY_DOCUMENT_CAPACITY);
    const DeserializationError err = deserializeJson(doc, contents);
    if (err)
    {
        error = std::string("Pressure history JSON parse error: ") + err.c_str();
        return false;
    }

    JsonArrayConst timestamps = doc["timestamps"].as<JsonArrayConst>();
    JsonArrayConst pressures = doc["pressures"].as<JsonArrayConst>();
    JsonArrayConst sources = doc["sources"].as<JsonArrayConst>();
    const size_t count = std::min(timestamps.size(), pressures.size());
    for (size_t i = 0; i < count; ++i)
    {
        PressureSample sample;
        sample.timestamp = static_cast<time_t>(timestamps[i] | 0L);
        sample.pressure = pressures[i] | NAN;
        sample.source = sources[i] | "";
        if (sample.timestamp != 0 && !std::isnan(sample.pressure))
        {
            samples_.push_back(sample);
        }
    }

    std::stable_sort(samples_.begin(), samples_.end(),
                     [](const PressureSample &a, const PressureSample &b) { return a.timestamp < b.timestamp; });
    INKWEATHER_LOGI(TAG, "Loaded %u pressure sample(s).", static_cast<unsigned>(samples_.size()));
    return true;
}

bool PressureHistory::save(std::string &error)
{
    DynamicJsonDocument doc(HISTORY_DOCUMENT_CAPACITY);
    JsonArray timestamps = doc.createNestedArray("timestamps");
    JsonArray pressures = doc.createNestedArray("pressures");
    JsonArray sources = doc.createNestedArray("sources");
    for (const PressureSample &sample : samples_)
    {
        timestamps.add(static_cast<long>(sample.timestamp));
        pressures.add(sample.pressure);
        sources.add(sample.source);
    }
    if (doc.overflowed())
    {
        error = "Pressure history does not fit in memory";
        return false;
    }

    std::string contents;
    serializeJson(doc, contents);
    if (!writeFileAtomically(store_, path_, contents))
    {
        error = "Cannot write " + path_;
        return false;
    }
    return true;
}

void PressureHistory::record(time_t now, float pressure, const std::string &source)
{
    if (std::isnan(pressure))
    {
        return;
    }
    prune(now);

    if (!samples_.empty() && now - samples_.back().timestamp < MIN_SAMPLE_SPACING_SECONDS)
    {
        samples_.back().pressure = pressure;
        samples_.back().source = source;
        return;
    }

    PressureSample sample;
    sample.timestamp = now;
    sample.pressure = pressure;
    sample.source = source;
    samples_.push_back(sample);
    INKWEATHER_LOGD(TAG, "Recorded %.1f hPa (%u samples)", pressure, static_cast<unsigned>(samples_.size()));
}

void PressureHistory::prune(time_t now)
{
    const time_t cutoff = now - RETENTION_SECONDS;
    samples_.erase(std::remove_if(samples_.begin(), samples_.end(),
                                  [cutoff](const PressureSample &sample) { return sample.timestamp < cutoff; }),
                   samples_.end());
}

PressureTrend PressureHistory::trend(time_t now) const
{
    PressureTrend result;
    if (samples_.size() < 2)
    {
        return result;
    }

    const time_t target = now - TREND_WINDOW_SECONDS;
    const PressureSample *best = &samples_.front();
    long bestDistance = std::labs(static_cast<long>(best->timestamp - target));
    for (const PressureSample &sample : samples_)
    {
        const long distance = std::labs(static_cast<long>(sample.timestamp - target));
        if (distance < bestDistance)
        {
            bestDistance = distance;
            best = &sample;
        }
    }

    result.hoursOfData = static_cast<float>(now - best->timestamp) / 3600.0F;
    if (result.hoursOfData < MIN_TREND_HOURS)
    {
        INKWEATHER_LOGD(TAG, "Only %.1f h of pressure data.", result.hoursOfData);
        return result;
    }

    result.change3h = samples_.back().pressure - best->pressure;
    if (result.change3h >= TREND_THRESHOLD_HPA)
    {
        result.direction = PressureTrend::Direction::Rising;
    }
    else if (result.change3h <= -TREND_THRESHOLD_HPA)
    {
        result.direction = PressureTrend::Direction::Falling;
    }
    else
    {
        result.direction = PressureTrend::Direction::Stable;
    }
    INKWEATHER_LOGI(TAG, "3h trend: %+.1f hPa over %.1f h -> %s", result.change3h, result.hoursOfData, result.arrow());
    return result;
}

void PressureHistory::apply(time_t now, WeatherPayload &weather)
{
    record(now, weather.pressure, weather.pressureSource);
    const PressureTrend current = trend(now);
    weather.pressureTrendArrow = current.arrow();
    weather.pressureTrendText = current.text();
    weather.pressureChange3h =
        current.direction == PressureTrend::Direction::InsufficientData ? NAN : current.change3h;
}

} // namespace inkweather
