#ifndef INKWEATHER_CONTEXT_H
#define INKWEATHER_CONTEXT_H

#include <ctime>
#include <map>
#include <string>

#include "inkweather/weather.h"

namespace inkweather
{

struct SignalValue
{
    enum class Type
    {
        Number,
        Boolean,
        Text
    };

    Type type{Type::Number};
    double number{0.0};
    bool flag{false};
    std::string text;

    static SignalValue fromNumber(double value);
    static SignalValue fromBool(bool value);
    static SignalValue fromText(const std::string &value);

    std::string toString() const;
};

bool operator==(const SignalValue &lhs, const SignalValue &rhs);

// Named signals for one update cycle. Built once, then only read.
class ContextSnapshot
{
public:
    ContextSnapshot() = default;
    ContextSnapshot(time_t capturedAt, int timezoneOffset);

    void set(const std::string &name, const SignalValue &value);
    bool has(const std::string &name) const;
    // Returns false when the signal is absent.
    bool get(const std::string &name, SignalValue &value) const;

    double number(const std::string &name, double fallback) const;
    bool flag(const std::string &name, bool fallback) const;
    std::string text(const std::string &name, const std::string &fallback) const;

    time_t capturedAt() const { return capturedAt_; }
    int timezoneOffset() const { return timezoneOffset_; }
    const std::map<std::string, SignalValue> &signals() const { return signals_; }

private:
    time_t capturedAt_{};
    int timezoneOffset_{0};
    std::map<std::string, SignalValue> signals_;
};

struct UserPreferences
{
    std::string modulePreference{"normal"};
};

// Daylight from sunrise/sunset when both are known, 06:00-18:00 otherwise.
bool isDaylight(const WeatherPayload &weather, time_t now);

ContextSnapshot buildContext(const WeatherPayload &weather, time_t now, const UserPreferences &preferences);

} // namespace inkweather

#endif // INKWEATHER_CONTEXT_H
