#include <cmath>
#include <cstdio>
#include <string>
#include <vector>

#include "inkweather/module_renderers.h"
#include "inkweather/text_layout.h"
#include "inkweather/time_util.h"
#include "inkweather/weather_format.h"

namespace inkweather
{
namespace
{
constexpr int PADDING = 14;
constexpr int LINE_GAP = 8;

int lineStep(const Surface &surface, FontRole font)
{
    return surface.fontHeight(font) + LINE_GAP;
}

bool fits(const Rect &rect, int y, const Surface &surface, FontRole font)
{
    return y + surface.fontHeight(font) <= rect.bottom() - PADDING / 2;
}

std::string joinSources(const std::vector<std::string> &sources)
{
    std::string out;
    for (const std::string &source : sources)
    {
        if (!out.empty())
        {
            out += ", ";
        }
        out += source;
    }
    return out.empty() ? std::string("--") : out;
}

bool renderMainWeather(Surface &surface, const Rect &rect, const WeatherPayload &weather, const ContextSnapshot &)
{
    const int x = rect.x + PADDING;
    const int maxWidth = rect.width - 2 * PADDING;
    int y = rect.y + PADDING;
    if (!fits(rect, y, surface, FontRole::Large))
    {
        return false;
    }

    if (!weather.location.empty())
    {
        surface.drawText(fitText(surface, weather.location, FontRole::Body, maxWidth), x, y, FontRole::Body);
        y += lineStep(surface, FontRole::Body);
    }

    surface.drawText(formatTemperature(weather.temperature, weather.temperatureUnit), x, y, FontRole::Large);
    y += lineStep(surface, FontRole::Large);

    const std::string description =
        weather.description.empty() ? std::string("Waiting for data") : capitalizeWords(weather.description);
    if (fits(rect, y, surface, FontRole::Heading))
    {
        surface.drawText(fitText(surface, description, FontRole::Heading, maxWidth), x, y, FontRole::Heading);
        y += lineStep(surface, FontRole::Heading);
    }

    if (weather.sunrise != 0 && weather.sunset != 0 && fits(rect, y, surface, FontRole::Body))
    {
        const std::string sun = "Sunrise " + formatLocal(weather.sunrise, weather.timezoneOffset, "%H:%M") +
                                "  Sunset " + formatLocal(weather.sunset, weather.timezoneOffset, "%H:%M");
        surface.drawText(fitText(surface, sun, FontRole::Body, maxWidth), x, y, FontRole::Body);
    }
    return true;
}

bool renderBarometer(Surface &surface, const Rect &rect, const WeatherPayload &weather, const ContextSnapshot &)
{
    if (std::isnan(weather.pressure))
    {
        return false;
    }

    const int x = rect.x + PADDING;
    const int maxWidth = rect.width - 2 * PADDING;
    int y = rect.y + PADDING;
    if (!fits(rect, y, surface, FontRole::Large))
    {
        return false;
    }

    char value[24];
    std::snprintf(value, sizeof(value), "%.0f hPa", weather.pressure);
    surface.drawText(fitText(surface, value, FontRole::Large, maxWidth), x, y, FontRole::Large);
    y += lineStep(surface, FontRole::Large);

    const std::string trend = weather.pressureTrendText.empty() ? std::string("Collecting data") : weather.pressureTrendText;
    if (fits(rect, y, surface, FontRole::Heading))
    {
        surface.drawText(fitText(surface, trend, FontRole::Heading, maxWidth), x, y, FontRole::Heading);
        y += lineStep(surface, FontRole::Heading);
    }

    if (!std::isnan(weather.pressureChange3h) && fits(rect, y, surface, FontRole::Body))
    {
        char change[32];
        std::snprintf(change, sizeof(change), "%+.1f hPa / 3h", weather.pressureChange3h);
        surface.drawText(fitText(surface, change, FontRole::Body, maxWidth), x, y, FontRole::Body);
    }
    return true;
}

bool renderTomorrow(Surface &surface, const Rect &rect, const WeatherPayload &weather, const ContextSnapshot &)
{
    const TomorrowForecast &tomorrow = weather.tomorrow;
    if (std::isnan(tomorrow.temperature) && std::isnan(tomorrow.maxTemperature))
    {
        return false;
    }

    const int x = rect.x + PADDING;
    const int maxWidth = rect.width - 2 * PADDING;
    int y = rect.y + PADDING;
    if (!fits(rect, y, surface, FontRole::Heading))
    {
        return false;
    }

    surface.drawText("Tomorrow", x, y, FontRole::Heading);
    y += lineStep(surface, FontRole::Heading);

    std::string temperatures;
    if (std::isnan(tomorrow.maxTemperature) || std::isnan(tomorrow.minTemperature))
    {
        temperatures = formatTemperature(tomorrow.temperature, weather.temperatureUnit);
    }
    else
    {
        temperatures = formatTemperature(tomorrow.maxTemperature, weather.temperatureUnit) + " / " +
                       formatTemperature(tomorrow.minTemperature, weather.temperatureUnit);
    }
    if (fits(rect, y, surface, FontRole::Heading))
    {
        surface.drawText(fitText(surface, temperatures, FontRole::Heading, maxWidth), x, y, FontRole::Heading);
        y += lineStep(surface, FontRole::Heading);
    }

    const std::string summary =
        tomorrow.description.empty() ? std::string("--") : capitalizeWords(tomorrow.description);
    for (const std::string &line : wrapText(surface, summary, FontRole::Body, maxWidth, 2))
    {
        if (!fits(rect, y, surface, FontRole::Body))
        {
            break;
        }
        surface.drawText(line, x, y, FontRole::Body);
        y += lineStep(surface, FontRole::Body);
    }
    return true;
}

bool renderClock(Surface &surface, const Rect &rect, const WeatherPayload &weather, const ContextSnapshot &context)
{
    const int x = rect.x + PADDING;
    const int maxWidth = rect.width - 2 * PADDING;
    int y = rect.y + PADDING;
    if (!fits(rect, y, surface, FontRole::Large))
    {
        return false;
    }

    const time_t now = context.capturedAt();
    surface.drawText(formatLocal(now, weather.timezoneOffset, "%H:%M"), x, y, FontRole::Large);
    y += lineStep(surface, FontRole::Large);
    if (fits(rect, y, surface, FontRole::Body))
    {
        surface.drawText(fitText(surface, formatLocal(now, weather.timezoneOffset, "%A %d %B"), FontRole::Body, maxWidth),
                         x, y, FontRole::Body);
    }
    return true;
}

bool renderStatus(Surface &surface, const Rect &rect, const WeatherPayload &weather, const ContextSnapshot &context)
{
    const int x = rect.x + PADDING;
    const int maxWidth = rect.width - 2 * PADDING;
    int y = rect.y + PADDING;
    if (!fits(rect, y, surface, FontRole::Small))
    {
        return false;
    }

    const std::string updated =
        weather.observedAt != 0 ? formatLocal(weather.observedAt, weather.timezoneOffset, "%d %b %H:%M")
                                : std::string("Pending");
    surface.drawText(fitText(surface, "Updated: " + updated, FontRole::Small, maxWidth), x, y, FontRole::Small);
    y += lineStep(surface, FontRole::Small);

    if (fits(rect, y, surface, FontRole::Small))
    {
        surface.drawText(fitText(surface, "Sources: " + joinSources(weather.sources), FontRole::Small, maxWidth), x, y,
                         FontRole::Small);
        y += lineStep(surface, FontRole::Small);
    }

    if (fits(rect, y, surface, FontRole::Small))
    {
        const std::string mode = context.text("user_preference", "normal");
        const std::string line = weather.testData ? "TEST DATA  mode: " + mode : "Mode: " + mode;
        surface.drawText(fitText(surface, line, FontRole::Small, maxWidth), x, y, FontRole::Small);
    }
    return true;
}

struct LegacyModule
{
    const char *id;
    bool (*function)(Surface &, const Rect &, const WeatherPayload &, const ContextSnapshot &);
};

const LegacyModule LEGACY_MODULES[] = {
    {"main_weather", renderMainWeather},
    {"barometer_module", renderBarometer},
    {"tomorrow_forecast", renderTomorrow},
    {"clock_module", renderClock},
    {"status_module", renderStatus},
};
} // namespace

RenderFunction legacyRenderFunction(const std::string &moduleId)
{
    for (const LegacyModule &module : LEGACY_MODULES)
    {
        if (moduleId == module.id)
        {
            return RenderFunction(module.function);
        }
    }
    return RenderFunction();
}

} // namespace inkweather
