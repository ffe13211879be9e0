#include "inkweather/module_renderers.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <initializer_list>
#include <memory>

#include "inkweather/log.h"
#include "inkweather/text_layout.h"
#include "inkweather/weather_format.h"

namespace inkweather
{
namespace
{
constexpr char TAG[] = "Module";
constexpr int PADDING = 12;
constexpr int ROW_GAP = 10;
constexpr int MIN_MODULE_HEIGHT = 60;
constexpr float DEG_TO_RAD = 3.14159265F / 180.0F;

void drawWarningGlyph(Surface &surface, int x, int y, int size)
{
    const int apex = x + size / 2;
    const int base = y + size - 1;
    surface.drawLine(x, base, apex, y);
    surface.drawLine(apex, y, x + size - 1, base);
    surface.drawLine(x, base, x + size - 1, base);
    const int markWidth = surface.measureText("!", FontRole::Body);
    surface.drawText("!", apex - markWidth / 2, y + size / 3, FontRole::Body);
}
} // namespace

void PrecipitationRenderer::describe(float precipitation, float forecast2h, const std::string &forecastTime,
                                     std::string &headline, std::string &detail)
{
    if (precipitation > 0.0F)
    {
        headline = "RAINING NOW";
        detail = std::string(precipitationIntensity(precipitation)) + " intensity";
    }
    else if (forecast2h > 0.0F)
    {
        headline = "RAIN EXPECTED";
        detail = std::string(precipitationIntensity(forecast2h)) + " - starts " +
                 (forecastTime.empty() ? std::string("soon") : forecastTime);
    }
    else
    {
        headline = "PRECIPITATION";
        detail = "Checking data...";
    }
}

bool PrecipitationRenderer::render(const Rect &rect, const WeatherPayload &weather, const ContextSnapshot &context)
{
    if (rect.height < MIN_MODULE_HEIGHT)
    {
        return false;
    }

    const float precipitation = static_cast<float>(context.number("precipitation", 0.0));
    const float forecast2h = static_cast<float>(context.number("forecast_precipitation_2h", 0.0));
    std::string headline;
    std::string detail;
    describe(precipitation, forecast2h, weather.forecastPrecipitationTime, headline, detail);

    const int glyphSize = std::min(40, rect.height - 2 * PADDING);
    drawWarningGlyph(surface_, rect.x + PADDING, rect.y + PADDING, glyphSize);

    const int textX = rect.x + PADDING + glyphSize + PADDING;
    const int textWidth = rect.right() - PADDING - textX;
    surface_.drawText(fitText(surface_, headline, FontRole::Heading, textWidth), textX, rect.y + PADDING,
                      FontRole::Heading);

    const int detailY = rect.y + PADDING + surface_.fontHeight(FontRole::Heading) + ROW_GAP;
    if (detailY + surface_.fontHeight(FontRole::Body) <= rect.bottom())
    {
        surface_.drawText(fitText(surface_, detail, FontRole::Body, textWidth), textX, detailY, FontRole::Body);
    }

    INKWEATHER_LOGD(TAG, "Precipitation: %s / %s", headline.c_str(), detail.c_str());
    return true;
}

bool WindRenderer::render(const Rect &rect, const WeatherPayload &weather, const ContextSnapshot &)
{
    if (std::isnan(weather.windSpeed) || rect.height < MIN_MODULE_HEIGHT)
    {
        return false;
    }

    char speed[24];
    std::snprintf(speed, sizeof(speed), "%.1f m/s", weather.windSpeed);
    const int maxWidth = rect.width - 2 * PADDING;
    int y = rect.y + PADDING;
    surface_.drawText(fitText(surface_, speed, FontRole::Large, maxWidth), rect.x + PADDING, y, FontRole::Large);
    y += surface_.fontHeight(FontRole::Large) + ROW_GAP;

    const int lineHeight = surface_.fontHeight(FontRole::Body);
    const std::vector<std::string> lines =
        wrapText(surface_, windDescription(weather.windSpeed), FontRole::Body, maxWidth, 2);
    for (const std::string &line : lines)
    {
        if (y + lineHeight > rect.bottom() - PADDING)
        {
            break;
        }
        surface_.drawText(line, rect.x + PADDING, y, FontRole::Body);
        y += lineHeight + 4;
    }

    const int labelHeight = surface_.fontHeight(FontRole::Body);
    const int radius = labelHeight / 2 + 4;
    const int rowY = rect.bottom() - PADDING - 2 * radius;
    if (rowY >= y)
    {
        drawDirectionArrow(rect.x + PADDING + radius, rowY + radius, radius, weather.windDirection);
        surface_.drawText(compassPoint(weather.windDirection), rect.x + PADDING + 2 * radius + 8,
                          rowY + radius - labelHeight / 2, FontRole::Body);
    }
    return true;
}

void WindRenderer::drawDirectionArrow(int centerX, int centerY, int radius, float degrees)
{
    if (std::isnan(degrees))
    {
        surface_.drawLine(centerX - radius, centerY, centerX + radius, centerY);
        return;
    }

    // Points where the wind blows to; meteorological degrees give its origin.
    const float angle = (degrees + 180.0F) * DEG_TO_RAD;
    const int tipX = centerX + static_cast<int>(std::lround(std::sin(angle) * radius));
    const int tipY = centerY - static_cast<int>(std::lround(std::cos(angle) * radius));
    const int tailX = centerX - static_cast<int>(std::lround(std::sin(angle) * radius));
    const int tailY = centerY + static_cast<int>(std::lround(std::cos(angle) * radius));
    surface_.drawLine(tailX, tailY, tipX, tipY);

    const float headLength = radius * 0.6F;
    for (const float spread : {-0.5F, 0.5F})
    {
        const float headAngle = angle + 3.14159265F + spread;
        surface_.drawLine(tipX, tipY, tipX + static_cast<int>(std::lround(std::sin(headAngle) * headLength)),
                          tipY - static_cast<int>(std::lround(std::cos(headAngle) * headLength)));
    }
}

void registerBuiltinRenderers(RendererRegistry &registry)
{
    registry.registerRenderer(PRECIPITATION_MODULE, [](Surface &surface) {
        return std::unique_ptr<ModuleRenderer>(new PrecipitationRenderer(surface));
    });
    registry.registerRenderer(WIND_MODULE, [](Surface &surface) {
        return std::unique_ptr<ModuleRenderer>(new WindRenderer(surface));
    });
}

} // namespace inkweather
