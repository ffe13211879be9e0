#ifndef INKWEATHER_MODULE_RENDERERS_H
#define INKWEATHER_MODULE_RENDERERS_H

#include <string>

#include "inkweather/renderer.h"
#include "inkweather/renderer_registry.h"

namespace inkweather
{

constexpr char PRECIPITATION_MODULE[] = "precipitation_module";
constexpr char WIND_MODULE[] = "wind_module";

// Current or expected rain: status line, intensity and start time.
class PrecipitationRenderer : public ModuleRenderer
{
public:
    using ModuleRenderer::ModuleRenderer;

    bool render(const Rect &rect, const WeatherPayload &weather, const ContextSnapshot &context) override;

    // Headline and detail line for the given rates (mm/h).
    static void describe(float precipitation, float forecast2h, const std::string &forecastTime,
                         std::string &headline, std::string &detail);
};

// Speed, Beaufort description and compass direction.
class WindRenderer : public ModuleRenderer
{
public:
    using ModuleRenderer::ModuleRenderer;

    bool render(const Rect &rect, const WeatherPayload &weather, const ContextSnapshot &context) override;

private:
    void drawDirectionArrow(int centerX, int centerY, int radius, float degrees);
};

void registerBuiltinRenderers(RendererRegistry &registry);

// Draw functions for the modules that have no dedicated renderer:
// main_weather, barometer_module, tomorrow_forecast, clock_module and
// status_module. Empty for anything else.
RenderFunction legacyRenderFunction(const std::string &moduleId);

} // namespace inkweather

#endif // INKWEATHER_MODULE_RENDERERS_H
