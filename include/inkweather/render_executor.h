#ifndef INKWEATHER_RENDER_EXECUTOR_H
#define INKWEATHER_RENDER_EXECUTOR_H

#include <functional>
#include <map>
#include <string>
#include <vector>

#include "inkweather/context.h"
#include "inkweather/layout.h"
#include "inkweather/renderer.h"
#include "inkweather/renderer_registry.h"
#include "inkweather/surface.h"
#include "inkweather/weather.h"

namespace inkweather
{

struct RenderSummary
{
    std::vector<std::string> rendered;
    std::vector<std::string> failed;
    std::vector<std::string> skipped;
};

// Returns the draw function for a module without a dedicated renderer, or an
// empty function when there is none.
using LegacyLookup = std::function<RenderFunction(const std::string &moduleId)>;

class RenderExecutor
{
public:
    RenderExecutor(Surface &surface, RendererRegistry &registry, const std::map<std::string, ModulePlacement> &placements,
                   LegacyLookup legacyLookup);

    // Clears the surface and draws every active module in order.
    RenderSummary compose(const LayoutState &layout, const WeatherPayload &weather, const ContextSnapshot &context);

    // Centered single message on a blank surface.
    void drawStatusMessage(const std::string &message);

private:
    void drawFrame(const ModulePlacement &placement);
    void drawFallback(const Rect &rect, const std::string &moduleId, const std::string &message);

    Surface &surface_;
    RendererRegistry &registry_;
    const std::map<std::string, ModulePlacement> &placements_;
    LegacyLookup legacyLookup_;
};

} // namespace inkweather

#endif // INKWEATHER_RENDER_EXECUTOR_H
