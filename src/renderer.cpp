#include "inkweather/renderer.h"

#include <utility>

#include "inkweather/log.h"

namespace inkweather
{
namespace
{
constexpr char TAG[] = "Render";
} // namespace

bool parseFrameStyle(const std::string &text, FrameStyle &style)
{
    if (text == "box")
    {
        style = FrameStyle::Box;
    }
    else if (text == "open")
    {
        style = FrameStyle::Open;
    }
    else if (text == "none")
    {
        style = FrameStyle::None;
    }
    else
    {
        return false;
    }
    return true;
}

const char *toString(RendererKind kind)
{
    switch (kind)
    {
    case RendererKind::Dedicated:
        return "dedicated";
    case RendererKind::LegacyAdapter:
        return "legacy";
    case RendererKind::Placeholder:
        return "placeholder";
    }
    return "unknown";
}

LegacyRenderAdapter::LegacyRenderAdapter(Surface &surface, RenderFunction function)
    : ModuleRenderer(surface), function_(std::move(function))
{
}

bool LegacyRenderAdapter::render(const Rect &rect, const WeatherPayload &weather, const ContextSnapshot &context)
{
    if (!function_)
    {
        return false;
    }
    return function_(surface_, rect, weather, context);
}

PlaceholderRenderer::PlaceholderRenderer(Surface &surface, const std::string &moduleId)
    : ModuleRenderer(surface), moduleId_(moduleId)
{
}

bool PlaceholderRenderer::render(const Rect &, const WeatherPayload &, const ContextSnapshot &)
{
    INKWEATHER_LOGW(TAG, "No renderer available for '%s'.", moduleId_.c_str());
    return false;
}

} // namespace inkweather
