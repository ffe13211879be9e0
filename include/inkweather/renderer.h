#ifndef INKWEATHER_RENDERER_H
#define INKWEATHER_RENDERER_H

#include <functional>
#include <memory>
#include <string>

#include "inkweather/context.h"
#include "inkweather/surface.h"
#include "inkweather/weather.h"

namespace inkweather
{

enum class FrameStyle
{
    Box,
    Open,
    None
};

bool parseFrameStyle(const std::string &text, FrameStyle &style);

struct ModulePlacement
{
    Rect rect;
    FrameStyle frame{FrameStyle::Box};
};

enum class RendererKind
{
    Dedicated,
    LegacyAdapter,
    Placeholder
};

const char *toString(RendererKind kind);

class ModuleRenderer
{
public:
    explicit ModuleRenderer(Surface &surface) : surface_(surface) {}
    virtual ~ModuleRenderer() = default;

    ModuleRenderer(const ModuleRenderer &) = delete;
    ModuleRenderer &operator=(const ModuleRenderer &) = delete;

    // Draws inside rect. Returns false when the module could not be drawn.
    virtual bool render(const Rect &rect, const WeatherPayload &weather, const ContextSnapshot &context) = 0;
    virtual RendererKind kind() const { return RendererKind::Dedicated; }

protected:
    Surface &surface_;
};

using RenderFunction =
    std::function<bool(Surface &surface, const Rect &rect, const WeatherPayload &weather, const ContextSnapshot &context)>;
using RendererFactory = std::function<std::unique_ptr<ModuleRenderer>(Surface &surface)>;

// Wraps a plain draw function for modules without a dedicated renderer.
class LegacyRenderAdapter : public ModuleRenderer
{
public:
    LegacyRenderAdapter(Surface &surface, RenderFunction function);

    bool render(const Rect &rect, const WeatherPayload &weather, const ContextSnapshot &context) override;
    RendererKind kind() const override { return RendererKind::LegacyAdapter; }

private:
    RenderFunction function_;
};

// Stands in for an unknown module; always reports failure so the executor
// draws a visible fallback block.
class PlaceholderRenderer : public ModuleRenderer
{
public:
    PlaceholderRenderer(Surface &surface, const std::string &moduleId);

    bool render(const Rect &rect, const WeatherPayload &weather, const ContextSnapshot &context) override;
    RendererKind kind() const override { return RendererKind::Placeholder; }

private:
    std::string moduleId_;
};

} // namespace inkweather

#endif // INKWEATHER_RENDERER_H
