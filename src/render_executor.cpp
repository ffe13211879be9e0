#include "inkweather/render_executor.h"

#include <algorithm>
#include <exception>
#include <utility>

#include "inkweather/log.h"
#include "inkweather/text_layout.h"

namespace inkweather
{
namespace
{
constexpr char TAG[] = "Render";
constexpr int FRAME_INSET = 4;
constexpr int FALLBACK_PADDING = 6;
constexpr int WARNING_GLYPH_MAX = 36;
} // namespace

RenderExecutor::RenderExecutor(Surface &surface, RendererRegistry &registry,
                               const std::map<std::string, ModulePlacement> &placements, LegacyLookup legacyLookup)
    : surface_(surface), registry_(registry), placements_(placements), legacyLookup_(std::move(legacyLookup))
{
}

RenderSummary RenderExecutor::compose(const LayoutState &layout, const WeatherPayload &weather,
                                      const ContextSnapshot &context)
{
    RenderSummary summary;
    surface_.clear();
    const Rect bounds{0, 0, surface_.width(), surface_.height()};

    for (const std::string &moduleId : layout.activeModules)
    {
        const auto placement = placements_.find(moduleId);
        if (placement == placements_.end())
        {
            INKWEATHER_LOGW(TAG, "No placement for module '%s'; skipped.", moduleId.c_str());
            summary.skipped.push_back(moduleId);
            continue;
        }
        const Rect &rect = placement->second.rect;
        if (rect.empty() || !bounds.contains(rect))
        {
            INKWEATHER_LOGW(TAG, "Module '%s' at %d,%d %dx%d is outside the panel; skipped.", moduleId.c_str(), rect.x,
                            rect.y, rect.width, rect.height);
            summary.skipped.push_back(moduleId);
            continue;
        }

        drawFrame(placement->second);
        const Rect content = placement->second.frame == FrameStyle::None ? rect : rect.inset(FRAME_INSET);

        bool ok = false;
        std::string failure = "Not available";
        try
        {
            RenderFunction legacy = legacyLookup_ ? legacyLookup_(moduleId) : RenderFunction();
            ModuleRenderer &renderer = registry_.createRenderer(moduleId, legacy);
            ok = renderer.render(content, weather, context);
            if (!ok && renderer.kind() == RendererKind::Placeholder)
            {
                failure = "Unknown module";
            }
        }
        catch (const std::exception &e)
        {
            INKWEATHER_LOGE(TAG, "Module '%s' threw: %s", moduleId.c_str(), e.what());
            failure = "Render error";
            ok = false;
        }
        catch (...)
        {
            // Injected legacy callbacks may throw anything.
            INKWEATHER_LOGE(TAG, "Module '%s' threw a non-standard exception", moduleId.c_str());
            failure = "Render error";
            ok = false;
        }

        if (ok)
        {
            summary.rendered.push_back(moduleId);
        }
        else
        {
            INKWEATHER_LOGW(TAG, "Module '%s' failed; drawing fallback.", moduleId.c_str());
            drawFallback(rect, moduleId, failure);
            summary.failed.push_back(moduleId);
        }
    }

    INKWEATHER_LOGD(TAG, "Composed frame: %u rendered, %u failed, %u skipped",
                    static_cast<unsigned>(summary.rendered.size()), static_cast<unsigned>(summary.failed.size()),
                    static_cast<unsigned>(summary.skipped.size()));
    return summary;
}

void RenderExecutor::drawFrame(const ModulePlacement &placement)
{
    const Rect &rect = placement.rect;
    switch (placement.frame)
    {
    case FrameStyle::Box:
        surface_.drawRect(rect, COLOR_BLACK);
        surface_.drawRect(rect.inset(2), COLOR_BLACK);
        break;
    case FrameStyle::Open:
        surface_.drawRect(rect, COLOR_BLACK);
        surface_.drawRect(rect.inset(3), COLOR_GREY);
        break;
    case FrameStyle::None:
        break;
    }
}

void RenderExecutor::drawFallback(const Rect &rect, const std::string &moduleId, const std::string &message)
{
    // Whatever the renderer drew before failing is wiped, but only inside its own rectangle.
    const Rect inner = rect.inset(FRAME_INSET);
    if (inner.empty())
    {
        surface_.fillRect(rect, COLOR_GREY);
        return;
    }
    surface_.fillRect(inner, COLOR_WHITE);
    surface_.drawRect(inner, COLOR_BLACK);

    const Rect area = inner.inset(FALLBACK_PADDING);
    if (area.empty())
    {
        surface_.fillRect(inner, COLOR_GREY);
        return;
    }

    int textX = area.x;
    const int glyph = std::min(WARNING_GLYPH_MAX, std::min(area.width / 3, area.height));
    if (glyph >= 12)
    {
        const int top = area.y;
        const int base = area.y + glyph - 1;
        const int left = area.x;
        const int apex = area.x + glyph / 2;
        const int right = area.x + glyph - 1;
        surface_.drawLine(left, base, apex, top, COLOR_BLACK);
        surface_.drawLine(apex, top, right, base, COLOR_BLACK);
        surface_.drawLine(left, base, right, base, COLOR_BLACK);
        const int markWidth = surface_.measureText("!", FontRole::Small);
        surface_.drawText("!", apex - markWidth / 2, top + glyph / 3, FontRole::Small);
        textX = area.x + glyph + FALLBACK_PADDING;
    }

    const int textWidth = area.right() - textX;
    const int lineHeight = surface_.fontHeight(FontRole::Small);
    if (textWidth <= 0 || lineHeight > area.height)
    {
        return;
    }
    surface_.drawText(fitText(surface_, message, FontRole::Small, textWidth), textX, area.y, FontRole::Small);
    if (2 * lineHeight + 2 <= area.height)
    {
        surface_.drawText(fitText(surface_, moduleId, FontRole::Small, textWidth), textX, area.y + lineHeight + 2,
                          FontRole::Small, COLOR_GREY);
    }
}

void RenderExecutor::drawStatusMessage(const std::string &message)
{
    surface_.clear();
    const int maxWidth = surface_.width() - 60;
    const std::vector<std::string> lines = wrapText(surface_, message, FontRole::Heading, maxWidth, 3);
    const int lineHeight = surface_.fontHeight(FontRole::Heading) + 8;
    int y = (surface_.height() - static_cast<int>(lines.size()) * lineHeight) / 2;
    for (const std::string &line : lines)
    {
        const int width = surface_.measureText(line, FontRole::Heading);
        surface_.drawText(line, (surface_.width() - width) / 2, y, FontRole::Heading);
        y += lineHeight;
    }
}

} // namespace inkweather
