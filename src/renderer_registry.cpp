#include "inkweather/renderer_registry.h"

#include <utility>

#include "inkweather/log.h"

namespace inkweather
{
namespace
{
constexpr char TAG[] = "Registry";
} // namespace

RendererRegistry::RendererRegistry(Surface &surface) : surface_(surface)
{
}

void RendererRegistry::registerRenderer(const std::string &moduleId, RendererFactory factory)
{
    factories_[moduleId] = std::move(factory);
    cache_.erase(moduleId);
}

bool RendererRegistry::hasDedicatedRenderer(const std::string &moduleId) const
{
    const auto it = factories_.find(moduleId);
    return it != factories_.end() && it->second;
}

ModuleRenderer &RendererRegistry::createRenderer(const std::string &moduleId, const RenderFunction &legacyFallback)
{
    const auto cached = cache_.find(moduleId);
    if (cached != cache_.end())
    {
        return *cached->second;
    }

    std::unique_ptr<ModuleRenderer> renderer = build(moduleId, legacyFallback);
    INKWEATHER_LOGD(TAG, "Created %s renderer for '%s'.", toString(renderer->kind()), moduleId.c_str());

    ModuleRenderer &result = *renderer;
    cache_[moduleId] = std::move(renderer);
    return result;
}

std::unique_ptr<ModuleRenderer> RendererRegistry::build(const std::string &moduleId,
                                                        const RenderFunction &legacyFallback)
{
    const auto factory = factories_.find(moduleId);
    if (factory != factories_.end() && factory->second)
    {
        std::unique_ptr<ModuleRenderer> renderer = factory->second(surface_);
        if (renderer)
        {
            return renderer;
        }
        INKWEATHER_LOGW(TAG, "Factory for '%s' returned nothing.", moduleId.c_str());
    }

    if (legacyFallback)
    {
        return std::unique_ptr<ModuleRenderer>(new LegacyRenderAdapter(surface_, legacyFallback));
    }
    return std::unique_ptr<ModuleRenderer>(new PlaceholderRenderer(surface_, moduleId));
}

void RendererRegistry::clearCache()
{
    INKWEATHER_LOGD(TAG, "Releasing %u cached renderer(s).", static_cast<unsigned>(cache_.size()));
    cache_.clear();
}

} // namespace inkweather
