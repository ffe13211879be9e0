#ifndef INKWEATHER_RENDERER_REGISTRY_H
#define INKWEATHER_RENDERER_REGISTRY_H

#include <cstddef>
#include <map>
#include <memory>
#include <string>

#include "inkweather/renderer.h"

namespace inkweather
{

// Module id -> renderer, created on first use and cached until clearCache().
class RendererRegistry
{
public:
    explicit RendererRegistry(Surface &surface);

    // Replaces any factory for moduleId and drops its cached instance.
    void registerRenderer(const std::string &moduleId, RendererFactory factory);
    bool hasDedicatedRenderer(const std::string &moduleId) const;

    // Dedicated factory first, then the legacy function, then a placeholder.
    ModuleRenderer &createRenderer(const std::string &moduleId, const RenderFunction &legacyFallback = RenderFunction());

    void clearCache();
    size_t cachedCount() const { return cache_.size(); }

private:
    std::unique_ptr<ModuleRenderer> build(const std::string &moduleId, const RenderFunction &legacyFallback);

    Surface &surface_;
    std::map<std::string, RendererFactory> factories_;
    std::map<std::string, std::unique_ptr<ModuleRenderer>> cache_;
};

} // namespace inkweather

#endif // INKWEATHER_RENDERER_REGISTRY_H
