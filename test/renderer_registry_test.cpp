#include <gtest/gtest.h>

#include <cmath>
#include <memory>
#include <string>
#include <vector>

#include "fakes.h"
#include "inkweather/module_renderers.h"
#include "inkweather/renderer_registry.h"

using namespace inkweather;

namespace
{

RendererFactory recordingFactory(bool result, std::vector<Rect> &calls, int &created)
{
    return [result, &calls, &created](Surface &surface) {
        ++created;
        return std::unique_ptr<ModuleRenderer>(new fakes::RecordingRenderer(surface, result, calls));
    };
}

} // namespace

TEST(RendererRegistryTest, DedicatedRendererIsCreatedOnceAndCached)
{
    fakes::FakeSurface surface;
    RendererRegistry registry(surface);
    std::vector<Rect> calls;
    int created = 0;
    registry.registerRenderer("radar_module", recordingFactory(true, calls, created));

    ModuleRenderer &first = registry.createRenderer("radar_module");
    ModuleRenderer &second = registry.createRenderer("radar_module");

    EXPECT_EQ(&first, &second);
    EXPECT_EQ(created, 1);
    EXPECT_EQ(first.kind(), RendererKind::Dedicated);
    EXPECT_TRUE(registry.hasDedicatedRenderer("radar_module"));
    EXPECT_EQ(registry.cachedCount(), 1U);
}

TEST(RendererRegistryTest, DedicatedRendererWinsOverLegacyFunction)
{
    fakes::FakeSurface surface;
    RendererRegistry registry(surface);
    std::vector<Rect> calls;
    int created = 0;
    registry.registerRenderer("radar_module", recordingFactory(true, calls, created));

    bool legacyCalled = false;
    RenderFunction legacy = [&legacyCalled](Surface &, const Rect &, const WeatherPayload &, const ContextSnapshot &) {
        legacyCalled = true;
        return true;
    };

    ModuleRenderer &renderer = registry.createRenderer("radar_module", legacy);
    EXPECT_TRUE(renderer.render(Rect{0, 0, 100, 100}, WeatherPayload(), ContextSnapshot()));
    EXPECT_FALSE(legacyCalled);
    EXPECT_EQ(calls.size(), 1U);
}

TEST(RendererRegistryTest, LegacyFunctionIsWrapped)
{
    fakes::FakeSurface surface;
    RendererRegistry registry(surface);
    Rect received;
    RenderFunction legacy = [&received](Surface &target, const Rect &rect, const WeatherPayload &,
                                        const ContextSnapshot &) {
        received = rect;
        target.drawText("legacy", rect.x, rect.y, FontRole::Body);
        return true;
    };

    ModuleRenderer &renderer = registry.createRenderer("clock_module", legacy);

    EXPECT_EQ(renderer.kind(), RendererKind::LegacyAdapter);
    EXPECT_TRUE(renderer.render(Rect{10, 20, 200, 100}, WeatherPayload(), ContextSnapshot()));
    EXPECT_EQ(received.x, 10);
    EXPECT_EQ(received.height, 100);
    EXPECT_TRUE(surface.hasText("legacy"));
}

TEST(RendererRegistryTest, UnknownModuleGetsFailingPlaceholder)
{
    fakes::FakeSurface surface;
    RendererRegistry registry(surface);

    ModuleRenderer &renderer = registry.createRenderer("does_not_exist");

    EXPECT_EQ(renderer.kind(), RendererKind::Placeholder);
    EXPECT_FALSE(renderer.render(Rect{0, 0, 100, 100}, WeatherPayload(), ContextSnapshot()));
    EXPECT_FALSE(registry.hasDedicatedRenderer("does_not_exist"));
}

TEST(RendererRegistryTest, FactoryReturningNothingFallsBack)
{
    fakes::FakeSurface surface;
    RendererRegistry registry(surface);
    registry.registerRenderer("broken", [](Surface &) { return std::unique_ptr<ModuleRenderer>(); });

    EXPECT_EQ(registry.createRenderer("broken").kind(), RendererKind::Placeholder);
}

TEST(RendererRegistryTest, RegisteringReplacesCachedInstance)
{
    fakes::FakeSurface surface;
    RendererRegistry registry(surface);
    std::vector<Rect> calls;
    int created = 0;

    EXPECT_EQ(registry.createRenderer("radar_module").kind(), RendererKind::Placeholder);
    registry.registerRenderer("radar_module", recordingFactory(true, calls, created));

    EXPECT_EQ(registry.createRenderer("radar_module").kind(), RendererKind::Dedicated);
    EXPECT_EQ(created, 1);
}

TEST(RendererRegistryTest, ClearCacheReleasesRenderers)
{
    fakes::FakeSurface surface;
    RendererRegistry registry(surface);
    std::vector<Rect> calls;
    int created = 0;
    registry.registerRenderer("radar_module", recordingFactory(true, calls, created));
    registry.createRenderer("radar_module");
    registry.createRenderer("other_module");
    EXPECT_EQ(registry.cachedCount(), 2U);

    registry.clearCache();
    EXPECT_EQ(registry.cachedCount(), 0U);

    registry.createRenderer("radar_module");
    EXPECT_EQ(created, 2);
}

TEST(RendererRegistryTest, BuiltinsRegisterDedicatedRenderers)
{
    fakes::FakeSurface surface;
    RendererRegistry registry(surface);
    registerBuiltinRenderers(registry);

    EXPECT_TRUE(registry.hasDedicatedRenderer(PRECIPITATION_MODULE));
    EXPECT_TRUE(registry.hasDedicatedRenderer(WIND_MODULE));
    EXPECT_FALSE(registry.hasDedicatedRenderer("main_weather"));
    EXPECT_TRUE(static_cast<bool>(legacyRenderFunction("main_weather")));
    EXPECT_TRUE(static_cast<bool>(legacyRenderFunction("status_module")));
    EXPECT_FALSE(static_cast<bool>(legacyRenderFunction("precipitation_module")));
}

TEST(ModuleRendererTest, PrecipitationHeadlines)
{
    std::string headline;
    std::string detail;

    PrecipitationRenderer::describe(1.2F, 0.0F, "", headline, detail);
    EXPECT_EQ(headline, "RAINING NOW");
    EXPECT_EQ(detail, "Moderate intensity");

    PrecipitationRenderer::describe(0.0F, 0.3F, "14:00", headline, detail);
    EXPECT_EQ(headline, "RAIN EXPECTED");
    EXPECT_EQ(detail, "Drizzle - starts 14:00");

    PrecipitationRenderer::describe(0.0F, 0.6F, "", headline, detail);
    EXPECT_EQ(detail, "Light - starts soon");

    PrecipitationRenderer::describe(0.0F, 0.0F, "", headline, detail);
    EXPECT_EQ(headline, "PRECIPITATION");
}

TEST(ModuleRendererTest, PrecipitationRendererDrawsInsideRect)
{
    fakes::FakeSurface surface;
    PrecipitationRenderer renderer(surface);
    ContextSnapshot context(fakes::NEW_YEAR_NOON, 0);
    context.set("precipitation", SignalValue::fromNumber(3.0));
    const Rect rect{484, 4, 472, 292};

    ASSERT_TRUE(renderer.render(rect, fakes::sampleWeather(), context));
    EXPECT_TRUE(surface.hasText("RAINING NOW"));
    EXPECT_TRUE(surface.hasText("Heavy intensity"));
    EXPECT_TRUE(surface.opsOutside(rect).empty());

    EXPECT_FALSE(renderer.render(Rect{0, 0, 400, 40}, fakes::sampleWeather(), context));
}

TEST(ModuleRendererTest, WindRendererNeedsSpeed)
{
    fakes::FakeSurface surface;
    WindRenderer renderer(surface);
    WeatherPayload weather = fakes::sampleWeather();
    weather.windSpeed = 9.0F;
    const Rect rect{4, 304, 472, 232};

    ASSERT_TRUE(renderer.render(rect, weather, ContextSnapshot()));
    EXPECT_TRUE(surface.hasText("9.0 m/s"));
    EXPECT_TRUE(surface.hasText("Fresh breeze"));
    EXPECT_TRUE(surface.hasText("SW"));

    weather.windSpeed = NAN;
    EXPECT_FALSE(renderer.render(rect, weather, ContextSnapshot()));
}
