#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

#include "fakes.h"
#include "inkweather/layout.h"
#include "inkweather/log.h"

using namespace inkweather;

namespace
{

LayoutSection makeSection(const std::string &name, const std::vector<ModuleGroup> &groups)
{
    LayoutSection section;
    section.name = name;
    section.groups = groups;
    return section;
}

TriggerDefinition makeTrigger(const std::string &name, const std::string &condition, const std::string &section,
                              const std::string &group, int priority, size_t index)
{
    TriggerDefinition trigger;
    trigger.name = name;
    trigger.condition = condition;
    trigger.targetSection = section;
    trigger.activateGroup = group;
    trigger.priority = priority;
    trigger.declarationIndex = index;
    return trigger;
}

LayoutConfig dashboardLayout()
{
    LayoutConfig config;
    config.sections.push_back(makeSection("top", {ModuleGroup{"normal", {"main_weather"}}}));
    config.sections.push_back(makeSection("bottom", {ModuleGroup{"normal", {"barometer_module", "tomorrow_forecast"}},
                                                     ModuleGroup{"precipitation_active", {"precipitation_module"}},
                                                     ModuleGroup{"windy", {"wind_module"}}}));
    config.triggers.push_back(makeTrigger("rain", "precipitation > 0 OR forecast_precipitation_2h > 0.2", "bottom",
                                          "precipitation_active", 90, 0));
    config.legacyModules = {"main_weather", "clock_module"};
    return config;
}

ContextSnapshot context(double precipitation, double forecast2h, double windSpeed = 0.0)
{
    ContextSnapshot snapshot(fakes::NEW_YEAR_NOON, 0);
    snapshot.set("precipitation", SignalValue::fromNumber(precipitation));
    snapshot.set("forecast_precipitation_2h", SignalValue::fromNumber(forecast2h));
    snapshot.set("wind_speed", SignalValue::fromNumber(windSpeed));
    return snapshot;
}

int warningLines = 0;

void countWarnings(LogLevel level, const char *)
{
    if (level == LogLevel::Warning)
    {
        ++warningLines;
    }
}

} // namespace

TEST(LayoutResolverTest, DefaultGroupsWhenNoTriggerFires)
{
    ConditionEvaluator evaluator;
    const LayoutResolver resolver(dashboardLayout(), evaluator);

    const LayoutState state = resolver.resolve(context(0.0, 0.0));

    EXPECT_FALSE(state.legacy);
    EXPECT_EQ(state.activeGroups.at("top"), "normal");
    EXPECT_EQ(state.activeGroups.at("bottom"), "normal");
    EXPECT_EQ(state.activeModules, (std::vector<std::string>{"main_weather", "barometer_module", "tomorrow_forecast"}));
    EXPECT_EQ(state.evaluatedAt, fakes::NEW_YEAR_NOON);
}

TEST(LayoutResolverTest, ForecastAboveThresholdActivatesPrecipitationGroup)
{
    ConditionEvaluator evaluator;
    const LayoutResolver resolver(dashboardLayout(), evaluator);

    const LayoutState wet = resolver.resolve(context(0.0, 0.3));
    EXPECT_EQ(wet.activeGroups.at("bottom"), "precipitation_active");
    EXPECT_EQ(wet.activeModules, (std::vector<std::string>{"main_weather", "precipitation_module"}));

    const LayoutState dry = resolver.resolve(context(0.0, 0.1));
    EXPECT_EQ(dry.activeGroups.at("bottom"), "normal");
}

TEST(LayoutResolverTest, HigherPriorityWinsRegardlessOfDeclarationOrder)
{
    ConditionEvaluator evaluator;
    const ContextSnapshot stormy = context(2.0, 0.0, 15.0);

    LayoutConfig windFirst = dashboardLayout();
    windFirst.triggers.clear();
    windFirst.triggers.push_back(makeTrigger("wind", "wind_speed > 10", "bottom", "windy", 60, 0));
    windFirst.triggers.push_back(
        makeTrigger("rain", "precipitation > 0", "bottom", "precipitation_active", 90, 1));

    LayoutConfig rainFirst = dashboardLayout();
    rainFirst.triggers.clear();
    rainFirst.triggers.push_back(
        makeTrigger("rain", "precipitation > 0", "bottom", "precipitation_active", 90, 0));
    rainFirst.triggers.push_back(makeTrigger("wind", "wind_speed > 10", "bottom", "windy", 60, 1));

    const LayoutResolver first(windFirst, evaluator);
    const LayoutResolver second(rainFirst, evaluator);

    EXPECT_EQ(first.resolve(stormy).activeGroups.at("bottom"), "precipitation_active");
    EXPECT_EQ(second.resolve(stormy).activeGroups.at("bottom"), "precipitation_active");
    EXPECT_EQ(first.triggers().front().name, "rain");
}

TEST(LayoutResolverTest, EqualPriorityKeepsDeclarationOrder)
{
    ConditionEvaluator evaluator;
    LayoutConfig config = dashboardLayout();
    config.triggers.clear();
    config.triggers.push_back(makeTrigger("wind", "wind_speed > 10", "bottom", "windy", 50, 0));
    config.triggers.push_back(makeTrigger("rain", "precipitation > 0", "bottom", "precipitation_active", 50, 1));

    const LayoutResolver resolver(config, evaluator);

    EXPECT_EQ(resolver.resolve(context(2.0, 0.0, 15.0)).activeGroups.at("bottom"), "windy");
}

TEST(LayoutResolverTest, LowerPriorityTriggerStillFiresWhenHigherIsFalse)
{
    ConditionEvaluator evaluator;
    LayoutConfig config = dashboardLayout();
    config.triggers.push_back(makeTrigger("wind", "wind_speed > 10", "bottom", "windy", 10, 1));

    const LayoutResolver resolver(config, evaluator);

    EXPECT_EQ(resolver.resolve(context(0.0, 0.0, 15.0)).activeGroups.at("bottom"), "windy");
}

TEST(LayoutResolverTest, ResolvingTwiceIsIdempotent)
{
    ConditionEvaluator evaluator;
    const LayoutResolver resolver(dashboardLayout(), evaluator);
    const ContextSnapshot snapshot = context(0.0, 0.3);

    const LayoutState first = resolver.resolve(snapshot);
    const LayoutState second = resolver.resolve(snapshot);

    EXPECT_TRUE(first == second);
    EXPECT_EQ(first.activeModules, second.activeModules);
    EXPECT_EQ(first.activeGroups, second.activeGroups);
}

TEST(LayoutResolverTest, DropsTriggersWithUnknownTargets)
{
    ConditionEvaluator evaluator;
    LayoutConfig config = dashboardLayout();
    config.triggers.push_back(makeTrigger("ghost_section", "precipitation > 0", "sidebar", "normal", 99, 1));
    config.triggers.push_back(makeTrigger("ghost_group", "precipitation > 0", "bottom", "snow", 99, 2));
    config.triggers.push_back(makeTrigger("no_condition", "", "bottom", "windy", 99, 3));

    const LayoutResolver resolver(config, evaluator);

    ASSERT_EQ(resolver.triggers().size(), 1U);
    EXPECT_EQ(resolver.triggers().front().name, "rain");
    EXPECT_EQ(resolver.resolve(context(1.0, 0.0)).activeGroups.at("bottom"), "precipitation_active");
}

TEST(LayoutResolverTest, MalformedConditionNeverFires)
{
    ConditionEvaluator evaluator;
    LayoutConfig config = dashboardLayout();
    config.triggers.clear();
    config.triggers.push_back(makeTrigger("broken", "precipitation >> 0", "bottom", "precipitation_active", 90, 0));

    const LayoutResolver resolver(config, evaluator);

    EXPECT_EQ(resolver.triggers().size(), 1U);
    EXPECT_EQ(resolver.resolve(context(5.0, 5.0)).activeGroups.at("bottom"), "normal");
}

TEST(LayoutResolverTest, FirstGroupIsDefaultWithoutNormal)
{
    ConditionEvaluator evaluator;
    LayoutConfig config;
    config.sections.push_back(
        makeSection("side", {ModuleGroup{"summary", {"clock_module"}}, ModuleGroup{"detail", {"wind_module"}}}));

    const LayoutResolver resolver(config, evaluator);
    const LayoutState state = resolver.resolve(context(0.0, 0.0));

    EXPECT_EQ(state.activeGroups.at("side"), "summary");
    EXPECT_EQ(state.activeModules, (std::vector<std::string>{"clock_module"}));
}

TEST(LayoutResolverTest, LegacyListWithoutGroupsOrTriggers)
{
    ConditionEvaluator evaluator;
    LayoutConfig config;
    config.legacyModules = {"main_weather", "clock_module"};

    const LayoutResolver resolver(config, evaluator);
    const LayoutState state = resolver.resolve(context(1.0, 0.0));

    EXPECT_TRUE(state.legacy);
    EXPECT_TRUE(state.activeGroups.empty());
    EXPECT_EQ(state.activeModules, config.legacyModules);
}

TEST(LayoutResolverTest, EmptyGroupsFallBackToLegacyList)
{
    ConditionEvaluator evaluator;
    LayoutConfig config;
    config.sections.push_back(makeSection("top", {ModuleGroup{"normal", {}}}));
    config.sections.push_back(makeSection("empty", {}));
    config.legacyModules = {"main_weather"};

    const LayoutResolver resolver(config, evaluator);
    EXPECT_EQ(resolver.sections().size(), 1U);

    const LayoutState state = resolver.resolve(context(0.0, 0.0));
    EXPECT_TRUE(state.legacy);
    EXPECT_EQ(state.activeModules, (std::vector<std::string>{"main_weather"}));
}

TEST(LayoutStateTest, EqualityIgnoresEvaluationTime)
{
    LayoutState a;
    a.activeGroups["bottom"] = "normal";
    a.activeModules = {"barometer_module"};
    a.evaluatedAt = 100;

    LayoutState b = a;
    b.evaluatedAt = 200;
    EXPECT_TRUE(a == b);

    b.activeModules.push_back("clock_module");
    EXPECT_TRUE(a != b);
}

TEST(LayoutStateTest, DescribesGroupAndModuleChanges)
{
    ConditionEvaluator evaluator;
    const LayoutResolver resolver(dashboardLayout(), evaluator);
    const LayoutState dry = resolver.resolve(context(0.0, 0.0));
    const LayoutState wet = resolver.resolve(context(0.5, 0.0));

    EXPECT_EQ(describeLayoutChange(dry, wet),
              "bottom: normal -> precipitation_active, +precipitation_module, -barometer_module, -tomorrow_forecast");

    LayoutState reordered = dry;
    std::reverse(reordered.activeModules.begin(), reordered.activeModules.end());
    EXPECT_EQ(describeLayoutChange(dry, reordered), "module order: tomorrow_forecast, barometer_module, main_weather");
}

TEST(LayoutResolverTest, MalformedConditionIsReportedOnceAtLoad)
{
    ConditionEvaluator evaluator;
    LayoutConfig config = dashboardLayout();
    config.triggers.push_back(makeTrigger("broken", "wind_speed >> 3", "top", "normal", 10, 1));

    warningLines = 0;
    setLogSink(countWarnings);
    const LayoutResolver resolver(config, evaluator);
    const int atLoad = warningLines;

    warningLines = 0;
    for (int cycle = 0; cycle < 3; ++cycle)
    {
        resolver.resolve(context(0.0, 0.0));
    }
    const int afterCycles = warningLines;
    setLogSink(nullptr);

    EXPECT_EQ(atLoad, 1);
    EXPECT_EQ(afterCycles, 0);
    EXPECT_EQ(resolver.resolve(context(1.0, 0.0)).activeGroups.at("bottom"), "precipitation_active");
}
