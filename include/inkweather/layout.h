#ifndef INKWEATHER_LAYOUT_H
#define INKWEATHER_LAYOUT_H

#include <cstddef>
#include <ctime>
#include <map>
#include <string>
#include <vector>

#include "inkweather/condition.h"
#include "inkweather/context.h"

namespace inkweather
{

constexpr char DEFAULT_GROUP_NAME[] = "normal";
constexpr int DEFAULT_TRIGGER_PRIORITY = 50;

struct TriggerDefinition
{
    std::string name;
    std::string condition;
    std::string targetSection;
    std::string activateGroup;
    int priority{DEFAULT_TRIGGER_PRIORITY};
    size_t declarationIndex{0};
};

struct ModuleGroup
{
    std::string name;
    std::vector<std::string> modules;
};

struct LayoutSection
{
    std::string name;
    std::vector<ModuleGroup> groups;

    const ModuleGroup *findGroup(const std::string &groupName) const;
    // "normal" when declared, else the first group.
    const ModuleGroup *defaultGroup() const;
};

struct LayoutConfig
{
    std::vector<LayoutSection> sections;
    std::vector<TriggerDefinition> triggers;
    // Enabled entries of "modules", in declaration order.
    std::vector<std::string> legacyModules;
};

struct LayoutState
{
    std::map<std::string, std::string> activeGroups;
    std::vector<std::string> activeModules;
    time_t evaluatedAt{};
    bool legacy{false};
};

// Structural equality; evaluatedAt is ignored.
bool operator==(const LayoutState &lhs, const LayoutState &rhs);
bool operator!=(const LayoutState &lhs, const LayoutState &rhs);

// Human readable difference, e.g. "bottom: normal -> precipitation_active".
std::string describeLayoutChange(const LayoutState &previous, const LayoutState &current);

class LayoutResolver
{
public:
    // Invalid triggers and empty sections are dropped here with a warning.
    LayoutResolver(const LayoutConfig &config, const ConditionEvaluator &evaluator);
    virtual ~LayoutResolver() = default;

    virtual LayoutState resolve(const ContextSnapshot &context) const;
    LayoutState legacyLayout(time_t evaluatedAt) const;

    // Triggers that survived validation, highest priority first.
    const std::vector<TriggerDefinition> &triggers() const { return triggers_; }
    const std::vector<LayoutSection> &sections() const { return sections_; }

private:
    bool acceptTrigger(const TriggerDefinition &trigger) const;
    const LayoutSection *findSection(const std::string &name) const;
    bool triggerFires(size_t index, const ContextSnapshot &context) const;

    const ConditionEvaluator &evaluator_;
    std::vector<LayoutSection> sections_;
    std::vector<TriggerDefinition> triggers_;
    // Parallel to triggers_; empty when the condition did not parse.
    std::vector<ParsedCondition> conditions_;
    std::vector<std::string> legacyModules_;
};

} // namespace inkweather

#endif // INKWEATHER_LAYOUT_H
