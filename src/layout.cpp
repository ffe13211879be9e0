#include "inkweather/layout.h"

#include <algorithm>
#include <exception>
#include <set>

#include "inkweather/log.h"

namespace inkweather
{
namespace
{
constexpr char TAG[] = "Layout";

bool contains(const std::vector<std::string> &items, const std::string &item)
{
    return std::find(items.begin(), items.end(), item) != items.end();
}

void appendPart(std::string &out, const std::string &part)
{
    if (!out.empty())
    {
        out += ", ";
    }
    out += part;
}

std::string joinModules(const std::vector<std::string> &modules)
{
    std::string out;
    for (const std::string &module : modules)
    {
        appendPart(out, module);
    }
    return out;
}
} // namespace

const ModuleGroup *LayoutSection::findGroup(const std::string &groupName) const
{
    for (const ModuleGroup &group : groups)
    {
        if (group.name == groupName)
        {
            return &group;
        }
    }
    return nullptr;
}

const ModuleGroup *LayoutSection::defaultGroup() const
{
    const ModuleGroup *normal = findGroup(DEFAULT_GROUP_NAME);
    if (normal != nullptr)
    {
        return normal;
    }
    return groups.empty() ? nullptr : &groups.front();
}

bool operator==(const LayoutState &lhs, const LayoutState &rhs)
{
    return lhs.activeGroups == rhs.activeGroups && lhs.activeModules == rhs.activeModules;
}

bool operator!=(const LayoutState &lhs, const LayoutState &rhs)
{
    return !(lhs == rhs);
}

std::string describeLayoutChange(const LayoutState &previous, const LayoutState &current)
{
    std::string detail;

    for (const auto &entry : current.activeGroups)
    {
        const auto before = previous.activeGroups.find(entry.first);
        if (before == previous.activeGroups.end())
        {
            appendPart(detail, entry.first + ": (none) -> " + entry.second);
        }
        else if (before->second != entry.second)
        {
            appendPart(detail, entry.first + ": " + before->second + " -> " + entry.second);
        }
    }
    for (const auto &entry : previous.activeGroups)
    {
        if (current.activeGroups.find(entry.first) == current.activeGroups.end())
        {
            appendPart(detail, entry.first + ": " + entry.second + " -> (none)");
        }
    }

    for (const std::string &module : current.activeModules)
    {
        if (!contains(previous.activeModules, module))
        {
            appendPart(detail, "+" + module);
        }
    }
    for (const std::string &module : previous.activeModules)
    {
        if (!contains(current.activeModules, module))
        {
            appendPart(detail, "-" + module);
        }
    }

    if (detail.empty() && previous.activeModules != current.activeModules)
    {
        detail = "module order: " + joinModules(current.activeModules);
    }
    return detail;
}

LayoutResolver::LayoutResolver(const LayoutConfig &config, const ConditionEvaluator &evaluator)
    : evaluator_(evaluator), legacyModules_(config.legacyModules)
{
    for (const LayoutSection &section : config.sections)
    {
        if (section.groups.empty())
        {
            INKWEATHER_LOGW(TAG, "Section '%s' has no groups; ignoring it.", section.name.c_str());
            continue;
        }
        sections_.push_back(section);
    }

    for (const TriggerDefinition &trigger : config.triggers)
    {
        if (acceptTrigger(trigger))
        {
            triggers_.push_back(trigger);
        }
    }

    std::stable_sort(triggers_.begin(), triggers_.end(), [](const TriggerDefinition &a, const TriggerDefinition &b) {
        if (a.priority != b.priority)
        {
            return a.priority > b.priority;
        }
        return a.declarationIndex < b.declarationIndex;
    });

    // Parsed once; a malformed condition is kept and never fires.
    for (const TriggerDefinition &trigger : triggers_)
    {
        ParsedCondition condition;
        std::string error;
        if (!ParsedCondition::parse(trigger.condition, condition, error))
        {
            INKWEATHER_LOGW(TAG, "Trigger '%s' condition is invalid (%s); it will never fire.", trigger.name.c_str(),
                            error.c_str());
        }
        conditions_.push_back(condition);
    }

    INKWEATHER_LOGI(TAG, "%u section(s), %u trigger(s), %u legacy module(s)",
                    static_cast<unsigned>(sections_.size()), static_cast<unsigned>(triggers_.size()),
                    static_cast<unsigned>(legacyModules_.size()));
}

bool LayoutResolver::acceptTrigger(const TriggerDefinition &trigger) const
{
    if (trigger.condition.empty() || trigger.targetSection.empty() || trigger.activateGroup.empty())
    {
        INKWEATHER_LOGW(TAG, "Trigger '%s' is missing condition, target_section or activate_group; skipped.",
                        trigger.name.c_str());
        return false;
    }

    const LayoutSection *section = findSection(trigger.targetSection);
    if (section == nullptr)
    {
        INKWEATHER_LOGW(TAG, "Trigger '%s' targets unknown section '%s'; skipped.", trigger.name.c_str(),
                        trigger.targetSection.c_str());
        return false;
    }
    if (section->findGroup(trigger.activateGroup) == nullptr)
    {
        INKWEATHER_LOGW(TAG, "Trigger '%s' activates unknown group '%s' in '%s'; skipped.", trigger.name.c_str(),
                        trigger.activateGroup.c_str(), trigger.targetSection.c_str());
        return false;
    }
    return true;
}

const LayoutSection *LayoutResolver::findSection(const std::string &name) const
{
    for (const LayoutSection &section : sections_)
    {
        if (section.name == name)
        {
            return &section;
        }
    }
    return nullptr;
}

bool LayoutResolver::triggerFires(size_t index, const ContextSnapshot &context) const
{
    const TriggerDefinition &trigger = triggers_[index];
    if (conditions_[index].empty())
    {
        return false;
    }
    try
    {
        return evaluator_.evaluate(conditions_[index], context, trigger.condition);
    }
    catch (const std::exception &e)
    {
        INKWEATHER_LOGE(TAG, "Trigger '%s' failed: %s", trigger.name.c_str(), e.what());
        return false;
    }
}

LayoutState LayoutResolver::legacyLayout(time_t evaluatedAt) const
{
    LayoutState state;
    state.evaluatedAt = evaluatedAt;
    state.activeModules = legacyModules_;
    state.legacy = true;
    return state;
}

LayoutState LayoutResolver::resolve(const ContextSnapshot &context) const
{
    if (sections_.empty() && triggers_.empty())
    {
        INKWEATHER_LOGD(TAG, "No module groups configured; using legacy module list.");
        return legacyLayout(context.capturedAt());
    }

    LayoutState state;
    state.evaluatedAt = context.capturedAt();
    for (const LayoutSection &section : sections_)
    {
        state.activeGroups[section.name] = section.defaultGroup()->name;
    }

    std::set<std::string> claimed;
    for (size_t i = 0; i < triggers_.size(); ++i)
    {
        const TriggerDefinition &trigger = triggers_[i];
        if (claimed.count(trigger.targetSection) != 0)
        {
            INKWEATHER_LOGD(TAG, "Trigger '%s' skipped; '%s' already claimed.", trigger.name.c_str(),
                            trigger.targetSection.c_str());
            continue;
        }
        if (!triggerFires(i, context))
        {
            continue;
        }

        INKWEATHER_LOGI(TAG, "Trigger '%s' active: %s -> %s (priority %d)", trigger.name.c_str(),
                        trigger.targetSection.c_str(), trigger.activateGroup.c_str(), trigger.priority);
        state.activeGroups[trigger.targetSection] = trigger.activateGroup;
        claimed.insert(trigger.targetSection);
    }

    for (const LayoutSection &section : sections_)
    {
        const ModuleGroup *group = section.findGroup(state.activeGroups[section.name]);
        if (group == nullptr)
        {
            continue;
        }
        state.activeModules.insert(state.activeModules.end(), group->modules.begin(), group->modules.end());
    }

    if (state.activeModules.empty())
    {
        INKWEATHER_LOGW(TAG, "Module groups produced no modules; falling back to legacy module list.");
        return legacyLayout(context.capturedAt());
    }
    return state;
}

} // namespace inkweather
