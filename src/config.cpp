#include "inkweather/config.h"

#include <ArduinoJson.h>

namespace inkweather
{
namespace
{
constexpr char TAG[] = "Config";
constexpr size_t CONFIG_DOCUMENT_CAPACITY = 24 * 1024;

std::string readString(JsonVariantConst value, const std::string &fallback)
{
    const char *text = value.as<const char *>();
    return text != nullptr ? std::string(text) : fallback;
}

int readPositiveInt(JsonVariantConst value, int fallback, const char *name)
{
    if (value.isNull())
    {
        return fallback;
    }
    const int parsed = value.as<int>();
    if (!value.is<int>() || parsed <= 0)
    {
        INKWEATHER_LOGW(TAG, "%s must be a positive integer; using %d.", name, fallback);
        return fallback;
    }
    return parsed;
}

bool readRect(JsonObjectConst module, Rect &rect)
{
    JsonObjectConst position = module["position"].as<JsonObjectConst>();
    if (position.isNull())
    {
        position = module["coords"].as<JsonObjectConst>();
    }
    JsonObjectConst size = module["size"].as<JsonObjectConst>();

    JsonVariantConst x = position.isNull() ? module["x"] : position["x"];
    JsonVariantConst y = position.isNull() ? module["y"] : position["y"];
    JsonVariantConst width = size.isNull() ? module["width"] : size["width"];
    JsonVariantConst height = size.isNull() ? module["height"] : size["height"];
    if (!x.is<int>() || !y.is<int>() || !width.is<int>() || !height.is<int>())
    {
        return false;
    }

    rect = Rect{x.as<int>(), y.as<int>(), width.as<int>(), height.as<int>()};
    return !rect.empty();
}

void parseModules(JsonObjectConst modules, AppConfig &config)
{
    for (JsonPairConst entry : modules)
    {
        const char *id = entry.key().c_str();
        if (isCommentKey(id))
        {
            continue;
        }
        JsonObjectConst module = entry.value().as<JsonObjectConst>();
        if (module.isNull())
        {
            INKWEATHER_LOGW(TAG, "Module '%s' is not an object; ignored.", id);
            continue;
        }

        ModulePlacement placement;
        if (readRect(module, placement.rect))
        {
            const std::string frame = readString(module["frame"], "box");
            if (!parseFrameStyle(frame, placement.frame))
            {
                INKWEATHER_LOGW(TAG, "Module '%s' has unknown frame '%s'; using box.", id, frame.c_str());
            }
            config.placements[id] = placement;
        }
        else
        {
            INKWEATHER_LOGW(TAG, "Module '%s' has no usable position/size.", id);
        }

        if (module["enabled"].as<bool>())
        {
            config.layout.legacyModules.push_back(id);
        }
    }
}

void parseModuleGroups(JsonObjectConst groups, LayoutConfig &layout)
{
    for (JsonPairConst sectionEntry : groups)
    {
        const char *sectionName = sectionEntry.key().c_str();
        if (isCommentKey(sectionName))
        {
            continue;
        }
        JsonObjectConst sectionObject = sectionEntry.value().as<JsonObjectConst>();
        if (sectionObject.isNull())
        {
            INKWEATHER_LOGW(TAG, "Section '%s' is not an object; ignored.", sectionName);
            continue;
        }

        LayoutSection section;
        section.name = sectionName;
        for (JsonPairConst groupEntry : sectionObject)
        {
            const char *groupName = groupEntry.key().c_str();
            if (isCommentKey(groupName))
            {
                continue;
            }
            JsonArrayConst modules = groupEntry.value().as<JsonArrayConst>();
            if (modules.isNull())
            {
                INKWEATHER_LOGW(TAG, "Group '%s.%s' is not a list; ignored.", sectionName, groupName);
                continue;
            }

            ModuleGroup group;
            group.name = groupName;
            for (JsonVariantConst module : modules)
            {
                const char *id = module.as<const char *>();
                if (id != nullptr && id[0] != '\0')
                {
                    group.modules.push_back(id);
                }
            }
            section.groups.push_back(group);
        }
        layout.sections.push_back(section);
    }
}

void parseTriggers(JsonObjectConst triggers, LayoutConfig &layout)
{
    size_t index = 0;
    for (JsonPairConst entry : triggers)
    {
        const char *name = entry.key().c_str();
        if (isCommentKey(name))
        {
            continue;
        }
        JsonObjectConst object = entry.value().as<JsonObjectConst>();
        if (object.isNull())
        {
            INKWEATHER_LOGW(TAG, "Trigger '%s' is not an object; ignored.", name);
            continue;
        }

        TriggerDefinition trigger;
        trigger.name = name;
        trigger.condition = readString(object["condition"], "");
        trigger.targetSection = readString(object["target_section"], "");
        trigger.activateGroup = readString(object["activate_group"], "");
        trigger.priority = object["priority"] | DEFAULT_TRIGGER_PRIORITY;
        trigger.declarationIndex = index++;
        layout.triggers.push_back(trigger);
    }
}

void parseDebug(JsonObjectConst debug, DebugSettings &settings)
{
    if (debug.isNull())
    {
        return;
    }
    const std::string level = readString(debug["log_level"], "INFO");
    if (!parseLogLevel(level, settings.logLevel))
    {
        INKWEATHER_LOGW(TAG, "Unknown log_level '%s'; using INFO.", level.c_str());
        settings.logLevel = LogLevel::Info;
    }
    settings.testMode = debug["test_mode"] | false;
    settings.allowTestData = debug["allow_test_data"] | false;
    settings.testDataPath = readString(debug["test_data_path"], settings.testDataPath);
    settings.testTimeoutHours = debug["test_timeout_hours"] | settings.testTimeoutHours;
}
} // namespace

bool isCommentKey(const char *key)
{
    return key != nullptr && key[0] == COMMENT_KEY_PREFIX;
}

bool parseConfig(const std::string &json, AppConfig &config, std::string &error)
{
    DynamicJsonDocument doc(CONFIG_DOCUMENT_CAPACITY);
    const DeserializationError err = deserializeJson(doc, json);
    if (err)
    {
        error = std::string("Config JSON parse error: ") + err.c_str();
        return false;
    }

    JsonObjectConst root = doc.as<JsonObjectConst>();
    if (root.isNull())
    {
        error = "Config root must be an object";
        return false;
    }

    config = AppConfig();
    config.updateIntervalSeconds = readPositiveInt(root["update_interval_seconds"], 60, "update_interval_seconds");
    config.watchdogMinutes = readPositiveInt(root["watchdog_minutes"], 30, "watchdog_minutes");
    config.numericTolerance = root["numeric_tolerance"] | 0.1;
    if (config.numericTolerance < 0.0)
    {
        INKWEATHER_LOGW(TAG, "numeric_tolerance must not be negative; using 0.1.");
        config.numericTolerance = 0.1;
    }

    JsonObjectConst layout = root["layout"].as<JsonObjectConst>();
    config.screenWidth = readPositiveInt(layout["screen_width"], config.screenWidth, "layout.screen_width");
    config.screenHeight = readPositiveInt(layout["screen_height"], config.screenHeight, "layout.screen_height");

    JsonObjectConst wifi = root["wifi"].as<JsonObjectConst>();
    config.wifi.ssid = readString(wifi["ssid"], "");
    config.wifi.password = readString(wifi["password"], "");
    config.wifi.connectTimeoutMs = wifi["connect_timeout_ms"] | config.wifi.connectTimeoutMs;

    JsonObjectConst weather = root["weather"].as<JsonObjectConst>();
    config.weather.apiKey = readString(weather["api_key"], "");
    config.weather.latitude = weather["latitude"] | static_cast<double>(NAN);
    config.weather.longitude = weather["longitude"] | static_cast<double>(NAN);
    config.weather.units = readString(weather["units"], config.weather.units);
    config.weather.language = readString(weather["language"], config.weather.language);
    if (config.weather.units != "metric" && config.weather.units != "imperial")
    {
        INKWEATHER_LOGW(TAG, "Unsupported units '%s'; using metric.", config.weather.units.c_str());
        config.weather.units = "metric";
    }

    parseModules(root["modules"].as<JsonObjectConst>(), config);
    parseModuleGroups(root["module_groups"].as<JsonObjectConst>(), config.layout);
    parseTriggers(root["triggers"].as<JsonObjectConst>(), config.layout);

    JsonObjectConst preferences = root["user_preferences"].as<JsonObjectConst>();
    config.preferences.modulePreference = readString(preferences["module_preference"], "normal");

    JsonObjectConst history = root["pressure_history"].as<JsonObjectConst>();
    config.pressureHistory.enabled = history["enabled"] | config.pressureHistory.enabled;
    config.pressureHistory.path = readString(history["path"], config.pressureHistory.path);

    parseDebug(root["debug"].as<JsonObjectConst>(), config.debug);

    if (config.placements.empty())
    {
        error = "Config has no module placements";
        return false;
    }

    INKWEATHER_LOGI(TAG, "Loaded %u module placement(s), %u section(s), %u trigger(s)",
                    static_cast<unsigned>(config.placements.size()), static_cast<unsigned>(config.layout.sections.size()),
                    static_cast<unsigned>(config.layout.triggers.size()));
    return true;
}

} // namespace inkweather
