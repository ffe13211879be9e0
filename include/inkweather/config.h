#ifndef INKWEATHER_CONFIG_H
#define INKWEATHER_CONFIG_H

#include <cmath>
#include <map>
#include <string>

#include "inkweather/context.h"
#include "inkweather/layout.h"
#include "inkweather/log.h"
#include "inkweather/renderer.h"

namespace inkweather
{

constexpr char DEFAULT_CONFIG_PATH[] = "/inkweather.json";
// Keys starting with this character are comments and never interpreted.
constexpr char COMMENT_KEY_PREFIX = '_';

struct WifiSettings
{
    std::string ssid;
    std::string password;
    unsigned long connectTimeoutMs{30000UL};
};

struct WeatherSettings
{
    std::string apiKey;
    double latitude{NAN};
    double longitude{NAN};
    std::string units{"metric"};
    std::string language{"en"};
};

struct PressureHistorySettings
{
    bool enabled{true};
    std::string path{"/pressure_history.json"};
};

struct DebugSettings
{
    LogLevel logLevel{LogLevel::Info};
    bool testMode{false};
    bool allowTestData{false};
    std::string testDataPath{"/test_precipitation.json"};
    double testTimeoutHours{1.0};
};

struct AppConfig
{
    int updateIntervalSeconds{60};
    int watchdogMinutes{30};
    double numericTolerance{0.1};
    int screenWidth{960};
    int screenHeight{540};

    WifiSettings wifi;
    WeatherSettings weather;
    LayoutConfig layout;
    std::map<std::string, ModulePlacement> placements;
    UserPreferences preferences;
    PressureHistorySettings pressureHistory;
    DebugSettings debug;
};

bool isCommentKey(const char *key);

// Parses the JSON configuration document. Unknown keys are ignored; a
// malformed document or one without any module placement is an error.
bool parseConfig(const std::string &json, AppConfig &config, std::string &error);

} // namespace inkweather

#endif // INKWEATHER_CONFIG_H
