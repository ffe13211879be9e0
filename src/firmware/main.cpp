#include <Arduino.h>
#include <M5EPD.h>
#include <SD.h>
#include <WiFi.h>
#include <time.h>

#include <map>
#include <memory>
#include <string>

#include "inkweather/config.h"
#include "inkweather/controller.h"
#include "inkweather/log.h"
#include "inkweather/render_executor.h"
#include "inkweather/renderer_registry.h"
#include "m5_display.h"
#include "sd_file_store.h"
#include "weather_fetch.h"

namespace
{
constexpr char TAG[] = "Setup";
constexpr uint8_t DISPLAY_ROTATION = 0;
constexpr uint32_t STOP_PRESS_MS = 2000;
constexpr uint32_t NTP_TIMEOUT_MS = 15000;
constexpr time_t MIN_VALID_EPOCH = 1600000000;
constexpr char NTP_PRIMARY[] = "pool.ntp.org";
constexpr char NTP_SECONDARY[] = "time.nist.gov";

M5EPD_Canvas canvas(&M5.EPD);
inkweather::SdFileStore fileStore;
inkweather::AppConfig appConfig;

std::unique_ptr<inkweather::M5CanvasSurface> surface;
std::unique_ptr<inkweather::M5PanelDriver> panel;
std::unique_ptr<inkweather::OpenWeatherSource> weatherSource;
std::unique_ptr<inkweather::UpdateController> controller;

uint32_t lastIterationMs = 0;
bool stopped = false;

void serialSink(inkweather::LogLevel, const char *line)
{
    Serial.println(line);
}

// Boot-time message before the controller exists, then power off.
[[noreturn]] void haltWithMessage(const std::string &message)
{
    INKWEATHER_LOGE(TAG, "%s", message.c_str());

    inkweather::M5CanvasSurface bootSurface(canvas, appConfig.screenWidth, appConfig.screenHeight);
    inkweather::M5PanelDriver bootPanel(canvas, bootSurface, DISPLAY_ROTATION);
    if (bootPanel.init())
    {
        inkweather::RendererRegistry registry(bootSurface);
        const std::map<std::string, inkweather::ModulePlacement> noPlacements;
        inkweather::RenderExecutor executor(bootSurface, registry, noPlacements, nullptr);
        executor.drawStatusMessage(message);
        bootPanel.display(bootSurface);
        bootPanel.sleep();
    }

    delay(500);
    M5.shutdown();
    for (;;)
    {
        delay(1000);
    }
}

bool loadConfiguration(std::string &error)
{
    if (!SD.begin())
    {
        error = "SD card not available";
        return false;
    }

    std::string json;
    if (!fileStore.exists(inkweather::DEFAULT_CONFIG_PATH) || !fileStore.read(inkweather::DEFAULT_CONFIG_PATH, json))
    {
        error = std::string("Missing configuration ") + inkweather::DEFAULT_CONFIG_PATH;
        return false;
    }

    std::string parseError;
    if (!inkweather::parseConfig(json, appConfig, parseError))
    {
        error = "Configuration error: " + parseError;
        return false;
    }
    return true;
}

void synchroniseClock()
{
    if (!inkweather::connectToWifi(appConfig.wifi))
    {
        INKWEATHER_LOGW("Clock", "No WiFi for NTP; relying on RTC-less system time.");
        return;
    }

    configTime(0, 0, NTP_PRIMARY, NTP_SECONDARY);
    const uint32_t start = millis();
    while (time(nullptr) < MIN_VALID_EPOCH)
    {
        if (millis() - start > NTP_TIMEOUT_MS)
        {
            INKWEATHER_LOGW("Clock", "NTP sync timed out.");
            break;
        }
        delay(250);
    }

    if (time(nullptr) >= MIN_VALID_EPOCH)
    {
        INKWEATHER_LOGI("Clock", "System time synchronised (%ld).", static_cast<long>(time(nullptr)));
    }
    inkweather::powerDownWifi();
}

void runIteration()
{
    lastIterationMs = millis();
    controller->runIteration(time(nullptr));
}
} // namespace

void setup()
{
    Serial.begin(115200);
    delay(100);
    Serial.println();
    inkweather::setLogSink(serialSink);
    INKWEATHER_LOGI(TAG, "Booting InkWeather");

    M5.begin();
    M5.RTC.begin();

    std::string error;
    if (!loadConfiguration(error))
    {
        haltWithMessage(error);
    }
    inkweather::setLogLevel(appConfig.debug.logLevel);

    surface.reset(new inkweather::M5CanvasSurface(canvas, appConfig.screenWidth, appConfig.screenHeight));
    panel.reset(new inkweather::M5PanelDriver(canvas, *surface, DISPLAY_ROTATION));
    weatherSource.reset(new inkweather::OpenWeatherSource(appConfig.wifi, appConfig.weather));
    controller.reset(new inkweather::UpdateController(appConfig, *weatherSource, *surface, *panel, fileStore));

    if (!controller->start(error))
    {
        INKWEATHER_LOGE(TAG, "Startup failed: %s", error.c_str());
        M5.shutdown();
        stopped = true;
        return;
    }

    synchroniseClock();
    runIteration();
}

void loop()
{
    if (stopped)
    {
        delay(1000);
        return;
    }

    M5.update();
    if (M5.BtnP.pressedFor(STOP_PRESS_MS))
    {
        INKWEATHER_LOGI(TAG, "Stop requested from side button.");
        controller->requestStop();
    }

    if (!controller->running())
    {
        controller->shutdown();
        stopped = true;
        M5.shutdown();
        return;
    }

    const uint32_t intervalMs = static_cast<uint32_t>(appConfig.updateIntervalSeconds) * 1000UL;
    if (millis() - lastIterationMs >= intervalMs)
    {
        runIteration();
    }
    delay(50);
}
