#include "inkweather/controller.h"

#include <exception>

#include "inkweather/log.h"
#include "inkweather/module_renderers.h"
#include "inkweather/test_override.h"

namespace inkweather
{
namespace
{
constexpr char TAG[] = "Update";
constexpr char FETCH_ERROR_REASON[] = "fetch error";

ChangeDetectorSettings detectorSettings(const AppConfig &config)
{
    ChangeDetectorSettings settings;
    settings.watchdogSeconds = static_cast<long>(config.watchdogMinutes) * 60L;
    settings.numericTolerance = config.numericTolerance;
    return settings;
}
} // namespace

UpdateController::UpdateController(const AppConfig &config, WeatherSource &source, Surface &surface,
                                   PanelDriver &panel, FileStore &store)
    : config_(config),
      source_(source),
      surface_(surface),
      panel_(panel),
      store_(store),
      resolver_(config_.layout, evaluator_),
      detector_(resolver_, detectorSettings(config_)),
      registry_(surface),
      executor_(surface, registry_, config_.placements, legacyRenderFunction),
      pressureHistory_(store, config_.pressureHistory.path)
{
    registerBuiltinRenderers(registry_);
}

bool UpdateController::start(std::string &error)
{
    if (!panel_.init())
    {
        if (!config_.debug.testMode)
        {
            error = "Display initialisation failed";
            INKWEATHER_LOGE(TAG, "%s.", error.c_str());
            return false;
        }
        INKWEATHER_LOGW(TAG, "Display initialisation failed; continuing in test mode.");
    }

    if (config_.pressureHistory.enabled)
    {
        std::string historyError;
        if (!pressureHistory_.load(historyError))
        {
            INKWEATHER_LOGW(TAG, "Pressure history unavailable (%s); starting empty.", historyError.c_str());
        }
    }

    running_ = true;
    INKWEATHER_LOGI(TAG, "Controller started: interval %ds, watchdog %d min, tolerance %.2f",
                    config_.updateIntervalSeconds, config_.watchdogMinutes, config_.numericTolerance);
    return true;
}

bool UpdateController::acquireWeather(time_t now, WeatherPayload &weather, std::string &error)
{
    bool fetched = false;
    try
    {
        fetched = source_.fetch(now, weather, error);
    }
    catch (const std::exception &e)
    {
        error = e.what();
        fetched = false;
    }
    if (!fetched)
    {
        return false;
    }

    if (config_.pressureHistory.enabled)
    {
        pressureHistory_.apply(now, weather);
        std::string historyError;
        if (!pressureHistory_.save(historyError))
        {
            INKWEATHER_LOGW(TAG, "Pressure history not saved: %s", historyError.c_str());
        }
    }

    TestOverride testData;
    if (loadTestOverride(store_, config_.debug, now, testData))
    {
        applyTestOverride(testData, weather);
    }
    return true;
}

IterationResult UpdateController::runIteration(time_t now)
{
    IterationResult result;
    ++iteration_;

    WeatherPayload weather;
    result.fetched = acquireWeather(now, weather, result.error);
    if (result.fetched)
    {
        lastGoodWeather_ = weather;
        hasLastGoodWeather_ = true;
    }
    else if (hasLastGoodWeather_)
    {
        INKWEATHER_LOGW(TAG, "Weather fetch failed (%s); reusing last payload.", result.error.c_str());
        weather = lastGoodWeather_;
    }
    else
    {
        INKWEATHER_LOGE(TAG, "Weather fetch failed (%s); nothing to show yet.", result.error.c_str());
        showStatus(result.error.empty() ? std::string("Weather update failed") : result.error);
        logIteration(result);
        return result;
    }

    if (logLevel() == LogLevel::Debug)
    {
        INKWEATHER_LOGD("Weather", "Payload %s", serializeWeather(weather).c_str());
    }

    const ContextSnapshot context = buildContext(weather, now, config_.preferences);
    result.decision = detector_.shouldUpdate(context, weather, accepted_);
    if (!result.decision.update)
    {
        logIteration(result);
        return result;
    }

    result.summary = executor_.compose(result.decision.layout, weather, context);
    result.redrawn = panel_.display(surface_);
    lastStatusMessage_.clear();
    if (!result.redrawn)
    {
        INKWEATHER_LOGE(TAG, "Panel write failed.");
    }

    // In test mode a missing panel must not cause a redraw every cycle.
    if (result.redrawn || config_.debug.testMode)
    {
        accepted_.hasWeather = true;
        accepted_.weather = ObservableWeatherState::observe(weather, now);
        accepted_.hasLayout = true;
        accepted_.layout = result.decision.layout;
        result.accepted = true;
    }

    logIteration(result);
    return result;
}

void UpdateController::showStatus(const std::string &message)
{
    if (message == lastStatusMessage_)
    {
        return;
    }
    executor_.drawStatusMessage(message);
    if (panel_.display(surface_))
    {
        lastStatusMessage_ = message;
    }
    else
    {
        INKWEATHER_LOGE(TAG, "Panel write failed while showing status.");
    }
}

void UpdateController::logIteration(const IterationResult &result) const
{
    if (!result.fetched && !hasLastGoodWeather_)
    {
        INKWEATHER_LOGI(TAG, "#%lu redraw=no reason=%s detail=\"%s\"", iteration_, FETCH_ERROR_REASON,
                        result.error.c_str());
        return;
    }

    const UpdateDecision &decision = result.decision;
    if (!decision.update)
    {
        INKWEATHER_LOGI(TAG, "#%lu redraw=no reason=%s detail=\"%s\"", iteration_, toString(decision.reason),
                        decision.detail.c_str());
        return;
    }

    INKWEATHER_LOGI(TAG, "#%lu redraw=%s reason=%s detail=\"%s\" rendered=%u failed=%u skipped=%u", iteration_,
                    result.redrawn ? "yes" : "no", toString(decision.reason), decision.detail.c_str(),
                    static_cast<unsigned>(result.summary.rendered.size()),
                    static_cast<unsigned>(result.summary.failed.size()),
                    static_cast<unsigned>(result.summary.skipped.size()));
}

void UpdateController::shutdown()
{
    running_ = false;
    registry_.clearCache();
    panel_.sleep();
    INKWEATHER_LOGI(TAG, "Controller stopped after %lu iteration(s).", iteration_);
}

} // namespace inkweather
