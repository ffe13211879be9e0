#ifndef INKWEATHER_CONTROLLER_H
#define INKWEATHER_CONTROLLER_H

#include <ctime>
#include <string>

#include "inkweather/change_detector.h"
#include "inkweather/condition.h"
#include "inkweather/config.h"
#include "inkweather/file_store.h"
#include "inkweather/layout.h"
#include "inkweather/pressure_history.h"
#include "inkweather/render_executor.h"
#include "inkweather/renderer_registry.h"
#include "inkweather/surface.h"
#include "inkweather/weather.h"

namespace inkweather
{

// Produces the weather payload for one iteration (HTTP on the device).
class WeatherSource
{
public:
    virtual ~WeatherSource() = default;

    virtual bool fetch(time_t now, WeatherPayload &weather, std::string &error) = 0;
};

struct IterationResult
{
    bool fetched{false};
    bool redrawn{false};
    bool accepted{false};
    UpdateDecision decision;
    RenderSummary summary;
    std::string error;
};

// Owns the loop state: the last accepted display state, the renderer cache
// and the pressure history. Iterations must not overlap.
class UpdateController
{
public:
    UpdateController(const AppConfig &config, WeatherSource &source, Surface &surface, PanelDriver &panel,
                     FileStore &store);

    // Panel init failure is fatal unless debug.test_mode is set.
    bool start(std::string &error);

    // fetch -> context -> decide -> (render + display + accept).
    IterationResult runIteration(time_t now);

    // Checked by the caller between iterations.
    void requestStop() { running_ = false; }
    bool running() const { return running_; }

    // Drops cached renderers and puts the panel to sleep.
    void shutdown();

    const DisplayState &acceptedState() const { return accepted_; }
    unsigned long iterationCount() const { return iteration_; }
    const AppConfig &config() const { return config_; }

private:
    bool acquireWeather(time_t now, WeatherPayload &weather, std::string &error);
    void showStatus(const std::string &message);
    void logIteration(const IterationResult &result) const;

    AppConfig config_;
    WeatherSource &source_;
    Surface &surface_;
    PanelDriver &panel_;
    FileStore &store_;

    ConditionEvaluator evaluator_;
    LayoutResolver resolver_;
    ChangeDetector detector_;
    RendererRegistry registry_;
    RenderExecutor executor_;
    PressureHistory pressureHistory_;

    DisplayState accepted_;
    WeatherPayload lastGoodWeather_;
    bool hasLastGoodWeather_{false};
    std::string lastStatusMessage_;
    unsigned long iteration_{0};
    bool running_{true};
};

} // namespace inkweather

#endif // INKWEATHER_CONTROLLER_H
