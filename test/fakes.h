#ifndef INKWEATHER_TEST_FAKES_H
#define INKWEATHER_TEST_FAKES_H

#include <algorithm>
#include <deque>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

#include "inkweather/controller.h"
#include "inkweather/file_store.h"
#include "inkweather/renderer.h"
#include "inkweather/surface.h"

namespace inkweather
{
namespace fakes
{

// Records every draw call. Text metrics are fixed-width per font role so
// layouts are predictable.
class FakeSurface : public Surface
{
public:
    enum class OpKind
    {
        Text,
        Rect,
        Fill,
        Line,
        Bitmap
    };

    struct Op
    {
        OpKind kind;
        std::string text;
        Rect bounds;
        uint8_t color;
    };

    FakeSurface(int width = 960, int height = 540) : width_(width), height_(height) {}

    int width() const override { return width_; }
    int height() const override { return height_; }

    void clear() override
    {
        ++clears;
        ops.clear();
    }

    void drawText(const std::string &text, int x, int y, FontRole font, uint8_t color) override
    {
        ops.push_back(Op{OpKind::Text, text, Rect{x, y, measureText(text, font), fontHeight(font)}, color});
    }

    void drawRect(const Rect &rect, uint8_t color) override { ops.push_back(Op{OpKind::Rect, "", rect, color}); }

    void fillRect(const Rect &rect, uint8_t color) override { ops.push_back(Op{OpKind::Fill, "", rect, color}); }

    void drawLine(int x0, int y0, int x1, int y1, uint8_t color) override
    {
        const int left = std::min(x0, x1);
        const int top = std::min(y0, y1);
        ops.push_back(Op{OpKind::Line, "", Rect{left, top, std::max(x0, x1) - left + 1, std::max(y0, y1) - top + 1},
                         color});
    }

    bool pasteBitmap(int x, int y, int width, int height, const uint8_t *) override
    {
        ops.push_back(Op{OpKind::Bitmap, "", Rect{x, y, width, height}, COLOR_BLACK});
        return true;
    }

    int measureText(const std::string &text, FontRole font) const override
    {
        return static_cast<int>(text.size()) * charWidth(font);
    }

    int fontHeight(FontRole font) const override { return 2 * charWidth(font); }

    static int charWidth(FontRole font)
    {
        switch (font)
        {
        case FontRole::Small:
            return 8;
        case FontRole::Body:
            return 12;
        case FontRole::Heading:
            return 16;
        case FontRole::Large:
            return 32;
        }
        return 12;
    }

    bool hasText(const std::string &needle) const
    {
        for (const Op &op : ops)
        {
            if (op.kind == OpKind::Text && op.text.find(needle) != std::string::npos)
            {
                return true;
            }
        }
        return false;
    }

    std::vector<Op> opsOutside(const Rect &area) const
    {
        std::vector<Op> outside;
        for (const Op &op : ops)
        {
            if (!area.contains(op.bounds))
            {
                outside.push_back(op);
            }
        }
        return outside;
    }

    std::vector<Op> ops;
    int clears{0};

private:
    int width_;
    int height_;
};

class FakePanel : public PanelDriver
{
public:
    bool init() override
    {
        ++inits;
        return initResult;
    }

    bool clear() override { return true; }

    bool display(Surface &) override
    {
        ++displays;
        return displayResult;
    }

    void sleep() override { ++sleeps; }

    bool initResult{true};
    bool displayResult{true};
    int inits{0};
    int displays{0};
    int sleeps{0};
};

class MemoryFileStore : public FileStore
{
public:
    bool exists(const std::string &path) override { return files.count(path) != 0; }

    bool read(const std::string &path, std::string &contents) override
    {
        const auto it = files.find(path);
        if (it == files.end())
        {
            return false;
        }
        contents = it->second;
        return true;
    }

    bool write(const std::string &path, const std::string &contents) override
    {
        if (failWrites)
        {
            return false;
        }
        files[path] = contents;
        return true;
    }

    bool remove(const std::string &path) override { return files.erase(path) != 0; }

    bool rename(const std::string &from, const std::string &to) override
    {
        const auto it = files.find(from);
        if (it == files.end())
        {
            return false;
        }
        files[to] = it->second;
        files.erase(it);
        return true;
    }

    std::map<std::string, std::string> files;
    bool failWrites{false};
};

// Hands out queued payloads; an empty queue reports a fetch failure.
class ScriptedWeatherSource : public WeatherSource
{
public:
    void push(const WeatherPayload &weather) { payloads.push_back(weather); }

    bool fetch(time_t, WeatherPayload &weather, std::string &error) override
    {
        ++calls;
        if (throwNext)
        {
            throwNext = false;
            throw std::runtime_error("socket closed");
        }
        if (payloads.empty())
        {
            error = "WiFi connection failed";
            return false;
        }
        weather = payloads.front();
        payloads.pop_front();
        return true;
    }

    std::deque<WeatherPayload> payloads;
    bool throwNext{false};
    int calls{0};
};

// Dedicated renderer that records the rectangle it was given.
class RecordingRenderer : public ModuleRenderer
{
public:
    RecordingRenderer(Surface &surface, bool result, std::vector<Rect> &calls)
        : ModuleRenderer(surface), result_(result), calls_(calls)
    {
    }

    bool render(const Rect &rect, const WeatherPayload &, const ContextSnapshot &) override
    {
        calls_.push_back(rect);
        surface_.fillRect(rect, COLOR_GREY);
        return result_;
    }

private:
    bool result_;
    std::vector<Rect> &calls_;
};

class ThrowingRenderer : public ModuleRenderer
{
public:
    using ModuleRenderer::ModuleRenderer;

    bool render(const Rect &, const WeatherPayload &, const ContextSnapshot &) override
    {
        throw std::runtime_error("font missing");
    }
};

// 2025-01-01 12:00:00 UTC
constexpr time_t NEW_YEAR_NOON = 1735732800;

inline WeatherPayload sampleWeather()
{
    WeatherPayload weather;
    weather.temperature = 20.0F;
    weather.conditionCode = 800;
    weather.description = "clear sky";
    weather.pressure = 1013.0F;
    weather.pressureTrendText = "Steady";
    weather.pressureTrendArrow = "stable";
    weather.windSpeed = 3.2F;
    weather.windDirection = 225.0F;
    weather.tomorrow.temperature = 18.0F;
    weather.tomorrow.minTemperature = 12.0F;
    weather.tomorrow.maxTemperature = 19.0F;
    weather.tomorrow.conditionCode = 500;
    weather.tomorrow.description = "light rain";
    weather.location = "Stockholm";
    weather.sources.push_back("OpenWeatherMap");
    weather.observedAt = NEW_YEAR_NOON - 300;
    return weather;
}

} // namespace fakes
} // namespace inkweather

#endif // INKWEATHER_TEST_FAKES_H
