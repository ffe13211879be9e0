#ifndef INKWEATHER_SURFACE_H
#define INKWEATHER_SURFACE_H

#include <cstdint>
#include <string>

namespace inkweather
{

// 4-bit greyscale, as the M5Paper panel uses it.
constexpr uint8_t COLOR_WHITE = 0;
constexpr uint8_t COLOR_GREY = 6;
constexpr uint8_t COLOR_BLACK = 15;

struct Rect
{
    int x{0};
    int y{0};
    int width{0};
    int height{0};

    int right() const noexcept { return x + width; }
    int bottom() const noexcept { return y + height; }
    bool empty() const noexcept { return width <= 0 || height <= 0; }

    Rect inset(int amount) const noexcept
    {
        return Rect{x + amount, y + amount, width - 2 * amount, height - 2 * amount};
    }

    bool contains(const Rect &other) const noexcept
    {
        return other.x >= x && other.y >= y && other.right() <= right() && other.bottom() <= bottom();
    }
};

enum class FontRole
{
    Small,
    Body,
    Heading,
    Large
};

// Drawing canvas shared by all module renderers. Text is anchored at its
// top-left corner.
class Surface
{
public:
    virtual ~Surface() = default;

    virtual int width() const = 0;
    virtual int height() const = 0;

    virtual void clear() = 0;
    virtual void drawText(const std::string &text, int x, int y, FontRole font, uint8_t color = COLOR_BLACK) = 0;
    virtual void drawRect(const Rect &rect, uint8_t color = COLOR_BLACK) = 0;
    virtual void fillRect(const Rect &rect, uint8_t color = COLOR_BLACK) = 0;
    virtual void drawLine(int x0, int y0, int x1, int y1, uint8_t color = COLOR_BLACK) = 0;
    // Row-major 4-bit pixels, one per byte.
    virtual bool pasteBitmap(int x, int y, int width, int height, const uint8_t *pixels) = 0;

    virtual int measureText(const std::string &text, FontRole font) const = 0;
    virtual int fontHeight(FontRole font) const = 0;
};

class PanelDriver
{
public:
    virtual ~PanelDriver() = default;

    virtual bool init() = 0;
    virtual bool clear() = 0;
    // Pushes a fully composed frame to the panel.
    virtual bool display(Surface &surface) = 0;
    virtual void sleep() = 0;
};

} // namespace inkweather

#endif // INKWEATHER_SURFACE_H
