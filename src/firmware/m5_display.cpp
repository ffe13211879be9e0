#include "m5_display.h"

#include "inkweather/log.h"

namespace inkweather
{
namespace
{
constexpr char TAG[] = "Display";

int textSizeFor(FontRole font) noexcept
{
    switch (font)
    {
    case FontRole::Small:
        return 2;
    case FontRole::Body:
        return 3;
    case FontRole::Heading:
        return 4;
    case FontRole::Large:
        return 8;
    }
    return 3;
}
} // namespace

M5CanvasSurface::M5CanvasSurface(M5EPD_Canvas &canvas, int width, int height)
    : canvas_(canvas), width_(width), height_(height)
{
}

void M5CanvasSurface::selectFont(FontRole font) const
{
    canvas_.setTextSize(textSizeFor(font));
}

void M5CanvasSurface::clear()
{
    if (!ready_)
    {
        return;
    }
    canvas_.fillCanvas(COLOR_WHITE);
    canvas_.setTextColor(COLOR_BLACK);
    canvas_.setTextDatum(TL_DATUM);
}

void M5CanvasSurface::drawText(const std::string &text, int x, int y, FontRole font, uint8_t color)
{
    if (!ready_)
    {
        return;
    }
    selectFont(font);
    canvas_.setTextColor(color);
    canvas_.drawString(text.c_str(), x, y);
    canvas_.setTextColor(COLOR_BLACK);
}

void M5CanvasSurface::drawRect(const Rect &rect, uint8_t color)
{
    if (ready_ && !rect.empty())
    {
        canvas_.drawRect(rect.x, rect.y, rect.width, rect.height, color);
    }
}

void M5CanvasSurface::fillRect(const Rect &rect, uint8_t color)
{
    if (ready_ && !rect.empty())
    {
        canvas_.fillRect(rect.x, rect.y, rect.width, rect.height, color);
    }
}

void M5CanvasSurface::drawLine(int x0, int y0, int x1, int y1, uint8_t color)
{
    if (ready_)
    {
        canvas_.drawLine(x0, y0, x1, y1, color);
    }
}

bool M5CanvasSurface::pasteBitmap(int x, int y, int width, int height, const uint8_t *pixels)
{
    if (!ready_ || pixels == nullptr || width <= 0 || height <= 0)
    {
        return false;
    }
    for (int row = 0; row < height; ++row)
    {
        for (int column = 0; column < width; ++column)
        {
            canvas_.drawPixel(x + column, y + row, pixels[row * width + column] & 0x0F);
        }
    }
    return true;
}

int M5CanvasSurface::measureText(const std::string &text, FontRole font) const
{
    selectFont(font);
    return canvas_.textWidth(text.c_str());
}

int M5CanvasSurface::fontHeight(FontRole font) const
{
    selectFont(font);
    return canvas_.fontHeight();
}

M5PanelDriver::M5PanelDriver(M5EPD_Canvas &canvas, M5CanvasSurface &surface, uint8_t rotation)
    : canvas_(canvas), surface_(surface), rotation_(rotation)
{
}

bool M5PanelDriver::init()
{
    M5.EPD.SetRotation(rotation_);
    M5.TP.SetRotation(rotation_);
    M5.EPD.Clear(true);

    surface_.setReady(canvas_.createCanvas(surface_.width(), surface_.height()) != nullptr);
    if (!surface_.ready())
    {
        INKWEATHER_LOGE(TAG, "Failed to allocate %dx%d EPD canvas.", surface_.width(), surface_.height());
        return false;
    }

    canvas_.setTextColor(COLOR_BLACK);
    canvas_.setTextDatum(TL_DATUM);
    return true;
}

bool M5PanelDriver::clear()
{
    M5.EPD.Clear(true);
    return true;
}

bool M5PanelDriver::display(Surface &)
{
    if (!surface_.ready())
    {
        INKWEATHER_LOGW(TAG, "Skipping panel write because canvas is not ready.");
        return false;
    }
    canvas_.pushCanvas(0, 0, UPDATE_MODE_GC16);
    return true;
}

void M5PanelDriver::sleep()
{
    if (surface_.ready())
    {
        canvas_.deleteCanvas();
        surface_.setReady(false);
    }
    M5.EPD.Sleep();
}

} // namespace inkweather
