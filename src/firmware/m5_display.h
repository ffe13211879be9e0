#ifndef INKWEATHER_FIRMWARE_M5_DISPLAY_H
#define INKWEATHER_FIRMWARE_M5_DISPLAY_H

#include <M5EPD.h>

#include "inkweather/surface.h"

namespace inkweather
{

// Surface over an M5EPD canvas using the built-in scalable bitmap font.
class M5CanvasSurface : public Surface
{
public:
    M5CanvasSurface(M5EPD_Canvas &canvas, int width, int height);

    int width() const override { return width_; }
    int height() const override { return height_; }

    void clear() override;
    void drawText(const std::string &text, int x, int y, FontRole font, uint8_t color) override;
    void drawRect(const Rect &rect, uint8_t color) override;
    void fillRect(const Rect &rect, uint8_t color) override;
    void drawLine(int x0, int y0, int x1, int y1, uint8_t color) override;
    bool pasteBitmap(int x, int y, int width, int height, const uint8_t *pixels) override;

    int measureText(const std::string &text, FontRole font) const override;
    int fontHeight(FontRole font) const override;

    bool ready() const { return ready_; }
    void setReady(bool ready) { ready_ = ready; }

private:
    void selectFont(FontRole font) const;

    M5EPD_Canvas &canvas_;
    int width_;
    int height_;
    bool ready_{false};
};

class M5PanelDriver : public PanelDriver
{
public:
    M5PanelDriver(M5EPD_Canvas &canvas, M5CanvasSurface &surface, uint8_t rotation);

    bool init() override;
    bool clear() override;
    bool display(Surface &surface) override;
    void sleep() override;

private:
    M5EPD_Canvas &canvas_;
    M5CanvasSurface &surface_;
    uint8_t rotation_;
};

} // namespace inkweather

#endif // INKWEATHER_FIRMWARE_M5_DISPLAY_H
