/**
 * TftDisplay implementation
 */

#include "tft_display.h"
#include "../logging.h"

namespace reverie {

TftDisplay::TftDisplay(TFT_eSPI& t)
    : tft(t)
    , lutGeneration(0)
    , pushes(0)
    , scale(DEFAULT_DISPLAY_SCALE)
    , lutValid(false) {
    memset(lut, 0, sizeof(lut));
    memset(line, 0, sizeof(line));
}

void TftDisplay::begin(uint8_t s, uint8_t rotation) {
    scale = (s == 0 || s > MAX_DISPLAY_SCALE) ? DEFAULT_DISPLAY_SCALE : s;

    pinMode(TFT_BACKLIGHT_PIN, OUTPUT);
    digitalWrite(TFT_BACKLIGHT_PIN, HIGH);

    tft.begin();
    tft.setRotation(rotation);
    tft.setSwapBytes(true);
    tft.fillScreen(TFT_BLACK);

    LOG_INFO(LogTag::DISPLAY, "TFT %dx%d ready, scale %dx", tft.width(), tft.height(), scale);
}

void TftDisplay::rebuildLut(const Palette& palette) {
    for (uint16_t i = 0; i < palette.size(); i++) {
        const CRGB& c = palette[i];
        lut[i] = tft.color565(c.r, c.g, c.b);
    }
    lutGeneration = palette.getGeneration();
    lutValid = true;
    LOG_DEBUG(LogTag::DISPLAY, "Palette %s (%u entries) converted", paletteName(palette.getPreset()), palette.size());
}

void TftDisplay::push(const FrameBuffer& frame, const Palette& palette) {
    if (!lutValid || palette.getGeneration() != lutGeneration) {
        rebuildLut(palette);
    }

    const uint16_t w = frame.getWidth();
    const uint16_t h = frame.getHeight();
    int32_t outW = static_cast<int32_t>(w) * scale;
    int32_t outH = static_cast<int32_t>(h) * scale;
    if (outW > tft.width()) outW = tft.width();
    if (outH > tft.height()) outH = tft.height();
    const int32_t originX = (tft.width() - outW) / 2;
    const int32_t originY = (tft.height() - outH) / 2;
    const uint16_t rows = outH / scale;
    const uint16_t limit = palette.size();

    tft.startWrite();
    tft.setAddrWindow(originX, originY, outW, rows * scale);
    for (uint16_t y = 0; y < rows; y++) {
        const uint8_t* src = frame.row(y);
        for (int32_t sx = 0; sx < outW; sx++) {
            uint8_t idx = src[sx / scale];
            line[sx] = lut[idx < limit ? idx : 0];
        }
        for (uint8_t r = 0; r < scale; r++) {
            tft.pushPixels(line, outW);
        }
    }
    tft.endWrite();
    pushes++;
}

} // namespace reverie
