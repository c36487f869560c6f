#ifndef REVERIE_TFT_DISPLAY_H
#define REVERIE_TFT_DISPLAY_H

#include <TFT_eSPI.h>
#include "../core/display.h"

namespace reverie {

/**
 * TftDisplay - Pushes frames to an SPI TFT through TFT_eSPI
 *
 * Palette entries are converted to RGB565 once per palette generation.
 * Each logical row is expanded horizontally by the scale into a line
 * buffer and pushed scale times, inside one SPI transaction per frame.
 * The image is centered; the border is cleared once in begin().
 */
class TftDisplay : public Display {
public:
    explicit TftDisplay(TFT_eSPI& tft);

    void begin(uint8_t scale, uint8_t rotation = 1);

    void push(const FrameBuffer& frame, const Palette& palette) override;

    uint32_t getPushCount() const { return pushes; }

private:
    void rebuildLut(const Palette& palette);

    TFT_eSPI& tft;
    uint16_t lut[MAX_PALETTE_SIZE];
    uint16_t line[MAX_FRAME_WIDTH * MAX_DISPLAY_SCALE];
    uint32_t lutGeneration;
    uint32_t pushes;
    uint8_t scale;
    bool lutValid;
};

} // namespace reverie

#endif // REVERIE_TFT_DISPLAY_H
