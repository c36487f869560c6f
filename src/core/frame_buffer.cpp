/**
 * FrameBuffer implementation
 */

#include "frame_buffer.h"
#include <cstring>

namespace reverie {

FrameBuffer::FrameBuffer()
    : width(0)
    , height(0)
    , indexLimit(1)
    , rejected(0)
    , configured(false) {
    memset(pixels, 0, sizeof(pixels));
}

bool FrameBuffer::configure(uint16_t w, uint16_t h) {
    if (configured) return false;
    if (w == 0 || h == 0 || w > MAX_FRAME_WIDTH || h > MAX_FRAME_HEIGHT) {
        return false;
    }
    width = w;
    height = h;
    configured = true;
    return true;
}

void FrameBuffer::fillBlock(int16_t x, int16_t y, uint16_t w, uint16_t h, uint8_t index) {
    if (index >= indexLimit) {
        rejected++;
        return;
    }

    // Clip to grid
    int32_t x0 = x < 0 ? 0 : x;
    int32_t y0 = y < 0 ? 0 : y;
    int32_t x1 = static_cast<int32_t>(x) + w;
    int32_t y1 = static_cast<int32_t>(y) + h;
    if (x1 > width) x1 = width;
    if (y1 > height) y1 = height;
    if (x0 >= x1 || y0 >= y1) return;

    for (int32_t row = y0; row < y1; row++) {
        memset(pixels + static_cast<size_t>(row) * width + x0, index, static_cast<size_t>(x1 - x0));
    }
}

void FrameBuffer::fill(uint8_t index) {
    if (index >= indexLimit) {
        rejected++;
        return;
    }
    memset(pixels, index, size());
}

void FrameBuffer::clear() {
    memset(pixels, 0, size());
}

} // namespace reverie
