#ifndef REVERIE_FRAME_BUFFER_H
#define REVERIE_FRAME_BUFFER_H

#include <cstdint>
#include <cstddef>
#include "../constants.h"

namespace reverie {

/**
 * FrameBuffer - The single reusable grid of palette indices
 *
 * This is the surface every effect draws on. It provides:
 * - Fixed storage sized at compile time (never resized or reallocated)
 * - Bounds-checked writes only: a write outside width x height, or with an
 *   index at or above the bound palette's size, is dropped and counted
 * - Row access for the display collaborator
 *
 * The logical size is configured exactly once, when the engine starts.
 * The engine compares rejectedWrites() before and after every step; any
 * increase halts the engine, so the write itself never reaches memory.
 */
class FrameBuffer {
public:
    FrameBuffer();

    // Set logical size (once). Fails if already configured or over capacity.
    bool configure(uint16_t w, uint16_t h);
    bool isConfigured() const { return configured; }

    uint16_t getWidth() const { return width; }
    uint16_t getHeight() const { return height; }
    size_t size() const { return static_cast<size_t>(width) * height; }

    // Palette size currently bound (exclusive upper limit for indices)
    void setIndexLimit(uint16_t limit) { indexLimit = limit; }
    uint16_t getIndexLimit() const { return indexLimit; }

    // --- Bounds-checked access ---

    void set(int16_t x, int16_t y, uint8_t index) {
        if (!contains(x, y) || index >= indexLimit) {
            rejected++;
            return;
        }
        pixels[static_cast<size_t>(y) * width + x] = index;
    }

    // Reads outside the grid return 0
    uint8_t get(int16_t x, int16_t y) const {
        if (!contains(x, y)) return 0;
        return pixels[static_cast<size_t>(y) * width + x];
    }

    bool contains(int16_t x, int16_t y) const {
        return x >= 0 && y >= 0 && x < static_cast<int16_t>(width) && y < static_cast<int16_t>(height);
    }

    // Fill a rectangle, clipped to the grid (clipping is not a rejected write)
    void fillBlock(int16_t x, int16_t y, uint16_t w, uint16_t h, uint8_t index);

    // Fill the whole grid
    void fill(uint8_t index);

    // Logical clear to index 0 (always valid)
    void clear();

    // --- Read-only access for the display collaborator ---

    const uint8_t* row(uint16_t y) const {
        return y < height ? pixels + static_cast<size_t>(y) * width : nullptr;
    }
    const uint8_t* data() const { return pixels; }

    uint32_t getRejectedWrites() const { return rejected; }

    // Bytes of fixed storage (for memory accounting)
    static constexpr size_t capacityBytes() {
        return static_cast<size_t>(MAX_FRAME_WIDTH) * MAX_FRAME_HEIGHT;
    }

private:
    uint8_t pixels[static_cast<size_t>(MAX_FRAME_WIDTH) * MAX_FRAME_HEIGHT];
    uint16_t width;
    uint16_t height;
    uint16_t indexLimit;
    uint32_t rejected;
    bool configured;
};

} // namespace reverie

#endif // REVERIE_FRAME_BUFFER_H
