#ifndef REVERIE_PALETTE_H
#define REVERIE_PALETTE_H

#include <FastLED.h>
#include "../constants.h"

namespace reverie {

/**
 * Built-in palette definitions, one per effect family
 */
enum class PalettePreset : uint8_t {
    Rainbow = 0,
    Spiral,
    Matrix,
    Neon,       // 8 hue bands of shades, entry 0 black
    Fractal,    // Entry 0 black (inside the set)
    Fire,
    Starfield,  // Entry 0 black (space)
    Wave,
    Streamers,  // Entry 0 black (background)
    COUNT
};

const char* paletteName(PalettePreset preset);

/**
 * Palette - Fixed-capacity ordered table of colors
 *
 * The engine rebuilds it from a preset before each effect's init and then
 * lends it to the effect as const for the whole window. getGeneration()
 * changes on every load so display collaborators can cache conversions.
 */
class Palette {
public:
    Palette();

    // Rebuild entries from a preset. Fails if size is 0 or over capacity.
    bool load(PalettePreset preset, uint16_t size);

    uint16_t size() const { return count; }

    // Out-of-range reads return entry 0
    const CRGB& operator[](uint16_t i) const {
        return i < count ? entries[i] : entries[0];
    }

    const CRGB* getEntries() const { return entries; }
    PalettePreset getPreset() const { return preset; }
    uint32_t getGeneration() const { return generation; }

    static constexpr size_t capacityBytes() { return sizeof(CRGB) * MAX_PALETTE_SIZE; }

private:
    CRGB entries[MAX_PALETTE_SIZE];
    uint16_t count;
    PalettePreset preset;
    uint32_t generation;
};

// Number of shades per hue band in a Neon palette of the given size
inline uint16_t neonShades(uint16_t paletteSize) {
    uint16_t shades = paletteSize > 1 ? (paletteSize - 1) / 8 : 0;
    return shades > 0 ? shades : 1;
}

// Number of hue bands that fit in a Neon palette of the given size
inline uint16_t neonBands(uint16_t paletteSize) {
    if (paletteSize < 2) return 0;
    uint16_t bands = (paletteSize - 1) / neonShades(paletteSize);
    return bands < 8 ? bands : 8;
}

// Map value in [0, range) onto [0, paletteSize)
inline uint8_t scaleToPalette(uint32_t value, uint32_t range, uint16_t paletteSize) {
    if (range == 0 || paletteSize == 0) return 0;
    uint32_t idx = (value * paletteSize) / range;
    return static_cast<uint8_t>(idx < paletteSize ? idx : paletteSize - 1);
}

} // namespace reverie

#endif // REVERIE_PALETTE_H
