/**
 * Palette presets
 *
 * Builders run only between effects, never per frame.
 */

#include "palette.h"
#include <cmath>
#include <cstring>

namespace reverie {

namespace {

constexpr float PI_F = 3.14159265f;

struct GradientStop {
    uint8_t pos;    // 0-255 along the palette
    CRGB color;
};

uint8_t clamp8(float v) {
    if (v < 0.0f) return 0;
    if (v > 255.0f) return 255;
    return static_cast<uint8_t>(v);
}

float unitPos(uint16_t i, uint16_t n) {
    return n > 1 ? static_cast<float>(i) / static_cast<float>(n - 1) : 0.0f;
}

// Piecewise-linear fill between stops (FastLED gradient per segment)
void fillStops(CRGB* entries, uint16_t n, const GradientStop* stops, uint8_t stopCount) {
    if (n == 1) {
        entries[0] = stops[0].color;
        return;
    }
    for (uint8_t s = 0; s + 1 < stopCount; s++) {
        uint16_t from = static_cast<uint16_t>((static_cast<uint32_t>(stops[s].pos) * (n - 1)) / 255);
        uint16_t to = static_cast<uint16_t>((static_cast<uint32_t>(stops[s + 1].pos) * (n - 1)) / 255);
        if (to <= from) {
            entries[from] = stops[s + 1].color;
            continue;
        }
        fill_gradient_RGB(entries, from, stops[s].color, to, stops[s + 1].color);
    }
}

void buildRainbow(CRGB* entries, uint16_t n) {
    for (uint16_t i = 0; i < n; i++) {
        uint8_t phase = static_cast<uint8_t>(unitPos(i, n) * 255.0f);
        entries[i] = CRGB(sin8(phase), sin8(phase + 85), sin8(phase + 170));
    }
}

void buildSpiral(CRGB* entries, uint16_t n) {
    // Blue to purple to pink
    for (uint16_t i = 0; i < n; i++) {
        float t = unitPos(i, n);
        entries[i] = CRGB(clamp8(50.0f + 205.0f * t * t),
                          clamp8(20.0f + 100.0f * sinf(t * PI_F)),
                          clamp8(255.0f - 100.0f * t));
    }
}

void buildMatrix(CRGB* entries, uint16_t n) {
    static const GradientStop stops[] = {
        {0, CRGB(0, 0, 0)},
        {255, CRGB(0, 255, 50)}
    };
    fillStops(entries, n, stops, 2);
}

void buildNeon(CRGB* entries, uint16_t n) {
    static const CRGB hues[8] = {
        CRGB(0, 255, 0), CRGB(0, 255, 255), CRGB(255, 0, 255), CRGB(255, 255, 0),
        CRGB(255, 0, 0), CRGB(0, 0, 255), CRGB(255, 128, 0), CRGB(128, 0, 255)
    };
    const uint16_t shades = neonShades(n);
    const uint16_t bands = neonBands(n);

    entries[0] = CRGB::Black;
    for (uint16_t i = 1; i < n; i++) {
        uint16_t band = (i - 1) / shades;
        if (band >= bands) {
            entries[i] = CRGB::Black;
            continue;
        }
        uint16_t shade = (i - 1) % shades;
        CRGB c = hues[band];
        c.nscale8(static_cast<uint8_t>(((shade + 1) * 255) / shades));
        entries[i] = c;
    }
}

void buildFractal(CRGB* entries, uint16_t n) {
    entries[0] = CRGB::Black;
    for (uint16_t i = 1; i < n; i++) {
        float t = unitPos(i, n);
        float intensity = 0.7f + 0.3f * sinf(t * PI_F * 12.0f);
        entries[i] = CRGB(clamp8((127.0f + 127.0f * sinf(t * PI_F * 6.0f)) * intensity),
                          clamp8((127.0f + 127.0f * sinf(t * PI_F * 4.0f + 2.0f)) * intensity),
                          clamp8((127.0f + 127.0f * sinf(t * PI_F * 8.0f + 4.0f)) * intensity));
    }
}

void buildFire(CRGB* entries, uint16_t n) {
    static const GradientStop stops[] = {
        {0,   CRGB(0, 0, 0)},
        {77,  CRGB(128, 0, 0)},
        {153, CRGB(255, 0, 0)},
        {204, CRGB(255, 165, 0)},
        {242, CRGB(255, 255, 100)},
        {255, CRGB(255, 255, 255)}
    };
    fillStops(entries, n, stops, 6);
}

void buildStarfield(CRGB* entries, uint16_t n) {
    entries[0] = CRGB::Black;
    for (uint16_t i = 1; i < n; i++) {
        float t = unitPos(i, n);
        if (t < 0.3f) {
            // Dim blue stars
            entries[i] = CRGB(clamp8(t * 100.0f), clamp8(t * 100.0f), clamp8(t * 255.0f));
        } else if (t < 0.7f) {
            uint8_t v = clamp8(t * 255.0f);
            entries[i] = CRGB(v, v, v);
        } else {
            entries[i] = CRGB::White;
        }
    }
}

void buildWave(CRGB* entries, uint16_t n) {
    static const GradientStop stops[] = {
        {0,   CRGB(0, 0, 255)},
        {51,  CRGB(0, 255, 255)},
        {102, CRGB(0, 255, 0)},
        {153, CRGB(255, 255, 0)},
        {204, CRGB(255, 128, 0)},
        {255, CRGB(255, 255, 255)}
    };
    fillStops(entries, n, stops, 6);
}

void buildStreamers(CRGB* entries, uint16_t n) {
    entries[0] = CRGB::Black;
    for (uint16_t i = 1; i < n; i++) {
        uint8_t phase = static_cast<uint8_t>(unitPos(i - 1, n - 1) * 255.0f);
        CRGB c(sin8(phase), sin8(phase + 85), sin8(phase + 170));

        // Boost saturation: stretch the brightest channel to 90%
        uint8_t peak = c.r > c.g ? c.r : c.g;
        if (c.b > peak) peak = c.b;
        if (peak > 0) {
            c.r = clamp8(c.r * 229.0f / peak);
            c.g = clamp8(c.g * 229.0f / peak);
            c.b = clamp8(c.b * 229.0f / peak);
        }
        entries[i] = c;
    }
}

} // namespace

Palette::Palette()
    : count(0)
    , preset(PalettePreset::Rainbow)
    , generation(0) {
    memset(entries, 0, sizeof(entries));
}

bool Palette::load(PalettePreset p, uint16_t size) {
    if (size == 0 || size > MAX_PALETTE_SIZE) {
        return false;
    }

    memset(entries, 0, sizeof(entries));
    switch (p) {
        case PalettePreset::Rainbow:   buildRainbow(entries, size); break;
        case PalettePreset::Spiral:    buildSpiral(entries, size); break;
        case PalettePreset::Matrix:    buildMatrix(entries, size); break;
        case PalettePreset::Neon:      buildNeon(entries, size); break;
        case PalettePreset::Fractal:   buildFractal(entries, size); break;
        case PalettePreset::Fire:      buildFire(entries, size); break;
        case PalettePreset::Starfield: buildStarfield(entries, size); break;
        case PalettePreset::Wave:      buildWave(entries, size); break;
        case PalettePreset::Streamers: buildStreamers(entries, size); break;
        default:
            return false;
    }

    count = size;
    preset = p;
    generation++;
    return true;
}

const char* paletteName(PalettePreset preset) {
    switch (preset) {
        case PalettePreset::Rainbow:   return "rainbow";
        case PalettePreset::Spiral:    return "spiral";
        case PalettePreset::Matrix:    return "matrix";
        case PalettePreset::Neon:      return "neon";
        case PalettePreset::Fractal:   return "fractal";
        case PalettePreset::Fire:      return "fire";
        case PalettePreset::Starfield: return "starfield";
        case PalettePreset::Wave:      return "wave";
        case PalettePreset::Streamers: return "streamers";
        default: return "rainbow";
    }
}

} // namespace reverie
