/**
 * Wave Interference - Four circling point sources
 *
 * Each source emits a sine ring, damped by 1 / (1 + d / 100). The sources
 * orbit the center on slowly breathing radii and their frequencies wander,
 * so the interference pattern never settles. The sum picks the color, with
 * a slow hue shift on top.
 */

#include "effects.h"

namespace reverie {

namespace {

constexpr uint8_t WAVE_SOURCES = 4;
constexpr uint16_t WAVE_MAX_DISTANCE = 255;
constexpr uint16_t WAVE_TIME_STEP = 1667;       // 2 * 0.08 rad per frame, sin8 units 8.8
constexpr uint16_t WAVE_ORBIT_STEP = 156;       // 0.3 * 0.08 rad, sin16 units
constexpr uint16_t WAVE_RADIUS_STEP = 104;      // 0.2 * 0.08 rad, sin16 units
constexpr uint16_t WAVE_FREQ_STEP = 209;        // 0.4 * 0.08 rad, sin16 units
constexpr uint16_t WAVE_SHIFT_STEP = 128;       // Half an entry per frame, 8.8

// Per-source constants: amplitude (8.8) and starting phase (sin8 units)
const uint16_t WAVE_AMPLITUDE[WAVE_SOURCES] = {256, 205, 230, 179};
const uint8_t WAVE_PHASE[WAVE_SOURCES] = {0, 64, 128, 192};

struct WaveSource {
    int16_t x;
    int16_t y;
    uint16_t freq;      // sin8 units per pixel, 8.8
};

class WavesEffect : public Effect {
public:
    static constexpr uint16_t SCRATCH_BYTES = WAVE_MAX_DISTANCE + 1;

    WavesEffect()
        : attenuation(nullptr), width(0), height(0), time(0), orbit(0)
        , radius(0), wander(0), shift(0) {}

    EngineError init(EffectContext& ctx) override {
        width = ctx.frame.getWidth();
        height = ctx.frame.getHeight();
        if (ctx.palette.size() < 2) {
            return EngineError::EffectInit;
        }

        EngineError err = ctx.memory.checkBudget(SCRATCH_BYTES);
        if (err != EngineError::None) return err;

        attenuation = ctx.memory.claimArray<uint8_t>(WAVE_MAX_DISTANCE + 1);
        if (!attenuation) return EngineError::Memory;

        for (uint16_t d = 0; d <= WAVE_MAX_DISTANCE; d++) {
            attenuation[d] = static_cast<uint8_t>((255u * 100u) / (100u + d));
        }

        time = static_cast<uint16_t>(ctx.seed);
        orbit = 0;
        radius = 0;
        wander = 0;
        shift = 0;
        return EngineError::None;
    }

    void step(FrameBuffer& frame, const Palette& palette, uint32_t frameIndex) override {
        (void)frameIndex;

        time += WAVE_TIME_STEP;
        orbit += WAVE_ORBIT_STEP;
        radius += WAVE_RADIUS_STEP;
        wander += WAVE_FREQ_STEP;
        shift += WAVE_SHIFT_STEP;
        moveSources();

        const int32_t n = palette.size();
        const uint8_t t = time >> 8;
        const int32_t hue = shift >> 8;

        for (int16_t y = 0; y < static_cast<int16_t>(height); y++) {
            for (int16_t x = 0; x < static_cast<int16_t>(width); x++) {
                int32_t total = 0;
                for (uint8_t i = 0; i < WAVE_SOURCES; i++) {
                    const WaveSource& s = sources[i];
                    int32_t dx = x - s.x;
                    int32_t dy = y - s.y;
                    uint32_t d2 = static_cast<uint32_t>(dx * dx + dy * dy);
                    uint16_t d = sqrt16(d2 > 65535u ? 65535u : static_cast<uint16_t>(d2));
                    if (d > WAVE_MAX_DISTANCE) d = WAVE_MAX_DISTANCE;

                    uint8_t arg = static_cast<uint8_t>(((d * s.freq) >> 8) + WAVE_PHASE[i] + t);
                    int32_t wave = static_cast<int32_t>(sin8(arg)) - 128;
                    total += (wave * WAVE_AMPLITUDE[i] * attenuation[d]) >> 16;
                }

                // Full swing of +/-2 amplitudes (+/-256) spans the palette once
                int32_t idx = ((total + 256) * (n - 1)) / 512 + hue;
                idx %= n;
                if (idx < 0) idx += n;
                frame.set(x, y, static_cast<uint8_t>(idx));
            }
        }
    }

    void teardown(MemoryGuardian& memory) override {
        memory.release(attenuation);
        attenuation = nullptr;
    }

private:
    void moveSources() {
        const int32_t cx = width / 2;
        const int32_t cy = height / 2;
        for (uint8_t i = 0; i < WAVE_SOURCES; i++) {
            // Quarter turn apart, radius 20 +/- 15
            uint16_t angle = orbit + i * 16384;
            int32_t r = 20 * 256 + ((15 * static_cast<int32_t>(sin16(radius + i * 10430))) >> 7);
            sources[i].x = static_cast<int16_t>(cx + ((r * cos16(angle)) >> 23));
            sources[i].y = static_cast<int16_t>(cy + ((r * sin16(angle)) >> 23));

            // 0.1 + 0.05 i, +/- 0.05 rad per pixel
            int32_t freq = 1043 + i * 521 + ((521 * static_cast<int32_t>(sin16(wander + i * 10430))) >> 15);
            sources[i].freq = static_cast<uint16_t>(freq > 0 ? freq : 0);
        }
    }

    WaveSource sources[WAVE_SOURCES];
    uint8_t* attenuation;
    uint16_t width;
    uint16_t height;
    uint16_t time;
    uint16_t orbit;
    uint16_t radius;
    uint16_t wander;
    uint16_t shift;
};

} // namespace

const EffectDescriptor WAVES_EFFECT =
    DESCRIBE_EFFECT(WavesEffect, "waves", "Wave Interference", Wave, 64, WavesEffect::SCRATCH_BYTES);

} // namespace reverie
