/**
 * Spiral effect - Rotating two-arm spiral over a radial ripple
 *
 * value = (sin(0.3 d + 2 angle + spin) + cos(0.1 d + pulse)) / 2
 *
 * Distance and angle are symmetric about the center, so init tables one
 * quadrant (3 bytes per cell) and step mirrors it. Doubling the angle maps
 * a half turn onto a full sin8 period, which makes the mirror a negation.
 */

#include "effects.h"
#include <cmath>

namespace reverie {

namespace {

constexpr float SPIRAL_UNITS_PER_RAD = 256.0f / 6.2831853f;
constexpr int16_t SPIRAL_SPIN_STEP = -1981;    // 0.24 rad inward minus 0.05 rad rotation, 8.8
constexpr uint16_t SPIRAL_PULSE_STEP = 834;     // 0.08 rad per frame, 8.8

struct SpiralCell {
    uint8_t arm;        // 0.3 * distance
    uint8_t ripple;     // 0.1 * distance
    uint8_t angle;      // 2 * atan2 within the quadrant
};

class SpiralEffect : public Effect {
public:
    static constexpr uint16_t QUAD_CELLS =
        (MAX_FRAME_WIDTH - MAX_FRAME_WIDTH / 2 + 1) * (MAX_FRAME_HEIGHT - MAX_FRAME_HEIGHT / 2 + 1);
    static constexpr uint16_t SCRATCH_BYTES = QUAD_CELLS * sizeof(SpiralCell);

    SpiralEffect()
        : cells(nullptr), width(0), height(0), centerX(0), centerY(0)
        , quadW(0), quadH(0), spin(0), pulse(0) {}

    EngineError init(EffectContext& ctx) override {
        width = ctx.frame.getWidth();
        height = ctx.frame.getHeight();
        if (width < 2 || height < 2 || ctx.palette.size() < 2) {
            return EngineError::EffectInit;
        }

        centerX = width / 2;
        centerY = height / 2;
        quadW = (width - centerX > centerX ? width - centerX : centerX) + 1;
        quadH = (height - centerY > centerY ? height - centerY : centerY) + 1;

        const size_t count = static_cast<size_t>(quadW) * quadH;
        EngineError err = ctx.memory.checkBudget(count * sizeof(SpiralCell));
        if (err != EngineError::None) return err;

        cells = ctx.memory.claimArray<SpiralCell>(count);
        if (!cells) return EngineError::Memory;

        for (uint16_t dy = 0; dy < quadH; dy++) {
            for (uint16_t dx = 0; dx < quadW; dx++) {
                float d = sqrtf(static_cast<float>(dx * dx + dy * dy));
                float a = atan2f(static_cast<float>(dy), static_cast<float>(dx));
                SpiralCell& c = cells[dy * quadW + dx];
                c.arm = static_cast<uint8_t>(static_cast<uint32_t>(d * 0.3f * SPIRAL_UNITS_PER_RAD));
                c.ripple = static_cast<uint8_t>(static_cast<uint32_t>(d * 0.1f * SPIRAL_UNITS_PER_RAD));
                c.angle = static_cast<uint8_t>(a * 2.0f * SPIRAL_UNITS_PER_RAD);
            }
        }

        spin = static_cast<uint16_t>(ctx.seed << 8);
        pulse = 0;
        return EngineError::None;
    }

    void step(FrameBuffer& frame, const Palette& palette, uint32_t frameIndex) override {
        (void)frameIndex;

        spin += SPIRAL_SPIN_STEP;
        pulse += SPIRAL_PULSE_STEP;
        const uint8_t s = spin >> 8;
        const uint8_t p = pulse >> 8;
        const uint16_t n = palette.size();

        for (uint16_t y = 0; y < height; y++) {
            bool above = y < centerY;
            uint16_t dy = above ? centerY - y : y - centerY;
            const SpiralCell* row = cells + dy * quadW;

            for (uint16_t x = 0; x < width; x++) {
                bool left = x < centerX;
                const SpiralCell& c = row[left ? centerX - x : x - centerX];

                // Opposite-sign quadrants mirror the angle
                uint8_t angle = (left != above) ? static_cast<uint8_t>(-c.angle) : c.angle;
                uint16_t v = sin8(c.arm + angle + s) + cos8(c.ripple + p);   // 0-510
                frame.set(x, y, scaleToPalette(v, 511, n));
            }
        }
    }

    void teardown(MemoryGuardian& memory) override {
        memory.release(cells);
        cells = nullptr;
    }

private:
    SpiralCell* cells;
    uint16_t width;
    uint16_t height;
    uint16_t centerX;
    uint16_t centerY;
    uint16_t quadW;
    uint16_t quadH;
    uint16_t spin;
    uint16_t pulse;
};

} // namespace

const EffectDescriptor SPIRAL_EFFECT =
    DESCRIBE_EFFECT(SpiralEffect, "spiral", "Spiral", Spiral, 32, SpiralEffect::SCRATCH_BYTES);

} // namespace reverie
