/**
 * Plasma Lite - The baseline effect
 *
 * Claims no scratch at all and has no preconditions, so it can always start.
 * The engine runs it from a slot outside the arena when nothing in the
 * rotation fits. Draws 4x4 blocks straight from sin8.
 */

#include "effects.h"

namespace reverie {

namespace {

constexpr uint8_t LITE_BLOCK = 4;

class PlasmaLiteEffect : public Effect {
public:
    PlasmaLiteEffect() : driftA(0), driftB(0) {}

    EngineError init(EffectContext& ctx) override {
        driftA = static_cast<uint8_t>(ctx.seed);
        driftB = static_cast<uint8_t>(ctx.seed >> 8);
        return EngineError::None;
    }

    void step(FrameBuffer& frame, const Palette& palette, uint32_t frameIndex) override {
        (void)frameIndex;

        driftA += 4;
        driftB += 3;

        const uint16_t n = palette.size();
        for (uint16_t y = 0; y < frame.getHeight(); y += LITE_BLOCK) {
            uint8_t rowWave = sin8(static_cast<uint8_t>(y * 6) + driftB);
            for (uint16_t x = 0; x < frame.getWidth(); x += LITE_BLOCK) {
                uint16_t v = sin8(static_cast<uint8_t>(x * 8) + driftA) + rowWave;
                frame.fillBlock(x, y, LITE_BLOCK, LITE_BLOCK, scaleToPalette(v, 511, n));
            }
        }
    }

    void teardown(MemoryGuardian& memory) override {
        (void)memory;
    }

private:
    uint8_t driftA;
    uint8_t driftB;
};

} // namespace

const EffectDescriptor PLASMA_LITE_EFFECT =
    DESCRIBE_EFFECT(PlasmaLiteEffect, "plasma-lite", "Plasma Lite", Rainbow, 0, 0);

} // namespace reverie
