/**
 * Fire effect - Rising heat on a cellular grid
 *
 * Heat grid at half resolution (80 x 60 for 160 x 120), drawn as 2 x 2
 * blocks. Each cell takes the average of itself, its neighbors and the row
 * below, minus a random cooling, so heat drifts upward and fades. The
 * bottom row is a flickering source that never goes out.
 */

#include "effects.h"
#include "../core/rng.h"
#include <cstring>

namespace reverie {

namespace {

constexpr uint8_t FIRE_BLOCK = 2;
constexpr uint8_t FIRE_MAX_HEAT = 31;
constexpr uint8_t FIRE_SOURCE_HEAT = 28;
constexpr uint8_t FIRE_SOURCE_MIN = 20;

class FireEffect : public Effect {
public:
    static constexpr uint16_t MAX_GRID_W = MAX_FRAME_WIDTH / FIRE_BLOCK;
    static constexpr uint16_t MAX_GRID_H = MAX_FRAME_HEIGHT / FIRE_BLOCK;
    static constexpr uint16_t SCRATCH_BYTES = MAX_GRID_W * MAX_GRID_H;

    FireEffect() : heat(nullptr), gridW(0), gridH(0), heatScale(0) {}

    EngineError init(EffectContext& ctx) override {
        gridW = ctx.frame.getWidth() / FIRE_BLOCK;
        gridH = ctx.frame.getHeight() / FIRE_BLOCK;
        if (gridW < 3 || gridH < 2 || ctx.palette.size() < 2) {
            return EngineError::EffectInit;
        }
        heatScale = ctx.palette.size() - 1;

        const size_t cells = static_cast<size_t>(gridW) * gridH;
        EngineError err = ctx.memory.checkBudget(cells);
        if (err != EngineError::None) return err;

        heat = ctx.memory.claimArray<uint8_t>(cells);
        if (!heat) return EngineError::Memory;

        memset(heat, 0, cells);
        memset(heat + (gridH - 1) * gridW, FIRE_MAX_HEAT, gridW);
        rng.seed(foldSeed(ctx.seed));
        return EngineError::None;
    }

    void step(FrameBuffer& frame, const Palette& palette, uint32_t frameIndex) override {
        (void)palette;
        (void)frameIndex;

        spread();
        refreshSource();

        for (uint16_t y = 0; y < gridH; y++) {
            const uint8_t* row = heat + y * gridW;
            for (uint16_t x = 0; x < gridW; x++) {
                uint8_t idx = static_cast<uint8_t>((row[x] * heatScale) / FIRE_MAX_HEAT);
                frame.fillBlock(x * FIRE_BLOCK, y * FIRE_BLOCK, FIRE_BLOCK, FIRE_BLOCK, idx);
            }
        }
    }

    void teardown(MemoryGuardian& memory) override {
        memory.release(heat);
        heat = nullptr;
    }

private:
    // Bottom-up, in place, so each row sees the freshly updated row below
    void spread() {
        for (int16_t y = gridH - 2; y >= 0; y--) {
            for (uint16_t x = 0; x < gridW; x++) {
                uint16_t sum = 0;
                uint8_t count = 0;
                for (int8_t dx = -1; dx <= 1; dx++) {
                    int16_t nx = static_cast<int16_t>(x) + dx;
                    if (nx < 0 || nx >= static_cast<int16_t>(gridW)) continue;
                    sum += heat[y * gridW + nx] + heat[(y + 1) * gridW + nx];
                    count += 2;
                }

                int16_t h = static_cast<int16_t>(sum / count) - rng.next8(1, 4);
                if (rng.next8(11) < 3) {
                    h -= rng.next8(3);      // Flicker
                }
                if (h < 0) h = 0;
                if (h > FIRE_MAX_HEAT) h = FIRE_MAX_HEAT;
                heat[y * gridW + x] = static_cast<uint8_t>(h);
            }
        }
    }

    void refreshSource() {
        uint8_t* source = heat + (gridH - 1) * gridW;
        for (uint16_t x = 0; x < gridW; x++) {
            int16_t h = FIRE_SOURCE_HEAT + static_cast<int16_t>(rng.next8(7)) - 3;
            if (h < FIRE_SOURCE_MIN) h = FIRE_SOURCE_MIN;
            if (h > FIRE_MAX_HEAT) h = FIRE_MAX_HEAT;
            source[x] = static_cast<uint8_t>(h);
        }
    }

    uint8_t* heat;
    Rng16 rng;
    uint16_t gridW;
    uint16_t gridH;
    uint16_t heatScale;
};

} // namespace

const EffectDescriptor FIRE_EFFECT =
    DESCRIBE_EFFECT(FireEffect, "fire", "Fire", Fire, 32, FireEffect::SCRATCH_BYTES);

} // namespace reverie
