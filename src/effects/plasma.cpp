/**
 * Plasma effect - Two crossing sine fields
 *
 * Each pixel is sin(x) + sin(y), with the two fields drifting at different
 * rates. Per-column and per-row phases are tabled in init; per-frame sine
 * values are tabled once per step, so the inner loop is a single add.
 */

#include "effects.h"

namespace reverie {

namespace {

// Phase increments in sin8 units (256 per turn), 8.8 fixed point
constexpr uint16_t PLASMA_COL_STEP = 2086;     // 0.2 rad per column
constexpr uint16_t PLASMA_ROW_STEP = 1564;     // 0.15 rad per row
constexpr uint16_t PLASMA_DRIFT_A = 1043;      // 0.1 rad per frame
constexpr uint16_t PLASMA_DRIFT_B = 834;       // 0.08 rad per frame

class PlasmaEffect : public Effect {
public:
    static constexpr uint16_t SCRATCH_BYTES = 2 * (MAX_FRAME_WIDTH + MAX_FRAME_HEIGHT);

    PlasmaEffect()
        : colPhase(nullptr), rowPhase(nullptr), colValue(nullptr), rowValue(nullptr)
        , width(0), height(0), driftA(0), driftB(0) {}

    EngineError init(EffectContext& ctx) override {
        width = ctx.frame.getWidth();
        height = ctx.frame.getHeight();
        if (ctx.palette.size() < 2) {
            return EngineError::EffectInit;
        }

        EngineError err = ctx.memory.checkBudget(2u * (width + height));
        if (err != EngineError::None) return err;

        colPhase = ctx.memory.claimArray<uint8_t>(width);
        rowPhase = ctx.memory.claimArray<uint8_t>(height);
        colValue = ctx.memory.claimArray<uint8_t>(width);
        rowValue = ctx.memory.claimArray<uint8_t>(height);
        if (!colPhase || !rowPhase || !colValue || !rowValue) {
            return EngineError::Memory;
        }

        for (uint16_t x = 0; x < width; x++) {
            colPhase[x] = static_cast<uint8_t>((static_cast<uint32_t>(x) * PLASMA_COL_STEP) >> 8);
        }
        for (uint16_t y = 0; y < height; y++) {
            rowPhase[y] = static_cast<uint8_t>((static_cast<uint32_t>(y) * PLASMA_ROW_STEP) >> 8);
        }

        // Phase offset from the seed so different slots do not look identical
        driftA = static_cast<uint16_t>(ctx.seed << 8);
        driftB = static_cast<uint16_t>(ctx.seed >> 8);
        return EngineError::None;
    }

    void step(FrameBuffer& frame, const Palette& palette, uint32_t frameIndex) override {
        (void)frameIndex;

        driftA += PLASMA_DRIFT_A;
        driftB += PLASMA_DRIFT_B;
        const uint8_t a = driftA >> 8;
        const uint8_t b = driftB >> 8;

        for (uint16_t x = 0; x < width; x++) colValue[x] = sin8(colPhase[x] + a);
        for (uint16_t y = 0; y < height; y++) rowValue[y] = sin8(rowPhase[y] + b);

        const uint16_t n = palette.size();
        for (uint16_t y = 0; y < height; y++) {
            for (uint16_t x = 0; x < width; x++) {
                uint16_t v = colValue[x] + rowValue[y];    // 0-510
                frame.set(x, y, scaleToPalette(v, 511, n));
            }
        }
    }

    void teardown(MemoryGuardian& memory) override {
        memory.release(colPhase);
        memory.release(rowPhase);
        memory.release(colValue);
        memory.release(rowValue);
        colPhase = rowPhase = colValue = rowValue = nullptr;
    }

private:
    uint8_t* colPhase;
    uint8_t* rowPhase;
    uint8_t* colValue;
    uint8_t* rowValue;
    uint16_t width;
    uint16_t height;
    uint16_t driftA;
    uint16_t driftB;
};

} // namespace

const EffectDescriptor PLASMA_EFFECT =
    DESCRIBE_EFFECT(PlasmaEffect, "plasma", "Plasma Field", Rainbow, 64, PlasmaEffect::SCRATCH_BYTES);

} // namespace reverie
