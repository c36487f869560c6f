/**
 * Julia Fractal - Morphing Julia set with cycling colors
 *
 * z = z^2 + c, with c and the zoom drifting on slow sine phases. Rendered
 * on a 2 x 2 block grid; escape count selects the color, rotated by a
 * per-frame offset. Points that never escape use entry 0 (black).
 */

#include "effects.h"

namespace reverie {

namespace {

constexpr uint8_t JULIA_BLOCK = 2;
constexpr uint8_t JULIA_MAX_ITERATIONS = 20;
constexpr float JULIA_CENTER_X = -0.7f;
constexpr float JULIA_CENTER_Y = 0.0f;

// sin16 phase steps (65536 per turn)
constexpr uint16_t JULIA_REAL_STEP = 261;      // 0.025 rad per frame
constexpr uint16_t JULIA_IMAG_STEP = 365;      // 0.035 rad per frame
constexpr uint16_t JULIA_ZOOM_STEP = 156;      // 0.015 rad per frame

inline float unitSine(int16_t s) {
    return static_cast<float>(s) / 32767.0f;
}

class JuliaEffect : public Effect {
public:
    static constexpr uint16_t MAX_COLS = (MAX_FRAME_WIDTH + JULIA_BLOCK - 1) / JULIA_BLOCK;
    static constexpr uint16_t MAX_ROWS = (MAX_FRAME_HEIGHT + JULIA_BLOCK - 1) / JULIA_BLOCK;
    static constexpr uint16_t SCRATCH_BYTES = (MAX_COLS + MAX_ROWS) * sizeof(float);

    JuliaEffect()
        : xBase(nullptr), yBase(nullptr), cols(0), rows(0)
        , phaseReal(0), phaseImag(0), phaseZoom(0), colorOffset(0) {}

    EngineError init(EffectContext& ctx) override {
        const uint16_t width = ctx.frame.getWidth();
        const uint16_t height = ctx.frame.getHeight();
        if (ctx.palette.size() < 2) {
            return EngineError::EffectInit;
        }

        cols = (width + JULIA_BLOCK - 1) / JULIA_BLOCK;
        rows = (height + JULIA_BLOCK - 1) / JULIA_BLOCK;

        EngineError err = ctx.memory.checkBudget((cols + rows) * sizeof(float));
        if (err != EngineError::None) return err;

        xBase = ctx.memory.claimArray<float>(cols);
        yBase = ctx.memory.claimArray<float>(rows);
        if (!xBase || !yBase) return EngineError::Memory;

        // Screen to plane, before zoom: [-2, 2) across each axis
        for (uint16_t i = 0; i < cols; i++) {
            xBase[i] = (static_cast<float>(i * JULIA_BLOCK) / width - 0.5f) * 4.0f;
        }
        for (uint16_t j = 0; j < rows; j++) {
            yBase[j] = (static_cast<float>(j * JULIA_BLOCK) / height - 0.5f) * 4.0f;
        }

        phaseReal = static_cast<uint16_t>(ctx.seed);
        phaseImag = static_cast<uint16_t>(ctx.seed >> 16);
        phaseZoom = 0;
        colorOffset = 0;
        return EngineError::None;
    }

    void step(FrameBuffer& frame, const Palette& palette, uint32_t frameIndex) override {
        (void)frameIndex;

        phaseReal += JULIA_REAL_STEP;
        phaseImag += JULIA_IMAG_STEP;
        phaseZoom += JULIA_ZOOM_STEP;
        colorOffset++;

        const float cReal = -0.4f + 0.3f * unitSine(sin16(phaseReal));
        const float cImag = 0.6f + 0.2f * unitSine(cos16(phaseImag));
        const float invZoom = 1.0f / (1.5f + 0.3f * unitSine(sin16(phaseZoom)));

        // Escape counts 1..max map onto entries 1..n-1
        const uint16_t bands = palette.size() - 1;

        for (uint16_t j = 0; j < rows; j++) {
            const float zy0 = yBase[j] * invZoom + JULIA_CENTER_Y;
            for (uint16_t i = 0; i < cols; i++) {
                const float zx0 = xBase[i] * invZoom + JULIA_CENTER_X;
                uint8_t iterations = escapeCount(zx0, zy0, cReal, cImag);

                uint8_t idx = 0;
                if (iterations != 0) {
                    idx = static_cast<uint8_t>((iterations + colorOffset) % bands + 1);
                }
                frame.fillBlock(i * JULIA_BLOCK, j * JULIA_BLOCK, JULIA_BLOCK, JULIA_BLOCK, idx);
            }
        }
    }

    void teardown(MemoryGuardian& memory) override {
        memory.release(xBase);
        memory.release(yBase);
        xBase = nullptr;
        yBase = nullptr;
    }

private:
    // 0 when the point stays bounded
    static uint8_t escapeCount(float zx, float zy, float cr, float ci) {
        for (uint8_t i = 0; i < JULIA_MAX_ITERATIONS; i++) {
            float xx = zx * zx;
            float yy = zy * zy;
            if (xx + yy > 4.0f) return i;
            zy = 2.0f * zx * zy + ci;
            zx = xx - yy + cr;
        }
        return 0;
    }

    float* xBase;
    float* yBase;
    uint16_t cols;
    uint16_t rows;
    uint16_t phaseReal;
    uint16_t phaseImag;
    uint16_t phaseZoom;
    uint8_t colorOffset;
};

} // namespace

const EffectDescriptor JULIA_EFFECT =
    DESCRIBE_EFFECT(JuliaEffect, "julia", "Julia Fractal", Fractal, 64, JuliaEffect::SCRATCH_BYTES);

} // namespace reverie
