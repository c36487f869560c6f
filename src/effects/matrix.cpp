/**
 * Matrix Rain - Falling green trails on a coarse character grid
 *
 * 20 x 15 cells (8 x 8 pixels each at 160 x 120). Every column carries one
 * drop with an 8-cell fading trail; drops that leave the bottom respawn
 * above the top, and idle columns wake up at random.
 */

#include "effects.h"
#include "../core/rng.h"

namespace reverie {

namespace {

constexpr uint8_t MATRIX_COLUMNS = 20;
constexpr uint8_t MATRIX_ROWS = 15;
constexpr uint8_t MATRIX_TRAIL = 8;
constexpr uint8_t MATRIX_MAX_SHADE = 15;

// Drop positions are in tenths of a cell
constexpr int16_t MATRIX_FALL_PER_SPEED = 3;

struct Drop {
    int16_t pos;
    uint8_t speed;      // 1-3
    uint8_t active;
};

// Floor division by 10 for negative positions
inline int16_t cellOf(int16_t pos) {
    return pos >= 0 ? pos / 10 : -((-pos + 9) / 10);
}

class MatrixEffect : public Effect {
public:
    static constexpr uint16_t SCRATCH_BYTES = MATRIX_COLUMNS * sizeof(Drop);

    MatrixEffect() : drops(nullptr), cellW(0), cellH(0), shadeScale(0) {}

    EngineError init(EffectContext& ctx) override {
        cellW = ctx.frame.getWidth() / MATRIX_COLUMNS;
        cellH = ctx.frame.getHeight() / MATRIX_ROWS;
        if (cellW == 0 || cellH == 0 || ctx.palette.size() < 2) {
            return EngineError::EffectInit;
        }
        shadeScale = ctx.palette.size() - 1;

        EngineError err = ctx.memory.checkBudget(SCRATCH_BYTES);
        if (err != EngineError::None) return err;

        drops = ctx.memory.claimArray<Drop>(MATRIX_COLUMNS);
        if (!drops) return EngineError::Memory;

        rng.seed(foldSeed(ctx.seed));
        for (uint8_t i = 0; i < MATRIX_COLUMNS; i++) {
            drops[i].pos = static_cast<int16_t>((static_cast<int16_t>(rng.next8(MATRIX_ROWS + 11)) - 10) * 10);
            drops[i].speed = rng.next8(1, 4);
            drops[i].active = rng.next8(2);
        }
        return EngineError::None;
    }

    void step(FrameBuffer& frame, const Palette& palette, uint32_t frameIndex) override {
        (void)palette;
        (void)frameIndex;

        frame.clear();

        for (uint8_t col = 0; col < MATRIX_COLUMNS; col++) {
            Drop& d = drops[col];

            if (!d.active) {
                // 5% chance per frame to wake up
                if (rng.next8(101) < 5) {
                    d.active = 1;
                    d.pos = respawnPos();
                }
                continue;
            }

            int16_t head = cellOf(d.pos);
            for (uint8_t t = 0; t < MATRIX_TRAIL; t++) {
                int16_t row = head - t;
                if (row < 0 || row >= MATRIX_ROWS) continue;

                uint8_t shade = t == 0 ? MATRIX_MAX_SHADE : MATRIX_MAX_SHADE - 2 * t;
                uint8_t idx = static_cast<uint8_t>((shade * shadeScale) / MATRIX_MAX_SHADE);
                frame.fillBlock(col * cellW, row * cellH, cellW, cellH, idx);
            }

            d.pos += d.speed * MATRIX_FALL_PER_SPEED;
            if (d.pos > (MATRIX_ROWS + 5) * 10) {
                d.pos = respawnPos();
                d.speed = rng.next8(1, 4);
                d.active = rng.next8(4) != 0;   // Sometimes pause
            }
        }
    }

    void teardown(MemoryGuardian& memory) override {
        memory.release(drops);
        drops = nullptr;
    }

private:
    // Somewhere 5-15 cells above the top
    int16_t respawnPos() {
        return static_cast<int16_t>(-(static_cast<int16_t>(rng.next8(5, 16)) * 10));
    }

    Drop* drops;
    Rng16 rng;
    uint16_t cellW;
    uint16_t cellH;
    uint16_t shadeScale;
};

} // namespace

const EffectDescriptor MATRIX_EFFECT =
    DESCRIBE_EFFECT(MatrixEffect, "matrix", "Matrix Rain", Matrix, 16, MatrixEffect::SCRATCH_BYTES);

} // namespace reverie
