/**
 * Color Matrix - Multicolor rain of tiny glyphs
 *
 * A 40 x 20 grid of 4 x 6 cells. Drops fall down each column leaving 3 x 5
 * glyphs behind them; each glyph keeps the hue band of the drop that wrote
 * it and dims with age until it is cleared after 50 frames.
 *
 * Uses the Neon palette: entry 0 is black, then one run of shades per hue.
 */

#include "effects.h"
#include "../core/rng.h"

namespace reverie {

namespace {

constexpr uint8_t GLYPH_W = 3;
constexpr uint8_t GLYPH_H = 5;
constexpr uint8_t CELL_W = 4;
constexpr uint8_t CELL_H = 6;
constexpr uint8_t CM_MAX_COLUMNS = 40;
constexpr uint8_t CM_MAX_ROWS = 20;
constexpr uint8_t CM_ACTIVE_COLUMNS = 35;
constexpr uint8_t CM_MAX_AGE = 50;

// One row per byte, bit 2 is the left column
const uint8_t GLYPHS[][GLYPH_H] = {
    {7, 5, 5, 5, 7}, {2, 6, 2, 2, 7}, {7, 1, 7, 4, 7}, {7, 1, 3, 1, 7},
    {5, 5, 7, 1, 1}, {7, 4, 7, 1, 7}, {7, 4, 7, 5, 7}, {7, 1, 1, 2, 2},
    {7, 5, 7, 5, 7}, {7, 5, 7, 1, 7}, {2, 5, 7, 5, 5}, {6, 5, 6, 5, 6},
    {7, 4, 4, 4, 7}, {5, 5, 2, 5, 5}, {5, 7, 5, 7, 5}, {0, 7, 0, 7, 0}
};
constexpr uint8_t GLYPH_COUNT = sizeof(GLYPHS) / sizeof(GLYPHS[0]);

struct Glyph {
    uint8_t shape;
    uint8_t band;
    uint8_t age;        // 0 = empty cell
};

struct Stream {
    int16_t pos;        // Tenths of a cell
    uint8_t speed;      // Tenths of a cell: 5, 10, 15 or 20
    uint8_t band;
    uint8_t active;
};

inline int16_t streamRow(int16_t pos) {
    return pos >= 0 ? pos / 10 : -((-pos + 9) / 10);
}

class ColorMatrixEffect : public Effect {
public:
    static constexpr uint16_t SCRATCH_BYTES =
        CM_MAX_COLUMNS * CM_MAX_ROWS * sizeof(Glyph) + CM_MAX_COLUMNS * sizeof(Stream);

    ColorMatrixEffect()
        : glyphs(nullptr), streams(nullptr), columns(0), rows(0), bands(0), shades(0) {}

    EngineError init(EffectContext& ctx) override {
        columns = ctx.frame.getWidth() / CELL_W;
        rows = ctx.frame.getHeight() / CELL_H;
        if (columns > CM_MAX_COLUMNS) columns = CM_MAX_COLUMNS;
        if (rows > CM_MAX_ROWS) rows = CM_MAX_ROWS;

        bands = neonBands(ctx.palette.size());
        shades = neonShades(ctx.palette.size());
        if (columns == 0 || rows == 0 || bands == 0) {
            return EngineError::EffectInit;
        }

        const size_t cells = static_cast<size_t>(columns) * rows;
        EngineError err = ctx.memory.checkBudget(cells * sizeof(Glyph) + columns * sizeof(Stream));
        if (err != EngineError::None) return err;

        streams = ctx.memory.claimArray<Stream>(columns);
        glyphs = ctx.memory.claimArray<Glyph>(cells);
        if (!streams || !glyphs) return EngineError::Memory;

        rng.seed(foldSeed(ctx.seed));
        for (uint8_t c = 0; c < columns; c++) {
            Stream& s = streams[c];
            s.pos = static_cast<int16_t>((static_cast<int16_t>(rng.next8(rows + 21)) - 20) * 10);
            s.speed = randomSpeed();
            s.active = rng.next8(2);
            s.band = rng.next8(bands);
        }
        return EngineError::None;
    }

    void step(FrameBuffer& frame, const Palette& palette, uint32_t frameIndex) override {
        (void)palette;
        (void)frameIndex;

        ageGlyphs();

        const uint8_t activeColumns = columns < CM_ACTIVE_COLUMNS ? columns : CM_ACTIVE_COLUMNS;
        for (uint8_t c = 0; c < activeColumns; c++) {
            Stream& s = streams[c];

            if (!s.active) {
                if (rng.next8(151) < 3) {
                    s.active = 1;
                    s.pos = respawnPos();
                    s.band = rng.next8(bands);
                }
                continue;
            }

            // Not every frame leaves a glyph
            int16_t row = streamRow(s.pos);
            if (row >= 0 && row < rows && rng.next8(4) == 0) {
                Glyph& g = glyphs[row * columns + c];
                g.shape = rng.next8(GLYPH_COUNT);
                g.band = s.band;
                g.age = 1;
            }

            s.pos += (s.speed * 4) / 10;
            if (s.pos > (rows + 5) * 10) {
                s.pos = respawnPos();
                s.speed = randomSpeed();
                s.band = rng.next8(bands);
                s.active = rng.next8(3) != 0;
            }
        }

        draw(frame);
    }

    void teardown(MemoryGuardian& memory) override {
        memory.release(glyphs);
        memory.release(streams);
        glyphs = nullptr;
        streams = nullptr;
    }

private:
    void ageGlyphs() {
        const size_t cells = static_cast<size_t>(columns) * rows;
        for (size_t i = 0; i < cells; i++) {
            if (glyphs[i].age == 0) continue;
            glyphs[i].age++;
            if (glyphs[i].age > CM_MAX_AGE) glyphs[i].age = 0;
        }
    }

    void draw(FrameBuffer& frame) {
        frame.clear();
        for (uint8_t r = 0; r < rows; r++) {
            for (uint8_t c = 0; c < columns; c++) {
                const Glyph& g = glyphs[r * columns + c];
                if (g.age == 0) continue;

                // Brightest shade when fresh, dimming with age
                uint16_t fade = (static_cast<uint16_t>(g.age) * shades) / (CM_MAX_AGE + 1);
                uint16_t shade = shades - 1 - (fade < shades ? fade : shades - 1);
                uint8_t idx = static_cast<uint8_t>(1 + g.band * shades + shade);

                const uint8_t* bits = GLYPHS[g.shape];
                for (uint8_t gy = 0; gy < GLYPH_H; gy++) {
                    for (uint8_t gx = 0; gx < GLYPH_W; gx++) {
                        if (bits[gy] & (4 >> gx)) {
                            frame.set(c * CELL_W + gx, r * CELL_H + gy, idx);
                        }
                    }
                }
            }
        }
    }

    uint8_t randomSpeed() {
        return static_cast<uint8_t>(5 * rng.next8(1, 5));
    }

    int16_t respawnPos() {
        return static_cast<int16_t>(-(static_cast<int16_t>(rng.next8(5, 26)) * 10));
    }

    Glyph* glyphs;
    Stream* streams;
    Rng16 rng;
    uint8_t columns;
    uint8_t rows;
    uint16_t bands;
    uint16_t shades;
};

} // namespace

const EffectDescriptor COLOR_MATRIX_EFFECT =
    DESCRIBE_EFFECT(ColorMatrixEffect, "color-matrix", "Color Matrix", Neon, 64,
                    ColorMatrixEffect::SCRATCH_BYTES);

} // namespace reverie
