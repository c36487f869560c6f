/**
 * Starfield - Flying through space
 *
 * 150 stars drift outward from the center, speeding up as they go and
 * brightening as they approach. A slow "warp" sine scales every star's
 * speed. Stars that leave the screen or pass the viewer respawn near the
 * center, far away.
 *
 * Positions and depth are 24.8 fixed point.
 */

#include "effects.h"
#include "../core/rng.h"

namespace reverie {

namespace {

constexpr uint8_t STAR_COUNT = 150;
constexpr uint8_t STAR_MAX_SHADE = 15;
constexpr int32_t STAR_NEAR_Z = 1 << 8;         // Passed the viewer
constexpr int32_t STAR_BIG_Z = 20 << 8;         // Closer than this draws 2 x 2
constexpr uint16_t STAR_WARP_STEP = 313;        // 0.03 rad per frame, sin16 units

struct Star {
    int32_t x;
    int32_t y;
    int32_t z;
    uint16_t speed;     // 8.8, 0.5-2.0
    uint8_t brightness; // 5-15
};

class StarfieldEffect : public Effect {
public:
    static constexpr uint16_t SCRATCH_BYTES = STAR_COUNT * sizeof(Star);

    StarfieldEffect()
        : stars(nullptr), width(0), height(0), centerX(0), centerY(0)
        , warpPhase(0), shadeScale(0) {}

    EngineError init(EffectContext& ctx) override {
        width = ctx.frame.getWidth();
        height = ctx.frame.getHeight();
        if (width < 2 || height < 2 || ctx.palette.size() < 2) {
            return EngineError::EffectInit;
        }
        shadeScale = ctx.palette.size() - 1;
        centerX = static_cast<int32_t>(width / 2) << 8;
        centerY = static_cast<int32_t>(height / 2) << 8;

        EngineError err = ctx.memory.checkBudget(SCRATCH_BYTES);
        if (err != EngineError::None) return err;

        stars = ctx.memory.claimArray<Star>(STAR_COUNT);
        if (!stars) return EngineError::Memory;

        rng.seed(foldSeed(ctx.seed));
        for (uint8_t i = 0; i < STAR_COUNT; i++) {
            place(stars[i], rng.next8(1, 101), rng.next16(1 << 8, 50 << 8));
        }
        warpPhase = 0;
        return EngineError::None;
    }

    void step(FrameBuffer& frame, const Palette& palette, uint32_t frameIndex) override {
        (void)palette;
        (void)frameIndex;

        warpPhase += STAR_WARP_STEP;
        // 1.0 +/- 0.5, 8.8
        const int32_t warp = 256 + (static_cast<int32_t>(sin16(warpPhase)) >> 8);

        frame.clear();

        for (uint8_t i = 0; i < STAR_COUNT; i++) {
            Star& s = stars[i];
            const int64_t pace = static_cast<int64_t>(s.speed) * warp;     // 16.16

            // Outward by 2% of the offset per frame, scaled by speed and warp
            s.x += static_cast<int32_t>(((s.x - centerX) * pace * 5) >> 24);
            s.y += static_cast<int32_t>(((s.y - centerY) * pace * 5) >> 24);
            s.z -= static_cast<int32_t>(pace >> 9);

            const int32_t sx = s.x >> 8;
            const int32_t sy = s.y >> 8;
            if (sx < 0 || sx >= width || sy < 0 || sy >= height || s.z < STAR_NEAR_Z) {
                respawn(s);
                continue;
            }

            // Brightness scales with 30 / z
            int32_t shade = (static_cast<int32_t>(s.brightness) * (30 << 8)) / s.z;
            if (shade < 1) shade = 1;
            if (shade > STAR_MAX_SHADE) shade = STAR_MAX_SHADE;
            uint8_t idx = static_cast<uint8_t>((shade * shadeScale) / STAR_MAX_SHADE);

            if (s.z < STAR_BIG_Z) {
                frame.fillBlock(sx, sy, 2, 2, idx);
            } else {
                frame.set(sx, sy, idx);
            }
        }
    }

    void teardown(MemoryGuardian& memory) override {
        memory.release(stars);
        stars = nullptr;
    }

private:
    void place(Star& s, uint8_t distance, uint16_t depth) {
        uint16_t angle = rng.next16();
        s.x = centerX + ((static_cast<int32_t>(distance) * cos16(angle)) >> 7);
        s.y = centerY + ((static_cast<int32_t>(distance) * sin16(angle)) >> 7);
        s.z = depth;
        s.brightness = rng.next8(5, 16);
        s.speed = rng.next16(128, 512);
    }

    // Back near the center, far away
    void respawn(Star& s) {
        place(s, rng.next8(1, 6), rng.next16(30 << 8, 50 << 8));
    }

    Star* stars;
    Rng16 rng;
    uint16_t width;
    uint16_t height;
    int32_t centerX;
    int32_t centerY;
    uint16_t warpPhase;
    uint16_t shadeScale;
};

} // namespace

const EffectDescriptor STARFIELD_EFFECT =
    DESCRIBE_EFFECT(StarfieldEffect, "starfield", "Starfield", Starfield, 16, StarfieldEffect::SCRATCH_BYTES);

} // namespace reverie
