/**
 * Streamers - Wavy colored ribbons drifting across the screen
 *
 * Eight streamers, each a 90-pixel sine ribbon of 1-3 pixel thickness that
 * slides left or right while its wave rolls. When one leaves the screen it
 * comes back from the opposite side with new shape and color.
 */

#include "effects.h"
#include "../core/rng.h"
#include <cstdlib>

namespace reverie {

namespace {

constexpr uint8_t STREAMER_COUNT = 8;
constexpr int16_t STREAMER_BEHIND = 30;         // Ribbon extent around its anchor
constexpr int16_t STREAMER_AHEAD = 60;
constexpr int16_t STREAMER_MARGIN = 50;         // Off-screen distance before respawn

struct Streamer {
    int32_t anchor;     // x of the ribbon anchor, 24.8
    uint16_t phase;     // sin8 units, 8.8
    uint16_t freq;      // sin8 units per pixel, 8.8 (0.05-0.15 rad)
    uint16_t roll;      // Phase advance per frame, 8.8 (0.02-0.08 rad)
    uint16_t speed;     // Pixels per frame, 8.8 (0.5-2.0)
    int16_t baseY;
    uint8_t amplitude;  // 5-25 pixels
    uint8_t color;
    uint8_t thickness;  // 1-3
    int8_t direction;
};

class StreamersEffect : public Effect {
public:
    static constexpr uint16_t SCRATCH_BYTES = STREAMER_COUNT * sizeof(Streamer);

    StreamersEffect() : streamers(nullptr), width(0), height(0), colors(0) {}

    EngineError init(EffectContext& ctx) override {
        width = ctx.frame.getWidth();
        height = ctx.frame.getHeight();
        colors = ctx.palette.size();
        if (width < 2 || height < 21 || colors < 2) {
            return EngineError::EffectInit;
        }

        EngineError err = ctx.memory.checkBudget(SCRATCH_BYTES);
        if (err != EngineError::None) return err;

        streamers = ctx.memory.claimArray<Streamer>(STREAMER_COUNT);
        if (!streamers) return EngineError::Memory;

        rng.seed(foldSeed(ctx.seed));
        for (uint8_t i = 0; i < STREAMER_COUNT; i++) {
            Streamer& s = streamers[i];
            s.anchor = static_cast<int32_t>(rng.next16(width + 41)) - 20;
            s.anchor <<= 8;
            s.phase = rng.next16();
            s.direction = rng.next8(2) ? 1 : -1;
            reshape(s);
        }
        return EngineError::None;
    }

    void step(FrameBuffer& frame, const Palette& palette, uint32_t frameIndex) override {
        (void)palette;
        (void)frameIndex;

        frame.clear();

        for (uint8_t i = 0; i < STREAMER_COUNT; i++) {
            Streamer& s = streamers[i];
            s.anchor += static_cast<int32_t>(s.speed) * s.direction;
            s.phase += s.roll;

            int32_t ax = s.anchor >> 8;
            if (s.direction > 0 && ax > width + STREAMER_MARGIN) {
                s.anchor = -(static_cast<int32_t>(rng.next8(20, 51)) << 8);
                reshape(s);
            } else if (s.direction < 0 && ax < -STREAMER_MARGIN) {
                s.anchor = (static_cast<int32_t>(width) + rng.next8(20, 51)) << 8;
                reshape(s);
            }

            draw(frame, s);
        }
    }

    void teardown(MemoryGuardian& memory) override {
        memory.release(streamers);
        streamers = nullptr;
    }

private:
    void reshape(Streamer& s) {
        s.baseY = static_cast<int16_t>(rng.next16(10, height - 10));
        s.amplitude = rng.next8(5, 26);
        s.freq = rng.next16(522, 1565);
        s.speed = rng.next16(128, 513);
        s.roll = rng.next16(209, 835);
        s.color = static_cast<uint8_t>(rng.next16(1, colors));
        s.thickness = rng.next8(1, 4);
    }

    void draw(FrameBuffer& frame, const Streamer& s) {
        const int32_t ax = s.anchor >> 8;
        int32_t startX = clampX(ax - STREAMER_BEHIND);
        int32_t endX = clampX(ax + STREAMER_AHEAD);

        bool havePrev = false;
        int16_t prevX = 0;
        int16_t prevY = 0;

        for (int32_t x = startX; x < endX; x += 2) {
            if (x < 0 || x >= width) continue;

            // Wave is anchored to the ribbon, so it travels with it
            uint8_t arg = static_cast<uint8_t>((((x - ax) * s.freq) + s.phase) >> 8);
            int16_t y = static_cast<int16_t>(s.baseY + ((static_cast<int16_t>(sin8(arg)) - 128) * s.amplitude) / 128);

            for (uint8_t t = 0; t < s.thickness; t++) {
                int16_t py = y + t - s.thickness / 2;
                if (py < 0 || py >= static_cast<int16_t>(height)) continue;
                frame.set(static_cast<int16_t>(x), py, s.color);

                // Fill the gap back to the previous sample
                if (havePrev && x - prevX <= 2 && abs(py - prevY) <= 4) {
                    int16_t midY = static_cast<int16_t>((py + prevY) / 2);
                    if (midY >= 0 && midY < static_cast<int16_t>(height)) {
                        frame.set(prevX, midY, s.color);
                    }
                }
            }

            havePrev = true;
            prevX = static_cast<int16_t>(x);
            prevY = y;
        }
    }

    int32_t clampX(int32_t x) const {
        if (x < -10) return -10;
        if (x > width + 10) return width + 10;
        return x;
    }

    Streamer* streamers;
    Rng16 rng;
    uint16_t width;
    uint16_t height;
    uint16_t colors;
};

} // namespace

const EffectDescriptor STREAMERS_EFFECT =
    DESCRIBE_EFFECT(StreamersEffect, "streamers", "Streamers", Streamers, 32, StreamersEffect::SCRATCH_BYTES);

} // namespace reverie
