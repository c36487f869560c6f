#ifndef REVERIE_RNG_H
#define REVERIE_RNG_H

#include <cstdint>

namespace reverie {

/**
 * Rng16 - Per-instance pseudo-random source
 *
 * Same recurrence and range reduction as FastLED's random8()/random16(),
 * but the state lives in the effect instead of the library's global seed,
 * so two instances with the same seed replay the same sequence.
 */
class Rng16 {
public:
    explicit Rng16(uint16_t seed = 1337) : state(seed) {}

    void seed(uint16_t s) { state = s; }
    uint16_t getState() const { return state; }

    uint16_t next16() {
        state = static_cast<uint16_t>(state * 2053u + 13849u);
        return state;
    }

    // [0, lim)
    uint16_t next16(uint16_t lim) {
        return static_cast<uint16_t>((static_cast<uint32_t>(next16()) * lim) >> 16);
    }

    uint8_t next8() {
        next16();
        return static_cast<uint8_t>((state & 0xFF) + (state >> 8));
    }

    // [0, lim)
    uint8_t next8(uint8_t lim) {
        return static_cast<uint8_t>((static_cast<uint16_t>(next8()) * lim) >> 8);
    }

    // [lo, hi)
    uint8_t next8(uint8_t lo, uint8_t hi) {
        return hi > lo ? static_cast<uint8_t>(lo + next8(static_cast<uint8_t>(hi - lo))) : lo;
    }

    uint16_t next16(uint16_t lo, uint16_t hi) {
        return hi > lo ? static_cast<uint16_t>(lo + next16(static_cast<uint16_t>(hi - lo))) : lo;
    }

private:
    uint16_t state;
};

// Fold a 32-bit seed into the 16-bit generator state (never zero)
inline uint16_t foldSeed(uint32_t seed) {
    uint16_t s = static_cast<uint16_t>(seed ^ (seed >> 16));
    return s ? s : 0x5EED;
}

} // namespace reverie

#endif // REVERIE_RNG_H
