#ifndef REVERIE_EFFECT_H
#define REVERIE_EFFECT_H

#include <cstdint>
#include <cstddef>
#include <new>
#include "engine_error.h"
#include "frame_buffer.h"
#include "palette.h"
#include "memory_guardian.h"

namespace reverie {

/**
 * What an effect receives for init
 *
 * The frame buffer and palette are lent for the effect's whole window.
 * Only step() may write to the frame buffer.
 */
struct EffectContext {
    const FrameBuffer& frame;
    const Palette& palette;
    MemoryGuardian& memory;
    uint32_t seed;
};

/**
 * Effect - One procedural visual
 *
 * Lifecycle, driven only by the Engine:
 *   init(ctx)        claim bounded scratch, seed the per-instance RNG
 *   step(...)        advance exactly one frame, draw with checked writes
 *   teardown(memory) release every claim made in init
 *
 * Instances are constructed in the scratch arena and destroyed at the end
 * of their window, so a fresh instance starts from the same state every
 * time its slot in the rotation comes around.
 */
class Effect {
public:
    virtual ~Effect() {}

    // Memory if scratch does not fit, EffectInit if a precondition fails
    virtual EngineError init(EffectContext& ctx) = 0;

    // frameIndex counts steps since init (informational, may wrap)
    virtual void step(FrameBuffer& frame, const Palette& palette, uint32_t frameIndex) = 0;

    virtual void teardown(MemoryGuardian& memory) = 0;
};

// Placement-constructs an effect into memory claimed by the engine
using EffectFactory = Effect* (*)(void* memory);

template<typename T>
Effect* constructEffect(void* memory) {
    return new (memory) T();
}

/**
 * Effect descriptor - immutable registry entry
 *
 * durationMs and paletteSize of 0 mean "use the engine default".
 * A seed of 0 means "derive from the engine's base seed".
 */
struct EffectDescriptor {
    const char* id;             // Machine name: "plasma" (lowercase, no spaces)
    const char* displayName;    // Human-readable name: "Plasma Field"
    EffectFactory create;
    uint16_t instanceSize;
    uint8_t instanceAlign;
    uint16_t scratchBytes;      // Declared upper bound of arena claims made in init
    uint32_t durationMs;
    PalettePreset palette;
    uint16_t paletteSize;
    uint32_t seed;

    // Arena bytes the whole window may use (instance, alignment slack, scratch)
    size_t footprint() const {
        return static_cast<size_t>(instanceSize) + instanceAlign + scratchBytes;
    }

    EffectDescriptor withSeed(uint32_t s) const {
        EffectDescriptor d = *this;
        d.seed = s;
        return d;
    }

    EffectDescriptor withDuration(uint32_t ms) const {
        EffectDescriptor d = *this;
        d.durationMs = ms;
        return d;
    }
};

/**
 * DESCRIBE_EFFECT macro
 *
 * Usage:
 *   const EffectDescriptor FIRE_EFFECT =
 *       DESCRIBE_EFFECT(FireEffect, "fire", "Fire", Fire, 32, FireEffect::SCRATCH_BYTES);
 */
#define DESCRIBE_EFFECT(Type, idStr, dispName, preset, palSize, scratch) \
    { \
        idStr, dispName, &reverie::constructEffect<Type>, \
        static_cast<uint16_t>(sizeof(Type)), static_cast<uint8_t>(alignof(Type)), \
        static_cast<uint16_t>(scratch), 0, reverie::PalettePreset::preset, \
        static_cast<uint16_t>(palSize), 0 \
    }

} // namespace reverie

#endif // REVERIE_EFFECT_H
