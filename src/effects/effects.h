#ifndef REVERIE_EFFECTS_H
#define REVERIE_EFFECTS_H

/**
 * Reverie Effects
 *
 * Each effect lives in its own .cpp file: the Effect subclass is private to
 * that file and only its descriptor is exported here.
 *
 * To add a new effect:
 * 1. Create effects/my_effect.cpp
 * 2. Implement init/step/teardown, claiming scratch only in init
 * 3. Define its descriptor with DESCRIBE_EFFECT
 * 4. Declare the descriptor here and add it to the catalog in catalog.cpp
 */

#include "../core/effect.h"
#include "../core/effect_registry.h"

namespace reverie {

// === Built-in effect descriptors ===

extern const EffectDescriptor PLASMA_EFFECT;
extern const EffectDescriptor PLASMA_LITE_EFFECT;     // Baseline: no scratch
extern const EffectDescriptor SPIRAL_EFFECT;
extern const EffectDescriptor MATRIX_EFFECT;
extern const EffectDescriptor COLOR_MATRIX_EFFECT;
extern const EffectDescriptor JULIA_EFFECT;
extern const EffectDescriptor FIRE_EFFECT;
extern const EffectDescriptor STARFIELD_EFFECT;
extern const EffectDescriptor WAVES_EFFECT;
extern const EffectDescriptor STREAMERS_EFFECT;

// === Catalog ===

// Number of built-in effects
uint8_t getCatalogCount();

// Built-in effect by catalog position (nullptr past the end)
const EffectDescriptor* getCatalogEffect(uint8_t index);

// Built-in effect by id (nullptr if unknown)
const EffectDescriptor* findCatalogEffect(const char* id);

// Fill registry with the production rotation. Returns effects added.
uint8_t buildDefaultRoster(EffectRegistry& registry);

// Fill registry from configured ids, in order. Unknown ids are logged and
// skipped; unknownCount (optional) receives how many were skipped.
uint8_t buildRoster(EffectRegistry& registry, const char* const* ids, uint8_t count,
                    uint8_t* unknownCount = nullptr);

} // namespace reverie

#endif // REVERIE_EFFECTS_H
