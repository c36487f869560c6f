/**
 * Effect catalog - built-in effects and roster construction
 */

#include "effects.h"
#include "../logging.h"
#include <cstring>

namespace reverie {

namespace {

// Catalog order is the production rotation order
const EffectDescriptor* const CATALOG[] = {
    &PLASMA_EFFECT,
    &SPIRAL_EFFECT,
    &MATRIX_EFFECT,
    &COLOR_MATRIX_EFFECT,
    &JULIA_EFFECT,
    &FIRE_EFFECT,
    &STARFIELD_EFFECT,
    &WAVES_EFFECT,
    &STREAMERS_EFFECT,
    &PLASMA_LITE_EFFECT
};
constexpr uint8_t CATALOG_COUNT = sizeof(CATALOG) / sizeof(CATALOG[0]);

// Built-ins left out of the default rotation (still selectable by id)
bool isDefaultRotation(const EffectDescriptor* desc) {
    return desc != &PLASMA_LITE_EFFECT;
}

} // namespace

uint8_t getCatalogCount() {
    return CATALOG_COUNT;
}

const EffectDescriptor* getCatalogEffect(uint8_t index) {
    if (index >= CATALOG_COUNT) return nullptr;
    return CATALOG[index];
}

const EffectDescriptor* findCatalogEffect(const char* id) {
    if (!id) return nullptr;
    for (uint8_t i = 0; i < CATALOG_COUNT; i++) {
        if (strcmp(CATALOG[i]->id, id) == 0) {
            return CATALOG[i];
        }
    }
    return nullptr;
}

uint8_t buildDefaultRoster(EffectRegistry& registry) {
    uint8_t added = 0;
    for (uint8_t i = 0; i < CATALOG_COUNT; i++) {
        if (!isDefaultRotation(CATALOG[i])) continue;
        if (registry.add(*CATALOG[i])) added++;
    }
    LOG_INFO(LogTag::EFFECT, "Default rotation: %d effects", added);
    return added;
}

uint8_t buildRoster(EffectRegistry& registry, const char* const* ids, uint8_t count,
                    uint8_t* unknownCount) {
    uint8_t added = 0;
    uint8_t unknown = 0;

    for (uint8_t i = 0; i < count; i++) {
        const EffectDescriptor* desc = findCatalogEffect(ids[i]);
        if (!desc) {
            LOG_WARN(LogTag::EFFECT, "Unknown effect '%s' in roster", ids[i] ? ids[i] : "?");
            unknown++;
            continue;
        }
        if (registry.add(*desc)) added++;
    }

    if (unknownCount) *unknownCount = unknown;
    LOG_INFO(LogTag::EFFECT, "Configured rotation: %d effects (%d unknown)", added, unknown);
    return added;
}

} // namespace reverie
