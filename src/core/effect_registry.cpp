/**
 * EffectRegistry implementation
 */

#include "effect_registry.h"
#include "../logging.h"
#include <cstring>

namespace reverie {

EffectRegistry::EffectRegistry()
    : count(0)
    , sealed(false) {
    memset(effects, 0, sizeof(effects));
}

bool EffectRegistry::add(const EffectDescriptor& desc) {
    if (sealed) {
        LOG_WARN(LogTag::ENGINE, "Registry sealed, ignoring %s", desc.id ? desc.id : "?");
        return false;
    }
    if (count >= MAX_EFFECTS) {
        LOG_WARN(LogTag::ENGINE, "Registry full (%d effects)", MAX_EFFECTS);
        return false;
    }

    // Validate descriptor
    if (!desc.id || desc.id[0] == '\0' || strlen(desc.id) >= MAX_EFFECT_ID_LEN) {
        LOG_WARN(LogTag::ENGINE, "Rejected effect with missing or oversized id");
        return false;
    }
    if (!desc.create || desc.instanceSize == 0 || desc.instanceAlign == 0) {
        LOG_WARN(LogTag::ENGINE, "Rejected %s: no factory", desc.id);
        return false;
    }
    if (desc.footprint() > MemoryGuardian::getCapacity()) {
        LOG_WARN(LogTag::ENGINE, "Rejected %s: footprint %u exceeds arena capacity %u",
                 desc.id, static_cast<unsigned>(desc.footprint()),
                 static_cast<unsigned>(MemoryGuardian::getCapacity()));
        return false;
    }

    effects[count] = desc;
    if (!effects[count].displayName) {
        effects[count].displayName = effects[count].id;
    }
    count++;
    return true;
}

const EffectDescriptor* EffectRegistry::getInfo(const char* id) const {
    if (!id) return nullptr;
    for (uint8_t i = 0; i < count; i++) {
        if (strcmp(effects[i].id, id) == 0) {
            return &effects[i];
        }
    }
    return nullptr;
}

size_t EffectRegistry::getMaxFootprint() const {
    size_t largest = 0;
    for (uint8_t i = 0; i < count; i++) {
        size_t fp = effects[i].footprint();
        if (fp > largest) largest = fp;
    }
    return largest;
}

} // namespace reverie
