#ifndef REVERIE_EFFECT_REGISTRY_H
#define REVERIE_EFFECT_REGISTRY_H

#include "effect.h"

namespace reverie {

/**
 * EffectRegistry - The rotation, in order
 *
 * Descriptors are copied in at startup and validated on the way in.
 * The engine seals the registry in begin(); after that nothing can be
 * added and the order is fixed for the life of the engine.
 */
class EffectRegistry {
public:
    EffectRegistry();

    // Rejects invalid descriptors, a full registry, and anything after seal()
    bool add(const EffectDescriptor& desc);

    void seal() { sealed = true; }
    bool isSealed() const { return sealed; }

    // Get descriptor by id (first match)
    const EffectDescriptor* getInfo(const char* id) const;

    // Get descriptor by rotation index
    const EffectDescriptor* getByIndex(uint8_t index) const {
        if (index >= count) return nullptr;
        return &effects[index];
    }

    uint8_t getCount() const { return count; }
    bool isEmpty() const { return count == 0; }

    // Largest declared footprint (instance + scratch) in the rotation
    size_t getMaxFootprint() const;

private:
    EffectDescriptor effects[MAX_EFFECTS];
    uint8_t count;
    bool sealed;
};

} // namespace reverie

#endif // REVERIE_EFFECT_REGISTRY_H
