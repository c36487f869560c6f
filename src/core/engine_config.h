#ifndef REVERIE_ENGINE_CONFIG_H
#define REVERIE_ENGINE_CONFIG_H

#include <ArduinoJson.h>
#include <cstring>
#include "engine_error.h"
#include "../constants.h"

namespace reverie {

/**
 * Engine configuration
 *
 * Fixed when the Engine is constructed; nothing changes it at runtime.
 * An empty roster means "the built-in default rotation".
 */
struct EngineConfig {
    uint32_t effectDurationMs;
    uint16_t targetFps;
    uint16_t width;
    uint16_t height;
    uint8_t displayScale;
    uint16_t paletteSize;         // Default for effects that do not name one
    size_t scratchBudget;
    uint32_t baseSeed;

    char roster[MAX_EFFECTS][MAX_EFFECT_ID_LEN];
    uint8_t rosterCount;

    EngineConfig() :
        effectDurationMs(DEFAULT_EFFECT_DURATION_MS),
        targetFps(DEFAULT_TARGET_FPS),
        width(DEFAULT_FRAME_WIDTH),
        height(DEFAULT_FRAME_HEIGHT),
        displayScale(DEFAULT_DISPLAY_SCALE),
        paletteSize(DEFAULT_PALETTE_SIZE),
        scratchBudget(DEFAULT_SCRATCH_BUDGET),
        baseSeed(DEFAULT_BASE_SEED),
        rosterCount(0) {
        memset(roster, 0, sizeof(roster));
    }

    // Append an effect id to the roster (false if full or id too long)
    bool addRosterId(const char* id);
    void clearRoster();
};

// Config error if any field is out of range
EngineError validateConfig(const EngineConfig& config);

// Update only the fields present in doc, clamped to legal ranges
void configFromJson(EngineConfig& config, const JsonDocument& doc);

void configToJson(const EngineConfig& config, JsonDocument& doc);

} // namespace reverie

#endif // REVERIE_ENGINE_CONFIG_H
