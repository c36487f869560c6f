/**
 * Engine configuration - validation and JSON conversion
 */

#include "engine_config.h"
#include "memory_guardian.h"
#include "../logging.h"

namespace reverie {

namespace {

template<typename T>
T clampValue(T v, T lo, T hi) {
    return v < lo ? lo : (v > hi ? hi : v);
}

} // namespace

bool EngineConfig::addRosterId(const char* id) {
    if (!id || id[0] == '\0') return false;
    if (rosterCount >= MAX_EFFECTS || strlen(id) >= MAX_EFFECT_ID_LEN) {
        return false;
    }
    strncpy(roster[rosterCount], id, MAX_EFFECT_ID_LEN - 1);
    roster[rosterCount][MAX_EFFECT_ID_LEN - 1] = '\0';
    rosterCount++;
    return true;
}

void EngineConfig::clearRoster() {
    memset(roster, 0, sizeof(roster));
    rosterCount = 0;
}

EngineError validateConfig(const EngineConfig& config) {
    if (config.width > MAX_FRAME_WIDTH || config.height > MAX_FRAME_HEIGHT) {
        LOG_ERROR(LogTag::CONFIG, "Resolution %ux%u exceeds frame capacity %ux%u",
                  config.width, config.height, MAX_FRAME_WIDTH, MAX_FRAME_HEIGHT);
        return EngineError::Config;
    }
    if (config.width < MIN_FRAME_WIDTH || config.height < MIN_FRAME_HEIGHT) {
        LOG_ERROR(LogTag::CONFIG, "Resolution %ux%u below minimum %ux%u",
                  config.width, config.height, MIN_FRAME_WIDTH, MIN_FRAME_HEIGHT);
        return EngineError::Config;
    }
    if (config.paletteSize == 0 || config.paletteSize > MAX_PALETTE_SIZE) {
        LOG_ERROR(LogTag::CONFIG, "Palette size %u out of range", config.paletteSize);
        return EngineError::Config;
    }
    if (config.targetFps == 0 || config.targetFps > MAX_TARGET_FPS) {
        LOG_ERROR(LogTag::CONFIG, "Target FPS %u out of range", config.targetFps);
        return EngineError::Config;
    }
    if (config.displayScale == 0 || config.displayScale > MAX_DISPLAY_SCALE) {
        LOG_ERROR(LogTag::CONFIG, "Display scale %u out of range", config.displayScale);
        return EngineError::Config;
    }
    if (config.effectDurationMs == 0) {
        LOG_ERROR(LogTag::CONFIG, "Effect duration must be non-zero");
        return EngineError::Config;
    }
    if (config.scratchBudget == 0 || config.scratchBudget > MemoryGuardian::getCapacity()) {
        LOG_ERROR(LogTag::CONFIG, "Scratch budget %u out of range (capacity %u)",
                  static_cast<unsigned>(config.scratchBudget),
                  static_cast<unsigned>(MemoryGuardian::getCapacity()));
        return EngineError::Config;
    }
    return EngineError::None;
}

void configFromJson(EngineConfig& config, const JsonDocument& doc) {
    if (doc["effectDurationMs"].is<int>()) {
        long ms = doc["effectDurationMs"].as<long>();
        config.effectDurationMs = ms < 1000 ? 1000 : static_cast<uint32_t>(ms);
    }
    if (doc["targetFps"].is<int>()) {
        config.targetFps = clampValue<int>(doc["targetFps"].as<int>(), 1, MAX_TARGET_FPS);
    }
    if (doc["width"].is<int>()) {
        config.width = clampValue<int>(doc["width"].as<int>(), MIN_FRAME_WIDTH, MAX_FRAME_WIDTH);
    }
    if (doc["height"].is<int>()) {
        config.height = clampValue<int>(doc["height"].as<int>(), MIN_FRAME_HEIGHT, MAX_FRAME_HEIGHT);
    }
    if (doc["scale"].is<int>()) {
        config.displayScale = clampValue<int>(doc["scale"].as<int>(), 1, MAX_DISPLAY_SCALE);
    }
    if (doc["paletteSize"].is<int>()) {
        config.paletteSize = clampValue<int>(doc["paletteSize"].as<int>(), 1, MAX_PALETTE_SIZE);
    }
    if (doc["scratchBudget"].is<int>()) {
        long budget = clampValue<long>(doc["scratchBudget"].as<long>(), 1,
                                       static_cast<long>(MemoryGuardian::getCapacity()));
        config.scratchBudget = static_cast<size_t>(budget);
    }
    if (doc["seed"].is<unsigned long>()) {
        config.baseSeed = doc["seed"].as<uint32_t>();
    }
    if (doc["roster"].is<JsonArrayConst>()) {
        config.clearRoster();
        for (JsonVariantConst v : doc["roster"].as<JsonArrayConst>()) {
            const char* id = v.as<const char*>();
            if (!config.addRosterId(id)) {
                LOG_WARN(LogTag::CONFIG, "Ignoring roster entry '%s'", id ? id : "?");
            }
        }
    }
}

void configToJson(const EngineConfig& config, JsonDocument& doc) {
    doc["effectDurationMs"] = config.effectDurationMs;
    doc["targetFps"] = config.targetFps;
    doc["width"] = config.width;
    doc["height"] = config.height;
    doc["scale"] = config.displayScale;
    doc["paletteSize"] = config.paletteSize;
    doc["scratchBudget"] = static_cast<uint32_t>(config.scratchBudget);
    doc["seed"] = config.baseSeed;

    JsonArray roster = doc["roster"].to<JsonArray>();
    for (uint8_t i = 0; i < config.rosterCount; i++) {
        roster.add(static_cast<const char*>(config.roster[i]));
    }
}

} // namespace reverie
