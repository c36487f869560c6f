#include "engine_status.h"

namespace reverie {

void statusToJson(const Engine& engine, JsonDocument& doc) {
    doc["state"] = stateName(engine.getState());
    doc["effect"] = engine.getActiveId();
    doc["index"] = engine.getActiveIndex();
    doc["baseline"] = engine.isBaselineActive();
    doc["elapsedMs"] = engine.getEffectElapsedMs();
    doc["rotations"] = engine.getRotationCount();
    doc["frames"] = engine.getFrameCount();
    doc["effectFrames"] = engine.getEffectFrames();
    doc["fps"] = engine.getActualFps();
    doc["droppedFrames"] = engine.getDroppedFrames();
    doc["skipped"] = engine.getSkippedCount();
    doc["fallbacks"] = engine.getFallbackCount();
    doc["error"] = errorName(engine.getLastError());

    const MemoryGuardian& memory = engine.getMemory();
    JsonObject arena = doc["arena"].to<JsonObject>();
    arena["inUse"] = static_cast<uint32_t>(memory.getBytesInUse());
    arena["highWater"] = static_cast<uint32_t>(memory.getHighWater());
    arena["budget"] = static_cast<uint32_t>(memory.getBudget());
    arena["capacity"] = static_cast<uint32_t>(MemoryGuardian::getCapacity());
    arena["liveClaims"] = memory.getLiveClaims();
    arena["failedClaims"] = memory.getFailedClaims();
    arena["barriers"] = memory.getBarrierCount();
    arena["staticFootprint"] = static_cast<uint32_t>(Engine::getStaticFootprint());

    const Palette& palette = engine.getPalette();
    JsonObject pal = doc["palette"].to<JsonObject>();
    pal["preset"] = paletteName(palette.getPreset());
    pal["size"] = palette.size();
}

} // namespace reverie
