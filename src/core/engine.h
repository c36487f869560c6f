#ifndef REVERIE_ENGINE_H
#define REVERIE_ENGINE_H

#include "clock.h"
#include "display.h"
#include "effect.h"
#include "effect_registry.h"
#include "engine_config.h"
#include "engine_error.h"
#include "frame_buffer.h"
#include "memory_guardian.h"
#include "palette.h"

namespace reverie {

enum class EngineState : uint8_t {
    Idle = 0,
    EffectInit,
    EffectRunning,
    EffectTeardown,
    Halted
};

const char* stateName(EngineState state);

/**
 * Optional observer of rotation events (used by diagnostics and tests)
 */
class EngineListener {
public:
    virtual ~EngineListener() {}
    virtual void onEffectStarted(const EffectDescriptor& desc, bool baseline) { (void)desc; (void)baseline; }
    virtual void onEffectEnded(const EffectDescriptor& desc, uint32_t steps) { (void)desc; (void)steps; }
    virtual void onEffectSkipped(const EffectDescriptor& desc, EngineError err) { (void)desc; (void)err; }
    virtual void onHalt(EngineError err) { (void)err; }
};

/**
 * Engine - The effect-cycling render engine
 *
 * Owns:
 * - The frame buffer, palette and scratch arena (all fixed storage)
 * - The effect registry (the rotation)
 * - Scheduler state and the active effect instance
 *
 * Responsibilities:
 * - Rotate through the registry in order, one wall-clock window per effect
 * - Pace steps to frame boundaries and push each finished frame
 * - Skip effects whose init runs out of memory, falling back to the
 *   baseline effect when nothing in the rotation can start
 * - Halt on anything that has no recovery path
 *
 * Usage:
 *   Engine engine(config, clock, display);
 *   buildDefaultRoster(engine.getRegistry());
 *   engine.begin();
 *   for (;;) sleep(engine.update());
 */
class Engine {
public:
    Engine(const EngineConfig& config, Clock& clock, Display& display);

    // Registry is writable until begin() seals it
    EffectRegistry& getRegistry() { return registry; }
    const EffectRegistry& getRegistry() const { return registry; }

    // Validate config, size the frame buffer and budget, seal the registry
    EngineError begin();

    // Advance at most one step. Returns ms until the next frame boundary.
    uint32_t update();

    void setListener(EngineListener* l) { listener = l; }

    // --- State ---

    EngineState getState() const { return state; }
    bool isHalted() const { return state == EngineState::Halted; }
    EngineError getLastError() const { return lastError; }

    // Descriptor of the running effect (nullptr between windows)
    const EffectDescriptor* getActiveDescriptor() const { return activeDesc; }
    const char* getActiveId() const { return activeDesc ? activeDesc->id : "none"; }
    int16_t getActiveIndex() const { return currentIndex; }
    bool isBaselineActive() const { return baselineActive; }
    uint32_t getEffectElapsedMs() const;

    // --- Stats ---

    uint32_t getFrameCount() const { return frameCounter; }
    uint32_t getEffectFrames() const { return effectFrames; }
    uint32_t getRotationCount() const { return rotationCount; }
    uint32_t getSkippedCount() const { return skippedCount; }
    uint32_t getFallbackCount() const { return fallbackCount; }
    uint32_t getDroppedFrames() const { return droppedFrames; }
    uint16_t getActualFps() const { return actualFps; }

    // Bytes of fixed storage held by the engine
    static constexpr size_t getStaticFootprint() {
        return FrameBuffer::capacityBytes() + Palette::capacityBytes() +
               MemoryGuardian::getCapacity() + BASELINE_SLOT_SIZE;
    }

    // --- Read-only access ---

    const EngineConfig& getConfig() const { return config; }
    const FrameBuffer& getFrameBuffer() const { return frame; }
    const Palette& getPalette() const { return palette; }
    const MemoryGuardian& getMemory() const { return memory; }

private:
    EngineError startNext();
    EngineError startEffect(const EffectDescriptor& desc, bool baseline);
    void endEffect();
    void renderFrame(uint32_t now);
    void halt(EngineError err);

    uint32_t seedFor(const EffectDescriptor& desc) const;
    uint32_t boundaryMs(uint32_t k) const;

    EngineConfig config;
    Clock& clock;
    Display& display;
    EngineListener* listener;

    FrameBuffer frame;
    Palette palette;
    MemoryGuardian memory;
    EffectRegistry registry;

    // Baseline effect lives here, outside the arena
    alignas(16) uint8_t baselineSlot[BASELINE_SLOT_SIZE];

    // Scheduler state
    EngineState state;
    bool started;
    int16_t currentIndex;
    Effect* active;
    void* activeSlot;
    const EffectDescriptor* activeDesc;
    bool baselineActive;
    uint32_t activeDuration;
    uint32_t effectStartMs;
    uint32_t nextBoundary;
    uint32_t effectFrames;
    uint32_t frameCounter;
    uint32_t rotationCount;
    uint32_t skippedCount;
    uint32_t fallbackCount;
    uint32_t droppedFrames;
    uint8_t consecutiveFailures;
    EngineError lastError;

    // Timing
    uint16_t actualFps;
    uint32_t fpsUpdateTime;
    uint16_t fpsFrameCount;
};

} // namespace reverie

#endif // REVERIE_ENGINE_H
