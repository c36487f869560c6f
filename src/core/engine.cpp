/**
 * Engine implementation
 */

#include "engine.h"
#include "../effects/effects.h"
#include "../logging.h"
#include <cstring>

namespace reverie {

const char* stateName(EngineState state) {
    switch (state) {
        case EngineState::Idle:           return "idle";
        case EngineState::EffectInit:     return "init";
        case EngineState::EffectRunning:  return "running";
        case EngineState::EffectTeardown: return "teardown";
        case EngineState::Halted:         return "halted";
        default:                          return "unknown";
    }
}

Engine::Engine(const EngineConfig& cfg, Clock& clk, Display& disp)
    : config(cfg)
    , clock(clk)
    , display(disp)
    , listener(nullptr)
    , state(EngineState::Idle)
    , started(false)
    , currentIndex(-1)
    , active(nullptr)
    , activeSlot(nullptr)
    , activeDesc(nullptr)
    , baselineActive(false)
    , activeDuration(0)
    , effectStartMs(0)
    , nextBoundary(0)
    , effectFrames(0)
    , frameCounter(0)
    , rotationCount(0)
    , skippedCount(0)
    , fallbackCount(0)
    , droppedFrames(0)
    , consecutiveFailures(0)
    , lastError(EngineError::None)
    , actualFps(0)
    , fpsUpdateTime(0)
    , fpsFrameCount(0) {

    memset(baselineSlot, 0, sizeof(baselineSlot));
}

EngineError Engine::begin() {
    if (started) {
        return EngineError::None;
    }

    EngineError err = validateConfig(config);
    if (err != EngineError::None) {
        lastError = err;
        return err;
    }

    if (!frame.configure(config.width, config.height)) {
        LOG_ERROR(LogTag::ENGINE, "Frame buffer rejected %ux%u", config.width, config.height);
        lastError = EngineError::Config;
        return EngineError::Config;
    }

    if (PLASMA_LITE_EFFECT.instanceSize > BASELINE_SLOT_SIZE || PLASMA_LITE_EFFECT.instanceAlign > 16) {
        LOG_ERROR(LogTag::ENGINE, "Baseline effect does not fit its reserved slot");
        lastError = EngineError::Config;
        return EngineError::Config;
    }

    // Budget: configured ceiling, arena capacity and the largest declared footprint
    size_t budget = config.scratchBudget;
    if (budget > MemoryGuardian::getCapacity()) budget = MemoryGuardian::getCapacity();
    size_t largest = registry.getMaxFootprint();
    if (largest > 0 && largest < budget) budget = largest;

    if (!memory.begin(budget)) {
        lastError = EngineError::Config;
        return EngineError::Config;
    }

    registry.seal();
    for (uint8_t i = 0; i < registry.getCount(); i++) {
        const EffectDescriptor* desc = registry.getByIndex(i);
        if (desc->footprint() > memory.getBudget()) {
            LOG_WARN(LogTag::ENGINE, "%s declares %u bytes over budget %u, will be skipped",
                     desc->id, static_cast<unsigned>(desc->footprint()),
                     static_cast<unsigned>(memory.getBudget()));
        }
    }
    if (registry.isEmpty()) {
        LOG_WARN(LogTag::ENGINE, "Empty rotation, running %s only", PLASMA_LITE_EFFECT.id);
    }

    LOG_INFO(LogTag::ENGINE, "Engine ready: %ux%u @ %u fps, %d effects, %us windows",
             config.width, config.height, config.targetFps, registry.getCount(),
             static_cast<unsigned>(config.effectDurationMs / 1000));
    LOG_INFO(LogTag::ENGINE, "Static footprint %u bytes, scratch budget %u/%u",
             static_cast<unsigned>(getStaticFootprint()), static_cast<unsigned>(memory.getBudget()),
             static_cast<unsigned>(MemoryGuardian::getCapacity()));

    fpsUpdateTime = clock.millis();
    started = true;
    return EngineError::None;
}

uint32_t Engine::update() {
    if (!started || state == EngineState::Halted) {
        return boundaryMs(1);
    }

    if (state == EngineState::Idle) {
        if (startNext() != EngineError::None) {
            return boundaryMs(1);
        }
    }

    uint32_t now = clock.millis();

    // Rotation is by wall clock, never by frame count
    if (now - effectStartMs >= activeDuration) {
        endEffect();
        if (state == EngineState::Halted) {
            return boundaryMs(1);
        }
        if (startNext() != EngineError::None) {
            return boundaryMs(1);
        }
        now = clock.millis();
    }

    uint32_t elapsed = now - effectStartMs;
    uint32_t latest = static_cast<uint32_t>((static_cast<uint64_t>(elapsed) * config.targetFps) / 1000);

    if (latest >= nextBoundary) {
        // Fell behind: step once at the latest boundary, drop the rest
        if (latest > nextBoundary) {
            droppedFrames += latest - nextBoundary;
        }
        nextBoundary = latest + 1;
        renderFrame(now);
        if (state == EngineState::Halted) {
            return boundaryMs(1);
        }
    }

    // Wait until the next boundary or the end of the window, whichever is first
    uint32_t target = boundaryMs(nextBoundary);
    if (target > activeDuration) target = activeDuration;
    return target > elapsed ? target - elapsed : 0;
}

uint32_t Engine::getEffectElapsedMs() const {
    if (state != EngineState::EffectRunning) return 0;
    return clock.millis() - effectStartMs;
}

EngineError Engine::startNext() {
    state = EngineState::EffectInit;

    const uint8_t count = registry.getCount();
    for (uint8_t attempt = 0; attempt < count; attempt++) {
        currentIndex = static_cast<int16_t>((currentIndex + 1) % count);
        const EffectDescriptor& desc = *registry.getByIndex(static_cast<uint8_t>(currentIndex));

        EngineError err = startEffect(desc, false);
        if (err == EngineError::None) {
            consecutiveFailures = 0;
            return EngineError::None;
        }
        if (err != EngineError::Memory) {
            halt(err);
            return err;
        }

        consecutiveFailures++;
        skippedCount++;
        LOG_WARN(LogTag::ENGINE, "Skipping %s: out of scratch memory (%u in a row)",
                 desc.id, consecutiveFailures);
        if (listener) listener->onEffectSkipped(desc, err);
    }

    // Nothing in the rotation could start
    if (count > 0) {
        fallbackCount++;
        LOG_WARN(LogTag::ENGINE, "No effect could start, falling back to %s", PLASMA_LITE_EFFECT.id);
    }
    consecutiveFailures = 0;

    EngineError err = startEffect(PLASMA_LITE_EFFECT, true);
    if (err != EngineError::None) {
        halt(err);
    }
    return err;
}

EngineError Engine::startEffect(const EffectDescriptor& desc, bool baseline) {
    uint16_t paletteSize = desc.paletteSize ? desc.paletteSize : config.paletteSize;
    if (!palette.load(desc.palette, paletteSize)) {
        LOG_ERROR(LogTag::ENGINE, "%s: invalid palette size %u", desc.id, paletteSize);
        return EngineError::EffectInit;
    }
    frame.setIndexLimit(palette.size());
    frame.clear();

    void* slot = nullptr;
    if (baseline) {
        slot = baselineSlot;
    } else {
        EngineError err = memory.openWindow(desc.id, desc.footprint());
        if (err != EngineError::None) {
            return err;
        }
        slot = memory.claim(desc.instanceSize, desc.instanceAlign);
        if (!slot) {
            memory.abandonWindow();
            return EngineError::Memory;
        }
    }

    Effect* fx = desc.create(slot);
    EffectContext ctx = { frame, palette, memory, seedFor(desc) };
    EngineError err = fx->init(ctx);
    if (err != EngineError::None) {
        fx->~Effect();
        if (!baseline) {
            memory.abandonWindow();
        }
        if (err != EngineError::Memory) {
            LOG_ERROR(LogTag::ENGINE, "%s init failed: %s", desc.id, errorName(err));
        }
        return err;
    }

    active = fx;
    activeSlot = baseline ? nullptr : slot;
    activeDesc = &desc;
    baselineActive = baseline;
    activeDuration = desc.durationMs ? desc.durationMs : config.effectDurationMs;
    effectFrames = 0;
    nextBoundary = 0;
    effectStartMs = clock.millis();
    state = EngineState::EffectRunning;

    LOG_INFO(LogTag::ENGINE, "Starting %s%s (palette %s/%u, arena %u/%u bytes)",
             desc.displayName, baseline ? " [baseline]" : "", paletteName(palette.getPreset()),
             palette.size(), static_cast<unsigned>(memory.getWindowBytes()),
             static_cast<unsigned>(memory.getBudget()));
    if (listener) listener->onEffectStarted(desc, baseline);
    return EngineError::None;
}

void Engine::endEffect() {
    state = EngineState::EffectTeardown;

    const EffectDescriptor* desc = activeDesc;
    active->teardown(memory);
    active->~Effect();
    active = nullptr;

    if (activeSlot) {
        memory.release(activeSlot);
        activeSlot = nullptr;
        memory.closeWindow();
    }

    LOG_INFO(LogTag::ENGINE, "Ended %s after %lu frames", desc->id, static_cast<unsigned long>(effectFrames));
    if (listener) listener->onEffectEnded(*desc, effectFrames);

    activeDesc = nullptr;
    baselineActive = false;

    EngineError err = memory.reclaimBarrier();
    if (err != EngineError::None) {
        LOG_ERROR(LogTag::MEMORY, "Reclamation failed after %s", desc->id);
        halt(err);
        return;
    }
    memory.logStats("after barrier");

    frame.clear();
    rotationCount++;
    state = EngineState::Idle;
}

void Engine::renderFrame(uint32_t now) {
    uint32_t rejectedBefore = frame.getRejectedWrites();

    active->step(frame, palette, effectFrames);
    effectFrames++;
    frameCounter++;

    if (frame.getRejectedWrites() != rejectedBefore) {
        LOG_ERROR(LogTag::EFFECT, "%s made %lu out-of-bounds writes on frame %lu",
                  activeDesc->id, static_cast<unsigned long>(frame.getRejectedWrites() - rejectedBefore),
                  static_cast<unsigned long>(effectFrames - 1));
        halt(EngineError::BufferBounds);
        return;
    }

    display.push(frame, palette);

    // FPS calculation
    fpsFrameCount++;
    if (now - fpsUpdateTime >= 1000) {
        actualFps = fpsFrameCount;
        fpsFrameCount = 0;
        fpsUpdateTime = now;
    }
}

void Engine::halt(EngineError err) {
    state = EngineState::Halted;
    lastError = err;
    LOG_ERROR(LogTag::ENGINE, "Engine halted: %s (effect %s)", errorName(err), getActiveId());
    if (listener) listener->onHalt(err);
}

uint32_t Engine::seedFor(const EffectDescriptor& desc) const {
    if (desc.seed != 0) return desc.seed;
    // Stable per rotation slot, so every window of a slot replays the same way
    uint32_t slot = static_cast<uint32_t>(currentIndex + 1);
    return config.baseSeed ^ (slot * 0x9E3779B1u);
}

uint32_t Engine::boundaryMs(uint32_t k) const {
    if (config.targetFps == 0) return 1000 * k;
    return static_cast<uint32_t>((static_cast<uint64_t>(k) * 1000) / config.targetFps);
}

} // namespace reverie
