/**
 * Long-run memory tests: the arena must look the same on every rotation
 * and nothing may touch the heap once the engine is running.
 */

#include <unity.h>
#include <cstdlib>
#include <new>
#include "test_support.h"

using namespace reverie;
using namespace reverie::test;

// --- Heap accounting ---

static bool countAllocations = false;
static uint32_t heapAllocations = 0;

void* operator new(std::size_t size) {
    if (countAllocations) heapAllocations++;
    void* p = std::malloc(size ? size : 1);
    if (!p) throw std::bad_alloc();
    return p;
}

void* operator new[](std::size_t size) {
    if (countAllocations) heapAllocations++;
    void* p = std::malloc(size ? size : 1);
    if (!p) throw std::bad_alloc();
    return p;
}

void operator delete(void* p) noexcept { std::free(p); }
void operator delete[](void* p) noexcept { std::free(p); }
void operator delete(void* p, std::size_t) noexcept { std::free(p); }
void operator delete[](void* p, std::size_t) noexcept { std::free(p); }

// --- Arena observer ---

class ArenaAudit : public EngineListener {
public:
    ArenaAudit() : engine(nullptr), starts(0), dirtyStarts(0), sizeMismatches(0), barrierMismatches(0) {
        for (uint8_t i = 0; i < MAX_EFFECTS; i++) windowBytes[i] = SIZE_MAX;
    }

    void onEffectStarted(const EffectDescriptor& desc, bool baseline) override {
        (void)desc;
        if (baseline) return;
        starts++;

        const MemoryGuardian& memory = engine->getMemory();

        // Nothing but the new window may occupy the arena
        if (memory.getBytesInUse() != memory.getWindowBytes()) dirtyStarts++;

        // Every completed window went through exactly one barrier
        if (memory.getBarrierCount() != engine->getRotationCount()) barrierMismatches++;

        // Same effect, same claims, every time
        int16_t slot = engine->getActiveIndex();
        if (windowBytes[slot] == SIZE_MAX) {
            windowBytes[slot] = memory.getWindowBytes();
        } else if (windowBytes[slot] != memory.getWindowBytes()) {
            sizeMismatches++;
        }
    }

    const Engine* engine;
    uint32_t starts;
    uint32_t dirtyStarts;
    uint32_t sizeMismatches;
    uint32_t barrierMismatches;
    size_t windowBytes[MAX_EFFECTS];
};

static ManualClock testClock;
static RecordingDisplay display;

void setUp() {
    testClock.set(0);
    display.reset();
    display.verifyIndices = false;
    countAllocations = false;
    heapAllocations = 0;
}

void tearDown() {
    countAllocations = false;
}

void test_thousand_rotations_keep_arena_invariant() {
    EngineConfig config;
    config.effectDurationMs = 200;
    config.targetFps = 10;

    ArenaAudit audit;
    Engine engine(config, testClock, display);
    audit.engine = &engine;
    engine.setListener(&audit);
    buildDefaultRoster(engine.getRegistry());
    TEST_ASSERT_TRUE(engine.begin() == EngineError::None);

    const size_t budget = engine.getMemory().getBudget();

    countAllocations = true;
    while (engine.getRotationCount() < 1000 && !engine.isHalted()) {
        engine.update();
        testClock.advance(100);
    }
    countAllocations = false;

    TEST_ASSERT_FALSE(engine.isHalted());
    TEST_ASSERT_EQUAL(1000, engine.getRotationCount());
    TEST_ASSERT_EQUAL(0, heapAllocations);

    TEST_ASSERT_TRUE(audit.starts > 1000);
    TEST_ASSERT_EQUAL(0, audit.dirtyStarts);
    TEST_ASSERT_EQUAL(0, audit.sizeMismatches);
    TEST_ASSERT_EQUAL(0, audit.barrierMismatches);

    TEST_ASSERT_EQUAL(0, engine.getSkippedCount());
    TEST_ASSERT_EQUAL(0, engine.getFallbackCount());
    TEST_ASSERT_EQUAL(0, engine.getMemory().getFailedClaims());
    TEST_ASSERT_TRUE(engine.getMemory().getHighWater() <= budget);
    TEST_ASSERT_EQUAL(budget, engine.getMemory().getBudget());
    TEST_ASSERT_EQUAL(0, engine.getFrameBuffer().getRejectedWrites());
}

void test_every_effect_uses_its_declared_bound() {
    ArenaAudit audit;
    EngineConfig config;
    config.effectDurationMs = 100;
    config.targetFps = 10;

    Engine engine(config, testClock, display);
    audit.engine = &engine;
    engine.setListener(&audit);
    uint8_t count = buildDefaultRoster(engine.getRegistry());
    engine.begin();

    while (engine.getRotationCount() < count && !engine.isHalted()) {
        engine.update();
        testClock.advance(100);
    }

    TEST_ASSERT_FALSE(engine.isHalted());
    const EffectRegistry& registry = engine.getRegistry();
    for (uint8_t i = 0; i < count; i++) {
        const EffectDescriptor* desc = registry.getByIndex(i);
        TEST_ASSERT_TRUE(audit.windowBytes[i] != SIZE_MAX);
        TEST_ASSERT_TRUE(audit.windowBytes[i] <= desc->footprint());
    }
}

void test_static_footprint_is_fixed() {
    TEST_ASSERT_EQUAL(FrameBuffer::capacityBytes() + Palette::capacityBytes() +
                      MemoryGuardian::getCapacity() + BASELINE_SLOT_SIZE,
                      Engine::getStaticFootprint());
    TEST_ASSERT_TRUE(sizeof(Engine) >= Engine::getStaticFootprint());
}

int main() {
    UNITY_BEGIN();
    RUN_TEST(test_thousand_rotations_keep_arena_invariant);
    RUN_TEST(test_every_effect_uses_its_declared_bound);
    RUN_TEST(test_static_footprint_is_fixed);
    return UNITY_END();
}
