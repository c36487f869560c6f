/**
 * EffectRegistry and catalog tests
 */

#include <unity.h>
#include <cstring>
#include "test_support.h"

using namespace reverie;
using namespace reverie::test;

static EffectRegistry* registry = nullptr;
alignas(EffectRegistry) static uint8_t registryStorage[sizeof(EffectRegistry)];

void setUp() {
    registry = new (registryStorage) EffectRegistry();
}

void tearDown() {
    registry->~EffectRegistry();
    registry = nullptr;
}

void test_add_keeps_order() {
    TEST_ASSERT_TRUE(registry->isEmpty());
    TEST_ASSERT_TRUE(registry->add(probeDescriptor("a")));
    TEST_ASSERT_TRUE(registry->add(probeDescriptor("b")));
    TEST_ASSERT_TRUE(registry->add(probeDescriptor("c")));

    TEST_ASSERT_EQUAL(3, registry->getCount());
    TEST_ASSERT_EQUAL_STRING("a", registry->getByIndex(0)->id);
    TEST_ASSERT_EQUAL_STRING("b", registry->getByIndex(1)->id);
    TEST_ASSERT_EQUAL_STRING("c", registry->getByIndex(2)->id);
    TEST_ASSERT_NULL(registry->getByIndex(3));
}

void test_get_info_by_id() {
    registry->add(probeDescriptor("a"));
    registry->add(FIRE_EFFECT);

    const EffectDescriptor* fire = registry->getInfo("fire");
    TEST_ASSERT_NOT_NULL(fire);
    TEST_ASSERT_EQUAL_STRING("Fire", fire->displayName);
    TEST_ASSERT_NULL(registry->getInfo("missing"));
    TEST_ASSERT_NULL(registry->getInfo(nullptr));
}

void test_rejects_invalid_descriptors() {
    EffectDescriptor noId = probeDescriptor("x");
    noId.id = nullptr;
    TEST_ASSERT_FALSE(registry->add(noId));

    EffectDescriptor emptyId = probeDescriptor("");
    TEST_ASSERT_FALSE(registry->add(emptyId));

    EffectDescriptor longId = probeDescriptor("a-very-long-effect-id");
    TEST_ASSERT_FALSE(registry->add(longId));

    EffectDescriptor noFactory = probeDescriptor("nofactory");
    noFactory.create = nullptr;
    TEST_ASSERT_FALSE(registry->add(noFactory));

    EffectDescriptor huge = probeDescriptor("huge");
    huge.scratchBytes = static_cast<uint16_t>(MemoryGuardian::getCapacity());
    TEST_ASSERT_FALSE(registry->add(huge));

    TEST_ASSERT_TRUE(registry->isEmpty());
}

void test_display_name_defaults_to_id() {
    EffectDescriptor d = probeDescriptor("plain");
    d.displayName = nullptr;
    TEST_ASSERT_TRUE(registry->add(d));
    TEST_ASSERT_EQUAL_STRING("plain", registry->getByIndex(0)->displayName);
}

void test_full_registry_rejects() {
    for (uint8_t i = 0; i < MAX_EFFECTS; i++) {
        TEST_ASSERT_TRUE(registry->add(probeDescriptor("p")));
    }
    TEST_ASSERT_FALSE(registry->add(probeDescriptor("one-more")));
    TEST_ASSERT_EQUAL(MAX_EFFECTS, registry->getCount());
}

void test_sealed_registry_rejects() {
    registry->add(probeDescriptor("a"));
    registry->seal();
    TEST_ASSERT_TRUE(registry->isSealed());
    TEST_ASSERT_FALSE(registry->add(probeDescriptor("b")));
    TEST_ASSERT_EQUAL(1, registry->getCount());
}

void test_max_footprint() {
    TEST_ASSERT_EQUAL(0, registry->getMaxFootprint());
    registry->add(probeDescriptor("a"));
    registry->add(SPIRAL_EFFECT);
    registry->add(LEAKY_PROBE);
    TEST_ASSERT_EQUAL(SPIRAL_EFFECT.footprint(), registry->getMaxFootprint());
}

void test_descriptor_overrides_copy() {
    EffectDescriptor seeded = PLASMA_EFFECT.withSeed(42).withDuration(1500);
    TEST_ASSERT_EQUAL(42, seeded.seed);
    TEST_ASSERT_EQUAL(1500, seeded.durationMs);
    TEST_ASSERT_EQUAL(0, PLASMA_EFFECT.seed);
    TEST_ASSERT_EQUAL_STRING(PLASMA_EFFECT.id, seeded.id);
}

// --- Catalog ---

void test_catalog_descriptors_are_valid() {
    TEST_ASSERT_EQUAL(10, getCatalogCount());
    for (uint8_t i = 0; i < getCatalogCount(); i++) {
        const EffectDescriptor* desc = getCatalogEffect(i);
        TEST_ASSERT_NOT_NULL(desc);
        TEST_ASSERT_TRUE(registry->add(*desc));
        TEST_ASSERT_TRUE(desc->footprint() <= DEFAULT_SCRATCH_BUDGET);
    }
    TEST_ASSERT_NULL(getCatalogEffect(getCatalogCount()));
}

void test_baseline_needs_no_scratch() {
    TEST_ASSERT_EQUAL(0, PLASMA_LITE_EFFECT.scratchBytes);
    TEST_ASSERT_TRUE(PLASMA_LITE_EFFECT.instanceSize <= BASELINE_SLOT_SIZE);
}

void test_find_catalog_effect() {
    TEST_ASSERT_EQUAL_PTR(&JULIA_EFFECT, findCatalogEffect("julia"));
    TEST_ASSERT_EQUAL_PTR(&PLASMA_LITE_EFFECT, findCatalogEffect("plasma-lite"));
    TEST_ASSERT_NULL(findCatalogEffect("nope"));
    TEST_ASSERT_NULL(findCatalogEffect(nullptr));
}

void test_default_roster_order() {
    const char* expected[] = {
        "plasma", "spiral", "matrix", "color-matrix", "julia",
        "fire", "starfield", "waves", "streamers"
    };
    TEST_ASSERT_EQUAL(9, buildDefaultRoster(*registry));
    for (uint8_t i = 0; i < 9; i++) {
        TEST_ASSERT_EQUAL_STRING(expected[i], registry->getByIndex(i)->id);
    }
    TEST_ASSERT_NULL(registry->getInfo("plasma-lite"));
}

void test_configured_roster_skips_unknown_ids() {
    const char* ids[] = { "fire", "bogus", "plasma", "" };
    uint8_t unknown = 0;
    TEST_ASSERT_EQUAL(2, buildRoster(*registry, ids, 4, &unknown));
    TEST_ASSERT_EQUAL(2, unknown);
    TEST_ASSERT_EQUAL_STRING("fire", registry->getByIndex(0)->id);
    TEST_ASSERT_EQUAL_STRING("plasma", registry->getByIndex(1)->id);
}

int main() {
    UNITY_BEGIN();
    RUN_TEST(test_add_keeps_order);
    RUN_TEST(test_get_info_by_id);
    RUN_TEST(test_rejects_invalid_descriptors);
    RUN_TEST(test_display_name_defaults_to_id);
    RUN_TEST(test_full_registry_rejects);
    RUN_TEST(test_sealed_registry_rejects);
    RUN_TEST(test_max_footprint);
    RUN_TEST(test_descriptor_overrides_copy);
    RUN_TEST(test_catalog_descriptors_are_valid);
    RUN_TEST(test_baseline_needs_no_scratch);
    RUN_TEST(test_find_catalog_effect);
    RUN_TEST(test_default_roster_order);
    RUN_TEST(test_configured_roster_skips_unknown_ids);
    return UNITY_END();
}
