/**
 * Configuration and status JSON tests
 */

#include <unity.h>
#include <ArduinoJson.h>
#include <memory>
#include "test_support.h"

using namespace reverie;
using namespace reverie::test;

static ManualClock testClock;
static RecordingDisplay display;

void setUp() {
    testClock.set(0);
    display.reset();
}

void tearDown() {}

// --- Defaults and validation ---

void test_defaults_are_valid() {
    EngineConfig config;
    TEST_ASSERT_TRUE(validateConfig(config) == EngineError::None);
    TEST_ASSERT_EQUAL(DEFAULT_EFFECT_DURATION_MS, config.effectDurationMs);
    TEST_ASSERT_EQUAL(DEFAULT_TARGET_FPS, config.targetFps);
    TEST_ASSERT_EQUAL(160, config.width);
    TEST_ASSERT_EQUAL(120, config.height);
    TEST_ASSERT_EQUAL(0, config.rosterCount);
}

void test_validate_rejects_out_of_range_fields() {
    EngineConfig config;
    config.width = MAX_FRAME_WIDTH + 1;
    TEST_ASSERT_TRUE(validateConfig(config) == EngineError::Config);

    config = EngineConfig();
    config.height = 0;
    TEST_ASSERT_TRUE(validateConfig(config) == EngineError::Config);

    config = EngineConfig();
    config.paletteSize = MAX_PALETTE_SIZE + 1;
    TEST_ASSERT_TRUE(validateConfig(config) == EngineError::Config);

    config = EngineConfig();
    config.targetFps = 0;
    TEST_ASSERT_TRUE(validateConfig(config) == EngineError::Config);

    config = EngineConfig();
    config.displayScale = MAX_DISPLAY_SCALE + 1;
    TEST_ASSERT_TRUE(validateConfig(config) == EngineError::Config);

    config = EngineConfig();
    config.effectDurationMs = 0;
    TEST_ASSERT_TRUE(validateConfig(config) == EngineError::Config);

    config = EngineConfig();
    config.scratchBudget = MemoryGuardian::getCapacity() + 1;
    TEST_ASSERT_TRUE(validateConfig(config) == EngineError::Config);
}

void test_validate_rejects_frames_below_minimum() {
    EngineConfig config;
    config.width = 16;
    config.height = 16;
    TEST_ASSERT_TRUE(validateConfig(config) == EngineError::Config);

    config.width = MIN_FRAME_WIDTH - 1;
    config.height = MIN_FRAME_HEIGHT;
    TEST_ASSERT_TRUE(validateConfig(config) == EngineError::Config);

    config.width = MIN_FRAME_WIDTH;
    config.height = MIN_FRAME_HEIGHT - 1;
    TEST_ASSERT_TRUE(validateConfig(config) == EngineError::Config);

    config.height = MIN_FRAME_HEIGHT;
    TEST_ASSERT_TRUE(validateConfig(config) == EngineError::None);
}

void test_engine_refuses_undersized_frame() {
    EngineConfig config;
    config.width = 16;
    config.height = 16;
    config.effectDurationMs = 1000;
    config.targetFps = 10;

    std::unique_ptr<Engine> engine(new Engine(config, testClock, display));
    buildDefaultRoster(engine->getRegistry());

    TEST_ASSERT_TRUE(engine->begin() == EngineError::Config);
    runUntil(*engine, testClock, 3000);

    // Never started, so nothing drawn and no effect ever initialised
    TEST_ASSERT_EQUAL(0, display.pushes);
    TEST_ASSERT_FALSE(engine->isHalted());
    TEST_ASSERT_TRUE(engine->getLastError() == EngineError::Config);
    TEST_ASSERT_EQUAL_STRING("none", engine->getActiveId());
}

void test_default_rotation_runs_at_minimum_frame() {
    EngineConfig config;
    config.width = MIN_FRAME_WIDTH;
    config.height = MIN_FRAME_HEIGHT;
    config.effectDurationMs = 1000;
    config.targetFps = 10;

    std::unique_ptr<Engine> engine(new Engine(config, testClock, display));
    uint8_t count = buildDefaultRoster(engine->getRegistry());
    TEST_ASSERT_TRUE(count > 0);
    TEST_ASSERT_TRUE(engine->begin() == EngineError::None);

    RecordingListener listener(testClock);
    engine->setListener(&listener);
    runUntil(*engine, testClock, static_cast<uint32_t>(count) * 1000 + 500);

    TEST_ASSERT_FALSE(engine->isHalted());
    TEST_ASSERT_TRUE(engine->getLastError() == EngineError::None);
    TEST_ASSERT_EQUAL(0, listener.haltCount);
    TEST_ASSERT_EQUAL(1, engine->getRotationCount());
    TEST_ASSERT_EQUAL(0, display.badIndices);
    TEST_ASSERT_TRUE(display.pushes > 0);
}

// --- Roster ---

void test_roster_ids() {
    EngineConfig config;
    TEST_ASSERT_TRUE(config.addRosterId("fire"));
    TEST_ASSERT_FALSE(config.addRosterId(""));
    TEST_ASSERT_FALSE(config.addRosterId(nullptr));
    TEST_ASSERT_FALSE(config.addRosterId("an-effect-id-too-long"));
    TEST_ASSERT_EQUAL(1, config.rosterCount);
    TEST_ASSERT_EQUAL_STRING("fire", config.roster[0]);

    for (uint8_t i = 1; i < MAX_EFFECTS; i++) {
        TEST_ASSERT_TRUE(config.addRosterId("plasma"));
    }
    TEST_ASSERT_FALSE(config.addRosterId("plasma"));

    config.clearRoster();
    TEST_ASSERT_EQUAL(0, config.rosterCount);
}

// --- JSON ---

void test_from_json_updates_present_fields_only() {
    EngineConfig config;
    JsonDocument doc;
    TEST_ASSERT_TRUE(deserializeJson(doc, "{\"targetFps\":20,\"seed\":77,\"roster\":[\"julia\",\"fire\"]}") ==
                     DeserializationError::Ok);

    configFromJson(config, doc);

    TEST_ASSERT_EQUAL(20, config.targetFps);
    TEST_ASSERT_EQUAL(77, config.baseSeed);
    TEST_ASSERT_EQUAL(2, config.rosterCount);
    TEST_ASSERT_EQUAL_STRING("julia", config.roster[0]);
    TEST_ASSERT_EQUAL_STRING("fire", config.roster[1]);
    TEST_ASSERT_EQUAL(DEFAULT_EFFECT_DURATION_MS, config.effectDurationMs);
    TEST_ASSERT_EQUAL(DEFAULT_FRAME_WIDTH, config.width);
}

void test_from_json_clamps() {
    EngineConfig config;
    JsonDocument doc;
    deserializeJson(doc,
        "{\"effectDurationMs\":5,\"targetFps\":500,\"width\":999,\"height\":0,"
        "\"scale\":9,\"paletteSize\":1000,\"scratchBudget\":999999}");

    configFromJson(config, doc);

    TEST_ASSERT_EQUAL(1000, config.effectDurationMs);
    TEST_ASSERT_EQUAL(MAX_TARGET_FPS, config.targetFps);
    TEST_ASSERT_EQUAL(MAX_FRAME_WIDTH, config.width);
    TEST_ASSERT_EQUAL(MIN_FRAME_HEIGHT, config.height);
    TEST_ASSERT_EQUAL(MAX_DISPLAY_SCALE, config.displayScale);
    TEST_ASSERT_EQUAL(MAX_PALETTE_SIZE, config.paletteSize);
    TEST_ASSERT_EQUAL(MemoryGuardian::getCapacity(), config.scratchBudget);
    TEST_ASSERT_TRUE(validateConfig(config) == EngineError::None);
}

void test_from_json_raises_small_frames_to_minimum() {
    EngineConfig config;
    JsonDocument doc;
    deserializeJson(doc, "{\"width\":5,\"height\":5}");

    configFromJson(config, doc);

    TEST_ASSERT_EQUAL(MIN_FRAME_WIDTH, config.width);
    TEST_ASSERT_EQUAL(MIN_FRAME_HEIGHT, config.height);
    TEST_ASSERT_TRUE(validateConfig(config) == EngineError::None);
}

void test_from_json_ignores_wrong_types() {
    EngineConfig config;
    JsonDocument doc;
    deserializeJson(doc, "{\"targetFps\":\"fast\",\"roster\":\"fire\",\"width\":[1]}");

    configFromJson(config, doc);

    TEST_ASSERT_EQUAL(DEFAULT_TARGET_FPS, config.targetFps);
    TEST_ASSERT_EQUAL(DEFAULT_FRAME_WIDTH, config.width);
    TEST_ASSERT_EQUAL(0, config.rosterCount);
}

void test_to_json_exports_every_field() {
    EngineConfig config;
    config.effectDurationMs = 30000;
    config.targetFps = 15;
    config.baseSeed = 4242;
    config.addRosterId("waves");

    JsonDocument doc;
    configToJson(config, doc);

    TEST_ASSERT_EQUAL(30000, doc["effectDurationMs"].as<uint32_t>());
    TEST_ASSERT_EQUAL(15, doc["targetFps"].as<int>());
    TEST_ASSERT_EQUAL(160, doc["width"].as<int>());
    TEST_ASSERT_EQUAL(120, doc["height"].as<int>());
    TEST_ASSERT_EQUAL(DEFAULT_DISPLAY_SCALE, doc["scale"].as<int>());
    TEST_ASSERT_EQUAL(DEFAULT_PALETTE_SIZE, doc["paletteSize"].as<int>());
    TEST_ASSERT_EQUAL(DEFAULT_SCRATCH_BUDGET, doc["scratchBudget"].as<uint32_t>());
    TEST_ASSERT_EQUAL(4242, doc["seed"].as<uint32_t>());
    TEST_ASSERT_EQUAL(1, doc["roster"].size());
    TEST_ASSERT_EQUAL_STRING("waves", doc["roster"][0].as<const char*>());

    // And back again
    EngineConfig restored;
    configFromJson(restored, doc);
    TEST_ASSERT_EQUAL(30000, restored.effectDurationMs);
    TEST_ASSERT_EQUAL(15, restored.targetFps);
    TEST_ASSERT_EQUAL(4242, restored.baseSeed);
    TEST_ASSERT_EQUAL_STRING("waves", restored.roster[0]);
}

// --- Status ---

void test_status_reports_running_engine() {
    EngineConfig config;
    config.effectDurationMs = 1000;
    config.targetFps = 10;

    std::unique_ptr<Engine> engine(new Engine(config, testClock, display));
    engine->getRegistry().add(probeDescriptor("a"));
    engine->getRegistry().add(probeDescriptor("b"));
    engine->begin();
    runUntil(*engine, testClock, 1500);

    JsonDocument doc;
    statusToJson(*engine, doc);

    TEST_ASSERT_EQUAL_STRING("running", doc["state"].as<const char*>());
    TEST_ASSERT_EQUAL_STRING("b", doc["effect"].as<const char*>());
    TEST_ASSERT_EQUAL(1, doc["index"].as<int>());
    TEST_ASSERT_FALSE(doc["baseline"].as<bool>());
    TEST_ASSERT_EQUAL(1, doc["rotations"].as<int>());
    TEST_ASSERT_EQUAL(15, doc["frames"].as<int>());
    TEST_ASSERT_EQUAL(5, doc["effectFrames"].as<int>());
    TEST_ASSERT_EQUAL_STRING("none", doc["error"].as<const char*>());

    JsonObject arena = doc["arena"];
    TEST_ASSERT_EQUAL(1, arena["barriers"].as<int>());
    TEST_ASSERT_EQUAL(2, arena["liveClaims"].as<int>());
    TEST_ASSERT_EQUAL(MemoryGuardian::getCapacity(), arena["capacity"].as<uint32_t>());
    TEST_ASSERT_EQUAL(Engine::getStaticFootprint(), arena["staticFootprint"].as<uint32_t>());
    TEST_ASSERT_TRUE(arena["inUse"].as<uint32_t>() > 0);

    JsonObject pal = doc["palette"];
    TEST_ASSERT_EQUAL_STRING("rainbow", pal["preset"].as<const char*>());
    TEST_ASSERT_EQUAL(16, pal["size"].as<int>());
}

void test_status_reports_halt() {
    EngineConfig config;
    config.effectDurationMs = 1000;
    config.targetFps = 10;

    std::unique_ptr<Engine> engine(new Engine(config, testClock, display));
    engine->getRegistry().add(BROKEN_INIT_PROBE);
    engine->begin();
    engine->update();

    JsonDocument doc;
    statusToJson(*engine, doc);
    TEST_ASSERT_EQUAL_STRING("halted", doc["state"].as<const char*>());
    TEST_ASSERT_EQUAL_STRING("effect-init", doc["error"].as<const char*>());
}

int main() {
    UNITY_BEGIN();
    RUN_TEST(test_defaults_are_valid);
    RUN_TEST(test_validate_rejects_out_of_range_fields);
    RUN_TEST(test_validate_rejects_frames_below_minimum);
    RUN_TEST(test_engine_refuses_undersized_frame);
    RUN_TEST(test_default_rotation_runs_at_minimum_frame);
    RUN_TEST(test_roster_ids);
    RUN_TEST(test_from_json_updates_present_fields_only);
    RUN_TEST(test_from_json_clamps);
    RUN_TEST(test_from_json_raises_small_frames_to_minimum);
    RUN_TEST(test_from_json_ignores_wrong_types);
    RUN_TEST(test_to_json_exports_every_field);
    RUN_TEST(test_status_reports_running_engine);
    RUN_TEST(test_status_reports_halt);
    return UNITY_END();
}
