/**
 * Reverie - Effect-cycling renderer for an ESP32 with a 320x240 SPI TFT
 *
 * Features:
 * - Rotates through procedural effects on a fixed wall-clock schedule
 * - All effect memory comes from one fixed scratch arena, never the heap
 * - Out-of-memory effects are skipped; a zero-scratch baseline always runs
 * - Optional /reverie.json on LittleFS overrides the built-in configuration
 *
 * Hardware:
 * - ESP32 with ILI9341-class 320x240 TFT (TFT_eSPI user setup)
 * - Backlight on GPIO 21
 */

#include <Arduino.h>
#include <ArduinoJson.h>
#include <TFT_eSPI.h>
#include <esp_task_wdt.h>

#include "reverie.h"
#include "storage.h"
#include "platform/arduino_clock.h"
#include "platform/tft_display.h"

using namespace reverie;

// Global configuration (fixed once setup() builds the engine)
EngineConfig config;

TFT_eSPI tft;
TftDisplay display(tft);
ArduinoClock engineClock;

// The engine holds the frame buffer, palette and arena inline, so it lives
// in static storage rather than on the loop task's stack
static Engine* engine = nullptr;
alignas(Engine) static uint8_t engineStorage[sizeof(Engine)];

bool watchdogArmed = false;
unsigned long lastStatusReport = 0;

static void buildRotation(EffectRegistry& registry) {
    if (config.rosterCount == 0) {
        buildDefaultRoster(registry);
        return;
    }

    const char* ids[MAX_EFFECTS];
    for (uint8_t i = 0; i < config.rosterCount; i++) {
        ids[i] = config.roster[i];
    }
    uint8_t unknown = 0;
    uint8_t added = buildRoster(registry, ids, config.rosterCount, &unknown);
    if (added == 0) {
        LOG_WARN(LogTag::CONFIG, "Configured roster has no usable effects, using the default rotation");
        buildDefaultRoster(registry);
    }
}

static void reportStatus() {
    JsonDocument doc;
    statusToJson(*engine, doc);
    serializeJson(doc, Serial);
    Serial.println();
}

void setup() {
    Serial.begin(115200);
    delay(1000);
    LOG_INFO(LogTag::MAIN, "=== %s v%s ===", FIRMWARE_NAME, FIRMWARE_VERSION);
    LOG_INFO(LogTag::MAIN, "Initializing...");

    // Load configuration
    if (storage.begin()) {
        if (storage.loadConfig(config)) {
            LOG_INFO(LogTag::CONFIG, "Configuration loaded from %s", CONFIG_FILE_PATH);
        } else {
            LOG_WARN(LogTag::CONFIG, "No config found, using defaults");
            if (storage.saveConfig(config)) {
                LOG_INFO(LogTag::CONFIG, "Wrote default configuration to %s", CONFIG_FILE_PATH);
            }
        }
    }
    LOG_DEBUG(LogTag::CONFIG, "%ux%u @ %u fps, scale %u, %lu ms per effect",
              config.width, config.height, config.targetFps, config.displayScale,
              static_cast<unsigned long>(config.effectDurationMs));

    // Initialize display
    display.begin(config.displayScale);

    // Initialize engine
    engine = new (engineStorage) Engine(config, engineClock, display);
    buildRotation(engine->getRegistry());

    EngineError err = engine->begin();
    if (err != EngineError::None) {
        // Leave the watchdog unarmed: a bad config is not fixed by rebooting
        LOG_ERROR(LogTag::MAIN, "Engine refused configuration: %s", errorName(err));
        return;
    }

    // Initialize watchdog timer
    esp_task_wdt_init(WATCHDOG_TIMEOUT_SEC, true);  // timeout in seconds, panic on timeout
    esp_task_wdt_add(NULL);  // Add current task (loop)
    watchdogArmed = true;

    LOG_INFO(LogTag::MAIN, "Setup complete, free heap %u bytes", ESP.getFreeHeap());
}

void loop() {
    uint32_t wait = engine->update();

    unsigned long now = millis();
    if (now - lastStatusReport >= STATUS_REPORT_INTERVAL_MS) {
        lastStatusReport = now;
        reportStatus();
    }

    // A halted engine stops feeding the watchdog, which restarts the device
    if (watchdogArmed && !engine->isHalted()) {
        esp_task_wdt_reset();
    }

    delay(wait < MAX_LOOP_IDLE_MS ? wait : MAX_LOOP_IDLE_MS);
}
