#ifndef REVERIE_CONSTANTS_H
#define REVERIE_CONSTANTS_H

#include <cstdint>
#include <cstddef>

// ============================================
// Project-wide Constants
// ============================================

// --- Frame buffer capacity (compile-time storage, logical pixels) ---
#ifndef REVERIE_MAX_FRAME_WIDTH
#define REVERIE_MAX_FRAME_WIDTH 160
#endif
#ifndef REVERIE_MAX_FRAME_HEIGHT
#define REVERIE_MAX_FRAME_HEIGHT 120
#endif

constexpr uint16_t MAX_FRAME_WIDTH = REVERIE_MAX_FRAME_WIDTH;
constexpr uint16_t MAX_FRAME_HEIGHT = REVERIE_MAX_FRAME_HEIGHT;

// Smallest frame every catalog effect can lay out (matrix grid, streamer band)
constexpr uint16_t MIN_FRAME_WIDTH = 20;
constexpr uint16_t MIN_FRAME_HEIGHT = 21;

// --- Display geometry (320x240 TFT shown at 2x) ---
constexpr uint16_t DEFAULT_FRAME_WIDTH = 160;
constexpr uint16_t DEFAULT_FRAME_HEIGHT = 120;
constexpr uint8_t DEFAULT_DISPLAY_SCALE = 2;
constexpr uint8_t MAX_DISPLAY_SCALE = 4;
constexpr uint16_t PHYSICAL_WIDTH = 320;
constexpr uint16_t PHYSICAL_HEIGHT = 240;

// --- Palette ---
constexpr uint16_t MAX_PALETTE_SIZE = 256;       // Unconstrained configuration
constexpr uint16_t DEFAULT_PALETTE_SIZE = 64;    // Memory-constrained configuration

// --- Scratch memory (beyond frame buffer + palette) ---
#ifndef REVERIE_SCRATCH_ARENA_CAPACITY
#define REVERIE_SCRATCH_ARENA_CAPACITY 32768
#endif
constexpr size_t SCRATCH_ARENA_CAPACITY = REVERIE_SCRATCH_ARENA_CAPACITY;
constexpr size_t DEFAULT_SCRATCH_BUDGET = 24576;
constexpr size_t BASELINE_SLOT_SIZE = 128;       // Baseline effect lives outside the arena

// --- Rotation & pacing ---
constexpr uint32_t DEFAULT_EFFECT_DURATION_MS = 60000;
constexpr uint16_t DEFAULT_TARGET_FPS = 12;
constexpr uint16_t MAX_TARGET_FPS = 60;
constexpr uint32_t DEFAULT_BASE_SEED = 0x5EED;

// --- Registry ---
constexpr uint8_t MAX_EFFECTS = 16;
constexpr size_t MAX_EFFECT_ID_LEN = 16;

// --- Firmware housekeeping ---
constexpr uint32_t STATUS_REPORT_INTERVAL_MS = 10000;
constexpr uint32_t MAX_LOOP_IDLE_MS = 10;        // Upper bound on a single loop() sleep
constexpr uint32_t WATCHDOG_TIMEOUT_SEC = 10;
constexpr uint8_t TFT_BACKLIGHT_PIN = 21;

#define CONFIG_FILE_PATH "/reverie.json"

// --- Version Info ---
#define FIRMWARE_VERSION "1.0.0"
#define FIRMWARE_NAME "Reverie"

#endif // REVERIE_CONSTANTS_H
