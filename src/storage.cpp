#include "storage.h"
#include "logging.h"

namespace reverie {

const char* Storage::CONFIG_PATH = CONFIG_FILE_PATH;

Storage storage;

Storage::Storage() : mounted(false) {}

bool Storage::begin() {
    mounted = LittleFS.begin(true);
    if (!mounted) {
        LOG_ERROR(LogTag::CONFIG, "Failed to mount LittleFS; using built-in defaults");
        return false;
    }
    size_t total = LittleFS.totalBytes();
    size_t used = LittleFS.usedBytes();
    LOG_INFO(LogTag::CONFIG, "LittleFS mounted (%u KB free)", static_cast<unsigned int>((total - used) / 1024));
    return true;
}

bool Storage::loadConfig(EngineConfig& config) {
    if (!mounted || !LittleFS.exists(CONFIG_PATH)) {
        return false;
    }

    File file = LittleFS.open(CONFIG_PATH, "r");
    if (!file) {
        LOG_WARN(LogTag::CONFIG, "Cannot open %s", CONFIG_PATH);
        return false;
    }

    JsonDocument doc;
    DeserializationError err = deserializeJson(doc, file);
    file.close();
    if (err) {
        LOG_WARN(LogTag::CONFIG, "%s is not valid JSON: %s", CONFIG_PATH, err.c_str());
        return false;
    }

    configFromJson(config, doc);
    return true;
}

bool Storage::saveConfig(const EngineConfig& config) {
    if (!mounted) {
        return false;
    }

    File file = LittleFS.open(CONFIG_PATH, "w");
    if (!file) {
        LOG_ERROR(LogTag::CONFIG, "Cannot write %s", CONFIG_PATH);
        return false;
    }

    JsonDocument doc;
    configToJson(config, doc);
    size_t written = serializeJson(doc, file);
    file.close();
    return written > 0;
}

} // namespace reverie
