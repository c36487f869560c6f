#ifndef REVERIE_STORAGE_H
#define REVERIE_STORAGE_H

#include <Arduino.h>
#include <LittleFS.h>
#include <ArduinoJson.h>
#include "core/engine_config.h"

namespace reverie {

/**
 * Storage - Engine configuration on the LittleFS partition
 *
 * The file is optional. A missing or unreadable file leaves the defaults
 * from constants.h in place; present keys are clamped by configFromJson().
 */
class Storage {
public:
    Storage();

    // Mount the filesystem (formats on first boot)
    bool begin();
    bool isMounted() const { return mounted; }

    // Config operations
    bool loadConfig(EngineConfig& config);
    bool saveConfig(const EngineConfig& config);

private:
    static const char* CONFIG_PATH;
    bool mounted;
};

extern Storage storage;

} // namespace reverie

#endif // REVERIE_STORAGE_H
