#ifndef REVERIE_ENGINE_STATUS_H
#define REVERIE_ENGINE_STATUS_H

#include <ArduinoJson.h>
#include "engine.h"

namespace reverie {

// Snapshot of scheduler and arena statistics
void statusToJson(const Engine& engine, JsonDocument& doc);

} // namespace reverie

#endif // REVERIE_ENGINE_STATUS_H
