#ifndef REVERIE_ARDUINO_CLOCK_H
#define REVERIE_ARDUINO_CLOCK_H

#include <Arduino.h>
#include "../core/clock.h"

namespace reverie {

// Arduino millis() as the engine's clock
class ArduinoClock : public Clock {
public:
    uint32_t millis() const override { return ::millis(); }
};

} // namespace reverie

#endif // REVERIE_ARDUINO_CLOCK_H
