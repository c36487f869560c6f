#ifndef REVERIE_CLOCK_H
#define REVERIE_CLOCK_H

#include <cstdint>

namespace reverie {

/**
 * Clock - Monotonic millisecond source
 *
 * Wraps after ~49 days; the engine only ever subtracts timestamps.
 */
class Clock {
public:
    virtual ~Clock() {}
    virtual uint32_t millis() const = 0;
};

} // namespace reverie

#endif // REVERIE_CLOCK_H
