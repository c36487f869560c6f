#ifndef REVERIE_ENGINE_ERROR_H
#define REVERIE_ENGINE_ERROR_H

#include <cstdint>

namespace reverie {

/**
 * EngineError - status codes returned through the engine
 *
 * Only Memory raised by an effect's init has a recovery path (skip and
 * retry). Everything else that reaches the scheduler halts the engine.
 */
enum class EngineError : uint8_t {
    None = 0,
    Memory,         // Scratch budget exceeded or arena claim failed
    BufferBounds,   // An effect tried to write outside the frame buffer or palette
    EffectInit,     // Effect-specific setup precondition failed
    Config          // Engine configuration rejected
};

inline const char* errorName(EngineError err) {
    switch (err) {
        case EngineError::None:         return "none";
        case EngineError::Memory:       return "memory";
        case EngineError::BufferBounds: return "buffer-bounds";
        case EngineError::EffectInit:   return "effect-init";
        case EngineError::Config:       return "config";
        default:                        return "unknown";
    }
}

} // namespace reverie

#endif // REVERIE_ENGINE_ERROR_H
