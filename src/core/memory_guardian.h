#ifndef REVERIE_MEMORY_GUARDIAN_H
#define REVERIE_MEMORY_GUARDIAN_H

#include <cstdint>
#include <cstddef>
#include <new>
#include "engine_error.h"
#include "../constants.h"

namespace reverie {

/**
 * MemoryGuardian - Owner of the effect scratch arena
 *
 * One fixed block of storage holds the active effect instance and all of
 * its scratch tables. Effects claim sub-ranges by offset; nothing is ever
 * taken from the heap.
 *
 * Lifecycle per effect window:
 *   openWindow(id, declaredBound)   - fails if the bound exceeds the budget
 *   checkBudget(n) / claim(n)       - inside init, never beyond the bound
 *   release(ptr)                    - inside teardown, one per claim
 *   closeWindow(); reclaimBarrier() - rewinds the arena for the next effect
 *
 * A failed init uses abandonWindow() instead, which rewinds unconditionally.
 */
class MemoryGuardian {
public:
    MemoryGuardian();

    // Set the engine-wide scratch ceiling (clamped to capacity)
    bool begin(size_t budgetBytes);

    // --- Effect windows ---

    EngineError openWindow(const char* owner, size_t declaredBound);
    void closeWindow();
    void abandonWindow();
    bool isWindowOpen() const { return windowOpen; }

    // Fail fast before claiming: remaining budget and the window's bound
    EngineError checkBudget(size_t requested) const;

    // --- Claims ---

    // Returns nullptr (and counts the failure) when the claim does not fit
    void* claim(size_t bytes, size_t alignment = alignof(std::max_align_t));

    template<typename T>
    T* claimArray(size_t count) {
        return static_cast<T*>(claim(sizeof(T) * count, alignof(T)));
    }

    void release(void* ptr);

    // Runs between teardown and the next init. Memory if claims leaked.
    EngineError reclaimBarrier();

    // --- Stats ---

    size_t getBudget() const { return budget; }
    size_t getBytesInUse() const { return offset; }
    size_t getWindowBytes() const { return offset - windowStart; }
    size_t getHighWater() const { return highWater; }
    uint16_t getLiveClaims() const { return liveClaims; }
    uint32_t getFailedClaims() const { return failedClaims; }
    uint32_t getBarrierCount() const { return barriers; }
    const char* getOwner() const { return owner ? owner : "none"; }

    static constexpr size_t getCapacity() { return SCRATCH_ARENA_CAPACITY; }

    // Log a one-line usage summary
    void logStats(const char* context) const;

private:
    bool owns(const void* ptr) const;

    alignas(16) uint8_t storage[SCRATCH_ARENA_CAPACITY];
    size_t budget;
    size_t offset;
    size_t windowStart;
    size_t windowLimit;
    size_t highWater;
    const char* owner;
    uint16_t liveClaims;
    uint32_t failedClaims;
    uint32_t barriers;
    bool windowOpen;
};

} // namespace reverie

#endif // REVERIE_MEMORY_GUARDIAN_H
