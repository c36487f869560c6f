/**
 * MemoryGuardian implementation
 */

#include "memory_guardian.h"
#include "../logging.h"
#include <cstring>

namespace reverie {

MemoryGuardian::MemoryGuardian()
    : budget(0)
    , offset(0)
    , windowStart(0)
    , windowLimit(0)
    , highWater(0)
    , owner(nullptr)
    , liveClaims(0)
    , failedClaims(0)
    , barriers(0)
    , windowOpen(false) {
    memset(storage, 0, sizeof(storage));
}

bool MemoryGuardian::begin(size_t budgetBytes) {
    if (budgetBytes == 0) {
        return false;
    }
    budget = budgetBytes < SCRATCH_ARENA_CAPACITY ? budgetBytes : SCRATCH_ARENA_CAPACITY;
    offset = 0;
    windowStart = 0;
    windowLimit = 0;
    liveClaims = 0;
    windowOpen = false;
    owner = nullptr;
    return true;
}

EngineError MemoryGuardian::openWindow(const char* who, size_t declaredBound) {
    if (windowOpen) {
        LOG_ERROR(LogTag::MEMORY, "Window for %s still open, refusing %s", getOwner(), who);
        return EngineError::Memory;
    }
    if (declaredBound > budget - offset) {
        LOG_WARN(LogTag::MEMORY, "%s declares %u bytes, budget has %u",
                 who, static_cast<unsigned>(declaredBound), static_cast<unsigned>(budget - offset));
        return EngineError::Memory;
    }

    owner = who;
    windowStart = offset;
    windowLimit = declaredBound;
    windowOpen = true;
    return EngineError::None;
}

void MemoryGuardian::closeWindow() {
    windowOpen = false;
}

void MemoryGuardian::abandonWindow() {
    memset(storage + windowStart, 0, offset - windowStart);
    offset = windowStart;
    liveClaims = 0;
    windowOpen = false;
    owner = nullptr;
}

EngineError MemoryGuardian::checkBudget(size_t requested) const {
    if (requested > budget - offset) {
        return EngineError::Memory;
    }
    if (windowOpen && (offset - windowStart) + requested > windowLimit) {
        return EngineError::Memory;
    }
    return EngineError::None;
}

void* MemoryGuardian::claim(size_t bytes, size_t alignment) {
    if (!windowOpen) {
        failedClaims++;
        LOG_ERROR(LogTag::MEMORY, "Claim of %u bytes outside an effect window", static_cast<unsigned>(bytes));
        return nullptr;
    }
    if (alignment == 0 || (alignment & (alignment - 1)) != 0) {
        alignment = alignof(std::max_align_t);
    }

    size_t aligned = (offset + alignment - 1) & ~(alignment - 1);
    size_t end = aligned + bytes;
    if (end > budget || end - windowStart > windowLimit) {
        failedClaims++;
        LOG_WARN(LogTag::MEMORY, "%s: claim of %u bytes denied (window %u/%u)",
                 getOwner(), static_cast<unsigned>(bytes),
                 static_cast<unsigned>(offset - windowStart), static_cast<unsigned>(windowLimit));
        return nullptr;
    }

    offset = end;
    if (offset > highWater) highWater = offset;
    liveClaims++;
    return storage + aligned;
}

void MemoryGuardian::release(void* ptr) {
    if (!ptr) return;
    if (!owns(ptr) || liveClaims == 0) {
        LOG_WARN(LogTag::MEMORY, "%s: release of unknown block", getOwner());
        return;
    }
    liveClaims--;
}

EngineError MemoryGuardian::reclaimBarrier() {
    if (windowOpen) {
        LOG_ERROR(LogTag::MEMORY, "Barrier with window for %s still open", getOwner());
        return EngineError::Memory;
    }
    if (liveClaims != 0) {
        LOG_ERROR(LogTag::MEMORY, "%s leaked %u scratch claims", getOwner(), liveClaims);
        return EngineError::Memory;
    }

    memset(storage, 0, offset);
    offset = 0;
    windowStart = 0;
    windowLimit = 0;
    owner = nullptr;
    barriers++;
    return EngineError::None;
}

void MemoryGuardian::logStats(const char* context) const {
    LOG_DEBUG(LogTag::MEMORY, "Arena %u/%u bytes (peak %u, capacity %u), %u claims, %lu barriers %s",
              static_cast<unsigned>(offset), static_cast<unsigned>(budget),
              static_cast<unsigned>(highWater), static_cast<unsigned>(SCRATCH_ARENA_CAPACITY),
              liveClaims, static_cast<unsigned long>(barriers), context);
}

bool MemoryGuardian::owns(const void* ptr) const {
    const uint8_t* p = static_cast<const uint8_t*>(ptr);
    return p >= storage && p < storage + offset;
}

} // namespace reverie
