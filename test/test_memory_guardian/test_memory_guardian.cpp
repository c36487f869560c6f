/**
 * MemoryGuardian tests: windows, claims, budget and the reclamation barrier
 */

#include <unity.h>
#include <new>
#include <cstdint>
#include "core/memory_guardian.h"

using namespace reverie;

static MemoryGuardian memory;

void setUp() {
    memory.~MemoryGuardian();
    new (&memory) MemoryGuardian();
    memory.begin(4096);
}

void tearDown() {}

void test_begin_clamps_budget_to_capacity() {
    TEST_ASSERT_FALSE(memory.begin(0));
    TEST_ASSERT_TRUE(memory.begin(MemoryGuardian::getCapacity() * 2));
    TEST_ASSERT_EQUAL(MemoryGuardian::getCapacity(), memory.getBudget());
}

void test_claim_outside_window_fails() {
    TEST_ASSERT_NULL(memory.claim(16));
    TEST_ASSERT_EQUAL(1, memory.getFailedClaims());
    TEST_ASSERT_EQUAL(0, memory.getBytesInUse());
}

void test_window_over_budget_is_refused() {
    TEST_ASSERT_TRUE(memory.openWindow("big", 5000) == EngineError::Memory);
    TEST_ASSERT_FALSE(memory.isWindowOpen());
    TEST_ASSERT_TRUE(memory.openWindow("fits", 4096) == EngineError::None);
    TEST_ASSERT_EQUAL_STRING("fits", memory.getOwner());
}

void test_second_window_is_refused_while_open() {
    TEST_ASSERT_TRUE(memory.openWindow("a", 100) == EngineError::None);
    TEST_ASSERT_TRUE(memory.openWindow("b", 100) == EngineError::Memory);
    TEST_ASSERT_EQUAL_STRING("a", memory.getOwner());
}

void test_claims_stay_inside_declared_bound() {
    memory.openWindow("fx", 256);

    void* a = memory.claim(100, 4);
    void* b = memory.claim(100, 4);
    TEST_ASSERT_NOT_NULL(a);
    TEST_ASSERT_NOT_NULL(b);
    TEST_ASSERT_EQUAL(2, memory.getLiveClaims());

    // 200 used, 100 more crosses the declared 256
    TEST_ASSERT_NULL(memory.claim(100, 4));
    TEST_ASSERT_EQUAL(1, memory.getFailedClaims());
    TEST_ASSERT_TRUE(memory.checkBudget(56) == EngineError::None);
    TEST_ASSERT_TRUE(memory.checkBudget(57) == EngineError::Memory);
}

void test_claims_are_aligned() {
    memory.openWindow("fx", 512);
    memory.claim(3, 1);
    void* p = memory.claim(8, 8);
    TEST_ASSERT_EQUAL(0, reinterpret_cast<uintptr_t>(p) % 8);
    void* q = memory.claimArray<uint32_t>(4);
    TEST_ASSERT_EQUAL(0, reinterpret_cast<uintptr_t>(q) % alignof(uint32_t));
    void* r = memory.claim(1);
    TEST_ASSERT_EQUAL(0, reinterpret_cast<uintptr_t>(r) % alignof(std::max_align_t));
}

void test_check_budget_against_engine_budget() {
    TEST_ASSERT_TRUE(memory.checkBudget(4096) == EngineError::None);
    TEST_ASSERT_TRUE(memory.checkBudget(4097) == EngineError::Memory);
}

void test_barrier_rewinds_after_clean_teardown() {
    memory.openWindow("fx", 1024);
    uint8_t* p = static_cast<uint8_t*>(memory.claim(512));
    for (int i = 0; i < 512; i++) p[i] = 0xAB;
    memory.release(p);
    memory.closeWindow();

    TEST_ASSERT_TRUE(memory.reclaimBarrier() == EngineError::None);
    TEST_ASSERT_EQUAL(0, memory.getBytesInUse());
    TEST_ASSERT_EQUAL(0, memory.getLiveClaims());
    TEST_ASSERT_EQUAL(1, memory.getBarrierCount());
    TEST_ASSERT_EQUAL(512, memory.getHighWater());
    TEST_ASSERT_EQUAL_STRING("none", memory.getOwner());

    // Next window gets the same, zeroed, storage
    memory.openWindow("next", 1024);
    uint8_t* q = static_cast<uint8_t*>(memory.claim(512));
    TEST_ASSERT_EQUAL_PTR(p, q);
    for (int i = 0; i < 512; i++) TEST_ASSERT_EQUAL_HEX8(0, q[i]);
}

void test_barrier_fails_with_live_claims() {
    memory.openWindow("leaky", 64);
    TEST_ASSERT_NOT_NULL(memory.claim(32));
    memory.closeWindow();

    TEST_ASSERT_TRUE(memory.reclaimBarrier() == EngineError::Memory);
    TEST_ASSERT_EQUAL(0, memory.getBarrierCount());
    TEST_ASSERT_EQUAL(1, memory.getLiveClaims());
}

void test_barrier_fails_with_open_window() {
    memory.openWindow("fx", 64);
    TEST_ASSERT_TRUE(memory.reclaimBarrier() == EngineError::Memory);
}

void test_abandon_window_rewinds_unconditionally() {
    memory.openWindow("fx", 256);
    memory.claim(64);
    memory.claim(64);
    memory.abandonWindow();

    TEST_ASSERT_FALSE(memory.isWindowOpen());
    TEST_ASSERT_EQUAL(0, memory.getBytesInUse());
    TEST_ASSERT_EQUAL(0, memory.getLiveClaims());
    TEST_ASSERT_TRUE(memory.reclaimBarrier() == EngineError::None);
}

void test_release_of_foreign_pointer_is_ignored() {
    memory.openWindow("fx", 256);
    void* p = memory.claim(16);
    int local = 0;
    memory.release(&local);
    memory.release(nullptr);
    TEST_ASSERT_EQUAL(1, memory.getLiveClaims());
    memory.release(p);
    TEST_ASSERT_EQUAL(0, memory.getLiveClaims());
}

void test_window_bytes_track_current_window() {
    memory.openWindow("fx", 256);
    memory.claim(40, 8);
    TEST_ASSERT_EQUAL(40, memory.getWindowBytes());
    TEST_ASSERT_EQUAL(40, memory.getBytesInUse());
}

int main() {
    UNITY_BEGIN();
    RUN_TEST(test_begin_clamps_budget_to_capacity);
    RUN_TEST(test_claim_outside_window_fails);
    RUN_TEST(test_window_over_budget_is_refused);
    RUN_TEST(test_second_window_is_refused_while_open);
    RUN_TEST(test_claims_stay_inside_declared_bound);
    RUN_TEST(test_claims_are_aligned);
    RUN_TEST(test_check_budget_against_engine_budget);
    RUN_TEST(test_barrier_rewinds_after_clean_teardown);
    RUN_TEST(test_barrier_fails_with_live_claims);
    RUN_TEST(test_barrier_fails_with_open_window);
    RUN_TEST(test_abandon_window_rewinds_unconditionally);
    RUN_TEST(test_release_of_foreign_pointer_is_ignored);
    RUN_TEST(test_window_bytes_track_current_window);
    return UNITY_END();
}
