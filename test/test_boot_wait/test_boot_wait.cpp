/*
 * File: test/test_boot_wait/test_boot_wait.cpp
 * Description: After a reboot of a previously remote-controlled target the
 * local service is held back until a remote re-claims or the wait expires.
 */
#include <unity.h>
#include "BootWaitGate.h"
#include "ControlSession.h"
#include "MockControlHAL.h"
#include "MockHardwarePort.h"
#include "StandardInterlock.h"

const ControlTimings timings = { 10000, 1000, 0, 500, 100, 5000, 30000, INTERLOCK_REJECT };

void setUp(void) {}
void tearDown(void) {}

// ============================================================================
// GATE
// ============================================================================

void test_no_marker_no_wait(void) {
    BootWaitGate gate;
    TEST_ASSERT_FALSE(gate.begin(0, false, 30000));
    TEST_ASSERT_FALSE(gate.isHolding());
    TEST_ASSERT_EQUAL(BOOT_WAIT_NONE, gate.tick(100000, IDLE));
}

void test_wait_times_out(void) {
    BootWaitGate gate;
    TEST_ASSERT_TRUE(gate.begin(1000, true, 30000));

    TEST_ASSERT_EQUAL(BOOT_WAIT_NONE, gate.tick(30999, IDLE));
    TEST_ASSERT_EQUAL_UINT32(1, gate.remaining(30999));
    TEST_ASSERT_EQUAL(BOOT_WAIT_RESUME_FALLBACK, gate.tick(31000, IDLE));
    TEST_ASSERT_FALSE(gate.isHolding());
    TEST_ASSERT_EQUAL(BOOT_WAIT_NONE, gate.tick(40000, IDLE));
}

void test_claim_ends_wait(void) {
    BootWaitGate gate;
    gate.begin(0, true, 30000);
    TEST_ASSERT_EQUAL(BOOT_WAIT_HANDED_OVER, gate.tick(5000, CLAIMED));
    TEST_ASSERT_EQUAL(BOOT_WAIT_NONE, gate.tick(60000, IDLE));
}

// ============================================================================
// SESSION INTEGRATION
// ============================================================================

void test_hold_then_resume(void) {
    MockControlHAL hal;
    MockHardwarePort port;
    MockFallback fallback;
    StandardInterlock rules;
    ControlSessionManager session(hal, port, fallback, rules, timings);

    TEST_ASSERT_TRUE(session.holdLocalControl("boot-wait"));
    TEST_ASSERT_FALSE(fallback.running);
    TEST_ASSERT_TRUE(hal.noticeActive);

    TEST_ASSERT_TRUE(session.resumeLocalControl());
    TEST_ASSERT_TRUE(fallback.running);
    TEST_ASSERT_FALSE(hal.noticeActive);
    TEST_ASSERT_EQUAL(WRITER_LOCAL, session.getWriter());
}

void test_reclaim_during_wait_keeps_fallback_down(void) {
    MockControlHAL hal;
    MockHardwarePort port;
    MockFallback fallback;
    StandardInterlock rules;
    ControlSessionManager session(hal, port, fallback, rules, timings);
    BootWaitGate gate;

    gate.begin(hal.getMillis(), true, timings.bootWaitTimeoutMs);
    session.holdLocalControl("boot-wait");

    char sid[SESSION_ID_LENGTH + 1];
    TEST_ASSERT_EQUAL(CLAIM_ACCEPTED, session.claim("remote-a", sid, sizeof(sid)));
    TEST_ASSERT_EQUAL(BOOT_WAIT_HANDED_OVER, gate.tick(hal.getMillis(), session.getState()));

    // Resuming is refused while the session exists
    TEST_ASSERT_FALSE(session.resumeLocalControl());
    TEST_ASSERT_FALSE(fallback.running);
    TEST_ASSERT_EQUAL(0, fallback.startCount);

    // The normal release path restarts the local service
    session.release(sid, RELEASE_GRACEFUL);
    TEST_ASSERT_TRUE(fallback.running);
}

void test_hold_fails_when_fallback_will_not_stop(void) {
    MockControlHAL hal;
    MockHardwarePort port;
    MockFallback fallback;
    fallback.failStop = true;
    StandardInterlock rules;
    ControlSessionManager session(hal, port, fallback, rules, timings);

    TEST_ASSERT_FALSE(session.holdLocalControl("boot-wait"));
    TEST_ASSERT_FALSE(hal.noticeActive);
}

int main(void) {
    UNITY_BEGIN();

    RUN_TEST(test_no_marker_no_wait);
    RUN_TEST(test_wait_times_out);
    RUN_TEST(test_claim_ends_wait);

    RUN_TEST(test_hold_then_resume);
    RUN_TEST(test_reclaim_during_wait_keeps_fallback_down);
    RUN_TEST(test_hold_fails_when_fallback_will_not_stop);

    return UNITY_END();
}
