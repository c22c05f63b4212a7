/*
 * File: test/test_safety_shutdown/test_safety_shutdown.cpp
 * Description: Verifies the deterministic shutdown sequence that runs on every
 * release: RFID reading, field and power off, then outer and inner lock,
 * spaced by the hardware command spacing.
 */
#include <unity.h>
#include <string>
#include <vector>
#include "ControlSession.h"
#include "MockControlHAL.h"
#include "MockHardwarePort.h"
#include "StandardInterlock.h"

const ControlTimings timings = { 10000, 1000, 1000, 500, 100, 5000, 30000, INTERLOCK_REJECT };

static const char* EXPECTED_SEQUENCE[] = {
    "rfid_read_stop", "rfid_field_off", "rfid_power_off", "lock_outer", "lock_inner"
};

void setUp(void) {}
void tearDown(void) {}

// --- Helper ---
static CommandMessage makeCommand(const char* sid, uint32_t seq, CommandKind kind) {
    CommandMessage cmd;
    memset(&cmd, 0, sizeof(cmd));
    strncpy(cmd.sessionId, sid, SESSION_ID_LENGTH);
    cmd.sequence = seq;
    cmd.kind = kind;
    return cmd;
}

static void assertShutdownTail(const MockHardwarePort& port, size_t from) {
    std::vector<std::string> names = port.writeNames();
    TEST_ASSERT_EQUAL(from + 5, names.size());
    for (size_t i = 0; i < 5; i++) {
        TEST_ASSERT_EQUAL_STRING(EXPECTED_SEQUENCE[i], names[from + i].c_str());
    }
}

// ============================================================================
// SEQUENCE
// ============================================================================

void test_release_runs_full_sequence_in_order(void) {
    MockControlHAL hal;
    MockHardwarePort port;
    port.clock = &hal;
    MockFallback fallback;
    StandardInterlock rules;
    ControlSessionManager session(hal, port, fallback, rules, timings);

    char sid[SESSION_ID_LENGTH + 1];
    session.claim("remote-a", sid, sizeof(sid));

    session.dispatch(makeCommand(sid, 1, CMD_RFID_POWER_ON));
    session.dispatch(makeCommand(sid, 2, CMD_RFID_FIELD_ON));
    session.dispatch(makeCommand(sid, 3, CMD_UNLOCK_INNER));
    while (session.executeNext(0)) {}

    TEST_ASSERT_TRUE(port.state.innerUnlocked);
    TEST_ASSERT_TRUE(port.state.rfidPowered);
    size_t before = port.writes.size();

    TEST_ASSERT_TRUE(session.release(sid, RELEASE_WATCHDOG_TIMEOUT));

    assertShutdownTail(port, before);
    TEST_ASSERT_FALSE(port.state.innerUnlocked);
    TEST_ASSERT_FALSE(port.state.outerUnlocked);
    TEST_ASSERT_FALSE(port.state.rfidPowered);
    TEST_ASSERT_FALSE(port.state.rfidField);
    TEST_ASSERT_FALSE(port.state.rfidReading);

    // Local service comes back only after the locks are secured
    TEST_ASSERT_EQUAL(1, fallback.startCount);
}

void test_sequence_writes_are_spaced(void) {
    MockControlHAL hal;
    MockHardwarePort port;
    port.clock = &hal;
    MockFallback fallback;
    StandardInterlock rules;
    ControlSessionManager session(hal, port, fallback, rules, timings);

    char sid[SESSION_ID_LENGTH + 1];
    session.claim("remote-a", sid, sizeof(sid));
    session.release(sid, RELEASE_GRACEFUL);

    TEST_ASSERT_EQUAL(5, port.writes.size());
    for (size_t i = 1; i < port.writes.size(); i++) {
        TEST_ASSERT_TRUE(port.writes[i].at - port.writes[i - 1].at >= timings.commandSpacingMs);
    }
}

void test_sequence_is_idempotent_on_safe_hardware(void) {
    MockControlHAL hal;
    MockHardwarePort port;
    MockFallback fallback;
    StandardInterlock rules;
    ControlSessionManager session(hal, port, fallback, rules, timings);

    char sid[SESSION_ID_LENGTH + 1];
    session.claim("remote-a", sid, sizeof(sid));
    uint32_t versionBefore = port.state.version;

    // Everything already off / locked: the writes happen, nothing changes
    session.release(sid, RELEASE_GRACEFUL);
    assertShutdownTail(port, 0);
    TEST_ASSERT_EQUAL_UINT32(versionBefore, port.state.version);

    session.claim("remote-a", sid, sizeof(sid));
    session.release(sid, RELEASE_GRACEFUL);
    assertShutdownTail(port, 5);
}

// ============================================================================
// FAULTS & QUEUE
// ============================================================================

void test_sequence_continues_through_faults(void) {
    MockControlHAL hal;
    MockHardwarePort port;
    MockFallback fallback;
    StandardInterlock rules;
    ControlSessionManager session(hal, port, fallback, rules, timings);

    char sid[SESSION_ID_LENGTH + 1];
    session.claim("remote-a", sid, sizeof(sid));

    port.failWrites = true;
    TEST_ASSERT_TRUE(session.release(sid, RELEASE_GRACEFUL));

    // Every step was attempted and the session still ended
    assertShutdownTail(port, 0);
    TEST_ASSERT_EQUAL(IDLE, session.getState());
    TEST_ASSERT_EQUAL(1, fallback.startCount);
    TEST_ASSERT_TRUE(hal.hasLog("Shutdown step"));
}

void test_release_discards_queued_commands(void) {
    MockControlHAL hal;
    MockHardwarePort port;
    MockFallback fallback;
    MockListener listener;
    StandardInterlock rules;
    ControlSessionManager session(hal, port, fallback, rules, timings);
    session.setListener(&listener);

    char sid[SESSION_ID_LENGTH + 1];
    session.claim("remote-a", sid, sizeof(sid));

    session.dispatch(makeCommand(sid, 1, CMD_UNLOCK_INNER));
    session.dispatch(makeCommand(sid, 2, CMD_RFID_POWER_ON));
    TEST_ASSERT_EQUAL(2, session.getQueuedCount());

    session.release(sid, RELEASE_CONNECTION_LOST);

    TEST_ASSERT_EQUAL(0, session.getQueuedCount());
    TEST_ASSERT_FALSE(session.executeNext(0));
    TEST_ASSERT_EQUAL(0, listener.completions.size());

    // Only the shutdown writes reached the hardware
    assertShutdownTail(port, 0);
    TEST_ASSERT_FALSE(port.state.innerUnlocked);
}

void test_lock_fault_releases_session(void) {
    MockControlHAL hal;
    MockHardwarePort port;
    MockFallback fallback;
    MockListener listener;
    StandardInterlock rules;
    ControlSessionManager session(hal, port, fallback, rules, timings);
    session.setListener(&listener);

    char sid[SESSION_ID_LENGTH + 1];
    session.claim("remote-a", sid, sizeof(sid));

    port.failWrites = true;
    session.dispatch(makeCommand(sid, 1, CMD_UNLOCK_OUTER));
    TEST_ASSERT_TRUE(session.executeNext(0));

    TEST_ASSERT_EQUAL(1, listener.completions.size());
    TEST_ASSERT_EQUAL(REJECT_HARDWARE_FAULT, listener.completions[0].result);
    TEST_ASSERT_EQUAL(IDLE, session.getState());
    TEST_ASSERT_EQUAL(RELEASE_HARDWARE_FAULT, listener.releases[0].reason);
}

void test_rfid_fault_keeps_session(void) {
    MockControlHAL hal;
    MockHardwarePort port;
    MockFallback fallback;
    MockListener listener;
    StandardInterlock rules;
    ControlSessionManager session(hal, port, fallback, rules, timings);
    session.setListener(&listener);

    char sid[SESSION_ID_LENGTH + 1];
    session.claim("remote-a", sid, sizeof(sid));

    port.failWrites = true;
    session.dispatch(makeCommand(sid, 1, CMD_RFID_POWER_ON));
    session.executeNext(0);

    TEST_ASSERT_EQUAL(REJECT_HARDWARE_FAULT, listener.completions[0].result);
    TEST_ASSERT_EQUAL(ACTIVE, session.getState());
    TEST_ASSERT_EQUAL(0, listener.releases.size());
}

int main(void) {
    UNITY_BEGIN();

    RUN_TEST(test_release_runs_full_sequence_in_order);
    RUN_TEST(test_sequence_writes_are_spaced);
    RUN_TEST(test_sequence_is_idempotent_on_safe_hardware);

    RUN_TEST(test_sequence_continues_through_faults);
    RUN_TEST(test_release_discards_queued_commands);
    RUN_TEST(test_lock_fault_releases_session);
    RUN_TEST(test_rfid_fault_keeps_session);

    return UNITY_END();
}
