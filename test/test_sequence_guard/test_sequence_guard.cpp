/*
 * File: test/test_sequence_guard/test_sequence_guard.cpp
 * Description: Command admission checks: session ownership, state, command
 * validity, strictly increasing sequence numbers and queue capacity.
 */
#include <unity.h>
#include "ControlSession.h"
#include "MockControlHAL.h"
#include "MockHardwarePort.h"
#include "StandardInterlock.h"

const ControlTimings timings = { 10000, 1000, 0, 500, 100, 5000, 30000, INTERLOCK_REJECT };

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

void test_sequence_must_increase(void) {
    MockControlHAL hal;
    MockHardwarePort port;
    MockFallback fallback;
    StandardInterlock rules;
    ControlSessionManager session(hal, port, fallback, rules, timings);

    char sid[SESSION_ID_LENGTH + 1];
    session.claim("remote-a", sid, sizeof(sid));

    TEST_ASSERT_EQUAL(REJECT_NONE, session.dispatch(makeCommand(sid, 1, CMD_RFID_POWER_ON)));
    TEST_ASSERT_EQUAL(REJECT_SEQUENCE, session.dispatch(makeCommand(sid, 1, CMD_RFID_POWER_ON)));
    TEST_ASSERT_EQUAL(REJECT_SEQUENCE, session.dispatch(makeCommand(sid, 0, CMD_RFID_POWER_OFF)));

    // Gaps are fine, going back is not
    TEST_ASSERT_EQUAL(REJECT_NONE, session.dispatch(makeCommand(sid, 5, CMD_RFID_FIELD_ON)));
    TEST_ASSERT_EQUAL(REJECT_SEQUENCE, session.dispatch(makeCommand(sid, 3, CMD_RFID_FIELD_OFF)));

    TEST_ASSERT_TRUE(hal.hasLog("Possible replay"));
    TEST_ASSERT_EQUAL(2, session.getQueuedCount());
}

void test_replayed_command_has_no_side_effect(void) {
    MockControlHAL hal;
    MockHardwarePort port;
    MockFallback fallback;
    StandardInterlock rules;
    ControlSessionManager session(hal, port, fallback, rules, timings);

    char sid[SESSION_ID_LENGTH + 1];
    session.claim("remote-a", sid, sizeof(sid));

    session.dispatch(makeCommand(sid, 1, CMD_UNLOCK_INNER));
    session.dispatch(makeCommand(sid, 2, CMD_LOCK_INNER));
    while (session.executeNext(0)) {}
    size_t writes = port.writes.size();

    TEST_ASSERT_EQUAL(REJECT_SEQUENCE, session.dispatch(makeCommand(sid, 1, CMD_UNLOCK_INNER)));
    TEST_ASSERT_FALSE(session.executeNext(0));
    TEST_ASSERT_EQUAL(writes, port.writes.size());
    TEST_ASSERT_FALSE(port.state.innerUnlocked);
}

void test_wrong_session_is_authorization_error(void) {
    MockControlHAL hal;
    MockHardwarePort port;
    MockFallback fallback;
    StandardInterlock rules;
    ControlSessionManager session(hal, port, fallback, rules, timings);

    // No session at all
    TEST_ASSERT_EQUAL(REJECT_AUTHORIZATION, session.dispatch(makeCommand("S0001-00000000", 1, CMD_UNLOCK_INNER)));

    char sid[SESSION_ID_LENGTH + 1];
    session.claim("remote-a", sid, sizeof(sid));
    TEST_ASSERT_EQUAL(REJECT_AUTHORIZATION, session.dispatch(makeCommand("S0001-00000000", 1, CMD_UNLOCK_INNER)));
    TEST_ASSERT_EQUAL(REJECT_AUTHORIZATION, session.dispatch(makeCommand("", 1, CMD_UNLOCK_INNER)));

    // The rejected attempts did not advance the owner's sequence
    TEST_ASSERT_EQUAL(REJECT_NONE, session.dispatch(makeCommand(sid, 1, CMD_UNLOCK_INNER)));
}

void test_old_session_id_rejected_after_reclaim(void) {
    MockControlHAL hal;
    MockHardwarePort port;
    MockFallback fallback;
    StandardInterlock rules;
    ControlSessionManager session(hal, port, fallback, rules, timings);

    char first[SESSION_ID_LENGTH + 1];
    char second[SESSION_ID_LENGTH + 1];
    session.claim("remote-a", first, sizeof(first));
    session.dispatch(makeCommand(first, 7, CMD_RFID_POWER_ON));
    session.release(first, RELEASE_CONNECTION_LOST);
    session.claim("remote-a", second, sizeof(second));

    TEST_ASSERT_EQUAL(REJECT_AUTHORIZATION, session.dispatch(makeCommand(first, 8, CMD_RFID_POWER_ON)));

    // Numbering restarts with the new session
    TEST_ASSERT_EQUAL(REJECT_NONE, session.dispatch(makeCommand(second, 1, CMD_RFID_POWER_ON)));
}

void test_unknown_command_rejected(void) {
    MockControlHAL hal;
    MockHardwarePort port;
    MockFallback fallback;
    StandardInterlock rules;
    ControlSessionManager session(hal, port, fallback, rules, timings);

    char sid[SESSION_ID_LENGTH + 1];
    session.claim("remote-a", sid, sizeof(sid));

    TEST_ASSERT_EQUAL(REJECT_UNKNOWN_COMMAND, session.dispatch(makeCommand(sid, 1, CMD_UNKNOWN)));
    TEST_ASSERT_EQUAL(REJECT_NONE, session.dispatch(makeCommand(sid, 1, CMD_RFID_POWER_ON)));
}

void test_queue_capacity(void) {
    MockControlHAL hal;
    MockHardwarePort port;
    MockFallback fallback;
    StandardInterlock rules;
    ControlSessionManager session(hal, port, fallback, rules, timings);

    char sid[SESSION_ID_LENGTH + 1];
    session.claim("remote-a", sid, sizeof(sid));

    uint32_t seq = 1;
    for (int i = 0; i < COMMAND_QUEUE_CAPACITY; i++) {
        CommandKind kind = (i % 2 == 0) ? CMD_RFID_POWER_ON : CMD_RFID_POWER_OFF;
        TEST_ASSERT_EQUAL(REJECT_NONE, session.dispatch(makeCommand(sid, seq++, kind)));
    }
    TEST_ASSERT_EQUAL(REJECT_QUEUE_FULL, session.dispatch(makeCommand(sid, seq, CMD_RFID_FIELD_ON)));

    // Draining one slot admits the same sequence number again
    session.executeNext(0);
    TEST_ASSERT_EQUAL(REJECT_NONE, session.dispatch(makeCommand(sid, seq, CMD_RFID_FIELD_ON)));
}

void test_commands_execute_in_sequence_order(void) {
    MockControlHAL hal;
    MockHardwarePort port;
    MockFallback fallback;
    MockListener listener;
    StandardInterlock rules;
    ControlSessionManager session(hal, port, fallback, rules, timings);
    session.setListener(&listener);

    char sid[SESSION_ID_LENGTH + 1];
    session.claim("remote-a", sid, sizeof(sid));

    session.dispatch(makeCommand(sid, 2, CMD_RFID_POWER_ON));
    session.dispatch(makeCommand(sid, 3, CMD_RFID_FIELD_ON));
    session.dispatch(makeCommand(sid, 9, CMD_RFID_READ_START));
    while (session.executeNext(0)) {}

    TEST_ASSERT_EQUAL(3, listener.completions.size());
    TEST_ASSERT_EQUAL_UINT32(2, listener.completions[0].sequence);
    TEST_ASSERT_EQUAL_UINT32(3, listener.completions[1].sequence);
    TEST_ASSERT_EQUAL_UINT32(9, listener.completions[2].sequence);
    TEST_ASSERT_EQUAL(FIELD_RFID_READING, listener.completions[2].delta.changedMask);
}

int main(void) {
    UNITY_BEGIN();

    RUN_TEST(test_sequence_must_increase);
    RUN_TEST(test_replayed_command_has_no_side_effect);
    RUN_TEST(test_wrong_session_is_authorization_error);
    RUN_TEST(test_old_session_id_rejected_after_reclaim);
    RUN_TEST(test_unknown_command_rejected);
    RUN_TEST(test_queue_capacity);
    RUN_TEST(test_commands_execute_in_sequence_order);

    return UNITY_END();
}
