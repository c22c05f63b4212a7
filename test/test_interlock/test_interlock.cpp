/*
 * File: test/test_interlock/test_interlock.cpp
 * Description: The inner and outer lock must never be unlocked at the same
 * time. Covers the rule itself, both modes through the session manager and
 * the hardware gate's last-line check.
 */
#include <unity.h>
#include "ControlSession.h"
#include "HardwareGate.h"
#include "MockControlHAL.h"
#include "MockHardwarePort.h"
#include "StandardInterlock.h"

const ControlTimings rejectTimings = { 10000, 1000, 0, 500, 100, 5000, 30000, INTERLOCK_REJECT };
const ControlTimings correctTimings = { 10000, 1000, 0, 500, 100, 5000, 30000, INTERLOCK_CORRECT };

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

// ============================================================================
// RULE
// ============================================================================

void test_rule_allows_single_side(void) {
    StandardInterlock rules;
    InterlockVerdict v = rules.evaluate(false, false, CMD_UNLOCK_INNER);
    TEST_ASSERT_TRUE(v.allowed);
    TEST_ASSERT_FALSE(v.needsCorrection);

    v = rules.evaluate(true, false, CMD_LOCK_INNER);
    TEST_ASSERT_TRUE(v.allowed);
}

void test_rule_rejects_second_side(void) {
    StandardInterlock rules(INTERLOCK_REJECT);
    TEST_ASSERT_FALSE(rules.evaluate(true, false, CMD_UNLOCK_OUTER).allowed);
    TEST_ASSERT_FALSE(rules.evaluate(false, true, CMD_UNLOCK_INNER).allowed);

    // Non-lock commands are never affected
    TEST_ASSERT_TRUE(rules.evaluate(true, true, CMD_RFID_POWER_ON).allowed);
}

void test_rule_correct_mode_locks_opposite(void) {
    StandardInterlock rules(INTERLOCK_CORRECT);
    InterlockVerdict v = rules.evaluate(true, false, CMD_UNLOCK_OUTER);
    TEST_ASSERT_TRUE(v.allowed);
    TEST_ASSERT_TRUE(v.needsCorrection);
    TEST_ASSERT_EQUAL(CMD_LOCK_INNER, v.correction);

    v = rules.evaluate(false, true, CMD_UNLOCK_INNER);
    TEST_ASSERT_EQUAL(CMD_LOCK_OUTER, v.correction);
}

// ============================================================================
// SESSION MANAGER
// ============================================================================

void test_reject_mode_uses_projected_state(void) {
    MockControlHAL hal;
    MockHardwarePort port;
    MockFallback fallback;
    StandardInterlock rules(INTERLOCK_REJECT);
    ControlSessionManager session(hal, port, fallback, rules, rejectTimings);

    char sid[SESSION_ID_LENGTH + 1];
    session.claim("remote-a", sid, sizeof(sid));

    // Neither command has executed yet; the second still sees the first
    TEST_ASSERT_EQUAL(REJECT_NONE, session.dispatch(makeCommand(sid, 1, CMD_UNLOCK_INNER)));
    TEST_ASSERT_EQUAL(REJECT_INTERLOCK, session.dispatch(makeCommand(sid, 2, CMD_UNLOCK_OUTER)));

    while (session.executeNext(0)) {}
    TEST_ASSERT_TRUE(port.state.innerUnlocked);
    TEST_ASSERT_FALSE(port.state.outerUnlocked);

    // Relocking inner first makes the outer unlock legal
    TEST_ASSERT_EQUAL(REJECT_NONE, session.dispatch(makeCommand(sid, 3, CMD_LOCK_INNER)));
    TEST_ASSERT_EQUAL(REJECT_NONE, session.dispatch(makeCommand(sid, 4, CMD_UNLOCK_OUTER)));
    while (session.executeNext(0)) {}
    TEST_ASSERT_FALSE(port.state.innerUnlocked);
    TEST_ASSERT_TRUE(port.state.outerUnlocked);
}

void test_rejected_interlock_does_not_consume_sequence(void) {
    MockControlHAL hal;
    MockHardwarePort port;
    MockFallback fallback;
    StandardInterlock rules(INTERLOCK_REJECT);
    ControlSessionManager session(hal, port, fallback, rules, rejectTimings);

    char sid[SESSION_ID_LENGTH + 1];
    session.claim("remote-a", sid, sizeof(sid));

    session.dispatch(makeCommand(sid, 1, CMD_UNLOCK_INNER));
    TEST_ASSERT_EQUAL(REJECT_INTERLOCK, session.dispatch(makeCommand(sid, 2, CMD_UNLOCK_OUTER)));
    TEST_ASSERT_EQUAL(REJECT_NONE, session.dispatch(makeCommand(sid, 2, CMD_RFID_POWER_ON)));
}

void test_correct_mode_relocks_before_unlock(void) {
    MockControlHAL hal;
    MockHardwarePort port;
    MockFallback fallback;
    MockListener listener;
    StandardInterlock rules(INTERLOCK_CORRECT);
    ControlSessionManager session(hal, port, fallback, rules, correctTimings);
    session.setListener(&listener);

    char sid[SESSION_ID_LENGTH + 1];
    session.claim("remote-a", sid, sizeof(sid));

    TEST_ASSERT_EQUAL(REJECT_NONE, session.dispatch(makeCommand(sid, 1, CMD_UNLOCK_INNER)));
    TEST_ASSERT_EQUAL(REJECT_NONE, session.dispatch(makeCommand(sid, 2, CMD_UNLOCK_OUTER)));
    while (session.executeNext(0)) {}

    TEST_ASSERT_FALSE(port.state.innerUnlocked);
    TEST_ASSERT_TRUE(port.state.outerUnlocked);

    std::vector<std::string> names = port.writeNames();
    TEST_ASSERT_EQUAL(3, names.size());
    TEST_ASSERT_EQUAL_STRING("unlock_inner", names[0].c_str());
    TEST_ASSERT_EQUAL_STRING("lock_inner", names[1].c_str());
    TEST_ASSERT_EQUAL_STRING("unlock_outer", names[2].c_str());

    // The ACK delta of the second command reports both lock changes
    TEST_ASSERT_EQUAL(2, listener.completions.size());
    uint16_t mask = listener.completions[1].delta.changedMask;
    TEST_ASSERT_TRUE(mask & FIELD_INNER_LOCK);
    TEST_ASSERT_TRUE(mask & FIELD_OUTER_LOCK);
}

// ============================================================================
// HARDWARE GATE
// ============================================================================

void test_gate_refuses_unlock_against_real_hardware(void) {
    MockControlHAL hal;
    MockHardwarePort port;
    HardwareGate gate(port, hal, 0);
    gate.designateWriter(WRITER_SESSION);

    // Hardware opened by something outside the projection
    port.state.outerUnlocked = true;

    TEST_ASSERT_EQUAL(GATE_INTERLOCK, gate.apply(WRITER_SESSION, CMD_UNLOCK_INNER, 0));
    TEST_ASSERT_EQUAL(0, port.writes.size());
}

void test_gate_refuses_wrong_writer(void) {
    MockControlHAL hal;
    MockHardwarePort port;
    HardwareGate gate(port, hal, 0);
    gate.designateWriter(WRITER_LOCAL);

    TEST_ASSERT_EQUAL(GATE_WRONG_WRITER, gate.apply(WRITER_SESSION, CMD_UNLOCK_INNER, 0));
    TEST_ASSERT_EQUAL(0, port.writes.size());

    TEST_ASSERT_EQUAL(GATE_APPLIED, gate.apply(WRITER_LOCAL, CMD_UNLOCK_INNER, 0));
    TEST_ASSERT_EQUAL_UINT32(1, gate.getWriteCount());
}

void test_gate_spacing_between_writes(void) {
    MockControlHAL hal;
    MockHardwarePort port;
    port.clock = &hal;
    HardwareGate gate(port, hal, 1000);
    gate.designateWriter(WRITER_SESSION);

    gate.apply(WRITER_SESSION, CMD_RFID_POWER_ON, 0);
    hal.advanceTime(300);
    gate.apply(WRITER_SESSION, CMD_RFID_FIELD_ON, 0);

    TEST_ASSERT_EQUAL(1000, port.writes[1].at - port.writes[0].at);
}

int main(void) {
    UNITY_BEGIN();

    RUN_TEST(test_rule_allows_single_side);
    RUN_TEST(test_rule_rejects_second_side);
    RUN_TEST(test_rule_correct_mode_locks_opposite);

    RUN_TEST(test_reject_mode_uses_projected_state);
    RUN_TEST(test_rejected_interlock_does_not_consume_sequence);
    RUN_TEST(test_correct_mode_relocks_before_unlock);

    RUN_TEST(test_gate_refuses_unlock_against_real_hardware);
    RUN_TEST(test_gate_refuses_wrong_writer);
    RUN_TEST(test_gate_spacing_between_writes);

    return UNITY_END();
}
