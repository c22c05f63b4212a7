/*
 * File: test/test_watchdog/test_watchdog.cpp
 * Description: Heartbeat deadline arithmetic and the forced release that
 * follows a missed deadline, including a watchdog thread racing a blocked
 * hardware write.
 */
#include <unity.h>
#include <string.h>
#include <atomic>
#include <chrono>
#include <thread>
#include "ControlSession.h"
#include "ControlTasks.h"
#include "HeartbeatWatchdog.h"
#include "LinuxControlHAL.h"
#include "MockControlHAL.h"
#include "MockHardwarePort.h"
#include "SimulatedHardwarePort.h"
#include "StandardInterlock.h"

const ControlTimings timings = { 10000, 1000, 0, 500, 100, 5000, 30000, INTERLOCK_REJECT };

void setUp(void) {}
void tearDown(void) {}

// ============================================================================
// DEADLINE
// ============================================================================

void test_watchdog_fires_once_at_deadline(void) {
    HeartbeatWatchdog dog;
    TEST_ASSERT_FALSE(dog.pollExpired(0));

    dog.arm(1000, 500);
    TEST_ASSERT_FALSE(dog.pollExpired(1499));
    TEST_ASSERT_TRUE(dog.pollExpired(1500));
    TEST_ASSERT_FALSE(dog.pollExpired(1600));
    TEST_ASSERT_TRUE(dog.hasFired());
}

void test_feed_moves_deadline(void) {
    HeartbeatWatchdog dog;
    dog.arm(0, 1000);
    dog.feed(800);
    TEST_ASSERT_EQUAL_UINT32(1800, dog.getDeadline());
    TEST_ASSERT_EQUAL_UINT32(300, dog.remaining(1500));
    TEST_ASSERT_FALSE(dog.pollExpired(1799));
    TEST_ASSERT_TRUE(dog.pollExpired(1800));

    // Feeding after the fire does not revive it
    dog.feed(1900);
    TEST_ASSERT_EQUAL_UINT32(1800, dog.getDeadline());
}

void test_disarmed_never_fires(void) {
    HeartbeatWatchdog dog;
    dog.arm(0, 100);
    dog.disarm();
    TEST_ASSERT_FALSE(dog.pollExpired(5000));
    TEST_ASSERT_EQUAL_UINT32(0, dog.remaining(0));
}

// ============================================================================
// SESSION EXPIRY
// ============================================================================

void test_session_released_after_timeout(void) {
    MockControlHAL hal;
    MockHardwarePort port;
    MockFallback fallback;
    MockListener listener;
    StandardInterlock rules;
    ControlSessionManager session(hal, port, fallback, rules, timings);
    session.setListener(&listener);

    char sid[SESSION_ID_LENGTH + 1];
    TEST_ASSERT_EQUAL(CLAIM_ACCEPTED, session.claim("remote-a", sid, sizeof(sid)));

    hal.advanceTime(9999);
    TEST_ASSERT_FALSE(session.checkWatchdog());
    TEST_ASSERT_EQUAL(ACTIVE, session.getState());

    hal.advanceTime(1);
    TEST_ASSERT_TRUE(session.checkWatchdog());
    TEST_ASSERT_EQUAL(IDLE, session.getState());
    TEST_ASSERT_TRUE(fallback.running);
    TEST_ASSERT_FALSE(hal.noticeActive);

    TEST_ASSERT_EQUAL(1, listener.releases.size());
    TEST_ASSERT_EQUAL(RELEASE_WATCHDOG_TIMEOUT, listener.releases[0].reason);
    TEST_ASSERT_TRUE(hal.hasLog("No heartbeat for"));

    // Nothing left to expire
    hal.advanceTime(20000);
    TEST_ASSERT_FALSE(session.checkWatchdog());
    TEST_ASSERT_EQUAL(1, listener.releases.size());
}

void test_heartbeats_keep_session_alive(void) {
    MockControlHAL hal;
    MockHardwarePort port;
    MockFallback fallback;
    StandardInterlock rules;
    ControlSessionManager session(hal, port, fallback, rules, timings);

    char sid[SESSION_ID_LENGTH + 1];
    session.claim("remote-a", sid, sizeof(sid));

    for (int i = 0; i < 10; i++) {
        hal.advanceTime(3333);
        TEST_ASSERT_TRUE(session.heartbeat(sid, 0));
        TEST_ASSERT_FALSE(session.checkWatchdog());
    }
    TEST_ASSERT_EQUAL(ACTIVE, session.getState());
}

void test_stale_heartbeat_does_not_feed(void) {
    MockControlHAL hal;
    MockHardwarePort port;
    MockFallback fallback;
    StandardInterlock rules;
    ControlSessionManager session(hal, port, fallback, rules, timings);

    char sid[SESSION_ID_LENGTH + 1];
    session.claim("remote-a", sid, sizeof(sid));

    hal.advanceTime(6000);
    TEST_ASSERT_FALSE(session.heartbeat("S0099-DEADBEEF", 0));
    hal.advanceTime(4000);
    TEST_ASSERT_TRUE(session.checkWatchdog());
    TEST_ASSERT_TRUE(hal.hasLog("Heartbeat ignored"));
}

void test_extend_deadline_during_sync(void) {
    MockControlHAL hal;
    MockHardwarePort port;
    MockFallback fallback;
    StandardInterlock rules;
    ControlSessionManager session(hal, port, fallback, rules, timings);

    char sid[SESSION_ID_LENGTH + 1];
    session.claim("remote-a", sid, sizeof(sid));

    hal.advanceTime(9000);
    TEST_ASSERT_TRUE(session.extendDeadline(sid));
    hal.advanceTime(9000);
    TEST_ASSERT_FALSE(session.checkWatchdog());

    TEST_ASSERT_FALSE(session.extendDeadline("S0099-DEADBEEF"));
    hal.advanceTime(1000);
    TEST_ASSERT_TRUE(session.checkWatchdog());
    TEST_ASSERT_FALSE(session.extendDeadline(sid));
}

// ============================================================================
// WATCHDOG THREAD
// ============================================================================

// Simulated door whose unlock hangs for a while, like a stuck actuator
class SlowUnlockPort : public SimulatedHardwarePort {
public:
    std::atomic<uint32_t> unlockDelayMs;
    std::atomic<bool> unlockEntered;

    explicit SlowUnlockPort(IPlatformHAL& hal) : SimulatedHardwarePort(hal), unlockDelayMs(0), unlockEntered(false) {}

    bool setLock(LockSide side, bool unlocked) override {
        if (unlocked) {
            unlockEntered = true;
            std::this_thread::sleep_for(std::chrono::milliseconds(unlockDelayMs.load()));
        }
        return SimulatedHardwarePort::setLock(side, unlocked);
    }
};

void test_watchdog_thread_not_held_up_by_slow_hardware(void) {
    LinuxControlHAL& hal = LinuxControlHAL::getInstance();
    hal.configurePaths("", "");
    const ControlTimings fast = { 500, 0, 0, 50, 100, 5000, 30000, INTERLOCK_REJECT };

    SlowUnlockPort port(hal);
    port.unlockDelayMs = 3000;
    MockFallback fallback;
    StandardInterlock rules;
    ControlSessionManager session(hal, port, fallback, rules, fast);
    CommandExecutorTask executor(session);
    WatchdogTask watchdog(hal, session);
    executor.start();
    watchdog.start();

    char sid[SESSION_ID_LENGTH + 1];
    TEST_ASSERT_EQUAL(CLAIM_ACCEPTED, session.claim("remote-a", sid, sizeof(sid)));
    std::chrono::steady_clock::time_point claimedAt = std::chrono::steady_clock::now();

    CommandMessage cmd;
    memset(&cmd, 0, sizeof(cmd));
    strncpy(cmd.sessionId, sid, sizeof(cmd.sessionId) - 1);
    cmd.sequence = 1;
    cmd.kind = CMD_UNLOCK_INNER;
    TEST_ASSERT_EQUAL(REJECT_NONE, session.dispatch(cmd));

    // No heartbeats: the session must leave ACTIVE on time while the unlock hangs
    while (session.getState() == ACTIVE &&
           std::chrono::steady_clock::now() - claimedAt < std::chrono::milliseconds(2500)) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    long elapsedMs = (long)std::chrono::duration_cast<std::chrono::milliseconds>(
                         std::chrono::steady_clock::now() - claimedAt).count();
    TEST_ASSERT_TRUE(port.unlockEntered);
    TEST_ASSERT_NOT_EQUAL(ACTIVE, session.getState());
    TEST_ASSERT_TRUE_MESSAGE(elapsedMs <= 500 + 50 + 250, "release started late");

    // The shutdown completes once the stuck write returns
    for (int i = 0; i < 500 && (session.getState() != IDLE || watchdog.getExpiries() == 0); i++) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    TEST_ASSERT_EQUAL(IDLE, session.getState());
    TEST_ASSERT_EQUAL(1, watchdog.getExpiries());

    HardwareSnapshot snap;
    TEST_ASSERT_TRUE(port.readSnapshot(snap));
    TEST_ASSERT_FALSE(snap.innerUnlocked);

    watchdog.stop();
    executor.stop();
}

int main(void) {
    UNITY_BEGIN();

    RUN_TEST(test_watchdog_fires_once_at_deadline);
    RUN_TEST(test_feed_moves_deadline);
    RUN_TEST(test_disarmed_never_fires);

    RUN_TEST(test_session_released_after_timeout);
    RUN_TEST(test_heartbeats_keep_session_alive);
    RUN_TEST(test_stale_heartbeat_does_not_feed);
    RUN_TEST(test_extend_deadline_during_sync);

    RUN_TEST(test_watchdog_thread_not_held_up_by_slow_hardware);

    return UNITY_END();
}
