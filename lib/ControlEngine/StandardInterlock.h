/*
 * =================================================================================
 * File:      lib/ControlEngine/StandardInterlock.h
 * Description: Default interlock. Inner and outer lock are never unlocked together.
 * INTERLOCK_REJECT refuses the offending unlock; INTERLOCK_CORRECT locks the
 * opposite side first and then performs the unlock.
 * =================================================================================
 */
#pragma once
#include "InterlockRules.h"

class StandardInterlock : public IInterlockRules {
public:
    explicit StandardInterlock(InterlockMode mode = INTERLOCK_REJECT) : _mode(mode) {}

    static bool wouldOpenBoth(bool innerUnlocked, bool outerUnlocked, CommandKind kind) {
        if (kind == CMD_UNLOCK_INNER) return outerUnlocked;
        if (kind == CMD_UNLOCK_OUTER) return innerUnlocked;
        return false;
    }

    InterlockVerdict evaluate(bool innerUnlocked, bool outerUnlocked, CommandKind kind) const override {
        InterlockVerdict v = { true, false, CMD_UNKNOWN };
        if (!wouldOpenBoth(innerUnlocked, outerUnlocked, kind)) return v;

        if (_mode == INTERLOCK_CORRECT) {
            v.needsCorrection = true;
            v.correction = (kind == CMD_UNLOCK_INNER) ? CMD_LOCK_OUTER : CMD_LOCK_INNER;
            return v;
        }

        v.allowed = false;
        return v;
    }

    InterlockMode getMode() const override { return _mode; }

private:
    InterlockMode _mode;
};
