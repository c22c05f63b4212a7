/*
 * =================================================================================
 * File:      lib/ControlEngine/InterlockRules.h
 * Description: Policy for commands that would open both sides of the flap.
 * =================================================================================
 */
#pragma once
#include "Types.h"

struct InterlockVerdict {
    bool allowed;
    bool needsCorrection;
    CommandKind correction; // Valid when needsCorrection is set
};

class IInterlockRules {
public:
    virtual ~IInterlockRules() {}

    // Evaluates 'kind' against the given (projected) lock state.
    virtual InterlockVerdict evaluate(bool innerUnlocked, bool outerUnlocked, CommandKind kind) const = 0;

    virtual InterlockMode getMode() const = 0;
};
