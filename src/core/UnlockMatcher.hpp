#pragma once

#include "InputInterceptor.hpp"
#include "KeyCombo.hpp"

namespace NUnlockMatcher {
    // True iff event is a key press whose modifier set equals combo's exactly and whose key is combo's key.
    // Stateless, every chord is judged on its own final key.
    bool matches(const SInputEvent& event, const CKeyCombo& combo);
};
