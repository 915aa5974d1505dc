#include "UnlockMatcher.hpp"

bool NUnlockMatcher::matches(const SInputEvent& event, const CKeyCombo& combo) {
    if (event.type != INPUT_EVENT_KEY || !event.pressed || !combo.valid())
        return false;

    if (event.modifiers != combo.modifiers())
        return false;

    return normalizeKeysym(event.keysym) == combo.key();
}
