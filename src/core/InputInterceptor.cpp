#include "InputInterceptor.hpp"
#include "UnlockMatcher.hpp"

eInputDecision classifyInput(const SInputEvent& event, const CKeyCombo& combo) {
    if (NUnlockMatcher::matches(event, combo))
        return INPUT_UNLOCK;

    if (event.type != INPUT_EVENT_KEY && event.onCloseControl)
        return INPUT_CLOSE_CONTROL;

    return INPUT_SUPPRESS;
}

const char* inputDecisionString(eInputDecision decision) {
    switch (decision) {
        case INPUT_SUPPRESS: return "suppress";
        case INPUT_UNLOCK: return "unlock";
        case INPUT_CLOSE_CONTROL: return "close control";
        default: return "??";
    }
}
