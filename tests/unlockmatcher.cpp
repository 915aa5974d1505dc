#include "shared.hpp"
#include "../src/core/UnlockMatcher.hpp"

static SInputEvent keyPress(uint8_t modifiers, xkb_keysym_t sym) {
    return {.type = INPUT_EVENT_KEY, .pressed = true, .modifiers = modifiers, .keysym = sym};
}

int main() {
    int        ret   = 0;
    const auto COMBO = CKeyCombo::defaultCombo();

    EXPECT(NUnlockMatcher::matches(keyPress(MODIFIER_SUPER | MODIFIER_ALT, XKB_KEY_u), COMBO), true);
    // level 0 keysym is lower case already, but an upper case one still matches
    EXPECT(NUnlockMatcher::matches(keyPress(MODIFIER_SUPER | MODIFIER_ALT, XKB_KEY_U), COMBO), true);

    // exact modifier set, no more and no less
    EXPECT(NUnlockMatcher::matches(keyPress(MODIFIER_SUPER, XKB_KEY_u), COMBO), false);
    EXPECT(NUnlockMatcher::matches(keyPress(MODIFIER_SUPER | MODIFIER_ALT | MODIFIER_SHIFT, XKB_KEY_u), COMBO), false);
    EXPECT(NUnlockMatcher::matches(keyPress(MODIFIER_NONE, XKB_KEY_u), COMBO), false);

    EXPECT(NUnlockMatcher::matches(keyPress(MODIFIER_SUPER | MODIFIER_ALT, XKB_KEY_i), COMBO), false);

    // releases never match
    auto release    = keyPress(MODIFIER_SUPER | MODIFIER_ALT, XKB_KEY_u);
    release.pressed = false;
    EXPECT(NUnlockMatcher::matches(release, COMBO), false);

    // neither do pointer events, even with the modifiers held
    SInputEvent click{.type = INPUT_EVENT_POINTER_BUTTON, .pressed = true, .modifiers = MODIFIER_SUPER | MODIFIER_ALT, .keysym = XKB_KEY_u};
    EXPECT(NUnlockMatcher::matches(click, COMBO), false);

    const auto [esc, escError] = CKeyCombo::parse("Ctrl+Escape");
    EXPECT(escError.status, SKeyComboError::KEY_COMBO_OK);
    EXPECT(NUnlockMatcher::matches(keyPress(MODIFIER_CTRL, XKB_KEY_Escape), esc), true);
    EXPECT(NUnlockMatcher::matches(keyPress(MODIFIER_CTRL, XKB_KEY_Escape), COMBO), false);

    // classification
    EXPECT(classifyInput(keyPress(MODIFIER_SUPER | MODIFIER_ALT, XKB_KEY_u), COMBO), INPUT_UNLOCK);
    EXPECT(classifyInput(keyPress(MODIFIER_NONE, XKB_KEY_a), COMBO), INPUT_SUPPRESS);

    SInputEvent onButton{.type = INPUT_EVENT_POINTER_BUTTON, .pressed = true, .onCloseControl = true};
    EXPECT(classifyInput(onButton, COMBO), INPUT_CLOSE_CONTROL);

    SInputEvent offButton{.type = INPUT_EVENT_POINTER_BUTTON, .pressed = true, .onCloseControl = false};
    EXPECT(classifyInput(offButton, COMBO), INPUT_SUPPRESS);

    SInputEvent touch{.type = INPUT_EVENT_TOUCH_DOWN, .pressed = true, .onCloseControl = true};
    EXPECT(classifyInput(touch, COMBO), INPUT_CLOSE_CONTROL);

    return ret;
}
