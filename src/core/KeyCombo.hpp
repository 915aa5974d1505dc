#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>
#include <xkbcommon/xkbcommon.h>

enum eModifier : uint8_t {
    MODIFIER_NONE  = 0,
    MODIFIER_SUPER = 1 << 0, // "command"
    MODIFIER_CTRL  = 1 << 1,
    MODIFIER_ALT   = 1 << 2, // "option"
    MODIFIER_SHIFT = 1 << 3,
};

struct SKeyComboError {
    enum eStatus : uint8_t {
        KEY_COMBO_OK,
        KEY_COMBO_UNKNOWN_TOKEN,
        KEY_COMBO_NO_PRIMARY_KEY,
        KEY_COMBO_MULTIPLE_PRIMARY_KEYS,
    } status = KEY_COMBO_OK;

    // the offending token for KEY_COMBO_UNKNOWN_TOKEN and KEY_COMBO_MULTIPLE_PRIMARY_KEYS
    std::string token   = "";
    std::string message = "";
};

// An unlock chord: a set of modifiers plus exactly one primary key.
// Immutable once parsed, compare with ==.
class CKeyCombo {
  public:
    CKeyCombo() = default;
    CKeyCombo(uint8_t modifiers, xkb_keysym_t key);

    // Split on '+', every token is matched case-insensitively against the modifier aliases or the key vocabulary.
    static std::pair<CKeyCombo, SKeyComboError> parse(const std::string& text);

    // Built in unlock chord, Super+Alt+U
    static CKeyCombo         defaultCombo();

    std::string              render() const;
    std::vector<std::string> warnings() const;

    uint8_t                  modifiers() const;
    xkb_keysym_t             key() const;
    bool                     valid() const;

    bool                     operator==(const CKeyCombo& other) const = default;

  private:
    uint8_t      m_modifiers = MODIFIER_NONE;
    xkb_keysym_t m_key       = XKB_KEY_NoSymbol;
};

// Canonical name of a primary key, empty if the keysym is not part of the vocabulary
std::string  keyNameForKeysym(xkb_keysym_t sym);
// Lower cased keysym as stored in a CKeyCombo, NoSymbol for keys outside the vocabulary
xkb_keysym_t normalizeKeysym(xkb_keysym_t sym);
