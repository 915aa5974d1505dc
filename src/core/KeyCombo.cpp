#include "KeyCombo.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <format>
#include <optional>
#include <hyprutils/string/String.hpp>

using namespace Hyprutils::String;

struct SModifierAlias {
    const char* name;
    eModifier   modifier;
};

struct SNamedKey {
    const char*  name;
    xkb_keysym_t sym;
};

// clang-format off
static constexpr std::array<SModifierAlias, 13> MODIFIER_ALIASES = {{
    {"cmd", MODIFIER_SUPER}, {"command", MODIFIER_SUPER}, {"super", MODIFIER_SUPER}, {"meta", MODIFIER_SUPER}, {"logo", MODIFIER_SUPER}, {"win", MODIFIER_SUPER},
    {"mod4", MODIFIER_SUPER},
    {"option", MODIFIER_ALT}, {"opt", MODIFIER_ALT}, {"alt", MODIFIER_ALT}, {"mod1", MODIFIER_ALT},
    {"ctrl", MODIFIER_CTRL}, {"control", MODIFIER_CTRL},
}};

// first entry for a keysym is its canonical spelling
static constexpr std::array<SNamedKey, 12> NAMED_KEYS = {{
    {"Escape", XKB_KEY_Escape}, {"Esc", XKB_KEY_Escape},
    {"Return", XKB_KEY_Return}, {"Enter", XKB_KEY_Return},
    {"Tab", XKB_KEY_Tab},
    {"Space", XKB_KEY_space},
    {"Delete", XKB_KEY_Delete}, {"Del", XKB_KEY_Delete},
    {"Left", XKB_KEY_Left}, {"Right", XKB_KEY_Right}, {"Up", XKB_KEY_Up}, {"Down", XKB_KEY_Down},
}};
// clang-format on

static std::string lowercase(std::string str) {
    std::ranges::transform(str, str.begin(), [](unsigned char c) { return std::tolower(c); });
    return str;
}

static std::optional<eModifier> modifierFromToken(const std::string& token) {
    const auto LOWER = lowercase(token);

    // shift has no aliases
    if (LOWER == "shift")
        return MODIFIER_SHIFT;

    for (const auto& alias : MODIFIER_ALIASES) {
        if (LOWER == alias.name)
            return alias.modifier;
    }

    return std::nullopt;
}

static std::optional<xkb_keysym_t> keyFromToken(const std::string& token) {
    const auto LOWER = lowercase(token);

    if (LOWER.size() == 1) {
        const char C = LOWER[0];
        if (C >= 'a' && C <= 'z')
            return XKB_KEY_a + (C - 'a');
        if (C >= '0' && C <= '9')
            return XKB_KEY_0 + (C - '0');
        return std::nullopt;
    }

    if (LOWER[0] == 'f' && LOWER.size() <= 3 && isNumber(LOWER.substr(1), false)) {
        const int N = std::stoi(LOWER.substr(1));
        if (N >= 1 && N <= 12)
            return XKB_KEY_F1 + (N - 1);
        return std::nullopt;
    }

    for (const auto& named : NAMED_KEYS) {
        if (LOWER == lowercase(named.name))
            return named.sym;
    }

    return std::nullopt;
}

xkb_keysym_t normalizeKeysym(xkb_keysym_t sym) {
    const auto LOWER = xkb_keysym_to_lower(sym);
    return keyNameForKeysym(LOWER).empty() ? XKB_KEY_NoSymbol : LOWER;
}

std::string keyNameForKeysym(xkb_keysym_t sym) {
    if (sym >= XKB_KEY_a && sym <= XKB_KEY_z)
        return std::string(1, (char)('A' + (sym - XKB_KEY_a)));
    if (sym >= XKB_KEY_0 && sym <= XKB_KEY_9)
        return std::string(1, (char)('0' + (sym - XKB_KEY_0)));
    if (sym >= XKB_KEY_F1 && sym <= XKB_KEY_F12)
        return std::format("F{}", sym - XKB_KEY_F1 + 1);

    for (const auto& named : NAMED_KEYS) {
        if (named.sym == sym)
            return named.name;
    }

    return "";
}

CKeyCombo::CKeyCombo(uint8_t modifiers, xkb_keysym_t key) : m_modifiers(modifiers), m_key(key) {
    ;
}

std::pair<CKeyCombo, SKeyComboError> CKeyCombo::parse(const std::string& text) {
    uint8_t                     modifiers = MODIFIER_NONE;
    std::optional<xkb_keysym_t> key;
    std::string                 keyToken;

    size_t                      pos = 0;
    while (pos <= text.size()) {
        const auto  NEXT  = std::min(text.find('+', pos), text.size());
        const auto  TOKEN = trim(text.substr(pos, NEXT - pos));
        pos               = NEXT + 1;

        if (TOKEN.empty())
            continue;

        if (const auto MOD = modifierFromToken(TOKEN); MOD) {
            modifiers |= *MOD;
            continue;
        }

        const auto SYM = keyFromToken(TOKEN);
        if (!SYM)
            return {CKeyCombo{},
                    {
                        .status  = SKeyComboError::KEY_COMBO_UNKNOWN_TOKEN,
                        .token   = TOKEN,
                        .message = std::format("unknown key or modifier \"{}\"", TOKEN),
                    }};

        if (key)
            return {CKeyCombo{},
                    {
                        .status  = SKeyComboError::KEY_COMBO_MULTIPLE_PRIMARY_KEYS,
                        .token   = TOKEN,
                        .message = std::format("more than one key in \"{}\" ({} and {})", text, keyToken, TOKEN),
                    }};

        key      = SYM;
        keyToken = TOKEN;
    }

    if (!key)
        return {CKeyCombo{},
                {
                    .status  = SKeyComboError::KEY_COMBO_NO_PRIMARY_KEY,
                    .message = std::format("no key in \"{}\"", text),
                }};

    return {CKeyCombo{modifiers, *key}, {}};
}

CKeyCombo CKeyCombo::defaultCombo() {
    return CKeyCombo(MODIFIER_SUPER | MODIFIER_ALT, XKB_KEY_u);
}

std::string CKeyCombo::render() const {
    std::string result;

    if (m_modifiers & MODIFIER_SUPER)
        result += "Super+";
    if (m_modifiers & MODIFIER_CTRL)
        result += "Ctrl+";
    if (m_modifiers & MODIFIER_ALT)
        result += "Alt+";
    if (m_modifiers & MODIFIER_SHIFT)
        result += "Shift+";

    return result + keyNameForKeysym(m_key);
}

std::vector<std::string> CKeyCombo::warnings() const {
    std::vector<std::string> result;

    if (m_modifiers == MODIFIER_NONE)
        result.emplace_back(std::format("{} has no modifiers and can be pressed by accident", render()));
    else if (m_modifiers == MODIFIER_SHIFT)
        result.emplace_back(std::format("{} only uses shift and can be pressed by accident", render()));

    return result;
}

uint8_t CKeyCombo::modifiers() const {
    return m_modifiers;
}

xkb_keysym_t CKeyCombo::key() const {
    return m_key;
}

bool CKeyCombo::valid() const {
    return m_key != XKB_KEY_NoSymbol;
}
