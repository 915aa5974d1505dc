#include "ProtectionConfig.hpp"
#include "../helpers/Log.hpp"
#include "../helpers/MiscFunctions.hpp"
#include <format>
#include <stdexcept>

std::optional<std::string> SProtectionConfig::validate() const {
    if (!exitKey.valid())
        return "no exit key";

    if (timer && (*timer < MIN_TIMER || *timer > MAX_TIMER))
        return "timer out of range";

    // also rejects NaN
    if (!(opacity >= 0.F && opacity <= 1.F))
        return "opacity out of range";

    return std::nullopt;
}

template <typename T>
static std::optional<T> pick(const std::optional<T>& cli, const std::optional<T>& file) {
    return cli ? cli : file;
}

std::pair<SProtectionConfig, SConfigError> buildProtectionConfig(const SConfigLayer& cli, const SConfigLayer& file) {
    SProtectionConfig config;

    if (const auto EXITKEY = pick(cli.exitKey, file.exitKey); EXITKEY) {
        const auto [combo, error] = CKeyCombo::parse(*EXITKEY);
        if (error.status != SKeyComboError::KEY_COMBO_OK)
            return {config, {.status = SConfigError::CONFIG_INVALID, .message = std::format("exit key: {}", error.message)}};

        config.exitKey = combo;
    }

    for (const auto& w : config.exitKey.warnings()) {
        Debug::log(WARN, "[config] {}", w);
    }

    if (const auto TIMER = pick(cli.timer, file.timer); TIMER) {
        try {
            config.timer = parseDuration(*TIMER);
        } catch (const std::invalid_argument& e) { return {config, {.status = SConfigError::CONFIG_INVALID, .message = std::format("timer: {}", e.what())}}; }
    }

    if (const auto HIDETIMER = pick(cli.hideTimer, file.hideTimer); HIDETIMER)
        config.hideTimer = *HIDETIMER;

    if (const auto OPACITY = pick(cli.opacity, file.opacity); OPACITY)
        config.opacity = *OPACITY;

    if (const auto INVALID = config.validate(); INVALID)
        return {config, {.status = SConfigError::CONFIG_INVALID, .message = *INVALID}};

    return {config, {}};
}
