#pragma once

#include "../core/KeyCombo.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <utility>

// Input of one protection session. Built once from CLI, config file and defaults, then never changed.
struct SProtectionConfig {
    static constexpr auto  MIN_TIMER       = std::chrono::seconds(60);
    static constexpr auto  MAX_TIMER       = std::chrono::seconds(24 * 60 * 60);
    static constexpr float DEFAULT_OPACITY = 0.3F;

    CKeyCombo                           exitKey = CKeyCombo::defaultCombo();
    std::optional<std::chrono::seconds> timer   = std::nullopt;
    bool                                hideTimer = false;
    float                               opacity   = DEFAULT_OPACITY;

    // std::nullopt if usable, the reason otherwise
    std::optional<std::string> validate() const;
};

// One source of configuration values, unset fields fall through to the next source
struct SConfigLayer {
    std::optional<std::string> exitKey   = std::nullopt;
    std::optional<std::string> timer     = std::nullopt;
    std::optional<bool>        hideTimer = std::nullopt;
    std::optional<float>       opacity   = std::nullopt;
};

struct SConfigError {
    enum eStatus : uint8_t {
        CONFIG_OK,
        CONFIG_INVALID,
    } status = CONFIG_OK;

    std::string message = "";
};

// Merge precedence: cli > file > built in default
std::pair<SProtectionConfig, SConfigError> buildProtectionConfig(const SConfigLayer& cli, const SConfigLayer& file);
