#pragma once

#include <hyprlang.hpp>
#include <optional>
#include <string>

#include "../defines.hpp"
#include "ProtectionConfig.hpp"

class CConfigManager {
  public:
    CConfigManager(std::string configPath);
    void init();

    template <typename T>
    Hyprlang::CSimpleConfigValue<T> getValue(const std::string& name) {
        return Hyprlang::CSimpleConfigValue<T>(&m_config, name.c_str());
    }

    // The protection related values of the file, empty strings count as unset
    SConfigLayer               fileLayer();

    std::optional<std::string> handleSource(const std::string&, const std::string&);

    std::string                configCurrentPath;

  private:
    Hyprlang::CConfig m_config;
};

inline UP<CConfigManager> g_pConfigManager;
