#include "ConfigManager.hpp"
#include "../helpers/MiscFunctions.hpp"
#include "../helpers/Log.hpp"
#include <hyprlang.hpp>
#include <hyprutils/path/Path.hpp>
#include <hyprutils/string/String.hpp>
#include <filesystem>
#include <glob.h>
#include <cstdlib>
#include <cstring>
#include <format>
#include <memory>

using namespace Hyprutils::String;

static Hyprlang::CParseResult handleSource(const char* c, const char* v) {
    const std::string      VALUE   = v;
    const std::string      COMMAND = c;

    const auto             RESULT = g_pConfigManager->handleSource(COMMAND, VALUE);

    Hyprlang::CParseResult result;
    if (RESULT.has_value())
        result.setError(RESULT.value().c_str());
    return result;
}

// A missing default config is fine, we just run on defaults
static std::string getMainConfigPath() {
    static const auto paths = Hyprutils::Path::findConfig("hyprshield");
    if (paths.first.has_value())
        return paths.first.value();

    const char* xdgConfigHome = getenv("XDG_CONFIG_HOME");
    if (xdgConfigHome && xdgConfigHome[0] != '\0')
        return std::string{xdgConfigHome} + "/hypr/hyprshield.conf";

    const char* home = getenv("HOME");
    return std::string{home ? home : ""} + "/.config/hypr/hyprshield.conf";
}

CConfigManager::CConfigManager(std::string configPath) :
    m_config(configPath.empty() ? getMainConfigPath().c_str() : configPath.c_str(), Hyprlang::SConfigOptions{.throwAllErrors = true, .allowMissingConfig = configPath.empty()}) {
    configCurrentPath = configPath.empty() ? getMainConfigPath() : configPath;
}

void CConfigManager::init() {
    m_config.addConfigValue("general:exit_key", Hyprlang::STRING{""});
    m_config.addConfigValue("general:timer", Hyprlang::STRING{""});
    m_config.addConfigValue("general:hide_timer", Hyprlang::INT{0});
    m_config.addConfigValue("general:opacity", Hyprlang::FLOAT{SProtectionConfig::DEFAULT_OPACITY});
    m_config.addConfigValue("general:screencopy", Hyprlang::INT{1});
    m_config.addConfigValue("general:hide_cursor", Hyprlang::INT{0});

    m_config.registerHandler(&::handleSource, "source", {.allowFlags = false});

    m_config.commence();

    auto result = m_config.parse();

    if (result.error)
        Debug::log(ERR, "[config] Config has errors:\n{}\nProceeding ignoring faulty entries", result.getError());
}

SConfigLayer CConfigManager::fileLayer() {
    const auto   EXITKEY   = getValue<Hyprlang::STRING>("general:exit_key");
    const auto   TIMER     = getValue<Hyprlang::STRING>("general:timer");
    const auto   HIDETIMER = getValue<Hyprlang::INT>("general:hide_timer");
    const auto   OPACITY   = getValue<Hyprlang::FLOAT>("general:opacity");

    SConfigLayer layer;

    if (const auto KEY = trim(std::string{*EXITKEY}); !KEY.empty())
        layer.exitKey = KEY;

    if (const auto DURATION = trim(std::string{*TIMER}); !DURATION.empty())
        layer.timer = DURATION;

    layer.hideTimer = *HIDETIMER != 0;
    layer.opacity   = *OPACITY;

    Debug::log(TRACE, "[config] {}: exit_key \"{}\", timer \"{}\", hide_timer {}, opacity {}", configCurrentPath, layer.exitKey.value_or(""), layer.timer.value_or(""),
               *layer.hideTimer, *layer.opacity);

    return layer;
}

std::optional<std::string> CConfigManager::handleSource(const std::string& command, const std::string& rawpath) {
    if (rawpath.length() < 2) {
        Debug::log(ERR, "[config] source= path garbage");
        return "source path " + rawpath + " bogus!";
    }
    std::unique_ptr<glob_t, void (*)(glob_t*)> glob_buf{new glob_t, [](glob_t* g) {
                                                                      globfree(g);
                                                                      delete g;
                                                                  }};
    memset(glob_buf.get(), 0, sizeof(glob_t));

    const auto CURRENTDIR = std::filesystem::path(configCurrentPath).parent_path().string();

    if (auto r = glob(absolutePath(rawpath, CURRENTDIR).c_str(), GLOB_TILDE, nullptr, glob_buf.get()); r != 0) {
        std::string err = std::format("source= globbing error: {}", r == GLOB_NOMATCH ? "found no match" : r == GLOB_ABORTED ? "read error" : "out of memory");
        Debug::log(ERR, "[config] {}", err);
        return err;
    }

    for (size_t i = 0; i < glob_buf->gl_pathc; i++) {
        const auto PATH = absolutePath(glob_buf->gl_pathv[i], CURRENTDIR);

        if (PATH.empty() || PATH == configCurrentPath) {
            Debug::log(WARN, "[config] source= skipping invalid path");
            continue;
        }

        if (!std::filesystem::is_regular_file(PATH)) {
            if (std::filesystem::exists(PATH)) {
                Debug::log(WARN, "[config] source= skipping non-file {}", PATH);
                continue;
            }

            Debug::log(ERR, "[config] source= file doesnt exist");
            return "source file " + PATH + " doesn't exist!";
        }

        // nested sources resolve relative to the file that sourced them
        auto backupConfigPath = configCurrentPath;
        configCurrentPath     = PATH;

        m_config.parseFile(PATH.c_str());

        configCurrentPath = backupConfigPath;
    }

    return {};
}
