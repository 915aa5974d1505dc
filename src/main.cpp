
#include "config/ConfigManager.hpp"
#include "config/ProtectionConfig.hpp"
#include "core/hyprshield.hpp"
#include "helpers/Log.hpp"
#include <cstddef>
#include <cmath>
#include <string_view>

void help() {
    std::println("Usage: hyprshield [options]\n\n"
                 "Blocks keyboard, mouse and touch input while keeping the screen visible.\n\n"
                 "Options:\n"
                 "  -v, --verbose              - Enable verbose logging\n"
                 "  -q, --quiet                - Disable logging\n"
                 "  -c FILE, --config FILE     - Specify config file to use\n"
                 "  --display NAME             - Specify the Wayland display to connect to\n"
                 "  -k COMBO, --exit-key COMBO - Key combination that ends protection (default Super+Alt+U)\n"
                 "  -t TIME, --timer TIME      - End protection automatically after TIME (e.g. 30m, 1h30m)\n"
                 "  --hide-timer               - Do not show the remaining time\n"
                 "  -o VALUE, --opacity VALUE  - Tint opacity from 0.0 to 1.0 (default 0.3)\n"
                 "  --no-screencopy            - Do not capture the screen, paint an opaque overlay\n"
                 "  -V, --version              - Show version information\n"
                 "  -h, --help                 - Show this help message");
}

std::optional<std::string> parseArg(const std::vector<std::string>& args, const std::string& flag, std::size_t& i) {
    if (i + 1 < args.size()) {
        return args[++i];
    } else {
        std::println(stderr, "Error: Missing value for {} option.", flag);
        return std::nullopt;
    }
}

static void printVersion() {
    constexpr bool ISTAGGEDRELEASE = std::string_view(HYPRSHIELD_COMMIT) == HYPRSHIELD_VERSION_COMMIT;
    if (ISTAGGEDRELEASE)
        std::println("Hyprshield version v{}", HYPRSHIELD_VERSION);
    else
        std::println("Hyprshield version v{} (commit {})", HYPRSHIELD_VERSION, HYPRSHIELD_COMMIT);
}

int main(int argc, char** argv, char** envp) {
    std::string              configPath;
    std::string              wlDisplay;
    bool                     noScreencopy = false;
    SConfigLayer             cliLayer;

    std::vector<std::string> args(argv, argv + argc);

    for (std::size_t i = 1; i < args.size(); ++i) {
        const std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            help();
            return 0;
        }

        if (arg == "--version" || arg == "-V") {
            printVersion();
            return 0;
        }

        if (arg == "--verbose" || arg == "-v")
            Debug::verbose = true;

        else if (arg == "--quiet" || arg == "-q")
            Debug::quiet = true;

        else if (arg == "--config" || arg == "-c") {
            if (auto value = parseArg(args, arg, i); value)
                configPath = *value;
            else
                return 1;

        } else if (arg == "--display") {
            if (auto value = parseArg(args, arg, i); value)
                wlDisplay = *value;
            else
                return 1;

        } else if (arg == "--exit-key" || arg == "-k") {
            if (auto value = parseArg(args, arg, i); value)
                cliLayer.exitKey = *value;
            else
                return 1;

        } else if (arg == "--timer" || arg == "-t") {
            if (auto value = parseArg(args, arg, i); value)
                cliLayer.timer = *value;
            else
                return 1;

        } else if (arg == "--opacity" || arg == "-o") {
            if (auto value = parseArg(args, arg, i); value) {
                try {
                    std::size_t used    = 0;
                    const float OPACITY = std::stof(*value, &used);
                    if (used != value->size() || !std::isfinite(OPACITY)) {
                        std::println(stderr, "Error: Invalid opacity value: {}", *value);
                        return 1;
                    }
                    cliLayer.opacity = OPACITY;
                } catch (const std::exception&) {
                    std::println(stderr, "Error: Invalid opacity value: {}", *value);
                    return 1;
                }
            } else
                return 1;

        } else if (arg == "--hide-timer")
            cliLayer.hideTimer = true;

        else if (arg == "--no-screencopy")
            noScreencopy = true;

        else {
            std::println(stderr, "Unknown option: {}", arg);
            help();
            return 1;
        }
    }

    printVersion();

    try {
        g_pConfigManager = makeUnique<CConfigManager>(configPath);
        g_pConfigManager->init();
    } catch (const std::exception& ex) {
        Debug::log(CRIT, "ConfigManager threw: {}", ex.what());
        if (std::string(ex.what()).contains("File does not exist"))
            Debug::log(ERR, "Check the path passed to --config.");

        return 1;
    }

    const auto [config, error] = buildProtectionConfig(cliLayer, g_pConfigManager->fileLayer());
    if (error.status != SConfigError::CONFIG_OK) {
        Debug::log(CRIT, "Invalid configuration: {}", error.message);
        return 1;
    }

    static const auto SCREENCOPY = g_pConfigManager->getValue<Hyprlang::INT>("general:screencopy");

    int               exitCode = 1;

    try {
        g_pHyprshield = makeUnique<CHyprshield>(wlDisplay, *SCREENCOPY && !noScreencopy);
        exitCode      = g_pHyprshield->run(config);
    } catch (const std::exception& ex) {
        Debug::log(CRIT, "Hyprshield threw: {}", ex.what());
        return 1;
    }

    g_pHyprshield.reset();

    return exitCode;
}
