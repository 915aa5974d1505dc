#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include "shared.hpp"
#include "../src/config/ConfigManager.hpp"

static void writeFile(const std::filesystem::path& path, const std::string& content) {
    std::ofstream file(path);
    file << content;
}

int main() {
    int ret = 0;

    char dirTemplate[] = "/tmp/hyprshield-configXXXXXX";
    if (!mkdtemp(dirTemplate)) {
        std::println("{}Failed: {}could not create a scratch dir", Colors::RED, Colors::RESET);
        return 1;
    }

    const std::filesystem::path DIR = dirTemplate;

    writeFile(DIR / "extra.conf", "general {\n    timer = 45m\n    opacity = 0.6\n}\n");
    writeFile(DIR / "hyprshield.conf", "source = ./extra.conf\n\ngeneral {\n    exit_key = Ctrl+Alt+Q\n    hide_timer = true\n}\n");

    {
        // values come from the main file and the sourced one
        g_pConfigManager = makeUnique<CConfigManager>((DIR / "hyprshield.conf").string());
        g_pConfigManager->init();

        const auto LAYER = g_pConfigManager->fileLayer();
        EXPECT(LAYER.exitKey.value_or(""), std::string{"Ctrl+Alt+Q"});
        EXPECT(LAYER.timer.value_or(""), std::string{"45m"});
        EXPECT(LAYER.hideTimer.value_or(false), true);
        EXPECT(LAYER.opacity.value_or(0.F) > 0.59F && LAYER.opacity.value_or(0.F) < 0.61F, true);

        // the glob buffer is released on every path
        EXPECT(g_pConfigManager->handleSource("source", "./extra.conf").has_value(), false);
        EXPECT(g_pConfigManager->handleSource("source", "./missing-*.conf").has_value(), true);
        EXPECT(g_pConfigManager->handleSource("source", "x").has_value(), true);
    }

    {
        // unset keys stay unset
        writeFile(DIR / "empty.conf", "general {\n    opacity = 0.2\n}\n");
        g_pConfigManager = makeUnique<CConfigManager>((DIR / "empty.conf").string());
        g_pConfigManager->init();

        const auto LAYER = g_pConfigManager->fileLayer();
        EXPECT(LAYER.exitKey.has_value(), false);
        EXPECT(LAYER.timer.has_value(), false);
        EXPECT(LAYER.hideTimer.value_or(true), false);
    }

    g_pConfigManager.reset();
    std::filesystem::remove_all(DIR);

    return ret;
}
