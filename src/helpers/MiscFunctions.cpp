#include <filesystem>
#include <algorithm>
#include <cctype>
#include <format>
#include <stdexcept>
#include <fcntl.h>
#include "MiscFunctions.hpp"
#include "Log.hpp"
#include <unistd.h>

std::string absolutePath(const std::string& rawpath, const std::string& currentDir) {
    std::filesystem::path path(rawpath);

    // Handling where rawpath starts with '~'
    if (!rawpath.empty() && rawpath[0] == '~') {
        static const char* const ENVHOME = getenv("HOME");
        path                             = std::filesystem::path(ENVHOME ? ENVHOME : "") / path.relative_path().string().substr(2);
    }

    if (path.is_relative())
        return std::filesystem::weakly_canonical(std::filesystem::path(currentDir) / path);

    return std::filesystem::weakly_canonical(path);
}

int createPoolFile(size_t size, std::string& name) {
    const auto XDGRUNTIMEDIR = getenv("XDG_RUNTIME_DIR");
    if (!XDGRUNTIMEDIR) {
        Debug::log(CRIT, "XDG_RUNTIME_DIR not set!");
        return -1;
    }

    name = std::string(XDGRUNTIMEDIR) + "/.hyprshield_shm_XXXXXX";

    const auto FD = mkostemp(name.data(), O_CLOEXEC);
    if (FD < 0) {
        Debug::log(CRIT, "createPoolFile: fd < 0");
        return -1;
    }

    // the fd keeps the pool alive, the name is not needed after this
    unlink(name.c_str());

    if (ftruncate(FD, size) < 0) {
        close(FD);
        Debug::log(CRIT, "createPoolFile: ftruncate < 0");
        return -1;
    }

    return FD;
}

std::chrono::minutes parseDuration(const std::string& text) {
    std::string compact;
    for (const char c : text) {
        if (!std::isspace((unsigned char)c))
            compact += (char)std::tolower((unsigned char)c);
    }

    if (compact.empty())
        throw std::invalid_argument("empty duration");

    int64_t     hours = -1, minutes = -1;
    std::string number;

    for (const char c : compact) {
        if (std::isdigit((unsigned char)c)) {
            number += c;
            continue;
        }

        if (number.empty())
            throw std::invalid_argument(std::format("expected a number before '{}' in \"{}\"", c, text));

        if (number.size() > 6)
            throw std::invalid_argument(std::format("value too large in \"{}\"", text));

        const int64_t VALUE = std::stoll(number);
        number.clear();

        if (c == 'h') {
            if (hours >= 0 || minutes >= 0)
                throw std::invalid_argument(std::format("unexpected hour component in \"{}\"", text));
            hours = VALUE;
        } else if (c == 'm') {
            if (minutes >= 0)
                throw std::invalid_argument(std::format("duplicate minute component in \"{}\"", text));
            minutes = VALUE;
        } else
            throw std::invalid_argument(std::format("unknown unit '{}' in \"{}\"", c, text));
    }

    if (!number.empty())
        throw std::invalid_argument(std::format("missing unit after {} in \"{}\"", number, text));

    return std::chrono::hours(std::max<int64_t>(hours, 0)) + std::chrono::minutes(std::max<int64_t>(minutes, 0));
}

std::string formatDuration(std::chrono::minutes duration) {
    const auto HOURS   = std::chrono::duration_cast<std::chrono::hours>(duration);
    const auto MINUTES = duration - HOURS;

    if (HOURS.count() == 0)
        return std::format("{}m", MINUTES.count());
    if (MINUTES.count() == 0)
        return std::format("{}h", HOURS.count());

    return std::format("{}h{}m", HOURS.count(), MINUTES.count());
}

std::string formatCountdown(std::chrono::milliseconds remaining) {
    // round up, "0:00" only shows once the countdown actually completed
    const int64_t TOTALSECS = std::max<int64_t>(0, (remaining.count() + 999) / 1000);
    const int64_t HOURS     = TOTALSECS / 3600;
    const int64_t MINUTES   = (TOTALSECS % 3600) / 60;
    const int64_t SECONDS   = TOTALSECS % 60;

    if (HOURS > 0)
        return std::format("{}:{:02}:{:02}", HOURS, MINUTES, SECONDS);

    return std::format("{:02}:{:02}", MINUTES, SECONDS);
}
