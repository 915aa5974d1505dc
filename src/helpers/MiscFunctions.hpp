#pragma once

#include <chrono>
#include <string>

std::string          absolutePath(const std::string&, const std::string&);
int                  createPoolFile(size_t size, std::string& name);

// "30m", "2h", "1h30m", "1h 30m". Throws std::invalid_argument on malformed input.
std::chrono::minutes parseDuration(const std::string& text);
std::string          formatDuration(std::chrono::minutes duration);
std::string          formatCountdown(std::chrono::milliseconds remaining);
