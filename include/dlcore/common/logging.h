#pragma once

#include <dlcore/core/types.h>

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

namespace dlcore {

/**
 * Logging configuration ([logging] section of config.toml).
 */
struct LogConfig {
    std::string level{"info"};              // trace|debug|info|warn|error|off
    std::filesystem::path file;             // empty = console only
    std::size_t maxFileBytes{10 * 1024 * 1024};
    std::size_t maxFiles{5};
    bool console{true};
};

/**
 * Install the dlcore default spdlog logger: colour console sink plus an optional
 * rotating file sink. Safe to call more than once; the last call wins.
 */
Result<void> initLogging(const LogConfig& config);

/**
 * Apply a textual level ("trace", "debug", ...). Unknown names leave the level unchanged
 * and return InvalidArgument.
 */
Result<void> setLogLevel(std::string_view level);

} // namespace dlcore
