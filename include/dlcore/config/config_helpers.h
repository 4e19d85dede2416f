#pragma once

#include <dlcore/common/logging.h>
#include <dlcore/core/types.h>
#include <dlcore/downloader/downloader.hpp>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace dlcore::config {

// String trimming utilities
inline void ltrim(std::string& s) {
    s.erase(s.begin(),
            std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
}

inline void rtrim(std::string& s) {
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); })
                .base(),
            s.end());
}

inline void trim(std::string& s) {
    ltrim(s);
    rtrim(s);
}

// Quote handling
inline std::string unquote(std::string val) {
    trim(val);
    if (val.size() >= 2 && ((val.front() == '"' && val.back() == '"') ||
                            (val.front() == '\'' && val.back() == '\''))) {
        return val.substr(1, val.size() - 2);
    }
    return val;
}

// Tilde expansion ("~" and "~/...")
inline std::filesystem::path expand_tilde(const std::string& path) {
    if (!path.empty() && path[0] == '~' && (path.size() == 1 || path[1] == '/')) {
        if (const char* home = std::getenv("HOME")) {
            if (path.size() <= 2) {
                return std::filesystem::path(home);
            }
            return std::filesystem::path(home) / path.substr(2);
        }
    }
    return path;
}

// Parse a value from TOML config file. Returns "" when the file, section or key is missing.
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

/// Strict numeric/boolean parsing of config values; nullopt on malformed input.
std::optional<std::uint64_t> parse_uint(std::string_view value);
std::optional<bool> parse_bool(std::string_view value);

// Resolution order: override_path -> $DLCORE_CONFIG -> $XDG_CONFIG_HOME/dlcore/config.toml
// -> ~/.config/dlcore/config.toml
std::filesystem::path get_config_path(const std::string& override_path = "");

/// Returns the user config directory
/// $XDG_CONFIG_HOME/dlcore or ~/.config/dlcore
std::filesystem::path get_config_dir();

/// Returns the user data directory (task database, JSON registry)
/// $DLCORE_DATA_DIR, else $XDG_DATA_HOME/dlcore or ~/.local/share/dlcore
std::filesystem::path get_data_dir();

/// Returns the default download directory
/// $DLCORE_DOWNLOAD_DIR, else ~/Downloads/dlcore
std::filesystem::path get_default_download_dir();

/**
 * Fully resolved runtime configuration.
 */
struct DlcoreConfig {
    downloader::DownloaderConfig downloader;
    downloader::StorageConfig storage;
    LogConfig logging;
    std::filesystem::path sourcePath; // config file that was read (may not exist)
};

/// Defaults with environment overrides applied, no file read.
DlcoreConfig default_config();

/**
 * Load config.toml (a missing file yields defaults) and apply environment overrides.
 * Malformed values return InvalidArgument naming the offending key.
 */
Result<DlcoreConfig> load_config(const std::string& override_path = "");

} // namespace dlcore::config
