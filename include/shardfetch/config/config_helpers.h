#pragma once

#include <shardfetch/fetch/fetcher.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace shardfetch::config {

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

// Tilde expansion
inline std::filesystem::path expand_tilde(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            if (path.size() == 1)
                return std::filesystem::path(home);
            return std::filesystem::path(home) / path.substr(2);
        }
    }
    return path;
}

// "true/false/yes/no/on/off/1/0"; std::nullopt for anything else
std::optional<bool> parse_bool(std::string_view s);

// Non-negative integer; std::nullopt when malformed
std::optional<long long> parse_int(std::string_view s);

// Parse a value from TOML config file. Accepts "[section] key = v" and "section.key = v".
// Returns an empty string when the file or the key is missing.
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

// Get standard config path
// Order: override → SHARDFETCH_CONFIG → $XDG_CONFIG_HOME/shardfetch/config.toml → ~/.config/...
std::filesystem::path get_config_path(const std::string& override_path = "");

/// Returns the user cache directory
/// Windows: %LOCALAPPDATA%\shardfetch\cache
/// Unix: $XDG_CACHE_HOME/shardfetch or ~/.cache/shardfetch
std::filesystem::path get_cache_dir();

// Cache directory resolution (env SHARDFETCH_CACHE_DIR → config cache.dir → get_cache_dir())
std::filesystem::path resolve_cache_dir_from_config(const std::filesystem::path& config_path);

/**
 * Build the fetcher configuration from a config file (missing file = defaults) with
 * SHARDFETCH_* environment overrides applied on top. Malformed values are logged and
 * the default is kept.
 */
fetch::FetcherConfig load_fetcher_config(const std::filesystem::path& config_path);

} // namespace shardfetch::config
