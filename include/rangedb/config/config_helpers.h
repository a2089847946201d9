#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace rangedb::config {

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
            return std::filesystem::path(home) / path.substr(path.size() > 1 ? 2 : 1);
        }
    }
    return path;
}

// Integer parsing; nullopt on anything that is not a whole number
std::optional<long long> parse_integer(std::string_view s);

// Boolean parsing: true/false, yes/no, on/off, 1/0
std::optional<bool> parse_bool(std::string_view s);

// Durations are written in milliseconds; an "s" suffix selects seconds
std::optional<std::chrono::milliseconds> parse_duration_ms(std::string_view s);

/**
 * Parse a TOML-style file into "section.key" -> value. Comments (#), blank lines and quotes are
 * handled; keys before the first section header are stored without a prefix.
 */
std::map<std::string, std::string> parse_config_file(const std::filesystem::path& config_path);

// Parse a single value from a TOML-style config file ("" when absent)
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

/// Returns the user config directory: $XDG_CONFIG_HOME/rangedb or ~/.config/rangedb
std::filesystem::path get_config_dir();

// Get standard config path: override, else $RANGEDB_CONFIG, else <config dir>/config.toml
std::filesystem::path get_config_path(const std::string& override_path = "");

} // namespace rangedb::config
