#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>

namespace hastat::config {

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

inline std::string trimmed(std::string_view s) {
    std::string out(s);
    trim(out);
    return out;
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

/**
 * @brief Resolve the config file location
 *
 * Order: explicit override, $HASTAT_CONFIG, $XDG_CONFIG_HOME/hastat/config.toml,
 * ~/.config/hastat/config.toml.
 */
std::filesystem::path get_config_path(const std::string& override_path = "");

/**
 * @brief Parse a flat "[section] key = value" file into "section.key" -> value
 *
 * Comments (#), quotes and surrounding whitespace are stripped. A missing file yields an
 * empty map.
 */
std::map<std::string, std::string> parse_simple_toml(const std::filesystem::path& path);

// Parse a value from TOML config file
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

} // namespace hastat::config
