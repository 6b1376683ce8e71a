#pragma once

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <string_view>

namespace ragcore::config {

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
            if (path.size() == 1) {
                return std::filesystem::path(home);
            }
            return std::filesystem::path(home) / path.substr(2);
        }
    }
    return path;
}

/**
 * Read one value from a TOML-style file ([section] headers, key = value lines,
 * '#' comments). An empty section matches keys in any section. Returns "" when
 * the file or key is absent.
 */
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

/// Config file path: override, then $RAGCORE_CONFIG, then <config dir>/config.toml
std::filesystem::path get_config_path(const std::string& override_path = "");

/// $XDG_CONFIG_HOME/ragcore or ~/.config/ragcore
std::filesystem::path get_config_dir();

/// $XDG_DATA_HOME/ragcore or ~/.local/share/ragcore
std::filesystem::path get_data_dir();

} // namespace ragcore::config
