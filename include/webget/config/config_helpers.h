#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace webget::config {

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

// Boolean values as written in config files: true/false, yes/no, on/off, 1/0
inline bool parse_bool(std::string_view s, bool fallback) {
    std::string v(s);
    trim(v);
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "true" || v == "yes" || v == "on" || v == "1")
        return true;
    if (v == "false" || v == "no" || v == "off" || v == "0")
        return false;
    return fallback;
}

// Parse a value from TOML config file. Returns an empty string when the key is absent.
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

// Parse a comma- or TOML-array-separated list of strings.
// Accepts forms like "a,b" or ["a", "b"]. Entries are unquoted; an entry written as ""
// is kept as an empty string.
std::vector<std::string> parse_string_list(const std::string& raw);

// Get standard config path
// Order: override, WEBGET_CONFIG, $XDG_CONFIG_HOME/webget/config.toml, ~/.config/webget/config.toml
std::filesystem::path get_config_path(const std::string& override_path = "");

} // namespace webget::config
