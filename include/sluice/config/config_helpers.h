#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <sluice/core/types.h>

namespace sluice::config {

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
            return path.size() > 1 ? std::filesystem::path(home) / path.substr(2)
                                   : std::filesystem::path(home);
        }
    }
    return path;
}

// section -> key -> raw (unquoted) value
using ConfigTable = std::map<std::string, std::map<std::string, std::string>>;

// Parse a TOML-style file ([section], key = value, # comments, quoted strings)
Result<ConfigTable> parse_config_file(const std::filesystem::path& config_path);

// Parse "8388608", "8MiB", "8M", "512KiB", "1GiB" into bytes
std::optional<std::uint64_t> parse_size(std::string_view text);

// Parse true/false/yes/no/on/off/1/0
std::optional<bool> parse_bool(std::string_view text);

// Get standard config path ($XDG_CONFIG_HOME/sluice/config.toml or ~/.config/sluice/...)
std::filesystem::path get_config_path(const std::string& override_path = "");

/// Returns the user data directory
/// $XDG_DATA_HOME/sluice or ~/.local/share/sluice
std::filesystem::path get_data_dir();

} // namespace sluice::config
