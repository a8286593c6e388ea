#include <charconv>
#include <fstream>
#include <utility>
#include <sluice/config/config_helpers.h>

namespace sluice::config {

Result<ConfigTable> parse_config_file(const std::filesystem::path& config_path) {
    std::ifstream file(config_path);
    if (!file) {
        return Error{ErrorCode::InvalidConfig, "Cannot read config file " + config_path.string()};
    }

    ConfigTable table;
    std::string line;
    std::string currentSection;
    int lineNo = 0;

    while (std::getline(file, line)) {
        ++lineNo;
        trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        // Check for section headers [section]
        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end == std::string::npos) {
                return Error{ErrorCode::InvalidConfig, config_path.string() + ":" +
                                                           std::to_string(lineNo) +
                                                           ": unterminated section header"};
            }
            currentSection = line.substr(1, end - 1);
            trim(currentSection);
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            return Error{ErrorCode::InvalidConfig, config_path.string() + ":" +
                                                       std::to_string(lineNo) +
                                                       ": expected key = value"};
        }
        std::string k = line.substr(0, eq);
        std::string v = line.substr(eq + 1);
        trim(k);
        trim(v);

        // Remove inline comments outside quotes
        if (!v.empty() && v.front() != '"' && v.front() != '\'') {
            size_t comment = v.find('#');
            if (comment != std::string::npos) {
                v = v.substr(0, comment);
                trim(v);
            }
        } else if (v.size() >= 2) {
            auto close = v.find(v.front(), 1);
            if (close != std::string::npos) {
                v = v.substr(0, close + 1);
            }
        }

        // Support both "transfer.chunk_size" and "[transfer] chunk_size"
        std::string section = currentSection;
        if (auto dot = k.find('.'); dot != std::string::npos && section.empty()) {
            section = k.substr(0, dot);
            k = k.substr(dot + 1);
        }
        table[section][k] = unquote(v);
    }

    return table;
}

std::optional<std::uint64_t> parse_size(std::string_view text) {
    std::string s(text);
    trim(s);
    if (s.empty()) {
        return std::nullopt;
    }
    std::uint64_t value = 0;
    auto res = std::from_chars(s.data(), s.data() + s.size(), value);
    if (res.ec != std::errc()) {
        return std::nullopt;
    }
    std::string unit(res.ptr, std::as_const(s).data() + s.size());
    trim(unit);
    std::transform(unit.begin(), unit.end(), unit.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    std::uint64_t multiplier = 1;
    if (unit.empty() || unit == "b") {
        multiplier = 1;
    } else if (unit == "k" || unit == "kb" || unit == "kib") {
        multiplier = 1024ull;
    } else if (unit == "m" || unit == "mb" || unit == "mib") {
        multiplier = 1024ull * 1024ull;
    } else if (unit == "g" || unit == "gb" || unit == "gib") {
        multiplier = 1024ull * 1024ull * 1024ull;
    } else {
        return std::nullopt;
    }
    return value * multiplier;
}

std::optional<bool> parse_bool(std::string_view text) {
    std::string s(text);
    trim(s);
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (s == "true" || s == "yes" || s == "on" || s == "1") {
        return true;
    }
    if (s == "false" || s == "no" || s == "off" || s == "0") {
        return false;
    }
    return std::nullopt;
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return std::filesystem::path(override_path);
    }

    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    const char* homeEnv = std::getenv("HOME");

    std::filesystem::path configHome;
    if (xdgConfigHome && *xdgConfigHome) {
        configHome = std::filesystem::path(xdgConfigHome);
    } else if (homeEnv) {
        configHome = std::filesystem::path(homeEnv) / ".config";
    } else {
        return std::filesystem::path("~/.config") / "sluice" / "config.toml";
    }

    return configHome / "sluice" / "config.toml";
}

std::filesystem::path get_data_dir() {
    if (const char* xdg_data = std::getenv("XDG_DATA_HOME"); xdg_data && *xdg_data) {
        return std::filesystem::path(xdg_data) / "sluice";
    }
    if (const char* home = std::getenv("HOME")) {
        return std::filesystem::path(home) / ".local" / "share" / "sluice";
    }
    return std::filesystem::current_path() / "sluice_data";
}

} // namespace sluice::config
