#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace courier::config {

// Strip ASCII whitespace from both ends, in place
inline void trim(std::string& s) {
    auto notSpace = [](unsigned char ch) { return !std::isspace(ch); };
    auto last = std::find_if(s.rbegin(), s.rend(), notSpace).base();
    auto first = std::find_if(s.begin(), last, notSpace);
    s.assign(first, last);
}

// 'value' or "value" -> value; TOML escapes are not interpreted
inline std::string unquote(std::string val) {
    trim(val);
    if (val.size() < 2)
        return val;
    const char q = val.front();
    if ((q == '"' || q == '\'') && val.back() == q)
        return val.substr(1, val.size() - 2);
    return val;
}

// "~" and "~/rest" against $HOME; "~user" forms are returned unchanged
inline std::filesystem::path expand_tilde(const std::string& path) {
    const char* home = std::getenv("HOME");
    if (!home || !*home)
        return path;
    if (path == "~")
        return std::filesystem::path(home);
    if (path.rfind("~/", 0) == 0)
        return std::filesystem::path(home) / path.substr(2);
    return path;
}

// Numeric and boolean parsing for config values; nullopt when the value is malformed
std::optional<std::uint64_t> parse_u64(std::string_view s);
std::optional<bool> parse_bool(std::string_view s);

// Parse a value from TOML config file ("" when the file, section or key is missing)
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

// Get standard config path: override, then $COURIER_CONFIG, then XDG
std::filesystem::path get_config_path(const std::string& override_path = "");

/// Returns the user config directory
/// Unix: $XDG_CONFIG_HOME/courier or ~/.config/courier
std::filesystem::path get_config_dir();

/// Returns the user data directory (downloads, split parts)
/// Unix: $XDG_DATA_HOME/courier or ~/.local/share/courier
std::filesystem::path get_data_dir();

// Data directory resolution (env → config → defaults)
std::filesystem::path resolve_data_dir_from_config(const std::filesystem::path& config_path);

} // namespace courier::config
