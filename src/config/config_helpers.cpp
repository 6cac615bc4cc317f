#include <charconv>
#include <fstream>
#include <courier/config/config_helpers.h>

namespace courier::config {

std::optional<std::uint64_t> parse_u64(std::string_view s) {
    std::string v(s);
    trim(v);
    // TOML allows 1_000_000
    v.erase(std::remove(v.begin(), v.end(), '_'), v.end());
    if (v.empty())
        return std::nullopt;
    std::uint64_t out = 0;
    auto res = std::from_chars(v.data(), v.data() + v.size(), out);
    if (res.ec != std::errc() || res.ptr != v.data() + v.size())
        return std::nullopt;
    return out;
}

std::optional<bool> parse_bool(std::string_view s) {
    std::string v(s);
    trim(v);
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "true" || v == "1" || v == "yes" || v == "on")
        return true;
    if (v == "false" || v == "0" || v == "no" || v == "off")
        return false;
    return std::nullopt;
}

std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key) {
    std::ifstream file(config_path);
    if (!file) {
        return "";
    }

    std::string line;
    std::string currentSection;
    bool in_target_section = section.empty();

    while (std::getline(file, line)) {
        trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        // Check for section headers [section]
        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end != std::string::npos) {
                currentSection = line.substr(1, end - 1);
                trim(currentSection);
                in_target_section = (section.empty() || currentSection == section);
            }
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos)
            continue;

        std::string k = line.substr(0, eq);
        std::string v = line.substr(eq + 1);
        trim(k);
        trim(v);

        // Remove inline comments outside quotes
        bool quoted = false;
        for (size_t i = 0; i < v.size(); ++i) {
            if (v[i] == '"' || v[i] == '\'') {
                quoted = !quoted;
            } else if (v[i] == '#' && !quoted) {
                v = v.substr(0, i);
                trim(v);
                break;
            }
        }

        // Support both "transfer.part_size_bytes" and "[transfer] part_size_bytes"
        if ((in_target_section && k == key) || (!section.empty() && k == section + "." + key)) {
            return unquote(v);
        }
    }

    return "";
}

std::filesystem::path get_config_dir() {
    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    const char* homeEnv = std::getenv("HOME");

    if (xdgConfigHome && *xdgConfigHome) {
        return std::filesystem::path(xdgConfigHome) / "courier";
    }
    if (homeEnv && *homeEnv) {
        return std::filesystem::path(homeEnv) / ".config" / "courier";
    }
    return std::filesystem::path("~/.config") / "courier";
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }
    if (const char* cfg_env = std::getenv("COURIER_CONFIG"); cfg_env && *cfg_env) {
        return expand_tilde(cfg_env);
    }
    return get_config_dir() / "config.toml";
}

std::filesystem::path get_data_dir() {
    if (const char* xdg_data = std::getenv("XDG_DATA_HOME"); xdg_data && *xdg_data) {
        return std::filesystem::path(xdg_data) / "courier";
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::filesystem::path(home) / ".local" / "share" / "courier";
    }
    return std::filesystem::current_path() / "courier_data";
}

std::filesystem::path resolve_data_dir_from_config(const std::filesystem::path& config_path) {
    // 1) COURIER_DATA_DIR env
    if (const char* env = std::getenv("COURIER_DATA_DIR"); env && *env) {
        return expand_tilde(env);
    }

    // 2) config.toml core.data_dir
    if (!config_path.empty()) {
        if (auto value = parse_config_value(config_path, "core", "data_dir"); !value.empty()) {
            return expand_tilde(value);
        }
    }

    // 3) XDG/HOME defaults
    return get_data_dir();
}

} // namespace courier::config
