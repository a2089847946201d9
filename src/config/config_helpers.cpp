#include <rangedb/config/config_helpers.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <fstream>

namespace rangedb::config {

std::optional<long long> parse_integer(std::string_view s) {
    std::string v(s);
    trim(v);
    if (v.empty())
        return std::nullopt;
    // TOML allows 1_000_000
    v.erase(std::remove(v.begin(), v.end(), '_'), v.end());
    long long out = 0;
    auto [end, ec] = std::from_chars(v.data(), v.data() + v.size(), out);
    if (ec != std::errc{} || end != v.data() + v.size())
        return std::nullopt;
    return out;
}

std::optional<bool> parse_bool(std::string_view s) {
    std::string v(s);
    trim(v);
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "true" || v == "yes" || v == "on" || v == "1")
        return true;
    if (v == "false" || v == "no" || v == "off" || v == "0")
        return false;
    return std::nullopt;
}

std::optional<std::chrono::milliseconds> parse_duration_ms(std::string_view s) {
    std::string v(s);
    trim(v);
    long long scale = 1;
    if (v.size() > 2 && v.compare(v.size() - 2, 2, "ms") == 0) {
        v.resize(v.size() - 2);
    } else if (v.size() > 1 && v.back() == 's') {
        v.pop_back();
        scale = 1000;
    }
    auto n = parse_integer(v);
    if (!n)
        return std::nullopt;
    return std::chrono::milliseconds(*n * scale);
}

std::map<std::string, std::string> parse_config_file(const std::filesystem::path& config_path) {
    std::map<std::string, std::string> out;
    std::ifstream file(config_path);
    if (!file) {
        return out;
    }

    std::string line;
    std::string currentSection;
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
            }
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
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
        } else if (!v.empty()) {
            const char quote = v.front();
            size_t close = v.find(quote, 1);
            if (close != std::string::npos) {
                v = v.substr(0, close + 1);
            }
        }

        out[currentSection.empty() ? k : currentSection + "." + k] = unquote(v);
    }
    return out;
}

std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key) {
    const auto values = parse_config_file(config_path);
    auto it = values.find(section.empty() ? key : section + "." + key);
    return it == values.end() ? "" : it->second;
}

std::filesystem::path get_config_dir() {
    if (const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME"); xdgConfigHome && *xdgConfigHome) {
        return std::filesystem::path(xdgConfigHome) / "rangedb";
    }
    if (const char* homeEnv = std::getenv("HOME"); homeEnv && *homeEnv) {
        return std::filesystem::path(homeEnv) / ".config" / "rangedb";
    }
    return std::filesystem::path("~/.config") / "rangedb";
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }
    if (const char* cfg_env = std::getenv("RANGEDB_CONFIG"); cfg_env && *cfg_env) {
        return expand_tilde(cfg_env);
    }
    return get_config_dir() / "config.toml";
}

} // namespace rangedb::config
