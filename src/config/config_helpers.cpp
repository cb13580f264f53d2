#include <fstream>
#include <hastat/config/config_helpers.h>

namespace hastat::config {

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }

    if (const char* explicitPath = std::getenv("HASTAT_CONFIG"); explicitPath && *explicitPath) {
        return expand_tilde(explicitPath);
    }

    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    const char* homeEnv = std::getenv("HOME");

    std::filesystem::path configHome;
    if (xdgConfigHome && *xdgConfigHome) {
        configHome = std::filesystem::path(xdgConfigHome);
    } else if (homeEnv) {
        configHome = std::filesystem::path(homeEnv) / ".config";
    } else {
        return std::filesystem::path("config.toml");
    }

    return configHome / "hastat" / "config.toml";
}

std::map<std::string, std::string> parse_simple_toml(const std::filesystem::path& path) {
    std::map<std::string, std::string> config;
    std::ifstream file(path);
    if (!file) {
        return config;
    }

    std::string line;
    std::string currentSection;

    while (std::getline(file, line)) {
        trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#')
            continue;

        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end != std::string::npos) {
                currentSection = line.substr(1, end - 1);
                trim(currentSection);
                if (!currentSection.empty()) {
                    currentSection += ".";
                }
            }
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos)
            continue;

        std::string key = line.substr(0, eq);
        std::string value = line.substr(eq + 1);
        trim(key);
        trim(value);

        // Remove inline comments outside of quotes
        if (!value.empty() && (value.front() == '"' || value.front() == '\'')) {
            size_t close = value.find(value.front(), 1);
            if (close != std::string::npos) {
                value = value.substr(0, close + 1);
            }
        } else if (size_t comment = value.find('#'); comment != std::string::npos) {
            value = value.substr(0, comment);
        }

        config[currentSection + key] = unquote(value);
    }

    return config;
}

std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key) {
    auto values = parse_simple_toml(config_path);
    auto it = values.find(section.empty() ? key : section + "." + key);
    return it != values.end() ? it->second : std::string{};
}

} // namespace hastat::config
