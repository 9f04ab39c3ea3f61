#include <fstream>
#include <streamcache/config/config_helpers.h>

namespace streamcache::config {

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

        // Section headers [section]
        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end != std::string::npos) {
                currentSection = line.substr(1, end - 1);
                trim(currentSection);
                in_target_section = (section.empty() || currentSection == section);
            }
            continue;
        }

        if (!in_target_section)
            continue;

        size_t eq = line.find('=');
        if (eq == std::string::npos)
            continue;

        std::string k = line.substr(0, eq);
        std::string v = line.substr(eq + 1);
        trim(k);
        trim(v);

        // Inline comments, unless inside a quoted value
        if (!v.empty() && v.front() != '"' && v.front() != '\'') {
            size_t comment = v.find('#');
            if (comment != std::string::npos) {
                v = v.substr(0, comment);
                trim(v);
            }
        } else if (v.size() >= 2) {
            size_t close = v.find(v.front(), 1);
            if (close != std::string::npos)
                v = v.substr(0, close + 1);
        }

        // Both "[cache] key" and dotted "cache.key" spellings
        if (k == key || (!section.empty() && k == section + "." + key)) {
            return unquote(v);
        }
    }

    return "";
}

std::filesystem::path get_config_dir() {
    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    const char* homeEnv = std::getenv("HOME");

    if (xdgConfigHome && *xdgConfigHome) {
        return std::filesystem::path(xdgConfigHome) / "streamcache";
    }
    if (homeEnv && *homeEnv) {
        return std::filesystem::path(homeEnv) / ".config" / "streamcache";
    }
    return std::filesystem::path("~/.config") / "streamcache";
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }
    return get_config_dir() / "config.toml";
}

std::filesystem::path resolve_config_path(const std::string& override_path) {
    // 1) --config
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }
    // 2) STREAMCACHE_CONFIG env
    if (const char* env = std::getenv("STREAMCACHE_CONFIG"); env && *env) {
        return expand_tilde(env);
    }
    // 3) XDG/HOME default
    return get_config_path();
}

} // namespace streamcache::config
