#pragma once

#include <algorithm>
#include <cctype>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace streamcache::config {

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

// Tilde expansion ("~" and "~/...")
inline std::filesystem::path expand_tilde(const std::string& path) {
    if (!path.empty() && path[0] == '~' && (path.size() == 1 || path[1] == '/')) {
        if (const char* home = std::getenv("HOME")) {
            return path.size() > 2 ? std::filesystem::path(home) / path.substr(2)
                                   : std::filesystem::path(home);
        }
    }
    return path;
}

// Unsigned integer; empty on anything but plain digits
inline std::optional<std::uint64_t> parse_u64(std::string_view s) {
    std::uint64_t v{0};
    auto res = std::from_chars(s.data(), s.data() + s.size(), v);
    if (s.empty() || res.ec != std::errc() || res.ptr != s.data() + s.size())
        return std::nullopt;
    return v;
}

// Time parsing (milliseconds)
inline std::optional<std::chrono::milliseconds> parse_ms(std::string_view s) {
    if (auto v = parse_u64(s))
        return std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(*v));
    return std::nullopt;
}

// true/false, yes/no, on/off, 1/0
inline std::optional<bool> parse_bool(std::string_view s) {
    std::string v(s);
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "true" || v == "yes" || v == "on" || v == "1")
        return true;
    if (v == "false" || v == "no" || v == "off" || v == "0")
        return false;
    return std::nullopt;
}

// Parse a value from TOML config file
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

/// Returns the user config directory: $XDG_CONFIG_HOME/streamcache or ~/.config/streamcache
std::filesystem::path get_config_dir();

// Get standard config path
std::filesystem::path get_config_path(const std::string& override_path = "");

/// Config file resolution: explicit override, then STREAMCACHE_CONFIG, then the standard path.
std::filesystem::path resolve_config_path(const std::string& override_path = "");

} // namespace streamcache::config
