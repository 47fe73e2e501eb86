#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

// Minimal TOML reading for exflow.toml: flat `key = value` pairs grouped by [section].
namespace exflow::config {

inline void trim(std::string& s) {
    auto notSpace = [](unsigned char ch) { return !std::isspace(ch); };
    s.erase(std::find_if(s.rbegin(), s.rend(), notSpace).base(), s.end());
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), notSpace));
}

// "value" or 'value' -> value; anything else is returned trimmed.
inline std::string unquote(std::string val) {
    trim(val);
    bool quoted = val.size() >= 2 && (val.front() == '"' || val.front() == '\'') &&
                  val.back() == val.front();
    return quoted ? val.substr(1, val.size() - 2) : val;
}

inline std::filesystem::path expand_tilde(const std::string& path) {
    const char* home = std::getenv("HOME");
    if (path.empty() || path[0] != '~' || home == nullptr)
        return path;
    if (path.size() <= 2)
        return std::filesystem::path(home);
    return std::filesystem::path(home) / path.substr(2);
}

std::string strip_inline_comment(const std::string& value);

// All assignments in the file keyed "section.key" (bare "key" before the first
// section header). Values are raw, quotes included. A missing file yields an empty map.
std::map<std::string, std::string> parse_config_file(const std::filesystem::path& config_path);

// Unquoted value of section.key, empty when absent.
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

// ["a", "b"] or a, b -> {a, b}; empty items are dropped.
std::vector<std::string> parse_string_list(const std::string& raw);

/// $XDG_CONFIG_HOME/exflow, falling back to ~/.config/exflow
std::filesystem::path get_config_dir();

std::filesystem::path get_config_path(const std::string& override_path = "");

} // namespace exflow::config
