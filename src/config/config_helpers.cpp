#include <exflow/config/config_helpers.h>

#include <fstream>

namespace exflow::config {

std::string strip_inline_comment(const std::string& value) {
    char quote = 0;
    for (size_t i = 0; i < value.size(); ++i) {
        char c = value[i];
        if (quote) {
            if (c == '\\' && quote == '"' && i + 1 < value.size()) {
                ++i;
            } else if (c == quote) {
                quote = 0;
            }
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '#') {
            std::string out = value.substr(0, i);
            trim(out);
            return out;
        }
    }
    return value;
}

std::map<std::string, std::string> parse_config_file(const std::filesystem::path& config_path) {
    std::map<std::string, std::string> values;
    std::ifstream file(config_path);
    if (!file) {
        return values;
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
        v = strip_inline_comment(v);

        values[currentSection.empty() ? k : currentSection + "." + k] = v;
    }

    return values;
}

std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key) {
    auto values = parse_config_file(config_path);
    auto it = values.find(section.empty() ? key : section + "." + key);
    if (it == values.end()) {
        return "";
    }
    return unquote(it->second);
}

std::vector<std::string> parse_string_list(const std::string& raw) {
    std::string s = raw;
    trim(s);
    if (s.size() >= 2 && s.front() == '[' && s.back() == ']') {
        s = s.substr(1, s.size() - 2);
    }

    std::vector<std::string> items;
    std::string current;
    char quote = 0;
    auto flush = [&]() {
        std::string item = unquote(current);
        if (!item.empty()) {
            items.push_back(std::move(item));
        }
        current.clear();
    };

    for (char c : s) {
        if (quote) {
            current.push_back(c);
            if (c == quote)
                quote = 0;
        } else if (c == '"' || c == '\'') {
            quote = c;
            current.push_back(c);
        } else if (c == ',') {
            flush();
        } else {
            current.push_back(c);
        }
    }
    flush();
    return items;
}

std::filesystem::path get_config_dir() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return std::filesystem::path(xdg) / "exflow";
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::filesystem::path(home) / ".config" / "exflow";
    }
    return std::filesystem::path("~/.config") / "exflow";
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }
    return get_config_dir() / "config.toml";
}

} // namespace exflow::config
