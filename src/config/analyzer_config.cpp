#include <exflow/config/analyzer_config.h>
#include <exflow/config/config_helpers.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace exflow::config {

bool isOutputFormat(std::string_view format) {
    return std::find(std::begin(kOutputFormats), std::end(kOutputFormats), format) !=
           std::end(kOutputFormats);
}

Result<int> parseDepth(std::string_view text) {
    std::string s(text);
    trim(s);
    int value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (s.empty() || ec != std::errc() || ptr != s.data() + s.size()) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("depth must be an integer, got '{}'", s)};
    }
    if (value < 0) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("depth must not be negative, got {}", value)};
    }
    return value;
}

Result<bool> parseBool(std::string_view text) {
    std::string s(text);
    trim(s);
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (s == "true" || s == "yes" || s == "on" || s == "1")
        return true;
    if (s == "false" || s == "no" || s == "off" || s == "0")
        return false;
    return Error{ErrorCode::InvalidArgument, fmt::format("expected a boolean, got '{}'", s)};
}

Result<AnalyzerConfig> loadAnalyzerConfig(const std::filesystem::path& file) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(file, ec)) {
        return Error{ErrorCode::FileNotFound,
                     fmt::format("config file not found: {}", file.string())};
    }

    AnalyzerConfig cfg;
    cfg.source = file;
    auto values = parse_config_file(file);

    if (auto it = values.find("analysis.depth"); it != values.end()) {
        auto depth = parseDepth(unquote(it->second));
        if (!depth) {
            return Error{ErrorCode::InvalidArgument,
                         fmt::format("{}: [analysis] {}", file.string(), depth.error().message)};
        }
        cfg.maxDepth = depth.value();
    }

    if (auto it = values.find("analysis.ignore"); it != values.end()) {
        cfg.ignore = parse_string_list(it->second);
    }

    if (auto it = values.find("output.format"); it != values.end()) {
        auto format = unquote(it->second);
        if (!isOutputFormat(format)) {
            return Error{ErrorCode::InvalidArgument,
                         fmt::format("{}: [output] unknown format '{}'", file.string(), format)};
        }
        cfg.format = format;
    }

    if (auto it = values.find("output.strict"); it != values.end()) {
        auto strict = parseBool(unquote(it->second));
        if (!strict) {
            return Error{ErrorCode::InvalidArgument,
                         fmt::format("{}: [output] strict: {}", file.string(),
                                     strict.error().message)};
        }
        cfg.strict = strict.value();
    }

    if (auto it = values.find("parser.grammar_path"); it != values.end()) {
        auto raw = unquote(it->second);
        if (!raw.empty())
            cfg.grammarPath = expand_tilde(raw);
    }

    spdlog::debug("[Config] loaded {} (depth={}, {} ignored, format={})", file.string(),
                  cfg.maxDepth, cfg.ignore.size(), cfg.format);
    return cfg;
}

std::filesystem::path resolveConfigPath(const std::string& overridePath) {
    if (!overridePath.empty()) {
        return expand_tilde(overridePath);
    }
    if (const char* env = std::getenv("EXFLOW_CONFIG"); env && *env) {
        return expand_tilde(env);
    }

    auto path = get_config_path();
    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        return path;
    }
    return {};
}

Result<AnalyzerConfig> resolveAnalyzerConfig(const std::string& overridePath) {
    auto path = resolveConfigPath(overridePath);
    if (path.empty()) {
        spdlog::debug("[Config] no config file, using defaults");
        return AnalyzerConfig{};
    }
    return loadAnalyzerConfig(path);
}

} // namespace exflow::config
