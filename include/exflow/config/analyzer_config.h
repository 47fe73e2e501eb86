#pragma once

#include <exflow/core/types.h>

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace exflow::config {

/**
 * @brief Settings read from config.toml
 *
 * [analysis] depth, ignore; [output] format, strict; [parser] grammar_path.
 */
struct AnalyzerConfig {
    int maxDepth = DEFAULT_MAX_DEPTH;
    std::vector<std::string> ignore;
    std::string format = "text";
    bool strict = false;
    std::filesystem::path grammarPath;
    std::filesystem::path source; ///< file the values came from, empty for defaults
};

inline constexpr std::string_view kOutputFormats[] = {"text", "json", "github"};

bool isOutputFormat(std::string_view format);

/// Non-negative integer depth; InvalidArgument otherwise.
Result<int> parseDepth(std::string_view text);

/// true/false (also yes/no, on/off, 1/0); InvalidArgument otherwise.
Result<bool> parseBool(std::string_view text);

/**
 * @brief Read a config file
 * @return ErrorCode::FileNotFound when it does not exist, ErrorCode::InvalidArgument
 *         for values that do not validate
 */
Result<AnalyzerConfig> loadAnalyzerConfig(const std::filesystem::path& file);

/**
 * @brief Config file to use: the override, then EXFLOW_CONFIG, then the XDG default
 *
 * The XDG default is only returned when it exists; an empty path means defaults.
 */
std::filesystem::path resolveConfigPath(const std::string& overridePath = "");

/**
 * @brief Resolve and load, falling back to defaults when no file applies
 */
Result<AnalyzerConfig> resolveAnalyzerConfig(const std::string& overridePath = "");

} // namespace exflow::config
