#pragma once

#include <exflow/analysis/models.h>

#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

namespace exflow::cli {

struct RenderOptions {
    bool verbose = false;
    bool color = false;
};

/**
 * @brief Human readable report of endpoints with undeclared exceptions
 */
std::string renderText(const analysis::AnalysisResult& result, const RenderOptions& opts = {});

/**
 * @brief Machine readable report; endpoints without issues only in verbose mode
 */
nlohmann::ordered_json toJson(const analysis::AnalysisResult& result, bool verbose = false);
std::string renderJson(const analysis::AnalysisResult& result, bool verbose = false);

/**
 * @brief One GitHub Actions `::error` workflow command per undeclared exception
 */
std::string renderGithub(const analysis::AnalysisResult& result);

/// Dispatch on "text", "json" or "github"; unknown names render as text.
std::string renderResult(const analysis::AnalysisResult& result, std::string_view format,
                         const RenderOptions& opts = {});

/**
 * @brief Every endpoint with its declared and detected exceptions
 */
std::string renderList(const analysis::AnalysisResult& result, const RenderOptions& opts = {});

/**
 * @brief Suggested `exceptions=[...]` for each endpoint with issues
 * @param diff Show a -/+ pair instead of the suggestion and the added classes
 */
std::string renderSuggestions(const analysis::AnalysisResult& result, bool diff,
                              const RenderOptions& opts = {});

} // namespace exflow::cli
