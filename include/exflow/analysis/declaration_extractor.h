#pragma once

#include <exflow/analysis/models.h>
#include <exflow/syntax/python_syntax.h>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace exflow::analysis {

/// Decorator attribute names that mark a route handler.
inline constexpr std::string_view kHttpMethods[] = {"get",   "post", "put",     "delete",
                                                    "patch", "head", "options", "trace"};

bool isHttpMethod(std::string_view token);

/**
 * @brief Endpoint record for a function carrying a route decorator
 *
 * Looks for the first decorator of the form `x.get(...)` or `get(...)` (any HTTP
 * method token). Its first positional literal becomes the path, and an
 * `exceptions=[...]` list literal becomes the declared exceptions. Detected
 * exceptions are left empty.
 *
 * @return nullopt when no decorator matches
 */
std::optional<EndpointRecord> extractEndpoint(const syntax::FunctionDef& function,
                                              const std::filesystem::path& file);

/**
 * @brief Class names listed in an `exceptions=` value
 *
 * Only list literals declare anything; elements that are not names or dotted
 * attribute chains are skipped.
 */
std::vector<std::string> parseExceptionList(const syntax::Expr& value);

} // namespace exflow::analysis
