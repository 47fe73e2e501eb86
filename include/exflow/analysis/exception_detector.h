#pragma once

#include <exflow/analysis/models.h>
#include <exflow/syntax/python_syntax.h>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace exflow::analysis {

/**
 * @brief Class name of a raise operand
 *
 * `Cls(...)` renders its callee, `Cls` and `pkg.Cls` render themselves. Anything
 * else has no class name.
 */
std::optional<std::string> raisedClassName(const syntax::Expr& exc);

/**
 * @brief Raise statements written directly in a function's body
 *
 * Bare re-raises and operands without a class name are skipped. The returned
 * occurrences have no enclosing function; the caller attributes them.
 */
std::vector<ExceptionOccurrence> detectDirectRaises(const syntax::FunctionDef& function,
                                                    const std::filesystem::path& file);

} // namespace exflow::analysis
