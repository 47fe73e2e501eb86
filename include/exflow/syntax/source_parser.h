#pragma once

#include <exflow/core/types.h>
#include <exflow/syntax/python_syntax.h>

#include <filesystem>
#include <string_view>

namespace exflow::syntax {

/**
 * @brief Front end that lowers source text into the analysis syntax model
 *
 * Implementations report malformed input as ErrorCode::ParseError. The source
 * handed to parse() is already known to be valid UTF-8.
 */
class ISourceParser {
public:
    virtual ~ISourceParser() = default;

    /**
     * @brief Parse one file's contents
     * @param source Full file contents
     * @param file Path used for the model and for diagnostics
     */
    virtual Result<ModuleSyntax> parse(std::string_view source,
                                       const std::filesystem::path& file) = 0;

    /**
     * @brief Language handled by this front end (e.g. "python")
     */
    virtual std::string_view language() const = 0;
};

} // namespace exflow::syntax
