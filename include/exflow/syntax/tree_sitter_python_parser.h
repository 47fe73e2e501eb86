#pragma once

#include <exflow/syntax/grammar_loader.h>
#include <exflow/syntax/source_parser.h>

#include <memory>

extern "C" {
#include <tree_sitter/api.h>
}

namespace exflow::syntax {

/**
 * @brief Python front end backed by tree-sitter-python
 *
 * Parses a file into a concrete syntax tree and lowers every function
 * definition into the analysis model. Trees containing ERROR or MISSING nodes
 * are rejected with ErrorCode::ParseError.
 */
class TreeSitterPythonParser final : public ISourceParser {
public:
    explicit TreeSitterPythonParser(LoadedGrammar grammar);
    ~TreeSitterPythonParser() override = default;

    TreeSitterPythonParser(const TreeSitterPythonParser&) = delete;
    TreeSitterPythonParser& operator=(const TreeSitterPythonParser&) = delete;

    /**
     * @brief Load the Python grammar and build a parser around it
     */
    static Result<std::shared_ptr<TreeSitterPythonParser>> create(const GrammarLoader& loader);

    Result<ModuleSyntax> parse(std::string_view source,
                               const std::filesystem::path& file) override;

    std::string_view language() const override { return "python"; }

private:
    LoadedGrammar grammar_;
    std::unique_ptr<TSParser, decltype(&ts_parser_delete)> parser_{nullptr, ts_parser_delete};
};

} // namespace exflow::syntax
