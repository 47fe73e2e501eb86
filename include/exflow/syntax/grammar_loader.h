#pragma once

#include <exflow/core/types.h>

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

// Forward declaration
struct TSLanguage;

namespace exflow::syntax {

/**
 * @brief A loaded tree-sitter grammar
 *
 * The shared library stays loaded for as long as any copy of the handle is alive,
 * so a parser holding one keeps its TSLanguage valid.
 */
struct LoadedGrammar {
    std::shared_ptr<void> library;
    const TSLanguage* language = nullptr;
    std::filesystem::path path;
};

/**
 * @brief Manages tree-sitter grammar discovery and loading
 *
 * Follows the XDG Base Directory Specification for grammar paths:
 * - explicit path overrides (config file, addGrammarPath)
 * - EXFLOW_TS_PYTHON_LIB environment variable
 * - XDG_DATA_HOME/exflow/grammars (primary)
 * - ~/.local/share/exflow/grammars (fallback)
 * - /usr/local/share/exflow/grammars, /usr/share/exflow/grammars
 * - /usr/local/lib, /usr/lib
 *
 * When none of those yield a loadable library the bare library name is handed to
 * the dynamic loader so LD_LIBRARY_PATH and the system cache are honoured.
 */
class GrammarLoader {
public:
    GrammarLoader() = default;

    /**
     * @brief Add custom grammar path override (file or directory)
     */
    void addGrammarPath(std::string_view language, const std::filesystem::path& path);

    /**
     * @brief Load grammar library for a language
     */
    Result<LoadedGrammar> loadGrammar(std::string_view language) const;

    /**
     * @brief Get all directories that will be searched, in order
     */
    std::vector<std::filesystem::path> getGrammarSearchPaths() const;

    /**
     * @brief Library file candidates for a language, in load order
     */
    std::vector<std::string> getLibraryCandidates(std::string_view language) const;

    /**
     * @brief Check if a grammar can be loaded (without keeping it loaded)
     */
    bool grammarExists(std::string_view language) const;

private:
    struct GrammarSpec {
        std::string_view key;
        std::string_view env_var;
        std::string_view symbol;
        std::string_view default_so;
    };

    static constexpr GrammarSpec kSpecs[] = {
        {"python", "EXFLOW_TS_PYTHON_LIB", "tree_sitter_python", "libtree-sitter-python.so"},
        {"py", "EXFLOW_TS_PYTHON_LIB", "tree_sitter_python", "libtree-sitter-python.so"},
    };

    const GrammarSpec* findSpec(std::string_view language) const;

    std::vector<std::pair<std::string, std::filesystem::path>> grammar_paths_;
};

} // namespace exflow::syntax
