#pragma once

#include <exflow/core/types.h>
#include <exflow/syntax/source_parser.h>

#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace exflow::analysis {

using ModulePtr = std::shared_ptr<const syntax::ModuleSyntax>;

/**
 * @brief A resolved function definition
 *
 * The pointer stays valid for the lifetime of the SourceIndex that returned it.
 */
struct FunctionRef {
    std::filesystem::path file;
    const syntax::FunctionDef* function = nullptr;
};

/**
 * @brief Parsed files and a bare-name symbol table for one analysis run
 *
 * Every function definition of a registered file (module level, methods, nested
 * functions) is resolvable by its bare name. When several definitions share a
 * name the one registered last wins; resolution never looks at modules, classes
 * or receivers.
 */
class SourceIndex {
public:
    explicit SourceIndex(std::shared_ptr<syntax::ISourceParser> parser);

    /**
     * @brief Parse a file on first use and return the cached model
     *
     * Failures are cached as well, so a broken file is read and parsed once.
     * @return ErrorCode::IOError, ErrorCode::EncodingError or ErrorCode::ParseError
     *         on failure
     */
    Result<ModulePtr> load(const std::filesystem::path& file);

    /**
     * @brief Make all functions of a file resolvable
     *
     * Idempotent per path. A file that fails to load is skipped silently; the
     * caller reports it when it loads the file for endpoint extraction.
     */
    void registerFile(const std::filesystem::path& file);

    /**
     * @brief Register an already lowered module (in-memory sources)
     *
     * Re-registering a path replaces the module; names it no longer defines stop
     * resolving, including ones it had shadowed in other files.
     */
    void registerModule(ModulePtr module);

    /**
     * @brief Most recently registered definition with this bare name
     */
    std::optional<FunctionRef> lookup(std::string_view name) const;

    bool isRegistered(const std::filesystem::path& file) const;

    size_t functionCount() const { return functions_.size(); }

private:
    void addFunctions(const ModulePtr& module);
    void dropFunctions(const std::filesystem::path& file);

    std::shared_ptr<syntax::ISourceParser> parser_;
    std::map<std::filesystem::path, Result<ModulePtr>> modules_;
    std::map<std::filesystem::path, ModulePtr> registered_;
    std::unordered_map<std::string, FunctionRef> functions_;
};

} // namespace exflow::analysis
