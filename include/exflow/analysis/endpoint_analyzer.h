#pragma once

#include <exflow/analysis/models.h>
#include <exflow/analysis/source_index.h>
#include <exflow/analysis/transitive_analyzer.h>
#include <exflow/core/types.h>
#include <exflow/syntax/source_parser.h>

#include <filesystem>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace exflow::analysis {

struct AnalysisOptions {
    int maxDepth = DEFAULT_MAX_DEPTH;
    std::set<std::string> ignore;
};

/**
 * @brief Finds route handlers under a path and the exceptions that reach them
 *
 * One instance is one analysis run: it owns the source index and the traversal
 * cache. All discovered files are registered before any endpoint is analyzed, so
 * every endpoint resolves calls against the same symbol table.
 *
 * Files that cannot be read or parsed are skipped and reported in
 * AnalysisResult::errors; nothing here fails the run.
 */
class EndpointAnalyzer {
public:
    EndpointAnalyzer(std::shared_ptr<syntax::ISourceParser> parser, AnalysisOptions options = {});

    // traversal_ holds a reference to index_
    EndpointAnalyzer(const EndpointAnalyzer&) = delete;
    EndpointAnalyzer& operator=(const EndpointAnalyzer&) = delete;
    EndpointAnalyzer(EndpointAnalyzer&&) = delete;
    EndpointAnalyzer& operator=(EndpointAnalyzer&&) = delete;

    /**
     * @brief Analyze a single file or every source file below a directory
     */
    AnalysisResult analyzePath(const std::filesystem::path& path);

    /**
     * @brief Analyze an explicit list of files, in the given order
     */
    AnalysisResult analyzeFiles(const std::vector<std::filesystem::path>& files);

    const AnalysisOptions& options() const noexcept { return options_; }
    const TraversalStats& stats() const noexcept { return traversal_.stats(); }
    SourceIndex& index() noexcept { return index_; }

private:
    void analyzeFile(const std::filesystem::path& file, AnalysisResult& result);

    AnalysisOptions options_;
    SourceIndex index_;
    TransitiveAnalyzer traversal_;
};

/**
 * @brief Run a fresh analysis over a path
 */
AnalysisResult analyze(const std::filesystem::path& path,
                       std::shared_ptr<syntax::ISourceParser> parser,
                       AnalysisOptions options = {});

/**
 * @brief "Syntax error in <file>: <detail>" and friends
 */
std::string describeFileError(const std::filesystem::path& file, const Error& error);

} // namespace exflow::analysis
