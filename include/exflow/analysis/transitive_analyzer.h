#pragma once

#include <exflow/analysis/models.h>
#include <exflow/analysis/source_index.h>
#include <exflow/core/types.h>

#include <cstddef>
#include <filesystem>
#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace exflow::analysis {

/**
 * @brief Counters collected while walking call graphs
 */
struct TraversalStats {
    size_t functionsAnalyzed = 0;
    size_t cacheHits = 0;
    size_t cacheMisses = 0;
    size_t unresolvedCalls = 0;
};

/**
 * @brief Depth-bounded, memoized walk over the bare-name call graph
 *
 * Starting from an endpoint body, collects its direct raises and, while the
 * depth is below the limit, the raises of every callee the SourceIndex can
 * resolve. Cycles are cut with a visited set that is copied into each recursive
 * call, so only ancestors on the current path block a revisit.
 *
 * Callee results are cached by (name, depth) for the lifetime of the analyzer.
 * A cached entry is reused for any call path reaching that name at that depth,
 * even one with a different set of ancestors.
 */
class TransitiveAnalyzer {
public:
    using VisitedSet = std::set<std::string>;

    TransitiveAnalyzer(const SourceIndex& index, int maxDepth = DEFAULT_MAX_DEPTH);

    /**
     * @brief Every occurrence reachable from an endpoint, in discovery order
     */
    std::vector<ExceptionOccurrence> analyzeEndpoint(const std::filesystem::path& file,
                                                     const syntax::FunctionDef& endpoint);

    /**
     * @brief One step of the walk
     * @param visited Names on the current path; taken by value on purpose
     */
    std::vector<ExceptionOccurrence> analyze(const std::filesystem::path& file,
                                             const syntax::FunctionDef& function, int depth,
                                             VisitedSet visited);

    int maxDepth() const noexcept { return maxDepth_; }
    const TraversalStats& stats() const noexcept { return stats_; }
    size_t cacheSize() const noexcept { return cache_.size(); }

private:
    std::vector<ExceptionOccurrence> analyzeCallee(const std::string& name, int depth,
                                                   const VisitedSet& visited);

    const SourceIndex& index_;
    int maxDepth_;
    std::map<std::pair<std::string, int>, std::vector<ExceptionOccurrence>> cache_;
    TraversalStats stats_;
};

} // namespace exflow::analysis
