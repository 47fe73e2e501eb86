#include <exflow/analysis/exception_detector.h>
#include <exflow/analysis/transitive_analyzer.h>

#include <spdlog/spdlog.h>

namespace exflow::analysis {

TransitiveAnalyzer::TransitiveAnalyzer(const SourceIndex& index, int maxDepth)
    : index_(index), maxDepth_(maxDepth < 0 ? 0 : maxDepth) {}

std::vector<ExceptionOccurrence>
TransitiveAnalyzer::analyzeEndpoint(const std::filesystem::path& file,
                                    const syntax::FunctionDef& endpoint) {
    auto found = analyze(file, endpoint, 0, {});
    spdlog::debug("[Traversal] {} -> {} occurrence(s)", endpoint.name, found.size());
    return found;
}

std::vector<ExceptionOccurrence> TransitiveAnalyzer::analyze(const std::filesystem::path& file,
                                                             const syntax::FunctionDef& function,
                                                             int depth, VisitedSet visited) {
    if (visited.count(function.name) > 0)
        return {};
    visited.insert(function.name);
    ++stats_.functionsAnalyzed;

    auto results = detectDirectRaises(function, file);
    if (depth >= maxDepth_)
        return results;

    for (const auto& event : function.body) {
        const auto* site = std::get_if<syntax::CallSite>(&event);
        if (!site || !site->call)
            continue;
        const auto* call = std::get_if<syntax::CallExpr>(&site->call->node);
        if (!call)
            continue;

        auto name = syntax::calleeName(*call);
        if (!name || visited.count(*name) > 0)
            continue;

        auto sub = analyzeCallee(*name, depth + 1, visited);
        results.insert(results.end(), sub.begin(), sub.end());
    }
    return results;
}

std::vector<ExceptionOccurrence>
TransitiveAnalyzer::analyzeCallee(const std::string& name, int depth, const VisitedSet& visited) {
    auto key = std::make_pair(name, depth);
    if (auto it = cache_.find(key); it != cache_.end()) {
        ++stats_.cacheHits;
        spdlog::trace("[Traversal] cache hit {}@{}", name, depth);
        return it->second;
    }
    ++stats_.cacheMisses;

    auto target = index_.lookup(name);
    if (!target) {
        ++stats_.unresolvedCalls;
        spdlog::trace("[Traversal] unresolved call {}", name);
        return {};
    }

    auto sub = analyze(target->file, *target->function, depth, visited);
    for (auto& occ : sub) {
        if (!occ.enclosingFunction)
            occ.enclosingFunction = name;
    }
    cache_[key] = sub;
    return sub;
}

} // namespace exflow::analysis
