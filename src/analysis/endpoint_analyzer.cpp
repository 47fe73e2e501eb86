#include <exflow/analysis/declaration_extractor.h>
#include <exflow/analysis/endpoint_analyzer.h>
#include <exflow/analysis/source_discovery.h>

#include <algorithm>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace exflow::analysis {

std::string describeFileError(const std::filesystem::path& file, const Error& error) {
    const char* kind = "Read error";
    switch (error.code) {
        case ErrorCode::ParseError:
            kind = "Syntax error";
            break;
        case ErrorCode::EncodingError:
            kind = "Encoding error";
            break;
        default:
            break;
    }
    return fmt::format("{} in {}: {}", kind, file.string(), error.message);
}

EndpointAnalyzer::EndpointAnalyzer(std::shared_ptr<syntax::ISourceParser> parser,
                                   AnalysisOptions options)
    : options_(std::move(options)), index_(std::move(parser)),
      traversal_(index_, options_.maxDepth) {}

AnalysisResult EndpointAnalyzer::analyzePath(const std::filesystem::path& path) {
    return analyzeFiles(discoverSourceFiles(path));
}

AnalysisResult EndpointAnalyzer::analyzeFiles(const std::vector<std::filesystem::path>& files) {
    AnalysisResult result;

    for (const auto& file : files) {
        index_.registerFile(file);
    }
    spdlog::debug("[Analyzer] {} function(s) indexed from {} file(s)", index_.functionCount(),
                  files.size());

    for (const auto& file : files) {
        analyzeFile(file, result);
    }

    const auto& st = traversal_.stats();
    spdlog::debug("[Analyzer] {} endpoint(s); traversal: {} analyzed, {} cache hit(s), {} "
                  "miss(es), {} unresolved",
                  result.endpoints.size(), st.functionsAnalyzed, st.cacheHits, st.cacheMisses,
                  st.unresolvedCalls);
    return result;
}

void EndpointAnalyzer::analyzeFile(const std::filesystem::path& file, AnalysisResult& result) {
    auto module = index_.load(file);
    if (!module) {
        auto message = describeFileError(file, module.error());
        spdlog::warn("{}", message);
        result.errors.push_back(std::move(message));
        return;
    }

    for (const auto& function : module.value()->functions) {
        auto endpoint = extractEndpoint(function, file);
        if (!endpoint)
            continue;

        auto found = traversal_.analyzeEndpoint(file, function);
        found.erase(std::remove_if(found.begin(), found.end(),
                                   [this](const ExceptionOccurrence& occ) {
                                       return options_.ignore.count(occ.exceptionClass) > 0;
                                   }),
                    found.end());
        endpoint->detectedExceptions = std::move(found);
        result.endpoints.push_back(std::move(*endpoint));
    }
}

AnalysisResult analyze(const std::filesystem::path& path,
                       std::shared_ptr<syntax::ISourceParser> parser, AnalysisOptions options) {
    EndpointAnalyzer analyzer(std::move(parser), std::move(options));
    return analyzer.analyzePath(path);
}

} // namespace exflow::analysis
