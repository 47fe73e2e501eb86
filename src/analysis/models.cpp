#include <exflow/analysis/models.h>

#include <algorithm>

namespace exflow::analysis {

std::vector<ExceptionOccurrence> EndpointRecord::undeclared() const {
    std::vector<ExceptionOccurrence> out;
    for (const auto& occ : detectedExceptions) {
        if (std::find(declaredExceptions.begin(), declaredExceptions.end(),
                      occ.exceptionClass) == declaredExceptions.end()) {
            out.push_back(occ);
        }
    }
    return out;
}

std::vector<std::string> EndpointRecord::unused() const {
    std::vector<std::string> out;
    for (const auto& declared : declaredExceptions) {
        bool seen = std::any_of(detectedExceptions.begin(), detectedExceptions.end(),
                                [&](const auto& occ) { return occ.exceptionClass == declared; });
        if (!seen)
            out.push_back(declared);
    }
    return out;
}

bool EndpointRecord::hasIssues() const {
    return !undeclared().empty();
}

bool AnalysisResult::hasIssues() const {
    return std::any_of(endpoints.begin(), endpoints.end(),
                       [](const auto& ep) { return ep.hasIssues(); });
}

size_t AnalysisResult::totalUndeclared() const {
    size_t total = 0;
    for (const auto& ep : endpoints) {
        total += ep.undeclared().size();
    }
    return total;
}

std::vector<const EndpointRecord*> AnalysisResult::endpointsWithIssues() const {
    std::vector<const EndpointRecord*> out;
    for (const auto& ep : endpoints) {
        if (ep.hasIssues())
            out.push_back(&ep);
    }
    return out;
}

} // namespace exflow::analysis
