#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace exflow::analysis {

/**
 * @brief One raise site that can be reached from an endpoint
 *
 * enclosingFunction is empty for raises in the endpoint's own body and names the
 * called function for raises found transitively.
 */
struct ExceptionOccurrence {
    std::filesystem::path file;
    uint32_t line = 0;
    uint32_t column = 0;
    std::string exceptionClass;
    std::optional<std::string> enclosingFunction;
};

/**
 * @brief A route handler with its declared and detected exceptions
 */
struct EndpointRecord {
    std::filesystem::path file;
    uint32_t line = 0;
    std::string functionName;
    std::string method; ///< upper case, e.g. "GET"
    std::optional<std::string> path;
    std::vector<std::string> declaredExceptions;
    std::vector<ExceptionOccurrence> detectedExceptions;

    /// Detected occurrences whose class is not declared, in detection order.
    std::vector<ExceptionOccurrence> undeclared() const;

    /// Declared classes never detected, in declaration order.
    std::vector<std::string> unused() const;

    bool hasIssues() const;
};

/**
 * @brief Everything found under one input path
 */
struct AnalysisResult {
    std::vector<EndpointRecord> endpoints;
    std::vector<std::string> errors;

    bool hasIssues() const;
    size_t totalUndeclared() const;
    std::vector<const EndpointRecord*> endpointsWithIssues() const;
};

} // namespace exflow::analysis
