#pragma once

#include <exflow/analysis/endpoint_analyzer.h>
#include <exflow/config/analyzer_config.h>
#include <exflow/core/types.h>

#include <string>
#include <vector>

namespace exflow::cli {

/**
 * Merge config.toml values with command-line overrides
 *
 * A non-empty depthFlag replaces the configured depth; extraIgnore is added to
 * the configured ignore list.
 */
inline Result<analysis::AnalysisOptions>
mergeAnalysisOptions(const config::AnalyzerConfig& cfg, const std::string& depthFlag,
                     const std::vector<std::string>& extraIgnore = {}) {
    analysis::AnalysisOptions options;
    options.maxDepth = cfg.maxDepth;
    if (!depthFlag.empty()) {
        auto depth = config::parseDepth(depthFlag);
        if (!depth) {
            return Error{depth.error().code, "--depth: " + depth.error().message};
        }
        options.maxDepth = depth.value();
    }
    options.ignore.insert(cfg.ignore.begin(), cfg.ignore.end());
    options.ignore.insert(extraIgnore.begin(), extraIgnore.end());
    return options;
}

} // namespace exflow::cli
