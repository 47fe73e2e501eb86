#include <exflow/analysis/exception_detector.h>

namespace exflow::analysis {

using namespace exflow::syntax;

std::optional<std::string> raisedClassName(const Expr& exc) {
    if (const auto* call = std::get_if<CallExpr>(&exc.node)) {
        return call->func ? renderQualifiedName(*call->func) : std::nullopt;
    }
    return renderQualifiedName(exc);
}

std::vector<ExceptionOccurrence> detectDirectRaises(const FunctionDef& function,
                                                    const std::filesystem::path& file) {
    std::vector<ExceptionOccurrence> found;
    for (const auto& event : function.body) {
        const auto* raise = std::get_if<RaiseSite>(&event);
        if (!raise || !raise->exc)
            continue;

        auto name = raisedClassName(*raise->exc);
        if (!name)
            continue;

        found.push_back(ExceptionOccurrence{file, raise->loc.line, raise->loc.column,
                                            std::move(*name), std::nullopt});
    }
    return found;
}

} // namespace exflow::analysis
