#include <exflow/cli/result_renderer.h>
#include <exflow/cli/ui_helpers.hpp>
#include <exflow/common/utf8_utils.h>

#include <algorithm>
#include <set>
#include <vector>

#include <fmt/format.h>

namespace exflow::cli {

using analysis::AnalysisResult;
using analysis::EndpointRecord;
using analysis::ExceptionOccurrence;

namespace {

std::string join(const std::vector<std::string>& parts, std::string_view sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0)
            out.append(sep);
        out.append(parts[i]);
    }
    return out;
}

class Painter {
public:
    explicit Painter(bool enabled) : enabled_(enabled) {}

    std::string operator()(std::string_view s, const char* code) const {
        return ui::colorize(s, code, enabled_);
    }

private:
    bool enabled_;
};

std::string endpointHeader(const EndpointRecord& ep, const Painter& paint) {
    auto location = fmt::format("{}:{}", paint(ep.file.string(), ui::Ansi::CYAN),
                                paint(std::to_string(ep.line), ui::Ansi::YELLOW));
    if (ep.path && !ep.path->empty()) {
        return fmt::format("{} - {} {} ({})", location, paint(ep.method, ui::Ansi::BOLD), *ep.path,
                           paint(ep.functionName, ui::Ansi::DIM));
    }
    return fmt::format("{} - {}", location, paint(ep.functionName, ui::Ansi::BOLD));
}

std::string occurrenceDetail(const ExceptionOccurrence& occ) {
    if (occ.enclosingFunction) {
        return fmt::format("(raised in {} at {}:{})", *occ.enclosingFunction, occ.file.string(),
                           occ.line);
    }
    return fmt::format("(raised at line {})", occ.line);
}

std::string formatEndpoint(const EndpointRecord& ep, bool verbose, const Painter& paint) {
    std::vector<std::string> lines;
    lines.push_back(endpointHeader(ep, paint));

    lines.push_back(paint("  Undeclared exceptions:", ui::Ansi::RED));
    for (const auto& occ : ep.undeclared()) {
        lines.push_back(fmt::format("    - {} {}", occ.exceptionClass,
                                    paint(occurrenceDetail(occ), ui::Ansi::DIM)));
    }

    if (verbose && !ep.declaredExceptions.empty()) {
        lines.push_back(paint("  Declared exceptions:", ui::Ansi::GREEN));
        for (const auto& cls : ep.declaredExceptions) {
            lines.push_back(fmt::format("    - {}", cls));
        }
    }

    lines.emplace_back();
    return join(lines, "\n");
}

} // namespace

std::string renderText(const AnalysisResult& result, const RenderOptions& opts) {
    Painter paint(opts.color);

    if (result.endpoints.empty()) {
        return paint("No FastAPI endpoints found.", ui::Ansi::YELLOW);
    }

    auto withIssues = result.endpointsWithIssues();
    std::vector<std::string> lines;

    if (withIssues.empty()) {
        if (opts.verbose) {
            lines.push_back(paint(fmt::format("Analyzed {} endpoints.", result.endpoints.size()),
                                  ui::Ansi::DIM));
        }
        lines.push_back(paint("No undeclared exceptions found.", ui::Ansi::GREEN));
        return join(lines, "\n");
    }

    for (const auto* ep : withIssues) {
        lines.push_back(formatEndpoint(*ep, opts.verbose, paint));
    }

    lines.emplace_back();
    auto summary = fmt::format(
        "Found {} in {}.",
        ui::pluralize(result.totalUndeclared(), "undeclared exception", "undeclared exceptions"),
        ui::pluralize(withIssues.size(), "endpoint", "endpoints"));
    lines.push_back(paint(summary, ui::Ansi::RED));
    return join(lines, "\n");
}

nlohmann::ordered_json toJson(const AnalysisResult& result, bool verbose) {
    nlohmann::ordered_json endpoints = nlohmann::ordered_json::array();

    for (const auto& ep : result.endpoints) {
        auto undeclared = ep.undeclared();
        if (!verbose && undeclared.empty())
            continue;

        nlohmann::ordered_json items = nlohmann::ordered_json::array();
        for (const auto& occ : undeclared) {
            items.push_back({
                {"class", occ.exceptionClass},
                {"file", common::sanitizeUtf8(occ.file.string())},
                {"line", occ.line},
                {"in_function", occ.enclosingFunction ? nlohmann::ordered_json(*occ.enclosingFunction)
                                                      : nlohmann::ordered_json(nullptr)},
            });
        }

        endpoints.push_back({
            {"file", common::sanitizeUtf8(ep.file.string())},
            {"line", ep.line},
            {"function", ep.functionName},
            {"method", ep.method},
            {"path", ep.path ? nlohmann::ordered_json(*ep.path) : nlohmann::ordered_json(nullptr)},
            {"declared_exceptions", ep.declaredExceptions},
            {"undeclared_exceptions", std::move(items)},
        });
    }

    nlohmann::ordered_json errors = nlohmann::ordered_json::array();
    for (const auto& err : result.errors) {
        errors.push_back(common::sanitizeUtf8(err));
    }

    return {
        {"summary",
         {
             {"total_endpoints", result.endpoints.size()},
             {"endpoints_with_issues", result.endpointsWithIssues().size()},
             {"total_undeclared", result.totalUndeclared()},
         }},
        {"endpoints", std::move(endpoints)},
        {"errors", std::move(errors)},
    };
}

std::string renderJson(const AnalysisResult& result, bool verbose) {
    return toJson(result, verbose).dump(2);
}

std::string renderGithub(const AnalysisResult& result) {
    std::vector<std::string> lines;
    for (const auto* ep : result.endpointsWithIssues()) {
        for (const auto& occ : ep->undeclared()) {
            auto message = fmt::format("Undeclared exception '{}'", occ.exceptionClass);
            if (occ.enclosingFunction) {
                message += fmt::format(" raised in {}", *occ.enclosingFunction);
            }
            lines.push_back(fmt::format("::error file={},line={},title=Undeclared Exception::{}",
                                        ep->file.string(), ep->line, message));
        }
    }
    return join(lines, "\n");
}

std::string renderResult(const AnalysisResult& result, std::string_view format,
                         const RenderOptions& opts) {
    if (format == "json")
        return renderJson(result, opts.verbose);
    if (format == "github")
        return renderGithub(result);
    return renderText(result, opts);
}

std::string renderList(const AnalysisResult& result, const RenderOptions& opts) {
    Painter paint(opts.color);

    if (result.endpoints.empty()) {
        return paint("No FastAPI endpoints found.", ui::Ansi::YELLOW);
    }

    const std::string ok = paint("✓", ui::Ansi::GREEN);
    const std::string bad = paint("✗", ui::Ansi::RED);

    std::vector<std::string> lines;
    for (const auto& ep : result.endpoints) {
        lines.emplace_back();
        lines.push_back(endpointHeader(ep, paint));

        if (ep.declaredExceptions.empty()) {
            lines.push_back(paint("  Declared: (none)", ui::Ansi::DIM));
        } else {
            lines.push_back(paint("  Declared:", ui::Ansi::GREEN));
            for (const auto& cls : ep.declaredExceptions) {
                lines.push_back(fmt::format("    {} {}", ok, cls));
            }
        }

        if (ep.detectedExceptions.empty()) {
            lines.push_back(paint("  Detected: (none)", ui::Ansi::DIM));
            continue;
        }

        lines.push_back(paint("  Detected:", ui::Ansi::BLUE));
        for (const auto& occ : ep.detectedExceptions) {
            bool declared = std::find(ep.declaredExceptions.begin(), ep.declaredExceptions.end(),
                                      occ.exceptionClass) != ep.declaredExceptions.end();
            auto where = occ.enclosingFunction
                             ? fmt::format("(in {} at line {})", *occ.enclosingFunction, occ.line)
                             : fmt::format("(line {})", occ.line);
            lines.push_back(fmt::format("    {} {} {}", declared ? ok : bad, occ.exceptionClass,
                                        paint(where, ui::Ansi::DIM)));
        }
    }

    lines.emplace_back();
    lines.push_back(paint(fmt::format("Total endpoints: {}", result.endpoints.size()),
                          ui::Ansi::DIM));
    return join(lines, "\n");
}

std::string renderSuggestions(const AnalysisResult& result, bool diff, const RenderOptions& opts) {
    Painter paint(opts.color);

    auto withIssues = result.endpointsWithIssues();
    if (withIssues.empty()) {
        return paint("All exceptions are properly declared.", ui::Ansi::GREEN);
    }

    std::vector<std::string> lines;
    for (const auto* ep : withIssues) {
        lines.emplace_back();
        lines.push_back(fmt::format("{} - {}",
                                    paint(fmt::format("{}:{}", ep->file.string(), ep->line),
                                          ui::Ansi::CYAN),
                                    paint(ep->functionName, ui::Ansi::BOLD)));

        std::set<std::string> all(ep->declaredExceptions.begin(), ep->declaredExceptions.end());
        for (const auto& occ : ep->detectedExceptions) {
            all.insert(occ.exceptionClass);
        }
        std::vector<std::string> sorted(all.begin(), all.end());

        if (diff) {
            lines.push_back(paint(
                fmt::format("  - exceptions=[{}]", join(ep->declaredExceptions, ", ")),
                ui::Ansi::RED));
            lines.push_back(
                paint(fmt::format("  + exceptions=[{}]", join(sorted, ", ")), ui::Ansi::GREEN));
            continue;
        }

        lines.push_back(paint("  Suggested:", ui::Ansi::YELLOW));
        lines.push_back(fmt::format("    exceptions=[{}]", join(sorted, ", ")));

        std::vector<std::string> added;
        for (const auto& occ : ep->undeclared()) {
            added.push_back(occ.exceptionClass);
        }
        if (!added.empty()) {
            lines.push_back(paint(fmt::format("  Adding: {}", join(added, ", ")), ui::Ansi::DIM));
        }
    }
    return join(lines, "\n");
}

} // namespace exflow::cli
