#include <exflow/analysis/declaration_extractor.h>

#include <algorithm>
#include <cctype>

namespace exflow::analysis {

using namespace exflow::syntax;

namespace {

std::optional<std::string> httpMethodOf(const Expr& func) {
    if (const auto* attr = std::get_if<AttributeExpr>(&func.node)) {
        if (isHttpMethod(attr->attr))
            return attr->attr;
    } else if (const auto* name = std::get_if<NameExpr>(&func.node)) {
        if (isHttpMethod(name->id))
            return name->id;
    }
    return std::nullopt;
}

std::string toUpper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

} // namespace

bool isHttpMethod(std::string_view token) {
    return std::find(std::begin(kHttpMethods), std::end(kHttpMethods), token) !=
           std::end(kHttpMethods);
}

std::vector<std::string> parseExceptionList(const Expr& value) {
    std::vector<std::string> names;
    const auto* list = std::get_if<ListExpr>(&value.node);
    if (!list)
        return names;

    for (const auto& element : list->elements) {
        if (!element)
            continue;
        if (auto name = renderQualifiedName(*element))
            names.push_back(std::move(*name));
    }
    return names;
}

std::optional<EndpointRecord> extractEndpoint(const FunctionDef& function,
                                              const std::filesystem::path& file) {
    for (const auto& decorator : function.decorators) {
        if (!decorator)
            continue;
        const auto* call = std::get_if<CallExpr>(&decorator->node);
        if (!call || !call->func)
            continue;

        auto method = httpMethodOf(*call->func);
        if (!method)
            continue;

        EndpointRecord record;
        record.file = file;
        record.line = function.loc.line;
        record.functionName = function.name;
        record.method = toUpper(*method);

        if (!call->args.empty() && call->args.front()) {
            if (const auto* literal = std::get_if<ConstantExpr>(&call->args.front()->node))
                record.path = literal->value;
        }

        for (const auto& keyword : call->keywords) {
            if (keyword.arg == "exceptions" && keyword.value) {
                record.declaredExceptions = parseExceptionList(*keyword.value);
                break;
            }
        }
        return record;
    }
    return std::nullopt;
}

} // namespace exflow::analysis
