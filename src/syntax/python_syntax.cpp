#include <exflow/syntax/python_syntax.h>

#include <algorithm>

namespace exflow::syntax {

namespace {
template <class... Ts> struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;
} // namespace

std::optional<std::string> renderQualifiedName(const Expr& expr) {
    return std::visit(
        Overloaded{
            [](const NameExpr& name) -> std::optional<std::string> { return name.id; },
            [&expr](const AttributeExpr&) -> std::optional<std::string> {
                // Collect attribute parts innermost-last, then reverse.
                std::vector<std::string_view> parts;
                const Expr* current = &expr;
                while (const auto* attr = std::get_if<AttributeExpr>(&current->node)) {
                    parts.push_back(attr->attr);
                    if (!attr->value)
                        break;
                    current = attr->value.get();
                }
                if (const auto* root = std::get_if<NameExpr>(&current->node)) {
                    parts.push_back(root->id);
                }
                std::reverse(parts.begin(), parts.end());

                std::string out;
                for (size_t i = 0; i < parts.size(); ++i) {
                    if (i > 0)
                        out.push_back('.');
                    out.append(parts[i]);
                }
                return out;
            },
            [](const auto&) -> std::optional<std::string> { return std::nullopt; },
        },
        expr.node);
}

std::optional<std::string> calleeName(const CallExpr& call) {
    if (!call.func)
        return std::nullopt;
    if (const auto* name = std::get_if<NameExpr>(&call.func->node))
        return name->id;
    if (const auto* attr = std::get_if<AttributeExpr>(&call.func->node))
        return attr->attr;
    return std::nullopt;
}

ExprPtr makeName(std::string id, SourceLocation loc) {
    return std::make_shared<const Expr>(Expr{NameExpr{std::move(id)}, loc});
}

ExprPtr makeAttribute(ExprPtr value, std::string attr, SourceLocation loc) {
    return std::make_shared<const Expr>(Expr{AttributeExpr{std::move(value), std::move(attr)}, loc});
}

ExprPtr makeCall(ExprPtr func, std::vector<ExprPtr> args, std::vector<Keyword> keywords,
                 SourceLocation loc) {
    return std::make_shared<const Expr>(
        Expr{CallExpr{std::move(func), std::move(args), std::move(keywords)}, loc});
}

ExprPtr makeConstant(std::string value, SourceLocation loc) {
    return std::make_shared<const Expr>(Expr{ConstantExpr{std::move(value)}, loc});
}

ExprPtr makeList(std::vector<ExprPtr> elements, SourceLocation loc) {
    return std::make_shared<const Expr>(Expr{ListExpr{std::move(elements)}, loc});
}

ExprPtr makeOther(std::string kind, SourceLocation loc) {
    return std::make_shared<const Expr>(Expr{OtherExpr{std::move(kind)}, loc});
}

ExprPtr makeDotted(std::string_view dotted, SourceLocation loc) {
    ExprPtr current;
    size_t start = 0;
    while (start <= dotted.size()) {
        size_t dot = dotted.find('.', start);
        std::string part(dotted.substr(start, dot == std::string_view::npos ? std::string_view::npos
                                                                             : dot - start));
        current = current ? makeAttribute(std::move(current), std::move(part), loc)
                          : makeName(std::move(part), loc);
        if (dot == std::string_view::npos)
            break;
        start = dot + 1;
    }
    return current;
}

} // namespace exflow::syntax
