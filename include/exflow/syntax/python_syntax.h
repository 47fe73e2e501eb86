#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace exflow::syntax {

/**
 * @brief Position of a syntax element in its source file
 */
struct SourceLocation {
    uint32_t line = 0;   ///< 1-based
    uint32_t column = 0; ///< 0-based byte offset within the line
};

struct Expr;
using ExprPtr = std::shared_ptr<const Expr>;

/// `name`
struct NameExpr {
    std::string id;
};

/// `value.attr`
struct AttributeExpr {
    ExprPtr value;
    std::string attr;
};

/// `arg=value` inside a call
struct Keyword {
    std::string arg;
    ExprPtr value;
};

/// `func(args..., keywords...)`
struct CallExpr {
    ExprPtr func;
    std::vector<ExprPtr> args;
    std::vector<Keyword> keywords;
};

/// String, number, boolean or None literal. Strings hold their unquoted text,
/// everything else keeps its source spelling.
struct ConstantExpr {
    std::string value;
};

/// `[a, b, ...]`
struct ListExpr {
    std::vector<ExprPtr> elements;
};

/// Any expression shape the analysis does not look into.
struct OtherExpr {
    std::string kind;
};

/**
 * @brief Expression node of the lowered syntax model
 *
 * Only the shapes the analysis dispatches on are modelled; everything else is
 * collapsed into OtherExpr.
 */
struct Expr {
    std::variant<NameExpr, AttributeExpr, CallExpr, ConstantExpr, ListExpr, OtherExpr> node;
    SourceLocation loc;
};

/// `raise`, `raise exc` or `raise exc from cause`; exc is null for a bare re-raise.
struct RaiseSite {
    ExprPtr exc;
    SourceLocation loc;
};

/// A call expression somewhere in a function body.
struct CallSite {
    ExprPtr call;
    SourceLocation loc;
};

using BodyEvent = std::variant<RaiseSite, CallSite>;

/**
 * @brief A `def` or `async def` with the parts of its body the analysis needs
 *
 * `body` lists raise statements and call expressions in source order, including
 * those inside nested blocks, nested functions, classes and lambdas.
 */
struct FunctionDef {
    std::string name;
    SourceLocation loc;
    bool isAsync = false;
    std::vector<ExprPtr> decorators;
    std::vector<BodyEvent> body;
};

/**
 * @brief Every function definition of one source file, in source order
 */
struct ModuleSyntax {
    std::filesystem::path file;
    std::vector<FunctionDef> functions;
};

/**
 * @brief Render a name or attribute chain as a class name
 *
 * `Name` renders as `Name`, `pkg.mod.Name` renders as `pkg.mod.Name`. Attribute
 * chains rooted in something other than a name render only their attribute
 * parts. Every other shape has no name.
 */
std::optional<std::string> renderQualifiedName(const Expr& expr);

/**
 * @brief Bare callee name of a call: the identifier, or the attribute name for
 * `receiver.method(...)`. Other callee shapes have no name.
 */
std::optional<std::string> calleeName(const CallExpr& call);

// Builders shared by the tree-sitter front end and by in-memory models.
ExprPtr makeName(std::string id, SourceLocation loc = {});
ExprPtr makeAttribute(ExprPtr value, std::string attr, SourceLocation loc = {});
ExprPtr makeCall(ExprPtr func, std::vector<ExprPtr> args = {}, std::vector<Keyword> keywords = {},
                 SourceLocation loc = {});
ExprPtr makeConstant(std::string value, SourceLocation loc = {});
ExprPtr makeList(std::vector<ExprPtr> elements, SourceLocation loc = {});
ExprPtr makeOther(std::string kind, SourceLocation loc = {});

/// Build `a.b.c` from a dotted string.
ExprPtr makeDotted(std::string_view dotted, SourceLocation loc = {});

} // namespace exflow::syntax
