#include <exflow/syntax/tree_sitter_python_parser.h>

#include <cstring>
#include <limits>
#include <optional>
#include <string>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace exflow::syntax {

namespace {

constexpr std::string_view kUtf8Bom = "\xEF\xBB\xBF";

std::string_view nodeType(TSNode node) {
    return ts_node_type(node);
}

SourceLocation locationOf(TSNode node) {
    TSPoint p = ts_node_start_point(node);
    return SourceLocation{p.row + 1, p.column};
}

TSNode fieldOf(TSNode node, std::string_view field) {
    return ts_node_child_by_field_name(node, field.data(), static_cast<uint32_t>(field.size()));
}

bool isComment(TSNode node) {
    return nodeType(node) == "comment";
}

// First named child that is not a comment; null node when there is none.
TSNode firstNamedChild(TSNode node) {
    uint32_t count = ts_node_named_child_count(node);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode child = ts_node_named_child(node, i);
        if (!isComment(child))
            return child;
    }
    return TSNode{};
}

// Depth-first search for the first ERROR or MISSING node.
std::optional<TSNode> findSyntaxError(TSNode node) {
    if (ts_node_is_missing(node) || nodeType(node) == "ERROR")
        return node;
    if (!ts_node_has_error(node))
        return std::nullopt;

    uint32_t count = ts_node_child_count(node);
    for (uint32_t i = 0; i < count; ++i) {
        if (auto found = findSyntaxError(ts_node_child(node, i)))
            return found;
    }
    return std::nullopt;
}

std::string describeSyntaxError(TSNode root) {
    auto bad = findSyntaxError(root);
    if (!bad)
        return "invalid syntax";

    auto loc = locationOf(*bad);
    if (ts_node_is_missing(*bad)) {
        return fmt::format("missing '{}' at line {}, column {}", nodeType(*bad), loc.line,
                           loc.column + 1);
    }
    return fmt::format("invalid syntax at line {}, column {}", loc.line, loc.column + 1);
}

bool isStringPrefixChar(char c) {
    switch (c) {
        case 'r': case 'R': case 'b': case 'B': case 'u': case 'U': case 'f': case 'F':
            return true;
        default:
            return false;
    }
}

class Lowering {
public:
    Lowering(std::string_view source, ModuleSyntax& module) : source_(source), module_(module) {}

    // Collect every function definition below node, outer functions first.
    void visitDefinitions(TSNode node) {
        if (nodeType(node) == "function_definition") {
            module_.functions.push_back(lowerFunction(node));
        }
        uint32_t count = ts_node_named_child_count(node);
        for (uint32_t i = 0; i < count; ++i) {
            visitDefinitions(ts_node_named_child(node, i));
        }
    }

private:
    std::string text(TSNode node) const {
        if (ts_node_is_null(node))
            return "";
        uint32_t start = ts_node_start_byte(node);
        uint32_t end = ts_node_end_byte(node);
        if (start >= end || end > source_.size())
            return "";
        return std::string(source_.substr(start, end - start));
    }

    FunctionDef lowerFunction(TSNode node) {
        FunctionDef fn;
        fn.name = text(fieldOf(node, "name"));
        fn.loc = locationOf(node);

        uint32_t count = ts_node_child_count(node);
        for (uint32_t i = 0; i < count; ++i) {
            if (nodeType(ts_node_child(node, i)) == "async") {
                fn.isAsync = true;
                break;
            }
        }

        TSNode parent = ts_node_parent(node);
        if (!ts_node_is_null(parent) && nodeType(parent) == "decorated_definition") {
            uint32_t n = ts_node_named_child_count(parent);
            for (uint32_t i = 0; i < n; ++i) {
                TSNode child = ts_node_named_child(parent, i);
                if (nodeType(child) != "decorator")
                    continue;
                TSNode expr = firstNamedChild(child);
                if (!ts_node_is_null(expr))
                    fn.decorators.push_back(lowerExpr(expr));
            }
        }

        TSNode body = fieldOf(node, "body");
        if (!ts_node_is_null(body))
            collectBody(body, fn.body);
        return fn;
    }

    void collectBody(TSNode node, std::vector<BodyEvent>& events) {
        auto type = nodeType(node);
        if (type == "raise_statement") {
            events.emplace_back(RaiseSite{raisedOperand(node), locationOf(node)});
        } else if (type == "call") {
            events.emplace_back(CallSite{lowerExpr(node), locationOf(node)});
        }

        uint32_t count = ts_node_named_child_count(node);
        for (uint32_t i = 0; i < count; ++i) {
            collectBody(ts_node_named_child(node, i), events);
        }
    }

    ExprPtr raisedOperand(TSNode node) {
        TSNode cause = fieldOf(node, "cause");
        uint32_t count = ts_node_named_child_count(node);
        for (uint32_t i = 0; i < count; ++i) {
            TSNode child = ts_node_named_child(node, i);
            if (isComment(child))
                continue;
            if (!ts_node_is_null(cause) && ts_node_eq(child, cause))
                continue;
            return lowerExpr(child);
        }
        return nullptr;
    }

    ExprPtr lowerExpr(TSNode node) {
        auto type = nodeType(node);
        auto loc = locationOf(node);

        if (type == "identifier")
            return makeName(text(node), loc);

        if (type == "attribute") {
            TSNode object = fieldOf(node, "object");
            ExprPtr value = ts_node_is_null(object) ? nullptr : lowerExpr(object);
            return makeAttribute(std::move(value), text(fieldOf(node, "attribute")), loc);
        }

        if (type == "call")
            return lowerCall(node, loc);

        if (type == "parenthesized_expression") {
            TSNode inner = firstNamedChild(node);
            return ts_node_is_null(inner) ? makeOther(std::string(type), loc) : lowerExpr(inner);
        }

        if (type == "string") {
            auto literal = stringValue(text(node));
            return literal ? makeConstant(std::move(*literal), loc)
                           : makeOther("formatted_string", loc);
        }

        if (type == "concatenated_string") {
            std::string joined;
            uint32_t count = ts_node_named_child_count(node);
            for (uint32_t i = 0; i < count; ++i) {
                TSNode part = ts_node_named_child(node, i);
                if (isComment(part))
                    continue;
                auto literal = stringValue(text(part));
                if (!literal)
                    return makeOther("formatted_string", loc);
                joined += *literal;
            }
            return makeConstant(std::move(joined), loc);
        }

        if (type == "integer" || type == "float" || type == "true" || type == "false" ||
            type == "none" || type == "ellipsis")
            return makeConstant(text(node), loc);

        if (type == "list") {
            std::vector<ExprPtr> elements;
            uint32_t count = ts_node_named_child_count(node);
            for (uint32_t i = 0; i < count; ++i) {
                TSNode child = ts_node_named_child(node, i);
                if (!isComment(child))
                    elements.push_back(lowerExpr(child));
            }
            return makeList(std::move(elements), loc);
        }

        return makeOther(std::string(type), loc);
    }

    ExprPtr lowerCall(TSNode node, SourceLocation loc) {
        TSNode function = fieldOf(node, "function");
        ExprPtr func =
            ts_node_is_null(function) ? makeOther("missing", loc) : lowerExpr(function);

        std::vector<ExprPtr> args;
        std::vector<Keyword> keywords;

        TSNode arguments = fieldOf(node, "arguments");
        if (!ts_node_is_null(arguments)) {
            if (nodeType(arguments) == "argument_list") {
                uint32_t count = ts_node_named_child_count(arguments);
                for (uint32_t i = 0; i < count; ++i) {
                    TSNode arg = ts_node_named_child(arguments, i);
                    if (isComment(arg))
                        continue;
                    if (nodeType(arg) == "keyword_argument") {
                        TSNode value = fieldOf(arg, "value");
                        keywords.push_back(Keyword{text(fieldOf(arg, "name")),
                                                   ts_node_is_null(value) ? nullptr
                                                                          : lowerExpr(value)});
                    } else {
                        args.push_back(lowerExpr(arg));
                    }
                }
            } else {
                // f(x for x in xs)
                args.push_back(lowerExpr(arguments));
            }
        }

        return makeCall(std::move(func), std::move(args), std::move(keywords), loc);
    }

    // Unquoted value of a string literal; nullopt for f-strings.
    static std::optional<std::string> stringValue(std::string_view literal) {
        size_t prefix = 0;
        bool raw = false;
        while (prefix < literal.size() && isStringPrefixChar(literal[prefix])) {
            char c = literal[prefix];
            if (c == 'f' || c == 'F')
                return std::nullopt;
            if (c == 'r' || c == 'R')
                raw = true;
            ++prefix;
        }
        literal.remove_prefix(prefix);

        size_t quote = 1;
        auto opening = literal.substr(0, 3);
        if (literal.size() >= 6 && (opening == "\"\"\"" || opening == "'''"))
            quote = 3;
        if (literal.size() < 2 * quote)
            return std::string(literal);
        literal = literal.substr(quote, literal.size() - 2 * quote);

        if (raw)
            return std::string(literal);

        std::string out;
        out.reserve(literal.size());
        for (size_t i = 0; i < literal.size(); ++i) {
            char c = literal[i];
            if (c != '\\' || i + 1 >= literal.size()) {
                out.push_back(c);
                continue;
            }
            char next = literal[i + 1];
            switch (next) {
                case '\\': out.push_back('\\'); break;
                case '\'': out.push_back('\''); break;
                case '"': out.push_back('"'); break;
                case 'n': out.push_back('\n'); break;
                case 't': out.push_back('\t'); break;
                case 'r': out.push_back('\r'); break;
                case '\n': break; // line continuation
                default:
                    out.push_back('\\');
                    out.push_back(next);
                    break;
            }
            ++i;
        }
        return out;
    }

    std::string_view source_;
    ModuleSyntax& module_;
};

} // namespace

TreeSitterPythonParser::TreeSitterPythonParser(LoadedGrammar grammar)
    : grammar_(std::move(grammar)), parser_(ts_parser_new(), ts_parser_delete) {
    if (grammar_.language) {
        ts_parser_set_language(parser_.get(), grammar_.language);
    }
}

Result<std::shared_ptr<TreeSitterPythonParser>>
TreeSitterPythonParser::create(const GrammarLoader& loader) {
    auto grammar = loader.loadGrammar("python");
    if (!grammar)
        return grammar.error();

    auto parser = std::make_shared<TreeSitterPythonParser>(std::move(grammar).value());
    if (ts_parser_language(parser->parser_.get()) == nullptr) {
        return Error{ErrorCode::NotSupported,
                     fmt::format("Grammar at {} is not compatible with this tree-sitter runtime "
                                 "(language ABI {})",
                                 parser->grammar_.path.string(),
                                 ts_language_version(parser->grammar_.language))};
    }
    return parser;
}

Result<ModuleSyntax> TreeSitterPythonParser::parse(std::string_view source,
                                                   const std::filesystem::path& file) {
    if (!parser_ || ts_parser_language(parser_.get()) == nullptr) {
        return Error{ErrorCode::NotInitialized, "Parser has no language set"};
    }
    if (source.substr(0, kUtf8Bom.size()) == kUtf8Bom) {
        source.remove_prefix(kUtf8Bom.size());
    }
    if (source.size() > std::numeric_limits<uint32_t>::max()) {
        return Error{ErrorCode::InvalidArgument, "source file too large"};
    }

    const char* data = source.empty() ? "" : source.data();
    std::unique_ptr<TSTree, decltype(&ts_tree_delete)> tree(
        ts_parser_parse_string(parser_.get(), nullptr, data, static_cast<uint32_t>(source.size())),
        ts_tree_delete);
    if (!tree) {
        return Error{ErrorCode::ParseError, "parser produced no syntax tree"};
    }

    TSNode root = ts_tree_root_node(tree.get());
    if (ts_node_has_error(root)) {
        return Error{ErrorCode::ParseError, describeSyntaxError(root)};
    }

    ModuleSyntax module;
    module.file = file;
    Lowering lowering(source, module);
    lowering.visitDefinitions(root);

    spdlog::trace("[PythonParser] {}: {} function definitions", file.string(),
                  module.functions.size());
    return module;
}

} // namespace exflow::syntax
