// In-memory front end and syntax builders for analysis tests
#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <exflow/syntax/source_parser.h>

namespace exflow::test {

using namespace exflow::syntax;

/**
 * @brief Fluent builder for a lowered function definition
 */
class FunctionBuilder {
public:
    explicit FunctionBuilder(std::string name, uint32_t line = 1) {
        fn_.name = std::move(name);
        fn_.loc = {line, 0};
    }

    // @router.<method>(path, exceptions=[...])
    FunctionBuilder& route(const std::string& method, std::optional<std::string> path = {},
                           std::optional<std::vector<std::string>> exceptions = {},
                           const std::string& receiver = "router") {
        std::vector<ExprPtr> args;
        if (path)
            args.push_back(makeConstant(*path));
        std::vector<Keyword> keywords;
        if (exceptions) {
            std::vector<ExprPtr> elements;
            for (const auto& cls : *exceptions)
                elements.push_back(makeDotted(cls));
            keywords.push_back(Keyword{"exceptions", makeList(std::move(elements))});
        }
        fn_.decorators.push_back(makeCall(makeAttribute(makeName(receiver), method),
                                          std::move(args), std::move(keywords)));
        return *this;
    }

    FunctionBuilder& decorator(ExprPtr expr) {
        fn_.decorators.push_back(std::move(expr));
        return *this;
    }

    // raise Cls(...)
    FunctionBuilder& raises(const std::string& cls, uint32_t line, uint32_t column = 4) {
        fn_.body.emplace_back(RaiseSite{makeCall(makeDotted(cls)), {line, column}});
        return *this;
    }

    // raise <expr>
    FunctionBuilder& raisesExpr(ExprPtr exc, uint32_t line, uint32_t column = 4) {
        fn_.body.emplace_back(RaiseSite{std::move(exc), {line, column}});
        return *this;
    }

    // bare raise
    FunctionBuilder& reraise(uint32_t line) {
        fn_.body.emplace_back(RaiseSite{nullptr, {line, 8}});
        return *this;
    }

    // callee(...) or receiver.method(...)
    FunctionBuilder& calls(const std::string& callee, uint32_t line) {
        fn_.body.emplace_back(CallSite{makeCall(makeDotted(callee)), {line, 4}});
        return *this;
    }

    FunctionDef build() const { return fn_; }

private:
    FunctionDef fn_;
};

inline ModuleSyntax make_module(const std::filesystem::path& file,
                                std::vector<FunctionDef> functions) {
    ModuleSyntax module;
    module.file = file;
    module.functions = std::move(functions);
    return module;
}

/**
 * @brief ISourceParser serving canned modules keyed by file name
 *
 * Sources starting with "#!syntax-error" fail with ErrorCode::ParseError. Files
 * without a canned module parse to an empty module.
 */
class FakeSourceParser : public ISourceParser {
public:
    void add(const std::string& fileName, std::vector<FunctionDef> functions) {
        modules_[fileName] = std::move(functions);
    }

    Result<ModuleSyntax> parse(std::string_view source,
                               const std::filesystem::path& file) override {
        ++parseCalls;
        if (source.rfind("#!syntax-error", 0) == 0) {
            return Error{ErrorCode::ParseError, "invalid syntax at line 1, column 1"};
        }
        auto it = modules_.find(file.filename().string());
        if (it == modules_.end()) {
            return make_module(file, {});
        }
        return make_module(file, it->second);
    }

    std::string_view language() const override { return "fake"; }

    int parseCalls = 0;

private:
    std::map<std::string, std::vector<FunctionDef>> modules_;
};

} // namespace exflow::test
