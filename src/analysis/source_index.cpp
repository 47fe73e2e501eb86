#include <exflow/analysis/source_discovery.h>
#include <exflow/analysis/source_index.h>
#include <exflow/common/utf8_utils.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace exflow::analysis {

namespace {

Result<ModulePtr> parseFile(syntax::ISourceParser& parser, const std::filesystem::path& file) {
    auto source = readSourceFile(file);
    if (!source)
        return source.error();

    const auto& text = source.value();
    if (auto bad = common::findInvalidUtf8(text)) {
        auto byte = static_cast<unsigned char>(text[*bad]);
        return Error{ErrorCode::EncodingError,
                     fmt::format("'utf-8' codec can't decode byte 0x{:02x} in position {}", byte,
                                 *bad)};
    }

    auto parsed = parser.parse(text, file);
    if (!parsed)
        return parsed.error();
    return std::make_shared<const syntax::ModuleSyntax>(std::move(parsed).value());
}

} // namespace

SourceIndex::SourceIndex(std::shared_ptr<syntax::ISourceParser> parser)
    : parser_(std::move(parser)) {}

Result<ModulePtr> SourceIndex::load(const std::filesystem::path& file) {
    auto it = modules_.find(file);
    if (it != modules_.end())
        return it->second;

    if (!parser_) {
        return Error{ErrorCode::NotInitialized, "no source parser configured"};
    }

    auto loaded = parseFile(*parser_, file);
    if (loaded) {
        spdlog::debug("[SourceIndex] parsed {} ({} functions)", file.string(),
                      loaded.value()->functions.size());
    } else {
        spdlog::debug("[SourceIndex] failed to parse {}: {}", file.string(),
                      loaded.error().message);
    }
    modules_.emplace(file, loaded);
    return loaded;
}

void SourceIndex::registerFile(const std::filesystem::path& file) {
    if (registered_.count(file) > 0)
        return;

    auto module = load(file);
    if (!module)
        return;

    registered_.emplace(file, module.value());
    addFunctions(module.value());
}

void SourceIndex::registerModule(ModulePtr module) {
    if (!module)
        return;
    if (registered_.count(module->file) > 0)
        dropFunctions(module->file);
    modules_.insert_or_assign(module->file, Result<ModulePtr>(module));
    registered_.insert_or_assign(module->file, module);
    addFunctions(module);
}

void SourceIndex::addFunctions(const ModulePtr& module) {
    for (const auto& fn : module->functions) {
        functions_.insert_or_assign(fn.name, FunctionRef{module->file, &fn});
    }
    spdlog::debug("[SourceIndex] registered {} function(s) from {}", module->functions.size(),
                  module->file.string());
}

void SourceIndex::dropFunctions(const std::filesystem::path& file) {
    for (auto it = functions_.begin(); it != functions_.end();) {
        if (it->second.file == file)
            it = functions_.erase(it);
        else
            ++it;
    }
}

std::optional<FunctionRef> SourceIndex::lookup(std::string_view name) const {
    auto it = functions_.find(std::string(name));
    if (it == functions_.end())
        return std::nullopt;
    return it->second;
}

bool SourceIndex::isRegistered(const std::filesystem::path& file) const {
    return registered_.count(file) > 0;
}

} // namespace exflow::analysis
