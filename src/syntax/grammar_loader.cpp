#include <exflow/syntax/grammar_loader.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <string>

#include <dlfcn.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

extern "C" {
#include <tree_sitter/api.h>
}

namespace exflow::syntax {

namespace {
using LanguageFactory = const TSLanguage* (*)();

// Open a library and resolve its language factory; null on failure.
std::shared_ptr<void> openGrammar(const std::string& candidate, std::string_view symbol,
                                  const TSLanguage** out) {
    void* handle = dlopen(candidate.c_str(), RTLD_LAZY | RTLD_LOCAL);
    if (!handle) {
        const char* err = dlerror();
        spdlog::trace("[GrammarLoader] dlopen failed for {}: {}", candidate, err ? err : "");
        return nullptr;
    }

    auto factory = reinterpret_cast<LanguageFactory>(dlsym(handle, std::string(symbol).c_str()));
    const TSLanguage* lang = factory ? factory() : nullptr;
    if (!lang) {
        spdlog::trace("[GrammarLoader] {} does not export {}", candidate, symbol);
        dlclose(handle);
        return nullptr;
    }

    *out = lang;
    return std::shared_ptr<void>(handle, [](void* h) {
        if (h)
            dlclose(h);
    });
}
} // namespace

void GrammarLoader::addGrammarPath(std::string_view language, const std::filesystem::path& path) {
    grammar_paths_.emplace_back(std::string(language), path);
}

const GrammarLoader::GrammarSpec* GrammarLoader::findSpec(std::string_view language) const {
    std::string lang_lower(language);
    std::transform(lang_lower.begin(), lang_lower.end(), lang_lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    for (const auto& spec : kSpecs) {
        if (lang_lower == spec.key) {
            return &spec;
        }
    }
    return nullptr;
}

std::vector<std::filesystem::path> GrammarLoader::getGrammarSearchPaths() const {
    std::vector<std::filesystem::path> paths;

    // XDG standard locations
    if (const char* xdg_data_home = std::getenv("XDG_DATA_HOME")) {
        if (*xdg_data_home) {
            paths.emplace_back(std::filesystem::path(xdg_data_home) / "exflow" / "grammars");
        }
    }

    // Default user path
    if (const char* home = std::getenv("HOME")) {
        paths.emplace_back(std::filesystem::path(home) / ".local" / "share" / "exflow" /
                           "grammars");
    }

    // System-wide locations
    paths.emplace_back("/usr/local/share/exflow/grammars");
    paths.emplace_back("/usr/share/exflow/grammars");
    paths.emplace_back("/usr/local/lib");
    paths.emplace_back("/usr/lib");

    return paths;
}

std::vector<std::string> GrammarLoader::getLibraryCandidates(std::string_view language) const {
    const auto* spec = findSpec(language);
    if (!spec) {
        return {};
    }

    std::vector<std::string> candidates;

    // Explicit overrides first; a directory is searched for the default library name
    for (const auto& [lang, path] : grammar_paths_) {
        if (!findSpec(lang) || findSpec(lang)->symbol != spec->symbol)
            continue;
        std::error_code ec;
        if (std::filesystem::is_directory(path, ec)) {
            candidates.push_back((path / std::string(spec->default_so)).string());
        } else {
            candidates.push_back(path.string());
        }
    }

    if (const char* env_path = std::getenv(std::string(spec->env_var).c_str())) {
        if (*env_path) {
            candidates.emplace_back(env_path);
        }
    }

    // "libtree-sitter-python.so" -> "tree-sitter-python"
    std::string core_name(spec->default_so);
    auto dot_pos = core_name.rfind('.');
    if (dot_pos != std::string::npos) {
        core_name = core_name.substr(0, dot_pos);
    }
    if (core_name.rfind("lib", 0) == 0) {
        core_name = core_name.substr(3);
    }

    std::vector<std::string> lib_names;
    lib_names.push_back("lib" + core_name + ".so");
    lib_names.push_back(core_name + ".so");
    std::string underscore_name = core_name;
    std::replace(underscore_name.begin(), underscore_name.end(), '-', '_');
    lib_names.push_back("lib" + underscore_name + ".so");
    lib_names.push_back(underscore_name + ".so");

    for (const auto& base_path : getGrammarSearchPaths()) {
        std::error_code ec;
        if (!std::filesystem::exists(base_path, ec))
            continue;

        for (const auto& lib_name : lib_names) {
            auto candidate = base_path / lib_name;
            if (std::filesystem::exists(candidate, ec)) {
                candidates.push_back(candidate.string());
            }
        }
    }

    // Let the dynamic loader search LD_LIBRARY_PATH and ld.so.cache
    candidates.push_back(lib_names.front());

    return candidates;
}

Result<LoadedGrammar> GrammarLoader::loadGrammar(std::string_view language) const {
    const auto* spec = findSpec(language);
    if (!spec) {
        return Error{ErrorCode::NotSupported,
                     fmt::format("Language '{}' not supported", language)};
    }

    auto candidates = getLibraryCandidates(language);
    for (const auto& candidate : candidates) {
        spdlog::debug("[GrammarLoader] trying grammar candidate: {}", candidate);

        const TSLanguage* lang = nullptr;
        auto library = openGrammar(candidate, spec->symbol, &lang);
        if (library) {
            spdlog::debug("[GrammarLoader] loaded {} grammar from {}", spec->key, candidate);
            return LoadedGrammar{std::move(library), lang, candidate};
        }
    }

    std::string tried_join;
    for (size_t i = 0; i < candidates.size(); ++i) {
        tried_join += candidates[i];
        if (i + 1 < candidates.size())
            tried_join += ", ";
    }
    return Error{ErrorCode::NotFound, fmt::format("Failed to load grammar for '{}'. Tried: {}",
                                                  language, tried_join)};
}

bool GrammarLoader::grammarExists(std::string_view language) const {
    auto loaded = loadGrammar(language);
    return loaded.has_value();
}

} // namespace exflow::syntax
