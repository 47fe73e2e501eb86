#include <exflow/cli/command_registry.h>
#include <exflow/cli/exflow_cli.h>
#include <exflow/syntax/grammar_loader.h>
#include <exflow/syntax/tree_sitter_python_parser.h>
#include <exflow/version.hpp>

#include <cctype>
#include <cstdlib>
#include <iostream>

#include <spdlog/spdlog.h>

namespace exflow::cli {

namespace {

std::optional<spdlog::level::level_enum> parseLevel(const std::string& s) {
    std::string v;
    v.reserve(s.size());
    for (char c : s)
        v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (v == "trace")
        return spdlog::level::trace;
    if (v == "debug")
        return spdlog::level::debug;
    if (v == "info")
        return spdlog::level::info;
    if (v == "warn" || v == "warning")
        return spdlog::level::warn;
    if (v == "error" || v == "err")
        return spdlog::level::err;
    if (v == "critical" || v == "crit")
        return spdlog::level::critical;
    if (v == "off" || v == "none" || v == "silent")
        return spdlog::level::off;
    return std::nullopt;
}

} // namespace

void ExflowCLI::setPendingCommand(ICommand* cmd) {
    pendingCommand_ = cmd;
}

ExflowCLI::ExflowCLI() {
    // Set a conservative default; finalized after parsing flags in run()
    spdlog::set_level(spdlog::level::warn);

    app_ = std::make_unique<CLI::App>(
        "Check that FastAPI endpoints declare every exception they can raise", "exflow");
    app_->set_version_flag("--version", EXFLOW_VERSION_LONG_STRING);
    app_->require_subcommand(1);

    app_->add_flag("--verbose", verbose_, "Enable debug logging");
    app_->add_option("--config", configPath_, "Path to configuration file")
        ->check(CLI::ExistingFile);
}

ExflowCLI::~ExflowCLI() = default;

void ExflowCLI::registerCommand(std::unique_ptr<ICommand> command) {
    command->registerCommand(*app_, this);
    commands_.push_back(std::move(command));
}

void ExflowCLI::registerBuiltinCommands() {
    CommandRegistry::registerAllCommands(this);
}

void ExflowCLI::applyLogLevel() const {
    // Precedence: env EXFLOW_LOG_LEVEL > --verbose > warn
    if (const char* envLvl = std::getenv("EXFLOW_LOG_LEVEL"); envLvl && *envLvl) {
        if (auto lvl = parseLevel(envLvl)) {
            spdlog::set_level(*lvl);
            return;
        }
        spdlog::warn("Ignoring unknown EXFLOW_LOG_LEVEL '{}'", envLvl);
    }
    spdlog::set_level(verbose_ ? spdlog::level::debug : spdlog::level::warn);
}

int ExflowCLI::exitCodeFor(const Error& error) {
    switch (error.code) {
        case ErrorCode::InvalidArgument:
        case ErrorCode::FileNotFound:
        case ErrorCode::NotFound:
        case ErrorCode::NotSupported:
            return kExitUsage;
        default:
            return kExitIssues;
    }
}

Result<config::AnalyzerConfig> ExflowCLI::loadConfig() {
    if (config_) {
        return *config_;
    }
    auto loaded = config::resolveAnalyzerConfig(configPath_);
    if (!loaded) {
        return loaded.error();
    }
    config_ = loaded.value();
    return *config_;
}

Result<std::shared_ptr<syntax::ISourceParser>>
ExflowCLI::createParser(const config::AnalyzerConfig& cfg) const {
    syntax::GrammarLoader loader;
    if (!cfg.grammarPath.empty()) {
        loader.addGrammarPath("python", cfg.grammarPath);
    }

    auto parser = syntax::TreeSitterPythonParser::create(loader);
    if (!parser) {
        return Error{parser.error().code,
                     parser.error().message +
                         " (set EXFLOW_TS_PYTHON_LIB or [parser] grammar_path to the "
                         "tree-sitter-python library)"};
    }
    return std::shared_ptr<syntax::ISourceParser>(parser.value());
}

Result<analysis::AnalysisResult> ExflowCLI::analyzePath(const std::filesystem::path& path,
                                                        const analysis::AnalysisOptions& options) {
    auto cfg = loadConfig();
    if (!cfg) {
        return cfg.error();
    }
    auto parser = createParser(cfg.value());
    if (!parser) {
        return parser.error();
    }

    spdlog::debug("Analyzing {} (depth={}, {} ignored)", path.string(), options.maxDepth,
                  options.ignore.size());
    analysis::EndpointAnalyzer analyzer(parser.value(), options);
    return analyzer.analyzePath(path);
}

int ExflowCLI::run(int argc, char* argv[]) {
    try {
        registerBuiltinCommands();

        app_->parse(argc, argv);

        applyLogLevel();

        if (pendingCommand_) {
            auto result = pendingCommand_->execute();
            if (!result) {
                std::cerr << "Error: " << result.error().message << "\n";
                spdlog::debug("{} failed: {} ({})", pendingCommand_->getName(),
                              result.error().message, result.error().code);
                return exitCodeFor(result.error());
            }
        }

        return exitCode_;
    } catch (const CLI::ParseError& e) {
        return app_->exit(e);
    } catch (const std::exception& e) {
        // Always provide a user-facing error even if logging is off
        std::cerr << "Unexpected error: " << e.what() << "\n";
        spdlog::error("Unexpected error: {}", e.what());
        return kExitIssues;
    }
}

} // namespace exflow::cli
