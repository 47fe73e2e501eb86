#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <CLI/CLI.hpp>
#include <exflow/analysis/endpoint_analyzer.h>
#include <exflow/cli/command.h>
#include <exflow/config/analyzer_config.h>
#include <exflow/syntax/source_parser.h>

namespace exflow::cli {

/// Exit codes of the exflow binary.
inline constexpr int kExitOk = 0;
inline constexpr int kExitIssues = 1;
inline constexpr int kExitUsage = 2;

/**
 * Main CLI application class
 */
class ExflowCLI {
public:
    ExflowCLI();
    ~ExflowCLI();

    /**
     * Run the CLI with given arguments
     */
    int run(int argc, char* argv[]);

    /**
     * Register a command
     */
    void registerCommand(std::unique_ptr<ICommand> command);

    /**
     * Defer execution of a command until after parsing and log setup
     */
    void setPendingCommand(ICommand* cmd);

    /**
     * Get verbose flag
     */
    bool getVerbose() const { return verbose_; }

    /**
     * Config file given with --config (empty when not given)
     */
    const std::string& getConfigOverride() const { return configPath_; }

    /**
     * Resolve and load config.toml (cached after the first call)
     */
    Result<config::AnalyzerConfig> loadConfig();

    /**
     * Build the Python front end, honouring [parser] grammar_path
     */
    Result<std::shared_ptr<syntax::ISourceParser>>
    createParser(const config::AnalyzerConfig& cfg) const;

    /**
     * Run one analysis over a path with a freshly built parser
     */
    Result<analysis::AnalysisResult> analyzePath(const std::filesystem::path& path,
                                                 const analysis::AnalysisOptions& options);

    /**
     * Exit code reported by run() when the command itself succeeded
     */
    void setExitCode(int code) { exitCode_ = code; }
    int getExitCode() const { return exitCode_; }

    /**
     * Map a command failure to an exit code
     */
    static int exitCodeFor(const Error& error);

private:
    void registerBuiltinCommands();
    void applyLogLevel() const;

    std::unique_ptr<CLI::App> app_;
    std::vector<std::unique_ptr<ICommand>> commands_;
    ICommand* pendingCommand_{nullptr};
    std::optional<config::AnalyzerConfig> config_;
    std::string configPath_;
    bool verbose_{false};
    int exitCode_{kExitOk};
};

} // namespace exflow::cli
