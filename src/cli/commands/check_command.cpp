#include <spdlog/spdlog.h>
#include <iostream>
#include <exflow/cli/command.h>
#include <exflow/cli/exflow_cli.h>
#include <exflow/cli/result_renderer.h>
#include <exflow/cli/ui_helpers.hpp>

#include "analysis_options.h"

namespace exflow::cli {

class CheckCommand : public ICommand {
public:
    std::string getName() const override { return "check"; }

    std::string getDescription() const override {
        return "Check for undeclared exceptions in FastAPI endpoints";
    }

    void registerCommand(CLI::App& app, ExflowCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("check", getDescription());
        cmd->add_option("path", path_, "File or directory to analyze")
            ->required()
            ->check(CLI::ExistingPath);
        cmd->add_option("--depth", depth_, "Maximum call depth for transitive analysis")
            ->type_name("N");
        cmd->add_option("--ignore", ignore_, "Exception class to ignore (repeatable)")
            ->type_name("CLS");
        formatOpt_ = cmd->add_option("--format", format_, "Output format")
                         ->check(CLI::IsMember({"text", "json", "github"}));
        strictOpt_ = cmd->add_flag("--strict", strict_, "Also fail when a file cannot be analyzed");
        cmd->add_flag("-q,--quiet", quiet_, "Only report through the exit code");
        cmd->add_flag("-v,--verbose", verbose_, "Show detailed analysis");
        colorOpt_ = cmd->add_flag("--color,!--no-color", color_, "Force colored output on or off");

        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        auto cfg = cli_->loadConfig();
        if (!cfg) {
            return cfg.error();
        }
        auto options = mergeAnalysisOptions(cfg.value(), depth_, ignore_);
        if (!options) {
            return options.error();
        }

        const std::string format = formatOpt_->count() > 0 ? format_ : cfg.value().format;
        const bool strict = strictOpt_->count() > 0 ? strict_ : cfg.value().strict;
        if (colorOpt_->count() > 0) {
            ui::set_colors_enabled_override(color_);
        }

        auto result = cli_->analyzePath(path_, options.value());
        if (!result) {
            return result.error();
        }
        const auto& analysis = result.value();

        if (!quiet_) {
            for (const auto& error : analysis.errors) {
                std::cerr << ui::colorize("Warning:", ui::Ansi::YELLOW) << " " << error << "\n";
            }
        }

        RenderOptions render;
        render.verbose = verbose_;
        render.color = format == "text" && ui::colors_enabled();
        auto output = renderResult(analysis, format, render);
        if (!quiet_ && !output.empty()) {
            std::cout << output << "\n";
        }

        bool failed = analysis.hasIssues() || (strict && !analysis.errors.empty());
        spdlog::debug("check: {} endpoint(s), {} undeclared, {} file error(s)",
                      analysis.endpoints.size(), analysis.totalUndeclared(),
                      analysis.errors.size());
        cli_->setExitCode(failed ? kExitIssues : kExitOk);
        return Result<void>();
    }

private:
    ExflowCLI* cli_ = nullptr;
    CLI::Option* formatOpt_ = nullptr;
    CLI::Option* strictOpt_ = nullptr;
    CLI::Option* colorOpt_ = nullptr;
    std::string path_;
    std::string depth_;
    std::vector<std::string> ignore_;
    std::string format_ = "text";
    bool strict_ = false;
    bool quiet_ = false;
    bool verbose_ = false;
    bool color_ = true;
};

// Factory function
std::unique_ptr<ICommand> createCheckCommand() {
    return std::make_unique<CheckCommand>();
}

} // namespace exflow::cli
