#include <iostream>
#include <exflow/cli/command.h>
#include <exflow/cli/exflow_cli.h>
#include <exflow/cli/result_renderer.h>
#include <exflow/cli/ui_helpers.hpp>

#include "analysis_options.h"

namespace exflow::cli {

class SuggestCommand : public ICommand {
public:
    std::string getName() const override { return "suggest"; }

    std::string getDescription() const override {
        return "Generate exception declarations for endpoints";
    }

    void registerCommand(CLI::App& app, ExflowCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("suggest", getDescription());
        cmd->add_option("path", path_, "File or directory to analyze")
            ->required()
            ->check(CLI::ExistingPath);
        cmd->add_option("--depth", depth_, "Maximum call depth for transitive analysis")
            ->type_name("N");
        cmd->add_option("--format", format_, "Output format")
            ->check(CLI::IsMember({"text", "diff"}))
            ->default_val("text");

        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        auto cfg = cli_->loadConfig();
        if (!cfg) {
            return cfg.error();
        }
        auto options = mergeAnalysisOptions(cfg.value(), depth_);
        if (!options) {
            return options.error();
        }
        auto opts = options.value();
        opts.ignore.clear();

        auto result = cli_->analyzePath(path_, opts);
        if (!result) {
            return result.error();
        }

        RenderOptions render;
        render.color = ui::colors_enabled();
        std::cout << renderSuggestions(result.value(), format_ == "diff", render) << "\n";
        return Result<void>();
    }

private:
    ExflowCLI* cli_ = nullptr;
    std::string path_;
    std::string depth_;
    std::string format_ = "text";
};

// Factory function
std::unique_ptr<ICommand> createSuggestCommand() {
    return std::make_unique<SuggestCommand>();
}

} // namespace exflow::cli
