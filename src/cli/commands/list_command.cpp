#include <iostream>
#include <exflow/cli/command.h>
#include <exflow/cli/exflow_cli.h>
#include <exflow/cli/result_renderer.h>
#include <exflow/cli/ui_helpers.hpp>

#include "analysis_options.h"

namespace exflow::cli {

class ListCommand : public ICommand {
public:
    std::string getName() const override { return "list"; }

    std::string getDescription() const override {
        return "List all detected exceptions in endpoints";
    }

    void registerCommand(CLI::App& app, ExflowCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("list", getDescription());
        cmd->add_option("path", path_, "File or directory to analyze")
            ->required()
            ->check(CLI::ExistingPath);
        cmd->add_option("--depth", depth_, "Maximum call depth for transitive analysis")
            ->type_name("N");
        cmd->add_flag("-v,--verbose", verbose_, "Show detailed information");

        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        auto cfg = cli_->loadConfig();
        if (!cfg) {
            return cfg.error();
        }
        // Ignored classes still show up here: list reports everything that was detected.
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
        render.verbose = verbose_;
        render.color = ui::colors_enabled();
        std::cout << renderList(result.value(), render) << "\n";
        return Result<void>();
    }

private:
    ExflowCLI* cli_ = nullptr;
    std::string path_;
    std::string depth_;
    bool verbose_ = false;
};

// Factory function
std::unique_ptr<ICommand> createListCommand() {
    return std::make_unique<ListCommand>();
}

} // namespace exflow::cli
