#pragma once

#include <string>
#include <CLI/CLI.hpp>
#include <exflow/core/types.h>

namespace exflow::cli {

class ExflowCLI;

// A subcommand of the exflow binary. registerCommand() wires options into
// the CLI11 app and queues the command via ExflowCLI::setPendingCommand; the
// CLI calls execute() once parsing has succeeded.
class ICommand {
public:
    virtual ~ICommand() = default;

    virtual std::string getName() const = 0;
    virtual std::string getDescription() const = 0;
    virtual void registerCommand(CLI::App& app, ExflowCLI* cli) = 0;
    virtual Result<void> execute() = 0;
};

} // namespace exflow::cli
