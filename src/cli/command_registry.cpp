#include <exflow/cli/command_registry.h>
#include <exflow/cli/exflow_cli.h>

namespace exflow::cli {

// External factory functions from command implementations (in this namespace)
std::unique_ptr<ICommand> createCheckCommand();
std::unique_ptr<ICommand> createListCommand();
std::unique_ptr<ICommand> createSuggestCommand();

void CommandRegistry::registerAllCommands(ExflowCLI* cli) {
    cli->registerCommand(CommandRegistry::createCheckCommand());
    cli->registerCommand(CommandRegistry::createListCommand());
    cli->registerCommand(CommandRegistry::createSuggestCommand());
}

std::unique_ptr<ICommand> CommandRegistry::createCheckCommand() {
    return ::exflow::cli::createCheckCommand();
}

std::unique_ptr<ICommand> CommandRegistry::createListCommand() {
    return ::exflow::cli::createListCommand();
}

std::unique_ptr<ICommand> CommandRegistry::createSuggestCommand() {
    return ::exflow::cli::createSuggestCommand();
}

} // namespace exflow::cli
