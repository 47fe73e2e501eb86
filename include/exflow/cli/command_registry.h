#pragma once

#include <memory>
#include <exflow/cli/command.h>

namespace exflow::cli {

class ExflowCLI;

// Factories for the built-in subcommands: check, list and suggest.
class CommandRegistry {
public:
    static void registerAllCommands(ExflowCLI* cli);

    static std::unique_ptr<ICommand> createCheckCommand();
    static std::unique_ptr<ICommand> createListCommand();
    static std::unique_ptr<ICommand> createSuggestCommand();
};

} // namespace exflow::cli
