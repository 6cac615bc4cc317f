#include <courier/cli/command_registry.h>
#include <courier/cli/courier_cli.h>

namespace courier::cli {

// External factory functions from command implementations (in this namespace)
std::unique_ptr<ICommand> createFetchCommand();
std::unique_ptr<ICommand> createSplitCommand();
std::unique_ptr<ICommand> createJoinCommand();
std::unique_ptr<ICommand> createListCommand();
std::unique_ptr<ICommand> createPurgeCommand();

void CommandRegistry::registerAllCommands(CourierCLI* cli) {
    cli->registerCommand(createFetchCommand());
    cli->registerCommand(createSplitCommand());
    cli->registerCommand(createJoinCommand());
    cli->registerCommand(createListCommand());
    cli->registerCommand(createPurgeCommand());
}

} // namespace courier::cli
