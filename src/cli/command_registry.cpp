#include <loregraph/cli/command_registry.h>
#include <loregraph/cli/loregraph_cli.h>

namespace loregraph::cli {

// External factory functions from command implementations (in this namespace)
std::unique_ptr<ICommand> createResolveCommand();
std::unique_ptr<ICommand> createExpandCommand();
std::unique_ptr<ICommand> createEdgesCommand();
std::unique_ptr<ICommand> createQueryCommand();
std::unique_ptr<ICommand> createBatchesCommand();
std::unique_ptr<ICommand> createApplyCommand();

void CommandRegistry::registerAllCommands(LoreGraphCLI* cli) {
    cli->registerCommand(CommandRegistry::createResolveCommand());
    cli->registerCommand(CommandRegistry::createExpandCommand());
    cli->registerCommand(CommandRegistry::createEdgesCommand());
    cli->registerCommand(CommandRegistry::createQueryCommand());
    cli->registerCommand(CommandRegistry::createBatchesCommand());
    cli->registerCommand(CommandRegistry::createApplyCommand());
}

std::unique_ptr<ICommand> CommandRegistry::createResolveCommand() {
    return ::loregraph::cli::createResolveCommand();
}

std::unique_ptr<ICommand> CommandRegistry::createExpandCommand() {
    return ::loregraph::cli::createExpandCommand();
}

std::unique_ptr<ICommand> CommandRegistry::createEdgesCommand() {
    return ::loregraph::cli::createEdgesCommand();
}

std::unique_ptr<ICommand> CommandRegistry::createQueryCommand() {
    return ::loregraph::cli::createQueryCommand();
}

std::unique_ptr<ICommand> CommandRegistry::createBatchesCommand() {
    return ::loregraph::cli::createBatchesCommand();
}

std::unique_ptr<ICommand> CommandRegistry::createApplyCommand() {
    return ::loregraph::cli::createApplyCommand();
}

} // namespace loregraph::cli
