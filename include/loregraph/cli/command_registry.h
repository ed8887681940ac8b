#pragma once

#include <loregraph/cli/command.h>

#include <memory>

namespace loregraph::cli {

class LoreGraphCLI;

/**
 * Registry of all available CLI commands
 */
class CommandRegistry {
public:
    /**
     * Register all built-in commands with the CLI
     */
    static void registerAllCommands(LoreGraphCLI* cli);

    static std::unique_ptr<ICommand> createResolveCommand();
    static std::unique_ptr<ICommand> createExpandCommand();
    static std::unique_ptr<ICommand> createEdgesCommand();
    static std::unique_ptr<ICommand> createQueryCommand();
    static std::unique_ptr<ICommand> createBatchesCommand();
    static std::unique_ptr<ICommand> createApplyCommand();
};

} // namespace loregraph::cli
