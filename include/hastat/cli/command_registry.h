#pragma once

#include <memory>
#include <hastat/cli/command.h>

namespace hastat::cli {

class HastatCLI;

/**
 * Registry of all available CLI commands
 */
class CommandRegistry {
public:
    /**
     * Register all built-in commands with the CLI
     */
    static void registerAllCommands(HastatCLI* cli);

    static std::unique_ptr<ICommand> createStatusCommand();
    static std::unique_ptr<ICommand> createListCommand();
    static std::unique_ptr<ICommand> createExportCommand();
    static std::unique_ptr<ICommand> createImportCommand();
};

} // namespace hastat::cli
