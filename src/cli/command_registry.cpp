#include <hastat/cli/command_registry.h>
#include <hastat/cli/hastat_cli.h>

namespace hastat::cli {

// Factory functions from command implementations (in this namespace)
std::unique_ptr<ICommand> createStatusCommand();
std::unique_ptr<ICommand> createListCommand();
std::unique_ptr<ICommand> createExportCommand();
std::unique_ptr<ICommand> createImportCommand();

void CommandRegistry::registerAllCommands(HastatCLI* cli) {
    cli->registerCommand(CommandRegistry::createStatusCommand());
    cli->registerCommand(CommandRegistry::createListCommand());
    cli->registerCommand(CommandRegistry::createExportCommand());
    cli->registerCommand(CommandRegistry::createImportCommand());
}

std::unique_ptr<ICommand> CommandRegistry::createStatusCommand() {
    return ::hastat::cli::createStatusCommand();
}

std::unique_ptr<ICommand> CommandRegistry::createListCommand() {
    return ::hastat::cli::createListCommand();
}

std::unique_ptr<ICommand> CommandRegistry::createExportCommand() {
    return ::hastat::cli::createExportCommand();
}

std::unique_ptr<ICommand> CommandRegistry::createImportCommand() {
    return ::hastat::cli::createImportCommand();
}

} // namespace hastat::cli
