#pragma once

#include <memory>
#include <string>
#include <CLI/CLI.hpp>
#include <hastat/core/types.h>

namespace hastat::cli {

class HastatCLI;

/**
 * Base interface for CLI commands
 */
class ICommand {
public:
    virtual ~ICommand() = default;

    /**
     * Get the command name (e.g., "status", "import")
     */
    virtual std::string getName() const = 0;

    /**
     * Get the command description for help text
     */
    virtual std::string getDescription() const = 0;

    /**
     * Register this command with the CLI11 app
     */
    virtual void registerCommand(CLI::App& app, HastatCLI* cli) = 0;

    /**
     * Execute the command; runs after global options and logging are settled
     */
    virtual Result<void> execute() = 0;
};

} // namespace hastat::cli
