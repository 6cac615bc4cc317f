#pragma once

#include <string>
#include <CLI/CLI.hpp>
#include <courier/transfer/transfer.hpp>

namespace courier::cli {

// Forward declarations
class CourierCLI;

/**
 * Base interface for CLI commands
 */
class ICommand {
public:
    virtual ~ICommand() = default;

    /**
     * Get the command name (e.g., "fetch", "split")
     */
    virtual std::string getName() const = 0;

    /**
     * Get the command description for help text
     */
    virtual std::string getDescription() const = 0;

    /**
     * Register this command with the CLI11 app
     */
    virtual void registerCommand(CLI::App& app, CourierCLI* cli) = 0;

    /**
     * Execute the command
     */
    virtual transfer::Expected<void> execute() = 0;
};

} // namespace courier::cli
