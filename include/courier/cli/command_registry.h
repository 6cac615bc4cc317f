#pragma once

#include <memory>
#include <courier/cli/command.h>

namespace courier::cli {

// Forward declaration
class CourierCLI;

/**
 * Registry of all available CLI commands
 */
class CommandRegistry {
public:
    /**
     * Register all built-in commands with the CLI
     */
    static void registerAllCommands(CourierCLI* cli);
};

} // namespace courier::cli
