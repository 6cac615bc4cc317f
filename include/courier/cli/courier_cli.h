#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <CLI/CLI.hpp>
#include <courier/cli/command.h>
#include <courier/config/transfer_config.h>
#include <courier/transfer/progress_store.hpp>

namespace courier::cli {

/**
 * Main CLI application class
 */
class CourierCLI {
public:
    CourierCLI();
    ~CourierCLI();

    /**
     * Run the CLI with given arguments
     */
    int run(int argc, char* argv[]);

    /**
     * Load config and apply logging settings once. Commands call this before doing work.
     */
    transfer::Expected<void> ensureInitialized();

    /**
     * Effective configuration (valid after ensureInitialized()).
     */
    const config::TransferConfig& getConfig() const { return config_; }

    /**
     * Process-wide progress registry shared by every transfer started from this CLI.
     */
    transfer::ProgressStore& getProgressStore() { return store_; }

    /**
     * Register a command with the CLI
     */
    void registerCommand(std::unique_ptr<ICommand> command);

private:
    void configureLogging();

    std::unique_ptr<CLI::App> app_;
    std::vector<std::unique_ptr<ICommand>> commands_;

    std::string configPath_;
    std::string logLevel_;
    bool verbose_ = false;

    bool initialized_ = false;
    config::TransferConfig config_;
    transfer::ProgressStore store_;
};

} // namespace courier::cli
