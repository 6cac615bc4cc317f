#include <spdlog/spdlog.h>
#include <iostream>
#include <memory>
#include <string>
#include <courier/cli/command.h>
#include <courier/cli/courier_cli.h>
#include <courier/transfer/workspace.hpp>

namespace courier::cli {

class PurgeCommand : public ICommand {
public:
    std::string getName() const override { return "purge"; }

    std::string getDescription() const override {
        return "Delete every file in the downloads and splits directories.";
    }

    void registerCommand(CLI::App& app, CourierCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("purge", getDescription());
        cmd->add_flag("-y,--yes", confirmed_, "Do not ask for confirmation.");

        cmd->callback([this]() {
            auto result = execute();
            if (!result.ok()) {
                spdlog::error("purge failed: {}", result.error().message);
                throw CLI::RuntimeError(1);
            }
        });
    }

    transfer::Expected<void> execute() override {
        auto init = cli_->ensureInitialized();
        if (!init.ok())
            return init;

        const auto& cfg = cli_->getConfig();
        transfer::Workspace workspace(cfg.download.downloadsDir, cfg.batch.splitsDir);

        if (!confirmed_) {
            std::cout << "Remove all files in " << workspace.downloadsDir().string() << " and "
                      << workspace.splitsDir().string() << "? [y/N] " << std::flush;
            std::string answer;
            std::getline(std::cin, answer);
            if (answer != "y" && answer != "Y" && answer != "yes") {
                std::cout << "Aborted\n";
                return transfer::Expected<void>{};
            }
        }

        auto report = workspace.purge();
        if (!report.ok())
            return report.error();

        std::cout << "Removed " << report.value().downloadsRemoved << " download(s) and "
                  << report.value().splitsRemoved << " part file(s)\n";
        return transfer::Expected<void>{};
    }

private:
    CourierCLI* cli_ = nullptr;
    bool confirmed_ = false;
};

// Factory function
std::unique_ptr<ICommand> createPurgeCommand() {
    return std::make_unique<PurgeCommand>();
}

} // namespace courier::cli
