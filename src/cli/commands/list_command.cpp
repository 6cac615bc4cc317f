#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <iostream>
#include <memory>
#include <string>
#include <courier/cli/command.h>
#include <courier/cli/courier_cli.h>
#include <courier/transfer/status_report.hpp>
#include <courier/transfer/workspace.hpp>

namespace courier::cli {

using json = nlohmann::json;

class ListCommand : public ICommand {
public:
    std::string getName() const override { return "list"; }

    std::string getDescription() const override {
        return "List files in the downloads directory.";
    }

    void registerCommand(CLI::App& app, CourierCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("list", getDescription());
        cmd->add_flag("--json", jsonOutput_, "Emit JSON to stdout.");

        cmd->callback([this]() {
            auto result = execute();
            if (!result.ok()) {
                spdlog::error("list failed: {}", result.error().message);
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
        auto entries = workspace.listDownloads();
        if (!entries.ok())
            return entries.error();

        if (jsonOutput_) {
            json arr = json::array();
            for (const auto& e : entries.value()) {
                arr.push_back({{"name", e.path.filename().string()},
                               {"path", e.path.string()},
                               {"size_bytes", e.sizeBytes}});
            }
            std::cout << arr.dump(2) << std::endl;
            return transfer::Expected<void>{};
        }

        if (entries.value().empty()) {
            std::cout << "No downloads in " << workspace.downloadsDir().string() << "\n";
            return transfer::Expected<void>{};
        }
        for (const auto& e : entries.value()) {
            std::cout << transfer::formatBytes(e.sizeBytes) << "\t"
                      << e.path.filename().string() << "\n";
        }
        return transfer::Expected<void>{};
    }

private:
    CourierCLI* cli_ = nullptr;
    bool jsonOutput_ = false;
};

// Factory function
std::unique_ptr<ICommand> createListCommand() {
    return std::make_unique<ListCommand>();
}

} // namespace courier::cli
