#include <spdlog/spdlog.h>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <courier/cli/command.h>
#include <courier/cli/courier_cli.h>
#include <courier/transfer/file_splitter.hpp>
#include <courier/transfer/status_report.hpp>

namespace courier::cli {

namespace fs = std::filesystem;

class SplitCommand : public ICommand {
public:
    std::string getName() const override { return "split"; }

    std::string getDescription() const override {
        return "Split a local file into <name>.part1..N of bounded size.";
    }

    void registerCommand(CLI::App& app, CourierCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("split", getDescription());
        cmd->add_option("file", source_, "File to split (left in place).")
            ->required()
            ->check(CLI::ExistingFile);
        cmd->add_option("--part-size", partSize_,
                        "Maximum bytes per part (default: [transfer] part_size_bytes).")
            ->check(CLI::PositiveNumber);
        cmd->add_option("-o,--out-dir", outDir_,
                        "Directory for the parts (default: [transfer] splits_dir).");

        cmd->callback([this]() {
            auto result = execute();
            if (!result.ok()) {
                spdlog::error("split failed: {}", result.error().message);
                throw CLI::RuntimeError(1);
            }
        });
    }

    transfer::Expected<void> execute() override {
        auto init = cli_->ensureInitialized();
        if (!init.ok())
            return init;

        const auto& cfg = cli_->getConfig();
        const auto partSize = partSize_.value_or(cfg.batch.partSizeBytes);
        const auto dir = outDir_.value_or(cfg.batch.splitsDir);

        auto parts = transfer::splitFile(source_, partSize, dir);
        if (!parts.ok())
            return parts.error();

        for (const auto& p : parts.value()) {
            std::cout << p.path.string() << "  " << transfer::formatBytes(p.sizeBytes) << "\n";
        }
        std::cout << parts.value().size() << " part(s)\n";
        return transfer::Expected<void>{};
    }

private:
    CourierCLI* cli_ = nullptr;
    fs::path source_;
    std::optional<std::uint64_t> partSize_;
    std::optional<fs::path> outDir_;
};

// Factory function
std::unique_ptr<ICommand> createSplitCommand() {
    return std::make_unique<SplitCommand>();
}

} // namespace courier::cli
