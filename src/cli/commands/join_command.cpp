#include <spdlog/spdlog.h>
#include <charconv>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <vector>
#include <courier/cli/command.h>
#include <courier/cli/courier_cli.h>
#include <courier/transfer/file_splitter.hpp>
#include <courier/transfer/status_report.hpp>

namespace courier::cli {

namespace fs = std::filesystem;

namespace {

// "movie.mkv.part12" -> 12
std::optional<std::size_t> partIndexFromName(const std::string& name) {
    const auto pos = name.rfind(".part");
    if (pos == std::string::npos)
        return std::nullopt;
    const auto digits = name.substr(pos + 5);
    std::size_t index = 0;
    auto res = std::from_chars(digits.data(), digits.data() + digits.size(), index);
    if (digits.empty() || res.ec != std::errc() || res.ptr != digits.data() + digits.size())
        return std::nullopt;
    return index;
}

} // namespace

class JoinCommand : public ICommand {
public:
    std::string getName() const override { return "join"; }

    std::string getDescription() const override {
        return "Reassemble <name>.partN files into one file and print its SHA-256.";
    }

    void registerCommand(CLI::App& app, CourierCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("join", getDescription());
        cmd->add_option("output", output_, "Destination file (overwritten).")->required();
        cmd->add_option("parts", partPaths_, "Part files, in any order.")
            ->required()
            ->check(CLI::ExistingFile);

        cmd->callback([this]() {
            auto result = execute();
            if (!result.ok()) {
                spdlog::error("join failed: {}", result.error().message);
                throw CLI::RuntimeError(1);
            }
        });
    }

    transfer::Expected<void> execute() override {
        auto init = cli_->ensureInitialized();
        if (!init.ok())
            return init;

        std::vector<transfer::PartFile> parts;
        parts.reserve(partPaths_.size());
        for (const auto& path : partPaths_) {
            auto index = partIndexFromName(path.filename().string());
            if (!index) {
                return transfer::Error{transfer::ErrorCode::InvalidArgument,
                                       "Not a part file (expected <name>.partN): " +
                                           path.string()};
            }
            std::error_code ec;
            auto size = fs::file_size(path, ec);
            parts.push_back(transfer::PartFile{*index, path, ec ? 0 : size});
        }

        auto joined = transfer::joinParts(parts, output_);
        if (!joined.ok())
            return joined.error();

        auto digest = transfer::sha256File(output_);
        if (!digest.ok())
            return digest.error();

        std::cout << output_.string() << "  " << transfer::formatBytes(joined.value())
                  << "  sha256:" << digest.value() << "\n";
        return transfer::Expected<void>{};
    }

private:
    CourierCLI* cli_ = nullptr;
    fs::path output_;
    std::vector<fs::path> partPaths_;
};

// Factory function
std::unique_ptr<ICommand> createJoinCommand() {
    return std::make_unique<JoinCommand>();
}

} // namespace courier::cli
