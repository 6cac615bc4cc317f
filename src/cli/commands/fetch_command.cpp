#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <courier/cli/command.h>
#include <courier/cli/courier_cli.h>
#include <courier/transfer/batch_orchestrator.hpp>
#include <courier/transfer/delivery.hpp>
#include <courier/transfer/download_manager.hpp>
#include <courier/transfer/status_report.hpp>

namespace courier::cli {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

std::atomic<bool> g_interrupted{false};

void onInterrupt(int) {
    g_interrupted.store(true);
}

// Installs SIGINT/SIGTERM for the lifetime of a fetch and restores the previous handlers.
class InterruptGuard {
public:
    InterruptGuard() {
        g_interrupted.store(false);
        struct sigaction sa;
        std::memset(&sa, 0, sizeof(sa));
        sa.sa_handler = onInterrupt;
        sigemptyset(&sa.sa_mask);
        sa.sa_flags = 0;
        if (sigaction(SIGINT, &sa, &prevInt_) == -1)
            spdlog::warn("Failed to install SIGINT handler");
        if (sigaction(SIGTERM, &sa, &prevTerm_) == -1)
            spdlog::warn("Failed to install SIGTERM handler");
    }
    ~InterruptGuard() {
        sigaction(SIGINT, &prevInt_, nullptr);
        sigaction(SIGTERM, &prevTerm_, nullptr);
    }
    InterruptGuard(const InterruptGuard&) = delete;
    InterruptGuard& operator=(const InterruptGuard&) = delete;

private:
    struct sigaction prevInt_ {};
    struct sigaction prevTerm_ {};
};

// Background thread: turns an interrupt into markAllStopped() and prints periodic status reports.
class StatusWatcher {
public:
    StatusWatcher(transfer::ProgressStore& store, bool report, std::chrono::milliseconds interval)
        : store_(store), report_(report), interval_(interval), thread_([this] { loop(); }) {}

    ~StatusWatcher() { stop(); }

    StatusWatcher(const StatusWatcher&) = delete;
    StatusWatcher& operator=(const StatusWatcher&) = delete;

    void stop() {
        done_.store(true);
        if (thread_.joinable())
            thread_.join();
    }

private:
    void loop() {
        using clock = std::chrono::steady_clock;
        bool stopRequested = false;
        auto nextReport = clock::now() + interval_;
        while (!done_.load()) {
            if (g_interrupted.load() && !stopRequested) {
                stopRequested = true;
                auto n = store_.markAllStopped();
                std::cerr << "\n[Interrupted: stopping " << n << " transfer(s)]\n";
            }
            if (report_ && clock::now() >= nextReport) {
                std::cerr << transfer::renderStatusReport(store_.listActive()) << std::flush;
                nextReport = clock::now() + interval_;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    }

    transfer::ProgressStore& store_;
    bool report_;
    std::chrono::milliseconds interval_;
    std::atomic<bool> done_{false};
    std::thread thread_;
};

json partsToJson(const std::vector<transfer::PartFile>& parts) {
    json arr = json::array();
    for (const auto& p : parts) {
        arr.push_back(
            {{"index", p.index}, {"path", p.path.string()}, {"size_bytes", p.sizeBytes}});
    }
    return arr;
}

json itemToJson(const transfer::BatchItem& item, const std::optional<std::string>& delivery) {
    json j = {{"url", item.url}, {"status", std::string(transfer::toString(item.status))}};
    if (item.result) {
        j["file_name"] = item.result->fileName;
        j["path"] = item.result->filePath.string();
        j["size_bytes"] = item.result->fileSize;
        j["sha256"] = item.result->sha256;
    }
    if (!item.parts.empty())
        j["parts"] = partsToJson(item.parts);
    if (item.error) {
        j["error"] = {{"code", std::string(transfer::errorCodeName(item.error->code))},
                      {"message", item.error->message}};
    }
    if (item.splitError)
        j["split_error"] = item.splitError->message;
    if (delivery)
        j["delivery"] = *delivery;
    return j;
}

} // namespace

class FetchCommand : public ICommand {
public:
    std::string getName() const override { return "fetch"; }

    std::string getDescription() const override {
        return "Download one or more URLs, splitting files above the size threshold.";
    }

    void registerCommand(CLI::App& app, CourierCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("fetch", getDescription());
        cmd->add_option("urls", urls_, "Source URL(s); several URLs are fetched concurrently.")
            ->required();
        cmd->add_option("--outbox", outbox_,
                        "Deliver finished files (or their parts) into this directory and remove "
                        "the local copies.");
        cmd->add_option("-j,--max-concurrent", maxConcurrent_,
                        "Limit concurrent transfers (default: config, 0 = one per URL).");
        cmd->add_flag("--progress", progress_, "Print a transfer status report to stderr.");
        cmd->add_option("--progress-interval", progressIntervalMs_,
                        "Status report interval in ms (default 2000).")
            ->check(CLI::Range(100, 60000));
        cmd->add_flag("--json", jsonOutput_, "Emit the result as JSON to stdout.");

        cmd->callback([this]() {
            auto result = execute();
            if (!result.ok()) {
                spdlog::error("fetch failed: {}", result.error().message);
                throw CLI::RuntimeError(1);
            }
        });

        cmd->footer(R"(Behavior:
  - Files larger than [transfer] split_threshold_bytes are split into
    <name>.part1..N of at most part_size_bytes each.
  - Ctrl+C stops every running transfer; partial files are removed.
  - Exit status is non-zero if any URL failed.)");
    }

    transfer::Expected<void> execute() override {
        auto init = cli_->ensureInitialized();
        if (!init.ok())
            return init;

        const auto& cfg = cli_->getConfig();
        auto& store = cli_->getProgressStore();

        auto batchOptions = cfg.batch;
        if (maxConcurrent_)
            batchOptions.maxConcurrentTransfers = *maxConcurrent_;

        auto manager = transfer::makeDownloadManager(store, cfg.download);
        transfer::BatchOrchestrator orchestrator(*manager, batchOptions);

        InterruptGuard guard;
        StatusWatcher watcher(store, progress_, std::chrono::milliseconds(progressIntervalMs_));

        transfer::BatchResult batch;
        std::mutex outMutex;
        if (urls_.size() == 1) {
            batch.items.push_back(orchestrator.fetchOne(urls_.front()));
            if (batch.items.front().succeeded()) {
                ++batch.successCount;
            } else {
                const auto& item = batch.items.front();
                batch.failures.push_back(
                    {item.url, item.error ? item.error->message : "unknown error"});
            }
        } else {
            batch = orchestrator.fetchAll(
                urls_, [this, &outMutex](std::size_t, const transfer::BatchItem& item) {
                    if (jsonOutput_)
                        return;
                    std::lock_guard<std::mutex> lk(outMutex);
                    printItemLine(item);
                });
        }

        watcher.stop();

        std::vector<std::optional<std::string>> deliveries(batch.items.size());
        if (outbox_) {
            transfer::DirectoryDeliverySink sink(*outbox_);
            transfer::DeliveryPipeline pipeline(sink);
            for (std::size_t i = 0; i < batch.items.size(); ++i) {
                const auto& item = batch.items[i];
                if (!item.succeeded())
                    continue;
                auto delivered = pipeline.deliver(item);
                deliveries[i] = delivered.ok()
                                    ? fmt::format("delivered {} file(s)", delivered.value())
                                    : "delivery failed: " + delivered.error().message;
            }
        }

        // Records of this run are no longer needed once reported
        store.clearTerminal();

        if (jsonOutput_) {
            json out = {{"total", batch.items.size()},
                        {"success_count", batch.successCount},
                        {"items", json::array()},
                        {"failures", json::array()}};
            for (std::size_t i = 0; i < batch.items.size(); ++i)
                out["items"].push_back(itemToJson(batch.items[i], deliveries[i]));
            for (const auto& f : batch.failures)
                out["failures"].push_back({{"url", f.url}, {"cause", f.cause}});
            std::cout << out.dump(2) << std::endl;
        } else {
            if (urls_.size() == 1)
                printItemLine(batch.items.front());
            for (std::size_t i = 0; i < batch.items.size(); ++i) {
                if (deliveries[i])
                    std::cout << "  " << batch.items[i].url << ": " << *deliveries[i] << "\n";
            }
            std::cout << fmt::format("\nDownloaded {} of {} URL(s)\n", batch.successCount,
                                     batch.items.size());
            if (!batch.failures.empty()) {
                std::cout << "Failed:\n";
                for (const auto& f : batch.failures)
                    std::cout << "  " << f.url << ": " << f.cause << "\n";
            }
        }

        if (!batch.failures.empty()) {
            return transfer::Error{transfer::ErrorCode::NetworkError,
                                   fmt::format("{} of {} URL(s) failed", batch.failures.size(),
                                               batch.items.size())};
        }
        return transfer::Expected<void>{};
    }

private:
    void printItemLine(const transfer::BatchItem& item) const {
        if (item.succeeded()) {
            std::cout << "[OK]   " << item.url << " -> " << item.result->filePath.string() << " ("
                      << transfer::formatBytes(item.result->fileSize) << ")\n";
            if (!item.parts.empty())
                std::cout << "       split into " << item.parts.size() << " part(s)\n";
            if (item.splitError)
                std::cout << "       split failed: " << item.splitError->message << "\n";
        } else {
            std::cout << "[" << (item.status == transfer::TransferStatus::Stopped ? "STOP" : "FAIL")
                      << "] " << item.url << ": "
                      << (item.error ? item.error->message : std::string("unknown error")) << "\n";
        }
    }

    CourierCLI* cli_ = nullptr;
    std::vector<std::string> urls_;
    std::optional<fs::path> outbox_;
    std::optional<std::size_t> maxConcurrent_;
    bool progress_ = false;
    int progressIntervalMs_ = 2000;
    bool jsonOutput_ = false;
};

// Factory function
std::unique_ptr<ICommand> createFetchCommand() {
    return std::make_unique<FetchCommand>();
}

} // namespace courier::cli
