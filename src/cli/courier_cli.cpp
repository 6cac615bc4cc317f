#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <courier/cli/command_registry.h>
#include <courier/cli/courier_cli.h>
#include <courier/config/config_helpers.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace courier::cli {

namespace {

std::optional<spdlog::level::level_enum> parseLevel(std::string_view s) {
    std::string v;
    v.reserve(s.size());
    for (unsigned char c : s)
        v.push_back(static_cast<char>(std::tolower(c)));
    if (v == "trace")
        return spdlog::level::trace;
    if (v == "debug")
        return spdlog::level::debug;
    if (v == "info")
        return spdlog::level::info;
    if (v == "warn" || v == "warning")
        return spdlog::level::warn;
    if (v == "error" || v == "err")
        return spdlog::level::err;
    if (v == "critical" || v == "crit")
        return spdlog::level::critical;
    if (v == "off" || v == "none" || v == "silent")
        return spdlog::level::off;
    return std::nullopt;
}

} // namespace

CourierCLI::CourierCLI() {
    // Set a conservative default; finalized once config is loaded
    spdlog::set_level(spdlog::level::warn);

    app_ = std::make_unique<CLI::App>("courier - fetch, track, split and deliver remote files",
                                      "courier");
    app_->set_version_flag("--version", "courier 1.0.0");
    app_->require_subcommand(1);

    app_->add_option("--config", configPath_,
                     "Config file (default: $COURIER_CONFIG or ~/.config/courier/config.toml)");
    app_->add_option("--log-level", logLevel_,
                     "Log level: trace|debug|info|warn|error|critical|off (overrides config)");
    app_->add_flag("-v,--verbose", verbose_, "Shorthand for --log-level debug");

    CommandRegistry::registerAllCommands(this);
}

CourierCLI::~CourierCLI() = default;

void CourierCLI::registerCommand(std::unique_ptr<ICommand> command) {
    command->registerCommand(*app_, this);
    commands_.push_back(std::move(command));
}

int CourierCLI::run(int argc, char* argv[]) {
    try {
        app_->parse(argc, argv);
        return 0;
    } catch (const CLI::ParseError& e) {
        return app_->exit(e);
    } catch (const std::exception& e) {
        // Always provide a user-facing error even if logging is off
        std::cerr << "[FAIL] Unexpected error: " << e.what() << "\n";
        spdlog::error("Unexpected error: {}", e.what());
        return 1;
    }
}

transfer::Expected<void> CourierCLI::ensureInitialized() {
    if (initialized_)
        return transfer::Expected<void>{};

    const auto configPath = config::get_config_path(configPath_);
    if (!configPath_.empty() && !std::filesystem::exists(configPath)) {
        return transfer::Error{transfer::ErrorCode::InvalidArgument,
                               "Config file not found: " + configPath.string()};
    }

    auto loaded = config::loadTransferConfig(configPath);
    if (!loaded.ok())
        return loaded.error();
    config_ = loaded.value();

    auto valid = config::validate(config_);
    if (!valid.ok())
        return valid.error();

    configureLogging();
    spdlog::debug("Config: {} (data dir {})", configPath.string(), config_.dataDir.string());
    initialized_ = true;
    return transfer::Expected<void>{};
}

void CourierCLI::configureLogging() {
    if (!config_.logging.file.empty()) {
        try {
            std::filesystem::create_directories(config_.logging.file.parent_path());
            const size_t max_size = 10 * 1024 * 1024; // 10MB per file
            const size_t max_files = 3;
            auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            auto rotating_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config_.logging.file.string(), max_size, max_files);
            auto logger = std::make_shared<spdlog::logger>(
                "courier", spdlog::sinks_init_list{console_sink, rotating_sink});
            spdlog::set_default_logger(logger);
        } catch (const std::exception& e) {
            std::cerr << "[WARN] Cannot open log file " << config_.logging.file.string() << ": "
                      << e.what() << "\n";
        }
    }
    spdlog::set_pattern("[%H:%M:%S] [%l] %v");

    std::string level = config_.logging.level;
    if (const char* envLvl = std::getenv("COURIER_LOG_LEVEL"); envLvl && *envLvl)
        level = envLvl;
    if (!logLevel_.empty())
        level = logLevel_;
    else if (verbose_)
        level = "debug";

    if (auto lvl = parseLevel(level)) {
        spdlog::set_level(*lvl);
    } else {
        spdlog::warn("Unknown log level '{}', keeping 'warn'", level);
        spdlog::set_level(spdlog::level::warn);
    }
}

} // namespace courier::cli
