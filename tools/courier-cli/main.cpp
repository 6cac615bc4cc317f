#include <spdlog/spdlog.h>
#include <courier/cli/courier_cli.h>

int main(int argc, char* argv[]) {
    try {
        // Set up logging with conservative default; CourierCLI adjusts based on flags and config
        spdlog::set_level(spdlog::level::warn);
        spdlog::set_pattern("[%H:%M:%S] [%l] %v");

        courier::cli::CourierCLI cli;
        return cli.run(argc, argv);

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
