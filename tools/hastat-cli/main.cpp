#include <exception>

#include <spdlog/spdlog.h>
#include <hastat/cli/hastat_cli.h>

int main(int argc, char* argv[]) {
    try {
        // Conservative default; HastatCLI::run() adjusts based on flags and config
        spdlog::set_level(spdlog::level::warn);
        spdlog::set_pattern("[%H:%M:%S] [%l] %v");

        hastat::cli::HastatCLI cli;
        return cli.run(argc, argv);

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
