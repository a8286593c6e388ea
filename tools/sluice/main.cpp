#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <sluice/cli/download_runner.h>
#include <sluice/cli/sluice_cli.h>

int main(int argc, char* argv[]) {
    try {
        // stdout is reserved for results; level is refined by SluiceCLI::loadConfig
        spdlog::set_default_logger(spdlog::stderr_color_mt("sluice"));
        spdlog::set_level(spdlog::level::warn);
        spdlog::set_pattern("[%H:%M:%S] [%l] %v");

        sluice::cli::SluiceCLI cli;
        return cli.run(argc, argv);

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return sluice::cli::kExitFatal;
    }
}
