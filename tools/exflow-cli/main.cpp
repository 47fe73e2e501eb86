#include <spdlog/spdlog.h>
#include <exflow/cli/exflow_cli.h>

int main(int argc, char* argv[]) {
    try {
        // Set up logging with conservative default; ExflowCLI::run() adjusts based on flags
        spdlog::set_level(spdlog::level::warn);
        spdlog::set_pattern("[%H:%M:%S] [%l] %v");

        exflow::cli::ExflowCLI cli;
        return cli.run(argc, argv);

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
