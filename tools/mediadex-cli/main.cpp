#include <spdlog/spdlog.h>
#include <mediadex/cli/mediadex_cli.h>

int main(int argc, char* argv[]) {
    try {
        // Conservative default; configureLogging() applies the configured level
        spdlog::set_level(spdlog::level::warn);
        spdlog::set_pattern("[%H:%M:%S] [%l] %v");

        mediadex::cli::MediadexCLI cli;
        return cli.run(argc, argv);
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
