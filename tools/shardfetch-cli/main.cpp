#include <exception>

#include <shardfetch/cli/fetch_cli.h>
#include <spdlog/spdlog.h>

int main(int argc, char* argv[]) {
    try {
        // Conservative default; runFetchCli() adjusts based on flags/env/config
        spdlog::set_level(spdlog::level::warn);
        spdlog::set_pattern("[%H:%M:%S] [%l] %v");

        return shardfetch::cli::runFetchCli(argc, argv);
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    } catch (...) {
        spdlog::error("Unknown fatal error");
        return 1;
    }
}
