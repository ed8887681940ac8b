#include <cstdio>

#include <spdlog/spdlog.h>
#include <loregraph/cli/loregraph_cli.h>

int main(int argc, char* argv[]) {
    try {
        // Conservative default; LoreGraphCLI::run() adjusts based on flags
        spdlog::set_level(spdlog::level::warn);
        spdlog::set_pattern("[%H:%M:%S] [%l] %v");

        loregraph::cli::LoreGraphCLI cli;
        return cli.run(argc, argv);
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    } catch (...) {
        spdlog::error("Unknown fatal error");
        return 1;
    }
}
