#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <exception>
#include <ragcore/cli/rag_cli.h>

int main(int argc, char* argv[]) {
    try {
        // stdout carries JSON results; logs go to stderr. RagCLI adjusts the level from config.
        spdlog::set_default_logger(spdlog::stderr_color_mt("ragcore"));
        spdlog::set_level(spdlog::level::warn);
        spdlog::set_pattern("[%H:%M:%S] [%l] %v");

        ragcore::cli::RagCLI cli;
        return cli.run(argc, argv);
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
