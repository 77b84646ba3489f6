#include "klpforge.hpp"

#include <exception>
#include <filesystem>
#include <iostream>
#include <system_error>

int main(int argc, char** argv) {
    klpforge::build_config cfg{};
    try {
        if (auto cli_result = klpforge::cli::parse_cli(argc, argv, cfg)) {
            return *cli_result;
        }
    } catch (std::exception& e) {
        std::cerr << "klpforge: error: " << e.what() << '\n';
        return 2;
    }

    klpforge::system_toolchain tools{};
    klpforge::pipeline pipeline{cfg, tools, std::cout};
    try {
        klpforge::process::install_interrupt_handlers();
        auto result = pipeline.run();
        if (!cfg.quiet) {
            std::cout << result.module_path.string() << '\n';
        }
        return 0;
    } catch (const klpforge::pipeline_error& e) {
        std::cerr << "klpforge: error: " << e.what() << '\n';
        std::error_code ec{};
        if (std::filesystem::exists(pipeline.log_path(), ec)) {
            std::cerr << "see " << pipeline.log_path().string() << '\n';
        }
        return klpforge::exit_status_for(e.kind());
    } catch (std::exception& e) {
        std::cerr << "klpforge: error: " << e.what() << '\n';
        return 1;
    }
}
