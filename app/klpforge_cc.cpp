#include "klpforge/error.hpp"
#include "klpforge/wrapper.hpp"

#include "../src/internal/platform.hpp"

extern "C" {
#include <unistd.h>
}

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "usage: klpforge-cc <tool> [args...]\n";
        return 2;
    }

    if (const char* tempdir = std::getenv(klpforge::internal::platform::cc_tempdir_env.data());
        tempdir != nullptr && *tempdir != '\0') {
        std::vector<std::string> args(argv + 2, argv + argc);
        try {
            klpforge::wrapper::record_invocation(
                    klpforge::wrapper::classify_tool(argv[1]), args, fs::path{tempdir}, fs::current_path());
        } catch (const klpforge::pipeline_error& e) {
            std::cerr << "klpforge-cc: error: " << e.what() << '\n';
            return 1;
        } catch (const fs::filesystem_error& e) {
            std::cerr << "klpforge-cc: error: " << e.what() << '\n';
            return 1;
        }
    }

    ::execvp(argv[1], argv + 1);
    std::cerr << "klpforge-cc: failed to exec " << argv[1] << ": " << std::strerror(errno) << '\n';
    return 127;
}
