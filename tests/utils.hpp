#pragma once

#include "klpforge.hpp"

#include <catch2/catch_test_macros.hpp>

#include "../src/internal/platform.hpp"

extern "C" {
#include <signal.h>
#include <unistd.h>
}

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace klpforge::test {
    namespace fs = std::filesystem;
    using namespace std::string_view_literals;

    struct temp_dir {
        fs::path path{};

        explicit temp_dir(std::string_view prefix) {
            auto now = std::chrono::system_clock::now().time_since_epoch().count();
            std::ostringstream dir_name{};
            dir_name << prefix << "_" << static_cast<long>(::getpid()) << "_" << now;
            path = fs::temp_directory_path() / dir_name.str();
            fs::create_directories(path);
        }

        ~temp_dir() {
            std::error_code ec{};
            fs::remove_all(path, ec);
        }
    };

    // Installs the pipeline's interrupt handlers for one test; the previous dispositions and a
    // clear interrupt flag are restored afterwards.
    struct interrupt_handlers {
        static constexpr int signals[]{SIGINT, SIGTERM, SIGHUP};
        struct sigaction saved[3]{};

        interrupt_handlers() {
            for (size_t i = 0U; i < 3U; ++i) {
                ::sigaction(signals[i], nullptr, &saved[i]);
            }
            process::install_interrupt_handlers();
        }

        ~interrupt_handlers() {
            for (size_t i = 0U; i < 3U; ++i) {
                ::sigaction(signals[i], &saved[i], nullptr);
            }
            process::clear_interrupt();
        }

        interrupt_handlers(const interrupt_handlers&) = delete;
        interrupt_handlers& operator=(const interrupt_handlers&) = delete;
    };

    inline void write_file(const fs::path& path, std::string_view text) {
        if (path.has_parent_path()) {
            fs::create_directories(path.parent_path());
        }
        std::ofstream out{path, std::ios::binary | std::ios::trunc};
        REQUIRE(out.good());
        out << text;
        REQUIRE(out.good());
    }

    inline std::string read_file(const fs::path& path) {
        std::ifstream in{path, std::ios::binary};
        REQUIRE(in.good());
        std::ostringstream ss{};
        ss << in.rdbuf();
        return ss.str();
    }

    inline std::vector<char*> to_argv(std::vector<std::string>& args) {
        std::vector<char*> argv{};
        argv.reserve(args.size());
        for (auto& arg : args) {
            argv.push_back(arg.data());
        }
        return argv;
    }

    // Runs `fn` and returns the pipeline_error it throws; fails the test when nothing is thrown.
    template <typename F>
    pipeline_error capture_error(F&& fn) {
        try {
            fn();
        } catch (const pipeline_error& e) {
            return e;
        }
        FAIL("expected a pipeline_error");
        return pipeline_error{error_kind::io, "unreachable"};
    }

}  // namespace klpforge::test
