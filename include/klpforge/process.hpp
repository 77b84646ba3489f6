#pragma once

#include <csignal>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace klpforge::process {

    using environment = std::vector<std::pair<std::string, std::string>>;

    struct process_spec {
        std::vector<std::string> args{};
        std::optional<std::filesystem::path> working_dir{};
        environment env{};
        std::filesystem::path stdout_path{};
        // empty: stderr shares the stdout file
        std::filesystem::path stderr_path{};
        bool append{true};
        // off for teardown commands, which must finish their work after an interrupt
        bool check_interrupt{true};
    };

    inline constexpr int segfault_exit_status = 128 + SIGSEGV;

    inline constexpr bool is_segfault(int exit_code) noexcept {
        return exit_code == segfault_exit_status;
    }

    // Runs the command to completion; returns its exit status, 128 + signal when killed.
    int run_process(const process_spec& spec);

    // Runs the command with stdout and stderr appended to the diagnostic log, preceded by
    // a "$ <command>" header line.
    int run_logged(
            const std::vector<std::string>& args,
            const std::filesystem::path& log_path,
            const std::optional<std::filesystem::path>& working_dir = std::nullopt,
            const environment& env = {},
            bool check_interrupt = true);

    // Runs the command with stdout written to `stdout_path`; stderr goes to the diagnostic log.
    int run_captured(
            const std::vector<std::string>& args,
            const std::filesystem::path& stdout_path,
            const std::filesystem::path& log_path,
            const std::optional<std::filesystem::path>& working_dir = std::nullopt);

    std::string command_line(const std::vector<std::string>& args);

    // Fails with a build_failure naming the tool. A core file in `search_dir` is
    // preserved in `core_dump_dir` and named in the message.
    [[noreturn]] void report_crash(
            std::string_view tool, const std::filesystem::path& search_dir, const std::filesystem::path& core_dump_dir);

    void install_interrupt_handlers();
    bool interrupt_requested() noexcept;
    void clear_interrupt() noexcept;
    void throw_if_interrupted(std::string_view stage);

}  // namespace klpforge::process
