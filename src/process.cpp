#include "klpforge/process.hpp"

#include "klpforge/error.hpp"
#include "klpforge/format.hpp"

#include "internal/fs.hpp"

extern "C" {
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>
}

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;
using namespace klpforge::literals;

namespace klpforge::process {

    namespace detail {

        static volatile std::sig_atomic_t interrupt_signal = 0;

        static void on_interrupt(int signo) {
            interrupt_signal = signo;
        }

        static int open_output_file(const fs::path& path, bool append) {
            auto flags = O_CREAT | O_WRONLY | (append ? O_APPEND : O_TRUNC);
            auto fd = ::open(path.c_str(), flags, 0644);
            if (fd < 0) {
                throw pipeline_error{error_kind::io, "failed to open file for write: {}"_format(path.string())};
            }
            return fd;
        }

        static bool needs_quoting(std::string_view arg) {
            return arg.empty() || arg.find_first_of(" \t\"'$\\") != std::string_view::npos;
        }

    }  // namespace detail

    std::string command_line(const std::vector<std::string>& args) {
        std::ostringstream out{};
        for (size_t i = 0U; i < args.size(); ++i) {
            if (i > 0U) {
                out << ' ';
            }
            if (detail::needs_quoting(args[i])) {
                out << '\'' << args[i] << '\'';
            }
            else {
                out << args[i];
            }
        }
        return out.str();
    }

    int run_process(const process_spec& spec) {
        if (spec.args.empty()) {
            throw pipeline_error{error_kind::configuration, "empty command"};
        }

        auto stdout_fd = detail::open_output_file(spec.stdout_path, spec.append);
        auto stderr_fd = -1;
        if (!spec.stderr_path.empty()) {
            try {
                stderr_fd = detail::open_output_file(spec.stderr_path, spec.append);
            } catch (...) {
                ::close(stdout_fd);
                throw;
            }
        }

        auto pid = ::fork();
        if (pid < 0) {
            ::close(stdout_fd);
            if (stderr_fd >= 0) {
                ::close(stderr_fd);
            }
            throw pipeline_error{error_kind::io, "fork failed"};
        }

        if (pid == 0) {
            if (::dup2(stdout_fd, STDOUT_FILENO) < 0) {
                _exit(127);
            }
            if (::dup2(stderr_fd >= 0 ? stderr_fd : stdout_fd, STDERR_FILENO) < 0) {
                _exit(127);
            }

            ::close(stdout_fd);
            if (stderr_fd >= 0) {
                ::close(stderr_fd);
            }

            if (spec.working_dir && ::chdir(spec.working_dir->c_str()) != 0) {
                _exit(127);
            }
            for (const auto& [key, value] : spec.env) {
                ::setenv(key.c_str(), value.c_str(), 1);
            }

            std::vector<char*> argv{};
            argv.reserve(spec.args.size() + 1U);
            for (const auto& arg : spec.args) {
                argv.push_back(const_cast<char*>(arg.c_str()));
            }
            argv.push_back(nullptr);

            ::execvp(argv[0], argv.data());
            _exit(127);
        }

        ::close(stdout_fd);
        if (stderr_fd >= 0) {
            ::close(stderr_fd);
        }

        // the child shares our process group, so an interrupt reaches it too; keep
        // waiting until it is gone
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0) {
            if (errno != EINTR) {
                throw pipeline_error{error_kind::io, "waitpid failed"};
            }
        }

        if (spec.check_interrupt) {
            throw_if_interrupted(spec.args.front());
        }

        if (WIFEXITED(status)) {
            return WEXITSTATUS(status);
        }
        if (WIFSIGNALED(status)) {
            return 128 + WTERMSIG(status);
        }
        return 1;
    }

    int run_logged(
            const std::vector<std::string>& args,
            const fs::path& log_path,
            const std::optional<fs::path>& working_dir,
            const environment& env,
            bool check_interrupt) {
        internal::files::append_text_file(log_path, "$ {}\n"_format(command_line(args)));
        return run_process(process_spec{
                .args = args,
                .working_dir = working_dir,
                .env = env,
                .stdout_path = log_path,
                .append = true,
                .check_interrupt = check_interrupt});
    }

    int run_captured(
            const std::vector<std::string>& args,
            const fs::path& stdout_path,
            const fs::path& log_path,
            const std::optional<fs::path>& working_dir) {
        internal::files::append_text_file(log_path, "$ {} > {}\n"_format(command_line(args), stdout_path.string()));
        return run_process(process_spec{
                .args = args,
                .working_dir = working_dir,
                .stdout_path = stdout_path,
                .stderr_path = log_path,
                .append = false});
    }

    void report_crash(std::string_view tool, const fs::path& search_dir, const fs::path& core_dump_dir) {
        std::vector<fs::path> cores{};
        std::error_code ec{};
        for (const auto& entry : fs::directory_iterator{search_dir, ec}) {
            if (entry.is_regular_file(ec) && entry.path().filename().string().starts_with("core")) {
                cores.push_back(entry.path());
            }
        }
        std::ranges::sort(cores);

        if (cores.empty()) {
            throw pipeline_error{
                    error_kind::build_failure,
                    "{} SIGSEGV: no core file found, run 'ulimit -c unlimited' and try to recreate"_format(tool),
                    {std::string{tool}}};
        }

        auto preserved = core_dump_dir / cores.front().filename();
        internal::files::copy_file(cores.front(), preserved);
        throw pipeline_error{
                error_kind::build_failure,
                "{} SIGSEGV: core file at {}"_format(tool, preserved.string()),
                {std::string{tool}}};
    }

    void install_interrupt_handlers() {
        struct sigaction action{};
        action.sa_handler = detail::on_interrupt;
        sigemptyset(&action.sa_mask);
        action.sa_flags = 0;
        for (auto signo : {SIGINT, SIGTERM, SIGHUP}) {
            if (::sigaction(signo, &action, nullptr) != 0) {
                throw pipeline_error{error_kind::io, "failed to install handler for signal {}"_format(signo)};
            }
        }
    }

    bool interrupt_requested() noexcept {
        return detail::interrupt_signal != 0;
    }

    void clear_interrupt() noexcept {
        detail::interrupt_signal = 0;
    }

    void throw_if_interrupted(std::string_view stage) {
        if (interrupt_requested()) {
            throw pipeline_error{
                    error_kind::interrupted,
                    "interrupted by signal {} during {}"_format(static_cast<int>(detail::interrupt_signal), stage)};
        }
    }

}  // namespace klpforge::process
