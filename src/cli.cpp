#include "klpforge/cli.hpp"

#include "klpforge/format.hpp"

#include "internal/json.hpp"
#include "internal/platform.hpp"
#include "internal/types.hpp"

#include <CLI/CLI.hpp>

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <vector>

using namespace klpforge::literals;

namespace klpforge::cli {

    namespace detail {

        using namespace std::string_view_literals;
        namespace fs = std::filesystem;

        static std::optional<std::string> normalize_optional(std::string value) {
            auto trimmed = utils::trim_ascii(value);
            if (trimmed.empty()) {
                return std::nullopt;
            }
            return std::string(trimmed);
        }

        static std::optional<fs::path> normalize_path(const std::string& value) {
            if (auto trimmed = normalize_optional(value)) {
                return fs::path{*trimmed};
            }
            return std::nullopt;
        }

        static std::vector<std::string> split_words(std::string_view text) {
            std::vector<std::string> words{};
            size_t cursor = 0U;
            while (cursor < text.size()) {
                auto start = text.find_first_not_of(" \t"sv, cursor);
                if (start == std::string_view::npos) {
                    break;
                }
                auto end = std::min(text.find_first_of(" \t"sv, start), text.size());
                words.emplace_back(text.substr(start, end - start));
                cursor = end;
            }
            return words;
        }

        static fs::path default_cache_dir() {
            if (const char* home = std::getenv("HOME"); home != nullptr && *home != '\0') {
                return fs::path{home} / ".klpforge";
            }
            return fs::path{".klpforge"};
        }

        static fs::path default_tools_dir() {
            std::error_code ec{};
            auto self = fs::read_symlink("/proc/self/exe", ec);
            if (ec) {
                return {};
            }
            return self.parent_path();
        }

        static unsigned default_jobs() {
            auto hw = std::thread::hardware_concurrency();
            return hw == 0U ? 1U : hw;
        }

        static std::string path_or_default(const std::optional<fs::path>& path) {
            return path ? path->string() : std::string{"<default>"};
        }

        static internal::printed_config to_printed(const build_config& cfg) {
            internal::printed_config out{};
            for (const auto& patch : cfg.patches) {
                out.patches.push_back(patch.string());
            }
            out.module_name = cfg.module_name.value_or("");
            out.source_dir = cfg.source_dir ? cfg.source_dir->string() : std::string{};
            out.config_file = cfg.config_file ? cfg.config_file->string() : std::string{};
            out.vmlinux = cfg.vmlinux ? cfg.vmlinux->string() : std::string{};
            out.arch_version = cfg.arch_version.value_or("");
            out.cache_dir = cfg.cache_dir.string();
            out.output_dir = cfg.output_dir.string();
            out.core_dump_dir = cfg.core_dump_dir.string();
            out.tools_dir = cfg.tools_dir.string();
            out.arch = std::string{to_string(cfg.arch)};
            out.cross_compile = cfg.cross_compile.value_or("");
            out.jobs = cfg.jobs;
            out.targets = cfg.targets;
            out.runtime = std::string{to_string(cfg.runtime)};
            out.extra_ldflags = cfg.extra_ldflags;
            out.debug = cfg.debug;
            out.skip_cleanup = cfg.skip_cleanup;
            out.skip_compiler_check = cfg.skip_compiler_check;
            return out;
        }

    }  // namespace detail

    void print_config(const build_config& cfg, std::ostream& os) {
        if (cfg.format == output_format::json) {
            os << internal::json::to_json(detail::to_printed(cfg)) << '\n';
            return;
        }

        std::vector<std::string> patches{};
        for (const auto& patch : cfg.patches) {
            patches.push_back(patch.string());
        }
        os << "patches=" << utils::join_with_separator(patches, ","sv) << '\n';
        os << "name=" << cfg.module_name.value_or("<derived>") << '\n';
        os << "sourcedir=" << detail::path_or_default(cfg.source_dir) << '\n';
        os << "config=" << detail::path_or_default(cfg.config_file) << '\n';
        os << "vmlinux=" << detail::path_or_default(cfg.vmlinux) << '\n';
        os << "archversion=" << cfg.arch_version.value_or("<running>") << '\n';
        os << "cache_dir=" << cfg.cache_dir.string() << '\n';
        os << "output=" << cfg.output_dir.string() << '\n';
        os << "core_dump_dir=" << cfg.core_dump_dir.string() << '\n';
        os << "tools_dir=" << cfg.tools_dir.string() << '\n';
        os << "arch=" << to_string(cfg.arch) << '\n';
        os << "cross_compile=" << cfg.cross_compile.value_or("<none>") << '\n';
        os << "jobs=" << cfg.jobs << '\n';
        os << "targets=" << utils::join_with_separator(cfg.targets, ","sv) << '\n';
        os << "runtime=" << to_string(cfg.runtime) << '\n';
        os << "ldflags=" << utils::join_with_separator(cfg.extra_ldflags, " "sv) << '\n';
        os << "debug=" << (cfg.debug ? "true" : "false") << '\n';
        os << "skip_cleanup=" << (cfg.skip_cleanup ? "true" : "false") << '\n';
        os << "skip_compiler_check=" << (cfg.skip_compiler_check ? "true" : "false") << '\n';
    }

    std::optional<int> parse_cli(int argc, char** argv, build_config& cfg) {
        CLI::App app{"klpforge: build a live patch module from kernel source patches"};

        cfg.cache_dir = detail::default_cache_dir();
        cfg.tools_dir = detail::default_tools_dir();
        cfg.arch = internal::platform::host_arch;
        cfg.jobs = detail::default_jobs();

        bool show_version = false;
        std::vector<std::string> patch_args{};
        std::string name_arg{};
        std::string sourcedir_arg{};
        std::string config_arg{};
        std::string vmlinux_arg{};
        std::string archversion_arg{};
        std::string cross_arg{};
        std::string output_arg{cfg.output_dir.string()};
        std::string cache_dir_arg{cfg.cache_dir.string()};
        std::string tools_dir_arg{cfg.tools_dir.string()};
        std::string core_dump_dir_arg{cfg.core_dump_dir.string()};
        std::string arch_arg{std::string{to_string(cfg.arch)}};
        std::string runtime_arg{std::string{to_string(cfg.runtime)}};
        std::string format_arg{std::string{to_string(cfg.format)}};
        std::vector<std::string> target_args{};
        std::string ldflags_arg{};

        app.add_option("patches", patch_args, "Patch files, applied in order with -p1");
        app.add_flag("--version", show_version, "Print version and exit");
        app.add_option("-n,--name", name_arg, "Module name (default: derived from the patch file)");
        app.add_option("-s,--sourcedir", sourcedir_arg, "Kernel source tree to build in place");
        app.add_option("-c,--config", config_arg, "Kernel .config (default: <sourcedir>/.config)");
        app.add_option("-v,--vmlinux", vmlinux_arg, "Baseline vmlinux (default: <sourcedir>/vmlinux)");
        app.add_option("-a,--archversion", archversion_arg, "Kernel version of the cached source tree");
        app.add_option("-j,--jobs", cfg.jobs, "Parallel build jobs");
        app.add_option("-t,--target", target_args, "Kernel build target; repeatable (default: vmlinux modules)");
        app.add_option("-o,--output", output_arg, "Output directory for the module");
        app.add_flag("-d,--debug", cfg.debug, "Keep scratch files and the build log");
        app.add_flag("--skip-cleanup", cfg.skip_cleanup, "Keep the scratch directory");
        app.add_flag(
                "--skip-compiler-check", cfg.skip_compiler_check, "Allow a compiler that differs from the kernel's");
        app.add_option("--cache-dir", cache_dir_arg, "Cache directory (default: ~/.klpforge)");
        app.add_option("--tools-dir", tools_dir_arg, "Directory holding klpforge-cc and the diff tools");
        app.add_option("--core-dump-dir", core_dump_dir_arg, "Where core files of crashed tools are kept");
        app.add_option("--arch", arch_arg, "Target architecture: x86_64|ppc64le|s390x|aarch64");
        app.add_option("--runtime", runtime_arg, "Patch runtime: auto|livepatch|kpatch");
        app.add_option("--cross-compile", cross_arg, "Cross toolchain prefix");
        app.add_option("--ldflags", ldflags_arg, "Extra flags for linking the changed objects");
        app.add_flag("--print-config", cfg.print_config, "Print resolved config and exit");
        app.add_option("--format", format_arg, "Config print format: text|json");
        app.add_flag("--quiet", cfg.quiet, "Suppress progress output");
        app.add_flag("--verbose", cfg.verbose, "Enable verbose output");

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            return std::optional<int>{app.exit(e)};
        }

        if (show_version) {
            std::cout << "klpforge " << internal::platform::version << '\n';
            return std::optional<int>{0};
        }

        if (cfg.quiet && cfg.verbose) {
            std::cerr << "--quiet and --verbose are mutually exclusive\n";
            return std::optional<int>{2};
        }

        if (!try_parse_target_arch(arch_arg, cfg.arch)) {
            std::cerr << "invalid --arch value: " << arch_arg << " (expected x86_64|ppc64le|s390x|aarch64)\n";
            return std::optional<int>{2};
        }
        if (!try_parse_livepatch_runtime(runtime_arg, cfg.runtime)) {
            std::cerr << "invalid --runtime value: " << runtime_arg << " (expected auto|livepatch|kpatch)\n";
            return std::optional<int>{2};
        }
        if (!try_parse_output_format(format_arg, cfg.format)) {
            std::cerr << "invalid --format value: " << format_arg << " (expected text|json)\n";
            return std::optional<int>{2};
        }
        if (cfg.jobs == 0U) {
            std::cerr << "invalid --jobs value: 0\n";
            return std::optional<int>{2};
        }

        for (const auto& patch : patch_args) {
            cfg.patches.emplace_back(patch);
        }
        cfg.module_name = detail::normalize_optional(name_arg);
        cfg.source_dir = detail::normalize_path(sourcedir_arg);
        cfg.config_file = detail::normalize_path(config_arg);
        cfg.vmlinux = detail::normalize_path(vmlinux_arg);
        cfg.arch_version = detail::normalize_optional(archversion_arg);
        cfg.cross_compile = detail::normalize_optional(cross_arg);
        cfg.output_dir = output_arg;
        cfg.cache_dir = cache_dir_arg;
        cfg.tools_dir = tools_dir_arg;
        cfg.core_dump_dir = core_dump_dir_arg;
        if (!target_args.empty()) {
            cfg.targets = target_args;
        }
        cfg.extra_ldflags = detail::split_words(ldflags_arg);

        if (cfg.print_config) {
            print_config(cfg, std::cout);
            return std::optional<int>{0};
        }

        if (cfg.patches.empty()) {
            std::cerr << "no patch files given\n" << app.help();
            return std::optional<int>{2};
        }

        return std::nullopt;
    }

}  // namespace klpforge::cli
