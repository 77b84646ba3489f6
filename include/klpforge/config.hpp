#pragma once

#include "utils.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace klpforge {

    using namespace std::string_view_literals;

    /*
     * klpforge Startup Config Options
     *
     * Inputs
     * - patches: Ordered list of unified diffs, applied with -p1 against the source tree.
     * - module_name: Explicit module name; derived from the sole patch file otherwise.
     * - source_dir: Kernel source tree used in place (also the kbuild object tree).
     * - config_file: Kernel .config of the target; defaults to <source_dir>/.config.
     * - vmlinux: Baseline core image with DWARF; defaults to <source_dir>/vmlinux.
     * - arch_version: Kernel version tag of the cached source tree to use.
     *
     * Workspace
     * - cache_dir: Root for the cached source tree, scratch directory and build log.
     * - output_dir: Where the finished module is copied.
     * - core_dump_dir: Where core files of crashed build tools are preserved.
     * - tools_dir: Directory holding klpforge-cc, create-diff-object and the module tools.
     *
     * Target
     * - arch: Architecture family; selects the special-section layout set.
     * - cross_compile: Toolchain prefix handed to kbuild as CROSS_COMPILE.
     * - jobs: Parallel jobs for the delegated build.
     * - targets: kbuild targets of both build passes.
     * - runtime: Native livepatch, shadow (kpatch) runtime, or auto from CONFIG_LIVEPATCH.
     * - extra_ldflags: Additional flags for the relocatable link of the diff objects.
     *
     * Behaviour
     * - debug: Keep scratch directory and log on success.
     * - skip_cleanup: Keep scratch directory regardless of outcome.
     * - skip_compiler_check: Do not enforce compiler/kernel version equality.
     * - quiet/verbose: Coarse output verbosity knobs.
     * - print_config/format: Print the resolved config and exit.
     */

    enum class target_arch : uint8_t { x86_64, ppc64le, s390x, aarch64 };
    enum class livepatch_runtime : uint8_t { automatic, native, shadow };
    enum class output_format : uint8_t { text, json };

    inline constexpr std::string_view to_string(target_arch arch) {
        switch (arch) {
            case target_arch::x86_64:
                return "x86_64"sv;
            case target_arch::ppc64le:
                return "ppc64le"sv;
            case target_arch::s390x:
                return "s390x"sv;
            case target_arch::aarch64:
                return "aarch64"sv;
        }
        return "x86_64"sv;
    }

    inline constexpr bool try_parse_target_arch(std::string_view text, target_arch& out) {
        if (utils::str_case_eq(text, "x86_64"sv) || utils::str_case_eq(text, "x86"sv)) {
            out = target_arch::x86_64;
            return true;
        }
        if (utils::str_case_eq(text, "ppc64le"sv) || utils::str_case_eq(text, "powerpc"sv)) {
            out = target_arch::ppc64le;
            return true;
        }
        if (utils::str_case_eq(text, "s390x"sv) || utils::str_case_eq(text, "s390"sv)) {
            out = target_arch::s390x;
            return true;
        }
        if (utils::str_case_eq(text, "aarch64"sv) || utils::str_case_eq(text, "arm64"sv)) {
            out = target_arch::aarch64;
            return true;
        }
        return false;
    }

    inline constexpr std::string_view to_string(livepatch_runtime runtime) {
        switch (runtime) {
            case livepatch_runtime::automatic:
                return "auto"sv;
            case livepatch_runtime::native:
                return "livepatch"sv;
            case livepatch_runtime::shadow:
                return "kpatch"sv;
        }
        return "auto"sv;
    }

    inline constexpr bool try_parse_livepatch_runtime(std::string_view text, livepatch_runtime& out) {
        if (utils::str_case_eq(text, "auto"sv)) {
            out = livepatch_runtime::automatic;
            return true;
        }
        if (utils::str_case_eq(text, "livepatch"sv) || utils::str_case_eq(text, "klp"sv)) {
            out = livepatch_runtime::native;
            return true;
        }
        if (utils::str_case_eq(text, "kpatch"sv) || utils::str_case_eq(text, "shadow"sv)) {
            out = livepatch_runtime::shadow;
            return true;
        }
        return false;
    }

    inline constexpr std::string_view to_string(output_format format) {
        switch (format) {
            case output_format::text:
                return "text"sv;
            case output_format::json:
                return "json"sv;
        }
        return "text"sv;
    }

    inline constexpr bool try_parse_output_format(std::string_view text, output_format& out) {
        if (utils::str_case_eq(text, "text"sv)) {
            out = output_format::text;
            return true;
        }
        if (utils::str_case_eq(text, "json"sv)) {
            out = output_format::json;
            return true;
        }
        return false;
    }

    struct build_config {
        std::vector<std::filesystem::path> patches{};
        std::optional<std::string> module_name{};
        std::optional<std::filesystem::path> source_dir{};
        std::optional<std::filesystem::path> config_file{};
        std::optional<std::filesystem::path> vmlinux{};
        std::optional<std::string> arch_version{};

        std::filesystem::path cache_dir{".klpforge"};
        std::filesystem::path output_dir{"."};
        std::filesystem::path core_dump_dir{"/tmp"};
        std::filesystem::path tools_dir{};

        target_arch arch{target_arch::x86_64};
        std::optional<std::string> cross_compile{};
        unsigned jobs{1U};
        std::vector<std::string> targets{"vmlinux", "modules"};
        livepatch_runtime runtime{livepatch_runtime::automatic};
        std::vector<std::string> extra_ldflags{};

        bool debug{false};
        bool skip_cleanup{false};
        bool skip_compiler_check{false};
        bool quiet{false};
        bool verbose{false};

        bool print_config{false};
        output_format format{output_format::text};
    };

}  // namespace klpforge
