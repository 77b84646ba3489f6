#pragma once

#include "assembly.hpp"
#include "build.hpp"
#include "config.hpp"
#include "graph.hpp"
#include "inspect.hpp"
#include "kconfig.hpp"
#include "layout.hpp"
#include "transaction.hpp"
#include "workspace.hpp"

#include <cstddef>
#include <filesystem>
#include <iosfwd>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace klpforge {

    // MODULE_NAME_LEN less room for the kernel's own suffixes
    inline constexpr size_t max_module_name_length = 55U;

    // Characters outside [A-Za-z0-9_-] become '-'; capped at max_module_name_length.
    std::string sanitize_module_name(std::string_view name);

    std::string derive_module_name(const build_config& cfg, bool native_livepatch);

    // Rejects option combinations no run can satisfy; configuration errors.
    void validate_config(const build_config& cfg);

    // Kernel options the pipeline depends on; prerequisite_missing errors.
    void check_kernel_config(const kernel_config& kconfig);

    bool uses_native_livepatch(livepatch_runtime runtime, const kernel_config& kconfig);

    // Produces an object with the compiler that will build the patch.
    class compiler_probe {
      public:
        virtual ~compiler_probe() = default;

        virtual std::filesystem::path compile(const std::filesystem::path& output) = 0;
    };

    class gcc_compiler_probe final : public compiler_probe {
      public:
        gcc_compiler_probe(std::filesystem::path gcc, std::filesystem::path log_path);

        std::filesystem::path compile(const std::filesystem::path& output) override;

      private:
        std::filesystem::path gcc_;
        std::filesystem::path log_path_;
    };

    // The compiler's .comment signature must match the baseline binary's.
    void check_toolchain(
            binary_inspector& inspector,
            const std::filesystem::path& probe_object,
            const std::filesystem::path& vmlinux);

    // What the pipeline knows about the run when it asks for a collaborator.
    struct run_context {
        const build_config& cfg;
        std::filesystem::path scratch_dir{};
        std::filesystem::path log_path{};
        std::filesystem::path source_dir{};
        std::filesystem::path vmlinux{};
        std::filesystem::path config_file{};
        std::string module_name{};
        bool native_livepatch{true};
        section_layout layout{};
    };

    /*
     * Creates the delegated tools of a run.
     *
     * Each collaborator is requested at the stage that first needs it, so the
     * context carries every value resolved up to that point.
     */
    class toolchain_factory {
      public:
        virtual ~toolchain_factory() = default;

        virtual std::unique_ptr<binary_inspector> make_inspector(const run_context& ctx) = 0;
        virtual std::unique_ptr<compiler_probe> make_compiler_probe(const run_context& ctx) = 0;
        virtual std::unique_ptr<patch_tool> make_patch_tool(const run_context& ctx) = 0;
        virtual std::unique_ptr<build_backend> make_build_backend(const run_context& ctx) = 0;
        virtual std::unique_ptr<build_graph> make_build_graph(const run_context& ctx) = 0;
        virtual std::unique_ptr<diff_compiler> make_diff_compiler(
                const run_context& ctx, binary_inspector& inspector) = 0;
        virtual std::unique_ptr<object_linker> make_linker(const run_context& ctx) = 0;
        virtual std::unique_ptr<module_assembler> make_module_assembler(const run_context& ctx) = 0;

        // nullptr: only already-cached or explicit source trees are usable
        virtual source_provider* sources() { return nullptr; }
    };

    // Tools found in the configured tools directory or on PATH.
    class system_toolchain final : public toolchain_factory {
      public:
        std::unique_ptr<binary_inspector> make_inspector(const run_context& ctx) override;
        std::unique_ptr<compiler_probe> make_compiler_probe(const run_context& ctx) override;
        std::unique_ptr<patch_tool> make_patch_tool(const run_context& ctx) override;
        std::unique_ptr<build_backend> make_build_backend(const run_context& ctx) override;
        std::unique_ptr<build_graph> make_build_graph(const run_context& ctx) override;
        std::unique_ptr<diff_compiler> make_diff_compiler(const run_context& ctx, binary_inspector& inspector) override;
        std::unique_ptr<object_linker> make_linker(const run_context& ctx) override;
        std::unique_ptr<module_assembler> make_module_assembler(const run_context& ctx) override;
    };

    // `name` from the tools directory when present there, otherwise left to PATH lookup
    std::filesystem::path locate_tool(const build_config& cfg, std::string_view name);

    struct pipeline_result {
        std::string module_name{};
        std::filesystem::path module_path{};
        std::vector<changed_object> objects{};
        std::vector<kernel_binary> patched_owners{};
    };

    /*
     * One end-to-end module build.
     *
     * Progress lines go to `out` unless the configuration is quiet. Teardown
     * (revert of the patch transaction, scratch and log cleanup) runs on every
     * exit route, including `interrupted`.
     */
    class pipeline {
      public:
        pipeline(build_config cfg, toolchain_factory& tools, std::ostream& out);

        pipeline_result run();

        // <cache>/build.log, kept on failure
        std::filesystem::path log_path() const;

      private:
        void progress(std::string_view line);
        void verbose(std::string_view line);

        build_config cfg_;
        toolchain_factory& tools_;
        std::ostream& out_;
    };

}  // namespace klpforge
