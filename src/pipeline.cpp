#include "klpforge/pipeline.hpp"

#include "klpforge/error.hpp"
#include "klpforge/format.hpp"
#include "klpforge/process.hpp"
#include "klpforge/symbols.hpp"
#include "klpforge/utils.hpp"

#include "internal/fs.hpp"
#include "internal/json.hpp"
#include "internal/platform.hpp"
#include "internal/types.hpp"

#include <algorithm>
#include <array>
#include <iostream>
#include <optional>
#include <system_error>

namespace fs = std::filesystem;
using namespace klpforge::literals;

namespace klpforge {

    namespace detail {

        static constexpr std::array rejected_kernel_options{
                "CONFIG_DEBUG_INFO_SPLIT"sv,
                "CONFIG_GCC_PLUGIN_LATENT_ENTROPY"sv,
                "CONFIG_GCC_PLUGIN_RANDSTRUCT"sv,
        };

        static constexpr bool is_module_name_char(char c) {
            return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_' || c == '-';
        }

        // final extension removed, whatever it is
        static std::string patch_base_name(const fs::path& patch) {
            return patch.filename().stem().string();
        }

        static bool file_exists(const fs::path& path) {
            std::error_code ec{};
            return fs::exists(path, ec);
        }

        static void write_summary(
                const fs::path& scratch_dir,
                const std::string& module_name,
                bool native_livepatch,
                const std::vector<changed_object>& objects,
                const std::vector<kernel_binary>& owners,
                const std::vector<std::string>& unsatisfied,
                const fs::path& module_path) {
            internal::run_summary summary{};
            summary.module_name = module_name;
            summary.runtime = to_string(native_livepatch ? livepatch_runtime::native : livepatch_runtime::shadow);
            for (const auto& object : objects) {
                summary.objects.push_back(internal::summary_object{
                        .path = object.path,
                        .owner = object.owner ? object.owner->path.string() : std::string{},
                        .outcome = std::string{to_string(object.outcome)}});
            }
            for (const auto& owner : owners) {
                summary.patched_owners.push_back(owner.path.string());
            }
            summary.unsatisfied_symbols = unsatisfied;
            summary.module_path = module_path.string();

            std::error_code ec{};
            if (fs::is_directory(scratch_dir, ec)) {
                internal::json::write_json_file(summary, scratch_dir / "summary.json");
            }
        }

    }  // namespace detail

    std::string sanitize_module_name(std::string_view name) {
        std::string out{name.substr(0U, std::min(name.size(), max_module_name_length))};
        std::ranges::replace_if(out, [](char c) { return !detail::is_module_name_char(c); }, '-');
        return out;
    }

    std::string derive_module_name(const build_config& cfg, bool native_livepatch) {
        if (cfg.module_name) {
            return sanitize_module_name(*cfg.module_name);
        }
        auto base = cfg.patches.size() == 1U ? detail::patch_base_name(cfg.patches.front()) : std::string{"patch"};
        auto prefix = native_livepatch ? "livepatch-"sv : "kpatch-"sv;
        return sanitize_module_name("{}{}"_format(prefix, base));
    }

    void validate_config(const build_config& cfg) {
        if (cfg.patches.empty()) {
            throw pipeline_error{error_kind::configuration, "no patch files given"};
        }
        for (const auto& patch : cfg.patches) {
            std::error_code ec{};
            if (!fs::is_regular_file(patch, ec)) {
                throw pipeline_error{
                        error_kind::configuration, "patch file {} not found"_format(patch.string()), {patch.string()}};
            }
        }
        if (cfg.arch_version && cfg.source_dir) {
            throw pipeline_error{error_kind::configuration, "--archversion is incompatible with --sourcedir"};
        }
        if (cfg.module_name && cfg.module_name->empty()) {
            throw pipeline_error{error_kind::configuration, "module name must not be empty"};
        }
        if (cfg.jobs == 0U) {
            throw pipeline_error{error_kind::configuration, "job count must be positive"};
        }
        if (cfg.targets.empty()) {
            throw pipeline_error{error_kind::configuration, "no build targets given"};
        }
        if (cfg.quiet && cfg.verbose) {
            throw pipeline_error{error_kind::configuration, "--quiet and --verbose are mutually exclusive"};
        }
        if (cfg.arch != internal::platform::host_arch && !cfg.cross_compile) {
            debug_log("building for ", to_string(cfg.arch), " without a cross-compile prefix");
        }
    }

    void check_kernel_config(const kernel_config& kconfig) {
        if (!kconfig.enabled("CONFIG_DEBUG_INFO")) {
            throw pipeline_error{
                    error_kind::prerequisite_missing,
                    "kernel doesn't have 'CONFIG_DEBUG_INFO' enabled",
                    {"CONFIG_DEBUG_INFO"}};
        }
        for (auto option : detail::rejected_kernel_options) {
            if (kconfig.enabled(option)) {
                throw pipeline_error{
                        error_kind::prerequisite_missing,
                        "kernel option '{}' is not supported"_format(option),
                        {std::string{option}}};
            }
        }
    }

    bool uses_native_livepatch(livepatch_runtime runtime, const kernel_config& kconfig) {
        switch (runtime) {
            case livepatch_runtime::native:
                if (!kconfig.enabled("CONFIG_LIVEPATCH")) {
                    throw pipeline_error{
                            error_kind::prerequisite_missing,
                            "livepatch runtime requested but 'CONFIG_LIVEPATCH' is not enabled",
                            {"CONFIG_LIVEPATCH"}};
                }
                return true;
            case livepatch_runtime::shadow:
                return false;
            case livepatch_runtime::automatic:
                return kconfig.enabled("CONFIG_LIVEPATCH");
        }
        return false;
    }

    gcc_compiler_probe::gcc_compiler_probe(fs::path gcc, fs::path log_path)
            : gcc_{std::move(gcc)}, log_path_{std::move(log_path)} {}

    fs::path gcc_compiler_probe::compile(const fs::path& output) {
        auto source = output.parent_path() / "probe.c";
        internal::files::write_text_file(source, "int klpforge_probe;\n");
        auto rc = process::run_logged({gcc_.string(), "-c", source.string(), "-o", output.string()}, log_path_);
        if (rc != 0) {
            throw pipeline_error{
                    error_kind::prerequisite_missing,
                    "{} failed to compile the toolchain probe"_format(gcc_.string()),
                    {gcc_.string()}};
        }
        return output;
    }

    void check_toolchain(binary_inspector& inspector, const fs::path& probe_object, const fs::path& vmlinux) {
        auto kernel_signature = inspector.compiler_signature(vmlinux);
        if (!kernel_signature) {
            throw pipeline_error{
                    error_kind::prerequisite_missing,
                    "can't determine the compiler that built {}"_format(vmlinux.string()),
                    {vmlinux.string()}};
        }
        auto compiler_signature = inspector.compiler_signature(probe_object);
        if (!compiler_signature) {
            throw pipeline_error{error_kind::prerequisite_missing, "can't determine the installed compiler version"};
        }
        if (*compiler_signature != *kernel_signature) {
            throw pipeline_error{
                    error_kind::prerequisite_missing,
                    "changed compiler version:\n  kernel:    {}\n  installed: {}"_format(
                            *kernel_signature, *compiler_signature)};
        }
    }

    fs::path locate_tool(const build_config& cfg, std::string_view name) {
        if (!cfg.tools_dir.empty()) {
            auto candidate = cfg.tools_dir / name;
            if (detail::file_exists(candidate)) {
                return candidate;
            }
        }
        return fs::path{name};
    }

    std::unique_ptr<binary_inspector> system_toolchain::make_inspector(const run_context& ctx) {
        return std::make_unique<readelf_inspector>(
                "{}{}"_format(ctx.cfg.cross_compile.value_or(""), internal::platform::tool::readelf),
                ctx.scratch_dir,
                ctx.log_path);
    }

    std::unique_ptr<compiler_probe> system_toolchain::make_compiler_probe(const run_context& ctx) {
        return std::make_unique<gcc_compiler_probe>(
                "{}{}"_format(ctx.cfg.cross_compile.value_or(""), internal::platform::tool::gcc), ctx.log_path);
    }

    std::unique_ptr<patch_tool> system_toolchain::make_patch_tool(const run_context& ctx) {
        return std::make_unique<gnu_patch_tool>(
                fs::path{internal::platform::tool::patch},
                fs::path{internal::platform::tool::git},
                ctx.source_dir,
                ctx.log_path);
    }

    std::unique_ptr<build_backend> system_toolchain::make_build_backend(const run_context& ctx) {
        return std::make_unique<kbuild_backend>(fs::path{internal::platform::tool::make}, ctx.source_dir, ctx.log_path);
    }

    std::unique_ptr<build_graph> system_toolchain::make_build_graph(const run_context& ctx) {
        return std::make_unique<kbuild_graph>(ctx.source_dir);
    }

    std::unique_ptr<diff_compiler> system_toolchain::make_diff_compiler(
            const run_context& ctx, binary_inspector& inspector) {
        return std::make_unique<create_diff_object_tool>(
                inspector,
                ctx.layout,
                create_diff_object_tool::settings{
                        .executable = locate_tool(ctx.cfg, internal::platform::tool::create_diff_object),
                        .scratch_dir = ctx.scratch_dir,
                        .log_path = ctx.log_path,
                        .core_dump_dir = ctx.cfg.core_dump_dir,
                        .debug = ctx.cfg.debug});
    }

    std::unique_ptr<object_linker> system_toolchain::make_linker(const run_context& ctx) {
        auto prefix = ctx.cfg.cross_compile.value_or("");
        return std::make_unique<binutils_linker>(binutils_linker::settings{
                .ld = "{}{}"_format(prefix, internal::platform::tool::ld),
                .objcopy = "{}{}"_format(prefix, internal::platform::tool::objcopy),
                .extra_ldflags = ctx.cfg.extra_ldflags,
                .scratch_dir = ctx.scratch_dir,
                .log_path = ctx.log_path});
    }

    std::unique_ptr<module_assembler> system_toolchain::make_module_assembler(const run_context& ctx) {
        return std::make_unique<kbuild_module_assembler>(kbuild_module_assembler::settings{
                .make = fs::path{internal::platform::tool::make},
                .create_kpatch_module = locate_tool(ctx.cfg, internal::platform::tool::create_kpatch_module),
                .create_klp_module = locate_tool(ctx.cfg, internal::platform::tool::create_klp_module),
                .template_dir = ctx.cfg.tools_dir / internal::platform::module_template_dir,
                .source_dir = ctx.source_dir,
                .patch_dir = ctx.scratch_dir / "patch",
                .log_path = ctx.log_path,
                .core_dump_dir = ctx.cfg.core_dump_dir,
                .extra_ldflags = ctx.cfg.extra_ldflags});
    }

    pipeline::pipeline(build_config cfg, toolchain_factory& tools, std::ostream& out)
            : cfg_{std::move(cfg)}, tools_{tools}, out_{out} {}

    fs::path pipeline::log_path() const {
        std::error_code ec{};
        auto cache = fs::absolute(cfg_.cache_dir, ec);
        return (ec ? cfg_.cache_dir : cache.lexically_normal()) / "build.log";
    }

    void pipeline::progress(std::string_view line) {
        if (!cfg_.quiet) {
            out_ << line << '\n';
        }
    }

    void pipeline::verbose(std::string_view line) {
        if (cfg_.verbose) {
            out_ << line << '\n';
        }
    }

    pipeline_result pipeline::run() {
        validate_config(cfg_);

        auto workspace = scoped_workspace::acquire(cfg_.cache_dir, cfg_.debug, cfg_.skip_cleanup);
        verbose("scratch directory: {}"_format(workspace.scratch_dir().string()));
        verbose("build log: {}"_format(workspace.log_path().string()));

        run_context ctx{.cfg = cfg_, .scratch_dir = workspace.scratch_dir(), .log_path = workspace.log_path()};

        source_cache sources{workspace.cache_dir(), tools_.sources()};
        ctx.source_dir = sources.resolve(cfg_);
        progress("Using source directory at {}"_format(ctx.source_dir.string()));

        ctx.vmlinux = cfg_.vmlinux.value_or(ctx.source_dir / "vmlinux");
        if (!detail::file_exists(ctx.vmlinux)) {
            throw pipeline_error{
                    error_kind::prerequisite_missing,
                    "baseline binary {} not found"_format(ctx.vmlinux.string()),
                    {ctx.vmlinux.string()}};
        }
        ctx.config_file = cfg_.config_file.value_or(ctx.source_dir / ".config");
        auto kconfig = kernel_config::load(ctx.config_file);
        check_kernel_config(kconfig);
        ctx.native_livepatch = uses_native_livepatch(cfg_.runtime, kconfig);
        ctx.module_name = derive_module_name(cfg_, ctx.native_livepatch);
        verbose("module name: {}"_format(ctx.module_name));

        auto inspector = tools_.make_inspector(ctx);
        if (!cfg_.skip_compiler_check) {
            auto probe = tools_.make_compiler_probe(ctx);
            check_toolchain(*inspector, probe->compile(workspace.scratch_dir() / "probe.o"), ctx.vmlinux);
        }

        ctx.layout = probe_section_layout(
                *inspector, ctx.vmlinux, cfg_.arch, kconfig.enabled("CONFIG_PARAVIRT"), workspace.scratch_dir());
        process::throw_if_interrupted("layout probe"sv);

        auto patcher = tools_.make_patch_tool(ctx);
        progress("Testing patch file(s)");
        patch_transaction::apply(*patcher, cfg_.patches).revert_all();

        auto backend = tools_.make_build_backend(ctx);
        differential_build_driver driver{
                *backend,
                build_settings{
                        .source_dir = ctx.source_dir,
                        .scratch_dir = workspace.scratch_dir(),
                        .log_path = workspace.log_path(),
                        .core_dump_dir = cfg_.core_dump_dir,
                        .cc_wrapper = locate_tool(cfg_, internal::platform::tool::cc_wrapper),
                        .cross_compile = cfg_.cross_compile,
                        .jobs = cfg_.jobs,
                        .targets = cfg_.targets}};

        progress("Building original source");
        driver.build_baseline();

        progress("Building patched source");
        auto transaction = patch_transaction::apply(*patcher, cfg_.patches);
        auto build = driver.build_instrumented();
        verbose("{} changed object(s)"_format(build.changed_objects.size()));

        progress("Extracting new and modified ELF sections");
        auto graph = tools_.make_build_graph(ctx);
        owner_resolver resolver{*graph};
        auto differ = tools_.make_diff_compiler(ctx, *inspector);
        aggregator assembler{
                resolver,
                *differ,
                aggregator_settings{
                        .scratch_dir = workspace.scratch_dir(),
                        .vmlinux = ctx.vmlinux,
                        .symvers = driver.symvers_snapshot(),
                        .log_path = workspace.log_path(),
                        .module_name = ctx.module_name}};

        aggregation_result aggregation{};
        try {
            aggregation = assembler.aggregate(build.changed_objects);
        } catch (const pipeline_error&) {
            detail::write_summary(
                    workspace.scratch_dir(), ctx.module_name, ctx.native_livepatch, assembler.processed(), {}, {}, {});
            throw;
        }
        for (const auto& owner : aggregation.patched_owners) {
            progress("patched owner: {}"_format(owner));
        }

        progress("Building patch module: {}.ko"_format(ctx.module_name));
        std::vector<fs::path> inputs{};
        for (const auto& output : aggregation.outputs) {
            inputs.push_back(workspace.output_dir() / output);
        }
        auto linked = workspace.patch_dir() / "tmp_output.o";
        auto linker = tools_.make_linker(ctx);
        linker->link(inputs, linked);
        if (!ctx.native_livepatch) {
            linker->embed_checksum(linked);
        }

        auto module_tool = tools_.make_module_assembler(ctx);
        auto module = module_tool->assemble(module_request{
                .linked_object = linked,
                .module_name = ctx.module_name,
                .symvers = driver.symvers_snapshot(),
                .native_livepatch = ctx.native_livepatch});
        process::throw_if_interrupted("module assembly"sv);

        try {
            verify_symbol_closure(build.diagnostics, *inspector, module, !ctx.native_livepatch);
        } catch (const pipeline_error& e) {
            if (e.kind() == error_kind::symbol) {
                detail::write_summary(
                        workspace.scratch_dir(),
                        ctx.module_name,
                        ctx.native_livepatch,
                        aggregation.objects,
                        aggregation.patched_owners,
                        e.subjects(),
                        module);
            }
            throw;
        }

        internal::files::ensure_dir(cfg_.output_dir);
        auto destination = cfg_.output_dir / module.filename();
        internal::files::copy_file(module, destination);

        transaction.revert_all();
        detail::write_summary(
                workspace.scratch_dir(),
                ctx.module_name,
                ctx.native_livepatch,
                aggregation.objects,
                aggregation.patched_owners,
                {},
                destination);
        progress("SUCCESS");
        workspace.mark_success();

        return pipeline_result{
                .module_name = ctx.module_name,
                .module_path = destination,
                .objects = std::move(aggregation.objects),
                .patched_owners = std::move(aggregation.patched_owners)};
    }

}  // namespace klpforge
