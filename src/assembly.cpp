#include "klpforge/assembly.hpp"

#include "klpforge/error.hpp"
#include "klpforge/format.hpp"
#include "klpforge/process.hpp"
#include "klpforge/utils.hpp"

#include "internal/fs.hpp"
#include "internal/platform.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <array>
#include <fstream>
#include <memory>
#include <system_error>

namespace fs = std::filesystem;
using namespace klpforge::literals;

namespace klpforge {

    namespace detail {

        struct md_ctx_deleter {
            void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
        };

        static constexpr bool is_excluded(std::string_view object) {
            return std::ranges::find(excluded_objects, object) != excluded_objects.end();
        }

        static bool file_exists(const fs::path& path) {
            std::error_code ec{};
            return fs::exists(path, ec);
        }

    }  // namespace detail

    create_diff_object_tool::create_diff_object_tool(
            binary_inspector& inspector, section_layout layout, settings config)
            : inspector_{inspector}, layout_{std::move(layout)}, config_{std::move(config)} {}

    fs::path create_diff_object_tool::symbol_table_for(const diff_request& request) {
        if (auto it = symtabs_.find(request.owner_binary); it != symtabs_.end()) {
            return it->second;
        }
        auto path = config_.scratch_dir / "{}.symtab"_format(request.owner.diff_name());
        internal::files::write_text_file(path, inspector_.symbol_table(request.owner_binary));
        return symtabs_.emplace(request.owner_binary, path).first->second;
    }

    int create_diff_object_tool::compare(const diff_request& request) {
        auto symtab = symbol_table_for(request);
        internal::files::ensure_dir(request.output.parent_path());

        std::vector<std::string> args{config_.executable.string()};
        if (config_.debug) {
            args.emplace_back("-d");
        }
        args.insert(
                args.end(),
                {request.original.string(),
                 request.patched.string(),
                 request.owner.diff_name(),
                 symtab.string(),
                 request.symvers.string(),
                 request.module_name,
                 request.output.string()});

        auto rc = process::run_logged(args, config_.log_path, config_.scratch_dir, layout_.to_environment());
        if (process::is_segfault(rc)) {
            process::report_crash(
                    internal::platform::tool::create_diff_object, config_.scratch_dir, config_.core_dump_dir);
        }
        return rc;
    }

    kbuild_module_assembler::kbuild_module_assembler(settings config) : config_{std::move(config)} {}

    void kbuild_module_assembler::run_tool(const std::vector<std::string>& args, std::string_view what) {
        auto rc = process::run_logged(args, config_.log_path, config_.patch_dir);
        if (process::is_segfault(rc)) {
            process::report_crash(
                    fs::path{args.front()}.filename().string(), config_.patch_dir, config_.core_dump_dir);
        }
        if (rc != 0) {
            throw pipeline_error{error_kind::build_failure, "{} failed (exit status {})"_format(what, rc)};
        }
    }

    fs::path kbuild_module_assembler::assemble(const module_request& request) {
        std::error_code ec{};
        if (!fs::is_directory(config_.template_dir, ec)) {
            throw pipeline_error{
                    error_kind::prerequisite_missing,
                    "module template directory not found: {}"_format(config_.template_dir.string())};
        }
        internal::files::ensure_dir(config_.patch_dir);
        fs::copy(config_.template_dir,
                 config_.patch_dir,
                 fs::copy_options::recursive | fs::copy_options::overwrite_existing,
                 ec);
        if (ec) {
            throw pipeline_error{
                    error_kind::io,
                    "failed to copy module template {}: {}"_format(config_.template_dir.string(), ec.message())};
        }

        run_tool(
                {config_.create_kpatch_module.string(),
                 request.linked_object.string(),
                 (config_.patch_dir / "output.o").string()},
                "building patch module metadata"sv);

        std::vector<std::string> make_args{config_.make.string(), "-C", config_.patch_dir.string()};
        process::environment env{
                {"KLPFORGE_BUILD", config_.source_dir.string()},
                {"KLPFORGE_NAME", request.module_name},
                {"KBUILD_EXTRA_SYMBOLS", request.symvers.string()},
                {"KLPFORGE_LDFLAGS", utils::join_with_separator(config_.extra_ldflags, " "sv)}};
        auto rc = process::run_logged(make_args, config_.log_path, config_.patch_dir, env);
        if (process::is_segfault(rc)) {
            process::report_crash(internal::platform::tool::make, config_.patch_dir, config_.core_dump_dir);
        }
        if (rc != 0) {
            throw pipeline_error{error_kind::build_failure, "patch module build failed (exit status {})"_format(rc)};
        }

        auto module = config_.patch_dir / "{}.ko"_format(request.module_name);
        if (request.native_livepatch) {
            auto converted = config_.patch_dir / "tmp.ko";
            run_tool(
                    {config_.create_klp_module.string(), module.string(), converted.string()},
                    "livepatch module conversion"sv);
            fs::rename(converted, module, ec);
            if (ec) {
                throw pipeline_error{
                        error_kind::io, "failed to rename {}: {}"_format(converted.string(), ec.message())};
            }
        }

        if (!detail::file_exists(module)) {
            throw pipeline_error{
                    error_kind::build_failure, "patch module {} was not produced"_format(module.string())};
        }
        return module;
    }

    aggregator::aggregator(owner_resolver& resolver, diff_compiler& compiler, aggregator_settings settings)
            : resolver_{resolver}, compiler_{compiler}, settings_{std::move(settings)} {}

    void aggregator::log(std::string_view line) const {
        internal::files::append_text_file(settings_.log_path, "klpforge: {}\n"_format(line));
    }

    fs::path aggregator::owner_binary(const kernel_binary& owner) const {
        if (!owner.is_module()) {
            return settings_.vmlinux;
        }
        return settings_.scratch_dir / "module" / owner.path;
    }

    aggregation_result aggregator::aggregate(const std::vector<std::string>& changed_objects) {
        aggregation_result result{};
        size_t errors = 0U;
        processed_.clear();

        auto module_name = settings_.module_name;
        std::ranges::replace(module_name, '-', '_');

        for (const auto& object : changed_objects) {
            changed_object record{.path = object};

            if (detail::is_excluded(object)) {
                log("skipping {}"_format(object));
                record.outcome = diff_outcome::skipped;
                processed_.push_back(std::move(record));
                continue;
            }

            auto original = settings_.scratch_dir / "orig" / object;
            auto patched = settings_.scratch_dir / "patched" / object;
            auto output = settings_.scratch_dir / "output" / object;
            auto resolution = resolver_.resolve(object);
            record.owner = resolution.owner;

            if (!detail::file_exists(original)) {
                internal::files::copy_file(patched, output);
                record.outcome = diff_outcome::new_object;
                result.outputs.push_back(object);
                log("new object {} ({})"_format(object, resolution.owner));
            }
            else {
                diff_request request{
                        .original = original,
                        .patched = patched,
                        .owner = resolution.owner,
                        .owner_binary = owner_binary(resolution.owner),
                        .output = output,
                        .symvers = settings_.symvers,
                        .module_name = module_name};
                record.outcome = classify_diff_exit(compiler_.compare(request));

                switch (record.outcome) {
                    case diff_outcome::changed:
                        if (!resolution.ambiguities.empty()) {
                            processed_.push_back(std::move(record));
                            throw pipeline_error{error_kind::resolution, resolution.ambiguities.front(), {object}};
                        }
                        ++result.changed_count;
                        result.outputs.push_back(object);
                        break;
                    case diff_outcome::unchanged:
                        log("{} has no functional changes"_format(object));
                        break;
                    default:
                        log("ERROR: {}"_format(object));
                        ++errors;
                        break;
                }
            }

            if (record.outcome == diff_outcome::changed || record.outcome == diff_outcome::new_object) {
                if (std::ranges::find(result.patched_owners, resolution.owner) == result.patched_owners.end()) {
                    result.patched_owners.push_back(resolution.owner);
                }
            }
            processed_.push_back(std::move(record));
        }

        if (errors > 0U) {
            throw pipeline_error{error_kind::diff, "{} error(s) encountered"_format(errors)};
        }
        if (result.changed_count == 0U) {
            throw pipeline_error{error_kind::diff, "no functional changes found"};
        }

        std::ranges::sort(result.patched_owners, {}, [](const kernel_binary& owner) { return owner.path.native(); });
        result.objects = processed_;
        return result;
    }

    void link_objects(
            const fs::path& ld,
            const std::vector<std::string>& extra_ldflags,
            const std::vector<fs::path>& inputs,
            const fs::path& output,
            const fs::path& log_path) {
        std::vector<std::string> args{ld.string(), "-r"};
        args.insert(args.end(), extra_ldflags.begin(), extra_ldflags.end());
        args.emplace_back("-o");
        args.push_back(output.string());
        for (const auto& input : inputs) {
            args.push_back(input.string());
        }

        internal::files::ensure_dir(output.parent_path());
        auto rc = process::run_logged(args, log_path);
        if (rc != 0) {
            throw pipeline_error{
                    error_kind::build_failure, "failed to link changed objects (exit status {})"_format(rc)};
        }
    }

    void binutils_linker::link(const std::vector<fs::path>& inputs, const fs::path& output) {
        link_objects(config_.ld, config_.extra_ldflags, inputs, output, config_.log_path);
    }

    void binutils_linker::embed_checksum(const fs::path& object) {
        klpforge::embed_checksum(config_.objcopy, object, config_.scratch_dir, config_.log_path);
    }

    std::string md5_hex(const fs::path& file) {
        std::ifstream in{file, std::ios::binary};
        if (!in) {
            throw pipeline_error{error_kind::io, "failed to open {}"_format(file.string())};
        }

        std::unique_ptr<EVP_MD_CTX, detail::md_ctx_deleter> ctx{EVP_MD_CTX_new()};
        if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1) {
            throw pipeline_error{error_kind::io, "failed to initialize md5 digest"};
        }

        std::array<char, 64 * 1024> buffer{};
        while (in) {
            in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            auto count = in.gcount();
            if (count > 0 && EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<size_t>(count)) != 1) {
                throw pipeline_error{error_kind::io, "failed to hash {}"_format(file.string())};
            }
        }

        std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
        unsigned int length = 0U;
        if (EVP_DigestFinal_ex(ctx.get(), digest.data(), &length) != 1) {
            throw pipeline_error{error_kind::io, "failed to hash {}"_format(file.string())};
        }

        std::string hex{};
        hex.reserve(length * 2U);
        for (unsigned int i = 0U; i < length; ++i) {
            hex += "{:02x}"_format(digest[i]);
        }
        return hex;
    }

    void embed_checksum(
            const fs::path& objcopy, const fs::path& object, const fs::path& scratch_dir, const fs::path& log_path) {
        auto checksum_file = scratch_dir / "checksum.tmp";
        auto checksum = md5_hex(object);
        checksum.push_back('\0');
        internal::files::write_text_file(checksum_file, checksum);

        auto rc = process::run_logged(
                {objcopy.string(),
                 "--add-section",
                 ".kpatch.checksum={}"_format(checksum_file.string()),
                 "--set-section-flags",
                 ".kpatch.checksum=alloc,load,contents,readonly",
                 object.string()},
                log_path);
        if (rc != 0) {
            throw pipeline_error{
                    error_kind::build_failure, "failed to add checksum section (exit status {})"_format(rc)};
        }
    }

}  // namespace klpforge
