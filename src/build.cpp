#include "klpforge/build.hpp"

#include "klpforge/error.hpp"
#include "klpforge/format.hpp"
#include "klpforge/utils.hpp"

#include "internal/fs.hpp"
#include "internal/platform.hpp"

#include <algorithm>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;
using namespace klpforge::literals;

namespace klpforge {

    namespace detail {

        static uintmax_t file_size_or_zero(const fs::path& path) {
            std::error_code ec{};
            auto size = fs::file_size(path, ec);
            return ec ? 0U : size;
        }

        static std::string read_from_offset(const fs::path& path, uintmax_t offset) {
            std::error_code ec{};
            if (!fs::exists(path, ec)) {
                return {};
            }
            std::ifstream in{path, std::ios::binary};
            if (!in) {
                throw pipeline_error{error_kind::io, "failed to open {}"_format(path.string())};
            }
            in.seekg(static_cast<std::streamoff>(offset));
            return std::string{std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
        }

    }  // namespace detail

    kbuild_backend::kbuild_backend(fs::path make, fs::path source_dir, fs::path log_path)
            : make_{std::move(make)}, source_dir_{std::move(source_dir)}, log_path_{std::move(log_path)} {}

    int kbuild_backend::build(const build_request& request) {
        std::vector<std::string> args{make_.string(), "-j{}"_format(request.jobs)};
        args.insert(args.end(), request.targets.begin(), request.targets.end());
        return process::run_logged(args, log_path_, source_dir_, request.env);
    }

    std::vector<std::string> read_changed_objects(const fs::path& changed_objs) {
        std::error_code ec{};
        if (!fs::exists(changed_objs, ec)) {
            return {};
        }

        std::vector<std::string> objects{};
        for (auto line : utils::split_lines(internal::files::read_text_file(changed_objs))) {
            auto object = utils::trim_ascii(line);
            if (!object.empty()) {
                objects.emplace_back(object);
            }
        }
        std::ranges::sort(objects);
        auto [first, last] = std::ranges::unique(objects);
        objects.erase(first, last);
        return objects;
    }

    differential_build_driver::differential_build_driver(build_backend& backend, build_settings settings)
            : backend_{backend}, settings_{std::move(settings)} {}

    process::environment differential_build_driver::pass_environment(build_pass pass) const {
        process::environment env{{"KCFLAGS", std::string{section_kcflags}}};
        if (pass == build_pass::instrumented) {
            auto cross = "{} {}"_format(settings_.cc_wrapper.string(), settings_.cross_compile.value_or(""));
            env.emplace_back("KBUILD_NOCMDDEP", "1");
            env.emplace_back("KBUILD_MODPOST_WARN", "1");
            env.emplace_back("CROSS_COMPILE", std::move(cross));
            env.emplace_back(std::string{internal::platform::cc_tempdir_env}, settings_.scratch_dir.string());
        }
        else if (settings_.cross_compile) {
            env.emplace_back("CROSS_COMPILE", *settings_.cross_compile);
        }
        return env;
    }

    void differential_build_driver::run_pass(build_pass pass) {
        build_request request{
                .pass = pass, .jobs = settings_.jobs, .targets = settings_.targets, .env = pass_environment(pass)};

        auto rc = backend_.build(request);
        if (process::is_segfault(rc)) {
            process::report_crash(internal::platform::tool::make, settings_.source_dir, settings_.core_dump_dir);
        }
        if (rc != 0) {
            throw pipeline_error{
                    error_kind::build_failure, "{} build failed (exit status {})"_format(to_string(pass), rc)};
        }
    }

    void differential_build_driver::build_baseline() {
        run_pass(build_pass::baseline);

        auto symvers = settings_.source_dir / "Module.symvers";
        std::error_code ec{};
        if (!fs::exists(symvers, ec)) {
            throw pipeline_error{error_kind::build_failure, "Module.symvers missing after baseline build"};
        }
        internal::files::copy_file(symvers, symvers_snapshot());
    }

    instrumented_build differential_build_driver::build_instrumented() {
        auto changed_objs = settings_.scratch_dir / "changed_objs";
        std::error_code ec{};
        fs::remove(changed_objs, ec);

        auto log_offset = detail::file_size_or_zero(settings_.log_path);
        run_pass(build_pass::instrumented);

        instrumented_build result{};
        result.diagnostics = detail::read_from_offset(settings_.log_path, log_offset);
        result.changed_objects = read_changed_objects(changed_objs);
        if (result.changed_objects.empty()) {
            throw pipeline_error{error_kind::build_failure, "no changed objects found"};
        }

        for (const auto& object : result.changed_objects) {
            internal::files::copy_file(settings_.source_dir / object, settings_.scratch_dir / "patched" / object);
        }
        return result;
    }

}  // namespace klpforge
