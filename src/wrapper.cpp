#include "klpforge/wrapper.hpp"

#include "klpforge/format.hpp"
#include "klpforge/utils.hpp"

#include "internal/fs.hpp"

extern "C" {
#include <fnmatch.h>
}

#include <algorithm>
#include <array>
#include <system_error>

namespace fs = std::filesystem;
using namespace klpforge::literals;

namespace klpforge::wrapper {

    namespace detail {

        static constexpr std::array ignored_object_patterns{
                "*.mod.o",
                "*built-in.o",
                "vmlinux.o",
                ".tmp_kallsyms*.o",
                ".tmp_vmlinux*",
                // recordmcount.pl intermediates, checked before the .tmp_ prefix is stripped
                ".tmp_mc_*",
                "*/.tmp_mc_*",
                "arch/x86/boot/*",
                "arch/x86/entry/vdso/*",
                "arch/x86/realmode/*",
                "arch/x86/purgatory/*",
                "drivers/firmware/efi/libstub/*",
                "scripts/*",
                "tools/*",
        };

        static constexpr auto tmp_prefix = ".tmp_"sv;

        static std::string relative_to(const fs::path& path, const fs::path& base) {
            if (!path.is_absolute()) {
                return path.lexically_normal().string();
            }
            auto rel = path.lexically_relative(base);
            if (rel.empty() || rel.native().starts_with("..")) {
                return path.string();
            }
            return rel.string();
        }

    }  // namespace detail

    tool_role classify_tool(std::string_view tool) {
        auto name = fs::path{tool}.filename().string();
        if (name.ends_with("gcc"sv) || name.ends_with("cc"sv) || name.ends_with("clang"sv)) {
            return tool_role::compiler;
        }
        if (name.ends_with("ld"sv)) {
            return tool_role::linker;
        }
        return tool_role::other;
    }

    bool is_ignored_object(std::string_view object) {
        std::string path{object};
        return std::ranges::any_of(detail::ignored_object_patterns, [&](const char* pattern) {
            return ::fnmatch(pattern, path.c_str(), 0) == 0;
        });
    }

    std::string normalize_object(std::string_view object) {
        fs::path path{object};
        auto name = path.filename().string();
        if (!name.starts_with(detail::tmp_prefix)) {
            return std::string{object};
        }
        return (path.parent_path() / name.substr(detail::tmp_prefix.size())).string();
    }

    std::optional<std::string> output_argument(const std::vector<std::string>& args) {
        std::optional<std::string> output{};
        for (size_t i = 0U; i < args.size(); ++i) {
            std::string_view arg{args[i]};
            if (arg == "-o"sv) {
                if (i + 1U < args.size()) {
                    output = args[++i];
                }
            }
            else if (arg.starts_with("-o"sv)) {
                output = std::string{arg.substr(2U)};
            }
        }
        return output;
    }

    bool record_invocation(
            tool_role role, const std::vector<std::string>& args, const fs::path& tempdir, const fs::path& cwd) {
        auto output = output_argument(args);
        if (!output) {
            return false;
        }
        auto object = detail::relative_to(*output, cwd);

        if (role == tool_role::compiler) {
            if (!object.ends_with(".o"sv) || is_ignored_object(object)) {
                return false;
            }
            object = normalize_object(object);
            if (is_ignored_object(object)) {
                return false;
            }

            std::error_code ec{};
            if (fs::exists(cwd / object, ec)) {
                internal::files::copy_file(cwd / object, tempdir / "orig" / object);
            }
            internal::files::append_text_file(tempdir / "changed_objs", "{}\n"_format(object));
            return true;
        }

        if (role == tool_role::linker) {
            std::error_code ec{};
            if (!object.ends_with(".ko"sv) || !fs::exists(cwd / object, ec)) {
                return false;
            }
            internal::files::copy_file(cwd / object, tempdir / "module" / object);
            return true;
        }

        return false;
    }

}  // namespace klpforge::wrapper
