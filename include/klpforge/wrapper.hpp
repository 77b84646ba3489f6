#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace klpforge::wrapper {

    using namespace std::string_view_literals;

    enum class tool_role : uint8_t { compiler, linker, other };

    inline constexpr std::string_view to_string(tool_role role) {
        switch (role) {
            case tool_role::compiler:
                return "compiler"sv;
            case tool_role::linker:
                return "linker"sv;
            case tool_role::other:
                return "other"sv;
        }
        return "other"sv;
    }

    // "x86_64-linux-gnu-gcc" -> compiler, "ld" -> linker
    tool_role classify_tool(std::string_view tool);

    // Aggregate and non-kernel objects the diff never looks at
    bool is_ignored_object(std::string_view object);

    // "dir/.tmp_foo.o" -> "dir/foo.o"
    std::string normalize_object(std::string_view object);

    // Value of the last "-o X" / "-oX" argument
    std::optional<std::string> output_argument(const std::vector<std::string>& args);

    /*
     * Records what a wrapped tool is about to overwrite.
     *
     * `args` are the tool's arguments without the tool itself; relative paths are
     * resolved against `cwd`. Compiler outputs are appended to
     * <tempdir>/changed_objs after the previous object is saved as <tempdir>/orig/X.o;
     * an existing module about to be relinked is saved as <tempdir>/module/X.ko.
     * Returns whether anything was recorded.
     */
    bool record_invocation(
            tool_role role,
            const std::vector<std::string>& args,
            const std::filesystem::path& tempdir,
            const std::filesystem::path& cwd);

}  // namespace klpforge::wrapper
