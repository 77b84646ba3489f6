#include "klpforge/inspect.hpp"

#include "klpforge/error.hpp"
#include "klpforge/format.hpp"
#include "klpforge/process.hpp"
#include "klpforge/utils.hpp"

#include "internal/fs.hpp"

#include <string_view>
#include <vector>

namespace fs = std::filesystem;
using namespace klpforge::literals;

namespace klpforge {

    namespace detail {

        static std::optional<std::string> parse_compiler_signature(std::string_view comment_dump) {
            for (auto line : utils::split_lines(comment_dump)) {
                auto pos = line.find("GCC:"sv);
                if (pos != std::string_view::npos) {
                    return std::string{utils::trim_ascii(line.substr(pos))};
                }
            }
            return std::nullopt;
        }

    }  // namespace detail

    readelf_inspector::readelf_inspector(fs::path readelf, fs::path scratch_dir, fs::path log_path)
            : readelf_{std::move(readelf)}, scratch_dir_{std::move(scratch_dir)}, log_path_{std::move(log_path)} {}

    void readelf_inspector::dump_debug_info(const fs::path& binary, const fs::path& out) {
        std::vector<std::string> args{readelf_.string(), "--debug-dump=info", "--wide", binary.string()};
        auto rc = process::run_captured(args, out, log_path_);
        if (rc != 0) {
            throw pipeline_error{
                    error_kind::prerequisite_missing,
                    "failed to read debug info from {} (readelf exited with {})"_format(binary.string(), rc)};
        }
    }

    std::string readelf_inspector::symbol_table(const fs::path& binary) {
        auto out = scratch_dir_ / "{}.symbols.txt"_format(binary.filename().string());
        std::vector<std::string> args{readelf_.string(), "--wide", "--symbols", binary.string()};
        auto rc = process::run_captured(args, out, log_path_);
        if (rc != 0) {
            throw pipeline_error{
                    error_kind::io,
                    "failed to read symbols from {} (readelf exited with {})"_format(binary.string(), rc)};
        }
        return internal::files::read_text_file(out);
    }

    std::optional<std::string> readelf_inspector::compiler_signature(const fs::path& binary) {
        auto out = scratch_dir_ / "{}.comment.txt"_format(binary.filename().string());
        std::vector<std::string> args{readelf_.string(), "-p", ".comment", binary.string()};
        auto rc = process::run_captured(args, out, log_path_);
        if (rc != 0) {
            return std::nullopt;
        }
        return detail::parse_compiler_signature(internal::files::read_text_file(out));
    }

}  // namespace klpforge
