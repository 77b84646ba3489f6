#pragma once

#include "klpforge/error.hpp"
#include "klpforge/format.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>

namespace klpforge::internal::files {

    namespace fs = std::filesystem;
    using namespace klpforge::literals;

    inline std::string read_text_file(const fs::path& path) {
        std::ifstream in{path};
        if (!in) {
            throw pipeline_error{error_kind::io, "failed to open {}"_format(path.string())};
        }
        std::ostringstream ss{};
        ss << in.rdbuf();
        return ss.str();
    }

    inline void write_text_file(const fs::path& path, std::string_view text) {
        std::ofstream out{path, std::ios::binary | std::ios::trunc};
        if (!out) {
            throw pipeline_error{error_kind::io, "failed to open file for write: {}"_format(path.string())};
        }
        out << text;
        if (!out) {
            throw pipeline_error{error_kind::io, "failed to write file: {}"_format(path.string())};
        }
    }

    inline void append_text_file(const fs::path& path, std::string_view text) {
        std::ofstream out{path, std::ios::binary | std::ios::app};
        if (!out) {
            throw pipeline_error{error_kind::io, "failed to open file for append: {}"_format(path.string())};
        }
        out << text;
    }

    inline void ensure_dir(const fs::path& path) {
        std::error_code ec{};
        fs::create_directories(path, ec);
        if (ec) {
            throw pipeline_error{error_kind::io, "failed to create directory: {}"_format(path.string())};
        }
    }

    inline void copy_file(const fs::path& from, const fs::path& to) {
        if (to.has_parent_path()) {
            ensure_dir(to.parent_path());
        }
        std::error_code ec{};
        fs::copy_file(from, to, fs::copy_options::overwrite_existing, ec);
        if (ec) {
            throw pipeline_error{
                    error_kind::io, "failed to copy {} to {}: {}"_format(from.string(), to.string(), ec.message())};
        }
    }

}  // namespace klpforge::internal::files
