#pragma once

#include "fs.hpp"

#include <glaze/glaze.hpp>

#include <filesystem>
#include <string>

namespace klpforge::internal::json {

    namespace fs = std::filesystem;
    using namespace klpforge::literals;

    inline constexpr int supported_schema_version = 1;

    template <typename T>
    std::string to_json(const T& value) {
        std::string json{};
        auto ec = glz::write_json(value, json);
        if (ec) {
            throw pipeline_error{error_kind::io, "failed to serialize json"};
        }
        return json;
    }

    template <typename T>
    void write_json_file(const T& value, const fs::path& path) {
        std::string json{};
        auto ec = glz::write_json(value, json);
        if (ec) {
            throw pipeline_error{error_kind::io, "failed to serialize json for {}"_format(path.string())};
        }
        json.push_back('\n');
        files::write_text_file(path, json);
    }

    template <typename T>
    T read_json_file(const fs::path& path) {
        T value{};
        auto json = files::read_text_file(path);
        auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(value, json);
        if (ec) {
            throw pipeline_error{error_kind::io, "failed to parse json file {}"_format(path.string())};
        }
        if (value.schema_version > supported_schema_version) {
            throw pipeline_error{
                    error_kind::io,
                    "unsupported schema_version in {}: {} > {}"_format(
                            path.string(), value.schema_version, supported_schema_version)};
        }
        return value;
    }

}  // namespace klpforge::internal::json
