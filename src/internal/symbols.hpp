#pragma once

#include "klpforge/utils.hpp"

#include <algorithm>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace klpforge::internal::symbols {

    using namespace std::string_view_literals;

    inline constexpr std::string_view between(std::string_view line, std::string_view open, std::string_view close) {
        auto start = line.find(open);
        if (start == std::string_view::npos) {
            return {};
        }
        start += open.size();
        auto end = line.find(close, start);
        if (end == std::string_view::npos) {
            return {};
        }
        return line.substr(start, end - start);
    }

    // ld.bfd: "undefined reference to `foo'"
    inline constexpr std::optional<std::string_view> bfd_undefined_reference(std::string_view line) {
        auto name = between(line, "undefined reference to `"sv, "'"sv);
        if (name.empty()) {
            return std::nullopt;
        }
        return name;
    }

    // ld.lld: "error: undefined symbol: foo"
    inline constexpr std::optional<std::string_view> lld_undefined_symbol(std::string_view line) {
        constexpr auto marker = "undefined symbol: "sv;
        auto pos = line.find(marker);
        if (pos == std::string_view::npos) {
            return std::nullopt;
        }
        auto name = utils::trim_ascii(line.substr(pos + marker.size()));
        if (auto space = name.find_first_of(" \t"sv); space != std::string_view::npos) {
            name = name.substr(0U, space);
        }
        if (name.empty()) {
            return std::nullopt;
        }
        return name;
    }

    // modpost: "WARNING: modpost: "foo" [drivers/bar.ko] undefined!"
    inline constexpr std::optional<std::string_view> modpost_undefined(std::string_view line) {
        if (line.find("undefined!"sv) == std::string_view::npos) {
            return std::nullopt;
        }
        auto name = between(line, "\""sv, "\""sv);
        if (name.empty()) {
            return std::nullopt;
        }
        return name;
    }

    // "[<localentry>: 8]" sits between visibility and section index on ppc64le
    inline std::string strip_localentry(std::string_view line) {
        std::string out{line};
        auto open = out.find("[<localentry>"sv);
        if (open != std::string::npos) {
            auto close = out.find(']', open);
            if (close != std::string::npos) {
                out.erase(open, (close - open) + 1U);
            }
        }
        return out;
    }

    inline std::vector<std::string_view> split_fields(std::string_view line) {
        std::vector<std::string_view> fields{};
        size_t cursor = 0U;
        while (cursor < line.size()) {
            auto start = line.find_first_not_of(" \t"sv, cursor);
            if (start == std::string_view::npos) {
                break;
            }
            auto end = line.find_first_of(" \t"sv, start);
            if (end == std::string_view::npos) {
                end = line.size();
            }
            fields.push_back(line.substr(start, end - start));
            cursor = end;
        }
        return fields;
    }

    struct symbol_row {
        std::string_view type{};
        std::string_view bind{};
        std::string_view ndx{};
        std::string_view name{};
    };

    //    Num:    Value          Size Type    Bind   Vis      Ndx Name
    //      5: 0000000000000000    24 FUNC    GLOBAL DEFAULT    2 foo
    inline std::optional<symbol_row> parse_symbol_row(const std::vector<std::string_view>& fields) {
        if (fields.size() < 8U || !fields[0].ends_with(':')) {
            return std::nullopt;
        }
        return symbol_row{.type = fields[3], .bind = fields[4], .ndx = fields[6], .name = fields[7]};
    }

    inline constexpr bool is_provided(const symbol_row& row) {
        return (row.type == "FUNC"sv || row.type == "OBJECT"sv) && (row.bind == "GLOBAL"sv || row.bind == "WEAK"sv) &&
               row.ndx != "UND"sv;
    }

    inline void sort_unique(std::vector<std::string>& names) {
        std::ranges::sort(names);
        auto [first, last] = std::ranges::unique(names);
        names.erase(first, last);
    }

}  // namespace klpforge::internal::symbols
