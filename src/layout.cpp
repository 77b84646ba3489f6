#include "klpforge/layout.hpp"

#include "klpforge/error.hpp"
#include "klpforge/format.hpp"
#include "klpforge/utils.hpp"

#include <algorithm>
#include <fstream>

namespace fs = std::filesystem;
using namespace klpforge::literals;

namespace klpforge {

    namespace detail {

        struct die_state {
            bool is_struct{false};
            std::optional<std::string> name{};
            std::optional<size_t> byte_size{};
        };

        // " <1><2d>: Abbrev Number: 5 (DW_TAG_structure_type)"
        static constexpr bool is_die_header(std::string_view line) {
            auto trimmed = utils::trim_ascii(line);
            return trimmed.starts_with('<') && trimmed.find("Abbrev Number:"sv) != std::string_view::npos;
        }

        // "<2e>   DW_AT_name  : (indirect string, offset: 0x1c9): alt_instr" -> "alt_instr"
        static constexpr std::string_view attribute_value(std::string_view line) {
            auto colon = line.rfind(": "sv);
            if (colon == std::string_view::npos) {
                return {};
            }
            return utils::trim_ascii(line.substr(colon + 2U));
        }

        static std::optional<size_t> parse_size(std::string_view text) {
            if (text.starts_with("0x"sv)) {
                return utils::parse_arithmetic<size_t>(text.substr(2U), 16);
            }
            return utils::parse_arithmetic<size_t>(text);
        }

    }  // namespace detail

    void section_layout::set(const layout_field& field, size_t size) {
        auto it = std::ranges::find(entries_, field.struct_name, &layout_entry::struct_name);
        if (it != entries_.end()) {
            it->size = size;
            return;
        }
        entries_.push_back(layout_entry{.struct_name = field.struct_name, .env_name = field.env_name, .size = size});
    }

    std::optional<size_t> section_layout::size_of(std::string_view struct_name) const {
        auto it = std::ranges::find(entries_, struct_name, &layout_entry::struct_name);
        if (it == entries_.end()) {
            return std::nullopt;
        }
        return it->size;
    }

    process::environment section_layout::to_environment() const {
        process::environment env{};
        env.reserve(entries_.size());
        for (const auto& entry : entries_) {
            env.emplace_back(entry.env_name, std::to_string(entry.size));
        }
        return env;
    }

    std::vector<layout_field> layout_fields_for(target_arch arch, bool paravirt) {
        if (arch == target_arch::ppc64le) {
            return {
                    {"fixup_entry", "FIXUP_STRUCT_SIZE", true},
                    {"bug_entry", "BUG_STRUCT_SIZE", true},
                    {"exception_table_entry", "EX_STRUCT_SIZE", true},
            };
        }
        return {
                {"alt_instr", "ALT_STRUCT_SIZE", true},
                {"bug_entry", "BUG_STRUCT_SIZE", true},
                {"exception_table_entry", "EX_STRUCT_SIZE", true},
                {"paravirt_patch_site", "PARA_STRUCT_SIZE", paravirt},
        };
    }

    section_layout scan_debug_info(std::istream& dump, const std::vector<layout_field>& fields) {
        section_layout layout{};
        detail::die_state die{};
        size_t found = 0U;

        auto finish_die = [&] {
            if (die.is_struct && die.name && die.byte_size && *die.byte_size > 0U) {
                auto field = std::ranges::find(fields, *die.name, &layout_field::struct_name);
                if (field != fields.end() && !layout.size_of(field->struct_name)) {
                    layout.set(*field, *die.byte_size);
                    ++found;
                }
            }
            die = detail::die_state{};
        };

        std::string line{};
        while (found < fields.size() && std::getline(dump, line)) {
            if (detail::is_die_header(line)) {
                finish_die();
                die.is_struct = line.find("(DW_TAG_structure_type)"sv) != std::string::npos;
                continue;
            }
            if (!die.is_struct) {
                continue;
            }
            if (line.find("DW_AT_name"sv) != std::string::npos) {
                die.name = std::string{detail::attribute_value(line)};
            }
            else if (line.find("DW_AT_byte_size"sv) != std::string::npos) {
                die.byte_size = detail::parse_size(detail::attribute_value(line));
            }
        }
        finish_die();

        return layout;
    }

    void require_complete(const section_layout& layout, const std::vector<layout_field>& fields) {
        for (const auto& field : fields) {
            if (field.required && !layout.size_of(field.struct_name)) {
                throw pipeline_error{
                        error_kind::prerequisite_missing,
                        "can't find special struct {} size"_format(field.struct_name),
                        {field.struct_name}};
            }
        }
    }

    section_layout probe_section_layout(
            binary_inspector& inspector,
            const fs::path& vmlinux,
            target_arch arch,
            bool paravirt,
            const fs::path& scratch_dir) {
        auto fields = layout_fields_for(arch, paravirt);
        auto dump_path = scratch_dir / "debug_info.txt";
        inspector.dump_debug_info(vmlinux, dump_path);

        std::ifstream dump{dump_path};
        if (!dump) {
            throw pipeline_error{error_kind::io, "failed to open {}"_format(dump_path.string())};
        }
        auto layout = scan_debug_info(dump, fields);
        require_complete(layout, fields);

        for (const auto& entry : layout.entries()) {
            debug_log("layout ", entry.struct_name, " = ", entry.size);
        }
        return layout;
    }

}  // namespace klpforge
