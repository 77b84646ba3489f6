#include "utils.hpp"

namespace klpforge::test {

    namespace detail {
        static constexpr auto debug_info_dump = R"(Contents of the .debug_info section:

  Compilation Unit @ offset 0x0:
   Length:        0x2f1 (32-bit)
   Version:       5
 <0><c>: Abbrev Number: 38 (DW_TAG_compile_unit)
    <d>   DW_AT_producer    : (indirect string, offset: 0x0): GNU C11 12.2.0
 <1><2d>: Abbrev Number: 12 (DW_TAG_structure_type)
    <2e>   DW_AT_name        : (indirect string, offset: 0x1c9): alt_instr
    <32>   DW_AT_byte_size   : 12
    <33>   DW_AT_decl_file   : 3
 <2><36>: Abbrev Number: 7 (DW_TAG_member)
    <37>   DW_AT_name        : (indirect string, offset: 0x1d3): instr_offset
    <3b>   DW_AT_byte_size   : 4
 <1><50>: Abbrev Number: 12 (DW_TAG_structure_type)
    <51>   DW_AT_name        : bug_entry
    <52>   DW_AT_declaration : 1
 <1><60>: Abbrev Number: 12 (DW_TAG_structure_type)
    <61>   DW_AT_name        : bug_entry
    <62>   DW_AT_byte_size   : 0xc
 <1><70>: Abbrev Number: 9 (DW_TAG_typedef)
    <71>   DW_AT_name        : exception_table_entry
    <72>   DW_AT_byte_size   : 99
 <1><80>: Abbrev Number: 12 (DW_TAG_structure_type)
    <81>   DW_AT_name        : (indirect string, offset: 0x2a0): exception_table_entry
    <85>   DW_AT_byte_size   : 12
 <1><90>: Abbrev Number: 12 (DW_TAG_structure_type)
    <91>   DW_AT_name        : paravirt_patch_site
    <95>   DW_AT_byte_size   : 16
 <1><a0>: Abbrev Number: 12 (DW_TAG_structure_type)
    <a1>   DW_AT_name        : fixup_entry
    <a5>   DW_AT_byte_size   : 24
)"sv;

        class dump_inspector final : public binary_inspector {
          public:
            explicit dump_inspector(std::string dump) : dump_{std::move(dump)} {}

            void dump_debug_info(const fs::path&, const fs::path& out) override { write_file(out, dump_); }
            std::string symbol_table(const fs::path&) override { return {}; }
            std::optional<std::string> compiler_signature(const fs::path&) override { return std::nullopt; }

          private:
            std::string dump_;
        };
    }  // namespace detail

    TEST_CASE("004: layout fields per architecture", "[004][layout]") {
        auto x86 = layout_fields_for(target_arch::x86_64, false);
        REQUIRE(x86.size() == 4U);
        CHECK(x86[0].struct_name == "alt_instr");
        CHECK(x86[0].env_name == "ALT_STRUCT_SIZE");
        CHECK(x86[3].struct_name == "paravirt_patch_site");
        CHECK_FALSE(x86[3].required);
        CHECK(layout_fields_for(target_arch::s390x, true)[3].required);

        auto ppc = layout_fields_for(target_arch::ppc64le, true);
        REQUIRE(ppc.size() == 3U);
        CHECK(ppc[0].struct_name == "fixup_entry");
        CHECK(ppc[0].env_name == "FIXUP_STRUCT_SIZE");
        CHECK(std::ranges::none_of(ppc, [](const layout_field& f) { return f.struct_name == "alt_instr"; }));
    }

    TEST_CASE("004: scan_debug_info reads struct sizes", "[004][layout]") {
        std::istringstream dump{std::string{detail::debug_info_dump}};
        auto fields = layout_fields_for(target_arch::x86_64, true);
        auto layout = scan_debug_info(dump, fields);

        CHECK(layout.size_of("alt_instr") == std::optional<size_t>{12U});
        CHECK(layout.size_of("bug_entry") == std::optional<size_t>{12U});
        CHECK(layout.size_of("exception_table_entry") == std::optional<size_t>{12U});
        CHECK(layout.size_of("paravirt_patch_site") == std::optional<size_t>{16U});
        CHECK_FALSE(layout.size_of("fixup_entry"));
        CHECK_NOTHROW(require_complete(layout, fields));

        auto env = layout.to_environment();
        CHECK(std::ranges::find(env, std::pair<std::string, std::string>{"ALT_STRUCT_SIZE", "12"}) != env.end());
        CHECK(std::ranges::find(env, std::pair<std::string, std::string>{"PARA_STRUCT_SIZE", "16"}) != env.end());
    }

    TEST_CASE("004: scanning stops once every struct is found", "[004][layout]") {
        std::string dump{detail::debug_info_dump};
        dump += " <1><b0>: Abbrev Number: 12 (DW_TAG_structure_type)\n";
        dump += "    <b1>   DW_AT_name        : alt_instr\n";
        dump += "    <b5>   DW_AT_byte_size   : 40\n";

        std::istringstream in{dump};
        auto layout = scan_debug_info(in, layout_fields_for(target_arch::x86_64, true));
        CHECK(layout.size_of("alt_instr") == std::optional<size_t>{12U});
    }

    TEST_CASE("004: ppc64le needs fixup_entry only", "[004][layout]") {
        std::istringstream dump{std::string{detail::debug_info_dump}};
        auto fields = layout_fields_for(target_arch::ppc64le, false);
        auto layout = scan_debug_info(dump, fields);

        CHECK(layout.size_of("fixup_entry") == std::optional<size_t>{24U});
        CHECK_FALSE(layout.size_of("alt_instr"));
        CHECK_NOTHROW(require_complete(layout, fields));
    }

    TEST_CASE("004: a missing required struct names the struct", "[004][layout]") {
        temp_dir temp{"klpforge_layout"};
        std::string dump{detail::debug_info_dump};
        dump.erase(dump.find(" <1><2d>"), dump.find(" <1><50>") - dump.find(" <1><2d>"));

        detail::dump_inspector inspector{dump};
        auto err = capture_error(
                [&] {
                    (void)probe_section_layout(
                            inspector, temp.path / "vmlinux", target_arch::x86_64, false, temp.path);
                });
        CHECK(err.kind() == error_kind::prerequisite_missing);
        CHECK(err.subjects() == std::vector<std::string>{"alt_instr"});
    }

    TEST_CASE("004: paravirt struct is required only with CONFIG_PARAVIRT", "[004][layout]") {
        temp_dir temp{"klpforge_layout_pv"};
        std::string dump{detail::debug_info_dump};
        dump.erase(dump.find(" <1><90>"), dump.find(" <1><a0>") - dump.find(" <1><90>"));

        detail::dump_inspector inspector{dump};
        auto layout = probe_section_layout(inspector, temp.path / "vmlinux", target_arch::x86_64, false, temp.path);
        CHECK_FALSE(layout.size_of("paravirt_patch_site"));
        CHECK(layout.entries().size() == 3U);

        auto err = capture_error(
                [&] {
                    (void)probe_section_layout(
                            inspector, temp.path / "vmlinux", target_arch::x86_64, true, temp.path);
                });
        CHECK(err.subjects() == std::vector<std::string>{"paravirt_patch_site"});
    }

}  // namespace klpforge::test
