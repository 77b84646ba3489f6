#pragma once

#include "graph.hpp"
#include "inspect.hpp"
#include "layout.hpp"

#include <array>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace klpforge {

    using namespace std::string_view_literals;

    enum class diff_outcome : uint8_t { unchanged, changed, error, new_object, skipped };

    inline constexpr std::string_view to_string(diff_outcome outcome) {
        switch (outcome) {
            case diff_outcome::unchanged:
                return "unchanged"sv;
            case diff_outcome::changed:
                return "changed"sv;
            case diff_outcome::error:
                return "error"sv;
            case diff_outcome::new_object:
                return "new_object"sv;
            case diff_outcome::skipped:
                return "skipped"sv;
        }
        return "error"sv;
    }

    inline constexpr int diff_exit_changed = 0;
    inline constexpr int diff_exit_unchanged = 3;

    inline constexpr diff_outcome classify_diff_exit(int exit_code) noexcept {
        switch (exit_code) {
            case diff_exit_changed:
                return diff_outcome::changed;
            case diff_exit_unchanged:
                return diff_outcome::unchanged;
            default:
                return diff_outcome::error;
        }
    }

    struct changed_object {
        std::string path{};
        std::optional<kernel_binary> owner{};
        diff_outcome outcome{diff_outcome::skipped};
    };

    struct diff_request {
        std::filesystem::path original{};
        std::filesystem::path patched{};
        kernel_binary owner{};
        // baseline copy of the owner: vmlinux, or the module saved before relinking
        std::filesystem::path owner_binary{};
        std::filesystem::path output{};
        std::filesystem::path symvers{};
        // module name with '-' replaced by '_'
        std::string module_name{};
    };

    // Compares two builds of one object; exit 0 changed, 3 unchanged, anything else failed.
    class diff_compiler {
      public:
        virtual ~diff_compiler() = default;

        virtual int compare(const diff_request& request) = 0;
    };

    class create_diff_object_tool final : public diff_compiler {
      public:
        struct settings {
            std::filesystem::path executable{};
            std::filesystem::path scratch_dir{};
            std::filesystem::path log_path{};
            std::filesystem::path core_dump_dir{"/tmp"};
            bool debug{false};
        };

        create_diff_object_tool(binary_inspector& inspector, section_layout layout, settings config);

        int compare(const diff_request& request) override;

        // `readelf --symbols` dump of the owner, produced once per owner
        std::filesystem::path symbol_table_for(const diff_request& request);

      private:
        binary_inspector& inspector_;
        section_layout layout_;
        settings config_;
        std::map<std::filesystem::path, std::filesystem::path> symtabs_{};
    };

    struct module_request {
        std::filesystem::path linked_object{};
        std::string module_name{};
        std::filesystem::path symvers{};
        bool native_livepatch{true};
    };

    // Turns the linked diff object into a loadable module; returns the module path.
    class module_assembler {
      public:
        virtual ~module_assembler() = default;

        virtual std::filesystem::path assemble(const module_request& request) = 0;
    };

    class kbuild_module_assembler final : public module_assembler {
      public:
        struct settings {
            std::filesystem::path make{"make"};
            std::filesystem::path create_kpatch_module{};
            std::filesystem::path create_klp_module{};
            // Kbuild makefile and runtime hooks compiled into the module
            std::filesystem::path template_dir{};
            std::filesystem::path source_dir{};
            std::filesystem::path patch_dir{};
            std::filesystem::path log_path{};
            std::filesystem::path core_dump_dir{"/tmp"};
            std::vector<std::string> extra_ldflags{};
        };

        explicit kbuild_module_assembler(settings config);

        std::filesystem::path assemble(const module_request& request) override;

      private:
        void run_tool(const std::vector<std::string>& args, std::string_view what);

        settings config_;
    };

    struct aggregator_settings {
        std::filesystem::path scratch_dir{};
        std::filesystem::path vmlinux{};
        std::filesystem::path symvers{};
        std::filesystem::path log_path{};
        std::string module_name{};
    };

    struct aggregation_result {
        std::vector<changed_object> objects{};
        // objects in <scratch>/output/ to link, relative to it
        std::vector<std::string> outputs{};
        std::vector<kernel_binary> patched_owners{};
        size_t changed_count{};
    };

    inline constexpr std::array excluded_objects{"usr/initramfs_data.o"sv, "arch/x86/lib/copy_user_64.o"sv};

    /*
     * Runs the diff compiler over every changed object.
     *
     * Objects with a baseline copy under <scratch>/orig are compared against their
     * instrumented copy under <scratch>/patched, with the result written to
     * <scratch>/output. Objects the baseline never had are copied through.
     */
    class aggregator {
      public:
        aggregator(owner_resolver& resolver, diff_compiler& compiler, aggregator_settings settings);

        aggregation_result aggregate(const std::vector<std::string>& changed_objects);

        std::filesystem::path owner_binary(const kernel_binary& owner) const;

        // Objects handled so far, including those of an aggregation that failed
        const std::vector<changed_object>& processed() const noexcept { return processed_; }

      private:
        void log(std::string_view line) const;

        owner_resolver& resolver_;
        diff_compiler& compiler_;
        aggregator_settings settings_;
        std::vector<changed_object> processed_{};
    };

    // Combines the diff outputs into the object the module is built from.
    class object_linker {
      public:
        virtual ~object_linker() = default;

        virtual void link(const std::vector<std::filesystem::path>& inputs, const std::filesystem::path& output) = 0;
        virtual void embed_checksum(const std::filesystem::path& object) = 0;
    };

    class binutils_linker final : public object_linker {
      public:
        struct settings {
            std::filesystem::path ld{"ld"};
            std::filesystem::path objcopy{"objcopy"};
            std::vector<std::string> extra_ldflags{};
            std::filesystem::path scratch_dir{};
            std::filesystem::path log_path{};
        };

        explicit binutils_linker(settings config) : config_{std::move(config)} {}

        void link(const std::vector<std::filesystem::path>& inputs, const std::filesystem::path& output) override;
        void embed_checksum(const std::filesystem::path& object) override;

      private:
        settings config_;
    };

    // `ld -r` of the diff outputs into one relocatable object
    void link_objects(
            const std::filesystem::path& ld,
            const std::vector<std::string>& extra_ldflags,
            const std::vector<std::filesystem::path>& inputs,
            const std::filesystem::path& output,
            const std::filesystem::path& log_path);

    std::string md5_hex(const std::filesystem::path& file);

    // Embeds md5_hex(object) plus a NUL terminator as the .kpatch.checksum section
    void embed_checksum(
            const std::filesystem::path& objcopy,
            const std::filesystem::path& object,
            const std::filesystem::path& scratch_dir,
            const std::filesystem::path& log_path);

}  // namespace klpforge
