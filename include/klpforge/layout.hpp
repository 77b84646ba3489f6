#pragma once

#include "config.hpp"
#include "inspect.hpp"
#include "process.hpp"

#include <cstddef>
#include <filesystem>
#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace klpforge {

    // A special-section record struct the diff compiler needs the size of.
    struct layout_field {
        std::string struct_name{};
        std::string env_name{};
        bool required{true};
    };

    struct layout_entry {
        std::string struct_name{};
        std::string env_name{};
        size_t size{};
    };

    class section_layout {
      public:
        void set(const layout_field& field, size_t size);

        std::optional<size_t> size_of(std::string_view struct_name) const;
        const std::vector<layout_entry>& entries() const noexcept { return entries_; }

        // {ALT_STRUCT_SIZE, 12}, ... as consumed by create-diff-object
        process::environment to_environment() const;

      private:
        std::vector<layout_entry> entries_{};
    };

    std::vector<layout_field> layout_fields_for(target_arch arch, bool paravirt);

    // Scans a `readelf --debug-dump=info` listing; stops once every field has a size.
    section_layout scan_debug_info(std::istream& dump, const std::vector<layout_field>& fields);

    // Throws prerequisite_missing naming the first required struct without a size.
    void require_complete(const section_layout& layout, const std::vector<layout_field>& fields);

    section_layout probe_section_layout(
            binary_inspector& inspector,
            const std::filesystem::path& vmlinux,
            target_arch arch,
            bool paravirt,
            const std::filesystem::path& scratch_dir);

}  // namespace klpforge
