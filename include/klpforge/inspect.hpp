#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace klpforge {

    // Read-only queries against ELF binaries.
    class binary_inspector {
      public:
        virtual ~binary_inspector() = default;

        // Writes the DWARF .debug_info dump of `binary` to `out`.
        virtual void dump_debug_info(const std::filesystem::path& binary, const std::filesystem::path& out) = 0;

        // `readelf --wide --symbols` listing of `binary`.
        virtual std::string symbol_table(const std::filesystem::path& binary) = 0;

        // First "GCC: ..." string of the .comment section, if any.
        virtual std::optional<std::string> compiler_signature(const std::filesystem::path& binary) = 0;
    };

    class readelf_inspector final : public binary_inspector {
      public:
        readelf_inspector(
                std::filesystem::path readelf, std::filesystem::path scratch_dir, std::filesystem::path log_path);

        void dump_debug_info(const std::filesystem::path& binary, const std::filesystem::path& out) override;
        std::string symbol_table(const std::filesystem::path& binary) override;
        std::optional<std::string> compiler_signature(const std::filesystem::path& binary) override;

      private:
        std::filesystem::path readelf_;
        std::filesystem::path scratch_dir_;
        std::filesystem::path log_path_;
    };

}  // namespace klpforge
