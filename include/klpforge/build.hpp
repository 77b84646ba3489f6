#pragma once

#include "process.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace klpforge {

    using namespace std::string_view_literals;

    enum class build_pass : uint8_t { baseline, instrumented };

    inline constexpr std::string_view to_string(build_pass pass) {
        switch (pass) {
            case build_pass::baseline:
                return "baseline"sv;
            case build_pass::instrumented:
                return "instrumented"sv;
        }
        return "baseline"sv;
    }

    struct build_request {
        build_pass pass{build_pass::baseline};
        unsigned jobs{1U};
        std::vector<std::string> targets{};
        process::environment env{};
    };

    // Runs one pass of the kernel build; returns the build's exit status.
    class build_backend {
      public:
        virtual ~build_backend() = default;

        virtual int build(const build_request& request) = 0;
    };

    class kbuild_backend final : public build_backend {
      public:
        kbuild_backend(std::filesystem::path make, std::filesystem::path source_dir, std::filesystem::path log_path);

        int build(const build_request& request) override;

      private:
        std::filesystem::path make_;
        std::filesystem::path source_dir_;
        std::filesystem::path log_path_;
    };

    struct build_settings {
        std::filesystem::path source_dir{};
        std::filesystem::path scratch_dir{};
        std::filesystem::path log_path{};
        std::filesystem::path core_dump_dir{"/tmp"};
        std::filesystem::path cc_wrapper{};
        std::optional<std::string> cross_compile{};
        unsigned jobs{1U};
        std::vector<std::string> targets{"vmlinux", "modules"};
    };

    struct instrumented_build {
        // relative to the source tree, deduplicated and sorted
        std::vector<std::string> changed_objects{};
        // build output of this pass only
        std::string diagnostics{};
    };

    inline constexpr auto section_kcflags = "-ffunction-sections -fdata-sections"sv;

    /*
     * Drives the two builds whose difference is the patch.
     *
     * Both passes build the same targets with per-function and per-object sections.
     * The instrumented pass routes every compiler and linker call through the
     * klpforge-cc wrapper, which records the objects it rebuilds in
     * <scratch>/changed_objs and saves their previous versions under <scratch>/orig.
     */
    class differential_build_driver {
      public:
        differential_build_driver(build_backend& backend, build_settings settings);

        void build_baseline();

        // Patches must already be applied to the tree.
        instrumented_build build_instrumented();

        process::environment pass_environment(build_pass pass) const;

        std::filesystem::path symvers_snapshot() const { return settings_.scratch_dir / "Module.symvers"; }

      private:
        void run_pass(build_pass pass);

        build_backend& backend_;
        build_settings settings_;
    };

    std::vector<std::string> read_changed_objects(const std::filesystem::path& changed_objs);

}  // namespace klpforge
