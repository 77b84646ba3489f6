#pragma once

#include "klpforge/config.hpp"

#include <string_view>

namespace klpforge::internal::platform {
    using namespace std::string_view_literals;

    inline constexpr bool is_x86_64 = KLPFORGE_ARCH_X86_64 != 0;
    inline constexpr bool is_ppc64le = KLPFORGE_ARCH_PPC64LE != 0;
    inline constexpr bool is_s390x = KLPFORGE_ARCH_S390X != 0;
    inline constexpr bool is_arm64 = KLPFORGE_ARCH_ARM64 != 0;

    inline constexpr target_arch host_arch = is_ppc64le ? target_arch::ppc64le
                                           : is_s390x   ? target_arch::s390x
                                           : is_arm64   ? target_arch::aarch64
                                                        : target_arch::x86_64;

    inline constexpr auto version = std::string_view{KLPFORGE_VERSION};

    namespace tool {
        inline constexpr auto make = "make"sv;
        inline constexpr auto patch = "patch"sv;
        inline constexpr auto git = "git"sv;
        inline constexpr auto readelf = "readelf"sv;
        inline constexpr auto objcopy = "objcopy"sv;
        inline constexpr auto ld = "ld"sv;
        inline constexpr auto gcc = "gcc"sv;

        inline constexpr auto cc_wrapper = "klpforge-cc"sv;
        inline constexpr auto create_diff_object = "create-diff-object"sv;
        inline constexpr auto create_kpatch_module = "create-kpatch-module"sv;
        inline constexpr auto create_klp_module = "create-klp-module"sv;
    }  // namespace tool

    // Kbuild template of the patch module, under the tools directory
    inline constexpr auto module_template_dir = "patch-module"sv;

    // Environment the compiler wrapper reads its scratch directory from
    inline constexpr auto cc_tempdir_env = "KLPFORGE_CC_TEMPDIR"sv;

}  // namespace klpforge::internal::platform
