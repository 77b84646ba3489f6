#pragma once

#include <glaze/glaze.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace klpforge::internal {

    struct cache_manifest {
        int schema_version{1};
        std::string version{};
        std::string source_dir{};
    };

    struct summary_object {
        std::string path{};
        std::string owner{};
        std::string outcome{};
    };

    struct run_summary {
        int schema_version{1};
        std::string module_name{};
        std::string runtime{};
        std::vector<summary_object> objects{};
        std::vector<std::string> patched_owners{};
        std::vector<std::string> unsatisfied_symbols{};
        std::string module_path{};
    };

    struct printed_config {
        std::vector<std::string> patches{};
        std::string module_name{};
        std::string source_dir{};
        std::string config_file{};
        std::string vmlinux{};
        std::string arch_version{};
        std::string cache_dir{};
        std::string output_dir{};
        std::string core_dump_dir{};
        std::string tools_dir{};
        std::string arch{};
        std::string cross_compile{};
        unsigned jobs{};
        std::vector<std::string> targets{};
        std::string runtime{};
        std::vector<std::string> extra_ldflags{};
        bool debug{};
        bool skip_cleanup{};
        bool skip_compiler_check{};
    };

}  // namespace klpforge::internal

namespace glz {

    template <>
    struct meta<klpforge::internal::cache_manifest> {
        using T = klpforge::internal::cache_manifest;
        static constexpr auto value =
                object("schema_version", &T::schema_version, "version", &T::version, "source_dir", &T::source_dir);
    };

    template <>
    struct meta<klpforge::internal::summary_object> {
        using T = klpforge::internal::summary_object;
        static constexpr auto value = object("path", &T::path, "owner", &T::owner, "outcome", &T::outcome);
    };

    template <>
    struct meta<klpforge::internal::run_summary> {
        using T = klpforge::internal::run_summary;
        static constexpr auto value =
                object("schema_version",
                       &T::schema_version,
                       "module_name",
                       &T::module_name,
                       "runtime",
                       &T::runtime,
                       "objects",
                       &T::objects,
                       "patched_owners",
                       &T::patched_owners,
                       "unsatisfied_symbols",
                       &T::unsatisfied_symbols,
                       "module_path",
                       &T::module_path);
    };

    template <>
    struct meta<klpforge::internal::printed_config> {
        using T = klpforge::internal::printed_config;
        static constexpr auto value =
                object("patches",
                       &T::patches,
                       "module_name",
                       &T::module_name,
                       "source_dir",
                       &T::source_dir,
                       "config_file",
                       &T::config_file,
                       "vmlinux",
                       &T::vmlinux,
                       "arch_version",
                       &T::arch_version,
                       "cache_dir",
                       &T::cache_dir,
                       "output_dir",
                       &T::output_dir,
                       "core_dump_dir",
                       &T::core_dump_dir,
                       "tools_dir",
                       &T::tools_dir,
                       "arch",
                       &T::arch,
                       "cross_compile",
                       &T::cross_compile,
                       "jobs",
                       &T::jobs,
                       "targets",
                       &T::targets,
                       "runtime",
                       &T::runtime,
                       "extra_ldflags",
                       &T::extra_ldflags,
                       "debug",
                       &T::debug,
                       "skip_cleanup",
                       &T::skip_cleanup,
                       "skip_compiler_check",
                       &T::skip_compiler_check);
    };

}  // namespace glz
