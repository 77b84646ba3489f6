#include "utils.hpp"

namespace klpforge::test {

    TEST_CASE("002: parse_cli accepts build options", "[002][cli]") {
        build_config cfg{};
        std::vector<std::string> args{
                "klpforge",
                "--name",
                "fix-cve",
                "--sourcedir",
                "/usr/src/linux",
                "--config",
                "/boot/config-6.1",
                "--vmlinux",
                "/usr/lib/debug/vmlinux",
                "--jobs",
                "8",
                "--target",
                "bzImage",
                "--target",
                "modules",
                "--output",
                "/tmp/out",
                "--cache-dir",
                "/tmp/klpforge_tests",
                "--arch",
                "ppc64le",
                "--runtime",
                "kpatch",
                "--cross-compile",
                "powerpc64le-linux-gnu-",
                "--ldflags=-z noexecstack",
                "--skip-compiler-check",
                "--debug",
                "first.patch",
                "second.patch"};
        auto argv = to_argv(args);

        auto result = cli::parse_cli(static_cast<int>(argv.size()), argv.data(), cfg);
        CHECK_FALSE(result);
        CHECK(cfg.patches == std::vector<fs::path>{"first.patch", "second.patch"});
        REQUIRE(cfg.module_name);
        CHECK(*cfg.module_name == "fix-cve");
        REQUIRE(cfg.source_dir);
        CHECK(*cfg.source_dir == "/usr/src/linux");
        REQUIRE(cfg.config_file);
        CHECK(*cfg.config_file == "/boot/config-6.1");
        REQUIRE(cfg.vmlinux);
        CHECK(*cfg.vmlinux == "/usr/lib/debug/vmlinux");
        CHECK(cfg.jobs == 8U);
        CHECK(cfg.targets == std::vector<std::string>{"bzImage", "modules"});
        CHECK(cfg.output_dir == "/tmp/out");
        CHECK(cfg.cache_dir == "/tmp/klpforge_tests");
        CHECK(cfg.arch == target_arch::ppc64le);
        CHECK(cfg.runtime == livepatch_runtime::shadow);
        REQUIRE(cfg.cross_compile);
        CHECK(*cfg.cross_compile == "powerpc64le-linux-gnu-");
        CHECK(cfg.extra_ldflags == std::vector<std::string>{"-z", "noexecstack"});
        CHECK(cfg.skip_compiler_check);
        CHECK(cfg.debug);
        CHECK_FALSE(cfg.arch_version);
    }

    TEST_CASE("002: parse_cli fills host defaults", "[002][cli]") {
        build_config cfg{};
        std::vector<std::string> args{"klpforge", "only.patch"};
        auto argv = to_argv(args);

        auto result = cli::parse_cli(static_cast<int>(argv.size()), argv.data(), cfg);
        CHECK_FALSE(result);
        CHECK(cfg.arch == internal::platform::host_arch);
        CHECK(cfg.jobs >= 1U);
        CHECK(cfg.cache_dir.filename() == ".klpforge");
        CHECK(cfg.targets == std::vector<std::string>{"vmlinux", "modules"});
        CHECK_FALSE(cfg.module_name);
    }

    TEST_CASE("002: parse_cli rejects invalid invocations", "[002][cli]") {
        SECTION("unknown architecture") {
            build_config cfg{};
            std::vector<std::string> args{"klpforge", "--arch", "mips", "a.patch"};
            auto argv = to_argv(args);

            auto result = cli::parse_cli(static_cast<int>(argv.size()), argv.data(), cfg);
            REQUIRE(result);
            CHECK(*result == 2);
        }

        SECTION("quiet and verbose cannot be combined") {
            build_config cfg{};
            std::vector<std::string> args{"klpforge", "--quiet", "--verbose", "a.patch"};
            auto argv = to_argv(args);

            auto result = cli::parse_cli(static_cast<int>(argv.size()), argv.data(), cfg);
            REQUIRE(result);
            CHECK(*result == 2);
        }

        SECTION("no patch files") {
            build_config cfg{};
            std::vector<std::string> args{"klpforge", "--jobs", "2"};
            auto argv = to_argv(args);

            auto result = cli::parse_cli(static_cast<int>(argv.size()), argv.data(), cfg);
            REQUIRE(result);
            CHECK(*result == 2);
        }

        SECTION("zero jobs") {
            build_config cfg{};
            std::vector<std::string> args{"klpforge", "--jobs", "0", "a.patch"};
            auto argv = to_argv(args);

            auto result = cli::parse_cli(static_cast<int>(argv.size()), argv.data(), cfg);
            REQUIRE(result);
            CHECK(*result == 2);
        }
    }

    TEST_CASE("002: parse_cli handles one-shot exits", "[002][cli]") {
        build_config cfg{};
        std::vector<std::string> args{"klpforge", "--version"};
        auto argv = to_argv(args);

        auto result = cli::parse_cli(static_cast<int>(argv.size()), argv.data(), cfg);
        REQUIRE(result);
        CHECK(*result == 0);
    }

    TEST_CASE("002: print_config renders text and json", "[002][cli]") {
        build_config cfg{};
        cfg.patches = {"fix.patch"};
        cfg.arch = target_arch::s390x;
        cfg.jobs = 4U;
        cfg.extra_ldflags = {"-z", "max-page-size=4096"};

        std::ostringstream text{};
        cli::print_config(cfg, text);
        CHECK(text.str().find("patches=fix.patch\n") != std::string::npos);
        CHECK(text.str().find("arch=s390x\n") != std::string::npos);
        CHECK(text.str().find("jobs=4\n") != std::string::npos);
        CHECK(text.str().find("name=<derived>\n") != std::string::npos);

        cfg.format = output_format::json;
        std::ostringstream json{};
        cli::print_config(cfg, json);
        CHECK(json.str().find("\"arch\":\"s390x\"") != std::string::npos);
        CHECK(json.str().find("\"patches\":[\"fix.patch\"]") != std::string::npos);
        CHECK(json.str().find("\"jobs\":4") != std::string::npos);
    }

}  // namespace klpforge::test
