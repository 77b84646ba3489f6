#include "utils.hpp"

#include "internal/json.hpp"
#include "internal/types.hpp"

namespace klpforge::test {

    using namespace klpforge::literals;

    namespace detail {
        class recording_provider final : public source_provider {
          public:
            std::vector<std::string> fetched{};

            void fetch(std::string_view version, const fs::path& destination) override {
                fetched.emplace_back(version);
                write_file(destination / "Makefile", "VERSION = {}\n"_format(version));
            }
        };
    }  // namespace detail

    TEST_CASE("012: acquiring a workspace", "[012][workspace]") {
        temp_dir temp{"klpforge_ws"};
        auto cache = temp.path / "cache";
        write_file(cache / "tmp/stale/leftover.o", "old");
        write_file(cache / "build.log", "previous run\n");

        {
            auto ws = scoped_workspace::acquire(cache, false, false);
            CHECK(ws.scratch_dir() == cache / "tmp");
            CHECK_FALSE(fs::exists(cache / "tmp/stale"));
            for (const auto& dir :
                 {ws.orig_dir(), ws.patched_dir(), ws.output_dir(), ws.module_dir(), ws.patch_dir()}) {
                CHECK(fs::is_directory(dir));
            }
            CHECK(read_file(ws.log_path()).empty());
        }

        CHECK_FALSE(fs::exists(cache / "tmp"));
        CHECK(fs::exists(cache / "build.log"));
    }

    TEST_CASE("012: workspace teardown", "[012][workspace]") {
        temp_dir temp{"klpforge_ws"};
        auto cache = temp.path / "cache";

        SECTION("success drops scratch and log") {
            {
                auto ws = scoped_workspace::acquire(cache, false, false);
                ws.mark_success();
            }
            CHECK_FALSE(fs::exists(cache / "tmp"));
            CHECK_FALSE(fs::exists(cache / "build.log"));
        }

        SECTION("debug keeps both") {
            {
                auto ws = scoped_workspace::acquire(cache, true, false);
                ws.mark_success();
            }
            CHECK(fs::is_directory(cache / "tmp/orig"));
            CHECK(fs::exists(cache / "build.log"));
        }

        SECTION("skip cleanup keeps scratch only") {
            {
                auto ws = scoped_workspace::acquire(cache, false, true);
                ws.mark_success();
            }
            CHECK(fs::is_directory(cache / "tmp/orig"));
            CHECK_FALSE(fs::exists(cache / "build.log"));
        }

        SECTION("a moved-from workspace does nothing") {
            auto ws = scoped_workspace::acquire(cache, false, false);
            {
                scoped_workspace moved{std::move(ws)};
                CHECK(fs::is_directory(cache / "tmp"));
            }
            CHECK_FALSE(fs::exists(cache / "tmp"));
        }
    }

    TEST_CASE("012: explicit source directory", "[012][source]") {
        temp_dir temp{"klpforge_src"};
        fs::create_directories(temp.path / "linux");
        source_cache sources{temp.path / "cache", nullptr};

        build_config cfg{};
        cfg.source_dir = temp.path / "linux";
        CHECK(sources.resolve(cfg) == temp.path / "linux");

        cfg.source_dir = temp.path / "missing";
        auto err = capture_error([&] { (void)sources.resolve(cfg); });
        CHECK(err.kind() == error_kind::configuration);
        CHECK(err.subjects() == std::vector<std::string>{(temp.path / "missing").string()});
    }

    TEST_CASE("012: cached source tree", "[012][source]") {
        temp_dir temp{"klpforge_src"};
        auto cache = temp.path / "cache";
        build_config cfg{};
        cfg.arch_version = "6.1.0-13-amd64";

        SECTION("matching manifest reuses the tree") {
            write_file(cache / "src/Makefile", "cached\n");
            internal::json::write_json_file(
                    internal::cache_manifest{.version = "6.1.0-13-amd64", .source_dir = (cache / "src").string()},
                    cache / "cache.json");
            detail::recording_provider provider{};
            source_cache sources{cache, &provider};

            CHECK(sources.resolve(cfg) == cache / "src");
            CHECK(provider.fetched.empty());
            CHECK(read_file(cache / "src/Makefile") == "cached\n");
        }

        SECTION("another version is discarded and fetched again") {
            write_file(cache / "src/Makefile", "cached\n");
            write_file(cache / "obj/stale.o", "stale");
            write_file(cache / "tmp/orig/kept.o", "scratch");
            internal::json::write_json_file(internal::cache_manifest{.version = "5.10.0"}, cache / "cache.json");
            detail::recording_provider provider{};
            source_cache sources{cache, &provider};

            CHECK(sources.resolve(cfg) == cache / "src");
            CHECK(provider.fetched == std::vector<std::string>{"6.1.0-13-amd64"});
            CHECK(read_file(cache / "src/Makefile") == "VERSION = 6.1.0-13-amd64\n");
            CHECK_FALSE(fs::exists(cache / "obj"));
            CHECK(fs::exists(cache / "tmp/orig/kept.o"));

            auto manifest = internal::json::read_json_file<internal::cache_manifest>(cache / "cache.json");
            CHECK(manifest.version == "6.1.0-13-amd64");
            CHECK(manifest.schema_version == 1);
        }

        SECTION("nothing cached and no provider") {
            source_cache sources{cache, nullptr};
            auto err = capture_error([&] { (void)sources.resolve(cfg); });
            CHECK(err.kind() == error_kind::prerequisite_missing);
            CHECK(err.subjects() == std::vector<std::string>{"6.1.0-13-amd64"});
        }

        SECTION("newer manifest schema is rejected") {
            fs::create_directories(cache / "src");
            write_file(cache / "cache.json", R"({"schema_version":2,"version":"6.1.0-13-amd64"})");
            source_cache sources{cache, nullptr};
            CHECK(capture_error([&] { (void)sources.resolve(cfg); }).kind() == error_kind::io);
        }
    }

    TEST_CASE("012: running kernel release", "[012][source]") {
        CHECK_FALSE(running_kernel_release().empty());
    }

}  // namespace klpforge::test
