#include "utils.hpp"

#include <csignal>

namespace klpforge::test {

    namespace detail {
        static constexpr auto fork_c = "int fork(void)\n{\n\treturn 1;\n}\n\nint exit(void)\n{\n\treturn 0;\n}\n"sv;
        static constexpr auto sched_c = "void schedule(void)\n{\n\tpick_next();\n}\n"sv;

        static constexpr auto fork_patch =
                "--- a/kernel/fork.c\n"
                "+++ b/kernel/fork.c\n"
                "@@ -1,4 +1,4 @@\n"
                " int fork(void)\n"
                " {\n"
                "-\treturn 1;\n"
                "+\treturn 2;\n"
                " }\n"sv;

        static constexpr auto sched_patch =
                "--- a/kernel/sched.c\n"
                "+++ b/kernel/sched.c\n"
                "@@ -1,4 +1,5 @@\n"
                " void schedule(void)\n"
                " {\n"
                "+\tcount_switch();\n"
                " \tpick_next();\n"
                " }\n"sv;

        // Context that is not in the tree
        static constexpr auto stale_patch =
                "--- a/kernel/fork.c\n"
                "+++ b/kernel/fork.c\n"
                "@@ -1,4 +1,4 @@\n"
                " int fork(void)\n"
                " {\n"
                "-\treturn 7;\n"
                "+\treturn 8;\n"
                " }\n"sv;

        static bool patch_installed(const fs::path& dir) {
            return process::run_process(process::process_spec{
                           .args = {"patch", "--version"}, .stdout_path = dir / "patch-version", .append = false}) ==
                   0;
        }

        struct source_tree {
            temp_dir temp{"klpforge_gnu_patch"};
            fs::path src{temp.path / "linux"};
            fs::path log{temp.path / "build.log"};
            gnu_patch_tool tool{"patch", "git", src, log};

            source_tree() {
                write_file(src / "kernel/fork.c", fork_c);
                write_file(src / "kernel/sched.c", sched_c);
                write_file(temp.path / "fork.patch", fork_patch);
                write_file(temp.path / "sched.patch", sched_patch);
                write_file(temp.path / "stale.patch", stale_patch);
            }

            fs::path patch(std::string_view name) const { return temp.path / name; }

            void check_pristine() const {
                CHECK(read_file(src / "kernel/fork.c") == fork_c);
                CHECK(read_file(src / "kernel/sched.c") == sched_c);
                size_t files = 0U;
                for (const auto& entry : fs::recursive_directory_iterator{src}) {
                    if (entry.is_regular_file()) {
                        INFO(entry.path().string());
                        CHECK_FALSE(entry.path().extension() == ".orig");
                        CHECK_FALSE(entry.path().extension() == ".rej");
                        ++files;
                    }
                }
                CHECK(files == 2U);
            }
        };
    }  // namespace detail

    TEST_CASE("014: commands run after an interrupt only report it when asked to", "[014][process]") {
        temp_dir temp{"klpforge_interrupt"};
        auto log = temp.path / "build.log";
        interrupt_handlers handlers{};
        std::raise(SIGINT);
        REQUIRE(process::interrupt_requested());

        CHECK(process::run_logged({"sh", "-c", "echo reverted; exit 3"}, log, std::nullopt, {}, false) == 3);
        CHECK(read_file(log) == "$ sh -c 'echo reverted; exit 3'\nreverted\n");

        auto err = capture_error([&] { (void)process::run_logged({"sh", "-c", "exit 0"}, log); });
        CHECK(err.kind() == error_kind::interrupted);
        CHECK(std::string_view{err.what()} == "interrupted by signal 2 during sh");
    }

    TEST_CASE("014: patch applies and reverts unified diffs byte for byte", "[014][transaction]") {
        detail::source_tree tree{};
        if (!detail::patch_installed(tree.temp.path)) {
            SKIP("patch is not installed");
        }

        {
            auto txn = patch_transaction::apply(tree.tool, {tree.patch("fork.patch"), tree.patch("sched.patch")});
            CHECK(txn.applied_count() == 2U);
            CHECK(read_file(tree.src / "kernel/fork.c") ==
                  "int fork(void)\n{\n\treturn 2;\n}\n\nint exit(void)\n{\n\treturn 0;\n}\n");
            CHECK(read_file(tree.src / "kernel/sched.c") ==
                  "void schedule(void)\n{\n\tcount_switch();\n\tpick_next();\n}\n");

            txn.revert_all();
            CHECK(txn.state() == transaction_state::reverted);
        }
        tree.check_pristine();

        auto log = read_file(tree.log);
        CHECK(log.contains("--dry-run"));
        CHECK(log.contains(" -R "));
    }

    TEST_CASE("014: an already applied patch is refused", "[014][transaction]") {
        detail::source_tree tree{};
        if (!detail::patch_installed(tree.temp.path)) {
            SKIP("patch is not installed");
        }

        REQUIRE(tree.tool.apply(tree.patch("fork.patch")));
        CHECK_FALSE(tree.tool.dry_run(tree.patch("fork.patch")));

        auto err = capture_error([&] { (void)patch_transaction::apply(tree.tool, {tree.patch("fork.patch")}); });
        CHECK(err.kind() == error_kind::transaction);
        CHECK(std::string_view{err.what()} == "fork.patch doesn't apply");

        REQUIRE(tree.tool.revert(tree.patch("fork.patch")));
        tree.check_pristine();
    }

    TEST_CASE("014: a patch with stale context leaves the tree untouched", "[014][transaction]") {
        detail::source_tree tree{};
        if (!detail::patch_installed(tree.temp.path)) {
            SKIP("patch is not installed");
        }

        auto err = capture_error([&] {
            (void)patch_transaction::apply(tree.tool, {tree.patch("sched.patch"), tree.patch("stale.patch")});
        });
        CHECK(err.kind() == error_kind::transaction);
        CHECK(err.subjects() == std::vector<std::string>{tree.patch("stale.patch").string()});
        tree.check_pristine();
    }

    TEST_CASE("014: teardown after an interrupt reverts every patch", "[014][transaction]") {
        detail::source_tree tree{};
        if (!detail::patch_installed(tree.temp.path)) {
            SKIP("patch is not installed");
        }
        interrupt_handlers handlers{};

        auto err = capture_error([&] {
            auto txn = patch_transaction::apply(tree.tool, {tree.patch("fork.patch"), tree.patch("sched.patch")});
            std::raise(SIGINT);
            // the next stage notices the interrupt and unwinds through the transaction
            process::throw_if_interrupted("instrumented build");
        });
        CHECK(err.kind() == error_kind::interrupted);
        CHECK(process::interrupt_requested());
        tree.check_pristine();
    }

    TEST_CASE("014: an explicit revert after an interrupt completes", "[014][transaction]") {
        detail::source_tree tree{};
        if (!detail::patch_installed(tree.temp.path)) {
            SKIP("patch is not installed");
        }
        interrupt_handlers handlers{};

        auto txn = patch_transaction::apply(tree.tool, {tree.patch("fork.patch"), tree.patch("sched.patch")});
        std::raise(SIGINT);

        txn.revert_all();
        CHECK(txn.state() == transaction_state::reverted);
        CHECK(txn.applied_count() == 0U);
        tree.check_pristine();
    }

}  // namespace klpforge::test
