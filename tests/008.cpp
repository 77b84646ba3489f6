#include "utils.hpp"

namespace klpforge::test {

    TEST_CASE("008: wrapped tools are classified by name", "[008][wrapper]") {
        using wrapper::tool_role;

        CHECK(wrapper::classify_tool("gcc") == tool_role::compiler);
        CHECK(wrapper::classify_tool("x86_64-linux-gnu-gcc") == tool_role::compiler);
        CHECK(wrapper::classify_tool("/usr/bin/cc") == tool_role::compiler);
        CHECK(wrapper::classify_tool("clang") == tool_role::compiler);
        CHECK(wrapper::classify_tool("ld") == tool_role::linker);
        CHECK(wrapper::classify_tool("powerpc64le-linux-gnu-ld") == tool_role::linker);
        CHECK(wrapper::classify_tool("objcopy") == tool_role::other);
        CHECK(wrapper::classify_tool("ar") == tool_role::other);
    }

    TEST_CASE("008: aggregate and non-kernel objects are ignored", "[008][wrapper]") {
        for (auto object :
             {"drivers/foo/foo.mod.o",
              "kernel/built-in.o",
              "vmlinux.o",
              ".tmp_kallsyms1.o",
              ".tmp_vmlinux.kallsyms1",
              "arch/x86/boot/compressed/misc.o",
              "arch/x86/entry/vdso/vclock_gettime.o",
              "arch/x86/realmode/rm/trampoline_64.o",
              "arch/x86/purgatory/purgatory.o",
              "drivers/firmware/efi/libstub/efi-stub.o",
              "scripts/mod/modpost.o",
              "tools/objtool/check.o"}) {
            INFO(object);
            CHECK(wrapper::is_ignored_object(object));
        }
        CHECK_FALSE(wrapper::is_ignored_object("fs/proc/meminfo.o"));
        CHECK_FALSE(wrapper::is_ignored_object("arch/x86/kernel/process.o"));
    }

    TEST_CASE("008: output argument and temporary names", "[008][wrapper]") {
        CHECK(wrapper::output_argument({"-c", "-o", "fs/proc/meminfo.o", "fs/proc/meminfo.c"}) ==
              std::optional<std::string>{"fs/proc/meminfo.o"});
        CHECK(wrapper::output_argument({"-c", "-ofs/a.o", "fs/a.c"}) == std::optional<std::string>{"fs/a.o"});
        CHECK_FALSE(wrapper::output_argument({"-E", "fs/a.c"}));

        CHECK(wrapper::normalize_object("fs/proc/.tmp_meminfo.o") == "fs/proc/meminfo.o");
        CHECK(wrapper::normalize_object("fs/proc/meminfo.o") == "fs/proc/meminfo.o");
    }

    TEST_CASE("008: compiler invocations record changed objects", "[008][wrapper]") {
        temp_dir temp{"klpforge_wrapper_cc"};
        auto tree = temp.path / "linux";
        auto scratch = temp.path / "scratch";
        write_file(tree / "fs/proc/meminfo.o", "baseline");
        fs::create_directories(scratch);

        CHECK(wrapper::record_invocation(
                wrapper::tool_role::compiler, {"-c", "-o", "fs/proc/meminfo.o", "fs/proc/meminfo.c"}, scratch, tree));
        CHECK(read_file(scratch / "orig/fs/proc/meminfo.o") == "baseline");

        // first build of a new object has nothing to save
        CHECK(wrapper::record_invocation(
                wrapper::tool_role::compiler, {"-c", "-o", "fs/proc/.tmp_new.o", "fs/proc/new.c"}, scratch, tree));
        CHECK_FALSE(fs::exists(scratch / "orig/fs/proc/new.o"));

        CHECK_FALSE(wrapper::record_invocation(
                wrapper::tool_role::compiler, {"-c", "-o", "scripts/mod/modpost.o", "x.c"}, scratch, tree));
        CHECK_FALSE(wrapper::record_invocation(
                wrapper::tool_role::compiler, {"-S", "-o", "fs/proc/meminfo.s", "x.c"}, scratch, tree));

        CHECK(read_changed_objects(scratch / "changed_objs") ==
              std::vector<std::string>{"fs/proc/meminfo.o", "fs/proc/new.o"});
    }

    TEST_CASE("008: recordmcount intermediates are not recorded", "[008][wrapper]") {
        temp_dir temp{"klpforge_wrapper_mc"};
        auto tree = temp.path / "linux";
        auto scratch = temp.path / "scratch";
        write_file(tree / "kernel/fork.o", "baseline");
        fs::create_directories(scratch);

        CHECK(wrapper::is_ignored_object("kernel/.tmp_mc_fork.o"));
        CHECK(wrapper::is_ignored_object(".tmp_mc_init.o"));
        CHECK_FALSE(wrapper::is_ignored_object("kernel/.tmp_fork.o"));

        CHECK_FALSE(wrapper::record_invocation(
                wrapper::tool_role::compiler,
                {"gcc", "-c", "-o", "kernel/.tmp_mc_fork.o", "kernel/.tmp_fork.s"},
                scratch,
                tree));
        CHECK_FALSE(fs::exists(scratch / "changed_objs"));
        CHECK_FALSE(fs::exists(scratch / "orig"));

        CHECK(wrapper::record_invocation(
                wrapper::tool_role::compiler,
                {"gcc", "-c", "-o", "kernel/.tmp_fork.o", "kernel/fork.c"},
                scratch,
                tree));
        CHECK(read_file(scratch / "changed_objs") == "kernel/fork.o\n");
    }

    TEST_CASE("008: absolute output paths are recorded relative to the tree", "[008][wrapper]") {
        temp_dir temp{"klpforge_wrapper_abs"};
        auto tree = temp.path / "linux";
        auto scratch = temp.path / "scratch";
        fs::create_directories(tree / "kernel");
        fs::create_directories(scratch);

        auto output = (tree / "kernel/fork.o").string();
        CHECK(wrapper::record_invocation(wrapper::tool_role::compiler, {"-c", "-o", output}, scratch, tree));
        CHECK(read_file(scratch / "changed_objs") == "kernel/fork.o\n");
    }

    TEST_CASE("008: linker invocations save the module before relinking", "[008][wrapper]") {
        temp_dir temp{"klpforge_wrapper_ld"};
        auto tree = temp.path / "linux";
        auto scratch = temp.path / "scratch";
        write_file(tree / "drivers/foo/foo.ko", "baseline-ko");
        fs::create_directories(scratch);

        CHECK(wrapper::record_invocation(
                wrapper::tool_role::linker,
                {"-r", "-o", "drivers/foo/foo.ko", "drivers/foo/foo.o", "drivers/foo/foo.mod.o"},
                scratch,
                tree));
        CHECK(read_file(scratch / "module/drivers/foo/foo.ko") == "baseline-ko");

        CHECK_FALSE(wrapper::record_invocation(
                wrapper::tool_role::linker, {"-r", "-o", "drivers/foo/foo.o", "drivers/foo/a.o"}, scratch, tree));
        CHECK_FALSE(wrapper::record_invocation(
                wrapper::tool_role::linker, {"-r", "-o", "drivers/bar/bar.ko"}, scratch, tree));
        CHECK_FALSE(fs::exists(scratch / "changed_objs"));
    }

}  // namespace klpforge::test
