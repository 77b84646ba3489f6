#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace klpforge {

    using namespace std::string_view_literals;

    // Kernel binary an object is linked into: the core image or a loadable module.
    struct kernel_binary {
        enum class kind_t : uint8_t { core, module };

        kind_t kind{kind_t::core};
        // relative to the build tree; "vmlinux" for the core image
        std::filesystem::path path{"vmlinux"};

        static constexpr bool to_string_formattable = true;

        std::string_view to_string() const { return path.native(); }

        bool is_module() const noexcept { return kind == kind_t::module; }

        // Name handed to the diff compiler: "vmlinux", or the module base name
        // with '-' replaced by '_'
        std::string diff_name() const;

        bool operator==(const kernel_binary&) const = default;
    };

    enum class search_mode : uint8_t { local, broad };

    /*
     * Source of "object X is an input of Y" edges.
     *
     * Paths are relative to the root of the build tree. Local mode only considers
     * the object's own directory; broad mode considers the whole tree.
     */
    class build_graph {
      public:
        virtual ~build_graph() = default;

        virtual std::vector<std::string> parents_of(std::string_view object, search_mode mode) = 0;
        virtual bool exists(std::string_view object) const = 0;
    };

    // Splits one kbuild command line into candidate paths; response lists are not expanded.
    std::vector<std::string> tokenize_command(std::string_view command);

    // `build_graph` backed by the `.<target>.cmd` records kbuild leaves in the tree.
    class kbuild_graph final : public build_graph {
      public:
        explicit kbuild_graph(std::filesystem::path tree_root);

        std::vector<std::string> parents_of(std::string_view object, search_mode mode) override;
        bool exists(std::string_view object) const override;

        const std::optional<std::string>& last_broad_dir() const noexcept { return last_broad_dir_; }

      private:
        // input object -> owners whose command record names it
        using dir_index = std::unordered_map<std::string, std::vector<std::string>>;

        const dir_index& index_for(const std::string& dir);
        std::vector<std::string> parents_in(const std::string& dir, std::string_view object);
        const std::vector<std::string>& all_dirs();

        std::filesystem::path root_;
        std::unordered_map<std::string, dir_index> indices_{};
        std::optional<std::vector<std::string>> all_dirs_{};
        std::optional<std::string> last_broad_dir_{};
    };

    bool is_core_terminal(std::string_view object);

    struct owner_resolution {
        kernel_binary owner{};
        // "two parent matches for X", in walk order
        std::vector<std::string> ambiguities{};
    };

    // Walks the parent chain of an object up to the kernel binary it ends up in.
    class owner_resolver {
      public:
        explicit owner_resolver(build_graph& graph) : graph_{graph} {}

        owner_resolution resolve(std::string_view object);

      private:
        build_graph& graph_;
    };

}  // namespace klpforge
