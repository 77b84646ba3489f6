#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string_view>
#include <vector>

namespace klpforge {

    using namespace std::string_view_literals;

    // Applies and reverts unified diffs against one source tree.
    class patch_tool {
      public:
        virtual ~patch_tool() = default;

        virtual bool dry_run(const std::filesystem::path& patch) = 0;
        virtual bool apply(const std::filesystem::path& patch) = 0;
        virtual bool revert(const std::filesystem::path& patch) = 0;

        // Reconciles version-control metadata after the tree changed
        virtual void refresh_index() = 0;
    };

    class gnu_patch_tool final : public patch_tool {
      public:
        gnu_patch_tool(
                std::filesystem::path patch,
                std::filesystem::path git,
                std::filesystem::path source_dir,
                std::filesystem::path log_path);

        bool dry_run(const std::filesystem::path& patch) override;
        bool apply(const std::filesystem::path& patch) override;
        bool revert(const std::filesystem::path& patch) override;
        void refresh_index() override;

      private:
        bool run(std::vector<std::string> args);

        std::filesystem::path patch_;
        std::filesystem::path git_;
        std::filesystem::path source_dir_;
        std::filesystem::path log_path_;
    };

    enum class transaction_state : uint8_t { applied, reverting, reverted };

    inline constexpr std::string_view to_string(transaction_state state) {
        switch (state) {
            case transaction_state::applied:
                return "applied"sv;
            case transaction_state::reverting:
                return "reverting"sv;
            case transaction_state::reverted:
                return "reverted"sv;
        }
        return "reverted"sv;
    }

    /*
     * The set of patches currently applied to the source tree.
     *
     * `apply` dry-runs then commits each patch in order; on the first failure the
     * already-applied prefix is reverted and a `transaction` error names the patch.
     * The value is move-only and reverts on destruction, so whatever route leaves
     * the owning scope closes it exactly once.
     */
    class patch_transaction {
      public:
        static patch_transaction apply(patch_tool& tool, std::vector<std::filesystem::path> patches);

        patch_transaction(const patch_transaction&) = delete;
        patch_transaction& operator=(const patch_transaction&) = delete;
        patch_transaction(patch_transaction&& other) noexcept;
        patch_transaction& operator=(patch_transaction&& other) noexcept;
        ~patch_transaction();

        // Reverts in reverse order of application; no-op once reverted.
        void revert_all();

        size_t applied_count() const noexcept { return applied_; }
        transaction_state state() const noexcept { return state_; }
        const std::vector<std::filesystem::path>& patches() const noexcept { return patches_; }

      private:
        patch_transaction(patch_tool& tool, std::vector<std::filesystem::path> patches);

        void close_quietly() noexcept;

        patch_tool* tool_;
        std::vector<std::filesystem::path> patches_;
        size_t applied_{};
        transaction_state state_{transaction_state::applied};
    };

}  // namespace klpforge
