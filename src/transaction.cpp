#include "klpforge/transaction.hpp"

#include "klpforge/error.hpp"
#include "klpforge/format.hpp"
#include "klpforge/process.hpp"
#include "klpforge/utils.hpp"

#include <iostream>
#include <system_error>

namespace fs = std::filesystem;
using namespace klpforge::literals;

namespace klpforge {

    gnu_patch_tool::gnu_patch_tool(fs::path patch, fs::path git, fs::path source_dir, fs::path log_path)
            : patch_{std::move(patch)},
              git_{std::move(git)},
              source_dir_{std::move(source_dir)},
              log_path_{std::move(log_path)} {}

    // patch and git always run to completion; the transaction checks for interrupts between steps so
    // that its count of applied patches matches the tree
    bool gnu_patch_tool::run(std::vector<std::string> args) {
        return process::run_logged(args, log_path_, std::nullopt, {}, false) == 0;
    }

    bool gnu_patch_tool::dry_run(const fs::path& patch) {
        return run({patch_.string(), "-N", "-p1", "--dry-run", "-d", source_dir_.string(), "-i", patch.string()});
    }

    bool gnu_patch_tool::apply(const fs::path& patch) {
        return run({patch_.string(), "-N", "-p1", "-d", source_dir_.string(), "-i", patch.string()});
    }

    bool gnu_patch_tool::revert(const fs::path& patch) {
        return run({patch_.string(), "-p1", "-R", "-d", source_dir_.string(), "-i", patch.string()});
    }

    void gnu_patch_tool::refresh_index() {
        std::error_code ec{};
        if (!fs::exists(source_dir_ / ".git", ec)) {
            return;
        }
        // exits non-zero whenever the tree differs from the index; only the stat refresh matters
        auto rc = process::run_logged(
                {git_.string(), "-C", source_dir_.string(), "update-index", "-q", "--refresh"},
                log_path_,
                std::nullopt,
                {},
                false);
        debug_log("git update-index exited with ", rc);
    }

    patch_transaction::patch_transaction(patch_tool& tool, std::vector<fs::path> patches)
            : tool_{&tool}, patches_{std::move(patches)} {}

    patch_transaction::patch_transaction(patch_transaction&& other) noexcept
            : tool_{other.tool_}, patches_{std::move(other.patches_)}, applied_{other.applied_}, state_{other.state_} {
        other.tool_ = nullptr;
        other.applied_ = 0U;
        other.state_ = transaction_state::reverted;
    }

    patch_transaction& patch_transaction::operator=(patch_transaction&& other) noexcept {
        if (this != &other) {
            close_quietly();
            tool_ = other.tool_;
            patches_ = std::move(other.patches_);
            applied_ = other.applied_;
            state_ = other.state_;
            other.tool_ = nullptr;
            other.applied_ = 0U;
            other.state_ = transaction_state::reverted;
        }
        return *this;
    }

    patch_transaction::~patch_transaction() {
        close_quietly();
    }

    void patch_transaction::close_quietly() noexcept {
        if (tool_ == nullptr || state_ == transaction_state::reverted) {
            return;
        }
        try {
            revert_all();
        } catch (const std::exception& e) {
            std::cerr << "klpforge: warning: {}\n"_format(e.what());
        }
    }

    patch_transaction patch_transaction::apply(patch_tool& tool, std::vector<fs::path> patches) {
        patch_transaction txn{tool, std::move(patches)};

        for (const auto& patch : txn.patches_) {
            if (!tool.dry_run(patch) || !tool.apply(patch)) {
                txn.revert_all();
                throw pipeline_error{
                        error_kind::transaction,
                        "{} doesn't apply"_format(patch.filename().string()),
                        {patch.string()}};
            }
            ++txn.applied_;
            debug_log("applied ", patch.string());
            process::throw_if_interrupted("patch application");
        }
        tool.refresh_index();

        return txn;
    }

    void patch_transaction::revert_all() {
        if (tool_ == nullptr || state_ == transaction_state::reverted) {
            return;
        }
        state_ = transaction_state::reverting;

        while (applied_ > 0U) {
            const auto& patch = patches_[applied_ - 1U];
            if (!tool_->revert(patch)) {
                throw pipeline_error{
                        error_kind::transaction,
                        "failed to revert patch {}"_format(patch.filename().string()),
                        {patch.string()}};
            }
            --applied_;
        }
        tool_->refresh_index();

        state_ = transaction_state::reverted;
    }

}  // namespace klpforge
