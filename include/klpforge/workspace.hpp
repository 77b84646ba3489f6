#pragma once

#include "config.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace klpforge {

    /*
     * Scratch directory and diagnostic log of one run.
     *
     *   <cache>/tmp/{orig,patched,output,module,patch}/
     *   <cache>/build.log
     *
     * Acquisition wipes any scratch left by an earlier run and truncates the log.
     * On destruction the scratch directory is removed unless `debug` or
     * `skip_cleanup` is set, and the log is removed when the run was marked
     * successful and `debug` is not set.
     */
    class scoped_workspace {
      public:
        static scoped_workspace acquire(const std::filesystem::path& cache_dir, bool debug, bool skip_cleanup);

        scoped_workspace(const scoped_workspace&) = delete;
        scoped_workspace& operator=(const scoped_workspace&) = delete;
        scoped_workspace(scoped_workspace&& other) noexcept;
        scoped_workspace& operator=(scoped_workspace&&) = delete;
        ~scoped_workspace();

        void mark_success() noexcept { succeeded_ = true; }
        bool succeeded() const noexcept { return succeeded_; }

        const std::filesystem::path& cache_dir() const noexcept { return cache_dir_; }
        const std::filesystem::path& scratch_dir() const noexcept { return scratch_dir_; }
        const std::filesystem::path& log_path() const noexcept { return log_path_; }

        std::filesystem::path orig_dir() const { return scratch_dir_ / "orig"; }
        std::filesystem::path patched_dir() const { return scratch_dir_ / "patched"; }
        std::filesystem::path output_dir() const { return scratch_dir_ / "output"; }
        std::filesystem::path module_dir() const { return scratch_dir_ / "module"; }
        std::filesystem::path patch_dir() const { return scratch_dir_ / "patch"; }

      private:
        scoped_workspace(std::filesystem::path cache_dir, bool debug, bool skip_cleanup);

        void teardown() noexcept;

        std::filesystem::path cache_dir_;
        std::filesystem::path scratch_dir_;
        std::filesystem::path log_path_;
        bool debug_{false};
        bool skip_cleanup_{false};
        bool succeeded_{false};
        bool active_{true};
    };

    // Obtains a kernel source tree for a version tag into an empty directory.
    class source_provider {
      public:
        virtual ~source_provider() = default;

        virtual void fetch(std::string_view version, const std::filesystem::path& destination) = 0;
    };

    std::string running_kernel_release();

    /*
     * Source tree selection.
     *
     * An explicit source directory is used in place. Otherwise <cache>/src is reused
     * when <cache>/cache.json records the requested version; any other cache content
     * is discarded and the provider asked for a fresh tree.
     */
    class source_cache {
      public:
        source_cache(std::filesystem::path cache_dir, source_provider* provider);

        std::filesystem::path resolve(const build_config& cfg);

        // Removes everything under the cache except the active scratch directory and log.
        void invalidate();

        std::filesystem::path source_dir() const { return cache_dir_ / "src"; }
        std::filesystem::path manifest_path() const { return cache_dir_ / "cache.json"; }

      private:
        std::filesystem::path cache_dir_;
        source_provider* provider_;
    };

}  // namespace klpforge
