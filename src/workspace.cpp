#include "klpforge/workspace.hpp"

#include "klpforge/error.hpp"
#include "klpforge/format.hpp"
#include "klpforge/utils.hpp"

#include "internal/fs.hpp"
#include "internal/json.hpp"
#include "internal/types.hpp"

extern "C" {
#include <sys/utsname.h>
}

#include <array>
#include <system_error>

namespace fs = std::filesystem;
using namespace klpforge::literals;

namespace klpforge {

    namespace detail {

        static constexpr std::array scratch_subdirs{"orig"sv, "patched"sv, "output"sv, "module"sv, "patch"sv};

        static fs::path absolute_or_self(const fs::path& path) {
            std::error_code ec{};
            auto abs = fs::absolute(path, ec);
            return ec ? path : abs.lexically_normal();
        }

    }  // namespace detail

    scoped_workspace::scoped_workspace(fs::path cache_dir, bool debug, bool skip_cleanup)
            : cache_dir_{detail::absolute_or_self(cache_dir)},
              scratch_dir_{cache_dir_ / "tmp"},
              log_path_{cache_dir_ / "build.log"},
              debug_{debug},
              skip_cleanup_{skip_cleanup} {}

    scoped_workspace::scoped_workspace(scoped_workspace&& other) noexcept
            : cache_dir_{std::move(other.cache_dir_)},
              scratch_dir_{std::move(other.scratch_dir_)},
              log_path_{std::move(other.log_path_)},
              debug_{other.debug_},
              skip_cleanup_{other.skip_cleanup_},
              succeeded_{other.succeeded_},
              active_{other.active_} {
        other.active_ = false;
    }

    scoped_workspace::~scoped_workspace() {
        teardown();
    }

    scoped_workspace scoped_workspace::acquire(const fs::path& cache_dir, bool debug, bool skip_cleanup) {
        scoped_workspace ws{cache_dir, debug, skip_cleanup};

        internal::files::ensure_dir(ws.cache_dir_);
        std::error_code ec{};
        fs::remove_all(ws.scratch_dir_, ec);
        if (ec) {
            throw pipeline_error{
                    error_kind::io, "failed to clear {}: {}"_format(ws.scratch_dir_.string(), ec.message())};
        }
        for (auto sub : detail::scratch_subdirs) {
            internal::files::ensure_dir(ws.scratch_dir_ / sub);
        }
        internal::files::write_text_file(ws.log_path_, "");

        return ws;
    }

    void scoped_workspace::teardown() noexcept {
        if (!active_) {
            return;
        }
        active_ = false;

        std::error_code ec{};
        if (!debug_ && !skip_cleanup_) {
            fs::remove_all(scratch_dir_, ec);
            if (ec) {
                debug_log("failed to remove ", scratch_dir_.string(), ": ", ec.message());
            }
        }
        if (succeeded_ && !debug_) {
            fs::remove(log_path_, ec);
        }
    }

    std::string running_kernel_release() {
        struct utsname info{};
        if (::uname(&info) != 0) {
            throw pipeline_error{error_kind::configuration, "failed to query the running kernel release"};
        }
        return info.release;
    }

    source_cache::source_cache(fs::path cache_dir, source_provider* provider)
            : cache_dir_{std::move(cache_dir)}, provider_{provider} {}

    void source_cache::invalidate() {
        std::error_code ec{};
        if (!fs::is_directory(cache_dir_, ec)) {
            return;
        }
        for (const auto& entry : fs::directory_iterator{cache_dir_, ec}) {
            auto name = entry.path().filename();
            if (name == "tmp" || name == "build.log") {
                continue;
            }
            std::error_code remove_ec{};
            fs::remove_all(entry.path(), remove_ec);
            if (remove_ec) {
                throw pipeline_error{
                        error_kind::io, "failed to remove {}: {}"_format(entry.path().string(), remove_ec.message())};
            }
        }
    }

    fs::path source_cache::resolve(const build_config& cfg) {
        std::error_code ec{};
        if (cfg.source_dir) {
            if (!fs::is_directory(*cfg.source_dir, ec)) {
                throw pipeline_error{
                        error_kind::configuration,
                        "source directory {} does not exist"_format(cfg.source_dir->string()),
                        {cfg.source_dir->string()}};
            }
            return detail::absolute_or_self(*cfg.source_dir);
        }

        auto version = cfg.arch_version.value_or(running_kernel_release());

        if (fs::exists(manifest_path(), ec) && fs::is_directory(source_dir(), ec)) {
            auto manifest = internal::json::read_json_file<internal::cache_manifest>(manifest_path());
            if (manifest.version == version) {
                debug_log("using cached source tree for ", version);
                return source_dir();
            }
            debug_log("cached source tree is ", manifest.version, ", wanted ", version);
        }

        invalidate();
        if (provider_ == nullptr) {
            throw pipeline_error{
                    error_kind::prerequisite_missing,
                    "no source tree cached for kernel {}; pass --sourcedir"_format(version),
                    {version}};
        }

        internal::files::ensure_dir(source_dir());
        provider_->fetch(version, source_dir());
        internal::json::write_json_file(
                internal::cache_manifest{.version = version, .source_dir = source_dir().string()}, manifest_path());
        return source_dir();
    }

}  // namespace klpforge
