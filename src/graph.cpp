#include "klpforge/graph.hpp"

#include "klpforge/error.hpp"
#include "klpforge/format.hpp"
#include "klpforge/utils.hpp"

#include "internal/fs.hpp"

extern "C" {
#include <fnmatch.h>
}

#include <algorithm>
#include <array>
#include <set>
#include <system_error>

namespace fs = std::filesystem;
using namespace klpforge::literals;

namespace klpforge {

    namespace detail {

        static constexpr std::array core_terminal_patterns{
                "*built-in.o",
                "*built-in.a",
                "lib.a",
                "*/lib.a",
                "vmlinux.o",
                "vmlinux.a",
                "arch/x86/kernel/head*.o",
                "arch/x86/kernel/ebda.o",
                "arch/x86/kernel/platform-quirks.o",
        };

        static constexpr bool is_linkable(std::string_view path) {
            return path.ends_with(".o"sv) || path.ends_with(".a"sv) || path.ends_with(".ko"sv);
        }

        static constexpr std::string_view strip_dot_slash(std::string_view token) {
            while (token.starts_with("./"sv)) {
                token.remove_prefix(2U);
            }
            return token;
        }

        static constexpr std::string_view trim_token(std::string_view token) {
            constexpr auto punctuation = "'\"();,"sv;
            auto first = token.find_first_not_of(punctuation);
            if (first == std::string_view::npos) {
                return {};
            }
            auto last = token.find_last_not_of(punctuation);
            return token.substr(first, (last - first) + 1U);
        }

        // ".foo.o.cmd" -> "foo.o"
        static std::optional<std::string> cmd_record_target(std::string_view filename) {
            if (!filename.starts_with('.') || !filename.ends_with(".cmd"sv) || filename.size() <= 5U) {
                return std::nullopt;
            }
            return std::string{filename.substr(1U, filename.size() - 5U)};
        }

        // The "cmd_<target> := <command>" line of a record ("savedcmd_" on newer kernels)
        static std::optional<std::string_view> command_of_record(std::string_view record) {
            for (auto line : utils::split_lines(record)) {
                if (!line.starts_with("cmd_"sv) && !line.starts_with("savedcmd_"sv)) {
                    continue;
                }
                auto assign = line.find(":="sv);
                if (assign == std::string_view::npos) {
                    continue;
                }
                return line.substr(assign + 2U);
            }
            return std::nullopt;
        }

        static std::string join_relative(const std::string& dir, std::string_view name) {
            if (dir.empty()) {
                return std::string{name};
            }
            return (fs::path{dir} / name).string();
        }

    }  // namespace detail

    std::string kernel_binary::diff_name() const {
        if (kind == kind_t::core) {
            return "vmlinux";
        }
        auto name = path.stem().string();
        std::ranges::replace(name, '-', '_');
        return name;
    }

    std::vector<std::string> tokenize_command(std::string_view command) {
        std::vector<std::string> tokens{};
        size_t cursor = 0U;
        while (cursor < command.size()) {
            auto start = command.find_first_not_of(" \t\r\n"sv, cursor);
            if (start == std::string_view::npos) {
                break;
            }
            auto end = command.find_first_of(" \t\r\n"sv, start);
            if (end == std::string_view::npos) {
                end = command.size();
            }
            auto token = detail::strip_dot_slash(detail::trim_token(command.substr(start, end - start)));
            if (!token.empty()) {
                tokens.emplace_back(token);
            }
            cursor = end;
        }
        return tokens;
    }

    kbuild_graph::kbuild_graph(fs::path tree_root) : root_{std::move(tree_root)} {}

    bool kbuild_graph::exists(std::string_view object) const {
        std::error_code ec{};
        return fs::exists(root_ / object, ec);
    }

    const kbuild_graph::dir_index& kbuild_graph::index_for(const std::string& dir) {
        if (auto it = indices_.find(dir); it != indices_.end()) {
            return it->second;
        }

        dir_index index{};
        auto add_edge = [&](std::string_view token, const std::string& owner) {
            token = detail::strip_dot_slash(token);
            if (!detail::is_linkable(token)) {
                return;
            }
            // built-in.a records name their members relative to the record's directory:
            //   printf "fs/ext4/%s " balloc.o inode.o | xargs ar cDPrST fs/ext4/built-in.a
            auto input = token.contains('/') ? std::string{token} : detail::join_relative(dir, token);
            if (input == owner) {
                return;
            }
            auto& owners = index[input];
            if (std::ranges::find(owners, owner) == owners.end()) {
                owners.push_back(owner);
            }
        };
        auto expand_list = [&](std::string_view list_file, const std::string& owner) {
            auto path = root_ / detail::strip_dot_slash(list_file);
            std::error_code ec{};
            if (!fs::is_regular_file(path, ec)) {
                debug_log("response list ", path.string(), " not found");
                return;
            }
            for (const auto& input : tokenize_command(internal::files::read_text_file(path))) {
                add_edge(input, owner);
            }
        };

        std::error_code ec{};
        for (const auto& entry : fs::directory_iterator{root_ / dir, ec}) {
            auto target = detail::cmd_record_target(entry.path().filename().native());
            if (!target || !detail::is_linkable(*target) || !entry.is_regular_file(ec)) {
                continue;
            }
            auto owner = detail::join_relative(dir, *target);
            auto record = internal::files::read_text_file(entry.path());
            auto command = detail::command_of_record(record);
            if (!command) {
                continue;
            }

            auto tokens = tokenize_command(*command);
            for (size_t i = 0U; i < tokens.size(); ++i) {
                const auto& token = tokens[i];
                if (token == "$(cat"sv) {
                    if (i + 1U < tokens.size()) {
                        expand_list(tokens[++i], owner);
                    }
                }
                else if (token.starts_with('@')) {
                    expand_list(std::string_view{token}.substr(1U), owner);
                }
                else if (!token.starts_with('-')) {
                    add_edge(token, owner);
                }
            }
        }

        return indices_.emplace(dir, std::move(index)).first->second;
    }

    std::vector<std::string> kbuild_graph::parents_in(const std::string& dir, std::string_view object) {
        const auto& index = index_for(dir);
        if (auto it = index.find(std::string{object}); it != index.end()) {
            return it->second;
        }
        return {};
    }

    const std::vector<std::string>& kbuild_graph::all_dirs() {
        if (all_dirs_) {
            return *all_dirs_;
        }

        std::vector<std::string> dirs{""};
        std::error_code ec{};
        fs::recursive_directory_iterator it{root_, fs::directory_options::skip_permission_denied, ec};
        for (; !ec && it != fs::recursive_directory_iterator{}; it.increment(ec)) {
            if (!it->is_directory(ec) || it->is_symlink(ec)) {
                continue;
            }
            if (it->path().filename() == ".git") {
                it.disable_recursion_pending();
                continue;
            }
            dirs.push_back(fs::relative(it->path(), root_).string());
        }
        if (ec) {
            throw pipeline_error{error_kind::io, "failed to walk {}: {}"_format(root_.string(), ec.message())};
        }
        std::ranges::sort(dirs);

        all_dirs_ = std::move(dirs);
        return *all_dirs_;
    }

    std::vector<std::string> kbuild_graph::parents_of(std::string_view object, search_mode mode) {
        if (mode == search_mode::local) {
            return parents_in(fs::path{object}.parent_path().string(), object);
        }

        if (last_broad_dir_) {
            auto parents = parents_in(*last_broad_dir_, object);
            if (!parents.empty()) {
                return parents;
            }
        }

        std::vector<std::string> parents{};
        std::string winning_dir{};
        for (const auto& dir : all_dirs()) {
            auto found = parents_in(dir, object);
            if (!found.empty()) {
                winning_dir = dir;
                parents.insert(parents.end(), found.begin(), found.end());
            }
        }
        if (parents.size() == 1U) {
            last_broad_dir_ = winning_dir;
        }
        return parents;
    }

    bool is_core_terminal(std::string_view object) {
        std::string path{object};
        return std::ranges::any_of(detail::core_terminal_patterns, [&](const char* pattern) {
            return ::fnmatch(pattern, path.c_str(), 0) == 0;
        });
    }

    owner_resolution owner_resolver::resolve(std::string_view object) {
        owner_resolution result{};
        std::set<std::string> visited{};
        std::string current{object};

        while (true) {
            if (current.ends_with(".ko"sv)) {
                result.owner = kernel_binary{.kind = kernel_binary::kind_t::module, .path = current};
                return result;
            }
            if (is_core_terminal(current)) {
                result.owner = kernel_binary{};
                return result;
            }
            if (!visited.insert(current).second) {
                throw pipeline_error{
                        error_kind::resolution,
                        "dependency cycle at {} for {}"_format(current, object),
                        {std::string{object}}};
            }

            auto parents = graph_.parents_of(current, search_mode::local);
            if (parents.empty()) {
                parents = graph_.parents_of(current, search_mode::broad);
            }
            if (parents.empty()) {
                throw pipeline_error{
                        error_kind::resolution,
                        "invalid ancestor {} for {}"_format(current, object),
                        {std::string{object}}};
            }

            std::ranges::sort(parents);
            if (parents.size() > 1U) {
                debug_log("parents of ", current, ": ", utils::join_with_separator(parents, ", "sv));
                result.ambiguities.push_back("two parent matches for {}"_format(current));
            }
            if (!graph_.exists(parents.front())) {
                throw pipeline_error{
                        error_kind::resolution,
                        "parent {} of {} does not exist"_format(parents.front(), current),
                        {std::string{object}}};
            }
            current = parents.front();
        }
    }

}  // namespace klpforge
