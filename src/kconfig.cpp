#include "klpforge/kconfig.hpp"

#include "klpforge/error.hpp"
#include "klpforge/format.hpp"
#include "klpforge/utils.hpp"

#include <fstream>
#include <sstream>

namespace fs = std::filesystem;
using namespace klpforge::literals;

namespace klpforge {

    namespace detail {

        static std::string unquote(std::string_view value) {
            if (value.size() >= 2U && value.front() == '"' && value.back() == '"') {
                value = value.substr(1U, value.size() - 2U);
            }
            return std::string{value};
        }

    }  // namespace detail

    kernel_config kernel_config::parse(std::string_view text) {
        kernel_config cfg{};
        for (auto raw : utils::split_lines(text)) {
            auto line = utils::trim_ascii(raw);
            if (line.empty() || line.front() == '#') {
                continue;
            }
            auto eq = line.find('=');
            if (eq == std::string_view::npos || eq == 0U) {
                continue;
            }
            auto key = utils::trim_ascii(line.substr(0U, eq));
            auto value = utils::trim_ascii(line.substr(eq + 1U));
            if (!key.starts_with("CONFIG_"sv) || value.empty() || value == "n"sv) {
                continue;
            }
            cfg.values_.insert_or_assign(std::string{key}, detail::unquote(value));
        }
        return cfg;
    }

    kernel_config kernel_config::load(const fs::path& path) {
        std::ifstream in{path};
        if (!in) {
            throw pipeline_error{
                    error_kind::prerequisite_missing, "kernel config file not found: {}"_format(path.string())};
        }
        std::ostringstream ss{};
        ss << in.rdbuf();
        return parse(ss.str());
    }

    bool kernel_config::enabled(std::string_view key) const {
        auto it = values_.find(std::string{key});
        if (it == values_.end()) {
            return false;
        }
        return it->second == "y"sv || it->second == "m"sv;
    }

    std::optional<std::string> kernel_config::value(std::string_view key) const {
        auto it = values_.find(std::string{key});
        if (it == values_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    void kernel_config::set(std::string key, std::string value) {
        values_.insert_or_assign(std::move(key), std::move(value));
    }

}  // namespace klpforge
