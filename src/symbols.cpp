#include "klpforge/symbols.hpp"

#include "klpforge/error.hpp"
#include "klpforge/format.hpp"
#include "klpforge/utils.hpp"

#include "internal/symbols.hpp"

#include <algorithm>
#include <iterator>

namespace fs = std::filesystem;
using namespace klpforge::literals;

namespace klpforge {

    std::vector<std::string> required_symbols(std::string_view diagnostics) {
        std::vector<std::string> names{};
        for (auto line : utils::split_lines(diagnostics)) {
            if (auto name = internal::symbols::bfd_undefined_reference(line)) {
                names.emplace_back(*name);
            }
            else if (auto name = internal::symbols::lld_undefined_symbol(line)) {
                names.emplace_back(*name);
            }
            else if (auto name = internal::symbols::modpost_undefined(line)) {
                names.emplace_back(*name);
            }
        }
        internal::symbols::sort_unique(names);
        return names;
    }

    std::vector<std::string> provided_symbols(std::string_view symbol_table) {
        std::vector<std::string> names{};
        for (auto line : utils::split_lines(symbol_table)) {
            auto cleaned = internal::symbols::strip_localentry(line);
            auto row = internal::symbols::parse_symbol_row(internal::symbols::split_fields(cleaned));
            if (row && internal::symbols::is_provided(*row)) {
                names.emplace_back(row->name);
            }
        }
        internal::symbols::sort_unique(names);
        return names;
    }

    std::vector<std::string> unsatisfied_symbols(
            const std::vector<std::string>& required, std::vector<std::string> provided, bool shadow_runtime) {
        if (shadow_runtime) {
            provided.insert(provided.end(), shadow_runtime_symbols.begin(), shadow_runtime_symbols.end());
        }
        internal::symbols::sort_unique(provided);

        auto wanted = required;
        internal::symbols::sort_unique(wanted);

        std::vector<std::string> missing{};
        std::ranges::set_difference(wanted, provided, std::back_inserter(missing));
        return missing;
    }

    void verify_symbol_closure(
            std::string_view diagnostics, binary_inspector& inspector, const fs::path& module, bool shadow_runtime) {
        auto required = required_symbols(diagnostics);
        if (required.empty()) {
            return;
        }

        auto missing = unsatisfied_symbols(required, provided_symbols(inspector.symbol_table(module)), shadow_runtime);
        if (!missing.empty()) {
            throw pipeline_error{
                    error_kind::symbol,
                    "unsatisfied symbols in {}: {}"_format(
                            module.filename().string(), utils::join_with_separator(missing, ", "sv)),
                    std::move(missing)};
        }
    }

}  // namespace klpforge
