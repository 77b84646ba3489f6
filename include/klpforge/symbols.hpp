#pragma once

#include "inspect.hpp"

#include <array>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace klpforge {

    using namespace std::string_view_literals;

    // Exported by the kpatch core module; satisfied at load time when the shadow runtime is used
    inline constexpr std::array shadow_runtime_symbols{
            "kpatch_shadow_free"sv,
            "kpatch_shadow_alloc"sv,
            "kpatch_register"sv,
            "kpatch_shadow_get"sv,
            "kpatch_unregister"sv,
            "kpatch_root_kobj"sv,
    };

    // Names the link and modpost diagnostics report as unresolved; sorted and deduplicated.
    std::vector<std::string> required_symbols(std::string_view diagnostics);

    // Defined FUNC/OBJECT symbols with GLOBAL or WEAK binding in a `readelf --wide --symbols` listing.
    std::vector<std::string> provided_symbols(std::string_view symbol_table);

    // required - provided, sorted
    std::vector<std::string> unsatisfied_symbols(
            const std::vector<std::string>& required, std::vector<std::string> provided, bool shadow_runtime);

    // Throws a `symbol` error naming every unsatisfied symbol.
    void verify_symbol_closure(
            std::string_view diagnostics,
            binary_inspector& inspector,
            const std::filesystem::path& module,
            bool shadow_runtime);

}  // namespace klpforge
