#pragma once

#include <cstdint>
#include <format>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace klpforge {

    using namespace std::string_view_literals;

    enum class error_kind : uint8_t {
        configuration,
        prerequisite_missing,
        transaction,
        build_failure,
        resolution,
        diff,
        symbol,
        io,
        interrupted,
    };

    inline constexpr std::string_view to_string(error_kind kind) {
        switch (kind) {
            case error_kind::configuration:
                return "configuration"sv;
            case error_kind::prerequisite_missing:
                return "prerequisite_missing"sv;
            case error_kind::transaction:
                return "transaction"sv;
            case error_kind::build_failure:
                return "build_failure"sv;
            case error_kind::resolution:
                return "resolution"sv;
            case error_kind::diff:
                return "diff"sv;
            case error_kind::symbol:
                return "symbol"sv;
            case error_kind::io:
                return "io"sv;
            case error_kind::interrupted:
                return "interrupted"sv;
        }
        return "io"sv;
    }

    // Process exit status for a fatal error of the given kind
    inline constexpr int exit_status_for(error_kind kind) {
        switch (kind) {
            case error_kind::configuration:
                return 2;
            case error_kind::interrupted:
                return 130;
            default:
                return 1;
        }
    }

    /*
     * Fatal pipeline failure.
     *
     * `subjects` names the entities the failure is about: the rejected patch, the
     * missing layout struct, the unsatisfied symbols. Ordering is stable (sorted where
     * the producer has no natural order).
     */
    class pipeline_error : public std::runtime_error {
      public:
        pipeline_error(error_kind kind, const std::string& message, std::vector<std::string> subjects = {})
                : std::runtime_error{message}, kind_{kind}, subjects_{std::move(subjects)} {}

        error_kind kind() const noexcept { return kind_; }
        const std::vector<std::string>& subjects() const noexcept { return subjects_; }

      private:
        error_kind kind_;
        std::vector<std::string> subjects_;
    };

}  // namespace klpforge

namespace std {
    template <>
    struct formatter<klpforge::error_kind, char> : formatter<std::string_view> {
        template <typename FormatContext>
        auto format(const klpforge::error_kind& val, FormatContext& ctx) const {
            return formatter<std::string_view>::format(klpforge::to_string(val), ctx);
        }
    };
}  // namespace std
