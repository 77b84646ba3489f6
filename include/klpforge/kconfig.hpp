#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace klpforge {

    // Parsed kernel .config; "# CONFIG_X is not set" lines are treated as absent.
    class kernel_config {
      public:
        kernel_config() = default;

        static kernel_config parse(std::string_view text);
        static kernel_config load(const std::filesystem::path& path);

        // true for "y" and "m"
        bool enabled(std::string_view key) const;
        std::optional<std::string> value(std::string_view key) const;
        void set(std::string key, std::string value);

        size_t size() const noexcept { return values_.size(); }

      private:
        std::unordered_map<std::string, std::string> values_{};
    };

}  // namespace klpforge
