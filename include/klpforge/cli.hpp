#pragma once

#include "config.hpp"

#include <iosfwd>
#include <optional>

namespace klpforge::cli {

    // Fills `cfg` from the command line; an exit status when the process should stop here.
    std::optional<int> parse_cli(int argc, char** argv, build_config& cfg);

    void print_config(const build_config& cfg, std::ostream& os);

}  // namespace klpforge::cli
