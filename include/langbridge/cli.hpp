#pragma once

#include "config.hpp"

#include <optional>
#include <ostream>

namespace langbridge::cli {

    // nullopt to continue into the server; otherwise the process exit code
    std::optional<int> parse_cli(int argc, char** argv, startup_config& cfg);

    void print_config(const startup_config& cfg, std::ostream& os);

}  // namespace langbridge::cli
