#pragma once

#include "gomca.hpp"

#include <optional>

namespace gomca::cli {

    std::optional<int> parse_cli(int argc, char** argv, startup_config& cfg);
    int run_command(const startup_config& cfg);

}  // namespace gomca::cli
