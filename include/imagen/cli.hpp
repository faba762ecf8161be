#pragma once

#include "config.hpp"

#include <iosfwd>
#include <optional>

namespace imagen::cli {

    // GEMINI_API_KEY and BASE_URL; call before parse_cli so flags take precedence
    void apply_environment(server_config& cfg);

    // Returns an exit status when the process should stop (help, version, usage error, print-config).
    std::optional<int> parse_cli(int argc, char** argv, server_config& cfg);

    void print_config(const server_config& cfg, std::ostream& os);

}  // namespace imagen::cli
