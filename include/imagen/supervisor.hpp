#pragma once

#include "backend.hpp"
#include "config.hpp"

#include <iosfwd>

namespace imagen::supervisor {

    // Boots the store, checks the credential, runs the asset server in the background and the
    // MCP session on `in`/`out` in the foreground. Returns the process exit status.
    int run(const server_config& cfg, std::istream& in, std::ostream& out, backend::backend_transport& transport);

    // stdin/stdout with the HTTP backend transport
    int run(const server_config& cfg);

}  // namespace imagen::supervisor
