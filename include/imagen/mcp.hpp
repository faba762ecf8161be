#pragma once

#include "tool.hpp"

#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

namespace imagen::mcp {

    inline constexpr auto default_protocol_version = "2024-11-05"sv;

    enum class session_state : uint8_t {
        unbound,
        bound,
        serving,
        closed,
    };

    inline constexpr std::string_view to_string(session_state state) {
        switch (state) {
            case session_state::unbound:
                return "unbound"sv;
            case session_state::bound:
                return "bound"sv;
            case session_state::serving:
                return "serving"sv;
            case session_state::closed:
                return "closed"sv;
        }
        return "closed"sv;
    }

    // One MCP session over newline-delimited JSON-RPC.
    class server {
      public:
        explicit server(tool::image_tool& tool);

        session_state state() const { return state_; }

        // Handles one message; returns the response line, or nothing for notifications.
        std::optional<std::string> handle_message(const std::string& line);

        // Reads until end-of-stream or a failed write, then closes the session.
        void serve(std::istream& in, std::ostream& out);

      private:
        tool::image_tool& tool_;
        session_state state_{session_state::unbound};
    };

}  // namespace imagen::mcp
