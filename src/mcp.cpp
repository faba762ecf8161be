#include "imagen/mcp.hpp"

#include "internal/guide.hpp"

#include <glaze/ext/jsonrpc.hpp>
#include <glaze/glaze.hpp>

#include <array>
#include <iostream>
#include <istream>
#include <ostream>
#include <string>
#include <vector>

using namespace imagen::literals;

namespace imagen::mcp {

    namespace detail {

        // ── MCP protocol types ──────────────────────────────────────────

        struct client_info {
            std::string name{};
            std::string version{};
            struct glaze {
                using T = client_info;
                static constexpr auto value = glz::object(&T::name, &T::version);
            };
        };

        struct initialize_params {
            std::string protocolVersion{};
            client_info clientInfo{};
            struct glaze {
                using T = initialize_params;
                static constexpr auto value =
                        glz::object("protocolVersion", &T::protocolVersion, "clientInfo", &T::clientInfo);
            };
        };

        struct server_info {
            std::string name{};
            std::string version{};
            struct glaze {
                using T = server_info;
                static constexpr auto value = glz::object(&T::name, &T::version);
            };
        };

        struct empty_object {
            struct glaze {
                using T = empty_object;
                static constexpr auto value = glz::object();
            };
        };

        struct server_capabilities {
            empty_object tools{};
            struct glaze {
                using T = server_capabilities;
                static constexpr auto value = glz::object(&T::tools);
            };
        };

        struct initialize_result {
            std::string protocolVersion{};
            server_capabilities capabilities{};
            server_info serverInfo{};
            std::string instructions{};
            struct glaze {
                using T = initialize_result;
                static constexpr auto value = glz::object(
                        "protocolVersion",
                        &T::protocolVersion,
                        "capabilities",
                        &T::capabilities,
                        "serverInfo",
                        &T::serverInfo,
                        "instructions",
                        &T::instructions);
            };
        };

        struct tool_definition {
            std::string name{};
            std::string description{};
            glz::raw_json inputSchema{};
            struct glaze {
                using T = tool_definition;
                static constexpr auto value = glz::object(&T::name, &T::description, "inputSchema", &T::inputSchema);
            };
        };

        struct tools_list_result {
            std::vector<tool_definition> tools{};
            struct glaze {
                using T = tools_list_result;
                static constexpr auto value = glz::object(&T::tools);
            };
        };

        struct tool_call_params {
            std::string name{};
            glz::raw_json arguments{};
            struct glaze {
                using T = tool_call_params;
                static constexpr auto value = glz::object(&T::name, &T::arguments);
            };
        };

        struct text_content {
            std::string type{"text"};
            std::string text{};
            struct glaze {
                using T = text_content;
                static constexpr auto value = glz::object(&T::type, &T::text);
            };
        };

        struct tool_call_result {
            std::vector<text_content> content{};
            bool isError{false};
            struct glaze {
                using T = tool_call_result;
                static constexpr auto value = glz::object(&T::content, "isError", &T::isError);
            };
        };

        struct generate_image_args {
            std::string prompt{};
            struct glaze {
                using T = generate_image_args;
                static constexpr auto value = glz::object(&T::prompt);
            };
        };

        static constexpr std::array known_protocol_versions{"2024-11-05"sv, "2025-03-26"sv, "2025-06-18"sv};

        static std::string negotiate_protocol_version(std::string_view requested) {
            for (auto version : known_protocol_versions) {
                if (version == requested) {
                    return std::string{version};
                }
            }
            return std::string{default_protocol_version};
        }

        // ── Response helpers ────────────────────────────────────────────

        template <typename T>
        static std::string make_response(const glz::rpc::id_t& id, T&& result) {
            glz::rpc::response_t<std::decay_t<T>> resp{};
            resp.id = id;
            resp.result = std::forward<T>(result);
            std::string json{};
            (void)glz::write_json(resp, json);
            return json;
        }

        static std::string make_error_response(
                const glz::rpc::id_t& id, glz::rpc::error_e code, const std::string& message) {
            glz::rpc::response_t<glz::raw_json> resp{};
            resp.id = id;
            resp.error = glz::rpc::error{code, std::nullopt, message};
            std::string json{};
            (void)glz::write_json(resp, json);
            return json;
        }

        // ── Handlers ────────────────────────────────────────────────────

        static std::string handle_initialize(const glz::rpc::id_t& id, glz::raw_json_view raw_params) {
            initialize_params params{};
            (void)glz::read<glz::opts{.error_on_unknown_keys = false}>(params, raw_params.str);
            debug_log("initialize from ", params.clientInfo.name, " ", params.clientInfo.version);

            initialize_result result{};
            result.protocolVersion = negotiate_protocol_version(params.protocolVersion);
            result.serverInfo = server_info{.name = std::string{server_name}, .version = std::string{server_version}};
            result.instructions = std::string{internal::usage_guide};

            return make_response(id, std::move(result));
        }

        static std::string handle_tools_list(const glz::rpc::id_t& id) {
            tools_list_result result{};
            result.tools.push_back(
                    tool_definition{
                            .name = std::string{tool::generate_image_name},
                            .description = std::string{tool::generate_image_description},
                            .inputSchema = glz::raw_json{tool::generate_image_input_schema},
                    });

            return make_response(id, std::move(result));
        }

        static std::string handle_generate_image(
                const glz::rpc::id_t& id, const glz::raw_json& raw_arguments, tool::image_tool& tool) {
            generate_image_args args{};
            auto ec = glz::read<glz::opts{.error_on_unknown_keys = false, .error_on_missing_keys = true}>(
                    args, raw_arguments.str);
            if (ec) {
                return make_error_response(
                        id, glz::rpc::error_e::invalid_params, "generate_image requires a string prompt");
            }

            tool_call_result result{};
            result.content.push_back(text_content{.text = tool.generate_image(args.prompt)});
            return make_response(id, std::move(result));
        }

        static std::string handle_tools_call(
                const glz::rpc::id_t& id, glz::raw_json_view raw_params, tool::image_tool& tool) {
            tool_call_params params{};
            auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(params, raw_params.str);
            if (ec) {
                return make_error_response(id, glz::rpc::error_e::invalid_params, "Failed to parse tool call params");
            }

            if (params.name == tool::generate_image_name) {
                return handle_generate_image(id, params.arguments, tool);
            }

            return make_error_response(id, glz::rpc::error_e::invalid_params, "Unknown tool: {}"_format(params.name));
        }

    }  // namespace detail

    server::server(tool::image_tool& tool) : tool_{tool}, state_{session_state::bound} {}

    std::optional<std::string> server::handle_message(const std::string& line) {
        glz::rpc::generic_request_t request{};
        auto ec = glz::read_json(request, line);
        if (ec) {
            return detail::make_error_response({}, glz::rpc::error_e::parse_error, "JSON parse error");
        }

        bool is_notification = std::holds_alternative<glz::generic::null_t>(request.id);

        if (request.method == "initialize"sv) {
            return detail::handle_initialize(request.id, request.params);
        }
        if (request.method == "tools/list"sv) {
            return detail::handle_tools_list(request.id);
        }
        if (request.method == "tools/call"sv) {
            return detail::handle_tools_call(request.id, request.params, tool_);
        }
        if (request.method == "ping"sv) {
            return detail::make_response(request.id, detail::empty_object{});
        }
        if (is_notification) {
            // notifications/initialized, notifications/cancelled, ...
            return std::nullopt;
        }
        return detail::make_error_response(
                request.id,
                glz::rpc::error_e::method_not_found,
                "Unknown method: {}"_format(std::string{request.method}));
    }

    void server::serve(std::istream& in, std::ostream& out) {
        state_ = session_state::serving;

        std::string line{};
        while (std::getline(in, line)) {
            if (utils::trim_view(line).empty()) {
                continue;
            }

            auto response = handle_message(line);
            if (!response) {
                continue;
            }

            out << *response << '\n';
            out.flush();
            if (!out) {
                std::cerr << "failed to write to the host, closing session\n";
                break;
            }
        }

        state_ = session_state::closed;
    }

}  // namespace imagen::mcp
