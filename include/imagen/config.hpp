#pragma once

#include "utils.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace imagen {

    using namespace std::string_view_literals;

    inline constexpr auto server_name = "imagen3-mcp"sv;
    inline constexpr auto server_version = "0.1.0"sv;

    inline constexpr auto api_key_env = "GEMINI_API_KEY"sv;
    inline constexpr auto base_url_env = "BASE_URL"sv;

    inline constexpr auto default_base_url = "https://generativelanguage.googleapis.com"sv;
    inline constexpr auto default_model = "imagen-3.0-generate-002"sv;
    inline constexpr auto default_http_host = "127.0.0.1"sv;
    inline constexpr uint16_t default_http_port = 9981;

    /*
     * Generation backend settings
     *
     * - api_key: Credential passed as the `key` query parameter; empty means unset.
     * - base_url: Scheme + authority of the backend, optionally followed by a path prefix.
     * - model: Model id placed in the predict path.
     * - timeout: Bound on connecting to and reading from the backend.
     */
    struct backend_settings {
        std::string api_key{};
        std::string base_url{default_base_url};
        std::string model{default_model};
        std::chrono::seconds timeout{120};
    };

    /*
     * Imagen Server Config Options
     *
     * Storage
     * - data_dir: Artifact base directory override; unset resolves the per-user data dir.
     *
     * Asset HTTP server
     * - http_host: Address the asset server binds and advertises in image URLs.
     * - http_port: Port the asset server binds; 0 picks an ephemeral port.
     *
     * Backend
     * - backend: See backend_settings.
     *
     * Output
     * - quiet/verbose: Coarse stderr verbosity knobs; stdout is reserved for the protocol.
     * - print_config: Print resolved config and exit.
     */
    struct server_config {
        std::optional<std::filesystem::path> data_dir{};

        std::string http_host{default_http_host};
        uint16_t http_port{default_http_port};

        backend_settings backend{};

        bool quiet{false};
        bool verbose{false};
        bool print_config{false};
    };

}  // namespace imagen
