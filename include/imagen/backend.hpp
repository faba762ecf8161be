#pragma once

#include "config.hpp"
#include "error.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

namespace httplib {
    enum class Error;
}  // namespace httplib

namespace imagen::backend {

    inline constexpr std::size_t random_id_length = 10U;
    inline constexpr auto artifact_extension = ".png"sv;

    // Seam between the generation client and the network.
    class backend_transport {
      public:
        virtual ~backend_transport() = default;

        // POSTs a JSON body to `base_url` + `path_and_query` and returns the raw response body.
        // `base_url` may carry a path prefix.
        // Failures are backend_http, or backend_timeout once `timeout` has elapsed.
        virtual result<std::string> post_json(
                const std::string& base_url,
                const std::string& path_and_query,
                const std::string& body,
                std::chrono::seconds timeout) = 0;
    };

    class http_transport final : public backend_transport {
      public:
        result<std::string> post_json(
                const std::string& base_url,
                const std::string& path_and_query,
                const std::string& body,
                std::chrono::seconds timeout) override;
    };

    /*
     * `BASE_URL` split for httplib: `origin` is `scheme://host[:port]`, `path_prefix` is any
     * path the backend is mounted under (a proxy), without trailing slashes.
     */
    struct endpoint {
        std::string origin{};
        std::string path_prefix{};
    };

    endpoint split_base_url(std::string_view base_url);

    // true when a failed request ran into `timeout` instead of failing on its own
    bool is_timeout_failure(
            httplib::Error err, std::chrono::steady_clock::duration elapsed, std::chrono::seconds timeout);

    // URL-safe random token from a cryptographic source
    std::string make_random_id(std::size_t length = random_id_length);

    // `{random_id}_{YYYYMMDDHHMMSS}.png`, local time
    std::string make_artifact_name();

    std::string predict_path(const backend_settings& settings);
    std::string make_request_body(std::string_view prompt);

    // Strict standard-alphabet base64 with required padding.
    result<std::string> decode_base64(std::string_view encoded);

    // Calls the backend for one image and stores it under `store_base`. Returns the stored filename.
    // Nothing is written unless every step before the store write succeeds. Exceptions from
    // naming, serialization or the transport come back as error_kind::internal.
    result<std::string> generate(
            std::string_view prompt,
            const backend_settings& settings,
            const std::filesystem::path& store_base,
            backend_transport& transport);

}  // namespace imagen::backend
