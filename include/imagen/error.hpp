#pragma once

#include "format.hpp"

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace imagen {

    using namespace std::string_view_literals;

    enum class error_kind : uint8_t {
        config,
        backend_http,
        backend_timeout,
        backend_parse,
        empty_result,
        decode,
        store_io,
        internal,
    };

    inline constexpr std::string_view to_string(error_kind kind) {
        switch (kind) {
            case error_kind::config:
                return "config"sv;
            case error_kind::backend_http:
                return "backend_http"sv;
            case error_kind::backend_timeout:
                return "backend_timeout"sv;
            case error_kind::backend_parse:
                return "backend_parse"sv;
            case error_kind::empty_result:
                return "empty_result"sv;
            case error_kind::decode:
                return "decode"sv;
            case error_kind::store_io:
                return "store_io"sv;
            case error_kind::internal:
                return "internal"sv;
        }
        return "internal"sv;
    }

    /*
     * One failure from the generation path.
     *
     * - kind: closed category callers branch on.
     * - message: human-readable cause, shown to the agent host.
     * - detail: extra diagnostic text (the raw backend body for backend_parse).
     */
    struct error {
        static constexpr bool to_string_formattable = true;

        error_kind kind{error_kind::store_io};
        std::string message{};
        std::string detail{};

        std::string to_string() const {
            if (detail.empty()) {
                return message;
            }
            return message + "\nThe response was: " + detail;
        }
    };

    template <typename T>
    using result = std::expected<T, error>;

    inline std::unexpected<error> make_error(error_kind kind, std::string message, std::string detail = {}) {
        return std::unexpected<error>{error{.kind = kind, .message = std::move(message), .detail = std::move(detail)}};
    }

}  // namespace imagen
