#include "imagen/backend.hpp"

#include "imagen/store.hpp"

#include <glaze/glaze.hpp>
#include <httplib.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include <array>
#include <cstdint>
#include <ctime>
#include <exception>
#include <stdexcept>
#include <vector>

using namespace imagen::literals;

namespace imagen::backend {

    namespace detail {

        // ── Backend wire types ──────────────────────────────────────────

        struct predict_instance {
            std::string prompt{};
            struct glaze {
                using T = predict_instance;
                static constexpr auto value = glz::object(&T::prompt);
            };
        };

        struct predict_parameters {
            int sampleCount{1};
            struct glaze {
                using T = predict_parameters;
                static constexpr auto value = glz::object("sampleCount", &T::sampleCount);
            };
        };

        struct predict_request {
            std::vector<predict_instance> instances{};
            predict_parameters parameters{};
            struct glaze {
                using T = predict_request;
                static constexpr auto value = glz::object(&T::instances, &T::parameters);
            };
        };

        struct prediction {
            std::string mimeType{};
            std::string bytesBase64Encoded{};
            struct glaze {
                using T = prediction;
                static constexpr auto value =
                        glz::object("mimeType", &T::mimeType, "bytesBase64Encoded", &T::bytesBase64Encoded);
            };
        };

        struct predict_response {
            std::vector<prediction> predictions{};
            struct glaze {
                using T = predict_response;
                static constexpr auto value = glz::object(&T::predictions);
            };
        };

        static constexpr auto id_alphabet = "useandom-26T198340PX75pxJACKVERYMINDBUSHWOLF_GQZbfghjklqvwyzrict"sv;
        static_assert(id_alphabet.size() == 64U);

        static constexpr auto b64_alphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/"sv;

        static int b64_value(char c) {
            auto pos = b64_alphabet.find(c);
            return pos == std::string_view::npos ? -1 : static_cast<int>(pos);
        }

        static bool is_unreserved(char c) {
            return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' ||
                   c == '_' || c == '.' || c == '~';
        }

        static std::string percent_encode(std::string_view value) {
            static constexpr auto hex = "0123456789ABCDEF"sv;
            std::string out{};
            out.reserve(value.size());
            for (char c : value) {
                if (is_unreserved(c)) {
                    out.push_back(c);
                    continue;
                }
                auto byte = static_cast<unsigned char>(c);
                out.push_back('%');
                out.push_back(hex[byte >> 4U]);
                out.push_back(hex[byte & 0x0fU]);
            }
            return out;
        }

        static std::string local_timestamp() {
            auto now = std::time(nullptr);
            std::tm local{};
            if (::localtime_r(&now, &local) == nullptr) {
                throw std::runtime_error("failed to read local time");
            }
            std::array<char, 32> buf{};
            auto n = std::strftime(buf.data(), buf.size(), "%Y%m%d%H%M%S", &local);
            return std::string(buf.data(), n);
        }

    }  // namespace detail

    // ── Naming ──────────────────────────────────────────────────────

    std::string make_random_id(std::size_t length) {
        std::vector<unsigned char> bytes(length);
        if (::RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
            throw std::runtime_error("RAND_bytes failed");
        }
        std::string id{};
        id.reserve(length);
        for (auto b : bytes) {
            // 64-symbol alphabet, so masking keeps the distribution uniform
            id.push_back(detail::id_alphabet[b & 63U]);
        }
        return id;
    }

    std::string make_artifact_name() {
        return "{}_{}{}"_format(make_random_id(), detail::local_timestamp(), artifact_extension);
    }

    // ── Request construction ────────────────────────────────────────

    std::string predict_path(const backend_settings& settings) {
        return "/v1beta/models/{}:predict?key={}"_format(settings.model, detail::percent_encode(settings.api_key));
    }

    std::string make_request_body(std::string_view prompt) {
        detail::predict_request request{};
        request.instances.push_back(detail::predict_instance{.prompt = std::string{prompt}});
        request.parameters.sampleCount = 1;

        std::string json{};
        if (auto ec = glz::write_json(request, json)) {
            throw std::runtime_error("failed to serialize backend request");
        }
        return json;
    }

    // ── Response decoding ───────────────────────────────────────────

    result<std::string> decode_base64(std::string_view encoded) {
        if (encoded.size() % 4U != 0U) {
            return make_error(error_kind::decode, "Invalid base64 length: {}"_format(encoded.size()));
        }

        std::size_t padding = 0;
        if (encoded.ends_with("=="sv)) {
            padding = 2;
        }
        else if (encoded.ends_with('=')) {
            padding = 1;
        }

        auto body = encoded.substr(0, encoded.size() - padding);
        for (std::size_t i = 0; i < body.size(); ++i) {
            if (detail::b64_value(body[i]) < 0) {
                return make_error(error_kind::decode, "Invalid base64 symbol at offset {}"_format(i));
            }
        }

        // trailing bits of the last symbol must be zero
        if (padding > 0) {
            auto last = detail::b64_value(body.back());
            auto mask = padding == 1 ? 0x03 : 0x0f;
            if ((last & mask) != 0) {
                return make_error(error_kind::decode, "Invalid last symbol in base64 payload");
            }
        }

        if (encoded.empty()) {
            return std::string{};
        }

        std::string out(encoded.size() / 4U * 3U, '\0');
        auto n = ::EVP_DecodeBlock(
                reinterpret_cast<unsigned char*>(out.data()),
                reinterpret_cast<const unsigned char*>(encoded.data()),
                static_cast<int>(encoded.size()));
        if (n < 0) {
            return make_error(error_kind::decode, "Invalid base64 payload");
        }
        out.resize(static_cast<std::size_t>(n) - padding);
        return out;
    }

    // ── HTTP transport ──────────────────────────────────────────────

    endpoint split_base_url(std::string_view base_url) {
        auto scheme_end = base_url.find("://"sv);
        auto authority_start = scheme_end == std::string_view::npos ? 0U : scheme_end + 3U;
        auto path_start = base_url.find('/', authority_start);
        if (path_start == std::string_view::npos) {
            return endpoint{.origin = std::string{base_url}};
        }

        auto prefix = base_url.substr(path_start);
        while (prefix.ends_with('/')) {
            prefix.remove_suffix(1);
        }
        return endpoint{.origin = std::string{base_url.substr(0, path_start)}, .path_prefix = std::string{prefix}};
    }

    bool is_timeout_failure(
            httplib::Error err, std::chrono::steady_clock::duration elapsed, std::chrono::seconds timeout) {
        if (err == httplib::Error::ConnectionTimeout) {
            return true;
        }
        // httplib reports an expired read timeout as a plain read failure
        return err == httplib::Error::Read && elapsed >= timeout;
    }

    result<std::string> http_transport::post_json(
            const std::string& base_url,
            const std::string& path_and_query,
            const std::string& body,
            std::chrono::seconds timeout) {
        auto target = split_base_url(base_url);
        httplib::Client client{target.origin};
        if (!client.is_valid()) {
            return make_error(error_kind::backend_http, "Invalid backend URL: {}"_format(base_url));
        }
        client.set_connection_timeout(timeout);
        client.set_read_timeout(timeout);
        client.set_write_timeout(timeout);

        auto started = std::chrono::steady_clock::now();
        auto res = client.Post(target.path_prefix + path_and_query, body, "application/json");
        if (!res) {
            auto elapsed = std::chrono::steady_clock::now() - started;
            if (is_timeout_failure(res.error(), elapsed, timeout)) {
                return make_error(
                        error_kind::backend_timeout,
                        "Request to the image backend timed out after {}s"_format(timeout.count()));
            }
            return make_error(
                    error_kind::backend_http,
                    "Request to the image backend failed: {}"_format(httplib::to_string(res.error())));
        }
        debug_log("backend responded with status ", res->status, ", ", res->body.size(), " bytes");
        return std::move(res->body);
    }

    // ── Generation ──────────────────────────────────────────────────

    namespace detail {

        static result<std::string> generate_and_store(
                std::string_view prompt,
                const backend_settings& settings,
                const std::filesystem::path& store_base,
                backend_transport& transport) {
            auto filename = make_artifact_name();

            if (settings.api_key.empty()) {
                return make_error(error_kind::config, "{} environment variable not set"_format(api_key_env));
            }

            auto raw = transport.post_json(
                    settings.base_url, predict_path(settings), make_request_body(prompt), settings.timeout);
            if (!raw) {
                return std::unexpected{std::move(raw.error())};
            }

            predict_response response{};
            auto ec = glz::read<glz::opts{.error_on_unknown_keys = false, .error_on_missing_keys = true}>(
                    response, *raw);
            if (ec) {
                return make_error(
                        error_kind::backend_parse,
                        "Failed to parse Gemini response: {}"_format(glz::format_error(ec, *raw)),
                        *raw);
            }

            if (response.predictions.empty()) {
                return make_error(error_kind::empty_result, "No images were generated");
            }

            // single-sample contract, extra predictions are ignored
            auto bytes = decode_base64(response.predictions.front().bytesBase64Encoded);
            if (!bytes) {
                return std::unexpected{std::move(bytes.error())};
            }

            auto written = store::write(store_base, filename, *bytes);
            if (!written) {
                return std::unexpected{std::move(written.error())};
            }
            return filename;
        }

    }  // namespace detail

    result<std::string> generate(
            std::string_view prompt,
            const backend_settings& settings,
            const std::filesystem::path& store_base,
            backend_transport& transport) {
        try {
            return detail::generate_and_store(prompt, settings, store_base, transport);
        } catch (const std::exception& e) {
            return make_error(error_kind::internal, "Image generation failed: {}"_format(e.what()));
        }
    }

}  // namespace imagen::backend
