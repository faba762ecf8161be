#include "utils.hpp"

#include <regex>
#include <thread>
#include <unordered_set>

namespace imagen::test {

    TEST_CASE("003: random ids are url-safe and fixed length", "[003][naming]") {
        static const std::regex id_pattern{"^[A-Za-z0-9_-]{10}$"};
        for (int i = 0; i < 100; ++i) {
            auto id = backend::make_random_id();
            CHECK(std::regex_match(id, id_pattern));
        }
        CHECK(backend::make_random_id(21).size() == 21U);
    }

    TEST_CASE("003: artifact names carry id, timestamp and extension", "[003][naming]") {
        static const std::regex name_pattern{R"(^[A-Za-z0-9_-]{10}_\d{14}\.png$)"};
        auto name = backend::make_artifact_name();
        CHECK(std::regex_match(name, name_pattern));
        CHECK(store::is_plain_filename(name));
    }

    TEST_CASE("003: names generated within one second are distinct", "[003][naming]") {
        std::unordered_set<std::string> names{};
        for (int i = 0; i < 5000; ++i) {
            names.insert(backend::make_artifact_name());
        }
        CHECK(names.size() == 5000U);
    }

    TEST_CASE("003: names generated from concurrent callers are distinct", "[003][naming]") {
        constexpr int thread_count = 8;
        constexpr int per_thread = 250;

        std::vector<std::vector<std::string>> batches(thread_count);
        std::vector<std::thread> workers{};
        for (auto& batch : batches) {
            workers.emplace_back([&batch] {
                batch.reserve(per_thread);
                for (int i = 0; i < per_thread; ++i) {
                    batch.push_back(backend::make_artifact_name());
                }
            });
        }
        for (auto& worker : workers) {
            worker.join();
        }

        std::unordered_set<std::string> names{};
        for (const auto& batch : batches) {
            REQUIRE(batch.size() == static_cast<std::size_t>(per_thread));
            names.insert(batch.begin(), batch.end());
        }
        CHECK(names.size() == static_cast<std::size_t>(thread_count * per_thread));
    }

    TEST_CASE("003: base url splits into origin and path prefix", "[003][backend]") {
        SECTION("bare origin") {
            auto target = backend::split_base_url("https://generativelanguage.googleapis.com");
            CHECK(target.origin == "https://generativelanguage.googleapis.com");
            CHECK(target.path_prefix.empty());
        }
        SECTION("origin with port and trailing slash") {
            auto target = backend::split_base_url("http://127.0.0.1:8080/");
            CHECK(target.origin == "http://127.0.0.1:8080");
            CHECK(target.path_prefix.empty());
        }
        SECTION("proxy prefix") {
            auto target = backend::split_base_url("https://proxy.example/gemini/v2//");
            CHECK(target.origin == "https://proxy.example");
            CHECK(target.path_prefix == "/gemini/v2");
        }
    }

    TEST_CASE("003: request body carries one instance and sampleCount 1", "[003][backend]") {
        auto body = backend::make_request_body(R"(a "quoted" cube)");
        CHECK(body == R"({"instances":[{"prompt":"a \"quoted\" cube"}],"parameters":{"sampleCount":1}})");
    }

    TEST_CASE("003: predict path embeds model and escaped key", "[003][backend]") {
        backend_settings settings{};
        settings.api_key = "k e/y";
        CHECK(backend::predict_path(settings) == "/v1beta/models/imagen-3.0-generate-002:predict?key=k%20e%2Fy");

        settings.model = "imagen-test";
        settings.api_key = "plain-key_1";
        CHECK(backend::predict_path(settings) == "/v1beta/models/imagen-test:predict?key=plain-key_1");
    }

    TEST_CASE("003: decode_base64 accepts canonical input", "[003][base64]") {
        auto png = backend::decode_base64(png_header_b64);
        REQUIRE(png);
        CHECK(*png == png_header_bytes);

        auto text = backend::decode_base64("aGVsbG8gd29ybGQ=");
        REQUIRE(text);
        CHECK(*text == "hello world");

        auto two = backend::decode_base64("YWI=");
        REQUIRE(two);
        CHECK(*two == "ab");

        auto three = backend::decode_base64("YWJj");
        REQUIRE(three);
        CHECK(*three == "abc");

        auto empty = backend::decode_base64("");
        REQUIRE(empty);
        CHECK(empty->empty());
    }

    TEST_CASE("003: decode_base64 rejects malformed input", "[003][base64]") {
        for (auto bad : {"abc"sv, "ab=c"sv, "a==="sv, "!!!!"sv, "YWJ="sv, "YQ="sv, "aGVs bG8="sv, "YW-j"sv}) {
            auto decoded = backend::decode_base64(bad);
            REQUIRE_FALSE(decoded);
            CHECK(decoded.error().kind == error_kind::decode);
        }
    }

}  // namespace imagen::test
