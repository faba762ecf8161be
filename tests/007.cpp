#include "utils.hpp"

#include <httplib.h>

namespace imagen::test {

    namespace detail {

        struct asset_fixture {
            temp_dir temp{"imagen_assets"};
            fs::path base{};
            std::optional<http::asset_server> server{};
            uint16_t port{0};

            asset_fixture() {
                auto ready = store::ensure_ready(temp.path / "artifacts");
                REQUIRE(ready);
                base = *ready;
                server.emplace(base);
                auto bound = server->bind("127.0.0.1", 0);
                REQUIRE(bound);
                port = *bound;
                server->start();
                REQUIRE(server->is_running());
            }

            httplib::Client client() const { return httplib::Client{"127.0.0.1", port}; }
        };

    }  // namespace detail

    TEST_CASE("007: list-images on an empty store is an empty array", "[007][http]") {
        detail::asset_fixture fx{};
        auto client = fx.client();

        auto res = client.Get("/list-images");
        REQUIRE(res);
        CHECK(res->status == 200);
        CHECK(res->body == "[]");
        CHECK(contains(res->get_header_value("Content-Type"), "application/json"));
    }

    TEST_CASE("007: stored images are listed and served byte for byte", "[007][http]") {
        detail::asset_fixture fx{};
        REQUIRE(store::write(fx.base, "abc_20250101000000.png", png_header_bytes));
        auto client = fx.client();

        auto list = client.Get("/list-images");
        REQUIRE(list);
        CHECK(list->status == 200);
        CHECK(list->body == R"(["abc_20250101000000.png"])");

        auto image = client.Get("/images/abc_20250101000000.png");
        REQUIRE(image);
        CHECK(image->status == 200);
        CHECK(image->body == png_header_bytes);
        CHECK(image->get_header_value("Content-Type") == "image/png");
        CHECK(image->get_header_value("Access-Control-Allow-Origin") == "*");
    }

    TEST_CASE("007: missing and out-of-tree names are not found", "[007][http]") {
        detail::asset_fixture fx{};
        write_bytes(fx.base / "secret.txt", "top secret");
        write_bytes(fx.temp.path / "outside.png", "outside");
        fs::create_symlink(fx.temp.path / "outside.png", store::images_dir(fx.base) / "link.png");
        fs::create_directory(store::images_dir(fx.base) / "dir.png");
        auto client = fx.client();

        for (auto path : {"/images/missing.png", "/images/..%2Fsecret.txt", "/images/../secret.txt", "/images/link.png",
                          "/images/dir.png", "/images/", "/nope"}) {
            auto res = client.Get(path);
            REQUIRE(res);
            CHECK(res->status == 404);
        }
    }

    TEST_CASE("007: in-progress temp files are never served", "[007][http]") {
        detail::asset_fixture fx{};
        write_bytes(store::images_dir(fx.base) / ".half_20250101000000.png.tmp", "\x89PN");
        CHECK(store::is_temp_name(".half_20250101000000.png.tmp"));
        CHECK_FALSE(store::is_temp_name("half_20250101000000.png"));
        auto client = fx.client();

        auto res = client.Get("/images/.half_20250101000000.png.tmp");
        REQUIRE(res);
        CHECK(res->status == 404);

        auto list = client.Get("/list-images");
        REQUIRE(list);
        CHECK(list->body == "[]");
    }

    TEST_CASE("007: symlinks that stay inside the images directory are served", "[007][http]") {
        detail::asset_fixture fx{};
        REQUIRE(store::write(fx.base, "real_20250101000000.png", "real"));
        fs::create_symlink(
                store::images_dir(fx.base) / "real_20250101000000.png", store::images_dir(fx.base) / "alias.png");
        auto client = fx.client();

        auto res = client.Get("/images/alias.png");
        REQUIRE(res);
        CHECK(res->status == 200);
        CHECK(res->body == "real");
    }

    TEST_CASE("007: content type follows the extension", "[007][http]") {
        CHECK(http::content_type_for("a.png") == "image/png"sv);
        CHECK(http::content_type_for("a.JPG") == "image/jpeg"sv);
        CHECK(http::content_type_for("a.jpeg") == "image/jpeg"sv);
        CHECK(http::content_type_for("a.webp") == "image/webp"sv);
        CHECK(http::content_type_for("a.gif") == "image/gif"sv);
        CHECK(http::content_type_for("a.svg") == "image/svg+xml"sv);
        CHECK(http::content_type_for("a") == "application/octet-stream"sv);
    }

    TEST_CASE("007: cross-origin preflight is allowed", "[007][http]") {
        detail::asset_fixture fx{};
        auto client = fx.client();

        auto res = client.Options("/images/anything.png");
        REQUIRE(res);
        CHECK(res->status == 204);
        CHECK(res->get_header_value("Access-Control-Allow-Origin") == "*");
        CHECK(contains(res->get_header_value("Access-Control-Allow-Methods"), "GET"));
    }

    TEST_CASE("007: list-images is not found once the directory disappears", "[007][http]") {
        detail::asset_fixture fx{};
        fs::remove_all(store::images_dir(fx.base));
        auto client = fx.client();

        auto res = client.Get("/list-images");
        REQUIRE(res);
        CHECK(res->status == 404);
    }

    TEST_CASE("007: stop closes the listening socket", "[007][http]") {
        detail::asset_fixture fx{};
        CHECK(port_accepts(fx.port));

        fx.server->stop();
        CHECK_FALSE(fx.server->is_running());
        CHECK_FALSE(port_accepts(fx.port));

        // stopping twice is harmless
        fx.server->stop();
    }

    TEST_CASE("007: bind fails when the port is taken", "[007][http]") {
        detail::asset_fixture fx{};
        http::asset_server second{fx.base};

        CHECK_FALSE(second.bind("127.0.0.1", fx.port));
    }

}  // namespace imagen::test
