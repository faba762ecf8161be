#include "imagen/http.hpp"

#include "imagen/store.hpp"

#include <glaze/glaze.hpp>
#include <httplib.h>

#include <chrono>
#include <fstream>
#include <iterator>
#include <system_error>
#include <utility>

using namespace imagen::literals;
namespace fs = std::filesystem;

namespace imagen::http {

    namespace detail {

        static void set_not_found(httplib::Response& res) {
            res.status = 404;
            res.set_content("Not Found", "text/plain");
        }

        // Resolves `name` to a regular file directly inside `images`, following symlinks.
        static std::optional<fs::path> resolve_image(const fs::path& images, std::string_view name) {
            if (!store::is_plain_filename(name) || store::is_temp_name(name)) {
                return std::nullopt;
            }

            std::error_code ec{};
            auto root = fs::canonical(images, ec);
            if (ec) {
                return std::nullopt;
            }
            auto target = fs::canonical(images / name, ec);
            if (ec) {
                return std::nullopt;
            }
            if (target.parent_path() != root || !fs::is_regular_file(target, ec)) {
                return std::nullopt;
            }
            return target;
        }

        static std::optional<std::string> read_file(const fs::path& path) {
            std::ifstream in{path, std::ios::binary};
            if (!in) {
                return std::nullopt;
            }
            std::string bytes{std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
            if (in.bad()) {
                return std::nullopt;
            }
            return bytes;
        }

    }  // namespace detail

    std::string_view content_type_for(const fs::path& file) {
        auto ext = file.extension().string();
        if (utils::str_case_eq(ext, ".png"sv)) {
            return "image/png"sv;
        }
        if (utils::str_case_eq(ext, ".jpg"sv) || utils::str_case_eq(ext, ".jpeg"sv)) {
            return "image/jpeg"sv;
        }
        if (utils::str_case_eq(ext, ".gif"sv)) {
            return "image/gif"sv;
        }
        if (utils::str_case_eq(ext, ".webp"sv)) {
            return "image/webp"sv;
        }
        if (utils::str_case_eq(ext, ".svg"sv)) {
            return "image/svg+xml"sv;
        }
        return "application/octet-stream"sv;
    }

    asset_server::asset_server(fs::path store_base)
        : store_base_{std::move(store_base)}, server_{std::make_unique<httplib::Server>()} {
        register_routes();
    }

    asset_server::~asset_server() {
        stop();
    }

    void asset_server::register_routes() {
        server_->Get(R"(/images/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
            auto path = detail::resolve_image(store::images_dir(store_base_), req.matches[1].str());
            if (!path) {
                detail::set_not_found(res);
                return;
            }
            auto bytes = detail::read_file(*path);
            if (!bytes) {
                detail::set_not_found(res);
                return;
            }
            res.set_content(std::move(*bytes), std::string{content_type_for(*path)});
        });

        server_->Options(R"(/images/(.*))", [](const httplib::Request&, httplib::Response& res) {
            res.status = 204;
            res.set_header("Access-Control-Allow-Methods", "GET, OPTIONS");
            res.set_header("Access-Control-Allow-Headers", "*");
        });

        server_->Get(std::string{list_images_path}, [this](const httplib::Request&, httplib::Response& res) {
            auto names = store::list(store_base_);
            if (!names) {
                debug_log("list-images: ", names.error().message);
                detail::set_not_found(res);
                return;
            }
            std::string json{};
            (void)glz::write_json(*names, json);
            res.set_content(std::move(json), "application/json");
        });

        server_->set_post_routing_handler([](const httplib::Request&, httplib::Response& res) {
            res.set_header("Access-Control-Allow-Origin", "*");
        });

        // a second listener on the same port must fail to bind
        server_->set_socket_options([](httplib::socket_t sock) {
            int yes = 1;
            ::setsockopt(sock, SOL_SOCKET, SO_REUSEADDR, reinterpret_cast<const char*>(&yes), sizeof(yes));
        });

        server_->set_logger([](const httplib::Request& req, const httplib::Response& res) {
            debug_log(req.method, " ", req.path, " -> ", res.status);
        });
    }

    std::optional<uint16_t> asset_server::bind(const std::string& host, uint16_t port) {
        if (port == 0) {
            auto bound = server_->bind_to_any_port(host);
            if (bound < 0) {
                return std::nullopt;
            }
            port_ = static_cast<uint16_t>(bound);
        }
        else {
            if (!server_->bind_to_port(host, port)) {
                return std::nullopt;
            }
            port_ = port;
        }
        bound_ = true;
        return port_;
    }

    void asset_server::start() {
        if (!bound_ || thread_.joinable()) {
            return;
        }
        loop_finished_ = false;
        thread_ = std::thread{[this] {
            if (!server_->listen_after_bind()) {
                debug_log("asset server loop ended with an error");
            }
            loop_finished_ = true;
        }};

        // stop() is a no-op until the loop runs, so hand back control only once it does
        while (!server_->is_running() && !loop_finished_) {
            std::this_thread::sleep_for(std::chrono::milliseconds{1});
        }
    }

    void asset_server::stop() {
        if (!thread_.joinable()) {
            return;
        }
        server_->stop();
        thread_.join();
    }

    bool asset_server::is_running() const {
        return server_->is_running();
    }

}  // namespace imagen::http
