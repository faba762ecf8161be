#pragma once

#include "utils.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

namespace httplib {
    class Server;
}  // namespace httplib

namespace imagen::http {

    using namespace std::string_view_literals;

    inline constexpr auto images_prefix = "/images/"sv;
    inline constexpr auto list_images_path = "/list-images"sv;

    std::string_view content_type_for(const std::filesystem::path& file);

    /*
     * Serves `<store>/images` under /images/ and the store listing under /list-images.
     *
     * bind() claims the socket, start() runs the accept loop on a background thread,
     * stop() ends it without draining in-flight requests.
     */
    class asset_server {
      public:
        explicit asset_server(std::filesystem::path store_base);
        ~asset_server();

        asset_server(const asset_server&) = delete;
        asset_server& operator=(const asset_server&) = delete;

        // Returns the bound port; port 0 picks an ephemeral one.
        std::optional<uint16_t> bind(const std::string& host, uint16_t port);

        void start();
        void stop();

        bool is_running() const;
        uint16_t port() const { return port_; }

      private:
        void register_routes();

        std::filesystem::path store_base_;
        std::unique_ptr<httplib::Server> server_;
        std::thread thread_{};
        std::atomic<bool> loop_finished_{false};
        uint16_t port_{0};
        bool bound_{false};
    };

}  // namespace imagen::http
