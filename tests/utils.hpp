#pragma once

#include "imagen.hpp"

#include <catch2/catch_test_macros.hpp>

extern "C" {
#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <signal.h>
#include <sys/socket.h>
#include <sys/wait.h>
#include <unistd.h>
}

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <vector>

namespace imagen::test {

    namespace fs = std::filesystem;
    using namespace std::string_view_literals;

    // 8-byte PNG signature plus two zero bytes
    inline constexpr auto png_header_b64 = "iVBORw0KGgoAAA=="sv;
    inline const std::string png_header_bytes{"\x89PNG\r\n\x1a\n\0\0", 10};

    inline std::string predictions_json(std::string_view b64) {
        return R"({"predictions":[{"mimeType":"image/png","bytesBase64Encoded":")" + std::string{b64} + R"("}]})";
    }

    struct temp_dir {
        fs::path path{};

        explicit temp_dir(std::string_view prefix) {
            auto now = std::chrono::system_clock::now().time_since_epoch().count();
            std::ostringstream dir_name{};
            dir_name << prefix << "_" << static_cast<long>(::getpid()) << "_" << now;
            path = fs::temp_directory_path() / dir_name.str();
            fs::create_directories(path);
        }

        ~temp_dir() {
            std::error_code ec{};
            fs::remove_all(path, ec);
        }

        temp_dir(const temp_dir&) = delete;
        temp_dir& operator=(const temp_dir&) = delete;
    };

    // sets or clears an environment variable for the lifetime of the guard
    struct scoped_env {
        std::string name{};
        std::optional<std::string> previous{};

        scoped_env(std::string_view var, std::optional<std::string_view> value) : name{var} {
            if (const char* old = std::getenv(name.c_str())) {
                previous = old;
            }
            if (value) {
                ::setenv(name.c_str(), std::string{*value}.c_str(), 1);
            }
            else {
                ::unsetenv(name.c_str());
            }
        }

        ~scoped_env() {
            if (previous) {
                ::setenv(name.c_str(), previous->c_str(), 1);
            }
            else {
                ::unsetenv(name.c_str());
            }
        }

        scoped_env(const scoped_env&) = delete;
        scoped_env& operator=(const scoped_env&) = delete;
    };

    struct stub_transport final : backend::backend_transport {
        std::string body{};
        std::optional<error> failure{};
        int calls{0};
        std::string last_base_url{};
        std::string last_path{};
        std::string last_body{};

        result<std::string> post_json(
                const std::string& base_url,
                const std::string& path_and_query,
                const std::string& request_body,
                std::chrono::seconds) override {
            ++calls;
            last_base_url = base_url;
            last_path = path_and_query;
            last_body = request_body;
            if (failure) {
                return std::unexpected{*failure};
            }
            return body;
        }
    };

    inline backend_settings test_settings() {
        backend_settings settings{};
        settings.api_key = "test-key";
        settings.base_url = "http://127.0.0.1:1";
        return settings;
    }

    inline std::size_t count_images(const fs::path& base) {
        auto names = store::list(base);
        REQUIRE(names);
        return names->size();
    }

    inline std::string read_bytes(const fs::path& p) {
        std::ifstream in{p, std::ios::binary};
        REQUIRE(in.good());
        return std::string{std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
    }

    inline void write_bytes(const fs::path& p, std::string_view content) {
        std::ofstream out{p, std::ios::binary};
        REQUIRE(out.good());
        out << content;
    }

    // a loopback port that was free a moment ago
    inline uint16_t free_port() {
        int fd = ::socket(AF_INET, SOCK_STREAM, 0);
        REQUIRE(fd >= 0);
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        REQUIRE(::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);
        socklen_t len = sizeof(addr);
        REQUIRE(::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) == 0);
        ::close(fd);
        return ntohs(addr.sin_port);
    }

    inline bool port_accepts(uint16_t port) {
        int fd = ::socket(AF_INET, SOCK_STREAM, 0);
        REQUIRE(fd >= 0);
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = htons(port);
        bool connected = ::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0;
        ::close(fd);
        return connected;
    }

    // for httplib servers started with listen_after_bind on another thread
    template <typename Server>
    void wait_until_running(Server& server) {
        while (!server.is_running()) {
            std::this_thread::sleep_for(std::chrono::milliseconds{1});
        }
    }

    inline std::vector<char*> to_argv(std::vector<std::string>& args) {
        std::vector<char*> argv{};
        argv.reserve(args.size());
        for (auto& arg : args) {
            argv.push_back(arg.data());
        }
        return argv;
    }

    inline bool contains(std::string_view haystack, std::string_view needle) {
        return haystack.find(needle) != std::string_view::npos;
    }

}  // namespace imagen::test
