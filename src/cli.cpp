#include "imagen/cli.hpp"

#include <CLI/CLI.hpp>

#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>

namespace imagen::cli {

    namespace detail {

        static std::optional<std::string> read_env(std::string_view name) {
            const char* value = std::getenv(std::string{name}.c_str());
            if (value == nullptr) {
                return std::nullopt;
            }
            auto trimmed = utils::trim_view(value);
            if (trimmed.empty()) {
                return std::nullopt;
            }
            return std::string(trimmed);
        }

        static std::string strip_trailing_slashes(std::string url) {
            while (url.size() > 1U && url.back() == '/') {
                url.pop_back();
            }
            return url;
        }

    }  // namespace detail

    void apply_environment(server_config& cfg) {
        if (auto key = detail::read_env(api_key_env)) {
            cfg.backend.api_key = std::move(*key);
        }
        if (auto url = detail::read_env(base_url_env)) {
            cfg.backend.base_url = detail::strip_trailing_slashes(std::move(*url));
        }
    }

    void print_config(const server_config& cfg, std::ostream& os) {
        os << "data_dir=" << (cfg.data_dir ? cfg.data_dir->string() : "<default>") << '\n';
        os << "http_host=" << cfg.http_host << '\n';
        os << "http_port=" << cfg.http_port << '\n';
        os << "base_url=" << cfg.backend.base_url << '\n';
        os << "model=" << cfg.backend.model << '\n';
        os << "api_key=" << utils::mask_secret(cfg.backend.api_key) << '\n';
        os << "timeout_s=" << cfg.backend.timeout.count() << '\n';
    }

    std::optional<int> parse_cli(int argc, char** argv, server_config& cfg) {
        CLI::App app{"imagen3-mcp: MCP image generation server with a local asset server"};

        bool show_version = false;
        std::string data_dir_arg{cfg.data_dir ? cfg.data_dir->string() : std::string{}};
        std::string host_arg{cfg.http_host};
        uint16_t port_arg{cfg.http_port};
        std::string base_url_arg{cfg.backend.base_url};
        std::string model_arg{cfg.backend.model};
        long timeout_arg{static_cast<long>(cfg.backend.timeout.count())};

        app.add_flag("--version", show_version, "Print version and exit");
        app.add_option("--data-dir", data_dir_arg, "Artifact directory (default: per-user data dir)");
        app.add_option("--host", host_arg, "Asset server bind address");
        app.add_option("--port", port_arg, "Asset server port, 0 for ephemeral");
        app.add_option("--base-url", base_url_arg, "Generation backend base URL (env: BASE_URL)");
        app.add_option("--model", model_arg, "Generation backend model id");
        app.add_option("--timeout", timeout_arg, "Backend request timeout in seconds")->check(CLI::PositiveNumber);
        app.add_flag("--print-config", cfg.print_config, "Print resolved config and exit");
        app.add_flag("--quiet", cfg.quiet, "Suppress non-essential output");
        app.add_flag("--verbose", cfg.verbose, "Enable verbose output");

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            return std::optional<int>{app.exit(e)};
        }

        if (cfg.quiet && cfg.verbose) {
            std::cerr << "--quiet and --verbose are mutually exclusive\n";
            return std::optional<int>{2};
        }

        auto host = utils::trim_view(host_arg);
        if (host.empty()) {
            std::cerr << "invalid --host value: must be non-empty\n";
            return std::optional<int>{2};
        }
        auto base_url = detail::strip_trailing_slashes(std::string{utils::trim_view(base_url_arg)});
        if (!base_url.starts_with("http://") && !base_url.starts_with("https://")) {
            std::cerr << "invalid --base-url value: " << base_url_arg << " (expected http:// or https://)\n";
            return std::optional<int>{2};
        }
        if (utils::trim_view(model_arg).empty()) {
            std::cerr << "invalid --model value: must be non-empty\n";
            return std::optional<int>{2};
        }

        if (auto dir = utils::trim_view(data_dir_arg); !dir.empty()) {
            cfg.data_dir = std::filesystem::path{dir};
        }
        cfg.http_host = std::string{host};
        cfg.http_port = port_arg;
        cfg.backend.base_url = std::move(base_url);
        cfg.backend.model = std::string{utils::trim_view(model_arg)};
        cfg.backend.timeout = std::chrono::seconds{timeout_arg};

        if (show_version) {
            std::cout << server_name << ' ' << server_version << '\n';
            return std::optional<int>{0};
        }

        if (cfg.print_config) {
            print_config(cfg, std::cout);
            return std::optional<int>{0};
        }

        return std::nullopt;
    }

}  // namespace imagen::cli
