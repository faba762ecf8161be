#include "imagen/supervisor.hpp"

#include "imagen/http.hpp"
#include "imagen/mcp.hpp"
#include "imagen/store.hpp"
#include "imagen/tool.hpp"

#include <csignal>
#include <iostream>

using namespace imagen::literals;

namespace imagen::supervisor {

    namespace detail {

        static void log_info(const server_config& cfg, std::string_view message) {
            if (cfg.verbose && !cfg.quiet) {
                std::cerr << "[imagen] " << message << '\n';
            }
        }

    }  // namespace detail

    int run(const server_config& cfg, std::istream& in, std::ostream& out, backend::backend_transport& transport) {
        auto base = store::ensure_ready(cfg.data_dir);
        if (!base) {
            std::cerr << "Error: " << base.error().message << '\n';
            return 1;
        }
        detail::log_info(cfg, "artifacts stored in {}"_format(base->string()));

        if (cfg.backend.api_key.empty()) {
            std::cerr << "Error: {} environment variable is not set. Image generation will fail.\n"_format(api_key_env);
            return 1;
        }

        http::asset_server assets{*base};
        auto port = assets.bind(cfg.http_host, cfg.http_port);
        if (!port) {
            std::cerr << "Error: failed to bind asset server to {}:{}\n"_format(cfg.http_host, cfg.http_port);
            return 1;
        }
        assets.start();
        detail::log_info(cfg, "serving images at http://{}:{}{}"_format(cfg.http_host, *port, http::images_prefix));

        tool::image_tool tool{*base, cfg.backend, cfg.http_host, *port, transport};
        mcp::server session{tool};
        session.serve(in, out);
        detail::log_info(cfg, "mcp session {}, stopping asset server"_format(session.state()));

        // the asset server lives only as long as the session
        assets.stop();
        return 0;
    }

    int run(const server_config& cfg) {
        // a host that hangs up early surfaces as a failed write, not a signal
        ::signal(SIGPIPE, SIG_IGN);

        backend::http_transport transport{};
        return run(cfg, std::cin, std::cout, transport);
    }

}  // namespace imagen::supervisor
