#include "imagen/cli.hpp"
#include "imagen/supervisor.hpp"

#include <exception>
#include <iostream>

int main(int argc, char** argv) {
    try {
        imagen::server_config cfg{};
        imagen::cli::apply_environment(cfg);
        if (auto cli_result = imagen::cli::parse_cli(argc, argv, cfg)) {
            return *cli_result;
        }

        return imagen::supervisor::run(cfg);
    } catch (std::exception& e) {
        std::cerr << "fatal: " << e.what() << '\n';
        return 1;
    } catch (...) {
        std::cerr << "fatal: unknown exception\n";
        return 1;
    }
}
