#include "langbridge.hpp"

#include <exception>
#include <iostream>

int main(int argc, char** argv) {
    try {
        langbridge::startup_config cfg{};
        langbridge::apply_environment(cfg);
        if (auto cli_result = langbridge::cli::parse_cli(argc, argv, cfg)) {
            return *cli_result;
        }

        return langbridge::mcp::run_mcp_server(cfg);
    } catch (std::exception& e) {
        std::cerr << "fatal: " << e.what() << '\n';
        return 1;
    } catch (...) {
        std::cerr << "fatal: unknown exception\n";
        return 1;
    }
}
