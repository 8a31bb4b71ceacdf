#include <iostream>
#include <string>
#include <core/constants.hpp>
#include "cli/remotefs_cli.hpp"
#include "cli/theme.hpp"

static const char* DEFAULT_MANIFEST = "remotefs.yaml";

void print_usage() {
    std::cout << theme::section("Usage");
    std::cout << theme::usage("remotefs apply  ", "[manifest]", "Converge the remote host to the manifest");
    std::cout << theme::usage("remotefs refresh", "[manifest]", "Re-read tracked resources into state");
    std::cout << theme::usage("remotefs destroy", "[manifest]", "Delete every tracked resource");
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    manifest defaults to ./" << DEFAULT_MANIFEST << "\n"
              << "    remotefs --version        Show version\n"
              << "    remotefs --help           Show this help"
              << theme::color::RESET << "\n\n";
}

int main(int argc, char** argv) {
    try {
        if (argc == 1) {
            print_usage();
            return 1;
        }

        std::string cmd = argv[1];
        std::string manifest = argc >= 3 ? argv[2] : DEFAULT_MANIFEST;
        RemotefsCLI cli;

        if (cmd == "--version") {
            std::cout << theme::color::BROWN << theme::color::BOLD << "remotefs"
                      << theme::color::RESET << theme::color::DIM
                      << " version " << REMOTEFS_VERSION << theme::color::RESET << "\n";
            return 0;
        } else if (cmd == "--help") {
            print_usage();
            return 0;
        } else if (cmd == "apply") {
            return cli.run_apply(manifest);
        } else if (cmd == "refresh") {
            return cli.run_refresh(manifest);
        } else if (cmd == "destroy") {
            return cli.run_destroy(manifest);
        }

        std::cout << theme::fail("Unknown command: " + cmd);
        print_usage();
        return 1;
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
