#include <iostream>
#include <vector>
#include <string>
#include "cli/docsync_cli.hpp"
#include "cli/theme.hpp"

#ifndef DOCSYNC_VERSION
#define DOCSYNC_VERSION "0.1.0"
#endif

int main(int argc, char** argv) {
    try {
        DocsyncCLI cli;

        if (argc == 1) {
            std::cout << theme::banner(DOCSYNC_VERSION);
            cli.print_help();
            return 1;
        }

        std::string cmd = argv[1];
        if (cmd == "--version") {
            std::cout << theme::color::TEAL << theme::color::BOLD << "docsync"
                      << theme::color::RESET << theme::color::DIM
                      << " version " DOCSYNC_VERSION << theme::color::RESET << "\n";
            return 0;
        } else if (cmd == "--help" || cmd == "help") {
            std::cout << theme::banner(DOCSYNC_VERSION);
            cli.print_help();
            return 0;
        }

        std::vector<std::string> args(argv + 2, argv + argc);
        return cli.run(cmd, args);
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
