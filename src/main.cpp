#include <iostream>
#include <string>
#include "cli/termbridge_cli.hpp"
#include "cli/theme.hpp"

void print_usage() {
    std::cout << theme::banner();
    std::cout << theme::section("Usage");
    std::cout << theme::color::BLUE << "    termbridge shell "
              << theme::color::RESET << theme::color::BROWN << "<profile>"
              << theme::color::RESET << theme::color::DIM
              << "                   Interactive shell (Ctrl-] to leave)" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    termbridge ls "
              << theme::color::RESET << theme::color::BROWN << "<profile> <path>"
              << theme::color::RESET << theme::color::DIM
              << "               List a remote directory" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    termbridge get "
              << theme::color::RESET << theme::color::BROWN << "<profile> <remote> [local]"
              << theme::color::RESET << theme::color::DIM
              << "     Download a file" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    termbridge put "
              << theme::color::RESET << theme::color::BROWN << "<profile> <local> <remote_dir>"
              << theme::color::RESET << theme::color::DIM
              << " Upload a file" << theme::color::RESET << "\n";
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    Profiles live under 'connections:' in ~/.termbridge/config.yaml\n\n"
              << "    termbridge --version        Show version\n"
              << "    termbridge --help           Show this help"
              << theme::color::RESET << "\n\n";
}

int main(int argc, char** argv) {
    try {
        if (argc == 1) {
            print_usage();
            return 1;
        }

        std::string cmd = argv[1];
        if (cmd == "--version") {
            std::cout << theme::color::BROWN << theme::color::BOLD << "termbridge"
                      << theme::color::RESET << theme::color::DIM
                      << " version 0.1.0" << theme::color::RESET << "\n";
            return 0;
        }
        if (cmd == "--help") {
            print_usage();
            return 0;
        }

        auto config = Config::load_global();
        if (config.is_err()) {
            std::cout << theme::fail(config.error);
            return 1;
        }
        TermbridgeCLI cli(config.value);

        if (cmd == "shell" && argc >= 3) {
            return cli.run_shell(argv[2]);
        } else if (cmd == "ls" && argc >= 3) {
            return cli.run_ls(argv[2], argc >= 4 ? argv[3] : ".");
        } else if (cmd == "get" && argc >= 4) {
            return cli.run_get(argv[2], argv[3], argc >= 5 ? argv[4] : "");
        } else if (cmd == "put" && argc >= 5) {
            return cli.run_put(argv[2], argv[3], argv[4]);
        }

        std::cout << theme::fail("Unknown command or missing arguments: " + cmd);
        print_usage();
        return 1;
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
