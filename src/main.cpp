#include <iostream>
#include <string>
#include <vector>
#include <stdexcept>
#include "../include/cli/cli.h"
#include "../include/cli/config.h"
#include "../include/db/errors.h"

int main(int argc, char* argv[]) {
    primdb::cli::Config config;
    try {
        config = primdb::cli::load_config(std::vector<std::string>(argv + 1, argv + argc));
    } catch (const primdb::db::ParseError& e) {
        std::cerr << "Error: " << e.what() << "\n\n" << primdb::cli::usage();
        return 2;
    }

    if (config.show_help) {
        std::cout << primdb::cli::usage();
        return 0;
    }

    try {
        primdb::cli::CLI cli(config);

        // If we have commands, execute each one and exit
        if (!config.commands.empty()) {
            for (const auto& command : config.commands) {
                if (!cli.execute_command(command)) {
                    break;
                }
            }
        } else {
            // Otherwise, start the interactive CLI
            cli.start();
        }

        return 0;
    } catch (const primdb::db::DBError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Unexpected error: " << e.what() << std::endl;
        return 1;
    }
}
