//
// Created by gregorian on 11/03/2026.
//

#include "cli_parser.hpp"
#include "app.hpp"
#include <iostream>
#include <exception>

int main(const int argc, char** argv) {
    try {
        const cilens::cli::Options options = cilens::cli::CliParser::parse(argc, argv);

        if (options.command == cilens::cli::Command::HELP) {
            cilens::cli::CliParser::print_help();
            return 0;
        }

        if (options.command == cilens::cli::Command::VERSION) {
            cilens::cli::CliParser::print_version();
            return 0;
        }

        cilens::cli::App app(options);
        return app.run();

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
