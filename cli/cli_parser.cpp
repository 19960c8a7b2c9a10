//
// Created by gregorian on 11/03/2026.
//

#include "cli_parser.hpp"
#include "cilens/version.h"

#include <charconv>
#include <iostream>

namespace cilens::cli {

    namespace {

        std::optional<int> parse_int(const std::string& text) {
            int value = 0;
            const char* end = text.data() + text.size();
            if (auto [ptr, ec] = std::from_chars(text.data(), end, value); ec != std::errc{} || ptr != end) {
                return std::nullopt;
            }
            return value;
        }

    } // namespace

    Command CliParser::parse_command(const std::string& cmd) {
        if (cmd == "analyze") return Command::ANALYZE;
        if (cmd == "help" || cmd == "--help" || cmd == "-h") return Command::HELP;
        if (cmd == "version" || cmd == "--version" || cmd == "-v") return Command::VERSION;
        return Command::UNKNOWN;
    }

    Options CliParser::parse(const int argc, char** argv) {
        if (argc < 2) {
            return Options{.command = Command::HELP};
        }

        const std::string cmd_str = argv[1];
        const Command cmd = parse_command(cmd_str);

        if (cmd == Command::HELP || cmd == Command::VERSION) {
            return Options{.command = cmd};
        }

        if (cmd == Command::UNKNOWN) {
            Options opts;
            opts.errors.push_back("Unknown command: " + cmd_str);
            return opts;
        }

        if (argc >= 3 && (std::string(argv[2]) == "--help" || std::string(argv[2]) == "-h")) {
            return Options{.command = Command::HELP};
        }

        int index = 2;
        return parse_analyze_options(argc, argv, index);
    }

    Options CliParser::parse_analyze_options(const int argc, char** argv, int& index) {
        Options opts;
        opts.command = Command::ANALYZE;

        const auto next_value = [&](const std::string& flag) -> std::optional<std::string> {
            if (index < argc) return std::string(argv[index++]);
            opts.errors.push_back("Missing value for " + flag);
            return std::nullopt;
        };

        while (index < argc) {
            if (std::string arg = argv[index++]; arg == "--input" || arg == "-i") {
                if (auto v = next_value(arg)) opts.input_file = *v;
            } else if (arg == "--output" || arg == "-o") {
                if (auto v = next_value(arg)) opts.output_file = *v;
            } else if (arg == "--config" || arg == "-c") {
                if (auto v = next_value(arg)) opts.config_file = *v;
            } else if (arg == "--min-type-percentage" || arg == "-m") {
                if (auto v = next_value(arg)) {
                    if (auto n = parse_int(*v)) {
                        opts.min_type_percentage = *n;
                    } else {
                        opts.errors.push_back("Invalid value for " + arg + ": " + *v);
                    }
                }
            } else if (arg == "--provider") {
                if (auto v = next_value(arg)) opts.provider = *v;
            } else if (arg == "--project") {
                if (auto v = next_value(arg)) opts.project = *v;
            } else if (arg == "--verbose") {
                opts.verbose = true;
            } else if (!arg.empty() && arg[0] != '-' && opts.input_file.empty()) {
                opts.input_file = arg;
            } else {
                opts.errors.push_back("Unknown option: " + arg);
            }
        }

        return opts;
    }

    void CliParser::print_help() {
        std::cout << R"(
CILens - CI/CD pipeline analytics

USAGE:
    cilens <COMMAND> [OPTIONS]

COMMANDS:
    analyze        Cluster pipelines and compute latency and reliability metrics
    help           Show this help message
    version        Show version information

)";
        print_command_help(Command::ANALYZE);
    }

    void CliParser::print_version() {
        std::cout << PROJECT_SHORT_NAME << " " << VERSION_STRING << "\n";
    }

    void CliParser::print_command_help(const Command cmd) {
        switch (cmd) {
            case Command::ANALYZE:
                std::cout << R"(cilens analyze - Analyze fetched pipeline records

USAGE:
    cilens analyze --input <file> [OPTIONS]

OPTIONS:
    -i, --input <file>                Pipeline JSON document (required)
    -c, --config <file>               TOML configuration file
    -o, --output <file>               Write insights JSON here (default: stdout)
    -m, --min-type-percentage <n>     Drop pipeline types below n percent (0-100)
    --provider <name>                 Provider name reported in the output
    --project <name>                  Project name reported in the output
    --verbose                         Log debug messages
)";
                break;
            default:
                print_help();
                break;
        }
    }

} // namespace cilens::cli
