//
// Created by gregorian on 11/03/2026.
//

#ifndef CILENS_CLI_PARSER_HPP
#define CILENS_CLI_PARSER_HPP

#include <optional>
#include <string>
#include <vector>

namespace cilens::cli {

    enum class Command {
        ANALYZE,
        HELP,
        VERSION,
        UNKNOWN
    };

    /**
     * Parsed command line. Unset optionals fall back to the configuration file,
     * then to built-in defaults.
     */
    struct Options {
        Command command = Command::UNKNOWN;

        std::string input_file;
        std::string output_file;
        std::optional<std::string> config_file;

        std::optional<int> min_type_percentage;
        std::optional<std::string> provider;
        std::optional<std::string> project;

        bool verbose = false;

        /// Problems found while parsing; reported by App::run().
        std::vector<std::string> errors;
    };

    class CliParser {
    public:
        static Options parse(int argc, char** argv);
        static void print_help();
        static void print_command_help(Command cmd);
        static void print_version();

    private:
        static Command parse_command(const std::string& cmd);
        static Options parse_analyze_options(int argc, char** argv, int& index);
    };

} // namespace cilens::cli

#endif //CILENS_CLI_PARSER_HPP
