//
// Created by gregorian on 03/03/2026.
//

#include "cilens/core/config.h"

#include "cilens/utils/file_utils.h"
#include "cilens/utils/string_utils.h"
#include <toml++/toml.h>
#include <algorithm>
#include <array>
#include <sstream>
#include <vector>

namespace cilens::core {
    Result<Config> Config::load_from_file(const std::string& path) {
        const auto content = utils::read_file(path);
        if (!content) {
            return Result<Config>::failure(ErrorCode::FILE_NOT_FOUND,
                                           "Configuration file not found: " + path);
        }

        return load_from_string(*content).map_error([&](const Error& error) {
            return error.with_context(path);
        });
    }

    Result<Config> Config::load_from_string(const std::string& content) {
        try {
            auto tbl = toml::parse(content);
            Config config;

            if (const auto* section = tbl["general"].as_table()) {
                const auto& general = *section;
                if (general["provider"])
                    config.general.provider = std::string(general["provider"].value_or("GitLab"));
                if (general["project"])
                    config.general.project = std::string(general["project"].value_or(""));
            }

            if (const auto* section = tbl["analysis"].as_table()) {
                const auto& analysis = *section;
                if (analysis["min_type_percentage"])
                    config.analysis.min_type_percentage = analysis["min_type_percentage"].value_or(1);
            }

            if (const auto* section = tbl["links"].as_table()) {
                const auto& links = *section;
                if (links["base_url"])
                    config.links.base_url = std::string(links["base_url"].value_or("https://gitlab.com"));
                if (links["project_path"])
                    config.links.project_path = std::string(links["project_path"].value_or(""));
            }

            if (const auto* section = tbl["output"].as_table()) {
                const auto& output = *section;
                if (output["pretty"])
                    config.output.pretty = output["pretty"].value_or(true);
                if (output["indent"])
                    config.output.indent = output["indent"].value_or(2);
            }

            if (const auto* section = tbl["logging"].as_table()) {
                const auto& log = *section;
                if (log["level"])
                    config.logging.level = utils::to_lower(log["level"].value_or("info"));
                if (log["file"])
                    config.logging.file = std::string(log["file"].value_or(""));
                if (log["console"])
                    config.logging.console = log["console"].value_or(true);
            }

            if (auto validation_result = config.validate(); !validation_result.is_success()) {
                return Result<Config>::failure(validation_result.error());
            }

            return Result<Config>::success(std::move(config));

        } catch (const toml::parse_error& err) {
            return Result<Config>::failure(ErrorCode::PARSE_ERROR,
                                           "Failed to parse TOML configuration: " + std::string(err.description()));
        }
    }

    Config Config::default_config() {
        return Config{};
    }

    Result<void> Config::save_to_file(const std::string& path) const {
        if (!utils::write_file(path, to_string())) {
            return Result<void>::failure(ErrorCode::FILE_WRITE_ERROR,
                                         "Failed to write configuration to file: " + path);
        }

        return Result<void>::success();
    }

    std::string Config::to_string() const {
        const toml::table tbl{
            {"general", toml::table{
                {"provider", general.provider},
                {"project", general.project}
            }},
            {"analysis", toml::table{
                {"min_type_percentage", analysis.min_type_percentage}
            }},
            {"links", toml::table{
                {"base_url", links.base_url},
                {"project_path", links.project_path}
            }},
            {"output", toml::table{
                {"pretty", output.pretty},
                {"indent", output.indent}
            }},
            {"logging", toml::table{
                {"level", logging.level},
                {"file", logging.file},
                {"console", logging.console}
            }}
        };

        // toml++ escapes quotes and backslashes in string values
        std::ostringstream ss;
        ss << tbl << "\n";
        return ss.str();
    }

    Result<void> Config::validate() const {
        std::vector<std::string> errors;

        if (analysis.min_type_percentage < 0 || analysis.min_type_percentage > 100) {
            errors.emplace_back("min_type_percentage must be between 0 and 100");
        }

        if (output.indent < 0) {
            errors.emplace_back("indent must be non-negative");
        }

        if (!is_known_log_level(logging.level)) {
            errors.emplace_back("unknown logging level '" + logging.level + "'");
        }

        if (!errors.empty()) {
            return Result<void>::failure(ErrorCode::INVALID_CONFIG,
                                         "Configuration validation failed:\n  " + utils::join(errors, "\n  "));
        }

        return Result<void>::success();
    }

    bool is_known_log_level(const std::string& level) {
        static constexpr std::array<std::string_view, 8> levels = {
            "trace", "debug", "info", "warn", "warning", "error", "critical", "off"
        };
        return std::ranges::find(levels, level) != levels.end();
    }

} // namespace cilens::core
