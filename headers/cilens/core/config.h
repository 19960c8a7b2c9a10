//
// Created by gregorian on 03/03/2026.
//

#ifndef CILENS_CORE_CONFIG_H
#define CILENS_CORE_CONFIG_H

#include "cilens/core/result.h"
#include <string>

namespace cilens::core {

    struct GeneralConfig {
        std::string provider = "GitLab";
        std::string project;
    };

    struct AnalysisConfig {
        int min_type_percentage = 1;   ///< Pipeline types below this share of all pipelines are dropped.
    };

    struct LinksConfig {
        std::string base_url = "https://gitlab.com";
        std::string project_path;      ///< Empty: evidence links are emitted as raw ids.
    };

    struct OutputConfig {
        bool pretty = true;
        int indent = 2;
    };

    struct LoggingConfig {
        std::string level = "info";
        std::string file;              ///< Empty: no file sink.
        bool console = true;
    };

    class Config {
    public:
        Config() = default;

        GeneralConfig general;
        AnalysisConfig analysis;
        LinksConfig links;
        OutputConfig output;
        LoggingConfig logging;

        /**
         * Load configuration from a TOML file.
         *
         * @param path Filesystem path to the config file.
         * @return Result containing a Config if successful, or an Error on failure.
         */
        static Result<Config> load_from_file(const std::string& path);

        /**
         * Load configuration from TOML text. Missing tables and keys keep their defaults.
         *
         * @param content Text content of a configuration file.
         * @return Result containing a validated Config, or PARSE_ERROR / INVALID_CONFIG.
         */
        static Result<Config> load_from_string(const std::string& content);

        static Config default_config();

        /**
         * Save this configuration to a file on disk.
         */
        [[nodiscard]] Result<void> save_to_file(const std::string& path) const;

        /**
         * Serialize the configuration back to TOML.
         */
        [[nodiscard]] std::string to_string() const;

        /**
         * Check ranges: min_type_percentage in [0, 100], indent non-negative,
         * logging level a known level name.
         *
         * @return Result<void>, INVALID_CONFIG listing every violation.
         */
        [[nodiscard]] Result<void> validate() const;
    };

    /// True for trace, debug, info, warn, warning, error, critical and off.
    bool is_known_log_level(const std::string& level);

}

#endif //CILENS_CORE_CONFIG_H
