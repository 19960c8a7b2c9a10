//
// Created by gregorian on 03/03/2026.
//

#ifndef CILENS_CORE_LOGGING_H
#define CILENS_CORE_LOGGING_H

#include "cilens/core/config.h"
#include "cilens/core/result.h"

#include <spdlog/common.h>
#include <string>

namespace cilens::core {

    constexpr auto LOGGER_NAME = "cilens";

    /**
     * Install the `cilens` logger as spdlog's default logger.
     *
     * Sinks: colored stderr when `config.console` is set, a file sink when
     * `config.file` is non-empty. With neither, log records are discarded.
     * Calling it again replaces the previous logger.
     *
     * @return FILE_WRITE_ERROR if the log file cannot be opened,
     *         INVALID_CONFIG for an unknown level.
     */
    Result<void> init_logging(const LoggingConfig& config);

    /**
     * Map a configuration level name to spdlog's level. "warning" is accepted as
     * an alias of "warn".
     */
    spdlog::level::level_enum parse_log_level(const std::string& level);

    void shutdown_logging();

    /**
     * Calls shutdown_logging() when it goes out of scope, flushing every sink on
     * all return paths of a command.
     */
    class LoggingGuard {
    public:
        LoggingGuard() = default;

        ~LoggingGuard() {
            shutdown_logging();
        }

        LoggingGuard(const LoggingGuard&) = delete;
        LoggingGuard& operator=(const LoggingGuard&) = delete;
    };

}

#endif //CILENS_CORE_LOGGING_H
