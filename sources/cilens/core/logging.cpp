//
// Created by gregorian on 03/03/2026.
//

#include "cilens/core/logging.h"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <vector>

namespace cilens::core {
    namespace {
        constexpr auto LOG_PATTERN = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";
    }

    spdlog::level::level_enum parse_log_level(const std::string& level) {
        if (level == "warning") {
            return spdlog::level::warn;
        }
        return spdlog::level::from_str(level);
    }

    Result<void> init_logging(const LoggingConfig& config) {
        if (!is_known_log_level(config.level)) {
            return Result<void>::failure(ErrorCode::INVALID_CONFIG,
                                         "Unknown logging level: " + config.level);
        }

        std::vector<spdlog::sink_ptr> sinks;
        if (config.console) {
            sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        }

        if (!config.file.empty()) {
            try {
                sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.file, false));
            } catch (const spdlog::spdlog_ex& ex) {
                return Result<void>::failure(ErrorCode::FILE_WRITE_ERROR,
                                             "Cannot open log file " + config.file + ": " + ex.what());
            }
        }

        if (sinks.empty()) {
            sinks.push_back(std::make_shared<spdlog::sinks::null_sink_mt>());
        }

        spdlog::drop(LOGGER_NAME);
        auto logger = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
        logger->set_pattern(LOG_PATTERN);
        logger->set_level(parse_log_level(config.level));
        spdlog::set_default_logger(std::move(logger));
        spdlog::flush_on(spdlog::level::warn);

        return Result<void>::success();
    }

    void shutdown_logging() {
        spdlog::shutdown();
    }

} // namespace cilens::core
