//
// Created by gregorian on 02/03/2026.
//

#ifndef CILENS_CORE_ERROR_H
#define CILENS_CORE_ERROR_H

#include <cstdint>
#include <source_location>
#include <string>

namespace cilens::core {

    /**
     * Failures raised around the analytics engine: reading the pipeline document,
     * loading configuration, resolving job dependencies and writing insights.
     */
    enum class ErrorCode {
        FILE_NOT_FOUND,
        FILE_READ_ERROR,
        FILE_WRITE_ERROR,

        INVALID_ARGUMENT,
        INVALID_CONFIG,

        PARSE_ERROR,          ///< TOML syntax.
        JSON_PARSE_ERROR,
        MALFORMED_DATA,       ///< Valid JSON with the wrong shape.

        CIRCULAR_DEPENDENCY
    };

    /**
     * An error with the place it was raised and, optionally, what was being
     * processed at the time (an input file, a pipeline id).
     */
    struct Error {
        ErrorCode code{};
        std::string message{};
        std::string context{};

        std::string file{};
        uint_least32_t line{};
        std::string function{};

        Error() = default;

        Error(ErrorCode code,
              std::string message,
              std::source_location location = std::source_location::current());

        /**
         * Copy of this error whose context names @p subject. An existing context
         * is kept after it, so outer callers read first: "input.json: pipeline 7".
         */
        [[nodiscard]] Error with_context(const std::string& subject) const;

        /// Code name, message, context and location on separate lines.
        [[nodiscard]] std::string to_string() const;
    };

    const char* error_code_to_string(ErrorCode code);

}  // namespace cilens::core

#endif //CILENS_CORE_ERROR_H
