//
// Created by gregorian on 02/03/2026.
//

#include "cilens/core/error.h"
#include <sstream>

namespace cilens::core {

    Error::Error(const ErrorCode code,
                 std::string message,
                 const std::source_location location)
        : code(code)
        , message(std::move(message))
        , file(location.file_name())
        , line(location.line())
        , function(location.function_name()) {
    }

    Error Error::with_context(const std::string& subject) const {
        Error copy = *this;
        copy.context = context.empty() ? subject : subject + ": " + context;
        return copy;
    }

    std::string Error::to_string() const {
        std::ostringstream ss;
        ss << error_code_to_string(code) << ": " << message;

        if (!context.empty()) {
            ss << "\n  While processing: " << context;
        }

        ss << "\n  Raised at: " << file << ":" << line << " in " << function;
        return ss.str();
    }

    const char* error_code_to_string(const ErrorCode code) {
        switch (code) {
            case ErrorCode::FILE_NOT_FOUND: return "File not found";
            case ErrorCode::FILE_READ_ERROR: return "File read error";
            case ErrorCode::FILE_WRITE_ERROR: return "File write error";
            case ErrorCode::INVALID_ARGUMENT: return "Invalid argument";
            case ErrorCode::INVALID_CONFIG: return "Invalid configuration";
            case ErrorCode::PARSE_ERROR: return "Configuration parse error";
            case ErrorCode::JSON_PARSE_ERROR: return "Pipeline JSON parse error";
            case ErrorCode::MALFORMED_DATA: return "Malformed pipeline data";
            case ErrorCode::CIRCULAR_DEPENDENCY: return "Circular job dependency";
        }
        return "Unknown error code";
    }

} // namespace cilens::core
