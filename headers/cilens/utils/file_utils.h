//
// Created by gregorian on 02/03/2026.
//

#ifndef CILENS_FILE_UTILS_H
#define CILENS_FILE_UTILS_H

#include <optional>
#include <string>
#include <string_view>

namespace cilens::utils {
    /**
     * Read the whole content of a file.
     *
     * @param path Path to the file.
     * @return The file content, or std::nullopt if the file cannot be opened.
     */
    std::optional<std::string> read_file(std::string_view path);

    /**
     * Write `content` to `path`, creating parent directories as needed and
     * truncating any existing file.
     *
     * @return True if the whole content was written.
     */
    bool write_file(std::string_view path, std::string_view content);

    bool file_exists(std::string_view path);
} // namespace cilens::utils

#endif //CILENS_FILE_UTILS_H
