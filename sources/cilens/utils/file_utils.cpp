//
// Created by gregorian on 02/03/2026.
//

#include "cilens/utils/file_utils.h"

#include <filesystem>
#include <fstream>
#include <sstream>

namespace cilens::utils {

std::optional<std::string> read_file(const std::string_view path) {
    std::ifstream file(std::string(path), std::ios::in | std::ios::binary);

    if (!file.is_open()) {
        return std::nullopt;
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

bool write_file(const std::string_view path, const std::string_view content) {
    const std::filesystem::path p(path);

    if (!p.parent_path().empty()) {
        std::error_code ec;
        std::filesystem::create_directories(p.parent_path(), ec);
        if (ec) {
            return false;
        }
    }

    std::ofstream file(p, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        return false;
    }

    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    return file.good();
}

bool file_exists(const std::string_view path) {
    std::error_code ec;
    return std::filesystem::is_regular_file(std::filesystem::path(path), ec);
}

} // namespace cilens::utils
