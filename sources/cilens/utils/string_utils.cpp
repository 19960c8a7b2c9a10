//
// Created by gregorian on 02/03/2026.
//

#include "cilens/utils/string_utils.h"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace cilens::utils {

std::string join(const std::vector<std::string>& strings, const std::string_view separator) {
    if (strings.empty()) return "";

    std::ostringstream oss;
    oss << strings[0];

    for (size_t i = 1; i < strings.size(); ++i) {
        oss << separator << strings[i];
    }

    return oss.str();
}

bool contains(const std::string_view str, const std::string_view substr) {
    return str.find(substr) != std::string_view::npos;
}

bool contains_ignore_case(const std::string_view str, const std::string_view substr) {
    return contains(to_lower(str), to_lower(substr));
}

std::string to_lower(const std::string_view str) {
    std::string result(str);
    std::ranges::transform(result, result.begin(),
                           [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string to_upper(const std::string_view str) {
    std::string result(str);
    std::ranges::transform(result, result.begin(),
                           [](const unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

std::string_view last_segment(const std::string_view str, const char delimiter) {
    const auto pos = str.rfind(delimiter);
    if (pos == std::string_view::npos) {
        return str;
    }
    return str.substr(pos + 1);
}

} // namespace cilens::utils
