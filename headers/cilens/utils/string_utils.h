//
// Created by gregorian on 02/03/2026.
//

#ifndef CILENS_STRING_UTILS_H
#define CILENS_STRING_UTILS_H

#include <string>
#include <string_view>
#include <vector>

namespace cilens::utils {
    /**
     * Join a list of strings into a single string, inserting `separator` between them.
     *
     * @param strings The vector of strings to join.
     * @param separator The string to insert between each pair.
     * @return The concatenated result, or an empty string if `strings` is empty.
     */
    std::string join(const std::vector<std::string>& strings, std::string_view separator);

    bool contains(std::string_view str, std::string_view substr);

    /**
     * Case-insensitive substring test (ASCII only).
     *
     * @param str The text to search in.
     * @param substr The text to search for; expected to be lower-case.
     */
    bool contains_ignore_case(std::string_view str, std::string_view substr);

    std::string to_lower(std::string_view str);
    std::string to_upper(std::string_view str);

    /**
     * Return the part of `str` after the last occurrence of `delimiter`, or the
     * whole string when the delimiter does not occur.
     */
    std::string_view last_segment(std::string_view str, char delimiter);

} // namespace cilens::utils

#endif //CILENS_STRING_UTILS_H
