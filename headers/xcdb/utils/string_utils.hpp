//
// Created by gregorian-rayne on 2/9/26.
//

#ifndef XCDB_STRING_UTILS_HPP
#define XCDB_STRING_UTILS_HPP

/**
 * @file string_utils.hpp
 * @brief String helpers used while scanning build logs.
 */

#include <string>
#include <string_view>
#include <vector>
#include <algorithm>
#include <cctype>
#include <sstream>

namespace xcdb::string_utils {

    inline std::string_view trim_left(std::string_view s) noexcept {
        const auto it = std::ranges::find_if(s, [](const unsigned char c) {
            return !std::isspace(c);
        });
        return s.substr(static_cast<std::size_t>(it - s.begin()));
    }

    inline std::string_view trim_right(std::string_view s) noexcept {
        const auto it = std::find_if(s.rbegin(), s.rend(), [](const unsigned char c) {
            return !std::isspace(c);
        });
        return s.substr(0, static_cast<std::size_t>(s.rend() - it));
    }

    /**
     * Trims whitespace from both ends of a string.
     */
    inline std::string_view trim(const std::string_view s) noexcept {
        return trim_left(trim_right(s));
    }

    /**
     * Splits a string by a delimiter, keeping empty parts.
     *
     * @param s The string to split.
     * @param delimiter The character to split on.
     * @return Views into s, one per part.
     */
    inline std::vector<std::string_view> split(std::string_view s, const char delimiter) {
        std::vector<std::string_view> result;
        std::size_t start = 0;
        std::size_t end = s.find(delimiter);

        while (end != std::string_view::npos) {
            result.push_back(s.substr(start, end - start));
            start = end + 1;
            end = s.find(delimiter, start);
        }

        result.push_back(s.substr(start));
        return result;
    }

    /**
     * Splits text into lines on '\n', dropping a trailing '\r' from each
     * line. A final line break does not produce an extra empty line.
     */
    inline std::vector<std::string> split_lines(std::string_view text) {
        std::vector<std::string> lines;
        if (text.empty()) {
            return lines;
        }

        for (auto part : split(text, '\n')) {
            if (!part.empty() && part.back() == '\r') {
                part.remove_suffix(1);
            }
            lines.emplace_back(part);
        }

        if (text.back() == '\n') {
            lines.pop_back();
        }
        return lines;
    }

    template<typename Container>
    std::string join(const Container& parts, const std::string_view delimiter) {
        if (parts.empty()) {
            return "";
        }

        std::ostringstream oss;
        auto it = parts.begin();
        oss << *it;
        ++it;

        for (; it != parts.end(); ++it) {
            oss << delimiter << *it;
        }

        return oss.str();
    }

    inline bool starts_with(const std::string_view s, const std::string_view prefix) noexcept {
        return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
    }

    inline bool ends_with(const std::string_view s, const std::string_view suffix) noexcept {
        return s.size() >= suffix.size() &&
               s.substr(s.size() - suffix.size()) == suffix;
    }

    inline bool contains(const std::string_view s, const std::string_view needle) noexcept {
        return s.find(needle) != std::string_view::npos;
    }

    /**
     * Checks whether s contains any of the given characters.
     */
    inline bool contains_any(const std::string_view s, const std::string_view chars) noexcept {
        return s.find_first_of(chars) != std::string_view::npos;
    }

    inline std::string to_lower(const std::string_view s) {
        std::string result(s);
        std::ranges::transform(result, result.begin(),
                               [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return result;
    }

}  // namespace xcdb::string_utils

#endif //XCDB_STRING_UTILS_HPP
