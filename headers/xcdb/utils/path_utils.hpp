//
// Created by gregorian-rayne on 2/9/26.
//

#ifndef XCDB_PATH_UTILS_HPP
#define XCDB_PATH_UTILS_HPP

/**
 * @file path_utils.hpp
 * @brief Lexical path helpers for compilation database entries.
 *
 * Paths in a build log may point at machines or sandboxes that no longer
 * exist, so nothing here touches the filesystem except exists().
 */

#include "xcdb/utils/string_utils.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace xcdb::path_utils {

    namespace fs = std::filesystem;

    /**
     * Normalizes a POSIX path lexically.
     *
     * Collapses repeated separators, removes "." components and resolves
     * ".." against the preceding component. ".." above the root of an
     * absolute path is dropped; leading ".." of a relative path is kept.
     * A leading "//" is preserved, three or more leading slashes collapse
     * to one. An empty result becomes ".".
     *
     * Examples:
     *   "/project/./src//a.cpp"  -> "/project/src/a.cpp"
     *   "build/../src/a.cpp"     -> "src/a.cpp"
     *   "../a.cpp"               -> "../a.cpp"
     *   "/.."                    -> "/"
     *
     * @param path The path to normalize.
     * @return The normalized path.
     */
    inline std::string normalize(const std::string_view path) {
        if (path.empty()) {
            return ".";
        }

        std::size_t leading = 0;
        while (leading < path.size() && path[leading] == '/') {
            ++leading;
        }
        const std::string prefix = leading == 0 ? "" : (leading == 2 ? "//" : "/");

        std::vector<std::string_view> parts;
        std::size_t pos = leading;
        while (pos <= path.size()) {
            auto next = path.find('/', pos);
            if (next == std::string_view::npos) {
                next = path.size();
            }
            const auto component = path.substr(pos, next - pos);
            pos = next + 1;

            if (component.empty() || component == ".") {
                continue;
            }
            if (component == "..") {
                if ((prefix.empty() && parts.empty()) || (!parts.empty() && parts.back() == "..")) {
                    parts.push_back(component);
                } else if (!parts.empty()) {
                    parts.pop_back();
                }
                continue;
            }
            parts.push_back(component);
        }

        std::string result = prefix;
        for (std::size_t i = 0; i < parts.size(); ++i) {
            if (i > 0) {
                result += '/';
            }
            result += parts[i];
        }

        return result.empty() ? "." : result;
    }

    /**
     * Checks whether a path exists on disk. Errors count as "does not exist".
     */
    inline bool exists(const std::string& path) {
        std::error_code ec;
        return fs::exists(fs::path(path), ec);
    }

    /**
     * Returns the extension of the final path component in lowercase,
     * including the leading dot.
     */
    inline std::string lower_extension(const fs::path& path) {
        return string_utils::to_lower(path.extension().string());
    }

}  // namespace xcdb::path_utils

#endif //XCDB_PATH_UTILS_HPP
