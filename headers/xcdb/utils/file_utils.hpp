//
// Created by gregorian-rayne on 2/9/26.
//

#ifndef XCDB_FILE_UTILS_HPP
#define XCDB_FILE_UTILS_HPP

/**
 * @file file_utils.hpp
 * @brief File system utilities.
 *
 * All operations use Result<T, Error> for error handling.
 */

#include "xcdb/result.hpp"
#include "xcdb/error.hpp"

#include <string>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace xcdb::file_utils {

    namespace fs = std::filesystem;

    /**
     * Reads an entire file into a string.
     *
     * @param path Path to the file.
     * @return The file contents or an error.
     */
    inline Result<std::string, Error> read_file(const fs::path& path) {
        if (std::error_code ec; !fs::exists(path, ec)) {
            return Result<std::string, Error>::failure(
                Error::not_found("File not found", path.string())
            );
        }

        std::ifstream file(path, std::ios::binary);
        if (!file) {
            return Result<std::string, Error>::failure(
                Error::io_error("Failed to open file", path.string())
            );
        }

        std::ostringstream oss;
        oss << file.rdbuf();

        if (file.bad()) {
            return Result<std::string, Error>::failure(
                Error::io_error("Failed to read file", path.string())
            );
        }

        return Result<std::string, Error>::success(oss.str());
    }

    /**
     * Checks that a path names an existing regular file.
     */
    inline bool is_regular_file(const fs::path& path) {
        std::error_code ec;
        return fs::is_regular_file(path, ec);
    }

    /**
     * Moves `from` over `to`, replacing any existing file.
     */
    inline Result<void, Error> replace_file(const fs::path& from, const fs::path& to) {
        std::error_code ec;
        fs::rename(from, to, ec);
        if (ec) {
            return Result<void, Error>::failure(
                Error::io_error("Failed to move " + from.string() + ": " + ec.message(), to.string())
            );
        }
        return Result<void, Error>::success();
    }

    /**
     * Removes a file if it exists.
     *
     * @return True if a file was removed.
     */
    inline bool remove_if_exists(const fs::path& path) {
        std::error_code ec;
        return fs::remove(path, ec);
    }

}  // namespace xcdb::file_utils

#endif //XCDB_FILE_UTILS_HPP
