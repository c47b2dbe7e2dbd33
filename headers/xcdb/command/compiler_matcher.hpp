//
// Created by gregorian-rayne on 2/10/26.
//

#ifndef XCDB_COMPILER_MATCHER_HPP
#define XCDB_COMPILER_MATCHER_HPP

/**
 * @file compiler_matcher.hpp
 * @brief Recognizes compiler driver invocations inside build log sections.
 *
 * A section contains progress output, environment exports and other tool
 * invocations besides the compiler call. A line is accepted only when it
 * names a known driver, followed by a standalone -c, followed by a
 * standalone -o.
 */

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace xcdb::command {

    /**
     * Driver names accepted as compilers. Matched against the basename
     * of an argument, so "/usr/bin/clang" and "clang" both qualify.
     */
    inline constexpr std::array<std::string_view, 11> SUPPORTED_COMPILERS = {
        "clang",
        "clang++",
        "llvm-cpp-4.2",
        "llvm-g++",
        "llvm-g++-4.2",
        "llvm-gcc",
        "llvm-gcc-4.2",
        "gcc",
        "g++",
        "c++",
        "cc",
    };

    /**
     * Checks whether an argument names a supported compiler driver.
     */
    [[nodiscard]] bool is_supported_compiler(std::string_view argument) noexcept;

    /**
     * Checks the argument list for driver, -c and -o in that order.
     */
    [[nodiscard]] bool has_compile_shape(const std::vector<std::string>& arguments) noexcept;

    /**
     * Tokenizes a log line and returns its arguments when it is a
     * supported compiler invocation. Lines that cannot be tokenized are
     * treated as non-matching.
     */
    [[nodiscard]] std::optional<std::vector<std::string>> match_compiler_invocation(std::string_view line);

    [[nodiscard]] bool is_compiler_invocation(std::string_view line);

}  // namespace xcdb::command

#endif //XCDB_COMPILER_MATCHER_HPP
