//
// Created by gregorian-rayne on 2/10/26.
//

#ifndef XCDB_TOKENIZER_HPP
#define XCDB_TOKENIZER_HPP

/**
 * @file tokenizer.hpp
 * @brief Shell-style command line splitting and compilation database quoting.
 *
 * Build logs print compiler invocations the way a shell would accept
 * them. tokenize() turns such a line back into argv, and quote() renders
 * one argument in the narrow escaping scheme understood by compilation
 * database consumers (only space, double quote and backslash are special).
 *
 * Usage:
 * @code
 *     auto tokens = command::tokenize(R"(clang -DNAME="a b" -c a.c -o a.o)");
 *     // tokens: clang, -DNAME=a b, -c, a.c, -o, a.o
 *
 *     command::quote("-DNAME=a b");   // "\"-DNAME=a b\""
 *     command::quote("");             // "\"\""
 * @endcode
 */

#include "xcdb/result.hpp"
#include "xcdb/error.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace xcdb::command {

    /**
     * Characters that switch tokenize() from the plain space split to
     * full shell word splitting.
     */
    inline constexpr std::string_view SHELL_QUOTING_CHARS = "'\"\\";

    /**
     * Characters that force quote() to wrap an argument.
     */
    inline constexpr std::string_view COMPDB_SPECIAL_CHARS = " \"\\";

    /**
     * Splits a command line into arguments.
     *
     * Lines without quotes or backslashes are split on single spaces and
     * each piece is trimmed; empty pieces are dropped. Tabs inside such a
     * piece are kept as part of the argument. All other lines go through
     * split_shell_words().
     *
     * @param line The command line.
     * @return The arguments, or a ParseError for unbalanced quoting.
     */
    [[nodiscard]] Result<std::vector<std::string>, Error> tokenize(std::string_view line);

    /**
     * POSIX shell word splitting without expansion.
     *
     * Blanks separate words. Single quotes are literal. Inside double
     * quotes a backslash escapes only \, ", $, ` and newline. Outside
     * quotes a backslash escapes the next character, and backslash-newline
     * is removed. Quoted empty strings produce empty words.
     */
    [[nodiscard]] Result<std::vector<std::string>, Error> split_shell_words(std::string_view line);

    /**
     * Quotes one argument for the "command" field of a compilation database.
     *
     * Empty arguments become "". Arguments without space, double quote or
     * backslash are returned unchanged. Anything else is wrapped in double
     * quotes with backslashes doubled, then double quotes escaped.
     */
    [[nodiscard]] std::string quote(std::string_view argument);

    /**
     * Reverses quote() for strings it produced.
     */
    [[nodiscard]] std::string unquote(std::string_view quoted);

    /**
     * Quotes every argument and joins them with single spaces.
     */
    [[nodiscard]] std::string join_quoted(const std::vector<std::string>& arguments);

}  // namespace xcdb::command

#endif //XCDB_TOKENIZER_HPP
