//
// Created by gregorian-rayne on 2/10/26.
//

#include "xcdb/command/tokenizer.hpp"
#include "xcdb/utils/string_utils.hpp"

namespace xcdb::command {

    namespace {

    bool is_blank(const char c) {
        return c == ' ' || c == '\t' || c == '\n' || c == '\r';
    }

    // Characters a backslash may escape inside double quotes.
    bool is_double_quote_escapable(const char c) {
        return c == '\\' || c == '"' || c == '$' || c == '`' || c == '\n';
    }

    std::vector<std::string> split_on_spaces(const std::string_view line) {
        std::vector<std::string> tokens;
        for (const auto piece : string_utils::split(string_utils::trim(line), ' ')) {
            if (const auto token = string_utils::trim(piece); !token.empty()) {
                tokens.emplace_back(token);
            }
        }
        return tokens;
    }

    }  // namespace

    Result<std::vector<std::string>, Error> tokenize(const std::string_view line) {
        if (!string_utils::contains_any(line, SHELL_QUOTING_CHARS)) {
            return Result<std::vector<std::string>, Error>::success(split_on_spaces(line));
        }
        return split_shell_words(line);
    }

    Result<std::vector<std::string>, Error> split_shell_words(const std::string_view line) {
        std::vector<std::string> words;
        std::string current;
        bool in_word = false;
        const std::size_t n = line.size();

        for (std::size_t i = 0; i < n; ++i) {
            const char c = line[i];

            if (is_blank(c)) {
                if (in_word) {
                    words.push_back(std::move(current));
                    current.clear();
                    in_word = false;
                }
                continue;
            }

            if (c == '\'') {
                const auto close = line.find('\'', i + 1);
                if (close == std::string_view::npos) {
                    return Result<std::vector<std::string>, Error>::failure(
                        Error::parse_error("No closing quotation", std::string(line))
                    );
                }
                current.append(line.substr(i + 1, close - i - 1));
                in_word = true;
                i = close;
                continue;
            }

            if (c == '"') {
                in_word = true;
                ++i;
                while (true) {
                    if (i >= n) {
                        return Result<std::vector<std::string>, Error>::failure(
                            Error::parse_error("No closing quotation", std::string(line))
                        );
                    }
                    const char q = line[i];
                    if (q == '"') {
                        break;
                    }
                    if (q == '\\' && i + 1 < n && is_double_quote_escapable(line[i + 1])) {
                        if (line[i + 1] != '\n') {
                            current += line[i + 1];
                        }
                        i += 2;
                        continue;
                    }
                    current += q;
                    ++i;
                }
                continue;
            }

            if (c == '\\') {
                if (i + 1 >= n) {
                    return Result<std::vector<std::string>, Error>::failure(
                        Error::parse_error("No escaped character", std::string(line))
                    );
                }
                ++i;
                if (line[i] == '\n') {
                    continue;
                }
                current += line[i];
                in_word = true;
                continue;
            }

            current += c;
            in_word = true;
        }

        if (in_word) {
            words.push_back(std::move(current));
        }

        return Result<std::vector<std::string>, Error>::success(std::move(words));
    }

    std::string quote(const std::string_view argument) {
        if (argument.empty()) {
            return "\"\"";
        }
        if (!string_utils::contains_any(argument, COMPDB_SPECIAL_CHARS)) {
            return std::string(argument);
        }

        // Backslashes first, so the ones added for quotes are not doubled.
        std::string escaped;
        escaped.reserve(argument.size() + 8);
        for (const char c : argument) {
            if (c == '\\') {
                escaped += "\\\\";
            } else {
                escaped += c;
            }
        }

        std::string result = "\"";
        for (const char c : escaped) {
            if (c == '"') {
                result += "\\\"";
            } else {
                result += c;
            }
        }
        result += '"';
        return result;
    }

    std::string unquote(const std::string_view quoted) {
        if (quoted.size() < 2 || quoted.front() != '"' || quoted.back() != '"') {
            return std::string(quoted);
        }

        const auto inner = quoted.substr(1, quoted.size() - 2);
        std::string result;
        result.reserve(inner.size());

        for (std::size_t i = 0; i < inner.size(); ++i) {
            if (inner[i] == '\\' && i + 1 < inner.size()) {
                ++i;
            }
            result += inner[i];
        }
        return result;
    }

    std::string join_quoted(const std::vector<std::string>& arguments) {
        std::vector<std::string> quoted;
        quoted.reserve(arguments.size());
        for (const auto& argument : arguments) {
            quoted.push_back(quote(argument));
        }
        return string_utils::join(quoted, " ");
    }

}  // namespace xcdb::command
