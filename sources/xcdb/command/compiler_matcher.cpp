//
// Created by gregorian-rayne on 2/10/26.
//

#include "xcdb/command/compiler_matcher.hpp"
#include "xcdb/command/tokenizer.hpp"
#include "xcdb/utils/string_utils.hpp"

#include <algorithm>

namespace xcdb::command {

    namespace {

    std::string_view basename(const std::string_view argument) {
        const auto slash = argument.rfind('/');
        return slash == std::string_view::npos ? argument : argument.substr(slash + 1);
    }

    }  // namespace

    bool is_supported_compiler(const std::string_view argument) noexcept {
        const auto name = basename(argument);
        return std::ranges::find(SUPPORTED_COMPILERS, name) != SUPPORTED_COMPILERS.end();
    }

    bool has_compile_shape(const std::vector<std::string>& arguments) noexcept {
        const auto driver = std::ranges::find_if(arguments, [](const std::string& arg) {
            return is_supported_compiler(arg);
        });
        if (driver == arguments.end()) {
            return false;
        }

        const auto compile_flag = std::find(driver + 1, arguments.end(), "-c");
        if (compile_flag == arguments.end()) {
            return false;
        }

        return std::find(compile_flag + 1, arguments.end(), "-o") != arguments.end();
    }

    std::optional<std::vector<std::string>> match_compiler_invocation(const std::string_view line) {
        // Cheap rejection before tokenizing every line of a large log.
        if (!string_utils::contains(line, "-c") || !string_utils::contains(line, "-o")) {
            return std::nullopt;
        }

        auto tokens = tokenize(line);
        if (tokens.is_err() || !has_compile_shape(tokens.value())) {
            return std::nullopt;
        }
        return std::move(tokens).value();
    }

    bool is_compiler_invocation(const std::string_view line) {
        return match_compiler_invocation(line).has_value();
    }

}  // namespace xcdb::command
