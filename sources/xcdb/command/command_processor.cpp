//
// Created by gregorian-rayne on 2/10/26.
//

#include "xcdb/command/command_processor.hpp"
#include "xcdb/command/tokenizer.hpp"
#include "xcdb/utils/path_utils.hpp"
#include "xcdb/utils/string_utils.hpp"

#include <algorithm>
#include <optional>
#include <utility>
#include <vector>

namespace xcdb::command {

    namespace {

    constexpr std::string_view INCLUDE_FLAG = "-include";
    constexpr std::string_view COMPILE_FLAG = "-c";
    constexpr std::string_view OUTPUT_FLAG = "-o";

    }  // namespace

    bool is_pch_output(const std::string_view path) noexcept {
        return std::ranges::any_of(PCH_OUTPUT_SUFFIXES, [path](const std::string_view suffix) {
            return string_utils::ends_with(path, suffix);
        });
    }

    FileExistsFn filesystem_exists() {
        return [](const std::string& path) { return path_utils::exists(path); };
    }

    CommandProcessor::CommandProcessor(pch::PchTable& table)
        : CommandProcessor(table, filesystem_exists()) {}

    CommandProcessor::CommandProcessor(pch::PchTable& table, FileExistsFn file_exists)
        : table_(table)
        , file_exists_(std::move(file_exists)) {}

    Result<bool, Error> CommandProcessor::register_source_for_pch(
        const std::string_view line,
        const std::string& /*directory*/
    ) const {
        auto tokens_result = tokenize(line);
        if (tokens_result.is_err()) {
            return Result<bool, Error>::failure(tokens_result.error());
        }
        const auto& tokens = tokens_result.value();

        std::optional<std::string> source;
        std::optional<std::string> artifact;

        for (std::size_t i = 0; i + 1 < tokens.size(); ++i) {
            if (tokens[i] == COMPILE_FLAG) {
                source = tokens[++i];
            } else if (tokens[i] == OUTPUT_FLAG) {
                if (is_pch_output(tokens[i + 1])) {
                    artifact = tokens[i + 1];
                }
                ++i;
            }
        }

        if (!source || !artifact) {
            return Result<bool, Error>::success(false);
        }

        table_.register_header(std::move(*artifact), std::move(*source));
        return Result<bool, Error>::success(true);
    }

    Result<CompileRecord, Error> CommandProcessor::process_compile_command(
        const std::string_view line,
        const std::string& directory
    ) const {
        auto tokens_result = tokenize(line);
        if (tokens_result.is_err()) {
            return Result<CompileRecord, Error>::failure(tokens_result.error());
        }
        const auto& tokens = tokens_result.value();

        std::vector<std::string> output;
        output.reserve(tokens.size());
        std::optional<std::string> source;

        for (std::size_t i = 0; i < tokens.size(); ++i) {
            const auto& token = tokens[i];
            output.push_back(quote(token));

            if (i + 1 >= tokens.size()) {
                continue;
            }

            if (token == INCLUDE_FLAG) {
                auto header = resolve_include(tokens[++i]);
                if (header.is_err()) {
                    return Result<CompileRecord, Error>::failure(header.error());
                }
                output.push_back(quote(header.value()));
            } else if (token == COMPILE_FLAG) {
                source = tokens[++i];
                output.push_back(quote(*source));
            }
        }

        if (!source) {
            return Result<CompileRecord, Error>::failure(Error::missing_source(std::string(line)));
        }

        CompileRecord record;
        record.directory = directory;
        record.command = string_utils::join(output, " ");
        record.file = path_utils::normalize(*source);
        return Result<CompileRecord, Error>::success(std::move(record));
    }

    Result<std::string, Error> CommandProcessor::resolve_include(const std::string& path) const {
        if (file_exists_(path)) {
            return Result<std::string, Error>::success(path);
        }
        if (auto header = table_.resolve(path)) {
            return Result<std::string, Error>::success(std::move(*header));
        }
        return Result<std::string, Error>::failure(Error::unresolved_header(path));
    }

}  // namespace xcdb::command
