//
// Created by gregorian-rayne on 2/9/26.
//

#include "xcdb/types.hpp"
#include "xcdb/utils/string_utils.hpp"

namespace xcdb {

    namespace {

    constexpr std::string_view COMPILE_MARKER = "CompileC";
    constexpr std::string_view PRECOMPILE_MARKER = "ProcessPCH";
    constexpr std::string_view PRECOMPILE_CXX_MARKER = "ProcessPCH++";

    std::string_view first_word(std::string_view line) {
        const auto end = line.find_first_of(" \t");
        return end == std::string_view::npos ? line : line.substr(0, end);
    }

    }  // namespace

    std::optional<SectionKind> detect_section_marker(const std::string_view line) {
        const auto word = first_word(line);

        if (word == COMPILE_MARKER) {
            return SectionKind::Compile;
        }
        if (word == PRECOMPILE_MARKER || word == PRECOMPILE_CXX_MARKER) {
            return SectionKind::Precompile;
        }
        return std::nullopt;
    }

    std::optional<InputFormat> string_to_input_format(const std::string_view name) {
        const auto lower = string_utils::to_lower(string_utils::trim(name));

        if (lower == "auto") return InputFormat::Auto;
        if (lower == "log" || lower == "text") return InputFormat::Log;
        if (lower == "json-lines" || lower == "jsonl" || lower == "json") return InputFormat::JsonLines;
        return std::nullopt;
    }

}  // namespace xcdb
