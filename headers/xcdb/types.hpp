//
// Created by gregorian-rayne on 2/9/26.
//

#ifndef XCDB_TYPES_HPP
#define XCDB_TYPES_HPP

/**
 * @file types.hpp
 * @brief Core data structures shared by the scanner, the command
 *        processor and the exporters.
 */

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace xcdb {

    // ============================================================================
    // Log Sections
    // ============================================================================

    /**
     * Kind of build step introduced by a section marker line.
     */
    enum class SectionKind {
        Compile,     // CompileC
        Precompile   // ProcessPCH, ProcessPCH++
    };

    inline const char* to_string(SectionKind kind) noexcept {
        switch (kind) {
            case SectionKind::Compile:    return "CompileC";
            case SectionKind::Precompile: return "ProcessPCH";
        }
        return "Unknown";
    }

    /**
     * Classifies a log line as a section marker.
     *
     * The marker must be the first word of the line. CompileC is tested
     * before ProcessPCH.
     *
     * @param line A raw log line.
     * @return The section kind, or nullopt if the line is not a marker.
     */
    [[nodiscard]] std::optional<SectionKind> detect_section_marker(std::string_view line);

    // ============================================================================
    // Input Formats
    // ============================================================================

    enum class InputFormat {
        Auto,       // chosen from the input file extension
        Log,        // plain build log text
        JsonLines   // one JSON object per line with a "command" field
    };

    inline const char* to_string(InputFormat format) noexcept {
        switch (format) {
            case InputFormat::Auto:      return "auto";
            case InputFormat::Log:       return "log";
            case InputFormat::JsonLines: return "json-lines";
        }
        return "auto";
    }

    /**
     * Parses "auto", "log" or "json-lines" (also "jsonl").
     */
    [[nodiscard]] std::optional<InputFormat> string_to_input_format(std::string_view name);

    // ============================================================================
    // Compilation Database
    // ============================================================================

    /**
     * One entry of a compilation database.
     *
     * `file` always names the literal source passed to -c, lexically
     * normalized, never a precompiled header artifact.
     */
    struct CompileRecord {
        std::string directory;
        std::string command;
        std::string file;

        bool operator==(const CompileRecord& other) const = default;
    };

    /**
     * Filesystem existence check used when resolving -include arguments.
     */
    using FileExistsFn = std::function<bool(const std::string&)>;

    /**
     * Predicate deciding whether a directory or a source file is excluded.
     */
    using ExcludePredicate = std::function<bool(const std::string&)>;

}  // namespace xcdb

#endif //XCDB_TYPES_HPP
