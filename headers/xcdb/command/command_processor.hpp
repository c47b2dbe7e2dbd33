//
// Created by gregorian-rayne on 2/10/26.
//

#ifndef XCDB_COMMAND_PROCESSOR_HPP
#define XCDB_COMMAND_PROCESSOR_HPP

/**
 * @file command_processor.hpp
 * @brief Turns compiler invocations from the log into database records.
 *
 * Two entry points share one PchTable:
 * - register_source_for_pch() reads a precompiled header invocation and
 *   remembers which header produced which artifact;
 * - process_compile_command() re-quotes a compile invocation, swapping
 *   -include artifacts for their headers, and extracts the -c source.
 */

#include "xcdb/result.hpp"
#include "xcdb/error.hpp"
#include "xcdb/types.hpp"
#include "xcdb/pch/pch_table.hpp"

#include <array>
#include <string>
#include <string_view>

namespace xcdb::command {

    /**
     * Output suffixes that mark an -o argument as a precompiled header.
     */
    inline constexpr std::array<std::string_view, 3> PCH_OUTPUT_SUFFIXES = {
        ".pch.pth",
        ".pch.pch",
        ".h.pch",
    };

    [[nodiscard]] bool is_pch_output(std::string_view path) noexcept;

    /**
     * Default FileExistsFn backed by std::filesystem.
     */
    [[nodiscard]] FileExistsFn filesystem_exists();

    class CommandProcessor {
    public:
        explicit CommandProcessor(pch::PchTable& table);
        CommandProcessor(pch::PchTable& table, FileExistsFn file_exists);

        /**
         * Records artifact -> header for a precompiled header invocation.
         *
         * @param line The compiler invocation.
         * @param directory Working directory of the section.
         * @return True if both a -c source and a PCH -o output were found
         *         and a mapping was recorded, false otherwise. Tokenizer
         *         errors are returned as failures.
         */
        [[nodiscard]] Result<bool, Error> register_source_for_pch(
            std::string_view line,
            const std::string& directory
        ) const;

        /**
         * Builds a compilation database record from a compile invocation.
         *
         * @param line The compiler invocation.
         * @param directory Working directory of the section.
         * @return The record, UnresolvedHeader when an -include argument
         *         cannot be traced back to a header, or MissingSource when
         *         there is no -c argument.
         */
        [[nodiscard]] Result<CompileRecord, Error> process_compile_command(
            std::string_view line,
            const std::string& directory
        ) const;

    private:
        [[nodiscard]] Result<std::string, Error> resolve_include(const std::string& path) const;

        pch::PchTable& table_;
        FileExistsFn file_exists_;
    };

}  // namespace xcdb::command

#endif //XCDB_COMMAND_PROCESSOR_HPP
