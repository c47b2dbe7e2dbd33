//
// Created by gregorian-rayne on 2/11/26.
//

#ifndef XCDB_SECTION_SCANNER_HPP
#define XCDB_SECTION_SCANNER_HPP

/**
 * @file section_scanner.hpp
 * @brief Finds compile and precompiled header sections in a build log.
 *
 * An Xcode build log groups the output of every build step under a marker
 * line. For the steps we care about the layout is:
 *
 * @code
 *     CompileC /build/a.o /project/a.m normal x86_64 objective-c ...
 *         cd /project
 *         export LANG=en_US.US-ASCII
 *         /usr/bin/clang -x objective-c ... -c /project/a.m -o /build/a.o
 * @endcode
 *
 * The line right after the marker is the working directory. The first
 * later line that looks like a supported compiler invocation is the
 * command; anything in between is noise. ProcessPCH sections feed the
 * PchTable, CompileC sections produce records.
 *
 * Usage:
 * @code
 *     pch::PchTable table;
 *     log::StreamLineSource source(input);
 *     log::SectionScanner scanner(source, table, {});
 *     while (true) {
 *         auto next = scanner.next();
 *         if (next.is_err()) { ... fatal ... }
 *         if (!next.value()) break;          // end of log
 *         write(*next.value());
 *     }
 * @endcode
 */

#include "xcdb/result.hpp"
#include "xcdb/error.hpp"
#include "xcdb/types.hpp"
#include "xcdb/command/command_processor.hpp"
#include "xcdb/log/line_source.hpp"
#include "xcdb/pch/pch_table.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace xcdb::log {

    /**
     * Exclusion predicates. An empty predicate excludes nothing.
     */
    struct ScanFilters {
        ExcludePredicate directory_excluded;
        ExcludePredicate file_excluded;
    };

    /**
     * Optional notifications about scanning progress.
     */
    struct ScanListener {
        std::function<void(SectionKind, const std::string& directory)> on_section;
        std::function<void(const std::string& directory)> on_directory_excluded;
        std::function<void(const CompileRecord&)> on_file_excluded;
        std::function<void(const std::string& directory, bool registered)> on_precompiled_header;
        std::function<void(SectionKind)> on_section_abandoned;
    };

    struct ScanOptions {
        ScanFilters filters;
        FileExistsFn file_exists;   // std::filesystem when empty
        ScanListener listener;
    };

    struct ScanStats {
        std::size_t compile_sections = 0;
        std::size_t precompile_sections = 0;
        std::size_t directories_excluded = 0;
        std::size_t files_excluded = 0;
        std::size_t records_emitted = 0;
        std::size_t pch_registered = 0;
        std::size_t sections_abandoned = 0;
    };

    /**
     * Extracts the directory from a "cd <dir>" statement.
     *
     * @return The directory, or an empty string when the line is not a cd
     *         statement or cannot be tokenized.
     */
    [[nodiscard]] std::string parse_directory_statement(std::string_view line);

    class SectionScanner {
    public:
        SectionScanner(LineSource& source, pch::PchTable& table, ScanOptions options);

        /**
         * Advances to the next emitted record.
         *
         * @return The next record, nullopt once the log is exhausted, or
         *         the fatal error that stopped the scan. After nullopt or
         *         an error every further call returns nullopt.
         */
        [[nodiscard]] Result<std::optional<CompileRecord>, Error> next();

        /**
         * Drains the scanner, passing every record to `sink`.
         *
         * @return Number of records delivered, or the fatal error.
         */
        [[nodiscard]] Result<std::size_t, Error> scan_all(
            const std::function<void(CompileRecord)>& sink
        );

        [[nodiscard]] const ScanStats& stats() const noexcept { return stats_; }

    private:
        [[nodiscard]] std::optional<std::string> find_compiler_invocation();
        [[nodiscard]] Result<std::optional<CompileRecord>, Error> end_of_stream();

        [[nodiscard]] bool directory_excluded(const std::string& directory) const;
        [[nodiscard]] bool file_excluded(const std::string& file) const;

        LineSource& source_;
        command::CommandProcessor processor_;
        ScanFilters filters_;
        ScanListener listener_;
        ScanStats stats_;
        bool finished_ = false;
    };

}  // namespace xcdb::log

#endif //XCDB_SECTION_SCANNER_HPP
