//
// Created by gregorian-rayne on 2/11/26.
//

#ifndef XCDB_LINE_SOURCE_HPP
#define XCDB_LINE_SOURCE_HPP

/**
 * @file line_source.hpp
 * @brief Forward-only line streams feeding the section scanner.
 *
 * Sources are pulled one line at a time and cannot be rewound. The end of
 * the stream is reported by next_line() returning nullopt. A source that
 * stops because its input is malformed keeps the reason in error(); the
 * scanner checks it once the stream runs dry.
 */

#include "xcdb/error.hpp"

#include <cstddef>
#include <deque>
#include <istream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace xcdb::log {

    class LineSource {
    public:
        virtual ~LineSource() = default;

        /**
         * Returns the next line without its line terminator, or nullopt
         * when the stream is exhausted.
         */
        [[nodiscard]] virtual std::optional<std::string> next_line() = 0;

        /**
         * The error that ended the stream early, if any.
         */
        [[nodiscard]] const std::optional<Error>& error() const noexcept { return error_; }

        [[nodiscard]] bool failed() const noexcept { return error_.has_value(); }

    protected:
        void fail(Error error) { error_ = std::move(error); }

    private:
        std::optional<Error> error_;
    };

    /**
     * Plain build log text read from a stream. A trailing '\r' is removed
     * from every line.
     */
    class StreamLineSource final : public LineSource {
    public:
        explicit StreamLineSource(std::istream& input);

        [[nodiscard]] std::optional<std::string> next_line() override;

    private:
        std::istream& input_;
    };

    /**
     * JSON-lines input, one object per line.
     *
     * The "command" string of every object is split on its embedded line
     * breaks and the pieces are served as log lines, in order, across all
     * input lines. Blank lines and objects without a string "command" are
     * skipped. A line that is not valid JSON ends the stream with a
     * ParseError.
     */
    class JsonLinesSource final : public LineSource {
    public:
        explicit JsonLinesSource(std::istream& input);

        [[nodiscard]] std::optional<std::string> next_line() override;

        /**
         * Number of physical input lines consumed so far.
         */
        [[nodiscard]] std::size_t records_read() const noexcept { return line_number_; }

    private:
        bool fill_pending();

        std::istream& input_;
        std::deque<std::string> pending_;
        std::size_t line_number_ = 0;
    };

    /**
     * In-memory lines, mostly for tests and for splitting a captured log.
     */
    class VectorLineSource final : public LineSource {
    public:
        explicit VectorLineSource(std::vector<std::string> lines);

        [[nodiscard]] std::optional<std::string> next_line() override;

    private:
        std::vector<std::string> lines_;
        std::size_t position_ = 0;
    };

}  // namespace xcdb::log

#endif //XCDB_LINE_SOURCE_HPP
