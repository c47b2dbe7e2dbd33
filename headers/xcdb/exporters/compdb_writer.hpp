//
// Created by gregorian-rayne on 2/12/26.
//

#ifndef XCDB_COMPDB_WRITER_HPP
#define XCDB_COMPDB_WRITER_HPP

/**
 * @file compdb_writer.hpp
 * @brief Streams records into a compile_commands.json document.
 *
 * Records are written as they arrive so a large log never has to be held
 * in memory. Output layout:
 *
 * @code
 *     [
 *     {
 *       "directory": "/project",
 *       "command": "clang -c /project/a.cpp -o /project/a.o",
 *       "file": "/project/a.cpp"
 *     },
 *     {
 *       ...
 *     }
 *     ]
 * @endcode
 */

#include "xcdb/result.hpp"
#include "xcdb/error.hpp"
#include "xcdb/types.hpp"

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

namespace xcdb::exporters {

    /**
     * Indentation used inside every record.
     */
    inline constexpr int RECORD_INDENT = 2;

    /**
     * Renders one record as pretty-printed JSON with keys in the order
     * directory, command, file. Throws nlohmann::json::type_error when a
     * field is not valid UTF-8.
     */
    [[nodiscard]] std::string record_to_json(const CompileRecord& record);

    class CompilationDatabaseWriter {
    public:
        explicit CompilationDatabaseWriter(std::ostream& stream);

        /**
         * Opens the JSON array.
         */
        [[nodiscard]] Result<void, Error> begin();

        /**
         * Appends one record. begin() must have been called. A record that
         * cannot be encoded yields ParseError and nothing is written.
         */
        [[nodiscard]] Result<void, Error> write(const CompileRecord& record);

        /**
         * Closes the JSON array and flushes the stream.
         */
        [[nodiscard]] Result<void, Error> finish();

        [[nodiscard]] std::size_t records_written() const noexcept { return records_written_; }

    private:
        [[nodiscard]] Result<void, Error> check_stream(const char* stage) const;

        std::ostream& stream_;
        std::size_t records_written_ = 0;
        bool begun_ = false;
        bool finished_ = false;
    };

    /**
     * Writes a complete database for an in-memory list of records.
     */
    [[nodiscard]] Result<void, Error> write_compilation_database(
        std::ostream& stream,
        const std::vector<CompileRecord>& records
    );

}  // namespace xcdb::exporters

#endif //XCDB_COMPDB_WRITER_HPP
