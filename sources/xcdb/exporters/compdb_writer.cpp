//
// Created by gregorian-rayne on 2/12/26.
//

#include "xcdb/exporters/compdb_writer.hpp"

#include <nlohmann/json.hpp>

namespace xcdb::exporters {

    std::string record_to_json(const CompileRecord& record) {
        nlohmann::ordered_json j;
        j["directory"] = record.directory;
        j["command"] = record.command;
        j["file"] = record.file;
        return j.dump(RECORD_INDENT);
    }

    CompilationDatabaseWriter::CompilationDatabaseWriter(std::ostream& stream)
        : stream_(stream) {}

    Result<void, Error> CompilationDatabaseWriter::begin() {
        if (begun_) {
            return Result<void, Error>::failure(
                Error::internal_error("Compilation database already started")
            );
        }
        begun_ = true;
        stream_ << "[";
        return check_stream("begin");
    }

    Result<void, Error> CompilationDatabaseWriter::write(const CompileRecord& record) {
        if (!begun_ || finished_) {
            return Result<void, Error>::failure(
                Error::internal_error("Record written outside of the database array")
            );
        }

        std::string rendered;
        try {
            rendered = record_to_json(record);
        } catch (const nlohmann::json::exception& e) {
            return Result<void, Error>::failure(
                Error::parse_error("Cannot encode record as JSON: " + std::string(e.what()), record.file)
            );
        }

        stream_ << (records_written_ == 0 ? "\n" : ",\n") << rendered;
        ++records_written_;
        return check_stream("write");
    }

    Result<void, Error> CompilationDatabaseWriter::finish() {
        if (!begun_ || finished_) {
            return Result<void, Error>::failure(
                Error::internal_error("Compilation database not open")
            );
        }
        finished_ = true;
        stream_ << "\n]\n";
        stream_.flush();
        return check_stream("finish");
    }

    Result<void, Error> CompilationDatabaseWriter::check_stream(const char* stage) const {
        if (!stream_) {
            return Result<void, Error>::failure(
                Error::io_error("Failed to write compilation database", stage)
            );
        }
        return Result<void, Error>::success();
    }

    Result<void, Error> write_compilation_database(
        std::ostream& stream,
        const std::vector<CompileRecord>& records
    ) {
        CompilationDatabaseWriter writer(stream);

        if (auto r = writer.begin(); r.is_err()) {
            return r;
        }
        for (const auto& record : records) {
            if (auto r = writer.write(record); r.is_err()) {
                return r;
            }
        }
        return writer.finish();
    }

}  // namespace xcdb::exporters
