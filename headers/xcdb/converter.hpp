//
// Created by gregorian-rayne on 2/12/26.
//

#ifndef XCDB_CONVERTER_HPP
#define XCDB_CONVERTER_HPP

/**
 * @file converter.hpp
 * @brief One conversion run: build log in, compilation database out.
 *
 * Every run owns a fresh PchTable, so precompiled header mappings never
 * leak between runs. convert_file() writes to "<output>.tmp" and only
 * moves it into place once the whole log converted; a fatal error leaves
 * no partial database behind.
 */

#include "xcdb/result.hpp"
#include "xcdb/error.hpp"
#include "xcdb/types.hpp"
#include "xcdb/config.hpp"
#include "xcdb/log/line_source.hpp"
#include "xcdb/log/section_scanner.hpp"

#include <cstddef>
#include <filesystem>
#include <istream>
#include <memory>
#include <ostream>
#include <utility>

namespace xcdb {

    namespace fs = std::filesystem;

    struct ConversionStats {
        InputFormat format = InputFormat::Log;
        log::ScanStats scan;
        std::size_t records_written = 0;
        std::size_t pch_mappings = 0;
    };

    /**
     * Picks the input format from the file extension: .json, .jsonl and
     * .ndjson are JSON lines, everything else is a plain log.
     */
    [[nodiscard]] InputFormat detect_input_format(const fs::path& path);

    /**
     * Creates the line source for a concrete (non-Auto) format.
     */
    [[nodiscard]] std::unique_ptr<log::LineSource> make_line_source(std::istream& input, InputFormat format);

    class Converter {
    public:
        explicit Converter(Config config, log::ScanListener listener = {});

        /**
         * Overrides the existence check used for -include arguments.
         */
        void set_file_exists(FileExistsFn file_exists) { file_exists_ = std::move(file_exists); }

        /**
         * Converts an already opened log into a database on `output`.
         */
        [[nodiscard]] Result<ConversionStats, Error> convert(log::LineSource& source, std::ostream& output) const;

        /**
         * Converts config.input.path into config.output.path.
         *
         * @return Statistics, NotFound when the input does not exist (no
         *         output is touched), or the fatal conversion error.
         */
        [[nodiscard]] Result<ConversionStats, Error> convert_file() const;

        [[nodiscard]] const Config& config() const noexcept { return config_; }

    private:
        Config config_;
        log::ScanListener listener_;
        FileExistsFn file_exists_;
    };

}  // namespace xcdb

#endif //XCDB_CONVERTER_HPP
