//
// Created by gregorian-rayne on 2/12/26.
//

#include "xcdb/converter.hpp"
#include "xcdb/exporters/compdb_writer.hpp"
#include "xcdb/log/exclusion_filter.hpp"
#include "xcdb/pch/pch_table.hpp"
#include "xcdb/utils/file_utils.hpp"
#include "xcdb/utils/path_utils.hpp"

#include <fstream>

namespace xcdb {

    namespace {

    constexpr auto TEMP_SUFFIX = ".tmp";

    }  // namespace

    InputFormat detect_input_format(const fs::path& path) {
        if (const auto ext = path_utils::lower_extension(path);
            ext == ".json" || ext == ".jsonl" || ext == ".ndjson") {
            return InputFormat::JsonLines;
        }
        return InputFormat::Log;
    }

    std::unique_ptr<log::LineSource> make_line_source(std::istream& input, const InputFormat format) {
        if (format == InputFormat::JsonLines) {
            return std::make_unique<log::JsonLinesSource>(input);
        }
        return std::make_unique<log::StreamLineSource>(input);
    }

    Converter::Converter(Config config, log::ScanListener listener)
        : config_(std::move(config))
        , listener_(std::move(listener)) {}

    Result<ConversionStats, Error> Converter::convert(log::LineSource& source, std::ostream& output) const {
        auto filter_result = log::ExclusionFilter::create(config_.exclude.directories, config_.exclude.files);
        if (filter_result.is_err()) {
            return Result<ConversionStats, Error>::failure(filter_result.error());
        }
        const auto& filter = filter_result.value();

        pch::PchTable table;

        log::ScanOptions options;
        options.filters.directory_excluded = filter.directory_predicate();
        options.filters.file_excluded = filter.file_predicate();
        options.file_exists = file_exists_;
        options.listener = listener_;

        log::SectionScanner scanner(source, table, std::move(options));
        exporters::CompilationDatabaseWriter writer(output);

        if (auto begun = writer.begin(); begun.is_err()) {
            return Result<ConversionStats, Error>::failure(begun.error());
        }

        while (true) {
            auto next = scanner.next();
            if (next.is_err()) {
                return Result<ConversionStats, Error>::failure(next.error());
            }
            if (!next.value()) {
                break;
            }
            if (auto written = writer.write(*next.value()); written.is_err()) {
                return Result<ConversionStats, Error>::failure(written.error());
            }
        }

        if (auto finished = writer.finish(); finished.is_err()) {
            return Result<ConversionStats, Error>::failure(finished.error());
        }

        ConversionStats stats;
        stats.scan = scanner.stats();
        stats.records_written = writer.records_written();
        stats.pch_mappings = table.size();
        return Result<ConversionStats, Error>::success(stats);
    }

    Result<ConversionStats, Error> Converter::convert_file() const {
        const fs::path input_path(config_.input.path);
        const fs::path output_path(config_.output.path);

        if (!file_utils::is_regular_file(input_path)) {
            return Result<ConversionStats, Error>::failure(
                Error::not_found("Build log not found", input_path.string())
            );
        }

        std::ifstream input(input_path, std::ios::binary);
        if (!input) {
            return Result<ConversionStats, Error>::failure(
                Error::io_error("Failed to open build log", input_path.string())
            );
        }

        const InputFormat format = config_.input.format == InputFormat::Auto
            ? detect_input_format(input_path)
            : config_.input.format;
        const auto source = make_line_source(input, format);

        fs::path temp_path = output_path;
        temp_path += TEMP_SUFFIX;

        auto converted = [&]() -> Result<ConversionStats, Error> {
            std::ofstream output(temp_path, std::ios::binary | std::ios::trunc);
            if (!output) {
                return Result<ConversionStats, Error>::failure(
                    Error::io_error("Failed to open output file", temp_path.string())
                );
            }
            return convert(*source, output);
        }();

        if (converted.is_err()) {
            file_utils::remove_if_exists(temp_path);
            return converted;
        }

        if (auto moved = file_utils::replace_file(temp_path, output_path); moved.is_err()) {
            file_utils::remove_if_exists(temp_path);
            return Result<ConversionStats, Error>::failure(moved.error());
        }

        converted.value().format = format;
        return converted;
    }

}  // namespace xcdb
