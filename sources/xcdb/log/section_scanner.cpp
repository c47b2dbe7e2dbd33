//
// Created by gregorian-rayne on 2/11/26.
//

#include "xcdb/log/section_scanner.hpp"
#include "xcdb/command/compiler_matcher.hpp"
#include "xcdb/command/tokenizer.hpp"

namespace xcdb::log {

    namespace {

    constexpr std::string_view CHANGE_DIRECTORY = "cd";

    using NextResult = Result<std::optional<CompileRecord>, Error>;

    }  // namespace

    std::string parse_directory_statement(const std::string_view line) {
        auto tokens = command::tokenize(line);
        if (tokens.is_err()) {
            return "";
        }

        const auto& words = tokens.value();
        if (words.size() < 2 || words[0] != CHANGE_DIRECTORY) {
            return "";
        }
        return words[1];
    }

    SectionScanner::SectionScanner(LineSource& source, pch::PchTable& table, ScanOptions options)
        : source_(source)
        , processor_(table, options.file_exists ? std::move(options.file_exists) : command::filesystem_exists())
        , filters_(std::move(options.filters))
        , listener_(std::move(options.listener)) {}

    NextResult SectionScanner::next() {
        if (finished_) {
            return NextResult::success(std::nullopt);
        }

        while (auto line = source_.next_line()) {
            const auto kind = detect_section_marker(*line);
            if (!kind) {
                continue;
            }

            auto directory_line = source_.next_line();
            if (!directory_line) {
                ++stats_.sections_abandoned;
                if (listener_.on_section_abandoned) listener_.on_section_abandoned(*kind);
                break;
            }

            const std::string directory = parse_directory_statement(*directory_line);
            if (listener_.on_section) listener_.on_section(*kind, directory);

            if (*kind == SectionKind::Compile) {
                ++stats_.compile_sections;
            } else {
                ++stats_.precompile_sections;
            }

            if (directory_excluded(directory)) {
                ++stats_.directories_excluded;
                if (listener_.on_directory_excluded) listener_.on_directory_excluded(directory);
                continue;
            }

            const auto invocation = find_compiler_invocation();
            if (!invocation) {
                ++stats_.sections_abandoned;
                if (listener_.on_section_abandoned) listener_.on_section_abandoned(*kind);
                break;
            }

            if (*kind == SectionKind::Precompile) {
                auto registered = processor_.register_source_for_pch(*invocation, directory);
                if (registered.is_err()) {
                    finished_ = true;
                    return NextResult::failure(registered.error());
                }
                if (registered.value()) {
                    ++stats_.pch_registered;
                }
                if (listener_.on_precompiled_header) {
                    listener_.on_precompiled_header(directory, registered.value());
                }
                continue;
            }

            auto record = processor_.process_compile_command(*invocation, directory);
            if (record.is_err()) {
                finished_ = true;
                return NextResult::failure(record.error());
            }

            if (file_excluded(record.value().file)) {
                ++stats_.files_excluded;
                if (listener_.on_file_excluded) listener_.on_file_excluded(record.value());
                continue;
            }

            ++stats_.records_emitted;
            return NextResult::success(std::move(record).value());
        }

        return end_of_stream();
    }

    Result<std::size_t, Error> SectionScanner::scan_all(
        const std::function<void(CompileRecord)>& sink
    ) {
        std::size_t delivered = 0;

        while (true) {
            auto next_record = next();
            if (next_record.is_err()) {
                return Result<std::size_t, Error>::failure(next_record.error());
            }
            if (!next_record.value()) {
                break;
            }
            sink(std::move(*next_record.value()));
            ++delivered;
        }

        return Result<std::size_t, Error>::success(delivered);
    }

    std::optional<std::string> SectionScanner::find_compiler_invocation() {
        while (auto line = source_.next_line()) {
            if (command::is_compiler_invocation(*line)) {
                return line;
            }
        }
        return std::nullopt;
    }

    NextResult SectionScanner::end_of_stream() {
        finished_ = true;
        if (source_.failed()) {
            return NextResult::failure(*source_.error());
        }
        return NextResult::success(std::nullopt);
    }

    bool SectionScanner::directory_excluded(const std::string& directory) const {
        return filters_.directory_excluded && filters_.directory_excluded(directory);
    }

    bool SectionScanner::file_excluded(const std::string& file) const {
        return filters_.file_excluded && filters_.file_excluded(file);
    }

}  // namespace xcdb::log
