//
// Created by gregorian-rayne on 2/11/26.
//

#include "xcdb/log/exclusion_filter.hpp"

#include <algorithm>

namespace xcdb::log {

    namespace {

    Result<std::vector<std::regex>, Error> compile_patterns(
        const std::vector<std::string>& patterns,
        const std::string_view kind
    ) {
        std::vector<std::regex> compiled;
        compiled.reserve(patterns.size());

        for (const auto& pattern : patterns) {
            try {
                compiled.emplace_back(pattern, std::regex::ECMAScript);
            } catch (const std::regex_error& e) {
                return Result<std::vector<std::regex>, Error>::failure(
                    Error::config_error(
                        "Invalid " + std::string(kind) + " exclusion pattern: " + e.what(),
                        pattern
                    )
                );
            }
        }

        return Result<std::vector<std::regex>, Error>::success(std::move(compiled));
    }

    bool matches_any(const std::vector<std::regex>& patterns, const std::string& value) {
        return std::ranges::any_of(patterns, [&value](const std::regex& pattern) {
            return std::regex_search(value, pattern);
        });
    }

    }  // namespace

    Result<ExclusionFilter, Error> ExclusionFilter::create(
        const std::vector<std::string>& directory_patterns,
        const std::vector<std::string>& file_patterns
    ) {
        auto directories = compile_patterns(directory_patterns, "directory");
        if (directories.is_err()) {
            return Result<ExclusionFilter, Error>::failure(directories.error());
        }

        auto files = compile_patterns(file_patterns, "file");
        if (files.is_err()) {
            return Result<ExclusionFilter, Error>::failure(files.error());
        }

        ExclusionFilter filter;
        filter.directory_patterns_ = std::make_shared<const std::vector<std::regex>>(std::move(directories).value());
        filter.file_patterns_ = std::make_shared<const std::vector<std::regex>>(std::move(files).value());
        return Result<ExclusionFilter, Error>::success(std::move(filter));
    }

    bool ExclusionFilter::is_directory_excluded(const std::string& directory) const {
        return matches_any(*directory_patterns_, directory);
    }

    bool ExclusionFilter::is_file_excluded(const std::string& file) const {
        return matches_any(*file_patterns_, file);
    }

    ExcludePredicate ExclusionFilter::directory_predicate() const {
        return [patterns = directory_patterns_](const std::string& directory) {
            return matches_any(*patterns, directory);
        };
    }

    ExcludePredicate ExclusionFilter::file_predicate() const {
        return [patterns = file_patterns_](const std::string& file) {
            return matches_any(*patterns, file);
        };
    }

}  // namespace xcdb::log
