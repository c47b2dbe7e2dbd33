//
// Created by gregorian-rayne on 2/11/26.
//

#ifndef XCDB_EXCLUSION_FILTER_HPP
#define XCDB_EXCLUSION_FILTER_HPP

/**
 * @file exclusion_filter.hpp
 * @brief Regex based exclusion of directories and source files.
 *
 * Patterns use ECMAScript syntax and match anywhere in the string, so
 * "Pods/" excludes every file below any Pods directory.
 */

#include "xcdb/result.hpp"
#include "xcdb/error.hpp"
#include "xcdb/types.hpp"

#include <memory>
#include <regex>
#include <string>
#include <vector>

namespace xcdb::log {

    class ExclusionFilter {
    public:
        ExclusionFilter() = default;

        /**
         * Compiles the directory and file patterns.
         *
         * @return The filter, or a ConfigError naming the invalid pattern.
         */
        [[nodiscard]] static Result<ExclusionFilter, Error> create(
            const std::vector<std::string>& directory_patterns,
            const std::vector<std::string>& file_patterns
        );

        [[nodiscard]] bool is_directory_excluded(const std::string& directory) const;
        [[nodiscard]] bool is_file_excluded(const std::string& file) const;

        /**
         * Predicates sharing the compiled patterns. They stay valid after
         * the filter is moved or destroyed.
         */
        [[nodiscard]] ExcludePredicate directory_predicate() const;
        [[nodiscard]] ExcludePredicate file_predicate() const;

        [[nodiscard]] bool empty() const noexcept {
            return directory_patterns_->empty() && file_patterns_->empty();
        }

    private:
        using PatternList = std::shared_ptr<const std::vector<std::regex>>;

        PatternList directory_patterns_ = std::make_shared<const std::vector<std::regex>>();
        PatternList file_patterns_ = std::make_shared<const std::vector<std::regex>>();
    };

}  // namespace xcdb::log

#endif //XCDB_EXCLUSION_FILTER_HPP
