//
// Created by gregorian-rayne on 2/12/26.
//

#ifndef XCDB_CONFIG_HPP
#define XCDB_CONFIG_HPP

/**
 * @file config.hpp
 * @brief TOML configuration for a conversion run.
 *
 * Example `.xcdb.toml`:
 * @code
 *     [input]
 *     path = "xcodebuild.log"
 *     format = "auto"            # auto | log | json-lines
 *
 *     [output]
 *     path = "compile_commands.json"
 *
 *     [exclude]
 *     files = ["Pods/", "\\.generated\\."]
 *     directories = ["/DerivedSources"]
 * @endcode
 *
 * Values given on the command line override the file.
 */

#include "xcdb/result.hpp"
#include "xcdb/error.hpp"
#include "xcdb/types.hpp"

#include <string>
#include <vector>

namespace xcdb {

    inline constexpr auto DEFAULT_INPUT_PATH = "xcodebuild.log";
    inline constexpr auto DEFAULT_OUTPUT_PATH = "compile_commands.json";
    inline constexpr auto DEFAULT_CONFIG_FILE = ".xcdb.toml";

    struct InputConfig {
        std::string path = DEFAULT_INPUT_PATH;
        InputFormat format = InputFormat::Auto;
    };

    struct OutputConfig {
        std::string path = DEFAULT_OUTPUT_PATH;
    };

    struct ExcludeConfig {
        std::vector<std::string> files;
        std::vector<std::string> directories;
    };

    class Config {
    public:
        Config() = default;

        [[nodiscard]] static Result<Config, Error> load_from_file(const std::string& path);
        [[nodiscard]] static Result<Config, Error> load_from_string(const std::string& content);
        [[nodiscard]] static Config default_config();

        /**
         * Checks paths are non-empty and every exclusion pattern compiles.
         */
        [[nodiscard]] Result<void, Error> validate() const;

        /**
         * Serializes back to TOML.
         */
        [[nodiscard]] std::string to_string() const;

        InputConfig input;
        OutputConfig output;
        ExcludeConfig exclude;
    };

}  // namespace xcdb

#endif //XCDB_CONFIG_HPP
