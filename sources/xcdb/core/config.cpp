//
// Created by gregorian-rayne on 2/12/26.
//

#include "xcdb/config.hpp"
#include "xcdb/log/exclusion_filter.hpp"
#include "xcdb/utils/file_utils.hpp"

#include <toml++/toml.h>

#include <sstream>

namespace xcdb {

    namespace {

    std::vector<std::string> read_string_array(const toml::node_view<toml::node> node) {
        std::vector<std::string> values;
        if (const auto* array = node.as_array()) {
            for (const auto& element : *array) {
                if (auto value = element.value<std::string>()) {
                    values.push_back(std::move(*value));
                }
            }
        }
        return values;
    }

    std::string toml_string(const std::string& value) {
        std::ostringstream ss;
        ss << toml::value<std::string>(value);
        return ss.str();
    }

    std::string toml_array(const std::vector<std::string>& values) {
        std::string result = "[";
        for (std::size_t i = 0; i < values.size(); ++i) {
            if (i > 0) result += ", ";
            result += toml_string(values[i]);
        }
        result += "]";
        return result;
    }

    }  // namespace

    Result<Config, Error> Config::load_from_file(const std::string& path) {
        auto content = file_utils::read_file(path);
        if (content.is_err()) {
            return Result<Config, Error>::failure(
                Error::config_error("Configuration file not readable", path)
            );
        }

        auto config = load_from_string(content.value());
        if (config.is_err()) {
            return Result<Config, Error>::failure(config.error().with_context(path));
        }
        return config;
    }

    Result<Config, Error> Config::load_from_string(const std::string& content) {
        try {
            auto tbl = toml::parse(content);
            Config config;

            if (tbl["input"]) {
                auto input = tbl["input"];
                if (auto path = input["path"].value<std::string>()) {
                    config.input.path = *path;
                }
                if (auto format_name = input["format"].value<std::string>()) {
                    const auto format = string_to_input_format(*format_name);
                    if (!format) {
                        return Result<Config, Error>::failure(
                            Error::config_error("Unknown input format", *format_name)
                        );
                    }
                    config.input.format = *format;
                }
            }

            if (tbl["output"]) {
                if (auto path = tbl["output"]["path"].value<std::string>()) {
                    config.output.path = *path;
                }
            }

            if (tbl["exclude"]) {
                config.exclude.files = read_string_array(tbl["exclude"]["files"]);
                config.exclude.directories = read_string_array(tbl["exclude"]["directories"]);
            }

            if (auto validation = config.validate(); validation.is_err()) {
                return Result<Config, Error>::failure(validation.error());
            }

            return Result<Config, Error>::success(std::move(config));

        } catch (const toml::parse_error& err) {
            return Result<Config, Error>::failure(
                Error::config_error("Failed to parse TOML configuration: " + std::string(err.description()))
            );
        }
    }

    Config Config::default_config() {
        return Config{};
    }

    Result<void, Error> Config::validate() const {
        if (input.path.empty()) {
            return Result<void, Error>::failure(Error::config_error("Input path must not be empty"));
        }
        if (output.path.empty()) {
            return Result<void, Error>::failure(Error::config_error("Output path must not be empty"));
        }

        if (auto filter = log::ExclusionFilter::create(exclude.directories, exclude.files); filter.is_err()) {
            return Result<void, Error>::failure(filter.error());
        }

        return Result<void, Error>::success();
    }

    std::string Config::to_string() const {
        std::ostringstream ss;

        ss << "[input]\n";
        ss << "path = " << toml_string(input.path) << "\n";
        ss << "format = \"" << xcdb::to_string(input.format) << "\"\n\n";

        ss << "[output]\n";
        ss << "path = " << toml_string(output.path) << "\n\n";

        ss << "[exclude]\n";
        ss << "files = " << toml_array(exclude.files) << "\n";
        ss << "directories = " << toml_array(exclude.directories) << "\n";

        return ss.str();
    }

}  // namespace xcdb
