//
// Created by gregorian-rayne on 2/13/26.
//

#include "xcdb/cli/commands/command.hpp"
#include "xcdb/config.hpp"
#include "xcdb/converter.hpp"
#include "xcdb/utils/file_utils.hpp"

#include <nlohmann/json.hpp>

#include <iostream>

namespace xcdb::cli
{
    class ConvertCommand final : public Command {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "convert";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Generate compile_commands.json from an Xcode build log";
        }

        [[nodiscard]] std::string usage() const override {
            return "Usage: xcdb [convert] [OPTIONS] [BUILD_LOG]\n"
                   "\n"
                   "Examples:\n"
                   "  xcodebuild | tee xcodebuild.log && xcdb\n"
                   "  xcdb build.log -o out/compile_commands.json\n"
                   "  xcdb build.log -e 'Pods/' -d '/DerivedSources'\n"
                   "  xcdb log.jsonl --format json-lines";
        }

        [[nodiscard]] std::vector<ArgDef> arguments() const override {
            return {
                {"output", 'o', "Compilation database to write", true, "FILE"},
                {"exclude", 'e', "Skip sources whose path matches REGEX (repeatable)", true, "REGEX"},
                {"exclude-dir", 'd', "Skip sections whose directory matches REGEX (repeatable)", true, "REGEX"},
                {"format", 'f', "Input format: auto, log or json-lines", true, "FORMAT"},
                {"config", 'c', "TOML configuration file", true, "FILE"},
            };
        }

        [[nodiscard]] std::string validate(const ParsedArgs& args) const override {
            if (args.positional().size() > 1) {
                return "Expected at most one build log, got " + std::to_string(args.positional().size());
            }
            if (const auto format = args.get("format"); format && !string_to_input_format(*format)) {
                return "Unknown input format: " + *format;
            }
            return "";
        }

        [[nodiscard]] int execute(const ParsedArgs& args) override {
            if (args.get_flag("help")) {
                print_help();
                return 0;
            }

            apply_common_flags(args);

            auto config_result = load_config(args);
            if (config_result.is_err()) {
                print_error(config_result.error().to_string());
                return 1;
            }
            Config config = std::move(config_result.value());
            apply_overrides(args, config);

            if (auto valid = config.validate(); valid.is_err()) {
                print_error(valid.error().to_string());
                return 1;
            }

            print_verbose("Reading " + config.input.path);
            print_debug("Effective configuration:\n" + config.to_string());

            const Converter converter(std::move(config), make_listener());
            auto result = converter.convert_file();
            if (result.is_err()) {
                if (result.error().code() == ErrorCode::NotFound) {
                    print_error("build log not found: " + converter.config().input.path);
                } else {
                    print_error(result.error().to_string());
                }
                return 1;
            }

            print_summary(converter.config(), result.value());
            return 0;
        }

    private:
        [[nodiscard]] static Result<Config, Error> load_config(const ParsedArgs& args) {
            if (const auto path = args.get("config")) {
                return Config::load_from_file(*path);
            }
            if (file_utils::is_regular_file(DEFAULT_CONFIG_FILE)) {
                return Config::load_from_file(DEFAULT_CONFIG_FILE);
            }
            return Result<Config, Error>::success(Config::default_config());
        }

        static void apply_overrides(const ParsedArgs& args, Config& config) {
            if (!args.positional().empty()) {
                config.input.path = args.positional().front();
            }
            if (const auto output = args.get("output")) {
                config.output.path = *output;
            }
            if (const auto format = args.get("format")) {
                config.input.format = string_to_input_format(*format).value_or(InputFormat::Auto);
            }
            for (auto& pattern : args.get_all("exclude")) {
                config.exclude.files.push_back(std::move(pattern));
            }
            for (auto& pattern : args.get_all("exclude-dir")) {
                config.exclude.directories.push_back(std::move(pattern));
            }
        }

        [[nodiscard]] log::ScanListener make_listener() const {
            log::ScanListener listener;
            if (is_debug()) {
                listener.on_section = [this](const SectionKind kind, const std::string& directory) {
                    print_debug(std::string(to_string(kind)) + " section in " +
                                (directory.empty() ? "<unknown>" : directory));
                };
                listener.on_section_abandoned = [this](const SectionKind kind) {
                    print_debug(std::string(to_string(kind)) + " section ended without a compiler invocation");
                };
                listener.on_precompiled_header = [this](const std::string& directory, const bool registered) {
                    print_debug(registered ? "Registered precompiled header in " + directory
                                           : "Precompile section in " + directory + " produced no mapping");
                };
            }
            if (is_verbose()) {
                listener.on_directory_excluded = [this](const std::string& directory) {
                    print_verbose("Excluded directory: " + directory);
                };
                listener.on_file_excluded = [this](const CompileRecord& record) {
                    print_verbose("Excluded file: " + record.file);
                };
            }
            return listener;
        }

        void print_summary(const Config& config, const ConversionStats& stats) const {
            if (is_json()) {
                nlohmann::json summary = {
                    {"input", config.input.path},
                    {"output", config.output.path},
                    {"format", to_string(stats.format)},
                    {"records", stats.records_written},
                    {"compile_sections", stats.scan.compile_sections},
                    {"precompile_sections", stats.scan.precompile_sections},
                    {"directories_excluded", stats.scan.directories_excluded},
                    {"files_excluded", stats.scan.files_excluded},
                    {"sections_abandoned", stats.scan.sections_abandoned},
                    {"pch_mappings", stats.pch_mappings},
                };
                std::cout << summary.dump(2) << "\n";
                return;
            }

            print("Wrote " + std::to_string(stats.records_written) + " entries to " + config.output.path);
            print_verbose("  Compile sections:     " + std::to_string(stats.scan.compile_sections));
            print_verbose("  Precompile sections:  " + std::to_string(stats.scan.precompile_sections));
            print_verbose("  PCH mappings:         " + std::to_string(stats.pch_mappings));
            print_verbose("  Excluded directories: " + std::to_string(stats.scan.directories_excluded));
            print_verbose("  Excluded files:       " + std::to_string(stats.scan.files_excluded));
            if (stats.scan.sections_abandoned > 0) {
                print_warning(std::to_string(stats.scan.sections_abandoned) +
                              " section(s) had no recognizable compiler invocation");
            }
        }
    };

    namespace {
        struct ConvertCommandRegistrar {
            ConvertCommandRegistrar() {
                CommandRegistry::instance().register_command(
                    std::make_unique<ConvertCommand>()
                );
            }
        } convert_registrar;
    }

} // namespace xcdb::cli
