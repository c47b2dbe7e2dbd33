//
// Created by gregorian-rayne on 2/13/26.
//

#include "xcdb/cli/commands/command.hpp"

#include <iostream>
#include <iomanip>

namespace xcdb::cli
{
    // ============================================================================
    // ParsedArgs Implementation
    // ============================================================================

    void ParsedArgs::set(const std::string& name, const std::string& value) {
        args_[name].push_back(value);
    }

    void ParsedArgs::set_flag(const std::string& name) {
        flags_[name] = true;
    }

    void ParsedArgs::add_positional(const std::string& value) {
        positional_.push_back(value);
    }

    bool ParsedArgs::has(const std::string& name) const {
        return args_.contains(name) || flags_.contains(name);
    }

    std::optional<std::string> ParsedArgs::get(const std::string& name) const {
        const auto it = args_.find(name);
        if (it == args_.end() || it->second.empty()) {
            return std::nullopt;
        }
        return it->second.back();
    }

    std::vector<std::string> ParsedArgs::get_all(const std::string& name) const {
        const auto it = args_.find(name);
        return it == args_.end() ? std::vector<std::string>{} : it->second;
    }

    bool ParsedArgs::get_flag(const std::string& name) const {
        return flags_.contains(name);
    }

    // ============================================================================
    // Command Implementation
    // ============================================================================

    void Command::print_help() const {
        std::cout << description() << "\n\n" << usage() << "\n";

        const auto defs = arguments();
        if (!defs.empty()) {
            std::cout << "\nOptions:\n";
        }
        for (const auto& def : defs) {
            std::string left = def.short_name ? std::string("-") + def.short_name + ", " : "    ";
            left += "--" + def.name;
            if (def.takes_value) {
                left += " " + def.value_name;
            }
            std::cout << "  " << std::left << std::setw(26) << left << def.description << "\n";
        }

        std::cout << "\nCommon options:\n"
                  << "  -h, --help                Show this help message\n"
                  << "  -v, --verbose             Report exclusions and section counts\n"
                  << "  -q, --quiet               Only show errors\n"
                  << "      --debug               Print every section and lookup\n"
                  << "      --json                Print the summary as JSON\n"
                  << "      --version             Print the version and exit\n";
    }

    void Command::apply_common_flags(const ParsedArgs& args) {
        if (args.get_flag("debug")) {
            set_verbosity(Verbosity::Debug);
        } else if (args.get_flag("verbose")) {
            set_verbosity(Verbosity::Verbose);
        } else if (args.get_flag("quiet")) {
            set_verbosity(Verbosity::Quiet);
        }
        if (args.get_flag("json")) {
            set_output_format(OutputFormat::JSON);
        }
    }

    void Command::print(const std::string_view msg) const {
        if (verbosity_ != Verbosity::Quiet) {
            std::cout << msg << "\n";
        }
    }

    void Command::print_error(const std::string_view msg)
    {
        std::cerr << "error: " << msg << "\n";
    }

    void Command::print_warning(const std::string_view msg) const {
        if (verbosity_ != Verbosity::Quiet) {
            std::cerr << "warning: " << msg << "\n";
        }
    }

    void Command::print_verbose(const std::string_view msg) const {
        if (verbosity_ >= Verbosity::Verbose) {
            std::cout << msg << "\n";
        }
    }

    void Command::print_debug(const std::string_view msg) const {
        if (verbosity_ >= Verbosity::Debug) {
            std::cout << "[DEBUG] " << msg << "\n";
        }
    }

    // ============================================================================
    // CommandRegistry Implementation
    // ============================================================================

    CommandRegistry& CommandRegistry::instance() {
        static CommandRegistry instance;
        return instance;
    }

    void CommandRegistry::register_command(std::unique_ptr<Command> cmd) {
        commands_.push_back(std::move(cmd));
    }

    Command* CommandRegistry::find(const std::string_view name) const {
        for (const auto& cmd : commands_) {
            if (cmd->name() == name) {
                return cmd.get();
            }
        }
        return nullptr;
    }

    std::vector<Command*> CommandRegistry::list() const {
        std::vector<Command*> result;
        result.reserve(commands_.size());
        for (const auto& cmd : commands_) {
            result.push_back(cmd.get());
        }
        return result;
    }

    // ============================================================================
    // Argument Parser
    // ============================================================================

    namespace {

    /**
     * Walks the argument vector once. Every parse_* member returns false
     * after recording an error in the result.
     */
    class ArgumentWalker {
    public:
        ArgumentWalker(const std::vector<std::string>& args, const std::vector<ArgDef>& defs)
            : args_(args) {
            for (const auto& def : defs) {
                by_name_.emplace(def.name, &def);
                if (def.short_name) {
                    by_letter_.emplace(def.short_name, &def);
                }
            }
        }

        ParseResult run() {
            bool options_ended = false;
            for (; pos_ < args_.size(); ++pos_) {
                const std::string& arg = args_[pos_];
                if (arg.empty()) {
                    continue;
                }
                if (options_ended || arg == "-" || arg[0] != '-') {
                    result_.args.add_positional(arg);
                } else if (arg == "--") {
                    options_ended = true;
                } else if (arg[1] == '-') {
                    if (!parse_long(arg.substr(2))) {
                        break;
                    }
                } else if (!parse_short_cluster(arg)) {
                    break;
                }
            }
            return std::move(result_);
        }

    private:
        static std::optional<std::string> common_flag(const char letter) {
            switch (letter) {
                case 'h': return "help";
                case 'v': return "verbose";
                case 'q': return "quiet";
                default: return std::nullopt;
            }
        }

        static bool is_common_flag(const std::string& name) {
            return name == "help" || name == "verbose" || name == "quiet" ||
                   name == "debug" || name == "json" || name == "version";
        }

        bool fail(std::string message) {
            result_.success = false;
            result_.error = std::move(message);
            return false;
        }

        std::string take_next() {
            return pos_ + 1 < args_.size() ? args_[++pos_] : std::string{};
        }

        bool parse_long(std::string name) {
            std::optional<std::string> inline_value;
            if (const auto eq = name.find('='); eq != std::string::npos) {
                inline_value = name.substr(eq + 1);
                name.erase(eq);
            }

            const auto it = by_name_.find(name);
            if (it == by_name_.end()) {
                if (!is_common_flag(name)) {
                    return fail("Unknown option: --" + name);
                }
                result_.args.set_flag(name);
                return true;
            }
            if (!it->second->takes_value) {
                result_.args.set_flag(name);
                return true;
            }

            const std::string value = inline_value ? *inline_value : take_next();
            if (value.empty()) {
                return fail("Option --" + name + " requires a value");
            }
            result_.args.set(name, value);
            return true;
        }

        // "-vq", "-o out.json" and "-oout.json" are all accepted. A letter
        // that takes a value consumes the rest of the cluster.
        bool parse_short_cluster(const std::string& arg) {
            for (std::size_t j = 1; j < arg.size(); ++j) {
                const char letter = arg[j];
                if (const auto common = common_flag(letter)) {
                    result_.args.set_flag(*common);
                    continue;
                }

                const auto it = by_letter_.find(letter);
                if (it == by_letter_.end()) {
                    return fail(std::string("Unknown option: -") + letter);
                }
                const ArgDef& def = *it->second;
                if (!def.takes_value) {
                    result_.args.set_flag(def.name);
                    continue;
                }

                const std::string value = j + 1 < arg.size() ? arg.substr(j + 1) : take_next();
                if (value.empty()) {
                    return fail(std::string("Option -") + letter + " requires a value");
                }
                result_.args.set(def.name, value);
                return true;
            }
            return true;
        }

        const std::vector<std::string>& args_;
        std::unordered_map<std::string, const ArgDef*> by_name_;
        std::unordered_map<char, const ArgDef*> by_letter_;
        std::size_t pos_ = 0;
        ParseResult result_;
    };

    }  // namespace

    ParseResult parse_arguments(
        const std::vector<std::string>& args,
        const std::vector<ArgDef>& defs
    ) {
        return ArgumentWalker(args, defs).run();
    }
}  // namespace xcdb::cli
