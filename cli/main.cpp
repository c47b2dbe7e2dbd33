//
// Created by gregorian-rayne on 2/13/26.
//

#include "xcdb/cli/commands/command.hpp"
#include "xcdb/version.hpp"

#include <iostream>
#include <exception>
#include <string>
#include <vector>

namespace {
    constexpr auto DEFAULT_COMMAND = "convert";

    void print_version() {
        std::cout << xcdb::PROJECT_SHORT_NAME << " " << xcdb::VERSION_STRING << "\n";
    }

    void print_commands() {
        std::cout << xcdb::PROJECT_NAME << "\n\n";
        std::cout << "Usage: " << xcdb::PROJECT_SHORT_NAME << " [COMMAND] [OPTIONS]\n\n";
        std::cout << "Commands:\n";
        for (const auto* cmd : xcdb::cli::CommandRegistry::instance().list()) {
            std::cout << "  " << cmd->name() << "  " << cmd->description() << "\n";
        }
        std::cout << "\nWithout a command, '" << DEFAULT_COMMAND << "' is run.\n";
        std::cout << "Run '" << xcdb::PROJECT_SHORT_NAME << " COMMAND --help' for command options.\n";
    }
}

int main(const int argc, char** argv) {
    try {
        std::vector<std::string> args(argv + 1, argv + argc);

        if (!args.empty() && (args.front() == "--version" || args.front() == "version")) {
            print_version();
            return 0;
        }
        if (!args.empty() && args.front() == "help") {
            print_commands();
            return 0;
        }

        auto& registry = xcdb::cli::CommandRegistry::instance();
        xcdb::cli::Command* cmd = nullptr;
        if (!args.empty()) {
            cmd = registry.find(args.front());
        }
        if (cmd) {
            args.erase(args.begin());
        } else {
            cmd = registry.find(DEFAULT_COMMAND);
        }
        if (!cmd) {
            std::cerr << "error: no command registered\n";
            return 1;
        }

        auto parsed = xcdb::cli::parse_arguments(args, cmd->arguments());
        if (!parsed.success) {
            std::cerr << "error: " << parsed.error << "\n";
            std::cerr << "Run '" << xcdb::PROJECT_SHORT_NAME << " " << cmd->name() << " --help' for usage.\n";
            return 1;
        }

        if (parsed.args.get_flag("version")) {
            print_version();
            return 0;
        }

        if (!parsed.args.get_flag("help")) {
            if (const auto error = cmd->validate(parsed.args); !error.empty()) {
                std::cerr << "error: " << error << "\n";
                return 1;
            }
        }

        return cmd->execute(parsed.args);

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
