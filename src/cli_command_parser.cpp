//
//  cli_command_parser.cpp
//
//  Command-line argument parsing implementation
//

#include "msdl/cli_command_parser.hpp"

#include <algorithm>

#include "msdl/cli_command_spec.hpp"

namespace msdl {

CommandParser::CommandParser(int argc, const char* argv[])
    : argc_(argc), argv_(argv) {
}

void CommandParser::SetCommandSpec(const CommandSpec& spec) {
    spec_ = &spec;
}

bool CommandParser::IsShortOption(const std::string& arg) {
    return arg.size() >= 2 && arg[0] == '-' && arg[1] != '-';
}

bool CommandParser::IsLongOption(const std::string& arg) {
    return arg.size() >= 3 && arg[0] == '-' && arg[1] == '-';
}

bool CommandParser::IsGlobalOption(const std::string& arg) {
    return arg == "-v" || arg == "--verbose";
}

std::string CommandParser::PeekCommand() const {
    for (int i = 1; i < argc_; i++) {
        std::string arg = argv_[i];
        if (IsGlobalOption(arg)) {
            continue;
        }
        if (IsShortOption(arg) || IsLongOption(arg)) {
            return "";
        }
        return arg;
    }
    return "";
}

ParsedCommand CommandParser::Parse() {
    ParsedCommand cmd;

    int i = 1;
    for (; i < argc_; i++) {
        std::string arg = argv_[i];
        if (IsGlobalOption(arg)) {
            cmd.verbose = true;
        } else if (arg == "-h" || arg == "--help") {
            cmd.help = true;
        } else if (IsShortOption(arg) || IsLongOption(arg)) {
            throw UsageError("Unknown option: " + arg);
        } else {
            cmd.command = arg;
            break;
        }
    }
    if (cmd.command.empty()) {
        return cmd;
    }

    ParseCommandOptions(cmd, i + 1);
    if (spec_ && !cmd.help) {
        ValidateParsedCommand(cmd);
    }
    return cmd;
}

void CommandParser::ParseCommandOptions(ParsedCommand& cmd, int first) {
    bool options_done = false;
    for (int i = first; i < argc_; i++) {
        std::string arg = argv_[i];

        if (options_done) {
            cmd.arguments.push_back(arg);
            continue;
        }
        if (arg == "--") {
            options_done = true;
            continue;
        }
        if (IsGlobalOption(arg)) {
            cmd.verbose = true;
            continue;
        }
        if (arg == "-h" || arg == "--help") {
            cmd.help = true;
            continue;
        }
        if (!IsShortOption(arg) && !IsLongOption(arg)) {
            cmd.arguments.push_back(arg);
            continue;
        }
        if (!spec_) {
            throw UsageError("Unknown option: " + arg);
        }

        const OptionSpec* option = nullptr;
        std::string inline_value;
        bool has_inline_value = false;
        if (IsShortOption(arg)) {
            char short_name = arg[1];
            auto it = std::find_if(spec_->options.begin(), spec_->options.end(),
                [short_name](const OptionSpec& opt) { return opt.short_name == short_name; });
            if (it != spec_->options.end() && arg.size() == 2) {
                option = &*it;
            }
        } else {
            std::string long_name = arg.substr(2);
            auto eq = long_name.find('=');
            if (eq != std::string::npos) {
                inline_value = long_name.substr(eq + 1);
                long_name = long_name.substr(0, eq);
                has_inline_value = true;
            }
            auto it = std::find_if(spec_->options.begin(), spec_->options.end(),
                [&long_name](const OptionSpec& opt) { return opt.long_name == long_name; });
            if (it != spec_->options.end()) {
                option = &*it;
            }
        }
        if (!option) {
            throw UsageError("Unknown option for '" + cmd.command + "': " + arg);
        }

        if (option->kind == ArgKind::Value) {
            if (has_inline_value) {
                cmd.options[option->long_name] = inline_value;
            } else {
                if (i + 1 >= argc_) {
                    throw UsageError("Missing value for option: --" + option->long_name);
                }
                cmd.options[option->long_name] = argv_[++i];
            }
        } else {
            if (has_inline_value) {
                throw UsageError("Option --" + option->long_name + " does not take a value");
            }
            cmd.options[option->long_name] = "true";
        }
    }
}

void CommandParser::ValidateParsedCommand(const ParsedCommand& cmd) {
    // Check required options
    for (const auto& opt_spec : spec_->options) {
        if (opt_spec.required && cmd.options.find(opt_spec.long_name) == cmd.options.end()) {
            std::string option_str = "--" + opt_spec.long_name;
            if (opt_spec.short_name) {
                option_str = std::string("-") + opt_spec.short_name + ", " + option_str;
            }
            throw UsageError("Required option missing: " + option_str);
        }
    }

    // Check positional argument count
    size_t arg_count = cmd.arguments.size();
    if (arg_count < spec_->min_positional || arg_count > spec_->max_positional) {
        std::string error = "Incorrect number of arguments. Expected ";
        if (spec_->min_positional == spec_->max_positional) {
            error += std::to_string(spec_->max_positional);
        } else {
            error += std::to_string(spec_->min_positional) + " to " + std::to_string(spec_->max_positional);
        }
        error += " positional arguments, got " + std::to_string(arg_count);
        throw UsageError(error);
    }
}

bool CommandParser::HasOption(const ParsedCommand& cmd, const std::string& opt) {
    return cmd.options.find(opt) != cmd.options.end();
}

std::string CommandParser::GetOption(const ParsedCommand& cmd, const std::string& opt,
                                     const std::string& default_val) {
    auto it = cmd.options.find(opt);
    if (it != cmd.options.end()) {
        return it->second;
    }
    return default_val;
}

int CommandParser::GetIntOption(const ParsedCommand& cmd, const std::string& opt, int default_val,
                                int min_value, int max_value) {
    auto it = cmd.options.find(opt);
    if (it == cmd.options.end()) {
        return default_val;
    }
    int value = 0;
    try {
        size_t consumed = 0;
        value = std::stoi(it->second, &consumed);
        if (consumed != it->second.size()) {
            throw UsageError("--" + opt + " expects an integer, got '" + it->second + "'");
        }
    } catch (const std::logic_error&) {
        throw UsageError("--" + opt + " expects an integer, got '" + it->second + "'");
    }
    if (value < min_value || value > max_value) {
        throw UsageError("--" + opt + " must be between " + std::to_string(min_value) + " and " +
                         std::to_string(max_value));
    }
    return value;
}

} // namespace msdl
