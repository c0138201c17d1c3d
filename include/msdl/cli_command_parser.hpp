//
//  cli_command_parser.hpp
//
//  Command-line argument parsing and routing
//

#pragma once

#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace msdl {

struct ParsedCommand {
    std::string command;
    std::vector<std::string> arguments;
    std::map<std::string, std::string> options;
    bool verbose = false;
    bool help = false;
};

// Malformed command line; the message is meant for the user.
class UsageError : public std::runtime_error {
public:
    explicit UsageError(const std::string& message) : std::runtime_error(message) {}
};

struct CommandSpec;

class CommandParser {
public:
    CommandParser(int argc, const char* argv[]);

    // Set command specification for parsing
    void SetCommandSpec(const CommandSpec& spec);

    // Parse command line arguments; throws UsageError
    ParsedCommand Parse();

    // First non-global argument, or empty when there is none
    std::string PeekCommand() const;

    // Utility functions
    static bool HasOption(const ParsedCommand& cmd, const std::string& opt);
    static std::string GetOption(const ParsedCommand& cmd, const std::string& opt,
                                 const std::string& default_val = "");
    // Throws UsageError when the value is not an integer in [min_value, max_value]
    static int GetIntOption(const ParsedCommand& cmd, const std::string& opt, int default_val,
                            int min_value, int max_value);

private:
    int argc_;
    const char** argv_;
    const CommandSpec* spec_ = nullptr;

    static bool IsGlobalOption(const std::string& arg);
    void ParseCommandOptions(ParsedCommand& cmd, int first);
    void ValidateParsedCommand(const ParsedCommand& cmd);
    static bool IsShortOption(const std::string& arg);
    static bool IsLongOption(const std::string& arg);
};

} // namespace msdl
