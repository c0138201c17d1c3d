//
//  cli_command_handler.hpp
//
//  Command execution handlers
//

#pragma once

#include <map>
#include <memory>
#include <string>

namespace msdl {

struct ParsedCommand;
struct CommandSpec;

// Process exit codes
constexpr int kExitSuccess = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;
constexpr int kExitCancelled = 130;

// Base interface for command handlers
class ICommandHandler {
public:
    virtual ~ICommandHandler() = default;
    virtual std::string CommandName() const = 0;
    virtual int Handle(const ParsedCommand& cmd) = 0;
    virtual const CommandSpec& GetSpec() const = 0;
};

// Dispatcher for command handlers
class CommandDispatcher {
public:
    void Register(std::unique_ptr<ICommandHandler> handler);

    // Returns kExitUsage for a command nobody registered.
    int Dispatch(const ParsedCommand& cmd);

    bool HasCommand(const std::string& name) const;

private:
    std::map<std::string, std::unique_ptr<ICommandHandler>> handlers_;
};

} // namespace msdl
