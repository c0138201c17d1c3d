//
//  cli_command_handler.cpp
//
//  Command dispatcher implementation
//

#include "msdl/cli_command_handler.hpp"

#include <iostream>

#include "msdl/cli_command_parser.hpp"
#include "msdl/cli_command_spec.hpp"
#include "msdl/user_interface.hpp"

namespace msdl {

void CommandDispatcher::Register(std::unique_ptr<ICommandHandler> handler) {
    std::string name = handler->CommandName();
    handlers_[name] = std::move(handler);
}

bool CommandDispatcher::HasCommand(const std::string& name) const {
    return handlers_.find(name) != handlers_.end();
}

int CommandDispatcher::Dispatch(const ParsedCommand& cmd) {
    auto it = handlers_.find(cmd.command);
    if (it == handlers_.end()) {
        UserInterface::ShowError("Unknown command: " + cmd.command, "Run 'msdl --help' for the command list");
        return kExitUsage;
    }
    if (cmd.help) {
        std::cout << MakeUsage(it->second->GetSpec());
        return kExitSuccess;
    }
    return it->second->Handle(cmd);
}

} // namespace msdl
