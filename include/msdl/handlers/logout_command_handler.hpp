//
//  logout_command_handler.hpp
//
//  Handler for 'logout' command
//

#pragma once

#include "msdl/cli_command_handler.hpp"

namespace msdl {

class LogoutCommandHandler : public ICommandHandler {
public:
    std::string CommandName() const override;
    int Handle(const ParsedCommand& cmd) override;
    const CommandSpec& GetSpec() const override;
};

} // namespace msdl
