//
//  list_command_handler.hpp
//
//  Handler for 'list' command
//

#pragma once

#include "msdl/cli_command_handler.hpp"

namespace msdl {

class ListCommandHandler : public ICommandHandler {
public:
    std::string CommandName() const override;
    int Handle(const ParsedCommand& cmd) override;
    const CommandSpec& GetSpec() const override;
};

} // namespace msdl
