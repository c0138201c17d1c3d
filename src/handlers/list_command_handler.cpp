//
//  list_command_handler.cpp
//
//  Handler for 'list' command
//

#include "msdl/handlers/list_command_handler.hpp"

#include "msdl/cli_command_parser.hpp"
#include "msdl/cli_command_spec.hpp"
#include "msdl/local_model_utils.hpp"

namespace msdl {

std::string ListCommandHandler::CommandName() const {
    return "list";
}

const CommandSpec& ListCommandHandler::GetSpec() const {
    return msdl::GetSpec("list");
}

int ListCommandHandler::Handle(const ParsedCommand& cmd) {
    return LocalModelUtils::ListLocalModels();
}

} // namespace msdl
