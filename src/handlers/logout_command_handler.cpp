//
//  logout_command_handler.cpp
//
//  Handler for 'logout' command
//

#include "msdl/handlers/logout_command_handler.hpp"

#include "msdl/cli_command_parser.hpp"
#include "msdl/cli_command_spec.hpp"
#include "msdl/cli_config_manager.hpp"
#include "msdl/user_interface.hpp"

namespace msdl {

std::string LogoutCommandHandler::CommandName() const {
    return "logout";
}

const CommandSpec& LogoutCommandHandler::GetSpec() const {
    return msdl::GetSpec("logout");
}

int LogoutCommandHandler::Handle(const ParsedCommand& cmd) {
    if (!ConfigManager::GetInstance().ClearAccessToken()) {
        UserInterface::ShowError("Failed to remove the stored access token");
        return kExitFailure;
    }
    UserInterface::ShowSuccess("Stored access token removed");
    return kExitSuccess;
}

} // namespace msdl
