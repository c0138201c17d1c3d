//
//  login_command_handler.cpp
//
//  Handler for 'login' command
//

#include "msdl/handlers/login_command_handler.hpp"

#include <utility>

#include "msdl/cli_command_parser.hpp"
#include "msdl/cli_command_spec.hpp"
#include "msdl/cli_config_manager.hpp"
#include "msdl/errors.hpp"
#include "msdl/ms_api_client.hpp"
#include "msdl/user_interface.hpp"

namespace msdl {

LoginCommandHandler::LoginCommandHandler(std::shared_ptr<HttpTransport> transport)
    : transport_(std::move(transport)) {
    if (!transport_) {
        transport_ = std::make_shared<HttplibTransport>();
    }
}

std::string LoginCommandHandler::CommandName() const {
    return "login";
}

const CommandSpec& LoginCommandHandler::GetSpec() const {
    return msdl::GetSpec("login");
}

int LoginCommandHandler::Handle(const ParsedCommand& cmd) {
    std::string token = CommandParser::GetOption(cmd, "token");
    if (token.empty()) {
        throw UsageError("--token must not be empty");
    }

    auto& config_mgr = ConfigManager::GetInstance();
    DownloadConfig dl_config = config_mgr.ToDownloadConfig(config_mgr.LoadConfig());
    MsApiClient api(transport_, dl_config);
    try {
        api.Login(token);
    } catch (const DownloadException& e) {
        UserInterface::ShowError(std::string("Login failed: ") + e.what(),
                                 e.kind() == ErrorKind::UNAUTHORIZED ? "Check the token on the hub's access token page"
                                                                    : "");
        return kExitFailure;
    }

    if (!config_mgr.SetAccessToken(token)) {
        UserInterface::ShowError("Token accepted but could not be saved to " + config_mgr.GetConfigFilePath());
        return kExitFailure;
    }
    UserInterface::ShowSuccess("Logged in to " + dl_config.endpoint);
    return kExitSuccess;
}

} // namespace msdl
