//
//  config_command_handler.cpp
//
//  Handler for 'config' command
//

#include "msdl/handlers/config_command_handler.hpp"

#include <iostream>

#include "msdl/cli_command_parser.hpp"
#include "msdl/cli_command_spec.hpp"
#include "msdl/cli_config_manager.hpp"
#include "msdl/user_interface.hpp"

namespace msdl {

std::string ConfigCommandHandler::CommandName() const {
    return "config";
}

const CommandSpec& ConfigCommandHandler::GetSpec() const {
    return msdl::GetSpec("config");
}

int ConfigCommandHandler::Handle(const ParsedCommand& cmd) {
    auto& config_mgr = ConfigManager::GetInstance();

    // If no arguments, show all config
    if (cmd.arguments.empty() || cmd.arguments[0] == "show") {
        config_mgr.ShowConfig(config_mgr.LoadConfig());
        return kExitSuccess;
    }

    const std::string& subcommand = cmd.arguments[0];
    if (subcommand == "set") {
        if (cmd.arguments.size() != 3) {
            throw UsageError("Usage: msdl config set <key> <value>");
        }
        const std::string& key = cmd.arguments[1];
        const std::string& value = cmd.arguments[2];
        if (!config_mgr.SetConfigValue(key, value)) {
            UserInterface::ShowError("Cannot set " + key + " to '" + value + "'", "Run 'msdl config help' for valid keys");
            return kExitFailure;
        }
        std::cout << "Config updated: " << key << " = " << (key == "access_token" ? "****" : value) << "\n";
        return kExitSuccess;
    } else if (subcommand == "reset") {
        // Reset all configs to default without confirmation
        if (!config_mgr.ResetConfig()) {
            UserInterface::ShowError("Failed to reset configuration");
            return kExitFailure;
        }
        std::cout << "Configuration reset to default settings.\n";
        return kExitSuccess;
    } else if (subcommand == "help") {
        std::cout << config_mgr.GetConfigHelp();
        return kExitSuccess;
    }
    throw UsageError("Unknown config subcommand: " + subcommand);
}

} // namespace msdl
