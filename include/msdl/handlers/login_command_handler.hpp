//
//  login_command_handler.hpp
//
//  Handler for 'login' command
//

#pragma once

#include <memory>

#include "msdl/cli_command_handler.hpp"
#include "msdl/http_transport.hpp"

namespace msdl {

class LoginCommandHandler : public ICommandHandler {
public:
    explicit LoginCommandHandler(std::shared_ptr<HttpTransport> transport = nullptr);

    std::string CommandName() const override;
    int Handle(const ParsedCommand& cmd) override;
    const CommandSpec& GetSpec() const override;

private:
    std::shared_ptr<HttpTransport> transport_;
};

} // namespace msdl
