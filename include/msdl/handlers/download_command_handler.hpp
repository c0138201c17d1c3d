//
//  download_command_handler.hpp
//
//  Handler for 'download' command
//

#pragma once

#include <memory>

#include "msdl/cancellation_token.hpp"
#include "msdl/cli_command_handler.hpp"
#include "msdl/dl_config.hpp"
#include "msdl/http_transport.hpp"

namespace msdl {

class DownloadCommandHandler : public ICommandHandler {
public:
    // `token` is cancelled by the signal watcher; a null transport selects HttplibTransport.
    explicit DownloadCommandHandler(std::shared_ptr<CancellationToken> token,
                                    std::shared_ptr<HttpTransport> transport = nullptr);

    std::string CommandName() const override;
    int Handle(const ParsedCommand& cmd) override;
    const CommandSpec& GetSpec() const override;

    // Applies command line overrides on top of the configured engine settings; throws UsageError.
    static DownloadConfig ApplyOptions(const ParsedCommand& cmd, DownloadConfig config);

private:
    std::shared_ptr<CancellationToken> token_;
    std::shared_ptr<HttpTransport> transport_;
};

} // namespace msdl
