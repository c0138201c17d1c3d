//
//  msdl.cpp
//
//  Command line entry point
//

#include <pthread.h>
#include <signal.h>
#include <unistd.h>

#include <atomic>
#include <exception>
#include <iostream>
#include <memory>
#include <thread>

#include "msdl/cancellation_token.hpp"
#include "msdl/cli_command_handler.hpp"
#include "msdl/cli_command_parser.hpp"
#include "msdl/cli_command_spec.hpp"
#include "msdl/handlers/config_command_handler.hpp"
#include "msdl/handlers/download_command_handler.hpp"
#include "msdl/handlers/list_command_handler.hpp"
#include "msdl/handlers/login_command_handler.hpp"
#include "msdl/handlers/logout_command_handler.hpp"
#include "msdl/log_utils.hpp"
#include "msdl/user_interface.hpp"

namespace {

// Turns SIGINT/SIGTERM into a cancellation request. The signals are blocked in
// every thread and collected here with sigwait, so no code runs in signal context.
class SignalWatcher {
public:
    explicit SignalWatcher(std::shared_ptr<msdl::CancellationToken> token) : token_(std::move(token)) {
        sigemptyset(&signals_);
        sigaddset(&signals_, SIGINT);
        sigaddset(&signals_, SIGTERM);
        sigaddset(&signals_, SIGUSR1);
        pthread_sigmask(SIG_BLOCK, &signals_, nullptr);
        thread_ = std::thread([this] { Run(); });
    }

    ~SignalWatcher() {
        stopping_.store(true);
        pthread_kill(thread_.native_handle(), SIGUSR1);
        thread_.join();
    }

private:
    void Run() {
        int received = 0;
        while (sigwait(&signals_, &received) == 0) {
            if (received == SIGUSR1) {
                if (stopping_.load()) {
                    return;
                }
                continue;
            }
            if (token_->IsCancelled()) {
                // Second interrupt: give up on a clean checkpoint.
                _exit(msdl::kExitCancelled);
            }
            std::cerr << "\nCancelling; progress is kept for the next run. Interrupt again to quit now." << std::endl;
            token_->Cancel();
        }
    }

    std::shared_ptr<msdl::CancellationToken> token_;
    sigset_t signals_;
    std::atomic<bool> stopping_{false};
    std::thread thread_;
};

class CommandLineInterface {
public:
    CommandLineInterface() : token_(std::make_shared<msdl::CancellationToken>()) {
        dispatcher_.Register(std::make_unique<msdl::DownloadCommandHandler>(token_));
        dispatcher_.Register(std::make_unique<msdl::LoginCommandHandler>());
        dispatcher_.Register(std::make_unique<msdl::LogoutCommandHandler>());
        dispatcher_.Register(std::make_unique<msdl::ListCommandHandler>());
        dispatcher_.Register(std::make_unique<msdl::ConfigCommandHandler>());
    }

    int Run(int argc, const char* argv[]) {
        msdl::CommandParser parser(argc, argv);
        try {
            std::string name = parser.PeekCommand();
            if (!name.empty() && dispatcher_.HasCommand(name)) {
                parser.SetCommandSpec(msdl::GetSpec(name));
            }
            msdl::ParsedCommand cmd = parser.Parse();
            msdl::LogUtils::SetVerbose(cmd.verbose);

            if (cmd.command.empty()) {
                std::cout << msdl::MakeGlobalUsage();
                return cmd.help ? msdl::kExitSuccess : msdl::kExitUsage;
            }

            SignalWatcher watcher(token_);
            return dispatcher_.Dispatch(cmd);
        } catch (const msdl::UsageError& e) {
            msdl::UserInterface::ShowError(e.what());
            std::string name = parser.PeekCommand();
            if (!name.empty() && dispatcher_.HasCommand(name)) {
                std::cerr << msdl::MakeUsage(msdl::GetSpec(name));
            } else {
                std::cerr << msdl::MakeGlobalUsage();
            }
            return msdl::kExitUsage;
        } catch (const std::exception& e) {
            msdl::UserInterface::ShowError(e.what());
            return msdl::kExitFailure;
        }
    }

private:
    std::shared_ptr<msdl::CancellationToken> token_;
    msdl::CommandDispatcher dispatcher_;
};

} // namespace

int main(int argc, const char* argv[]) {
    CommandLineInterface cli;
    return cli.Run(argc, argv);
}
