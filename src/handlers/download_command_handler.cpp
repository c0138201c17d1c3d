//
//  download_command_handler.cpp
//
//  Handler for 'download' command
//

#include "msdl/handlers/download_command_handler.hpp"

#include <unistd.h>

#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <utility>

#include "msdl/cli_command_parser.hpp"
#include "msdl/cli_command_spec.hpp"
#include "msdl/cli_config_manager.hpp"
#include "msdl/cli_download_listener.hpp"
#include "msdl/file_utils.hpp"
#include "msdl/log_utils.hpp"
#include "msdl/model_name_utils.hpp"
#include "msdl/ms_model_downloader.hpp"
#include "msdl/user_interface.hpp"

namespace fs = std::filesystem;

namespace msdl {

namespace {

void PrintSummary(const DownloadResult& result) {
    int64_t total_bytes = 0;
    for (const auto& file : result.succeeded) {
        total_bytes += file.size;
    }
    std::cout << result.succeeded.size() << " file(s) downloaded (" << LogUtils::FormatFileSize(total_bytes)
              << "), " << result.failed.size() << " failed\n";
    for (const auto& file : result.failed) {
        std::cout << "  " << file.remote_path << ": "
                  << (file.error_kind ? ErrorKindName(*file.error_kind) : "error") << ": " << file.message << "\n";
    }
}

} // namespace

DownloadCommandHandler::DownloadCommandHandler(std::shared_ptr<CancellationToken> token,
                                               std::shared_ptr<HttpTransport> transport)
    : token_(std::move(token)), transport_(std::move(transport)) {
}

std::string DownloadCommandHandler::CommandName() const {
    return "download";
}

const CommandSpec& DownloadCommandHandler::GetSpec() const {
    return msdl::GetSpec("download");
}

DownloadConfig DownloadCommandHandler::ApplyOptions(const ParsedCommand& cmd, DownloadConfig config) {
    config.max_workers = CommandParser::GetIntOption(cmd, "workers", config.max_workers, 1, 64);
    int threshold_mb = CommandParser::GetIntOption(cmd, "chunk-threshold-mb",
                                                   static_cast<int>(config.chunk_threshold_bytes / kMiB), 1, 1 << 20);
    config.chunk_threshold_bytes = threshold_mb * kMiB;
    int min_chunk_mb = CommandParser::GetIntOption(cmd, "min-chunk-mb",
                                                   static_cast<int>(config.min_chunk_bytes / kMiB), 1, 1 << 20);
    config.min_chunk_bytes = min_chunk_mb * kMiB;
    config.request_timeout_seconds =
        CommandParser::GetIntOption(cmd, "timeout", config.request_timeout_seconds, 1, 3600);
    config.max_attempts = CommandParser::GetIntOption(cmd, "retries", config.max_attempts, 1, 100);
    if (CommandParser::HasOption(cmd, "token")) {
        config.access_token = CommandParser::GetOption(cmd, "token");
    }
    if (CommandParser::HasOption(cmd, "no-verify")) {
        config.verify_sha256 = false;
    }
    return config;
}

int DownloadCommandHandler::Handle(const ParsedCommand& cmd) {
    RepositoryId repo;
    try {
        repo = ModelNameUtils::ParseRepositoryId(cmd.arguments.at(0));
    } catch (const std::invalid_argument& e) {
        throw UsageError(e.what());
    }

    auto& config_mgr = ConfigManager::GetInstance();
    Config cfg = config_mgr.LoadConfig();
    DownloadConfig dl_config = ApplyOptions(cmd, config_mgr.ToDownloadConfig(cfg));

    std::string progress = CommandParser::GetOption(cmd, "progress", isatty(STDOUT_FILENO) ? "bar" : "lines");
    if (progress != "bar" && progress != "lines" && progress != "none") {
        throw UsageError("--progress expects bar, lines or none, got '" + progress + "'");
    }

    DownloadRequest request;
    request.repo = repo;
    if (CommandParser::HasOption(cmd, "file")) {
        request.file_path = CommandParser::GetOption(cmd, "file");
    }
    request.save_dir = CommandParser::HasOption(cmd, "save-dir")
                           ? FileUtils::ExpandTilde(CommandParser::GetOption(cmd, "save-dir"))
                           : config_mgr.GetSaveDir();

    LOG_DEBUG_TAG("Downloading " + repo.ToString() + " into " + request.save_dir + " with " +
                      std::to_string(dl_config.max_workers) + " worker(s)",
                  "DownloadCommand");

    SilentDownloadListener silent_listener;
    LineDownloadListener line_listener;
    CLIDownloadListener bar_listener;
    ProgressListener* listener = &silent_listener;
    if (progress == "bar") {
        listener = &bar_listener;
    } else if (progress == "lines") {
        listener = &line_listener;
    }

    MsModelDownloader downloader(dl_config, transport_, token_);
    downloader.SetListener(listener);
    DownloadResult result = downloader.Download(request);
    if (progress == "bar") {
        bar_listener.EndProgress();
    }

    std::error_code ec;
    if (fs::exists(result.model_path, ec)) {
        config_mgr.AppendKnownSaveDir(request.save_dir);
    }

    if (result.success()) {
        PrintSummary(result);
        UserInterface::ShowSuccess(repo.ToString() + " saved to " + result.model_path);
        return kExitSuccess;
    }
    if (result.cancelled()) {
        if (!result.succeeded.empty() || !result.failed.empty()) {
            PrintSummary(result);
        }
        UserInterface::ShowInfo(result.error_message);
        return kExitCancelled;
    }
    if (result.succeeded.empty() && result.failed.empty()) {
        std::string suggestion;
        if (result.error_kind == ErrorKind::UNAUTHORIZED) {
            suggestion = "Run 'msdl login --token <token>' or pass --token";
        } else if (result.error_kind == ErrorKind::NOT_FOUND) {
            suggestion = "Check the repository id and the --file path";
        }
        UserInterface::ShowError(result.error_message, suggestion);
        return kExitFailure;
    }
    PrintSummary(result);
    UserInterface::ShowError(result.error_message, "Run the same command again to resume");
    return kExitFailure;
}

} // namespace msdl
